/*
 * Copyright (c) 2018 Peerplays Blockchain Standards Association, and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <tourney/bracket/bracket_engine.hpp>
#include <tourney/bracket/config.hpp>
#include <tourney/bracket/exceptions.hpp>
#include <tourney/bracket/double_elimination_generator.hpp>
#include <tourney/bracket/round_robin_generator.hpp>
#include <tourney/bracket/single_elimination_generator.hpp>
#include <tourney/bracket/swiss_system_generator.hpp>

#include <fc/log/logger.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <set>

namespace tourney { namespace bracket {

bracket_engine::bracket_engine()
{
   std::shared_ptr<bracket_generator> single_elimination = std::make_shared<single_elimination_generator>();
   std::shared_ptr<bracket_generator> double_elimination = std::make_shared<double_elimination_generator>();

   registered_generators["single_elim"] = single_elimination;
   registered_generators["single_elimination"] = single_elimination;
   registered_generators["double_elim"] = double_elimination;
   registered_generators["double_elimination"] = double_elimination;
   registered_generators["round_robin"] = std::make_shared<round_robin_generator>();
   registered_generators["swiss"] = std::make_shared<swiss_system_generator>();
}

std::string bracket_engine::normalize_format_key( const std::string& format )
{
   std::string key = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( format ) );
   boost::algorithm::replace_all( key, " ", "_" );
   boost::algorithm::replace_all( key, "-", "_" );
   return key;
}

std::string bracket_engine::determine_format( const tournament_descriptor& tournament,
                                              const stage_descriptor& stage )const
{
   const std::string stage_key = normalize_format_key( stage.type );
   if( supports_format( stage_key ) )
      return stage_key;

   const std::string hint_key = normalize_format_key( tournament.format_hint );
   if( supports_format( hint_key ) )
   {
      fc_dlog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
               "Stage ${stage} type '${type}' is not a registered format, using tournament format '${hint}'",
               ("stage", stage.id)("type", stage.type)("hint", hint_key) );
      return hint_key;
   }

   FC_THROW_EXCEPTION( unknown_bracket_format,
                       "Cannot determine bracket format for stage ${stage} (type '${type}', tournament format '${hint}'). "
                       "Supported formats: ${formats}",
                       ("stage", stage.id)("type", stage.type)("hint", tournament.format_hint)
                       ("formats", boost::algorithm::join( get_supported_formats(), ", " )) );
}

void bracket_engine::check_participants( const tournament_descriptor& tournament,
                                         const std::vector<participant>& participants,
                                         std::vector<std::string>& errors )
{
   std::set<participant_id_type> seen;
   for( const participant& p : participants )
      if( !seen.insert( p.id ).second )
         errors.push_back( "Participant " + std::to_string( p.id ) + " is listed more than once" );

   if( tournament.max_teams.valid() && participants.size() > *tournament.max_teams )
      errors.push_back( "Tournament allows at most " + std::to_string( *tournament.max_teams ) +
                        " teams, got " + std::to_string( participants.size() ) );
}

std::vector<match_record> bracket_engine::generate_bracket_for_stage( const tournament_descriptor& tournament,
                                                                      const stage_descriptor& stage,
                                                                      const std::vector<participant>& participants )const
{
   const std::string format = determine_format( tournament, stage );
   const std::shared_ptr<const bracket_generator> generator = get_generator( format );

   validation_result validation = generator->validate( tournament, stage, participants.size() );
   check_participants( tournament, participants, validation.errors );
   if( !validation.valid() )
   {
      const std::string errors = boost::algorithm::join( validation.errors, "; " );
      fc_wlog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
               "Rejected ${format} bracket for stage ${stage} of tournament ${tournament}: ${errors}",
               ("format", format)("stage", stage.id)("tournament", tournament.id)("errors", errors) );
      FC_THROW_EXCEPTION( invalid_bracket_configuration,
                          "Invalid ${format} configuration for stage ${stage} of tournament ${tournament}: ${errors}",
                          ("format", format)("stage", stage.id)("tournament", tournament.id)("errors", errors) );
   }

   std::vector<match_record> matches;
   bool failed = false;
   std::string failure;
   try
   {
      matches = generator->generate( tournament, stage, participants );
   }
   catch( const fc::exception& e )
   {
      failed = true;
      failure = e.to_detail_string();
   }
   catch( const std::exception& e )
   {
      failed = true;
      failure = e.what();
   }
   if( failed )
   {
      fc_elog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
               "Generating ${format} bracket for stage ${stage} of tournament ${tournament} failed: ${failure}",
               ("format", format)("stage", stage.id)("tournament", tournament.id)("failure", failure) );
      FC_THROW_EXCEPTION( bracket_generation_failure,
                          "Failed to generate ${format} bracket for stage ${stage} of tournament ${tournament}: ${failure}",
                          ("format", format)("stage", stage.id)("tournament", tournament.id)("failure", failure) );
   }

   const uint32_t expected = generator->expected_match_count( stage, participants.size() );
   if( matches.size() != expected )
   {
      fc_elog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
               "${format} generator returned ${count} matches for stage ${stage}, expected ${expected}",
               ("format", format)("count", matches.size())("stage", stage.id)("expected", expected) );
      FC_THROW_EXCEPTION( bracket_generation_failure,
                          "Inconsistent ${format} bracket for stage ${stage} of tournament ${tournament}: "
                          "${count} matches instead of ${expected}",
                          ("format", format)("stage", stage.id)("tournament", tournament.id)
                          ("count", matches.size())("expected", expected) );
   }

   fc_ilog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
            "Generated ${count} matches for ${format} stage ${stage} of tournament ${tournament}",
            ("count", matches.size())("format", format)("stage", stage.id)("tournament", tournament.id) );
   return matches;
}

void bracket_engine::register_generator( const std::string& format, std::shared_ptr<bracket_generator> generator )
{
   const std::string key = normalize_format_key( format );
   FC_ASSERT( !key.empty(), "Format key must not be empty" );
   FC_ASSERT( generator, "No generator given for format ${format}", ("format", key) );

   std::lock_guard<std::mutex> locker( lock );
   auto itr = registered_generators.find( key );
   if( itr != registered_generators.end() )
   {
      fc_wlog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
               "Replacing ${old} generator registered for format ${format} with ${new}",
               ("old", itr->second->name())("format", key)("new", generator->name()) );
      itr->second = generator;
   }
   else
   {
      fc_ilog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
               "Registered ${name} generator for format ${format}",
               ("name", generator->name())("format", key) );
      registered_generators[key] = generator;
   }
}

std::vector<std::string> bracket_engine::get_supported_formats()const
{
   std::lock_guard<std::mutex> locker( lock );
   std::vector<std::string> formats;
   formats.reserve( registered_generators.size() );
   for( const auto& entry : registered_generators )
      formats.push_back( entry.first );
   return formats;
}

bool bracket_engine::supports_format( const std::string& format )const
{
   const std::string key = normalize_format_key( format );
   std::lock_guard<std::mutex> locker( lock );
   return registered_generators.find( key ) != registered_generators.end();
}

std::shared_ptr<const bracket_generator> bracket_engine::get_generator( const std::string& format )const
{
   const std::string key = normalize_format_key( format );
   {
      std::lock_guard<std::mutex> locker( lock );
      auto itr = registered_generators.find( key );
      if( itr != registered_generators.end() )
         return itr->second;
   }
   FC_THROW_EXCEPTION( unknown_bracket_format, "Unsupported bracket format '${format}'. Supported formats: ${formats}",
                       ("format", format)("formats", boost::algorithm::join( get_supported_formats(), ", " )) );
}

} } // tourney::bracket
