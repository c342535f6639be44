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
#include <tourney/bracket/single_elimination_generator.hpp>
#include <tourney/bracket/config.hpp>
#include <tourney/bracket/seeding.hpp>
#include <tourney/bracket/stage_options.hpp>

#include <fc/log/logger.hpp>

namespace tourney { namespace bracket {

std::string single_elimination_generator::name()const
{
   return "single_elimination";
}

validation_result single_elimination_generator::validate( const tournament_descriptor& tournament,
                                                          const stage_descriptor& stage,
                                                          uint32_t participant_count )const
{
   validation_result result;
   check_participant_count( "Single elimination", participant_count,
                            TOURNEY_SINGLE_ELIMINATION_MIN_PARTICIPANTS,
                            TOURNEY_SINGLE_ELIMINATION_MAX_PARTICIPANTS, result.errors );
   parse_single_elimination_options( stage, result.errors );
   return result;
}

uint32_t single_elimination_generator::expected_match_count( const stage_descriptor& stage,
                                                             uint32_t participant_count )const
{
   std::vector<std::string> errors;
   const single_elimination_options options = parse_single_elimination_options( stage, errors );
   const uint32_t bracket_size = next_power_of_two( participant_count );
   uint32_t count = bracket_size - 1;
   if( options.third_place_match && number_of_rounds( bracket_size ) >= 2 )
      ++count;
   return count;
}

std::vector<match_record> single_elimination_generator::allocate_rounds( const tournament_descriptor& tournament,
                                                                         const stage_descriptor& stage,
                                                                         const std::vector<participant>& participants,
                                                                         bracket_segment segment,
                                                                         const std::string& bracket_type,
                                                                         const std::string& round_name_prefix )
{
   const uint32_t num_participants = participants.size();
   const uint32_t bracket_size = next_power_of_two( num_participants );
   const uint32_t num_rounds = number_of_rounds( bracket_size );
   const std::vector<match_slot> slots = seed_with_byes( participants, bye_count( num_participants ) );

   std::vector<match_record> matches;
   matches.reserve( bracket_size - 1 );

   // first round: slots 2k and 2k+1 meet; top seeds always hold the even slot
   uint32_t match_number = 0;
   for( uint32_t i = 0; i < bracket_size / 2; ++i )
   {
      const match_slot& first = slots[2 * i];
      const match_slot& second = slots[2 * i + 1];
      if( first.is_bye() && second.is_bye() )
         continue;

      match_record match = make_match( tournament, stage, segment, 1, ++match_number );
      match.team_a = first;
      match.team_b = second;
      match.metadata = fc::mutable_variant_object( "bracket_type", bracket_type )
                          ( "round_name", round_name_prefix + round_name( 1, num_rounds ) )
                          ( "has_bye", match.has_bye() );
      matches.push_back( match );
   }

   uint32_t matches_in_round = bracket_size / 2;
   for( uint32_t round = 2; round <= num_rounds; ++round )
   {
      matches_in_round /= 2;
      for( uint32_t i = 1; i <= matches_in_round; ++i )
      {
         match_record match = make_match( tournament, stage, segment, round, i );
         match.metadata = fc::mutable_variant_object( "bracket_type", bracket_type )
                             ( "round_name", round_name_prefix + round_name( round, num_rounds ) );
         matches.push_back( match );
      }
   }
   return matches;
}

std::vector<match_record> single_elimination_generator::generate( const tournament_descriptor& tournament,
                                                                  const stage_descriptor& stage,
                                                                  const std::vector<participant>& participants )const
{
   require_valid( tournament, stage, participants.size() );
   std::vector<std::string> errors;
   const single_elimination_options options = parse_single_elimination_options( stage, errors );
   fc_dlog( fc::logger::get( TOURNEY_BRACKET_LOGGER ), "Single elimination options for stage ${stage}: ${options}",
            ("stage", stage.id)("options", options) );

   std::vector<match_record> matches = allocate_rounds( tournament, stage, participants, bracket_segment::main,
                                                        name(), "" );

   const uint32_t num_rounds = number_of_rounds( next_power_of_two( participants.size() ) );
   if( options.third_place_match && num_rounds >= 2 )
   {
      // both semifinal losers are unknown until the semifinals are played
      match_record match = make_match( tournament, stage, bracket_segment::main, num_rounds + 1, 1 );
      match.metadata = fc::mutable_variant_object( "bracket_type", name() )
                          ( "round_name", "Third Place" )
                          ( "is_third_place_match", true );
      matches.push_back( match );
   }

   fc_ilog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
            "Allocated ${count} single elimination matches over ${rounds} rounds for ${n} participants",
            ("count", matches.size())("rounds", num_rounds)("n", participants.size()) );
   return matches;
}

} } // tourney::bracket
