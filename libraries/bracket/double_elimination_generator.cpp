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
#include <tourney/bracket/double_elimination_generator.hpp>
#include <tourney/bracket/single_elimination_generator.hpp>
#include <tourney/bracket/config.hpp>
#include <tourney/bracket/seeding.hpp>
#include <tourney/bracket/stage_options.hpp>

#include <fc/log/logger.hpp>

#include <algorithm>
#include <numeric>

namespace tourney { namespace bracket {

std::string double_elimination_generator::name()const
{
   return "double_elimination";
}

validation_result double_elimination_generator::validate( const tournament_descriptor& tournament,
                                                          const stage_descriptor& stage,
                                                          uint32_t participant_count )const
{
   validation_result result;
   check_participant_count( "Double elimination", participant_count,
                            TOURNEY_DOUBLE_ELIMINATION_MIN_PARTICIPANTS,
                            TOURNEY_DOUBLE_ELIMINATION_MAX_PARTICIPANTS, result.errors );
   parse_double_elimination_options( stage, result.errors );
   return result;
}

std::vector<uint32_t> double_elimination_generator::losers_round_sizes( uint32_t participant_count )
{
   const uint32_t winners_rounds = number_of_rounds( next_power_of_two( participant_count ) );
   const uint32_t losers_rounds = winners_rounds > 0 ? 2 * (winners_rounds - 1) : 0;

   // two first round losers meet in each first losers round match; after every
   // drop-in (even) round the field halves
   std::vector<uint32_t> sizes;
   sizes.reserve( losers_rounds );
   uint32_t matches_in_round = std::max<uint32_t>( participant_count / 4, 1 );
   for( uint32_t round = 1; round <= losers_rounds; ++round )
   {
      sizes.push_back( matches_in_round );
      if( round % 2 == 0 )
         matches_in_round = std::max<uint32_t>( matches_in_round / 2, 1 );
   }
   return sizes;
}

uint32_t double_elimination_generator::expected_match_count( const stage_descriptor& stage,
                                                             uint32_t participant_count )const
{
   std::vector<std::string> errors;
   const double_elimination_options options = parse_double_elimination_options( stage, errors );
   const std::vector<uint32_t> losers = losers_round_sizes( participant_count );
   const uint32_t losers_matches = std::accumulate( losers.begin(), losers.end(), 0u );
   return next_power_of_two( participant_count ) - 1 + losers_matches + (options.grand_finals_reset ? 2 : 1);
}

std::vector<match_record> double_elimination_generator::generate( const tournament_descriptor& tournament,
                                                                  const stage_descriptor& stage,
                                                                  const std::vector<participant>& participants )const
{
   require_valid( tournament, stage, participants.size() );
   std::vector<std::string> errors;
   const double_elimination_options options = parse_double_elimination_options( stage, errors );
   fc_dlog( fc::logger::get( TOURNEY_BRACKET_LOGGER ), "Double elimination options for stage ${stage}: ${options}",
            ("stage", stage.id)("options", options) );

   std::vector<match_record> matches =
      single_elimination_generator::allocate_rounds( tournament, stage, participants, bracket_segment::winners,
                                                     name(), "Winners " );
   const uint32_t winners_rounds = number_of_rounds( next_power_of_two( participants.size() ) );

   const std::vector<uint32_t> losers = losers_round_sizes( participants.size() );
   for( uint32_t round = 1; round <= losers.size(); ++round )
   {
      // round 1 takes the winners round 1 losers, every even round takes the
      // losers of the next winners round
      fc::mutable_variant_object metadata( "bracket_type", name() );
      metadata( "round_name", "Losers Round " + std::to_string( round ) );
      if( round == 1 )
         metadata( "drops_from_winners_round", 1 );
      else if( round % 2 == 0 )
         metadata( "drops_from_winners_round", round / 2 + 1 );
      const fc::variant_object round_metadata( metadata );

      for( uint32_t i = 1; i <= losers[round - 1]; ++i )
      {
         match_record match = make_match( tournament, stage, bracket_segment::losers, round, i );
         match.metadata = round_metadata;
         matches.push_back( match );
      }
   }

   match_record grand_finals = make_match( tournament, stage, bracket_segment::grand_finals, winners_rounds + 1, 1 );
   grand_finals.metadata = fc::mutable_variant_object( "bracket_type", name() )
                              ( "round_name", "Grand Finals" );
   matches.push_back( grand_finals );

   if( options.grand_finals_reset )
   {
      match_record reset = make_match( tournament, stage, bracket_segment::grand_finals_reset, winners_rounds + 2, 1 );
      reset.metadata = fc::mutable_variant_object( "bracket_type", name() )
                          ( "round_name", "Grand Finals Reset" )
                          ( "is_conditional", true )
                          ( "condition", "Only played if the losers bracket champion wins the first grand finals match" );
      matches.push_back( reset );
   }

   fc_ilog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
            "Allocated ${count} double elimination matches (${winners} winners rounds, ${losers} losers rounds) for ${n} participants",
            ("count", matches.size())("winners", winners_rounds)("losers", losers.size())("n", participants.size()) );
   return matches;
}

} } // tourney::bracket
