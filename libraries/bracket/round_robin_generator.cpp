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
#include <tourney/bracket/round_robin_generator.hpp>
#include <tourney/bracket/config.hpp>

#include <fc/log/logger.hpp>

#include <deque>

namespace tourney { namespace bracket {

std::string round_robin_generator::name()const
{
   return "round_robin";
}

validation_result round_robin_generator::validate( const tournament_descriptor& tournament,
                                                   const stage_descriptor& stage,
                                                   uint32_t participant_count )const
{
   validation_result result;
   check_participant_count( "Round robin", participant_count,
                            TOURNEY_ROUND_ROBIN_MIN_PARTICIPANTS,
                            TOURNEY_ROUND_ROBIN_MAX_PARTICIPANTS, result.errors );
   return result;
}

uint32_t round_robin_generator::expected_match_count( const stage_descriptor& stage, uint32_t participant_count )const
{
   return participant_count * (participant_count - 1) / 2;
}

std::vector<std::vector<std::pair<uint32_t, uint32_t>>> round_robin_generator::schedule( uint32_t participant_count )
{
   std::vector<std::vector<std::pair<uint32_t, uint32_t>>> rounds;
   if( participant_count < 2 )
      return rounds;

   // an odd field gets a phantom seed; whoever meets it sits the round out
   const uint32_t count = participant_count + (participant_count % 2);

   // top[i] meets bottom[i]; top[0] is the fixed anchor of the circle
   std::deque<uint32_t> top;
   std::deque<uint32_t> bottom;
   for( uint32_t i = 0; i < count / 2; ++i )
      top.push_back( i );
   for( uint32_t i = count - 1; i >= count / 2; --i )
      bottom.push_back( i );

   rounds.reserve( count - 1 );
   for( uint32_t round = 1; round < count; ++round )
   {
      std::vector<std::pair<uint32_t, uint32_t>> pairings;
      for( uint32_t i = 0; i < count / 2; ++i )
         if( top[i] < participant_count && bottom[i] < participant_count )
            pairings.emplace_back( top[i], bottom[i] );
      rounds.push_back( pairings );

      top.insert( top.begin() + 1, bottom.front() );
      bottom.pop_front();
      bottom.push_back( top.back() );
      top.pop_back();
   }
   return rounds;
}

std::vector<match_record> round_robin_generator::generate( const tournament_descriptor& tournament,
                                                           const stage_descriptor& stage,
                                                           const std::vector<participant>& participants )const
{
   require_valid( tournament, stage, participants.size() );

   const auto rounds = schedule( participants.size() );
   std::vector<match_record> matches;
   matches.reserve( expected_match_count( stage, participants.size() ) );
   for( uint32_t round = 1; round <= rounds.size(); ++round )
   {
      const auto& pairings = rounds[round - 1];
      for( uint32_t i = 0; i < pairings.size(); ++i )
      {
         match_record match = make_match( tournament, stage, bracket_segment::main, round, i + 1 );
         match.team_a = match_slot::for_participant( participants[pairings[i].first] );
         match.team_b = match_slot::for_participant( participants[pairings[i].second] );
         match.metadata = fc::mutable_variant_object( "bracket_type", name() )
                             ( "round_name", "Round " + std::to_string( round ) );
         matches.push_back( match );
      }
   }

   fc_ilog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
            "Scheduled ${count} round robin matches over ${rounds} rounds for ${n} participants",
            ("count", matches.size())("rounds", rounds.size())("n", participants.size()) );
   return matches;
}

} } // tourney::bracket
