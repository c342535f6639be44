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
#include <tourney/bracket/swiss_system_generator.hpp>
#include <tourney/bracket/config.hpp>
#include <tourney/bracket/exceptions.hpp>
#include <tourney/bracket/stage_options.hpp>

#include <fc/log/logger.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <set>

namespace tourney { namespace bracket {

namespace {
   typedef std::set<std::pair<participant_id_type, participant_id_type>> pairing_set;

   std::pair<participant_id_type, participant_id_type> pairing_key( participant_id_type a, participant_id_type b )
   {
      return std::make_pair( std::min( a, b ), std::max( a, b ) );
   }

   // Depth first search for a rematch-free pairing of everyone not yet used.
   // The lowest index unpaired player is paired first, trying opponents in
   // rank order.
   bool pair_without_rematches( const std::vector<participant_id_type>& ranked, std::vector<bool>& used,
                                const pairing_set& played,
                                std::vector<std::pair<participant_id_type, participant_id_type>>& pairs,
                                uint32_t& steps )
   {
      auto first = std::find( used.begin(), used.end(), false );
      if( first == used.end() )
         return true;
      const size_t i = first - used.begin();

      used[i] = true;
      for( size_t j = i + 1; j < ranked.size(); ++j )
      {
         if( used[j] || played.count( pairing_key( ranked[i], ranked[j] ) ) )
            continue;
         if( ++steps > TOURNEY_SWISS_MAX_PAIRING_STEPS )
            break;

         used[j] = true;
         pairs.emplace_back( ranked[i], ranked[j] );
         if( pair_without_rematches( ranked, used, played, pairs, steps ) )
            return true;
         pairs.pop_back();
         used[j] = false;
      }
      used[i] = false;
      return false;
   }

   // Fallback when every complete pairing repeats a match: take the highest
   // ranked new opponent where possible, the next in line otherwise
   std::vector<std::pair<participant_id_type, participant_id_type>> pair_allowing_rematches(
         const std::vector<participant_id_type>& ranked, const pairing_set& played )
   {
      std::vector<std::pair<participant_id_type, participant_id_type>> pairs;
      std::vector<bool> used( ranked.size(), false );
      for( size_t i = 0; i < ranked.size(); ++i )
      {
         if( used[i] )
            continue;
         used[i] = true;
         size_t opponent = ranked.size();
         for( size_t j = i + 1; j < ranked.size(); ++j )
         {
            if( used[j] )
               continue;
            if( opponent == ranked.size() )
               opponent = j;
            if( !played.count( pairing_key( ranked[i], ranked[j] ) ) )
            {
               opponent = j;
               break;
            }
         }
         if( opponent == ranked.size() )
            break;
         used[opponent] = true;
         pairs.emplace_back( ranked[i], ranked[opponent] );
      }
      return pairs;
   }
}

std::string swiss_system_generator::name()const
{
   return "swiss";
}

validation_result swiss_system_generator::validate( const tournament_descriptor& tournament,
                                                    const stage_descriptor& stage,
                                                    uint32_t participant_count )const
{
   validation_result result;
   check_participant_count( "Swiss system", participant_count,
                            TOURNEY_SWISS_MIN_PARTICIPANTS,
                            TOURNEY_SWISS_MAX_PARTICIPANTS, result.errors );
   parse_swiss_options( stage, result.errors );
   return result;
}

uint32_t swiss_system_generator::expected_match_count( const stage_descriptor& stage, uint32_t participant_count )const
{
   return participant_count / 2 + participant_count % 2;
}

std::vector<match_record> swiss_system_generator::generate( const tournament_descriptor& tournament,
                                                            const stage_descriptor& stage,
                                                            const std::vector<participant>& participants )const
{
   require_valid( tournament, stage, participants.size() );
   std::vector<std::string> errors;
   const swiss_options options = parse_swiss_options( stage, errors );
   const uint32_t num_participants = participants.size();
   if( options.rounds_count >= num_participants )
      fc_wlog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
               "Swiss stage ${stage} plays ${rounds} rounds with only ${n} participants; rematches will be unavoidable",
               ("stage", stage.id)("rounds", options.rounds_count)("n", num_participants) );

   // the top half of the seeds meets the bottom half in order
   const uint32_t half = (num_participants + 1) / 2;
   std::vector<match_record> matches;
   matches.reserve( expected_match_count( stage, num_participants ) );
   for( uint32_t i = 0; i < num_participants / 2; ++i )
   {
      match_record match = make_match( tournament, stage, bracket_segment::main, 1, i + 1 );
      match.team_a = match_slot::for_participant( participants[i] );
      match.team_b = match_slot::for_participant( participants[i + half] );
      match.metadata = fc::mutable_variant_object( "bracket_type", name() )
                          ( "round_name", "Round 1" )
                          ( "swiss_round", 1 )
                          ( "total_rounds", options.rounds_count )
                          ( "has_bye", false );
      matches.push_back( match );
   }

   // with an odd field the last top half seed has nobody left to meet
   if( num_participants % 2 )
   {
      match_record match = make_match( tournament, stage, bracket_segment::main, 1, matches.size() + 1 );
      match.team_a = match_slot::for_participant( participants[half - 1] );
      match.team_b = match_slot::bye();
      match.metadata = fc::mutable_variant_object( "bracket_type", name() )
                          ( "round_name", "Round 1" )
                          ( "swiss_round", 1 )
                          ( "total_rounds", options.rounds_count )
                          ( "has_bye", true );
      matches.push_back( match );
   }

   fc_ilog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
            "Paired round 1 of ${rounds} Swiss rounds: ${count} matches for ${n} participants",
            ("rounds", options.rounds_count)("count", matches.size())("n", num_participants) );
   return matches;
}

std::vector<swiss_pairing> swiss_system_generator::generate_subsequent_round(
      uint32_t round_number,
      const std::vector<swiss_standing>& standings,
      const std::vector<swiss_pairing>& previous_pairings )const
{
   std::vector<swiss_pairing> result;
   if( standings.empty() )
      return result;

   std::set<participant_id_type> listed;
   for( const swiss_standing& s : standings )
      if( !listed.insert( s.participant_id ).second )
         FC_THROW_EXCEPTION( invalid_bracket_configuration,
                             "Participant ${id} is listed more than once in the standings for Swiss round ${round}",
                             ("id", s.participant_id)("round", round_number) );

   std::vector<swiss_standing> ranked( standings );
   std::stable_sort( ranked.begin(), ranked.end(), []( const swiss_standing& a, const swiss_standing& b ) {
      if( a.wins != b.wins )
         return a.wins > b.wins;
      if( a.points != b.points )
         return a.points > b.points;
      return a.buchholz > b.buchholz;
   });

   pairing_set played;
   std::set<participant_id_type> had_bye;
   for( const swiss_pairing& pairing : previous_pairings )
   {
      if( pairing.is_bye() )
         had_bye.insert( pairing.first );
      else
         played.insert( pairing_key( pairing.first, *pairing.second ) );
   }

   std::vector<participant_id_type> ids;
   ids.reserve( ranked.size() );
   for( const swiss_standing& s : ranked )
      ids.push_back( s.participant_id );

   std::vector<std::pair<participant_id_type, participant_id_type>> pairs;
   uint32_t steps = 0;
   fc::optional<participant_id_type> bye;
   if( ids.size() % 2 == 0 )
   {
      std::vector<bool> used( ids.size(), false );
      if( !pair_without_rematches( ids, used, played, pairs, steps ) )
      {
         fc_wlog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
                  "No rematch-free pairing for Swiss round ${round} after ${steps} steps, allowing rematches",
                  ("round", round_number)("steps", steps) );
         pairs = pair_allowing_rematches( ids, played );
      }
   }
   else
   {
      // bye candidates from the bottom up, those who already sat out only if everyone has
      std::vector<size_t> candidates;
      for( size_t i = ids.size(); i-- > 0; )
         if( !had_bye.count( ids[i] ) )
            candidates.push_back( i );
      if( candidates.empty() )
         for( size_t i = ids.size(); i-- > 0; )
            candidates.push_back( i );

      for( size_t candidate : candidates )
      {
         std::vector<bool> used( ids.size(), false );
         used[candidate] = true;
         pairs.clear();
         if( pair_without_rematches( ids, used, played, pairs, steps ) )
         {
            bye = ids[candidate];
            break;
         }
         if( steps > TOURNEY_SWISS_MAX_PAIRING_STEPS )
            break;
      }

      if( !bye.valid() )
      {
         fc_wlog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
                  "No rematch-free pairing for Swiss round ${round} after ${steps} steps, allowing rematches",
                  ("round", round_number)("steps", steps) );
         bye = ids[candidates.front()];
         std::vector<participant_id_type> rest( ids );
         rest.erase( rest.begin() + candidates.front() );
         pairs = pair_allowing_rematches( rest, played );
      }
   }

   for( const auto& p : pairs )
   {
      swiss_pairing pairing;
      pairing.first = p.first;
      pairing.second = p.second;
      result.push_back( pairing );
   }
   if( bye.valid() )
   {
      swiss_pairing pairing;
      pairing.first = *bye;
      result.push_back( pairing );
   }
   return result;
}

std::vector<match_record> swiss_system_generator::generate_round( const tournament_descriptor& tournament,
                                                                  const stage_descriptor& stage,
                                                                  const std::vector<participant>& participants,
                                                                  uint32_t round_number,
                                                                  const std::vector<swiss_standing>& standings,
                                                                  const std::vector<swiss_pairing>& previous_pairings )const
{
   require_valid( tournament, stage, participants.size() );
   std::vector<std::string> errors;
   const swiss_options options = parse_swiss_options( stage, errors );
   if( round_number < 2 || round_number > options.rounds_count )
      FC_THROW_EXCEPTION( invalid_bracket_configuration,
                          "Swiss stage ${stage} has rounds 2 to ${rounds} to pair from standings, got round ${round}",
                          ("stage", stage.id)("rounds", options.rounds_count)("round", round_number) );

   std::map<participant_id_type, const participant*> by_id;
   for( const participant& p : participants )
      by_id[p.id] = &p;
   for( const swiss_standing& s : standings )
      if( !by_id.count( s.participant_id ) )
         FC_THROW_EXCEPTION( invalid_bracket_configuration,
                             "Standings name participant ${id} who is not in stage ${stage}",
                             ("id", s.participant_id)("stage", stage.id) );

   // equal records are ranked by seed
   std::map<participant_id_type, size_t> seed;
   for( size_t i = 0; i < participants.size(); ++i )
      seed[participants[i].id] = i;
   std::vector<swiss_standing> seeded( standings );
   std::stable_sort( seeded.begin(), seeded.end(), [&seed]( const swiss_standing& a, const swiss_standing& b ) {
      return seed[a.participant_id] < seed[b.participant_id];
   });

   const std::vector<swiss_pairing> pairings = generate_subsequent_round( round_number, seeded, previous_pairings );
   std::vector<match_record> matches;
   matches.reserve( pairings.size() );
   for( const swiss_pairing& pairing : pairings )
   {
      match_record match = make_match( tournament, stage, bracket_segment::main, round_number, matches.size() + 1 );
      match.team_a = match_slot::for_participant( *by_id[pairing.first] );
      match.team_b = pairing.is_bye() ? match_slot::bye() : match_slot::for_participant( *by_id[*pairing.second] );
      match.metadata = fc::mutable_variant_object( "bracket_type", name() )
                          ( "round_name", "Round " + std::to_string( round_number ) )
                          ( "swiss_round", round_number )
                          ( "total_rounds", options.rounds_count )
                          ( "has_bye", pairing.is_bye() );
      matches.push_back( match );
   }

   fc_ilog( fc::logger::get( TOURNEY_BRACKET_LOGGER ),
            "Paired Swiss round ${round} of stage ${stage}: ${count} matches",
            ("round", round_number)("stage", stage.id)("count", matches.size()) );
   return matches;
}

} } // tourney::bracket
