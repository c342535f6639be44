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
#pragma once

#include <tourney/bracket/bracket_generator.hpp>

namespace tourney { namespace bracket {

   /// A participant's record after some Swiss rounds
   struct swiss_standing
   {
      participant_id_type participant_id = 0;
      uint32_t            wins = 0;
      uint32_t            losses = 0;
      double              points = 0;
      /// Sum of the opponents' scores, breaks ties between equal records
      double              buchholz = 0;
   };

   /// Two participants meeting in a Swiss round, or one participant receiving the bye
   struct swiss_pairing
   {
      participant_id_type                first = 0;
      fc::optional<participant_id_type>  second;

      bool is_bye()const { return !second.valid(); }
   };

   /**
    * @brief Swiss system: a fixed number of rounds, opponents picked by record
    *
    * generate() only produces round 1, which is fully determined by the seed
    * order: seed i meets seed i + ceil(n/2).  Later rounds depend on results
    * and are produced one at a time by generate_round().
    *
    * Stage options: `rounds_count` (integer, required).
    */
   class swiss_system_generator : public bracket_generator
   {
   public:
      std::string name()const override;

      validation_result validate( const tournament_descriptor& tournament,
                                  const stage_descriptor& stage,
                                  uint32_t participant_count )const override;

      std::vector<match_record> generate( const tournament_descriptor& tournament,
                                          const stage_descriptor& stage,
                                          const std::vector<participant>& participants )const override;

      uint32_t expected_match_count( const stage_descriptor& stage, uint32_t participant_count )const override;

      /**
       * @brief Pair a round after the first from the current standings
       *
       * Standings are ranked by wins, then points, then Buchholz, ties keeping
       * their given order.  With an odd field the lowest ranked participant
       * who has not had a bye yet sits out, unless that leaves no
       * rematch-free round; then the next one up is tried.  The rest are
       * paired from the top down, each taking the highest ranked opponent
       * they have not met before, so players stay within their score group
       * unless a rematch forces them to float down.  Only when no bye choice
       * gives a rematch-free round are rematches allowed.
       *
       * Throws invalid_bracket_configuration if a participant is listed twice.
       *
       * @param round_number round being paired, used for logging
       * @param standings current record of every participant still playing
       * @param previous_pairings all pairings of earlier rounds, byes included
       * @return pairings ordered by rank, the bye (if any) last
       */
      std::vector<swiss_pairing> generate_subsequent_round( uint32_t round_number,
                                                            const std::vector<swiss_standing>& standings,
                                                            const std::vector<swiss_pairing>& previous_pairings )const;

      /**
       * @brief Match records for round @p round_number (2..rounds_count)
       *
       * Every participant named in @p standings must be in @p participants.
       * Participants with equal records are ranked by seed.
       */
      std::vector<match_record> generate_round( const tournament_descriptor& tournament,
                                                const stage_descriptor& stage,
                                                const std::vector<participant>& participants,
                                                uint32_t round_number,
                                                const std::vector<swiss_standing>& standings,
                                                const std::vector<swiss_pairing>& previous_pairings )const;
   };

} } // tourney::bracket

FC_REFLECT( tourney::bracket::swiss_standing, (participant_id)(wins)(losses)(points)(buchholz) )
FC_REFLECT( tourney::bracket::swiss_pairing, (first)(second) )
