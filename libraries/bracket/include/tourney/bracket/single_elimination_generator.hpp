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

   /**
    * @brief Knockout bracket; one loss eliminates
    *
    * Fields that are not a power of two are padded with byes in the first
    * round.  Only the first round has resolved slots; the caller fills the
    * later rounds as results arrive.
    *
    * Stage options: `third_place_match` (bool, default false).
    */
   class single_elimination_generator : public bracket_generator
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

      bool supports_third_place()const override { return true; }

      /**
       * @brief Allocate every round of a seeded knockout bracket
       *
       * Shared with the winners side of double elimination.  Round 1 holds
       * next_power_of_two(n) / 2 matches, bye matches included, and each
       * later round halves the count.
       */
      static std::vector<match_record> allocate_rounds( const tournament_descriptor& tournament,
                                                        const stage_descriptor& stage,
                                                        const std::vector<participant>& participants,
                                                        bracket_segment segment,
                                                        const std::string& bracket_type,
                                                        const std::string& round_name_prefix );
   };

} } // tourney::bracket
