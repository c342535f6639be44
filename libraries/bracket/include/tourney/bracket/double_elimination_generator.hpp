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
    * @brief Winners bracket, losers bracket and grand finals
    *
    * The losers bracket alternates between rounds that pair its own
    * survivors and rounds in which the losers of a winners round drop in,
    * so it needs 2 * (winners rounds - 1) rounds.  The grand finals reset is
    * a conditional match: it is only played when the losers bracket
    * champion wins the first grand finals match.
    *
    * Stage options: `grand_finals_reset` (bool, default true).
    */
   class double_elimination_generator : public bracket_generator
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

      /// Match count of each losers bracket round, first round first
      static std::vector<uint32_t> losers_round_sizes( uint32_t participant_count );
   };

} } // tourney::bracket
