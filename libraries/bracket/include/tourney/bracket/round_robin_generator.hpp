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

#include <utility>

namespace tourney { namespace bracket {

   /**
    * @brief Everyone plays everyone once, scheduled with the circle method
    *
    * With an odd field one participant sits out each round; no bye match is
    * emitted for them.
    */
   class round_robin_generator : public bracket_generator
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
       * @brief Seed index pairs of every round
       *
       * Seed 0 stays in place while the others rotate one position per round.
       */
      static std::vector<std::vector<std::pair<uint32_t, uint32_t>>> schedule( uint32_t participant_count );
   };

} } // tourney::bracket
