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

#include <tourney/bracket/types.hpp>

#include <string>
#include <vector>

namespace tourney { namespace bracket {

   struct single_elimination_options
   {
      /// Play an extra match between the two semifinal losers
      bool third_place_match = false;
   };

   struct double_elimination_options
   {
      /// Replay the grand finals if the losers bracket champion wins the first one
      bool grand_finals_reset = true;
   };

   struct swiss_options
   {
      /// Number of Swiss rounds; required, there is no default
      uint32_t rounds_count = 0;
   };

   /**
    * @brief Look up a stage option, preferring `config` over `metadata`
    * @return nullptr when neither map has the key
    */
   const fc::variant* find_stage_option( const stage_descriptor& stage, const std::string& key );

   /**
    * Parse the typed options of a format from the free-form stage maps.
    * Problems are appended to @p errors as readable messages and the
    * affected field keeps its default.
    */
   /// @{
   single_elimination_options parse_single_elimination_options( const stage_descriptor& stage,
                                                                std::vector<std::string>& errors );
   double_elimination_options parse_double_elimination_options( const stage_descriptor& stage,
                                                                std::vector<std::string>& errors );
   swiss_options parse_swiss_options( const stage_descriptor& stage, std::vector<std::string>& errors );
   /// @}

} } // tourney::bracket

FC_REFLECT( tourney::bracket::single_elimination_options, (third_place_match) )
FC_REFLECT( tourney::bracket::double_elimination_options, (grand_finals_reset) )
FC_REFLECT( tourney::bracket::swiss_options, (rounds_count) )
