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

   struct round_summary
   {
      uint32_t    round_number = 0;
      std::string round_name;
      uint32_t    match_count = 0;
      uint32_t    bye_count = 0;
   };

   struct segment_summary
   {
      bracket_segment            segment = bracket_segment::main;
      std::vector<round_summary> rounds;
   };

   /**
    * @brief Shape of a generated bracket, for display and sanity checks
    *
    * Segments appear in the order their first match was generated, rounds in
    * ascending order within each segment.
    */
   struct bracket_summary
   {
      std::string                  format;
      uint32_t                     participant_count = 0;
      uint32_t                     total_matches = 0;
      uint32_t                     bye_matches = 0;
      std::vector<segment_summary> segments;
   };

   bracket_summary summarize_bracket( const std::string& format, uint32_t participant_count,
                                      const std::vector<match_record>& matches );

} } // tourney::bracket

FC_REFLECT( tourney::bracket::round_summary, (round_number)(round_name)(match_count)(bye_count) )
FC_REFLECT( tourney::bracket::segment_summary, (segment)(rounds) )
FC_REFLECT( tourney::bracket::bracket_summary,
            (format)(participant_count)(total_matches)(bye_matches)(segments) )
