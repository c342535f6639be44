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

   /// Smallest power of two that is >= n, for n >= 1
   uint32_t next_power_of_two( uint32_t n );

   /// Number of phantom slots needed to fill a bracket for n participants
   uint32_t bye_count( uint32_t n );

   /// log2 of a power of two
   uint32_t number_of_rounds( uint32_t bracket_size );

   /**
    * @brief Place seeded participants into first round bracket slots
    *
    * Returns next_power_of_two(n) slots, where slots 2k and 2k+1 meet in
    * the first round.  Seed k lands on the slot given by the bit-reversed
    * Gray code of k, so seed k always faces seed (size - 1 - k) and the top
    * two seeds sit in opposite halves.  The phantom seeds n..size-1 become
    * bye slots, which therefore only ever face the top seeds.
    *
    * @param participants participants in seed order
    * @param byes must equal bye_count(participants.size())
    */
   std::vector<match_slot> seed_with_byes( const std::vector<participant>& participants, uint32_t byes );

   /**
    * Human readable name of an elimination round, counted from the final:
    * "Finals", "Semi Finals", "Quarter Finals", "Round of 16", "Round of 32",
    * then "Round N"
    */
   std::string round_name( uint32_t round_number, uint32_t total_rounds );

} } // tourney::bracket
