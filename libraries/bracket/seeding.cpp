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
#include <tourney/bracket/seeding.hpp>

#include <fc/exception/exception.hpp>

namespace tourney { namespace bracket {

namespace {
   // reverse the bits in an integer
   uint32_t reverse_bits( uint32_t x )
   {
      x = (((x & 0xaaaaaaaa) >> 1) | ((x & 0x55555555) << 1));
      x = (((x & 0xcccccccc) >> 2) | ((x & 0x33333333) << 2));
      x = (((x & 0xf0f0f0f0) >> 4) | ((x & 0x0f0f0f0f) << 4));
      x = (((x & 0xff00ff00) >> 8) | ((x & 0x00ff00ff) << 8));
      return ((x >> 16) | (x << 16));
   }

   uint32_t slot_for_seed( uint32_t seed, uint32_t num_rounds )
   {
      if( num_rounds == 0 )
         return 0;
      return reverse_bits( seed ^ (seed >> 1) ) >> (32 - num_rounds);
   }
}

uint32_t next_power_of_two( uint32_t n )
{
   FC_ASSERT( n >= 1, "Bracket size is only defined for at least one participant" );
   FC_ASSERT( n <= (1u << 31), "Too many participants: ${n}", ("n", n) );
   uint32_t size = 1;
   while( size < n )
      size <<= 1;
   return size;
}

uint32_t bye_count( uint32_t n )
{
   return next_power_of_two( n ) - n;
}

uint32_t number_of_rounds( uint32_t bracket_size )
{
   FC_ASSERT( bracket_size >= 1 && (bracket_size & (bracket_size - 1)) == 0,
              "Bracket size ${size} is not a power of two", ("size", bracket_size) );
   uint32_t rounds = 0;
   while( (1u << rounds) < bracket_size )
      ++rounds;
   return rounds;
}

std::vector<match_slot> seed_with_byes( const std::vector<participant>& participants, uint32_t byes )
{
   const uint32_t num_participants = participants.size();
   FC_ASSERT( num_participants >= 1, "Cannot seed an empty participant list" );
   FC_ASSERT( byes == bye_count( num_participants ),
              "${n} participants need ${expected} byes, got ${byes}",
              ("n", num_participants)("expected", bye_count( num_participants ))("byes", byes) );

   const uint32_t bracket_size = num_participants + byes;
   const uint32_t num_rounds = number_of_rounds( bracket_size );

   // every slot not claimed by a real seed belongs to a phantom seed, i.e. a bye
   std::vector<match_slot> slots( bracket_size, match_slot::bye() );
   for( uint32_t seed = 0; seed < num_participants; ++seed )
      slots[slot_for_seed( seed, num_rounds )] = match_slot::for_participant( participants[seed] );
   return slots;
}

std::string round_name( uint32_t round_number, uint32_t total_rounds )
{
   const uint32_t rounds_from_end = total_rounds >= round_number ? total_rounds - round_number : 0;
   switch( rounds_from_end )
   {
      case 0: return "Finals";
      case 1: return "Semi Finals";
      case 2: return "Quarter Finals";
      case 3: return "Round of 16";
      case 4: return "Round of 32";
      default: return "Round " + std::to_string( round_number );
   }
}

} } // tourney::bracket
