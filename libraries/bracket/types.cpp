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
#include <tourney/bracket/types.hpp>
#include <tourney/bracket/config.hpp>

#include <fc/exception/exception.hpp>

namespace tourney { namespace bracket {

match_slot match_slot::for_participant( const participant& p )
{
   match_slot slot;
   slot.kind = slot_kind::resolved;
   slot.participant_id = p.id;
   slot.participant_name = p.name;
   return slot;
}

match_slot match_slot::to_be_determined()
{
   return match_slot();
}

match_slot match_slot::bye()
{
   match_slot slot;
   slot.kind = slot_kind::bye;
   return slot;
}

std::string match_slot::display_name()const
{
   switch( kind )
   {
      case slot_kind::resolved:
         return participant_name;
      case slot_kind::bye:
         return TOURNEY_BYE_LABEL;
      case slot_kind::unresolved:
      default:
         return TOURNEY_TBD_LABEL;
   }
}

} } // tourney::bracket

namespace fc {
   // Flatten the slots into the id/name pairs the persistence layer stores
   void to_variant( const tourney::bracket::match_record& record, fc::variant& v, uint32_t max_depth )
   { try {
      fc::mutable_variant_object o;
      o("id", fc::variant(record.id, max_depth))
       ("tournament_id", fc::variant(record.tournament_id, max_depth))
       ("stage_id", fc::variant(record.stage_id, max_depth))
       ("round_number", fc::variant(record.round_number, max_depth))
       ("match_number", fc::variant(record.match_number, max_depth))
       ("stage_type", fc::variant(record.segment, max_depth))
       ("team_a_id", fc::variant(record.team_a.participant_id, max_depth))
       ("team_b_id", fc::variant(record.team_b.participant_id, max_depth))
       ("team_a_name", fc::variant(record.team_a.display_name()))
       ("team_b_name", fc::variant(record.team_b.display_name()))
       ("state", fc::variant(record.state, max_depth))
       ("metadata", fc::variant(record.metadata));

      v = o;
   } FC_RETHROW_EXCEPTIONS(warn, "") }
} //end namespace fc
