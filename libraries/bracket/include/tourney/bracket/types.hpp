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

#include <cstdint>
#include <string>
#include <vector>

#include <fc/optional.hpp>
#include <fc/time.hpp>
#include <fc/variant_object.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

namespace tourney { namespace bracket {

   typedef uint64_t tournament_id_type;
   typedef uint64_t stage_id_type;
   typedef uint64_t participant_id_type;
   typedef uint64_t match_id_type;

   /**
    * @brief The tournament a stage belongs to, as handed over by the domain layer
    *
    * Only `format_hint` and `max_teams` influence generation; everything else is
    * carried for logging and error context.
    */
   struct tournament_descriptor
   {
      tournament_id_type             id = 0;
      std::string                    name;
      std::string                    game_slug;
      /// Name of the phase the tournament is currently in
      std::string                    stage;
      uint32_t                       team_size = 1;
      fc::optional<uint32_t>         max_teams;
      std::string                    status;
      fc::time_point_sec             start_time;
      /// Fallback format selector, used when the stage type is not a registered format
      std::string                    format_hint;
   };

   /**
    * @brief One phase of a tournament with its own format
    *
    * `config` and `metadata` are free-form maps; each format reads its knobs
    * from them through the typed option structs in stage_options.hpp.
    */
   struct stage_descriptor
   {
      stage_id_type                  id = 0;
      std::string                    name;
      /// Primary format selector, e.g. "single_elim" or "Round Robin"
      std::string                    type;
      uint32_t                       order = 1;
      fc::variant_object             config;
      fc::variant_object             metadata;
   };

   /// A competing team. Its seed is its position in the participant list.
   struct participant
   {
      participant_id_type            id = 0;
      std::string                    name;
   };

   enum class bracket_segment
   {
      winners,
      losers,
      grand_finals,
      grand_finals_reset,
      main
   };

   enum class match_record_state
   {
      pending
   };

   enum class slot_kind
   {
      unresolved,
      resolved,
      bye
   };

   /**
    * @brief One side of a match
    *
    * A slot either names its participant, waits for the result of an earlier
    * match, or is a bye that the other side advances through.
    */
   struct match_slot
   {
      slot_kind                          kind = slot_kind::unresolved;
      fc::optional<participant_id_type>  participant_id;
      std::string                        participant_name;

      static match_slot for_participant( const participant& p );
      static match_slot to_be_determined();
      static match_slot bye();

      bool is_resolved()const   { return kind == slot_kind::resolved; }
      bool is_unresolved()const { return kind == slot_kind::unresolved; }
      bool is_bye()const        { return kind == slot_kind::bye; }

      /// The participant name, or the BYE / TBD label
      std::string display_name()const;
   };

   /**
    * @brief A match allocated by a generator, not yet persisted
    */
   struct match_record
   {
      /// Assigned by the persistence layer, never by a generator
      fc::optional<match_id_type>    id;
      tournament_id_type             tournament_id = 0;
      stage_id_type                  stage_id = 0;
      uint32_t                       round_number = 0;
      uint32_t                       match_number = 0;
      bracket_segment                segment = bracket_segment::main;
      match_slot                     team_a;
      match_slot                     team_b;
      match_record_state             state = match_record_state::pending;
      fc::variant_object             metadata;

      bool has_bye()const { return team_a.is_bye() || team_b.is_bye(); }
   };

} } // tourney::bracket

namespace fc {
   void to_variant( const tourney::bracket::match_record& record, fc::variant& v, uint32_t max_depth = 1 );
} //end namespace fc

FC_REFLECT_ENUM( tourney::bracket::bracket_segment,
                 (winners)
                 (losers)
                 (grand_finals)
                 (grand_finals_reset)
                 (main) )
FC_REFLECT_ENUM( tourney::bracket::match_record_state, (pending) )
FC_REFLECT_ENUM( tourney::bracket::slot_kind, (unresolved)(resolved)(bye) )

FC_REFLECT( tourney::bracket::tournament_descriptor,
            (id)(name)(game_slug)(stage)(team_size)(max_teams)(status)(start_time)(format_hint) )
FC_REFLECT( tourney::bracket::stage_descriptor, (id)(name)(type)(order)(config)(metadata) )
FC_REFLECT( tourney::bracket::participant, (id)(name) )
FC_REFLECT( tourney::bracket::match_slot, (kind)(participant_id)(participant_name) )
