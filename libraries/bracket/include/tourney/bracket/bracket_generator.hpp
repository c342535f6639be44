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

   /// Outcome of bracket_generator::validate
   struct validation_result
   {
      std::vector<std::string> errors;

      bool valid()const { return errors.empty(); }
   };

   /**
    * @brief Turns a seeded participant list into the match skeleton of one format
    *
    * Implementations are stateless: every method is a pure function of its
    * arguments, so a single instance may serve any number of threads.
    */
   class bracket_generator
   {
   public:
      virtual ~bracket_generator() {}

      /// Format name written into the `bracket_type` metadata of every record
      virtual std::string name()const = 0;

      /**
       * @brief Check participant count bounds and the format's stage options
       * @return every problem found, not just the first
       */
      virtual validation_result validate( const tournament_descriptor& tournament,
                                          const stage_descriptor& stage,
                                          uint32_t participant_count )const = 0;

      /**
       * @brief Allocate all matches of the stage
       *
       * Throws invalid_bracket_configuration when called with input that
       * validate() rejects.
       */
      virtual std::vector<match_record> generate( const tournament_descriptor& tournament,
                                                  const stage_descriptor& stage,
                                                  const std::vector<participant>& participants )const = 0;

      /// Number of records generate() returns for a valid input of this size
      virtual uint32_t expected_match_count( const stage_descriptor& stage, uint32_t participant_count )const = 0;

      virtual bool supports_third_place()const { return false; }

   protected:
      static void check_participant_count( const std::string& format_name, uint32_t participant_count,
                                           uint32_t minimum, uint32_t maximum,
                                           std::vector<std::string>& errors );

      /// Record stamped with the tournament and stage, both slots TBD
      static match_record make_match( const tournament_descriptor& tournament, const stage_descriptor& stage,
                                      bracket_segment segment, uint32_t round_number, uint32_t match_number );

      void require_valid( const tournament_descriptor& tournament, const stage_descriptor& stage,
                          uint32_t participant_count )const;
   };

} } // tourney::bracket
