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

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tourney { namespace bracket {

   /**
    * @brief Picks the generator for a stage and runs it
    *
    * Each engine owns its own registry of formats, filled with the built in
    * generators on construction:
    *
    *  - `single_elim`, `single_elimination`
    *  - `double_elim`, `double_elimination`
    *  - `round_robin`
    *  - `swiss`
    *
    * Registry access is serialized; generation itself runs outside the lock,
    * so one engine can serve concurrent callers.
    */
   class bracket_engine
   {
   public:
      bracket_engine();

      /**
       * @brief Resolve the format key of a stage
       *
       * The normalized stage type wins; the tournament's format hint is the
       * fallback.  Throws unknown_bracket_format listing the registered keys
       * when neither names a registered format.
       */
      std::string determine_format( const tournament_descriptor& tournament, const stage_descriptor& stage )const;

      /**
       * @brief Generate every match of a stage
       *
       * Either returns the complete bracket or throws:
       * invalid_bracket_configuration when validation fails (generate is not
       * called), unknown_bracket_format when no format resolves, and
       * bracket_generation_failure when the generator itself fails.
       *
       * @param participants in seed order
       */
      std::vector<match_record> generate_bracket_for_stage( const tournament_descriptor& tournament,
                                                            const stage_descriptor& stage,
                                                            const std::vector<participant>& participants )const;

      /// Add a format, or replace the generator behind an existing key
      void register_generator( const std::string& format, std::shared_ptr<bracket_generator> generator );

      /// Registered format keys, sorted
      std::vector<std::string> get_supported_formats()const;

      bool supports_format( const std::string& format )const;

      /// Throws unknown_bracket_format if @p format is not registered
      std::shared_ptr<const bracket_generator> get_generator( const std::string& format )const;

      /// Lower case, surrounding blanks trimmed, spaces and hyphens turned into underscores
      static std::string normalize_format_key( const std::string& format );

   private:
      /// Checks every format shares: unique participant ids, the tournament team limit
      static void check_participants( const tournament_descriptor& tournament,
                                      const std::vector<participant>& participants,
                                      std::vector<std::string>& errors );

      mutable std::mutex lock;
      std::map<std::string, std::shared_ptr<bracket_generator>> registered_generators;
   };

} } // tourney::bracket
