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
#include <tourney/bracket/stage_options.hpp>
#include <tourney/bracket/config.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace tourney { namespace bracket {

namespace {
   bool parse_flag( const stage_descriptor& stage, const std::string& key, bool default_value,
                    std::vector<std::string>& errors )
   {
      const fc::variant* value = find_stage_option( stage, key );
      if( value == nullptr || value->is_null() )
         return default_value;
      if( value->is_bool() )
         return value->as_bool();
      if( value->is_int64() || value->is_uint64() )
         return value->as_uint64() != 0;
      if( value->is_string() )
      {
         std::string text = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( value->as_string() ) );
         if( text == "true" || text == "1" || text == "yes" )
            return true;
         if( text == "false" || text == "0" || text == "no" )
            return false;
      }
      errors.push_back( key + " must be a boolean" );
      return default_value;
   }
}

const fc::variant* find_stage_option( const stage_descriptor& stage, const std::string& key )
{
   auto itr = stage.config.find( key );
   if( itr != stage.config.end() )
      return &itr->value();
   itr = stage.metadata.find( key );
   if( itr != stage.metadata.end() )
      return &itr->value();
   return nullptr;
}

single_elimination_options parse_single_elimination_options( const stage_descriptor& stage,
                                                             std::vector<std::string>& errors )
{
   single_elimination_options options;
   options.third_place_match = parse_flag( stage, "third_place_match", options.third_place_match, errors );
   return options;
}

double_elimination_options parse_double_elimination_options( const stage_descriptor& stage,
                                                             std::vector<std::string>& errors )
{
   double_elimination_options options;
   options.grand_finals_reset = parse_flag( stage, "grand_finals_reset", options.grand_finals_reset, errors );
   return options;
}

swiss_options parse_swiss_options( const stage_descriptor& stage, std::vector<std::string>& errors )
{
   swiss_options options;
   const fc::variant* value = find_stage_option( stage, "rounds_count" );
   if( value == nullptr || value->is_null() )
   {
      errors.push_back( "Swiss stage requires rounds_count in its config" );
      return options;
   }
   if( !value->is_int64() && !value->is_uint64() )
   {
      errors.push_back( "rounds_count must be an integer" );
      return options;
   }

   const int64_t rounds = value->as_int64();
   if( rounds < TOURNEY_SWISS_MIN_ROUNDS || rounds > TOURNEY_SWISS_MAX_ROUNDS )
   {
      errors.push_back( "rounds_count must be between " + std::to_string( TOURNEY_SWISS_MIN_ROUNDS ) +
                        " and " + std::to_string( TOURNEY_SWISS_MAX_ROUNDS ) +
                        ", got " + std::to_string( rounds ) );
      return options;
   }
   options.rounds_count = static_cast<uint32_t>( rounds );
   return options;
}

} } // tourney::bracket
