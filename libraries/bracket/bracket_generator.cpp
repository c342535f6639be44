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
#include <tourney/bracket/bracket_generator.hpp>
#include <tourney/bracket/exceptions.hpp>

#include <boost/algorithm/string/join.hpp>

namespace tourney { namespace bracket {

void bracket_generator::check_participant_count( const std::string& format_name, uint32_t participant_count,
                                                 uint32_t minimum, uint32_t maximum,
                                                 std::vector<std::string>& errors )
{
   if( participant_count < minimum )
      errors.push_back( format_name + " requires at least " + std::to_string( minimum ) +
                        " participants, got " + std::to_string( participant_count ) );
   else if( participant_count > maximum )
      errors.push_back( format_name + " supports at most " + std::to_string( maximum ) +
                        " participants, got " + std::to_string( participant_count ) );
}

match_record bracket_generator::make_match( const tournament_descriptor& tournament, const stage_descriptor& stage,
                                            bracket_segment segment, uint32_t round_number, uint32_t match_number )
{
   match_record record;
   record.tournament_id = tournament.id;
   record.stage_id = stage.id;
   record.segment = segment;
   record.round_number = round_number;
   record.match_number = match_number;
   return record;
}

void bracket_generator::require_valid( const tournament_descriptor& tournament, const stage_descriptor& stage,
                                       uint32_t participant_count )const
{
   validation_result result = validate( tournament, stage, participant_count );
   if( !result.valid() )
      FC_THROW_EXCEPTION( invalid_bracket_configuration,
                          "Cannot generate ${format} bracket: ${errors}",
                          ("format", name())("errors", boost::algorithm::join( result.errors, "; " )) );
}

} } // tourney::bracket
