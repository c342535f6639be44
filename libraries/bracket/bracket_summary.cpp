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
#include <tourney/bracket/bracket_summary.hpp>

#include <map>

namespace tourney { namespace bracket {

bracket_summary summarize_bracket( const std::string& format, uint32_t participant_count,
                                   const std::vector<match_record>& matches )
{
   bracket_summary summary;
   summary.format = format;
   summary.participant_count = participant_count;
   summary.total_matches = matches.size();

   std::vector<bracket_segment> order;
   std::map<bracket_segment, std::map<uint32_t, round_summary>> rounds;
   for( const match_record& match : matches )
   {
      if( rounds.find( match.segment ) == rounds.end() )
         order.push_back( match.segment );

      round_summary& round = rounds[match.segment][match.round_number];
      if( round.match_count == 0 )
      {
         round.round_number = match.round_number;
         auto itr = match.metadata.find( "round_name" );
         if( itr != match.metadata.end() && itr->value().is_string() )
            round.round_name = itr->value().get_string();
         else
            round.round_name = "Round " + std::to_string( match.round_number );
      }
      ++round.match_count;
      if( match.has_bye() )
      {
         ++round.bye_count;
         ++summary.bye_matches;
      }
   }

   for( bracket_segment segment : order )
   {
      segment_summary s;
      s.segment = segment;
      for( const auto& entry : rounds[segment] )
         s.rounds.push_back( entry.second );
      summary.segments.push_back( s );
   }
   return summary;
}

} } // tourney::bracket
