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
#include <tourney/bracket/bracket_engine.hpp>
#include <tourney/bracket/bracket_summary.hpp>
#include <tourney/bracket/config.hpp>
#include <tourney/bracket/exceptions.hpp>
#include <tourney/bracket/swiss_system_generator.hpp>

#include <fc/exception/exception.hpp>
#include <fc/io/json.hpp>
#include <fc/log/appender.hpp>
#include <fc/log/logger.hpp>

#include <boost/algorithm/string/join.hpp>
#include <boost/program_options.hpp>

#include <iostream>

using namespace tourney::bracket;
namespace bpo = boost::program_options;

/// One stage to generate, as read from the request file
struct bracket_request
{
   tournament_descriptor               tournament;
   stage_descriptor                    stage;
   /// in seed order
   std::vector<participant>            participants;

   /// Set to pair a later Swiss round from standings instead of generating the stage
   fc::optional<uint32_t>              swiss_round;
   std::vector<swiss_standing>         standings;
   std::vector<swiss_pairing>          previous_pairings;
};

FC_REFLECT( bracket_request, (tournament)(stage)(participants)(swiss_round)(standings)(previous_pairings) )

namespace {

   std::vector<match_record> run_request( const bracket_engine& engine, const bracket_request& request,
                                          std::string& format )
   {
      format = engine.determine_format( request.tournament, request.stage );
      if( !request.swiss_round.valid() || *request.swiss_round == 1 )
         return engine.generate_bracket_for_stage( request.tournament, request.stage, request.participants );

      auto swiss = std::dynamic_pointer_cast<const swiss_system_generator>( engine.get_generator( format ) );
      if( !swiss )
         FC_THROW_EXCEPTION( invalid_bracket_configuration,
                             "swiss_round given for stage ${stage}, but its format is ${format}",
                             ("stage", request.stage.id)("format", format) );
      return swiss->generate_round( request.tournament, request.stage, request.participants,
                                    *request.swiss_round, request.standings, request.previous_pairings );
   }

   fc::variant matches_to_variant( const std::vector<match_record>& matches )
   {
      fc::variants result;
      result.reserve( matches.size() );
      for( const match_record& match : matches )
      {
         fc::variant v;
         fc::to_variant( match, v, TOURNEY_MAX_NESTED_OBJECTS );
         result.push_back( v );
      }
      return fc::variant( result );
   }

}

int main( int argc, char** argv )
{
   try
   {
      bpo::options_description opts( "Generates the matches of one tournament stage" );
      opts.add_options()
            ("help,h", "Print this help message and exit")
            ("request,r", bpo::value<std::string>(), "JSON file holding the tournament, stage and participants")
            ("output,o", bpo::value<std::string>(), "File to write the result to (default: stdout)")
            ("summary", "Write the round structure of the bracket instead of the matches")
            ("list-formats", "Print the supported bracket formats and exit")
            ("verbose,v", "Log generation details to stderr");

      bpo::variables_map options;
      bpo::store( bpo::parse_command_line( argc, argv, opts ), options );
      bpo::notify( options );

      if( options.count( "help" ) )
      {
         std::cout << opts << "\n";
         return 0;
      }

      if( options.count( "verbose" ) )
      {
         fc::logger::get( TOURNEY_BRACKET_LOGGER ).add_appender( fc::appender::get( "stderr" ) );
         fc::logger::get( TOURNEY_BRACKET_LOGGER ).set_log_level( fc::log_level::debug );
      }

      bracket_engine engine;
      if( options.count( "list-formats" ) )
      {
         std::cout << boost::algorithm::join( engine.get_supported_formats(), "\n" ) << "\n";
         return 0;
      }

      if( !options.count( "request" ) )
      {
         std::cerr << "Missing --request\n\n" << opts << "\n";
         return 1;
      }

      const std::string request_file = options["request"].as<std::string>();
      const bracket_request request =
            fc::json::from_file( fc::path( request_file ) ).as<bracket_request>( TOURNEY_MAX_NESTED_OBJECTS );

      std::string format;
      const std::vector<match_record> matches = run_request( engine, request, format );

      fc::variant result;
      if( options.count( "summary" ) )
         result = fc::variant( summarize_bracket( format, request.participants.size(), matches ),
                               TOURNEY_MAX_NESTED_OBJECTS );
      else
         result = matches_to_variant( matches );

      if( options.count( "output" ) )
      {
         const std::string output_file = options["output"].as<std::string>();
         fc::json::save_to_file( result, fc::path( output_file ) );
         ilog( "Wrote ${count} ${format} matches to ${file}",
               ("count", matches.size())("format", format)("file", output_file) );
      }
      else
         std::cout << fc::json::to_pretty_string( result ) << "\n";
   }
   catch( const bracket_exception& e )
   {
      std::cerr << e.to_string() << "\n";
      return 2;
   }
   catch( const fc::exception& e )
   {
      std::cerr << e.to_detail_string() << "\n";
      return 1;
   }
   catch( const std::exception& e )
   {
      std::cerr << e.what() << "\n";
      return 1;
   }
   return 0;
}
