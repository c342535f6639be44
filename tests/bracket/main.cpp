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
#include <cstdlib>
#include <iostream>
#include <boost/test/included/unit_test.hpp>

#include <fc/log/appender.hpp>
#include <fc/log/logger.hpp>

#include <tourney/bracket/config.hpp>

boost::unit_test::test_suite* init_unit_test_suite(int argc, char* argv[]) {
   const char* verbose = getenv("TOURNEY_TESTING_VERBOSE");
   if( verbose != nullptr && std::string(verbose) != "0" )
   {
      fc::logger::get(TOURNEY_BRACKET_LOGGER).add_appender(fc::appender::get("stdout"));
      fc::logger::get(TOURNEY_BRACKET_LOGGER).set_log_level(fc::log_level::debug);
      std::cout << "Bracket logging enabled" << std::endl;
   }
   return nullptr;
}
