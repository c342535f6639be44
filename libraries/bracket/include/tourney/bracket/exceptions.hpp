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

#include <fc/exception/exception.hpp>

namespace tourney { namespace bracket {

   FC_DECLARE_EXCEPTION( bracket_exception, 3900000, "bracket exception" )

   /// The participant list or the stage options cannot produce a bracket; fix the input and retry
   FC_DECLARE_DERIVED_EXCEPTION( invalid_bracket_configuration, tourney::bracket::bracket_exception,
                                 3900001, "invalid bracket configuration" )
   /// Neither the stage type nor the tournament format hint names a registered format
   FC_DECLARE_DERIVED_EXCEPTION( unknown_bracket_format, tourney::bracket::bracket_exception,
                                 3900002, "unknown bracket format" )
   /// A generator failed after its validation passed
   FC_DECLARE_DERIVED_EXCEPTION( bracket_generation_failure, tourney::bracket::bracket_exception,
                                 3900003, "bracket generation failure" )

} } // tourney::bracket
