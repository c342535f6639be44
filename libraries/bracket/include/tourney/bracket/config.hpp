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

#define TOURNEY_BRACKET_LOGGER "bracket"

#define TOURNEY_MAX_NESTED_OBJECTS (200)

#define TOURNEY_SINGLE_ELIMINATION_MIN_PARTICIPANTS 2
#define TOURNEY_SINGLE_ELIMINATION_MAX_PARTICIPANTS 256

#define TOURNEY_DOUBLE_ELIMINATION_MIN_PARTICIPANTS 4
#define TOURNEY_DOUBLE_ELIMINATION_MAX_PARTICIPANTS 128

/// Practical scheduling limit; a 20 team field already needs 19 rounds
#define TOURNEY_ROUND_ROBIN_MIN_PARTICIPANTS 3
#define TOURNEY_ROUND_ROBIN_MAX_PARTICIPANTS 20

#define TOURNEY_SWISS_MIN_PARTICIPANTS 4
#define TOURNEY_SWISS_MAX_PARTICIPANTS 64
#define TOURNEY_SWISS_MIN_ROUNDS 1
#define TOURNEY_SWISS_MAX_ROUNDS 10

/**
 * Upper bound on the number of candidate pairings tried while searching for
 * a rematch-free Swiss round before falling back to sequential pairing.
 */
#define TOURNEY_SWISS_MAX_PAIRING_STEPS 200000

#define TOURNEY_BYE_LABEL "BYE"
#define TOURNEY_TBD_LABEL "TBD"
