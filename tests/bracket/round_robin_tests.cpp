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
#include <boost/test/unit_test.hpp>

#include <tourney/bracket/exceptions.hpp>
#include <tourney/bracket/round_robin_generator.hpp>
#include "../common/bracket_helper.hpp"

#include <set>

BOOST_AUTO_TEST_SUITE(round_robin_tests)

BOOST_AUTO_TEST_CASE( four_participants_meet_once_each )
{
    try
    {
        bracket_helper helper("round_robin");
        round_robin_generator generator;
        const std::vector<match_record> matches = generator.generate(helper.tournament, helper.stage,
                                                                     bracket_helper::make_participants(4));

        BOOST_REQUIRE_EQUAL(matches.size(), 6u);
        for (uint32_t round = 1; round <= 3; ++round)
            BOOST_CHECK_EQUAL(bracket_helper::count_round(matches, bracket_segment::main, round), 2u);

        std::set<std::pair<participant_id_type, participant_id_type>> pairs;
        for (const match_record& match : matches)
        {
            BOOST_REQUIRE(match.team_a.is_resolved());
            BOOST_REQUIRE(match.team_b.is_resolved());
            const participant_id_type a = *match.team_a.participant_id;
            const participant_id_type b = *match.team_b.participant_id;
            BOOST_CHECK(a != b);
            pairs.insert(std::make_pair(std::min(a, b), std::max(a, b)));
            BOOST_CHECK_EQUAL(bracket_helper::metadata_string(match, "bracket_type"), "round_robin");
            BOOST_CHECK_EQUAL(bracket_helper::metadata_string(match, "round_name"),
                              "Round " + std::to_string(match.round_number));
        }
        BOOST_CHECK_EQUAL(pairs.size(), 6u);
    }
    catch (fc::exception& e)
    {
        edump((e.to_detail_string()));
        throw;
    }
}

BOOST_AUTO_TEST_CASE( every_field_size_is_complete )
{
    bracket_helper helper("round_robin");
    round_robin_generator generator;
    for (uint32_t n = 3; n <= 20; ++n)
    {
        const std::vector<match_record> matches = generator.generate(helper.tournament, helper.stage,
                                                                     bracket_helper::make_participants(n));
        BOOST_CHECK_EQUAL(matches.size(), n * (n - 1) / 2);
        BOOST_CHECK_EQUAL(matches.size(), generator.expected_match_count(helper.stage, n));

        const std::map<participant_id_type, uint32_t> seen = bracket_helper::appearances(matches);
        BOOST_CHECK_EQUAL(seen.size(), n);
        for (const auto& entry : seen)
            BOOST_CHECK_EQUAL(entry.second, n - 1);

        // n - 1 rounds for an even field, n rounds for an odd one
        const uint32_t rounds = n % 2 ? n : n - 1;
        std::set<std::pair<participant_id_type, participant_id_type>> pairs;
        for (uint32_t round = 1; round <= rounds; ++round)
        {
            BOOST_CHECK_EQUAL(bracket_helper::count_round(matches, bracket_segment::main, round), n / 2);

            // nobody plays twice in one round
            std::set<participant_id_type> in_round;
            for (const match_record& match : matches)
            {
                if (match.round_number != round)
                    continue;
                BOOST_CHECK(in_round.insert(*match.team_a.participant_id).second);
                BOOST_CHECK(in_round.insert(*match.team_b.participant_id).second);
            }
        }
        for (const match_record& match : matches)
        {
            BOOST_CHECK(match.round_number >= 1 && match.round_number <= rounds);
            const participant_id_type a = *match.team_a.participant_id;
            const participant_id_type b = *match.team_b.participant_id;
            pairs.insert(std::make_pair(std::min(a, b), std::max(a, b)));
        }
        BOOST_CHECK_EQUAL(pairs.size(), matches.size());
    }
}

BOOST_AUTO_TEST_CASE( odd_field_rests_one_participant_per_round )
{
    const auto rounds = round_robin_generator::schedule(5);
    BOOST_REQUIRE_EQUAL(rounds.size(), 5u);

    std::set<uint32_t> resting;
    for (const auto& round : rounds)
    {
        BOOST_REQUIRE_EQUAL(round.size(), 2u);
        std::set<uint32_t> playing;
        for (const auto& pairing : round)
        {
            playing.insert(pairing.first);
            playing.insert(pairing.second);
        }
        for (uint32_t i = 0; i < 5; ++i)
            if (!playing.count(i))
                resting.insert(i);
    }
    // everybody sits out exactly one round
    BOOST_CHECK_EQUAL(resting.size(), 5u);
}

BOOST_AUTO_TEST_CASE( participant_bounds_are_validated )
{
    bracket_helper helper("round_robin");
    round_robin_generator generator;

    validation_result result = generator.validate(helper.tournament, helper.stage, 2);
    BOOST_REQUIRE(!result.valid());
    BOOST_CHECK_EQUAL(result.errors.front(), "Round robin requires at least 3 participants, got 2");

    result = generator.validate(helper.tournament, helper.stage, 21);
    BOOST_REQUIRE(!result.valid());
    BOOST_CHECK_EQUAL(result.errors.front(), "Round robin supports at most 20 participants, got 21");

    BOOST_CHECK_THROW(generator.generate(helper.tournament, helper.stage, bracket_helper::make_participants(2)),
                      invalid_bracket_configuration);
}

BOOST_AUTO_TEST_SUITE_END()
