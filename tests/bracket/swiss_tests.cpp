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
#include <tourney/bracket/swiss_system_generator.hpp>
#include "../common/bracket_helper.hpp"

namespace {

swiss_standing standing(participant_id_type id, uint32_t wins, uint32_t losses, double points, double buchholz = 0)
{
    swiss_standing s;
    s.participant_id = id;
    s.wins = wins;
    s.losses = losses;
    s.points = points;
    s.buchholz = buchholz;
    return s;
}

swiss_pairing pairing(participant_id_type first, participant_id_type second)
{
    swiss_pairing p;
    p.first = first;
    p.second = second;
    return p;
}

swiss_pairing bye(participant_id_type first)
{
    swiss_pairing p;
    p.first = first;
    return p;
}

bool same_pair(const swiss_pairing& p, participant_id_type a, participant_id_type b)
{
    if (p.is_bye())
        return false;
    return (p.first == a && *p.second == b) || (p.first == b && *p.second == a);
}

struct swiss_fixture
{
    swiss_fixture() : helper("swiss")
    {
        helper.set_stage_option("rounds_count", 3);
    }

    bracket_helper helper;
    swiss_system_generator generator;
};

}

BOOST_AUTO_TEST_SUITE(swiss_tests)

BOOST_FIXTURE_TEST_CASE( first_round_pairs_top_half_with_bottom_half, swiss_fixture )
{
    try
    {
        const std::vector<match_record> matches = generator.generate(helper.tournament, helper.stage,
                                                                     bracket_helper::make_participants(8));
        BOOST_REQUIRE_EQUAL(matches.size(), 4u);
        for (uint32_t i = 0; i < 4; ++i)
        {
            BOOST_CHECK_EQUAL(matches[i].round_number, 1u);
            BOOST_CHECK_EQUAL(matches[i].match_number, i + 1);
            BOOST_CHECK_EQUAL(*matches[i].team_a.participant_id, 101u + i);
            BOOST_CHECK_EQUAL(*matches[i].team_b.participant_id, 105u + i);
            BOOST_CHECK_EQUAL(matches[i].metadata["swiss_round"].as_uint64(), 1u);
            BOOST_CHECK_EQUAL(matches[i].metadata["total_rounds"].as_uint64(), 3u);
            BOOST_CHECK_EQUAL(bracket_helper::metadata_string(matches[i], "bracket_type"), "swiss");
            BOOST_CHECK_EQUAL(bracket_helper::metadata_string(matches[i], "round_name"), "Round 1");
        }
    }
    catch (fc::exception& e)
    {
        edump((e.to_detail_string()));
        throw;
    }
}

BOOST_FIXTURE_TEST_CASE( odd_first_round_gives_one_bye, swiss_fixture )
{
    const std::vector<match_record> matches = generator.generate(helper.tournament, helper.stage,
                                                                 bracket_helper::make_participants(5));
    BOOST_REQUIRE_EQUAL(matches.size(), 3u);
    BOOST_CHECK_EQUAL(generator.expected_match_count(helper.stage, 5), 3u);

    BOOST_CHECK_EQUAL(*matches[0].team_a.participant_id, 101u);
    BOOST_CHECK_EQUAL(*matches[0].team_b.participant_id, 104u);
    BOOST_CHECK_EQUAL(*matches[1].team_a.participant_id, 102u);
    BOOST_CHECK_EQUAL(*matches[1].team_b.participant_id, 105u);

    BOOST_CHECK_EQUAL(*matches[2].team_a.participant_id, 103u);
    BOOST_CHECK(matches[2].team_b.is_bye());
    BOOST_CHECK(matches[2].metadata["has_bye"].as_bool());
    BOOST_CHECK_EQUAL(bracket_helper::count_byes(matches), 1u);
}

BOOST_FIXTURE_TEST_CASE( rounds_count_is_required, swiss_fixture )
{
    bracket_helper bare("swiss");
    validation_result result = generator.validate(bare.tournament, bare.stage, 8);
    BOOST_REQUIRE_EQUAL(result.errors.size(), 1u);
    BOOST_CHECK_EQUAL(result.errors.front(), "Swiss stage requires rounds_count in its config");

    result = generator.validate(helper.tournament, helper.stage, 3);
    BOOST_REQUIRE_EQUAL(result.errors.size(), 1u);
    BOOST_CHECK_EQUAL(result.errors.front(), "Swiss system requires at least 4 participants, got 3");

    BOOST_CHECK_THROW(generator.generate(bare.tournament, bare.stage, bracket_helper::make_participants(8)),
                      invalid_bracket_configuration);
}

BOOST_FIXTURE_TEST_CASE( players_are_paired_by_wins, swiss_fixture )
{
    const std::vector<swiss_standing> standings = {
        standing(1, 1, 0, 3), standing(3, 0, 1, 0), standing(2, 1, 0, 3), standing(4, 0, 1, 0)
    };
    const std::vector<swiss_pairing> previous = { pairing(1, 3), pairing(2, 4) };

    const std::vector<swiss_pairing> result = generator.generate_subsequent_round(2, standings, previous);
    BOOST_REQUIRE_EQUAL(result.size(), 2u);
    BOOST_CHECK(same_pair(result[0], 1, 2));
    BOOST_CHECK(same_pair(result[1], 3, 4));
}

BOOST_FIXTURE_TEST_CASE( rematches_are_avoided, swiss_fixture )
{
    const std::vector<swiss_standing> standings = {
        standing(1, 2, 0, 6), standing(2, 2, 0, 6), standing(3, 0, 2, 0), standing(4, 0, 2, 0)
    };
    const std::vector<swiss_pairing> previous = { pairing(1, 2), pairing(3, 4), pairing(1, 3), pairing(2, 4) };

    const std::vector<swiss_pairing> result = generator.generate_subsequent_round(3, standings, previous);
    BOOST_REQUIRE_EQUAL(result.size(), 2u);
    BOOST_CHECK(same_pair(result[0], 1, 4));
    BOOST_CHECK(same_pair(result[1], 2, 3));
}

BOOST_FIXTURE_TEST_CASE( rematch_allowed_when_unavoidable, swiss_fixture )
{
    const std::vector<swiss_standing> standings = { standing(1, 1, 0, 3), standing(2, 0, 1, 0) };
    const std::vector<swiss_pairing> previous = { pairing(2, 1) };

    const std::vector<swiss_pairing> result = generator.generate_subsequent_round(2, standings, previous);
    BOOST_REQUIRE_EQUAL(result.size(), 1u);
    BOOST_CHECK(same_pair(result[0], 1, 2));
}

BOOST_FIXTURE_TEST_CASE( odd_field_bye_goes_to_lowest_ranked, swiss_fixture )
{
    const std::vector<swiss_standing> standings = {
        standing(1, 2, 0, 6), standing(2, 2, 0, 6), standing(3, 1, 1, 3), standing(4, 1, 1, 3), standing(5, 0, 2, 0)
    };

    std::vector<swiss_pairing> result = generator.generate_subsequent_round(3, standings, {});
    BOOST_REQUIRE_EQUAL(result.size(), 3u);
    BOOST_CHECK(result.back().is_bye());
    BOOST_CHECK_EQUAL(result.back().first, 5u);

    // a participant never gets a second bye while someone else has not had one
    result = generator.generate_subsequent_round(3, standings, { bye(5) });
    BOOST_REQUIRE_EQUAL(result.size(), 3u);
    BOOST_CHECK(result.back().is_bye());
    BOOST_CHECK_EQUAL(result.back().first, 4u);
    BOOST_CHECK(same_pair(result[0], 1, 2));
    BOOST_CHECK(same_pair(result[1], 3, 5));
}

BOOST_FIXTURE_TEST_CASE( bye_moves_up_when_it_would_force_rematches, swiss_fixture )
{
    const std::vector<swiss_standing> standings = {
        standing(1, 2, 0, 6), standing(2, 2, 0, 6), standing(3, 1, 1, 3), standing(4, 1, 1, 3), standing(5, 0, 2, 0)
    };
    // with 5 sitting out, 1 has already met everyone left
    const std::vector<swiss_pairing> previous = {
        pairing(1, 2), pairing(3, 4), pairing(1, 3), pairing(2, 4), pairing(1, 4)
    };

    const std::vector<swiss_pairing> result = generator.generate_subsequent_round(4, standings, previous);
    BOOST_REQUIRE_EQUAL(result.size(), 3u);
    BOOST_CHECK(result.back().is_bye());
    BOOST_CHECK_EQUAL(result.back().first, 4u);
    BOOST_CHECK(same_pair(result[0], 1, 5));
    BOOST_CHECK(same_pair(result[1], 2, 3));
}

BOOST_FIXTURE_TEST_CASE( bye_falls_back_to_lowest_when_rematches_are_unavoidable, swiss_fixture )
{
    const std::vector<swiss_standing> standings = { standing(1, 1, 0, 3), standing(2, 1, 0, 3), standing(3, 0, 1, 0) };
    const std::vector<swiss_pairing> previous = { pairing(1, 2), pairing(1, 3), pairing(2, 3) };

    const std::vector<swiss_pairing> result = generator.generate_subsequent_round(3, standings, previous);
    BOOST_REQUIRE_EQUAL(result.size(), 2u);
    BOOST_CHECK(same_pair(result[0], 1, 2));
    BOOST_CHECK(result[1].is_bye());
    BOOST_CHECK_EQUAL(result[1].first, 3u);
}

BOOST_FIXTURE_TEST_CASE( buchholz_breaks_ties, swiss_fixture )
{
    const std::vector<swiss_standing> standings = {
        standing(1, 1, 1, 3, 1.0), standing(2, 1, 1, 3, 3.0), standing(3, 1, 1, 3, 2.0), standing(4, 1, 1, 3, 0.5)
    };

    const std::vector<swiss_pairing> result = generator.generate_subsequent_round(3, standings, {});
    BOOST_REQUIRE_EQUAL(result.size(), 2u);
    BOOST_CHECK_EQUAL(result[0].first, 2u);
    BOOST_CHECK_EQUAL(*result[0].second, 3u);
    BOOST_CHECK_EQUAL(result[1].first, 1u);
    BOOST_CHECK_EQUAL(*result[1].second, 4u);
}

BOOST_FIXTURE_TEST_CASE( empty_standings_give_no_pairings, swiss_fixture )
{
    BOOST_CHECK(generator.generate_subsequent_round(2, {}, {}).empty());
}

BOOST_FIXTURE_TEST_CASE( later_round_becomes_match_records, swiss_fixture )
{
    try
    {
        const std::vector<participant> participants = bracket_helper::make_participants(4);
        const std::vector<swiss_standing> standings = {
            standing(101, 1, 0, 3), standing(102, 1, 0, 3), standing(103, 0, 1, 0), standing(104, 0, 1, 0)
        };
        const std::vector<swiss_pairing> previous = { pairing(101, 103), pairing(102, 104) };

        const std::vector<match_record> matches = generator.generate_round(helper.tournament, helper.stage,
                                                                           participants, 2, standings, previous);
        BOOST_REQUIRE_EQUAL(matches.size(), 2u);
        BOOST_CHECK_EQUAL(matches[0].round_number, 2u);
        BOOST_CHECK_EQUAL(matches[0].match_number, 1u);
        BOOST_CHECK_EQUAL(matches[1].match_number, 2u);
        BOOST_CHECK_EQUAL(matches[0].team_a.participant_name, "Team 1");
        BOOST_CHECK_EQUAL(matches[0].team_b.participant_name, "Team 2");
        BOOST_CHECK_EQUAL(bracket_helper::metadata_string(matches[1], "round_name"), "Round 2");
        BOOST_CHECK_EQUAL(matches[1].metadata["swiss_round"].as_uint64(), 2u);
    }
    catch (fc::exception& e)
    {
        edump((e.to_detail_string()));
        throw;
    }
}

BOOST_FIXTURE_TEST_CASE( equal_records_are_ranked_by_seed, swiss_fixture )
{
    const std::vector<participant> participants = bracket_helper::make_participants(4);
    // standings arrive in reverse seed order, all four on the same record
    const std::vector<swiss_standing> standings = {
        standing(104, 1, 1, 3), standing(103, 1, 1, 3), standing(102, 1, 1, 3), standing(101, 1, 1, 3)
    };

    const std::vector<match_record> matches = generator.generate_round(helper.tournament, helper.stage,
                                                                       participants, 3, standings, {});
    BOOST_REQUIRE_EQUAL(matches.size(), 2u);
    BOOST_CHECK_EQUAL(*matches[0].team_a.participant_id, 101u);
    BOOST_CHECK_EQUAL(*matches[0].team_b.participant_id, 102u);
    BOOST_CHECK_EQUAL(*matches[1].team_a.participant_id, 103u);
    BOOST_CHECK_EQUAL(*matches[1].team_b.participant_id, 104u);
}

BOOST_FIXTURE_TEST_CASE( later_round_input_is_checked, swiss_fixture )
{
    const std::vector<participant> participants = bracket_helper::make_participants(4);
    const std::vector<swiss_standing> standings = {
        standing(101, 1, 0, 3), standing(102, 1, 0, 3), standing(103, 0, 1, 0), standing(999, 0, 1, 0)
    };

    BOOST_CHECK_THROW(generator.generate_round(helper.tournament, helper.stage, participants, 2, standings, {}),
                      invalid_bracket_configuration);
    // a participant listed twice would be paired against themselves
    const std::vector<swiss_standing> repeated = {
        standing(101, 1, 0, 3), standing(101, 1, 0, 3), standing(102, 0, 1, 0), standing(103, 0, 1, 0)
    };
    BOOST_CHECK_THROW(generator.generate_round(helper.tournament, helper.stage, participants, 2, repeated, {}),
                      invalid_bracket_configuration);
    BOOST_CHECK_THROW(generator.generate_subsequent_round(2, repeated, {}), invalid_bracket_configuration);

    BOOST_CHECK_THROW(generator.generate_round(helper.tournament, helper.stage, participants, 1, {}, {}),
                      invalid_bracket_configuration);
    BOOST_CHECK_THROW(generator.generate_round(helper.tournament, helper.stage, participants, 4, {}, {}),
                      invalid_bracket_configuration);
}

BOOST_AUTO_TEST_SUITE_END()
