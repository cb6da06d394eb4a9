#include "swissdesk/core/tournament/SwissScheduler.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <map>
#include <set>

using swissdesk::core::players::PlayerRegistry;
using swissdesk::core::tournament::Color;
using swissdesk::core::tournament::Outcome;
using swissdesk::core::tournament::Pairing;
using swissdesk::core::tournament::Round;
using swissdesk::core::tournament::RoundLedger;
using swissdesk::core::tournament::SwissContext;
using swissdesk::core::tournament::SwissPlayerState;
using swissdesk::core::tournament::SwissScheduler;
using swissdesk::core::tournament::Tournament;
using swissdesk::core::util::Error;
using swissdesk::test::AddPlayer;
using swissdesk::test::Details;
using swissdesk::test::Unordered;
using swissdesk::test::WhiteWins;

namespace {

SwissPlayerState State(const std::string& id, int rating, double score = 0.0)
{
    SwissPlayerState state;
    state.id = id;
    state.name = id;
    state.rating = rating;
    state.score = score;
    return state;
}

void Meet(SwissContext& context, size_t a, size_t b)
{
    context.players[a].opponents.insert(context.players[b].id);
    context.players[b].opponents.insert(context.players[a].id);
}

std::string OpponentOf(const Round& round, const std::string& id)
{
    for (const auto& pairing : round.pairings) {
        if (pairing.player_a_id == id) {
            return pairing.player_b_id;
        }
        if (pairing.player_b_id == id) {
            return pairing.player_a_id;
        }
    }
    return std::string();
}

}  // namespace

TEST(SwissSchedulerTest, testFirstRoundFoldsByRating)
{
    SwissContext context;
    context.players = {State("a", 2000), State("b", 1900), State("c", 1800), State("d", 1700)};
    const Round round = SwissScheduler().BuildRound(context);

    ASSERT_EQ(2u, round.pairings.size());
    EXPECT_FALSE(round.forced_repeat);
    EXPECT_EQ("c", OpponentOf(round, "a"));
    EXPECT_EQ("d", OpponentOf(round, "b"));
    EXPECT_TRUE(round.pairings[0].involves("a"));
    for (const auto& pairing : round.pairings) {
        EXPECT_EQ(Color::White, pairing.color_a);
        EXPECT_EQ(Color::Black, pairing.color_b);
    }
}

TEST(SwissSchedulerTest, testByeGoesToLowestSeed)
{
    SwissContext context;
    context.players = {State("a", 2000), State("b", 1900), State("c", 1800)};
    const Round round = SwissScheduler().BuildRound(context);

    ASSERT_EQ(2u, round.pairings.size());
    EXPECT_TRUE(round.pairings.back().is_bye());
    EXPECT_EQ("c", round.bye_player_id().value_or(""));
    EXPECT_EQ(Color::None, round.pairings.back().color_a);
}

TEST(SwissSchedulerTest, testByeSkipsPlayersWhoHadOne)
{
    SwissContext context;
    context.players = {State("a", 2000), State("b", 1900), State("c", 1800)};
    context.players[2].had_bye = true;
    const Round round = SwissScheduler().BuildRound(context);
    EXPECT_EQ("b", round.bye_player_id().value_or(""));
}

TEST(SwissSchedulerTest, testRematchIsAvoided)
{
    SwissContext context;
    context.players = {State("a", 2000), State("b", 1900), State("c", 1800), State("d", 1700)};
    Meet(context, 0, 2);
    const Round round = SwissScheduler().BuildRound(context);

    EXPECT_FALSE(round.forced_repeat);
    EXPECT_EQ("d", OpponentOf(round, "a"));
    EXPECT_EQ("c", OpponentOf(round, "b"));
}

TEST(SwissSchedulerTest, testScoreGroupsPairTogether)
{
    SwissContext context;
    context.players = {State("a", 1500, 0.0), State("b", 1600, 1.0), State("c", 1700, 0.0), State("d", 1400, 1.0)};
    const Round round = SwissScheduler().BuildRound(context);

    EXPECT_EQ("d", OpponentOf(round, "b"));
    EXPECT_EQ("a", OpponentOf(round, "c"));
    EXPECT_TRUE(round.pairings[0].involves("b"));
}

TEST(SwissSchedulerTest, testBlockedLeadersFloatDown)
{
    SwissContext context;
    context.players = {State("a", 2000, 1.0), State("b", 1900, 1.0), State("c", 1800), State("d", 1700)};
    Meet(context, 0, 1);
    const Round round = SwissScheduler().BuildRound(context);

    EXPECT_FALSE(round.forced_repeat);
    EXPECT_EQ("c", OpponentOf(round, "a"));
    EXPECT_EQ("d", OpponentOf(round, "b"));
}

TEST(SwissSchedulerTest, testForcedRepeatWhenNoAlternativeExists)
{
    SwissContext context;
    context.players = {State("a", 2000), State("b", 1900)};
    Meet(context, 0, 1);
    const Round round = SwissScheduler().BuildRound(context);

    ASSERT_EQ(1u, round.pairings.size());
    EXPECT_TRUE(round.forced_repeat);
    EXPECT_TRUE(round.pairings[0].repeat);
}

TEST(SwissSchedulerTest, testThirdSameColorIsAvoided)
{
    SwissContext context;
    context.players = {State("a", 2000), State("b", 1900)};
    context.players[0].colors = {Color::White, Color::White};
    context.players[1].colors = {Color::Black, Color::White};
    const Round round = SwissScheduler().BuildRound(context);

    ASSERT_EQ(1u, round.pairings.size());
    EXPECT_EQ("b", round.pairings[0].player_a_id);
    EXPECT_EQ("a", round.pairings[0].player_b_id);
}

TEST(SwissSchedulerTest, testColorsAlternateWhenBalanced)
{
    SwissContext context;
    context.players = {State("a", 2000), State("b", 1900)};
    context.players[0].colors = {Color::White};
    context.players[1].colors = {Color::White};
    const Round round = SwissScheduler().BuildRound(context);

    // Both are due Black; the higher seed gets its due color.
    ASSERT_EQ(1u, round.pairings.size());
    EXPECT_EQ("b", round.pairings[0].player_a_id);
}

TEST(SwissSchedulerTest, testBuildContextCollectsHistory)
{
    PlayerRegistry registry;
    Error error;
    std::string a;
    std::string b;
    std::string c;
    ASSERT_TRUE(registry.Add(Details("Ann", 2000), &a, &error));
    ASSERT_TRUE(registry.Add(Details("Bob", 1900), &b, &error));
    ASSERT_TRUE(registry.Add(Details("Cid", 1800), &c, &error));

    Round round;
    round.index = 1;
    Pairing game;
    game.player_a_id = a;
    game.player_b_id = b;
    game.color_a = Color::White;
    game.color_b = Color::Black;
    Pairing bye;
    bye.player_a_id = c;
    round.pairings = {game, bye};

    RoundLedger ledger;
    ASSERT_TRUE(ledger.Append(round, &error));
    ASSERT_TRUE(ledger.RecordResults(1, {Outcome::PlayerBWin, Outcome::Bye}, &error));
    ASSERT_TRUE(registry.SetActive(a, false, &error));

    const SwissContext context = SwissScheduler::BuildContext(registry, ledger, 0.5);
    EXPECT_EQ(2, context.round_index);
    ASSERT_EQ(2u, context.players.size());
    EXPECT_EQ(b, context.players[0].id);
    EXPECT_DOUBLE_EQ(1.0, context.players[0].score);
    EXPECT_EQ(1u, context.players[0].opponents.count(a));
    ASSERT_EQ(1u, context.players[0].colors.size());
    EXPECT_EQ(Color::Black, context.players[0].colors[0]);
    EXPECT_EQ(c, context.players[1].id);
    EXPECT_DOUBLE_EQ(0.5, context.players[1].score);
    EXPECT_TRUE(context.players[1].had_bye);
    EXPECT_TRUE(context.players[1].colors.empty());
}

TEST(SwissSchedulerTest, testByesRotateAndNoRematchesOverSeveralRounds)
{
    Tournament t("Rotation");
    Error error;
    ASSERT_TRUE(t.SetNumRounds(5, &error));
    for (int i = 0; i < 7; ++i) {
        AddPlayer(t, "Player" + std::to_string(i + 1), 2000 - i * 50);
    }

    std::set<std::pair<std::string, std::string>> seen_pairs;
    std::set<std::string> bye_players;
    for (int r = 1; r <= 5; ++r) {
        Round round;
        ASSERT_TRUE(t.GenerateNextRound(&round, &error)) << error.message;
        EXPECT_FALSE(round.forced_repeat);

        std::map<std::string, int> appearances;
        int byes = 0;
        for (const auto& pairing : round.pairings) {
            appearances[pairing.player_a_id] += 1;
            if (pairing.is_bye()) {
                byes += 1;
                EXPECT_TRUE(bye_players.insert(pairing.player_a_id).second);
                continue;
            }
            appearances[pairing.player_b_id] += 1;
            EXPECT_TRUE(seen_pairs.insert(Unordered(pairing)).second);
        }
        EXPECT_EQ(1, byes);
        EXPECT_EQ(7u, appearances.size());
        for (const auto& entry : appearances) {
            EXPECT_EQ(1, entry.second) << entry.first;
        }
        ASSERT_TRUE(t.RecordResults(r, WhiteWins(round), &error)) << error.message;
    }
}

TEST(SwissSchedulerTest, testTinySearchBudgetStillPairsEveryone)
{
    SwissContext context;
    context.players = {State("a", 2000), State("b", 1900), State("c", 1800), State("d", 1700)};
    const Round round = SwissScheduler(1).BuildRound(context);
    EXPECT_EQ(2u, round.pairings.size());
    EXPECT_FALSE(round.forced_repeat);
}
