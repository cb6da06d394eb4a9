#include "swissdesk/core/persist/TournamentRecord.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

using swissdesk::core::persist::FromJsonString;
using swissdesk::core::persist::FromRecord;
using swissdesk::core::persist::ToJsonString;
using swissdesk::core::persist::ToRecord;
using swissdesk::core::stats::TiebreakCriterion;
using swissdesk::core::tournament::Round;
using swissdesk::core::tournament::Tournament;
using swissdesk::core::tournament::TournamentStatus;
using swissdesk::core::util::Error;
using swissdesk::core::util::ErrorKind;
using swissdesk::test::AddPlayer;
using swissdesk::test::WhiteWins;

class TournamentRecordTest : public testing::Test {
protected:
    void SetUp() override
    {
        Error error;
        ASSERT_TRUE(played.SetNumRounds(5, &error));
        AddPlayer(played, "Ann", 2100);
        AddPlayer(played, "Bob", 2000);
        AddPlayer(played, "Cid", std::nullopt);
        AddPlayer(played, "Dan", 1850);
        AddPlayer(played, "Eve", 1700);
        AddPlayer(played, "Fay", 1650);
        AddPlayer(played, "Gus", 1500);

        for (int r = 1; r <= 2; ++r) {
            Round round;
            ASSERT_TRUE(played.GenerateNextRound(&round, &error)) << error.message;
            ASSERT_TRUE(played.RecordResults(r, WhiteWins(round), &error)) << error.message;
        }
        ASSERT_TRUE(played.SetActive("p6", false, &error));
    }

    Tournament played {"Club Championship"};
};

TEST_F(TournamentRecordTest, testRecordLayout)
{
    const auto root = ToRecord(played);
    EXPECT_EQ("Club Championship", root.at("name"));
    EXPECT_EQ(5, root.at("num_rounds"));
    EXPECT_DOUBLE_EQ(1.0, root.at("bye_points").get<double>());
    ASSERT_EQ(7u, root.at("players").size());
    EXPECT_TRUE(root.at("players").at("p3").at("rating").is_null());
    EXPECT_FALSE(root.at("players").at("p6").at("is_active").get<bool>());
    EXPECT_EQ("p1", root.at("player_order").at(0));
    ASSERT_EQ(2u, root.at("rounds").size());

    const auto& first = root.at("rounds").at(0);
    EXPECT_EQ(1, first.at("index"));
    ASSERT_EQ(4u, first.at("pairings").size());
    EXPECT_TRUE(first.at("pairings").at(3).at("player_b").is_null());
    EXPECT_EQ("white", first.at("pairings").at(0).at("color_a"));
    ASSERT_EQ(4u, first.at("results").size());
    EXPECT_EQ("bye", first.at("results").at(3));
}

TEST_F(TournamentRecordTest, testRoundTripKeepsStandingsAndNextPairing)
{
    Tournament restored;
    Error error;
    ASSERT_TRUE(FromJsonString(ToJsonString(played), restored, &error)) << error.message;

    EXPECT_EQ(played.name(), restored.name());
    EXPECT_EQ(played.ledger().rounds(), restored.ledger().rounds());
    EXPECT_EQ(played.ComputeStandings(), restored.ComputeStandings());
    EXPECT_EQ(TournamentStatus::ReadyForNextRound, restored.status());

    Round expected;
    Round actual;
    ASSERT_TRUE(played.GenerateNextRound(&expected, &error)) << error.message;
    ASSERT_TRUE(restored.GenerateNextRound(&actual, &error)) << error.message;
    EXPECT_EQ(expected, actual);
}

TEST_F(TournamentRecordTest, testPendingRoundSurvivesRoundTrip)
{
    Error error;
    ASSERT_TRUE(played.GenerateNextRound(nullptr, &error));
    const auto root = ToRecord(played);
    EXPECT_FALSE(root.at("rounds").at(2).contains("results"));

    Tournament restored;
    ASSERT_TRUE(FromRecord(root, restored, &error)) << error.message;
    EXPECT_EQ(TournamentStatus::AwaitingResults, restored.status());
    EXPECT_EQ(played.ledger().rounds().back(), restored.ledger().rounds().back());
}

TEST_F(TournamentRecordTest, testMissingPlayerOrderFallsBackToIdOrder)
{
    auto root = ToRecord(played);
    root.erase("player_order");
    root.erase("bye_points");
    Tournament restored;
    Error error;
    ASSERT_TRUE(FromRecord(root, restored, &error)) << error.message;
    ASSERT_EQ(7u, restored.players().size());
    EXPECT_EQ("p1", restored.players().players().front().id);
    EXPECT_DOUBLE_EQ(1.0, restored.config().bye_points);
}

TEST_F(TournamentRecordTest, testIdSequenceResumesAfterLoad)
{
    nlohmann::json root;
    root["name"] = "Fresh";
    root["num_rounds"] = 3;
    root["tiebreak_order"] = nlohmann::json::array({"rating"});
    root["players"]["p4"] = {{"name", "Ann"}, {"rating", 1800}, {"is_active", true}};
    root["players"]["p9"] = {{"name", "Bob"}, {"rating", nullptr}, {"is_active", true}};
    root["rounds"] = nlohmann::json::array();

    Tournament restored;
    Error error;
    ASSERT_TRUE(FromRecord(root, restored, &error)) << error.message;
    const std::vector<TiebreakCriterion> expected {TiebreakCriterion::Rating};
    EXPECT_EQ(expected, restored.config().tiebreak_order);
    EXPECT_EQ("p10", AddPlayer(restored, "Cid", 1500));
}

TEST_F(TournamentRecordTest, testMalformedTextIsDecodeError)
{
    Tournament restored {"Untouched"};
    Error error;
    EXPECT_FALSE(FromJsonString("{\"name\": ", restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);
    EXPECT_EQ("Untouched", restored.name());
}

TEST_F(TournamentRecordTest, testUnknownPlayerInRoundIsRejected)
{
    auto root = ToRecord(played);
    root["rounds"][0]["pairings"][0]["player_a"] = "p99";
    Tournament restored {"Untouched"};
    Error error;
    EXPECT_FALSE(FromRecord(root, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);
    EXPECT_EQ("Untouched", restored.name());
    EXPECT_TRUE(restored.players().empty());
}

TEST_F(TournamentRecordTest, testStructuralErrorsAreRejected)
{
    Error error;
    Tournament restored;

    auto bad_result = ToRecord(played);
    bad_result["rounds"][0]["results"][0] = "2-0";
    EXPECT_FALSE(FromRecord(bad_result, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    auto short_results = ToRecord(played);
    short_results["rounds"][1]["results"].erase(0);
    EXPECT_FALSE(FromRecord(short_results, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    auto gap = ToRecord(played);
    gap["rounds"][0].erase("results");
    EXPECT_FALSE(FromRecord(gap, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    auto bad_index = ToRecord(played);
    bad_index["rounds"][1]["index"] = 5;
    EXPECT_FALSE(FromRecord(bad_index, restored, &error));

    auto unknown_tiebreak = ToRecord(played);
    unknown_tiebreak["tiebreak_order"] = nlohmann::json::array({"koya"});
    EXPECT_FALSE(FromRecord(unknown_tiebreak, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    auto duplicate_name = ToRecord(played);
    duplicate_name["players"]["p2"]["name"] = "Ann";
    EXPECT_FALSE(FromRecord(duplicate_name, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    auto too_many_rounds = ToRecord(played);
    too_many_rounds["num_rounds"] = 1;
    EXPECT_FALSE(FromRecord(too_many_rounds, restored, &error));

    auto wrong_type = ToRecord(played);
    wrong_type["players"]["p1"]["rating"] = "high";
    EXPECT_FALSE(FromRecord(wrong_type, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    // 2^32 + 1800 would wrap to a plausible 1800 if narrowed to int.
    auto wrapped_rating = ToRecord(played);
    wrapped_rating["players"]["p1"]["rating"] = 4294968096LL;
    EXPECT_FALSE(FromRecord(wrapped_rating, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    auto wrapped_rounds = ToRecord(played);
    wrapped_rounds["num_rounds"] = 4294967301LL;
    EXPECT_FALSE(FromRecord(wrapped_rounds, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    auto wrapped_index = ToRecord(played);
    wrapped_index["rounds"][0]["index"] = 4294967297LL;
    EXPECT_FALSE(FromRecord(wrapped_index, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    auto fractional_rounds = ToRecord(played);
    fractional_rounds["num_rounds"] = 5.5;
    EXPECT_FALSE(FromRecord(fractional_rounds, restored, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    EXPECT_TRUE(restored.players().empty());
}
