#include "swissdesk/core/tournament/RoundLedger.h"

#include <gtest/gtest.h>

using swissdesk::core::tournament::Color;
using swissdesk::core::tournament::Outcome;
using swissdesk::core::tournament::Pairing;
using swissdesk::core::tournament::Round;
using swissdesk::core::tournament::RoundLedger;
using swissdesk::core::util::Error;
using swissdesk::core::util::ErrorKind;

namespace {

Pairing Game(const std::string& white, const std::string& black)
{
    Pairing pairing;
    pairing.player_a_id = white;
    pairing.player_b_id = black;
    pairing.color_a = Color::White;
    pairing.color_b = Color::Black;
    return pairing;
}

Pairing Bye(const std::string& player)
{
    Pairing pairing;
    pairing.player_a_id = player;
    return pairing;
}

Round MakeRound(int index)
{
    Round round;
    round.index = index;
    round.pairings = {Game("p1", "p2"), Bye("p3")};
    return round;
}

}  // namespace

class RoundLedgerTest : public testing::Test {
protected:
    void AppendAndRecord(int index)
    {
        Error error;
        ASSERT_TRUE(ledger.Append(MakeRound(index), &error)) << error.message;
        ASSERT_TRUE(ledger.RecordResults(index, {Outcome::Draw, Outcome::Bye}, &error)) << error.message;
    }

    RoundLedger ledger;
    Error error;
};

TEST_F(RoundLedgerTest, testAppendedRoundIsPending)
{
    ASSERT_TRUE(ledger.Append(MakeRound(1), &error));
    EXPECT_TRUE(ledger.has_pending_round());
    EXPECT_EQ(1, ledger.size());
    EXPECT_EQ(0, ledger.recorded_count());
    EXPECT_FALSE(ledger.rounds().back().is_recorded);
}

TEST_F(RoundLedgerTest, testAppendWhilePendingIsSequenceError)
{
    ASSERT_TRUE(ledger.Append(MakeRound(1), &error));
    EXPECT_FALSE(ledger.Append(MakeRound(2), &error));
    EXPECT_EQ(ErrorKind::Sequence, error.kind);
    EXPECT_EQ(1, ledger.size());
}

TEST_F(RoundLedgerTest, testAppendWrongIndexIsSequenceError)
{
    EXPECT_FALSE(ledger.Append(MakeRound(2), &error));
    EXPECT_EQ(ErrorKind::Sequence, error.kind);
    EXPECT_TRUE(ledger.empty());
}

TEST_F(RoundLedgerTest, testRecordOutOfOrderIsSequenceError)
{
    EXPECT_FALSE(ledger.RecordResults(1, {Outcome::Draw, Outcome::Bye}, &error));
    EXPECT_EQ(ErrorKind::Sequence, error.kind);

    AppendAndRecord(1);
    ASSERT_TRUE(ledger.Append(MakeRound(2), &error));
    EXPECT_FALSE(ledger.RecordResults(1, {Outcome::Draw, Outcome::Bye}, &error));
    EXPECT_EQ(ErrorKind::Sequence, error.kind);
    EXPECT_FALSE(ledger.RecordResults(3, {Outcome::Draw, Outcome::Bye}, &error));
    EXPECT_EQ(ErrorKind::Sequence, error.kind);
}

TEST_F(RoundLedgerTest, testMalformedOutcomesAreValidationErrors)
{
    ASSERT_TRUE(ledger.Append(MakeRound(1), &error));
    const auto version = ledger.version();

    EXPECT_FALSE(ledger.RecordResults(1, {Outcome::Draw}, &error));
    EXPECT_EQ(ErrorKind::Validation, error.kind);
    EXPECT_FALSE(ledger.RecordResults(1, {Outcome::Draw, Outcome::PlayerAWin}, &error));
    EXPECT_EQ(ErrorKind::Validation, error.kind);
    EXPECT_FALSE(ledger.RecordResults(1, {Outcome::Bye, Outcome::Bye}, &error));
    EXPECT_EQ(ErrorKind::Validation, error.kind);

    EXPECT_EQ(version, ledger.version());
    EXPECT_TRUE(ledger.has_pending_round());
}

TEST_F(RoundLedgerTest, testUndoRestoresPairingOnlyState)
{
    AppendAndRecord(1);
    ASSERT_TRUE(ledger.Append(MakeRound(2), &error));
    const Round before = ledger.rounds().back();

    ASSERT_TRUE(ledger.RecordResults(2, {Outcome::PlayerBWin, Outcome::Bye}, &error));
    const Round recorded = ledger.rounds().back();

    ASSERT_TRUE(ledger.UndoLast(&error));
    EXPECT_EQ(before, ledger.rounds().back());
    EXPECT_EQ(1, ledger.recorded_count());

    ASSERT_TRUE(ledger.RecordResults(2, {Outcome::PlayerBWin, Outcome::Bye}, &error));
    EXPECT_EQ(recorded, ledger.rounds().back());
}

TEST_F(RoundLedgerTest, testUndoWithNothingRecordedIsSequenceError)
{
    EXPECT_FALSE(ledger.UndoLast(&error));
    EXPECT_EQ(ErrorKind::Sequence, error.kind);

    ASSERT_TRUE(ledger.Append(MakeRound(1), &error));
    EXPECT_FALSE(ledger.UndoLast(&error));
    EXPECT_EQ(ErrorKind::Sequence, error.kind);
}

// Undo only reaches one round back: the undone round has to be recorded
// again before the one before it can be undone.
TEST_F(RoundLedgerTest, testSecondUndoNeedsTheRoundRecordedAgain)
{
    AppendAndRecord(1);
    AppendAndRecord(2);
    ASSERT_TRUE(ledger.UndoLast(&error));

    const auto version = ledger.version();
    EXPECT_FALSE(ledger.UndoLast(&error));
    EXPECT_EQ(ErrorKind::Sequence, error.kind);
    EXPECT_EQ(version, ledger.version());
    EXPECT_EQ(2, ledger.size());
    EXPECT_EQ(1, ledger.recorded_count());
    ASSERT_NE(nullptr, ledger.Find(1));
    EXPECT_TRUE(ledger.Find(1)->is_recorded);

    ASSERT_TRUE(ledger.RecordResults(2, {Outcome::Draw, Outcome::Bye}, &error));
    ASSERT_TRUE(ledger.UndoLast(&error));
    EXPECT_FALSE(ledger.Find(2)->is_recorded);
    EXPECT_TRUE(ledger.Find(1)->is_recorded);
}

TEST_F(RoundLedgerTest, testVersionBumpsOnEveryMutation)
{
    const auto start = ledger.version();
    AppendAndRecord(1);
    EXPECT_EQ(start + 2, ledger.version());
    ASSERT_TRUE(ledger.UndoLast(&error));
    EXPECT_EQ(start + 3, ledger.version());
}

TEST_F(RoundLedgerTest, testFindByIndex)
{
    AppendAndRecord(1);
    ASSERT_NE(nullptr, ledger.Find(1));
    EXPECT_EQ(1, ledger.Find(1)->index);
    EXPECT_EQ(nullptr, ledger.Find(0));
    EXPECT_EQ(nullptr, ledger.Find(2));
}

TEST_F(RoundLedgerTest, testLoadRejectsUnrecordedRoundBeforeRecordedOne)
{
    Round first = MakeRound(1);
    Round second = MakeRound(2);
    second.results = {Outcome::Draw, Outcome::Bye};
    second.is_recorded = true;
    EXPECT_FALSE(ledger.Load({first, second}, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);
    EXPECT_TRUE(ledger.empty());
}

TEST_F(RoundLedgerTest, testLoadRejectsBadIndexAndResultCount)
{
    Round round = MakeRound(2);
    EXPECT_FALSE(ledger.Load({round}, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);

    round.index = 1;
    round.results = {Outcome::Draw};
    round.is_recorded = true;
    EXPECT_FALSE(ledger.Load({round}, &error));
    EXPECT_EQ(ErrorKind::Decode, error.kind);
}

TEST_F(RoundLedgerTest, testLoadAcceptsTrailingPendingRound)
{
    Round first = MakeRound(1);
    first.results = {Outcome::PlayerAWin, Outcome::Bye};
    first.is_recorded = true;
    ASSERT_TRUE(ledger.Load({first, MakeRound(2)}, &error)) << error.message;
    EXPECT_EQ(2, ledger.size());
    EXPECT_EQ(1, ledger.recorded_count());
    EXPECT_TRUE(ledger.has_pending_round());
}
