// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "database.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

namespace lastchair
{
namespace
{

class MatchesTableTests : public DBTest
{

protected:

  MatchesTable tbl;

  MatchesTableTests ()
    : tbl(GetDb ())
  {}

};

TEST_F (MatchesTableTests, CreateAndRead)
{
  const auto id = TestMatchId (1);
  EXPECT_EQ (tbl.GetById (id), nullptr);

  {
    auto h = tbl.CreateNew (id);
    h->SetPlayer (Side::A, "alice");
    h->SetStake (100);
  }

  auto h = tbl.GetById (id);
  ASSERT_NE (h, nullptr);
  EXPECT_EQ (h->GetId (), id);
  EXPECT_EQ (h->GetPlayer (Side::A), "alice");
  EXPECT_EQ (h->GetPlayer (Side::B), "");
  EXPECT_EQ (h->GetStake (), 100);
  EXPECT_EQ (h->GetCurrentRound (), 1u);
  EXPECT_EQ (h->GetStatus (), MatchStatus::WAITING);
  EXPECT_EQ (h->GetScore (Side::A), ScaledScore ());
  EXPECT_EQ (h->GetScore (Side::B), ScaledScore ());
}

TEST_F (MatchesTableTests, Modification)
{
  const auto id = TestMatchId (1);
  {
    auto h = tbl.CreateNew (id);
    h->SetPlayer (Side::A, "alice");
    h->SetStake (100);
  }

  {
    auto h = tbl.GetById (id);
    h->SetPlayer (Side::B, "bob");
    h->SetStatus (MatchStatus::ACTIVE);
    h->AddScores ({ScaledScore (32), ScaledScore (20),
                   RoundOutcome::BOTH_SAFE});
    h->AdvanceRound ();
  }

  auto h = tbl.GetById (id);
  EXPECT_EQ (h->GetPlayer (Side::B), "bob");
  EXPECT_EQ (h->GetStatus (), MatchStatus::ACTIVE);
  EXPECT_EQ (h->GetScore (Side::A), ScaledScore (32));
  EXPECT_EQ (h->GetScore (Side::B), ScaledScore (20));
  EXPECT_EQ (h->GetCurrentRound (), 2u);
}

TEST_F (MatchesTableTests, CurrentRoundStaysAtLast)
{
  const auto id = TestMatchId (1);
  {
    auto h = tbl.CreateNew (id);
    h->SetPlayer (Side::A, "alice");
    h->SetStake (100);
    for (unsigned i = 0; i < 5; ++i)
      h->AdvanceRound ();
  }

  EXPECT_EQ (tbl.GetById (id)->GetCurrentRound (), NUM_ROUNDS);
}

TEST_F (MatchesTableTests, GetSideOf)
{
  auto h = tbl.CreateNew (TestMatchId (1));
  h->SetPlayer (Side::A, "alice");
  h->SetStake (1);

  Side s;
  ASSERT_TRUE (h->GetSideOf ("alice", s));
  EXPECT_EQ (s, Side::A);
  EXPECT_FALSE (h->GetSideOf ("bob", s));
  EXPECT_FALSE (h->GetSideOf ("", s));

  h->SetPlayer (Side::B, "bob");
  ASSERT_TRUE (h->GetSideOf ("bob", s));
  EXPECT_EQ (s, Side::B);
}

TEST_F (MatchesTableTests, QueryAll)
{
  for (const unsigned n : {3, 1, 2})
    {
      auto h = tbl.CreateNew (TestMatchId (n));
      h->SetPlayer (Side::A, "alice");
      h->SetStake (n);
    }

  auto stmt = tbl.QueryAll ();
  for (const unsigned n : {1, 2, 3})
    {
      ASSERT_TRUE (stmt.Step ());
      auto h = tbl.GetFromResult (stmt);
      EXPECT_EQ (h->GetId (), TestMatchId (n));
      EXPECT_EQ (h->GetStake (), static_cast<Amount> (n));
    }
  EXPECT_FALSE (stmt.Step ());
}

using MatchesTableDeathTests = MatchesTableTests;

TEST_F (MatchesTableDeathTests, PlayerSetTwice)
{
  auto h = tbl.CreateNew (TestMatchId (1));
  h->SetPlayer (Side::A, "alice");
  h->SetStake (1);
  EXPECT_DEATH (h->SetPlayer (Side::A, "bob"), "already set");
  EXPECT_DEATH (h->SetPlayer (Side::B, "alice"), "would be");
}

/* ************************************************************************** */

class RoundsTableTests : public DBTest
{

protected:

  RoundsTable tbl;
  const uint256 id = TestMatchId (1);

  RoundsTableTests ()
    : tbl(GetDb ())
  {
    auto h = MatchesTable (GetDb ()).CreateNew (id);
    h->SetPlayer (Side::A, "alice");
    h->SetStake (1);
  }

};

TEST_F (RoundsTableTests, CreateAndRead)
{
  EXPECT_EQ (tbl.Get (id, 2), nullptr);
  tbl.CreateNew (id, 2);

  auto h = tbl.Get (id, 2);
  ASSERT_NE (h, nullptr);
  EXPECT_EQ (h->GetMatchId (), id);
  EXPECT_EQ (h->GetRound (), 2u);
  EXPECT_EQ (h->GetStatus (), RoundStatus::PENDING);
  for (const Side s : {Side::A, Side::B})
    {
      EXPECT_TRUE (h->GetCommitment (s).IsNull ());
      EXPECT_TRUE (h->GetSelection (s).IsUnset ());
      EXPECT_FALSE (h->HasRevealed (s));
      EXPECT_EQ (h->GetScore (s), ScaledScore ());
    }
}

TEST_F (RoundsTableTests, Commitments)
{
  uint256 ca, cb;
  ASSERT_TRUE (ca.FromHex ("aa"));
  ASSERT_TRUE (cb.FromHex ("bb"));

  {
    auto h = tbl.CreateNew (id, 1);
    h->SetCommitment (Side::A, ca);
    h->SetCommitment (Side::B, cb);
  }

  auto h = tbl.Get (id, 1);
  EXPECT_EQ (h->GetCommitment (Side::A), ca);
  EXPECT_EQ (h->GetCommitment (Side::B), cb);
}

TEST_F (RoundsTableTests, RevealStatusTransitions)
{
  tbl.CreateNew (id, 1);
  tbl.CreateNew (id, 2);

  tbl.Get (id, 1)->RecordReveal (Side::B, Sel (5, 1, 2, 9));
  EXPECT_EQ (tbl.Get (id, 1)->GetStatus (), RoundStatus::REVEALED_B);

  tbl.Get (id, 2)->RecordReveal (Side::A, Sel (8, 1, 2, 3));
  EXPECT_EQ (tbl.Get (id, 2)->GetStatus (), RoundStatus::REVEALED_A);

  tbl.Get (id, 1)->RecordReveal (Side::A, Sel (3, 5, 6, 7));
  auto h = tbl.Get (id, 1);
  EXPECT_EQ (h->GetStatus (), RoundStatus::BOTH_REVEALED);
  EXPECT_EQ (h->GetSelection (Side::A), Sel (3, 5, 6, 7));
  EXPECT_EQ (h->GetSelection (Side::B), Sel (5, 1, 2, 9));
}

TEST_F (RoundsTableTests, Scores)
{
  {
    auto h = tbl.CreateNew (id, 3);
    h->RecordReveal (Side::A, Sel (3, 5, 6, 7));
    h->RecordReveal (Side::B, Sel (5, 1, 2, 9));
    h->SetScores ({ScaledScore (44), ScaledScore (5),
                   RoundOutcome::B_TRAPPED});
  }

  auto h = tbl.Get (id, 3);
  EXPECT_EQ (h->GetStatus (), RoundStatus::SCORED);
  EXPECT_EQ (h->GetScore (Side::A), ScaledScore (44));
  EXPECT_EQ (h->GetScore (Side::B), ScaledScore (5));
}

TEST_F (RoundsTableTests, QueryForMatch)
{
  for (const unsigned r : {3, 1, 2})
    tbl.CreateNew (id, r);

  auto stmt = tbl.QueryForMatch (id);
  for (const unsigned r : {1, 2, 3})
    {
      ASSERT_TRUE (stmt.Step ());
      EXPECT_EQ (tbl.GetFromResult (stmt)->GetRound (), r);
    }
  EXPECT_FALSE (stmt.Step ());

  stmt = tbl.QueryForMatch (TestMatchId (2));
  EXPECT_FALSE (stmt.Step ());
}

using RoundsTableDeathTests = RoundsTableTests;

TEST_F (RoundsTableDeathTests, RevealTwice)
{
  auto h = tbl.CreateNew (id, 1);
  h->RecordReveal (Side::A, Sel (3, 5, 6, 7));
  EXPECT_DEATH (h->RecordReveal (Side::A, Sel (4, 5, 6, 7)),
                "already revealed");
}

TEST_F (RoundsTableDeathTests, ScoreBeforeBothRevealed)
{
  auto h = tbl.CreateNew (id, 1);
  h->RecordReveal (Side::A, Sel (3, 5, 6, 7));
  EXPECT_DEATH (h->SetScores ({ScaledScore (1), ScaledScore (1),
                               RoundOutcome::BOTH_SAFE}),
                "Scoring round");
}

/* ************************************************************************** */

class PendingCommitmentsTests : public DBTest
{

protected:

  PendingCommitments pending;

  PendingCommitmentsTests ()
    : pending(GetDb ())
  {}

};

TEST_F (PendingCommitmentsTests, InsertAndGet)
{
  const auto id = TestMatchId (1);
  const auto c = CommitmentsFor ("alice", {Sel (1, 2, 3, 4), Sel (5, 6, 7, 8),
                                           Sel (9, 10, 11, 12)});
  pending.Insert (id, "alice", c);

  uint256 val;
  ASSERT_TRUE (pending.Get (id, "alice", 2, val));
  EXPECT_EQ (val, c[1]);
  EXPECT_FALSE (pending.Get (id, "bob", 2, val));
  EXPECT_FALSE (pending.Get (TestMatchId (2), "alice", 2, val));

  Commitments all;
  ASSERT_TRUE (pending.GetAll (id, "alice", all));
  EXPECT_EQ (all, c);
  EXPECT_FALSE (pending.GetAll (id, "bob", all));
}

} // anonymous namespace
} // namespace lastchair
