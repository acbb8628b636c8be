// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "statejson.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

namespace lastchair
{
namespace
{

class StateJsonTests : public GameTest
{

protected:

  const uint256 id = TestMatchId (1);

  const RoundSelections selA = {
      Sel (8, 1, 2, 3), Sel (3, 5, 6, 7), Sel (12, 1, 2, 3),
  };
  const RoundSelections selB = {
      Sel (5, 4, 6, 7), Sel (5, 1, 2, 9), Sel (1, 10, 11, 12),
  };

  StateJsonExtractor ext;

  StateJsonTests ()
    : ext(GetDb ())
  {
    ledger.Credit ("alice", 100);
    ledger.Credit ("bob", 100);
  }

};

TEST_F (StateJsonTests, UnknownMatch)
{
  ExpectGameError (ErrorKind::NOT_FOUND, [&] ()
    {
      ext.GetMatch (id);
    });
  ExpectGameError (ErrorKind::NOT_FOUND, [&] ()
    {
      ext.GetRound (id, 1);
    });
  ExpectGameError (ErrorKind::NOT_FOUND, [&] ()
    {
      ext.GetCommitment (id, "alice", 1);
    });
  EXPECT_EQ (ext.FullState (), ParseJson ("[]"));
}

TEST_F (StateJsonTests, InvalidRound)
{
  Start (id, "alice", 100, selA);
  for (const unsigned r : {0, 4})
    {
      ExpectGameError (ErrorKind::VALIDATION_FAILURE, [&] ()
        {
          ext.GetRound (id, r);
        });
      ExpectGameError (ErrorKind::VALIDATION_FAILURE, [&] ()
        {
          ext.GetCommitment (id, "alice", r);
        });
    }
}

TEST_F (StateJsonTests, WaitingMatch)
{
  Start (id, "alice", 100, selA);

  Json::Value expected = ParseJson (R"({
    "players": {"a": "alice", "b": null},
    "stake": 100,
    "status": "waiting",
    "scores":
      {
        "a": {"scaled": 0, "real": 0.0},
        "b": {"scaled": 0, "real": 0.0}
      },
    "split_a_bps": 5000
  })");
  expected["id"] = id.ToHex ();
  expected["round"] = 1u;
  EXPECT_EQ (ext.GetMatch (id), expected);

  const auto round = ext.GetRound (id, 2);
  EXPECT_EQ (round["status"], "pending");
  EXPECT_TRUE (round["commitments"]["a"].isNull ());
  EXPECT_TRUE (round["commitments"]["b"].isNull ());
  EXPECT_FALSE (round.isMember ("outcome"));

  EXPECT_EQ (ext.GetCommitment (id, "alice", 2).asString (),
             CommitmentsFor ("alice", selA)[1].ToHex ());
  EXPECT_TRUE (ext.GetCommitment (id, "bob", 2).isNull ());

  ExpectGameError (ErrorKind::NOT_FOUND, [&] ()
    {
      ext.GetCommitment (TestMatchId (2), "alice", 2);
    });
}

TEST_F (StateJsonTests, RoundProgress)
{
  Start (id, "alice", 100, selA);
  Start (id, "bob", 100, selB);

  auto round = ext.GetRound (id, 1);
  EXPECT_EQ (round["round"].asUInt (), 1u);
  EXPECT_EQ (round["commitments"]["a"].asString (),
             CommitmentsFor ("alice", selA)[0].ToHex ());
  EXPECT_EQ (round["commitments"]["b"].asString (),
             CommitmentsFor ("bob", selB)[0].ToHex ());
  EXPECT_TRUE (round["reveals"]["a"].isNull ());
  EXPECT_TRUE (round["reveals"]["b"].isNull ());

  Reveal (id, "bob", 1, selB[0]);
  round = ext.GetRound (id, 1);
  EXPECT_EQ (round["status"], "revealed b");
  EXPECT_TRUE (round["reveals"]["a"].isNull ());
  EXPECT_EQ (round["reveals"]["b"]["chair"].asUInt (), 5u);
  ASSERT_EQ (round["reveals"]["b"]["traps"].size (), 3u);
  EXPECT_EQ (round["reveals"]["b"]["traps"][2].asUInt (), 7u);

  Reveal (id, "alice", 1, selA[0]);
  EXPECT_EQ (ext.GetRound (id, 1)["status"], "both revealed");

  game.SettleRound (id, 1);
  round = ext.GetRound (id, 1);
  EXPECT_EQ (round["status"], "scored");
  EXPECT_EQ (round["outcome"], "both safe");
  EXPECT_EQ (round["scores"], ParseJson (R"({
    "a": {"scaled": 32, "real": 8.0},
    "b": {"scaled": 20, "real": 5.0}
  })"));

  const auto match = ext.GetMatch (id);
  EXPECT_EQ (match["status"], "active");
  EXPECT_EQ (match["players"]["b"], "bob");
  EXPECT_EQ (match["round"].asUInt (), 2u);
  EXPECT_EQ (match["split_a_bps"].asInt64 (), 6'153);
}

TEST_F (StateJsonTests, FullState)
{
  Start (TestMatchId (2), "alice", 50, selA);
  Start (TestMatchId (1), "bob", 30, selB);

  const auto state = ext.FullState ();
  ASSERT_EQ (state.size (), 2u);
  EXPECT_EQ (state[0]["id"].asString (), TestMatchId (1).ToHex ());
  EXPECT_EQ (state[0]["players"]["a"], "bob");
  EXPECT_EQ (state[1]["id"].asString (), TestMatchId (2).ToHex ());
  EXPECT_EQ (state[1]["stake"].asInt64 (), 50);

  for (const auto& m : state)
    {
      ASSERT_EQ (m["rounds"].size (), NUM_ROUNDS);
      for (unsigned i = 0; i < NUM_ROUNDS; ++i)
        EXPECT_EQ (m["rounds"][i]["round"].asUInt (), i + 1);
    }
}

} // anonymous namespace
} // namespace lastchair
