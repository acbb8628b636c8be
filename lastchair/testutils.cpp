// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include "schema.hpp"

#include <glog/logging.h>

#include <sstream>

namespace lastchair
{

using testing::_;

Json::Value
ParseJson (const std::string& val)
{
  std::istringstream in(val);
  Json::Value res;
  in >> res;
  return res;
}

uint256
TestMatchId (const unsigned num)
{
  uint256 res;
  res.FromScalar (0x1000 + num);
  return res;
}

Selection
Sel (const unsigned chair, const unsigned t1, const unsigned t2,
     const unsigned t3)
{
  return Selection (chair, {t1, t2, t3});
}

std::string
TestSalt (const std::string& player, const unsigned round)
{
  std::ostringstream out;
  out << "salt " << player << " " << round;
  return out.str ();
}

Commitments
CommitmentsFor (const std::string& player, const RoundSelections& sel)
{
  Commitments res;
  for (unsigned i = 0; i < NUM_ROUNDS; ++i)
    res[i] = ComputeCommitment (sel[i], TestSalt (player, i + 1));
  return res;
}

proto::RevealCredential
TestCredential (const std::string& player, const unsigned round,
                const Selection& sel)
{
  return BuildCredential (sel, TestSalt (player, round));
}

MockLedger::MockLedger ()
{
  /* Expect no calls by default.  */
  EXPECT_CALL (*this, Lock (_, _)).Times (0);
  EXPECT_CALL (*this, Pay (_, _)).Times (0);
}

MockRevealVerifier::MockRevealVerifier ()
{
  ON_CALL (*this, Verify (_, _, _)).WillByDefault (testing::Return (false));
}

void
MockRevealVerifier::AcceptAs (const Selection& sel)
{
  EXPECT_CALL (*this, Verify (_, _, _))
      .WillRepeatedly (testing::DoAll (testing::SetArgReferee<2> (sel),
                                       testing::Return (true)));
}

DBTest::DBTest ()
  : db("test", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY)
{
  SetupDatabaseSchema (GetDb ());
}

GameTest::GameTest ()
  : ledger(GetDb ()), game(GetDb (), ledger, verifier, events)
{}

void
GameTest::Start (const uint256& id, const std::string& player,
                 const Amount stake, const RoundSelections& sel)
{
  game.StartMatch (id, player, stake, CommitmentsFor (player, sel));
}

void
GameTest::Reveal (const uint256& id, const std::string& player,
                  const unsigned round, const Selection& sel)
{
  game.SubmitReveal (id, player, round, TestCredential (player, round, sel));
}

} // namespace lastchair
