// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "reveal.hpp"

#include "ledger.hpp"
#include "lifecycle.hpp"
#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace lastchair
{
namespace
{

using testing::_;

class RoundControllerTests : public DBTest
{

protected:

  SQLiteLedger ledger;
  MockRevealVerifier verifier;
  RoundController ctrl;

  const uint256 id = TestMatchId (1);

  const RoundSelections selA = {
      Sel (8, 1, 2, 3), Sel (3, 5, 6, 7), Sel (12, 1, 2, 3),
  };
  const RoundSelections selB = {
      Sel (5, 4, 6, 7), Sel (5, 1, 2, 9), Sel (1, 10, 11, 12),
  };

  EventList events;

  RoundControllerTests ()
    : ledger(GetDb ()), ctrl(GetDb (), verifier)
  {
    ledger.Credit ("alice", 100);
    ledger.Credit ("bob", 100);
  }

  /**
   * Creates the match with alice and (optionally) lets bob join.
   */
  void
  SetupMatch (const bool join = true)
  {
    MatchLifecycle lifecycle(GetDb (), ledger);
    lifecycle.StartMatch (id, "alice", 100, CommitmentsFor ("alice", selA),
                          events);
    if (join)
      lifecycle.StartMatch (id, "bob", 100, CommitmentsFor ("bob", selB),
                            events);
    events.clear ();
  }

  /**
   * Checks and records a reveal with a credential for the selection.
   */
  void
  Reveal (const std::string& player, const unsigned round,
          const Selection& sel)
  {
    const auto rev = ctrl.Check (id, player, round,
                                 TestCredential (player, round, sel));
    ctrl.Record (rev, events);
  }

  /**
   * Expects that a reveal fails with the given error kind.
   */
  void
  ExpectRejected (const ErrorKind kind, const std::string& player,
                  const unsigned round, const proto::RevealCredential& cred)
  {
    ExpectGameError (kind, [&] ()
      {
        ctrl.Check (id, player, round, cred);
      });
  }

  RoundsTable::Handle
  GetRound (const unsigned round)
  {
    return RoundsTable (GetDb ()).Get (id, round);
  }

};

TEST_F (RoundControllerTests, FirstReveal)
{
  SetupMatch ();

  EXPECT_CALL (verifier,
               Verify (CommitmentsFor ("bob", selB)[1], _, _))
      .WillOnce (testing::DoAll (testing::SetArgReferee<2> (selB[1]),
                                 testing::Return (true)));
  Reveal ("bob", 2, selB[1]);

  auto r = GetRound (2);
  EXPECT_EQ (r->GetStatus (), RoundStatus::REVEALED_B);
  EXPECT_EQ (r->GetSelection (Side::B), selB[1]);
  EXPECT_TRUE (r->GetSelection (Side::A).IsUnset ());

  ASSERT_EQ (events.size (), 1u);
  ASSERT_TRUE (events[0].has_reveal_submitted ());
  const auto& ev = events[0].reveal_submitted ();
  EXPECT_EQ (ev.round (), 2u);
  EXPECT_EQ (ev.player (), "bob");
  EXPECT_EQ (ev.chair (), 5u);
}

TEST_F (RoundControllerTests, BothRevealed)
{
  SetupMatch ();

  verifier.AcceptAs (selA[0]);
  Reveal ("alice", 1, selA[0]);
  EXPECT_EQ (GetRound (1)->GetStatus (), RoundStatus::REVEALED_A);

  verifier.AcceptAs (selB[0]);
  Reveal ("bob", 1, selB[0]);
  EXPECT_EQ (GetRound (1)->GetStatus (), RoundStatus::BOTH_REVEALED);
}

TEST_F (RoundControllerTests, RoundsInAnyOrder)
{
  SetupMatch ();

  verifier.AcceptAs (selA[2]);
  Reveal ("alice", 3, selA[2]);
  verifier.AcceptAs (selA[0]);
  Reveal ("alice", 1, selA[0]);

  EXPECT_EQ (GetRound (1)->GetStatus (), RoundStatus::REVEALED_A);
  EXPECT_EQ (GetRound (2)->GetStatus (), RoundStatus::PENDING);
  EXPECT_EQ (GetRound (3)->GetStatus (), RoundStatus::REVEALED_A);
}

TEST_F (RoundControllerTests, MatchNotFound)
{
  ExpectRejected (ErrorKind::NOT_FOUND, "alice", 1,
                  TestCredential ("alice", 1, selA[0]));
}

TEST_F (RoundControllerTests, MatchNotActive)
{
  SetupMatch (false);
  ExpectRejected (ErrorKind::STATE_MISMATCH, "alice", 1,
                  TestCredential ("alice", 1, selA[0]));
}

TEST_F (RoundControllerTests, InvalidRound)
{
  SetupMatch ();
  for (const unsigned r : {0, 4, 100})
    ExpectRejected (ErrorKind::VALIDATION_FAILURE, "alice", r,
                    TestCredential ("alice", 1, selA[0]));
}

TEST_F (RoundControllerTests, NotAPlayer)
{
  SetupMatch ();
  ExpectRejected (ErrorKind::UNAUTHORISED, "charly", 1,
                  TestCredential ("alice", 1, selA[0]));
  ExpectRejected (ErrorKind::UNAUTHORISED, "", 1,
                  TestCredential ("alice", 1, selA[0]));
}

TEST_F (RoundControllerTests, MalformedCredential)
{
  SetupMatch ();
  EXPECT_CALL (verifier, Verify (_, _, _)).Times (0);

  proto::RevealCredential cred;
  ExpectRejected (ErrorKind::VALIDATION_FAILURE, "alice", 1, cred);

  cred = TestCredential ("alice", 1, selA[0]);
  cred.mutable_public_inputs ()->RemoveLast ();
  cred.mutable_public_inputs ()->RemoveLast ();
  cred.mutable_public_inputs ()->RemoveLast ();
  ExpectRejected (ErrorKind::VALIDATION_FAILURE, "alice", 1, cred);

  cred = TestCredential ("alice", 1, selA[0]);
  *cred.mutable_public_inputs (4) = "x";
  ExpectRejected (ErrorKind::VALIDATION_FAILURE, "alice", 1, cred);
}

TEST_F (RoundControllerTests, InvalidSelection)
{
  SetupMatch ();
  EXPECT_CALL (verifier, Verify (_, _, _)).Times (0);

  for (const auto& sel : {Sel (0, 1, 2, 3), Sel (13, 1, 2, 3),
                          Sel (5, 1, 2, 13), Sel (5, 1, 1, 2),
                          Sel (5, 5, 1, 2)})
    ExpectRejected (ErrorKind::VALIDATION_FAILURE, "alice", 1,
                    TestCredential ("alice", 1, sel));
}

TEST_F (RoundControllerTests, DuplicateReveal)
{
  SetupMatch ();

  verifier.AcceptAs (selA[0]);
  Reveal ("alice", 1, selA[0]);

  ExpectRejected (ErrorKind::DUPLICATE_ACTION, "alice", 1,
                  TestCredential ("alice", 1, selA[0]));
  ExpectRejected (ErrorKind::DUPLICATE_ACTION, "alice", 1,
                  TestCredential ("alice", 1, Sel (9, 1, 2, 3)));

  EXPECT_EQ (GetRound (1)->GetSelection (Side::A), selA[0]);
}

TEST_F (RoundControllerTests, VerifierRejects)
{
  SetupMatch ();
  EXPECT_CALL (verifier, Verify (_, _, _))
      .WillOnce (testing::Return (false));

  ExpectRejected (ErrorKind::CRYPTO_FAILURE, "alice", 1,
                  TestCredential ("alice", 1, selA[0]));
  EXPECT_EQ (GetRound (1)->GetStatus (), RoundStatus::PENDING);
}

TEST_F (RoundControllerTests, AttestedValuesDiffer)
{
  SetupMatch ();
  verifier.AcceptAs (Sel (9, 1, 2, 3));

  ExpectRejected (ErrorKind::CRYPTO_FAILURE, "alice", 1,
                  TestCredential ("alice", 1, selA[0]));
  EXPECT_EQ (GetRound (1)->GetStatus (), RoundStatus::PENDING);
}

TEST_F (RoundControllerTests, WithHashVerifier)
{
  SetupMatch ();

  HashRevealVerifier hashVerifier;
  RoundController hashCtrl(GetDb (), hashVerifier);

  ExpectGameError (ErrorKind::CRYPTO_FAILURE, [&] ()
    {
      hashCtrl.Check (id, "alice", 1, TestCredential ("alice", 1, selA[1]));
    });
  ExpectGameError (ErrorKind::CRYPTO_FAILURE, [&] ()
    {
      hashCtrl.Check (id, "alice", 1, TestCredential ("bob", 1, selA[0]));
    });

  const auto rev = hashCtrl.Check (id, "alice", 1,
                                   TestCredential ("alice", 1, selA[0]));
  EXPECT_EQ (rev.side, Side::A);
  EXPECT_EQ (rev.selection, selA[0]);
}

} // anonymous namespace
} // namespace lastchair
