// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "game.hpp"

#include "statejson.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

#include <glog/logging.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace lastchair
{
namespace
{

class GameTests : public GameTest
{

protected:

  const uint256 id = TestMatchId (1);

  const RoundSelections selA = {
      Sel (8, 1, 2, 3), Sel (3, 5, 6, 7), Sel (12, 1, 2, 3),
  };
  const RoundSelections selB = {
      Sel (5, 4, 6, 7), Sel (5, 1, 2, 9), Sel (1, 10, 11, 12),
  };

  GameTests ()
  {
    ledger.Credit ("alice", 1'000);
    ledger.Credit ("bob", 1'000);
  }

  void
  StartBoth ()
  {
    Start (id, "alice", 1'000, selA);
    Start (id, "bob", 1'000, selB);
  }

  void
  RevealBoth (const unsigned round)
  {
    Reveal (id, "alice", round, selA[round - 1]);
    Reveal (id, "bob", round, selB[round - 1]);
  }

  MatchesTable::Handle
  GetMatch ()
  {
    return MatchesTable (GetDb ()).GetById (id);
  }

};

TEST_F (GameTests, FullMatch)
{
  StartBoth ();
  EXPECT_EQ (ledger.GetBalance ("alice"), 0);
  EXPECT_EQ (ledger.GetBalance ("bob"), 0);
  EXPECT_EQ (ledger.GetCustody (), 2'000);

  /* Both safe in the first round.  */
  RevealBoth (1);
  game.SettleRound (id, 1);
  EXPECT_EQ (GetMatch ()->GetScore (Side::A), ScaledScore (32));
  EXPECT_EQ (GetMatch ()->GetScore (Side::B), ScaledScore (20));

  /* Bob is trapped in the second round.  */
  RevealBoth (2);
  game.SettleRound (id, 2);
  EXPECT_EQ (GetMatch ()->GetScore (Side::A), ScaledScore (32 + 44));
  EXPECT_EQ (GetMatch ()->GetScore (Side::B), ScaledScore (20 + 5));

  /* Both are trapped in the last round.  */
  RevealBoth (3);
  game.SettleRound (id, 3);
  EXPECT_EQ (GetMatch ()->GetScore (Side::A), ScaledScore (120));
  EXPECT_EQ (GetMatch ()->GetScore (Side::B), ScaledScore (58));

  game.SettleMatch (id);
  EXPECT_EQ (GetMatch ()->GetStatus (), MatchStatus::FINISHED);
  EXPECT_EQ (ledger.GetBalance ("alice"), 1'328);
  EXPECT_EQ (ledger.GetBalance ("bob"), 652);
  EXPECT_EQ (ledger.GetCustody (), 20);

  const auto all = events.GetEvents ();
  ASSERT_EQ (all.size (), 12u);
  EXPECT_TRUE (all[0].has_match_queued ());
  EXPECT_TRUE (all[1].has_match_started ());
  EXPECT_TRUE (all[2].has_reveal_submitted ());
  EXPECT_TRUE (all[4].has_round_settled ());
  EXPECT_EQ (all[7].round_settled ().outcome (),
             proto::RoundSettled::B_TRAPPED);
  EXPECT_EQ (all[10].round_settled ().outcome (),
             proto::RoundSettled::BOTH_TRAPPED);
  ASSERT_TRUE (all[11].has_match_finished ());
  EXPECT_EQ (all[11].match_finished ().split_a_bps (), 6'741);
  EXPECT_EQ (all[11].match_finished ().fee (), 20);
}

TEST_F (GameTests, RejectedOperationsPublishNothing)
{
  StartBoth ();
  events.Take ();

  ExpectGameError (ErrorKind::DUPLICATE_ACTION, [&] ()
    {
      Start (TestMatchId (1), "charly", 1'000, selA);
    });
  ExpectGameError (ErrorKind::CRYPTO_FAILURE, [&] ()
    {
      Reveal (id, "alice", 1, selA[1]);
    });
  ExpectGameError (ErrorKind::STATE_MISMATCH, [&] ()
    {
      game.SettleRound (id, 1);
    });
  ExpectGameError (ErrorKind::STATE_MISMATCH, [&] ()
    {
      game.SettleMatch (id);
    });

  EXPECT_TRUE (events.GetEvents ().empty ());
}

TEST_F (GameTests, InsufficientFundsRollsBack)
{
  ExpectGameError (ErrorKind::INSUFFICIENT_FUNDS, [&] ()
    {
      Start (id, "charly", 10, selA);
    });
  EXPECT_EQ (GetMatch (), nullptr);

  Start (id, "alice", 1'000, selA);
  ExpectGameError (ErrorKind::VALUE_MISMATCH, [&] ()
    {
      Start (id, "charly", 10, selB);
    });
  ExpectGameError (ErrorKind::INSUFFICIENT_FUNDS, [&] ()
    {
      Start (id, "charly", 1'000, selB);
    });

  auto m = GetMatch ();
  EXPECT_EQ (m->GetStatus (), MatchStatus::WAITING);
  EXPECT_EQ (m->GetPlayer (Side::B), "");
  EXPECT_EQ (ledger.GetCustody (), 1'000);

  StateJsonExtractor ext(GetDb ());
  EXPECT_TRUE (ext.GetCommitment (id, "charly", 1).isNull ());
}

TEST_F (GameTests, ConcurrentReveals)
{
  constexpr unsigned numMatches = 8;

  for (unsigned i = 0; i < numMatches; ++i)
    {
      const std::string a = "a" + std::to_string (i);
      const std::string b = "b" + std::to_string (i);
      ledger.Credit (a, 10);
      ledger.Credit (b, 10);
      Start (TestMatchId (i), a, 10, selA);
      Start (TestMatchId (i), b, 10, selB);
    }

  /* Each player reveals all rounds in their own thread, so that the two
     players of a match race against each other.  */
  std::vector<std::thread> threads;
  for (unsigned i = 0; i < numMatches; ++i)
    for (const bool first : {true, false})
      threads.emplace_back ([this, i, first] ()
        {
          const std::string name = (first ? "a" : "b") + std::to_string (i);
          const auto& sel = (first ? selA : selB);
          for (unsigned r = 1; r <= NUM_ROUNDS; ++r)
            Reveal (TestMatchId (i), name, r, sel[r - 1]);
        });
  for (auto& t : threads)
    t.join ();

  RoundsTable rounds(GetDb ());
  for (unsigned i = 0; i < numMatches; ++i)
    for (unsigned r = 1; r <= NUM_ROUNDS; ++r)
      {
        auto h = rounds.Get (TestMatchId (i), r);
        EXPECT_EQ (h->GetStatus (), RoundStatus::BOTH_REVEALED);
        EXPECT_EQ (h->GetSelection (Side::A), selA[r - 1]);
        EXPECT_EQ (h->GetSelection (Side::B), selB[r - 1]);
      }

  EXPECT_EQ (events.GetEvents ().size (),
             numMatches * (2 + 2 * NUM_ROUNDS));
}

TEST_F (GameTests, ConcurrentDuplicateReveals)
{
  StartBoth ();
  events.Take ();

  constexpr unsigned numThreads = 8;
  std::vector<std::thread> threads;
  std::atomic<unsigned> accepted(0);
  std::atomic<unsigned> duplicates(0);
  for (unsigned i = 0; i < numThreads; ++i)
    threads.emplace_back ([&] ()
      {
        try
          {
            Reveal (id, "alice", 1, selA[0]);
            ++accepted;
          }
        catch (const GameError& exc)
          {
            if (exc.GetKind () == ErrorKind::DUPLICATE_ACTION)
              ++duplicates;
          }
      });
  for (auto& t : threads)
    t.join ();

  EXPECT_EQ (accepted.load (), 1u);
  EXPECT_EQ (duplicates.load (), numThreads - 1);
  EXPECT_EQ (events.GetEvents ().size (), 1u);
}

TEST_F (GameTests, ReadsSeeOnlyCompleteOperations)
{
  constexpr unsigned numMatches = 200;

  for (unsigned i = 0; i < numMatches; ++i)
    {
      ledger.Credit ("a" + std::to_string (i), 1);
      ledger.Credit ("b" + std::to_string (i), 1);
    }

  std::atomic<bool> done(false);
  std::thread writer([&] ()
    {
      for (unsigned i = 0; i < numMatches; ++i)
        {
          Start (TestMatchId (i), "a" + std::to_string (i), 1, selA);
          Start (TestMatchId (i), "b" + std::to_string (i), 1, selB);
        }
      done = true;
    });

  StateJsonExtractor ext(GetDb ());
  unsigned numReads = 0;
  while (!done || numReads == 0)
    {
      const auto state = ext.FullState ();
      for (const auto& m : state)
        {
          EXPECT_EQ (m["rounds"].size (), NUM_ROUNDS);

          const bool active = (m["status"] == "active");
          EXPECT_EQ (active, !m["players"]["b"].isNull ());
          for (const auto& r : m["rounds"])
            {
              EXPECT_EQ (active, !r["commitments"]["a"].isNull ());
              EXPECT_EQ (active, !r["commitments"]["b"].isNull ());
            }
        }
      ++numReads;
    }

  writer.join ();
  EXPECT_EQ (ext.FullState ().size (), numMatches);
}

/**
 * Event sink that joins every newly queued match as bob, by calling
 * back into the game from Publish.
 */
class AutoJoinSink : public EventSink
{

public:

  Game* game = nullptr;
  RoundSelections sel;
  unsigned numStarted = 0;

  void
  Publish (const proto::GameEvent& ev) override
  {
    if (ev.has_match_started ())
      ++numStarted;

    if (!ev.has_match_queued ())
      return;

    uint256 id;
    CHECK (id.FromBinaryString (ev.match_queued ().match_id ()));
    game->StartMatch (id, "bob", ev.match_queued ().stake (),
                      CommitmentsFor ("bob", sel));
  }

};

TEST_F (GameTests, SinkMayCallBackIntoGame)
{
  AutoJoinSink sink;
  Game joiningGame(GetDb (), ledger, verifier, sink);
  sink.game = &joiningGame;
  sink.sel = selB;

  joiningGame.StartMatch (id, "alice", 1'000, CommitmentsFor ("alice", selA));

  EXPECT_EQ (sink.numStarted, 1u);
  auto m = GetMatch ();
  EXPECT_EQ (m->GetStatus (), MatchStatus::ACTIVE);
  EXPECT_EQ (m->GetPlayer (Side::B), "bob");
  EXPECT_EQ (ledger.GetCustody (), 2'000);
}

} // anonymous namespace
} // namespace lastchair
