// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement.hpp"

#include "database.hpp"
#include "errors.hpp"
#include "payout.hpp"
#include "scoring.hpp"

#include <glog/logging.h>

#include <sstream>

namespace lastchair
{

void
Settlement::SettleRound (const uint256& id, const unsigned round,
                         EventList& events)
{
  MatchesTable matches(db);
  auto m = matches.GetById (id);
  if (m == nullptr)
    throw GameError (ErrorKind::NOT_FOUND, "no match " + id.ToHex ());

  if (!IsValidRound (round))
    {
      std::ostringstream msg;
      msg << "invalid round: " << round;
      throw GameError (ErrorKind::VALIDATION_FAILURE, msg.str ());
    }

  RoundsTable rounds(db);
  auto r = rounds.Get (id, round);
  CHECK (r != nullptr)
      << "Round " << round << " of match " << id.ToHex () << " is missing";

  if (r->GetStatus () == RoundStatus::SCORED)
    throw GameError (ErrorKind::DUPLICATE_ACTION, "round is already scored");
  if (m->GetStatus () != MatchStatus::ACTIVE)
    throw GameError (ErrorKind::STATE_MISMATCH,
                     "match is " + MatchStatusToString (m->GetStatus ()));
  if (r->GetStatus () != RoundStatus::BOTH_REVEALED)
    throw GameError (ErrorKind::STATE_MISMATCH,
                     "round is " + RoundStatusToString (r->GetStatus ()));
  if (round != m->GetCurrentRound ())
    {
      std::ostringstream msg;
      msg << "round " << round << " settled out of order, current round is "
          << m->GetCurrentRound ();
      throw GameError (ErrorKind::STATE_MISMATCH, msg.str ());
    }

  /* Each player's chair is checked against the opponent's traps.  */
  const Selection& selA = r->GetSelection (Side::A);
  const Selection& selB = r->GetSelection (Side::B);
  const RoundScore sc = ScoreRound (selA.chair, selB.traps,
                                    selB.chair, selA.traps);

  r->SetScores (sc);
  m->AddScores (sc);
  m->AdvanceRound ();

  const int64_t bps = ComputeSplitBps (m->GetScore (Side::A),
                                       m->GetScore (Side::B));

  LOG (INFO)
      << "Settled round " << round << " of match " << id.ToHex ()
      << ": " << RoundOutcomeToString (sc.outcome)
      << ", scores " << sc.a << " / " << sc.b
      << ", running split " << bps << " bps";
  events.push_back (RoundSettledEvent (id, round, sc, bps));
}

void
Settlement::SettleMatch (const uint256& id, EventList& events)
{
  MatchesTable matches(db);
  auto m = matches.GetById (id);
  if (m == nullptr)
    throw GameError (ErrorKind::NOT_FOUND, "no match " + id.ToHex ());

  if (m->GetStatus () == MatchStatus::FINISHED)
    throw GameError (ErrorKind::DUPLICATE_ACTION, "match already finished");
  if (m->GetStatus () != MatchStatus::ACTIVE)
    throw GameError (ErrorKind::STATE_MISMATCH,
                     "match is " + MatchStatusToString (m->GetStatus ()));

  RoundsTable rounds(db);
  auto last = rounds.Get (id, NUM_ROUNDS);
  CHECK (last != nullptr);
  if (last->GetStatus () != RoundStatus::SCORED)
    throw GameError (ErrorKind::STATE_MISMATCH, "last round is not scored");
  if ((last->GetScore (Side::A) + last->GetScore (Side::B)).GetScaled () == 0)
    throw GameError (ErrorKind::STATE_MISMATCH,
                     "last round has no combined score");

  const Payout p = ComputePayout (m->GetStake (), m->GetScore (Side::A),
                                  m->GetScore (Side::B));

  if (p.payoutA > 0)
    ledger.Pay (m->GetPlayer (Side::A), p.payoutA);
  if (p.payoutB > 0)
    ledger.Pay (m->GetPlayer (Side::B), p.payoutB);

  m->SetStatus (MatchStatus::FINISHED);

  LOG (INFO)
      << "Finished match " << id.ToHex ()
      << " (" << FeeTierToString (p.tier) << ", split " << p.splitBps
      << " bps): " << m->GetPlayer (Side::A) << " gets " << p.payoutA
      << ", " << m->GetPlayer (Side::B) << " gets " << p.payoutB
      << ", fee " << p.fee;
  events.push_back (MatchFinishedEvent (id, p));
}

} // namespace lastchair
