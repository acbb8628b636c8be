// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "reveal.hpp"

#include "errors.hpp"

#include <chairdb/transaction.hpp>

#include <glog/logging.h>

#include <sstream>

namespace lastchair
{

CheckedReveal
RoundController::Check (const uint256& id, const std::string& caller,
                        const unsigned round,
                        const proto::RevealCredential& cred)
{
  CheckedReveal res;
  res.matchId = id;
  res.round = round;
  res.player = caller;

  uint256 commitment;
  {
    SQLiteReadView view(db);

    MatchesTable matches(db);
    auto m = matches.GetById (id);
    if (m == nullptr)
      throw GameError (ErrorKind::NOT_FOUND, "no match " + id.ToHex ());

    if (m->GetStatus () != MatchStatus::ACTIVE)
      throw GameError (ErrorKind::STATE_MISMATCH,
                       "match is " + MatchStatusToString (m->GetStatus ()));

    if (!IsValidRound (round))
      {
        std::ostringstream msg;
        msg << "invalid round: " << round;
        throw GameError (ErrorKind::VALIDATION_FAILURE, msg.str ());
      }

    if (!m->GetSideOf (caller, res.side))
      throw GameError (ErrorKind::UNAUTHORISED,
                       caller + " is not a player of the match");

    if (!ExtractRevealedSelection (cred, res.selection))
      throw GameError (ErrorKind::VALIDATION_FAILURE,
                       "malformed reveal credential");

    RoundsTable rounds(db);
    auto r = rounds.Get (id, round);
    CHECK (r != nullptr)
        << "Round " << round << " of match " << id.ToHex () << " is missing";

    if (r->HasRevealed (res.side))
      throw GameError (ErrorKind::DUPLICATE_ACTION,
                       caller + " has already revealed this round");

    if (!res.selection.IsValid ())
      {
        std::ostringstream msg;
        msg << "invalid selection: " << res.selection;
        throw GameError (ErrorKind::VALIDATION_FAILURE, msg.str ());
      }

    commitment = r->GetCommitment (res.side);
    CHECK (!commitment.IsNull ())
        << "Active match " << id.ToHex () << " has no commitment for "
        << res.side << " in round " << round;
  }

  /* Verification does not touch the database, so it runs without holding
     the connection.  */
  Selection attested;
  if (!verifier.Verify (commitment, cred, attested))
    throw GameError (ErrorKind::CRYPTO_FAILURE, "credential rejected");

  /* The values we record are the trailing public inputs.  Make sure they
     are what the verifier actually attested to.  */
  if (attested != res.selection)
    {
      std::ostringstream msg;
      msg << "verifier attested " << attested
          << " but credential reveals " << res.selection;
      throw GameError (ErrorKind::CRYPTO_FAILURE, msg.str ());
    }

  return res;
}

void
RoundController::Record (const CheckedReveal& rev, EventList& events)
{
  MatchesTable matches(db);
  auto m = matches.GetById (rev.matchId);
  CHECK (m != nullptr);
  CHECK (m->GetStatus () == MatchStatus::ACTIVE);

  RoundsTable rounds(db);
  auto r = rounds.Get (rev.matchId, rev.round);
  CHECK (r != nullptr);
  r->RecordReveal (rev.side, rev.selection);

  LOG (INFO)
      << rev.player << " revealed " << rev.selection
      << " for round " << rev.round << " of match " << rev.matchId.ToHex ();
  events.push_back (RevealSubmittedEvent (rev.matchId, rev.round, rev.player,
                                          rev.selection.chair));
}

} // namespace lastchair
