// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "lifecycle.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace lastchair
{

void
MatchLifecycle::StartMatch (const uint256& id, const std::string& caller,
                            const Amount stake, const Commitments& c,
                            EventList& events)
{
  if (caller.empty ())
    throw GameError (ErrorKind::VALIDATION_FAILURE, "caller is not set");
  if (stake <= 0 || stake > MAX_STAKE)
    {
      std::ostringstream msg;
      msg << "invalid stake: " << stake;
      throw GameError (ErrorKind::VALIDATION_FAILURE, msg.str ());
    }
  for (const auto& cur : c)
    if (cur.IsNull ())
      throw GameError (ErrorKind::VALIDATION_FAILURE, "null commitment");

  MatchesTable matches(db);
  auto m = matches.GetById (id);
  if (m == nullptr)
    CreateMatch (id, caller, stake, c, events);
  else
    JoinMatch (*m, caller, stake, c, events);
}

void
MatchLifecycle::CreateMatch (const uint256& id, const std::string& caller,
                             const Amount stake, const Commitments& c,
                             EventList& events)
{
  ledger.Lock (caller, stake);

  /* The match row has to be written before the rounds that reference it,
     so we let the handle go out of scope here.  */
  {
    MatchesTable matches(db);
    auto m = matches.CreateNew (id);
    m->SetPlayer (Side::A, caller);
    m->SetStake (stake);
  }

  PendingCommitments (db).Insert (id, caller, c);

  RoundsTable rounds(db);
  for (unsigned r = 1; r <= NUM_ROUNDS; ++r)
    rounds.CreateNew (id, r);

  LOG (INFO)
      << caller << " created match " << id.ToHex ()
      << " with stake " << stake;
  events.push_back (MatchQueuedEvent (id, caller, stake));
}

void
MatchLifecycle::JoinMatch (MatchData& m, const std::string& caller,
                           const Amount stake, const Commitments& c,
                           EventList& events)
{
  if (m.GetStatus () != MatchStatus::WAITING)
    throw GameError (ErrorKind::DUPLICATE_ACTION, "match already started");
  if (caller == m.GetPlayer (Side::A))
    throw GameError (ErrorKind::DUPLICATE_ACTION,
                     "caller already joined the match");
  if (stake != m.GetStake ())
    {
      std::ostringstream msg;
      msg << "stake mismatch: " << stake << " vs " << m.GetStake ();
      throw GameError (ErrorKind::VALUE_MISMATCH, msg.str ());
    }

  const uint256& id = m.GetId ();
  const std::string& playerA = m.GetPlayer (Side::A);

  PendingCommitments pending(db);
  Commitments commitmentsA;
  CHECK (pending.GetAll (id, playerA, commitmentsA))
      << "Missing pending commitments of " << playerA
      << " for match " << id.ToHex ();

  ledger.Lock (caller, stake);

  pending.Insert (id, caller, c);

  RoundsTable rounds(db);
  for (unsigned r = 1; r <= NUM_ROUNDS; ++r)
    {
      auto round = rounds.Get (id, r);
      CHECK (round != nullptr)
          << "Round " << r << " of match " << id.ToHex () << " is missing";
      round->SetCommitment (Side::A, commitmentsA[r - 1]);
      round->SetCommitment (Side::B, c[r - 1]);
    }

  m.SetPlayer (Side::B, caller);
  m.SetStatus (MatchStatus::ACTIVE);
  CHECK_EQ (m.GetCurrentRound (), 1u);

  LOG (INFO)
      << caller << " joined match " << id.ToHex ()
      << " against " << playerA;
  events.push_back (MatchStartedEvent (id, playerA, caller, stake));
}

} // namespace lastchair
