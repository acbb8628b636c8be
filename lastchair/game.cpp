// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "game.hpp"

#include "lifecycle.hpp"
#include "reveal.hpp"
#include "settlement.hpp"

#include <chairdb/transaction.hpp>

namespace lastchair
{

void
Game::Publish (const EventList& events)
{
  for (const auto& ev : events)
    sink.Publish (ev);
}

void
Game::StartMatch (const uint256& id, const std::string& caller,
                  const Amount stake, const Commitments& c)
{
  EventList events;
  {
    auto lock = locks.Acquire (id);
    SQLiteTransaction tx(db, "startmatch");
    MatchLifecycle (db, ledger).StartMatch (id, caller, stake, c, events);
    tx.Commit ();
  }

  Publish (events);
}

void
Game::SubmitReveal (const uint256& id, const std::string& caller,
                    const unsigned round, const proto::RevealCredential& cred)
{
  EventList events;
  {
    auto lock = locks.Acquire (id);

    RoundController ctrl(db, verifier);
    const CheckedReveal rev = ctrl.Check (id, caller, round, cred);

    SQLiteTransaction tx(db, "reveal");
    ctrl.Record (rev, events);
    tx.Commit ();
  }

  Publish (events);
}

void
Game::SettleRound (const uint256& id, const unsigned round)
{
  EventList events;
  {
    auto lock = locks.Acquire (id);
    SQLiteTransaction tx(db, "settleround");
    Settlement (db, ledger).SettleRound (id, round, events);
    tx.Commit ();
  }

  Publish (events);
}

void
Game::SettleMatch (const uint256& id)
{
  EventList events;
  {
    auto lock = locks.Acquire (id);
    SQLiteTransaction tx(db, "settlematch");
    Settlement (db, ledger).SettleMatch (id, events);
    tx.Commit ();
  }

  Publish (events);
}

} // namespace lastchair
