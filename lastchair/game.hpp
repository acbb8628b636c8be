// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_GAME_HPP
#define LASTCHAIR_GAME_HPP

#include "database.hpp"
#include "events.hpp"
#include "ledger.hpp"
#include "matchlocks.hpp"
#include "rules.hpp"
#include "verifier.hpp"

#include "proto/credential.pb.h"

#include <chairdb/database.hpp>
#include <chairutil/uint256.hpp>

#include <string>

namespace lastchair
{

/**
 * The entry point for all state-changing game operations.  Each operation
 * holds the lock of its match while it checks and applies its changes in
 * a single database transaction.  The resulting events are published
 * after the transaction has been committed and the match lock released,
 * so that sinks may themselves call back into the game.
 *
 * If an operation is rejected, GameError is thrown and nothing changes.
 * This class is thread-safe.
 */
class Game
{

private:

  SQLiteDatabase& db;
  Ledger& ledger;
  const RevealVerifier& verifier;
  EventSink& sink;

  /** Locks of the matches currently being processed.  */
  MatchLocks locks;

  /**
   * Publishes the given events to the sink.
   */
  void Publish (const EventList& events);

public:

  explicit Game (SQLiteDatabase& d, Ledger& l, const RevealVerifier& v,
                 EventSink& s)
    : db(d), ledger(l), verifier(v), sink(s)
  {}

  Game () = delete;
  Game (const Game&) = delete;
  void operator= (const Game&) = delete;

  /**
   * Creates or joins the match with the given ID, locking the stake and
   * submitting commitments for all rounds.
   */
  void StartMatch (const uint256& id, const std::string& caller, Amount stake,
                   const Commitments& c);

  /**
   * Reveals the caller's chair and traps for a round.
   */
  void SubmitReveal (const uint256& id, const std::string& caller,
                     unsigned round, const proto::RevealCredential& cred);

  void SettleRound (const uint256& id, unsigned round);
  void SettleMatch (const uint256& id);

};

} // namespace lastchair

#endif // LASTCHAIR_GAME_HPP
