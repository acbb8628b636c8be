// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_LIFECYCLE_HPP
#define LASTCHAIR_LIFECYCLE_HPP

#include "database.hpp"
#include "events.hpp"
#include "ledger.hpp"
#include "rules.hpp"

#include <chairdb/database.hpp>
#include <chairutil/uint256.hpp>

#include <string>

namespace lastchair
{

/**
 * Creation and activation of matches.  The first player to call StartMatch
 * for a match ID creates it and waits, the second one joins and thereby
 * starts the match.
 *
 * Methods of this class must be called inside a database transaction and
 * while holding the lock of the match.
 */
class MatchLifecycle
{

private:

  /** The game database.  */
  SQLiteDatabase& db;

  /** Ledger used to lock stakes.  */
  Ledger& ledger;

  /**
   * Creates a new match with the caller as first player.
   */
  void CreateMatch (const uint256& id, const std::string& caller,
                    Amount stake, const Commitments& c, EventList& events);

  /**
   * Joins the caller as second player into an existing match, starting it.
   */
  void JoinMatch (MatchData& m, const std::string& caller, Amount stake,
                  const Commitments& c, EventList& events);

public:

  explicit MatchLifecycle (SQLiteDatabase& d, Ledger& l)
    : db(d), ledger(l)
  {}

  MatchLifecycle () = delete;
  MatchLifecycle (const MatchLifecycle&) = delete;
  void operator= (const MatchLifecycle&) = delete;

  /**
   * Processes a StartMatch call.  Throws GameError if any precondition
   * fails, in which case nothing has been changed.
   */
  void StartMatch (const uint256& id, const std::string& caller, Amount stake,
                   const Commitments& c, EventList& events);

};

} // namespace lastchair

#endif // LASTCHAIR_LIFECYCLE_HPP
