// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_SETTLEMENT_HPP
#define LASTCHAIR_SETTLEMENT_HPP

#include "events.hpp"
#include "ledger.hpp"

#include <chairdb/database.hpp>
#include <chairutil/uint256.hpp>

namespace lastchair
{

/**
 * Scoring of revealed rounds and final payout of matches.  Anyone may
 * trigger these once the match is ready for it.
 *
 * Methods must be called inside a transaction while holding the match lock.
 */
class Settlement
{

private:

  /** The game database.  */
  SQLiteDatabase& db;

  /** Ledger used to pay out the pot.  */
  Ledger& ledger;

public:

  explicit Settlement (SQLiteDatabase& d, Ledger& l)
    : db(d), ledger(l)
  {}

  Settlement () = delete;
  Settlement (const Settlement&) = delete;
  void operator= (const Settlement&) = delete;

  /**
   * Scores the given round, which must be the match's current round with
   * both reveals in.  The scores are added to the match totals.
   */
  void SettleRound (const uint256& id, unsigned round, EventList& events);

  /**
   * Pays out the pot of a match whose last round has been scored, and
   * finishes the match.
   */
  void SettleMatch (const uint256& id, EventList& events);

};

} // namespace lastchair

#endif // LASTCHAIR_SETTLEMENT_HPP
