// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_REVEAL_HPP
#define LASTCHAIR_REVEAL_HPP

#include "database.hpp"
#include "events.hpp"
#include "rules.hpp"
#include "verifier.hpp"

#include "proto/credential.pb.h"

#include <chairdb/database.hpp>
#include <chairutil/uint256.hpp>

#include <string>

namespace lastchair
{

/**
 * A reveal that has been fully checked (including the credential) and
 * only needs to be recorded.
 */
struct CheckedReveal
{
  uint256 matchId;
  unsigned round;
  Side side;
  std::string player;
  Selection selection;
};

/**
 * Handles the reveals of chair and traps for rounds.
 *
 * Processing a reveal is split into two steps:  Check validates the reveal
 * and runs the verifier, without changing anything in the database.  It
 * reads through its own SQLiteReadView, so it must be called with the match
 * lock held but outside of any transaction.  Record then writes the reveal,
 * and must be called inside a transaction (with the lock still held).
 */
class RoundController
{

private:

  /** The game database.  */
  SQLiteDatabase& db;

  /** The verifier for reveal credentials.  */
  const RevealVerifier& verifier;

public:

  explicit RoundController (SQLiteDatabase& d, const RevealVerifier& v)
    : db(d), verifier(v)
  {}

  RoundController () = delete;
  RoundController (const RoundController&) = delete;
  void operator= (const RoundController&) = delete;

  /**
   * Checks a reveal and returns the data to record.  Throws GameError if
   * the reveal is not valid.
   */
  CheckedReveal Check (const uint256& id, const std::string& caller,
                       unsigned round, const proto::RevealCredential& cred);

  /**
   * Records a checked reveal in the round.
   */
  void Record (const CheckedReveal& r, EventList& events);

};

} // namespace lastchair

#endif // LASTCHAIR_REVEAL_HPP
