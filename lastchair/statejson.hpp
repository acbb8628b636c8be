// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_STATEJSON_HPP
#define LASTCHAIR_STATEJSON_HPP

#include <chairdb/database.hpp>
#include <chairutil/uint256.hpp>

#include <json/json.h>

#include <string>

namespace lastchair
{

class MatchData;
class RoundData;

/**
 * Extracts parts of the game state from the database as JSON.  This is
 * the public read interface of the game.  It does not modify anything.
 *
 * Each call reads through an SQLiteReadView, so it sees the state between
 * operations and never a partially applied one.  Calls must not be made
 * while the same thread has a transaction open.
 */
class StateJsonExtractor
{

private:

  /** The underlying database.  */
  SQLiteDatabase& db;

  /**
   * Converts a match to JSON, without its rounds.
   */
  static Json::Value MatchToJson (const MatchData& m);

  /**
   * Converts a round to JSON.
   */
  static Json::Value RoundToJson (const RoundData& r);

public:

  explicit StateJsonExtractor (SQLiteDatabase& d)
    : db(d)
  {}

  StateJsonExtractor () = delete;
  StateJsonExtractor (const StateJsonExtractor&) = delete;
  void operator= (const StateJsonExtractor&) = delete;

  /**
   * Returns the data of a match.  Throws GameError (NOT_FOUND) if there is
   * no match with that ID.
   */
  Json::Value GetMatch (const uint256& id) const;

  /**
   * Returns the data of one round of a match.
   */
  Json::Value GetRound (const uint256& id, unsigned round) const;

  /**
   * Returns the commitment a player submitted for a round as hex string,
   * or null if the player has none in that match.  Throws
   * GameError (NOT_FOUND) if the match does not exist.
   */
  Json::Value GetCommitment (const uint256& id, const std::string& player,
                             unsigned round) const;

  /**
   * Returns all matches with their rounds.  This is mainly meant for
   * testing and debugging.
   */
  Json::Value FullState () const;

};

} // namespace lastchair

#endif // LASTCHAIR_STATEJSON_HPP
