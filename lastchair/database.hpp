// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_DATABASE_HPP
#define LASTCHAIR_DATABASE_HPP

#include "rules.hpp"
#include "scoring.hpp"

#include <chairdb/database.hpp>
#include <chairutil/uint256.hpp>

#include <array>
#include <memory>
#include <string>

namespace lastchair
{

/**
 * Lifecycle states of a match.  The numeric values are stored in the
 * database and must not be changed.
 */
enum class MatchStatus
{
  WAITING = 1,
  ACTIVE = 2,
  FINISHED = 3,
};

std::string MatchStatusToString (MatchStatus s);

/**
 * States of a single round.  BOTH_REVEALED means that both players have
 * revealed but the round has not yet been scored, and SCORED is final.
 * The numeric values are stored in the database.
 */
enum class RoundStatus
{
  PENDING = 1,
  REVEALED_A = 2,
  REVEALED_B = 3,
  BOTH_REVEALED = 4,
  SCORED = 5,
};

std::string RoundStatusToString (RoundStatus s);

/** The commitments a player submits for all rounds of a match.  */
using Commitments = std::array<uint256, NUM_ROUNDS>;

/* ************************************************************************** */

/**
 * Wrapper class around the state of one match in the database.  Changes
 * are written back when the instance is destructed.
 *
 * Instances of this class should be obtained through the MatchesTable.
 */
class MatchData
{

private:

  /** The underlying database.  */
  SQLiteDatabase& db;

  /** The ID of this match.  */
  uint256 id;

  /** The players, empty if not yet set.  */
  std::array<std::string, 2> players;

  /** The stake each player locks.  */
  Amount stake;

  /** The round that is settled next.  */
  unsigned currentRound;

  MatchStatus status;

  /** Cumulative scores of both players.  */
  std::array<ScaledScore, 2> scores;

  /**
   * Set to true if the data has been modified and we need to update the
   * database table in the destructor.
   */
  bool dirty;

  /**
   * Constructs a fresh instance for the given ID, which is not yet in
   * the database.
   */
  explicit MatchData (SQLiteDatabase& d, const uint256& i);

  /**
   * Constructs an instance based on the given result row.
   */
  explicit MatchData (SQLiteDatabase& d, const SQLiteDatabase::Statement& row);

  friend class MatchesTable;

public:

  /**
   * If this instance has been modified, the destructor updates the
   * database to reflect the changes.
   */
  ~MatchData ();

  MatchData () = delete;
  MatchData (const MatchData&) = delete;
  void operator= (const MatchData&) = delete;

  const uint256&
  GetId () const
  {
    return id;
  }

  const std::string& GetPlayer (Side s) const;
  void SetPlayer (Side s, const std::string& name);

  /**
   * Looks up which side the given name plays on.  Returns false if
   * the name is not one of the match's players.
   */
  bool GetSideOf (const std::string& name, Side& s) const;

  Amount
  GetStake () const
  {
    return stake;
  }

  void SetStake (Amount s);

  unsigned
  GetCurrentRound () const
  {
    return currentRound;
  }

  /**
   * Moves on to the next round, unless the current one is the last.
   */
  void AdvanceRound ();

  MatchStatus
  GetStatus () const
  {
    return status;
  }

  void SetStatus (MatchStatus s);

  const ScaledScore& GetScore (Side s) const;

  /**
   * Adds the given round result to the cumulative scores.
   */
  void AddScores (const RoundScore& sc);

};

/**
 * Utility class that handles querying and modifying the matches table in
 * the database.  This class provides MatchData instances.
 */
class MatchesTable
{

private:

  /** The underlying database instance.  */
  SQLiteDatabase& db;

public:

  /** Movable handle to a match instance.  */
  using Handle = std::unique_ptr<MatchData>;

  explicit MatchesTable (SQLiteDatabase& d)
    : db(d)
  {}

  MatchesTable () = delete;
  MatchesTable (const MatchesTable&) = delete;
  void operator= (const MatchesTable&) = delete;

  /**
   * Returns a handle for the instance based on the result row.
   */
  Handle GetFromResult (const SQLiteDatabase::Statement& row);

  /**
   * Returns a handle by ID of the match.  Returns null if no such match
   * is in the database.
   */
  Handle GetById (const uint256& id);

  /**
   * Creates a new match (in WAITING state).  It is written to the
   * database when the handle is destructed.
   */
  Handle CreateNew (const uint256& id);

  /**
   * Queries for all matches, ordered by ID.  The returned statement can be
   * walked through and used with GetFromResult.
   */
  SQLiteDatabase::Statement QueryAll ();

};

/* ************************************************************************** */

/**
 * Wrapper around the state of one round of a match in the database.
 * Like MatchData, it writes back changes in its destructor.
 */
class RoundData
{

private:

  /** The underlying database.  */
  SQLiteDatabase& db;

  /** The match this belongs to.  */
  uint256 matchId;

  /** The round number (1-based).  */
  unsigned round;

  /** The commitments of both players (null while unset).  */
  std::array<uint256, 2> commitments;

  /** The revealed selections (unset sentinel until revealed).  */
  std::array<Selection, 2> selections;

  RoundStatus status;

  /** The scores of this round, zero until scored.  */
  std::array<ScaledScore, 2> scores;

  /** Whether we need to write back changes.  */
  bool dirty;

  explicit RoundData (SQLiteDatabase& d, const uint256& id, unsigned r);
  explicit RoundData (SQLiteDatabase& d, const SQLiteDatabase::Statement& row);

  friend class RoundsTable;

public:

  ~RoundData ();

  RoundData () = delete;
  RoundData (const RoundData&) = delete;
  void operator= (const RoundData&) = delete;

  const uint256&
  GetMatchId () const
  {
    return matchId;
  }

  unsigned
  GetRound () const
  {
    return round;
  }

  const uint256& GetCommitment (Side s) const;

  /**
   * Binds the commitment of one player.  This must only be done once,
   * when the match is activated.
   */
  void SetCommitment (Side s, const uint256& c);

  const Selection& GetSelection (Side s) const;

  /**
   * Returns true if the given side has already revealed.
   */
  bool
  HasRevealed (const Side s) const
  {
    return !GetSelection (s).IsUnset ();
  }

  /**
   * Records the revealed selection of one side and advances the status
   * accordingly.  Each side can reveal only once.
   */
  void RecordReveal (Side s, const Selection& sel);

  RoundStatus
  GetStatus () const
  {
    return status;
  }

  const ScaledScore& GetScore (Side s) const;

  /**
   * Stores the scores of this round and marks it as scored.  The round
   * must have both reveals and must not have been scored before.
   */
  void SetScores (const RoundScore& sc);

};

/**
 * Utility class that handles querying and modifying the rounds table.
 */
class RoundsTable
{

private:

  /** The underlying database instance.  */
  SQLiteDatabase& db;

public:

  using Handle = std::unique_ptr<RoundData>;

  explicit RoundsTable (SQLiteDatabase& d)
    : db(d)
  {}

  RoundsTable () = delete;
  RoundsTable (const RoundsTable&) = delete;
  void operator= (const RoundsTable&) = delete;

  Handle GetFromResult (const SQLiteDatabase::Statement& row);

  /**
   * Returns the given round of a match, or null if it does not exist.
   */
  Handle Get (const uint256& matchId, unsigned round);

  /**
   * Creates a new, pending round.
   */
  Handle CreateNew (const uint256& matchId, unsigned round);

  /**
   * Queries for all rounds of a match, ordered by round number.
   */
  SQLiteDatabase::Statement QueryForMatch (const uint256& matchId);

};

/* ************************************************************************** */

/**
 * Access to the table of commitments submitted by each player at
 * match start, before they get bound to the round records.
 */
class PendingCommitments
{

private:

  /** The underlying database instance.  */
  SQLiteDatabase& db;

public:

  explicit PendingCommitments (SQLiteDatabase& d)
    : db(d)
  {}

  PendingCommitments () = delete;
  PendingCommitments (const PendingCommitments&) = delete;
  void operator= (const PendingCommitments&) = delete;

  /**
   * Stores the commitments of the given player for all rounds.
   */
  void Insert (const uint256& matchId, const std::string& player,
               const Commitments& c);

  /**
   * Retrieves the commitment of a player for one round.  Returns false if
   * there is none.
   */
  bool Get (const uint256& matchId, const std::string& player, unsigned round,
            uint256& commitment) const;

  /**
   * Retrieves the commitments of a player for all rounds.  Returns false if
   * they are not stored.
   */
  bool GetAll (const uint256& matchId, const std::string& player,
               Commitments& c) const;

};

} // namespace lastchair

#endif // LASTCHAIR_DATABASE_HPP
