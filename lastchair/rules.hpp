// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_RULES_HPP
#define LASTCHAIR_RULES_HPP

#include <json/json.h>

#include <array>
#include <cstdint>
#include <ostream>

namespace lastchair
{

/** Number of chairs a player can pick from.  */
constexpr unsigned NUM_CHAIRS = 12;

/** Number of traps each player places per round.  */
constexpr unsigned NUM_TRAPS = 3;

/** Number of rounds in a match.  */
constexpr unsigned NUM_ROUNDS = 3;

/** Type used for stakes and payouts.  */
using Amount = int64_t;

/**
 * Largest stake accepted per player.  This keeps the basis-point arithmetic
 * on the pot (2 * stake * 10'000) inside 64 bits.
 */
constexpr Amount MAX_STAKE = 100'000'000'000'000;

/**
 * Converts an amount to JSON.
 */
Json::Value AmountToJson (Amount n);

/**
 * Parses an amount from JSON.  Returns true if the value is an integer
 * in the range [0, MAX_STAKE].
 */
bool AmountFromJson (const Json::Value& val, Amount& n);

/**
 * The two sides of a match.  Side A is the player who created the match,
 * side B the one who joined it.
 */
enum class Side
{
  A,
  B,
};

/**
 * Returns the other side.
 */
Side operator! (Side s);

std::ostream& operator<< (std::ostream& out, Side s);

/** The three trap positions of a selection.  */
using Traps = std::array<unsigned, NUM_TRAPS>;

/**
 * A player's choices for one round:  The chair they sit on and the three
 * chairs they trap for the opponent.  A value of zero for the chair (and
 * traps) is the "not yet revealed" sentinel.
 */
struct Selection
{

  unsigned chair = 0;
  Traps traps = {0, 0, 0};

  Selection () = default;
  Selection (const Selection&) = default;
  Selection& operator= (const Selection&) = default;

  explicit Selection (const unsigned c, const Traps& t)
    : chair(c), traps(t)
  {}

  /**
   * Returns true if this is the unset sentinel.
   */
  bool
  IsUnset () const
  {
    return chair == 0;
  }

  /**
   * Checks if the selection is valid, i.e. the chair and all traps are
   * in the range [1, NUM_CHAIRS], the traps are pairwise distinct and
   * the chair is not one of the traps.
   */
  bool IsValid () const;

  friend bool
  operator== (const Selection& a, const Selection& b)
  {
    return a.chair == b.chair && a.traps == b.traps;
  }

  friend bool
  operator!= (const Selection& a, const Selection& b)
  {
    return !(a == b);
  }

};

std::ostream& operator<< (std::ostream& out, const Selection& s);

/**
 * Returns true if the value is a chair on the table.
 */
bool IsChairOnTable (unsigned val);

/**
 * Returns true if the value is a valid round number.
 */
bool IsValidRound (unsigned round);

} // namespace lastchair

#endif // LASTCHAIR_RULES_HPP
