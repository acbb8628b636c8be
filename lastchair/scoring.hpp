// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_SCORING_HPP
#define LASTCHAIR_SCORING_HPP

#include "rules.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace lastchair
{

/**
 * Fixed-point scale of scores.  A stored score of S corresponds to one
 * real point, which lets a trapped player's 0.25x multiplier stay integral.
 */
constexpr int64_t SCORE_SCALE = 4;

/** Multiplier on the chair value for a player who was trapped (0.25x).  */
constexpr int64_t TRAPPED_MULTIPLIER = 1;

/** Bonus (in scaled units) for trapping the opponent.  */
constexpr int64_t TRAP_BONUS = SCORE_SCALE * 8;

/**
 * A score in scaled units (real points times SCORE_SCALE).  This is kept
 * as a distinct type so that scaled and real values cannot be mixed up
 * by accident.  Conversion to real points is done only through
 * ScaledToReal when presenting values.
 */
class ScaledScore final
{

private:

  int64_t value = 0;

public:

  ScaledScore () = default;
  ScaledScore (const ScaledScore&) = default;
  ScaledScore& operator= (const ScaledScore&) = default;

  explicit constexpr ScaledScore (const int64_t v)
    : value(v)
  {}

  constexpr int64_t
  GetScaled () const
  {
    return value;
  }

  ScaledScore&
  operator+= (const ScaledScore& o)
  {
    value += o.value;
    return *this;
  }

  friend ScaledScore
  operator+ (ScaledScore a, const ScaledScore& b)
  {
    a += b;
    return a;
  }

  friend bool
  operator== (const ScaledScore& a, const ScaledScore& b)
  {
    return a.value == b.value;
  }

  friend bool
  operator!= (const ScaledScore& a, const ScaledScore& b)
  {
    return !(a == b);
  }

  friend bool
  operator< (const ScaledScore& a, const ScaledScore& b)
  {
    return a.value < b.value;
  }

  friend bool
  operator> (const ScaledScore& a, const ScaledScore& b)
  {
    return b < a;
  }

};

std::ostream& operator<< (std::ostream& out, const ScaledScore& s);

/**
 * Converts a scaled score to real points.  This is meant only for
 * presentation to users, never for further computations.
 */
double ScaledToReal (const ScaledScore& s);

/**
 * How a round turned out in terms of traps.
 */
enum class RoundOutcome
{
  BOTH_SAFE,
  A_TRAPPED,
  B_TRAPPED,
  BOTH_TRAPPED,
};

std::string RoundOutcomeToString (RoundOutcome o);

/**
 * The scores of both players in a single round.
 */
struct RoundScore
{
  ScaledScore a;
  ScaledScore b;
  RoundOutcome outcome;
};

/**
 * Returns true if the position is one of the given traps.
 */
bool IsTrapped (unsigned position, const Traps& traps);

/**
 * Computes the round scores from the revealed values.  Each player's chair
 * is checked against the opponent's traps.  A safe player scores
 * chair * SCORE_SCALE, a trapped one chair * TRAPPED_MULTIPLIER, and each
 * player whose opponent got trapped earns TRAP_BONUS on top.
 */
RoundScore ScoreRound (unsigned chairA, const Traps& trapsB,
                       unsigned chairB, const Traps& trapsA);

} // namespace lastchair

#endif // LASTCHAIR_SCORING_HPP
