// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_PAYOUT_HPP
#define LASTCHAIR_PAYOUT_HPP

#include "rules.hpp"
#include "scoring.hpp"

#include <cstdint>
#include <string>

namespace lastchair
{

/** Basis points making up the whole.  */
constexpr int64_t BPS_TOTAL = 10'000;

/** The split reported when nobody scored.  */
constexpr int64_t EVEN_SPLIT_BPS = BPS_TOTAL / 2;

/** Inclusive bounds on side A's split for a game to count as close.  */
constexpr int64_t CLOSE_GAME_MIN_BPS = 4'500;
constexpr int64_t CLOSE_GAME_MAX_BPS = 5'500;

/**
 * Divisor of the pot for the fee charged to *each* side in a tie or
 * close game (0.5%).
 */
constexpr Amount SHARED_FEE_DIVISOR = 200;

/**
 * Divisor of the pot for the fee charged to the winner of a decisive
 * game (1%).
 */
constexpr Amount WINNER_FEE_DIVISOR = 100;

/**
 * The fee tier a finished match falls into.
 */
enum class FeeTier
{

  /** Nobody scored at all, the pot is split evenly.  */
  TIE,

  /** Side A's split is within the close-game band.  */
  CLOSE,

  /** Side A's split is outside the close-game band.  */
  DECISIVE,

};

std::string FeeTierToString (FeeTier t);

/**
 * Returns side A's share of the total score in basis points, or
 * EVEN_SPLIT_BPS if the total is zero.  Side B's share is the
 * remainder to BPS_TOTAL.
 */
int64_t ComputeSplitBps (const ScaledScore& a, const ScaledScore& b);

/**
 * Full result of settling a match.
 */
struct Payout
{

  /** Side A's split of the pot in basis points.  */
  int64_t splitBps;

  FeeTier tier;

  /** The total pot (both stakes).  */
  Amount pot;

  Amount payoutA;
  Amount payoutB;

  /** The fee retained, i.e. pot - payoutA - payoutB.  */
  Amount fee;

};

/**
 * Computes how the pot of a match with the given per-player stake is split
 * based on the cumulative scores.  Rounding remainders of the integer
 * divisions end up with side B's gross share, so that the payouts and fee
 * always add up to the pot exactly.
 */
Payout ComputePayout (Amount stake, const ScaledScore& a,
                      const ScaledScore& b);

} // namespace lastchair

#endif // LASTCHAIR_PAYOUT_HPP
