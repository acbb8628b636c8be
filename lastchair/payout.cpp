// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "payout.hpp"

#include <glog/logging.h>

namespace lastchair
{

std::string
FeeTierToString (const FeeTier t)
{
  switch (t)
    {
    case FeeTier::TIE:
      return "tie";
    case FeeTier::CLOSE:
      return "close";
    case FeeTier::DECISIVE:
      return "decisive";
    }

  LOG (FATAL) << "Invalid fee tier: " << static_cast<int> (t);
}

int64_t
ComputeSplitBps (const ScaledScore& a, const ScaledScore& b)
{
  CHECK_GE (a.GetScaled (), 0);
  CHECK_GE (b.GetScaled (), 0);

  const int64_t total = a.GetScaled () + b.GetScaled ();
  if (total == 0)
    return EVEN_SPLIT_BPS;

  return (a.GetScaled () * BPS_TOTAL) / total;
}

Payout
ComputePayout (const Amount stake, const ScaledScore& a, const ScaledScore& b)
{
  CHECK_GT (stake, 0);
  CHECK_LE (stake, MAX_STAKE);

  Payout res;
  res.pot = 2 * stake;
  res.splitBps = ComputeSplitBps (a, b);

  const Amount grossA = (res.pot * res.splitBps) / BPS_TOTAL;
  const Amount grossB = res.pot - grossA;

  if ((a + b).GetScaled () == 0)
    res.tier = FeeTier::TIE;
  else if (res.splitBps >= CLOSE_GAME_MIN_BPS
              && res.splitBps <= CLOSE_GAME_MAX_BPS)
    res.tier = FeeTier::CLOSE;
  else
    res.tier = FeeTier::DECISIVE;

  switch (res.tier)
    {
    case FeeTier::TIE:
    case FeeTier::CLOSE:
      {
        const Amount feeEach = res.pot / SHARED_FEE_DIVISOR;
        res.payoutA = grossA - feeEach;
        res.payoutB = grossB - feeEach;
        break;
      }

    case FeeTier::DECISIVE:
      {
        /* Outside the close band the split is never even, so there is
           always a strict winner by score.  */
        const Amount fee = res.pot / WINNER_FEE_DIVISOR;
        CHECK (a != b);
        if (a > b)
          {
            res.payoutA = grossA - fee;
            res.payoutB = grossB;
          }
        else
          {
            res.payoutA = grossA;
            res.payoutB = grossB - fee;
          }
        break;
      }
    }

  CHECK_GE (res.payoutA, 0);
  CHECK_GE (res.payoutB, 0);
  res.fee = res.pot - res.payoutA - res.payoutB;
  CHECK_GE (res.fee, 0);

  return res;
}

} // namespace lastchair
