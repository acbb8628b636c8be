// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "moveprocessor.hpp"

#include "errors.hpp"

#include <chairutil/hex.hpp>

#include <glog/logging.h>

namespace lastchair
{

namespace
{

/**
 * Parses a match ID (or commitment) from a hex string.
 */
bool
Uint256FromJson (const Json::Value& val, uint256& res)
{
  if (!val.isString ())
    return false;
  return res.FromHex (val.asString ());
}

/**
 * Parses raw bytes from a hex string with optional 0x prefix.
 */
bool
BytesFromJson (const Json::Value& val, std::string& res)
{
  if (!val.isString ())
    return false;
  return DecodeHex (StripHexPrefix (val.asString ()), res);
}

bool
RoundFromJson (const Json::Value& val, unsigned& res)
{
  if (!val.isUInt ())
    return false;
  res = val.asUInt ();
  return true;
}

} // anonymous namespace

void
MoveProcessor::Execute (const std::string& what,
                        const std::function<void ()>& op)
{
  try
    {
      op ();
      ++accepted;
    }
  catch (const GameError& exc)
    {
      ++rejected;
      LOG (WARNING)
          << what << " rejected (" << ErrorKindToString (exc.GetKind ())
          << "): " << exc.what ();
    }
}

void
MoveProcessor::Invalid (const std::string& what, const Json::Value& op)
{
  ++rejected;
  LOG (WARNING) << "Invalid " << what << " operation: " << op;
}

void
MoveProcessor::HandleOperation (const std::string& name, const Json::Value& mv)
{
  CHECK (mv.isObject ());
  if (mv.size () != 1)
    {
      Invalid ("game", mv);
      return;
    }

  if (mv.isMember ("s"))
    HandleStart (name, mv["s"]);
  else if (mv.isMember ("r"))
    HandleReveal (name, mv["r"]);
  else if (mv.isMember ("sr"))
    HandleSettleRound (name, mv["sr"]);
  else if (mv.isMember ("sm"))
    HandleSettleMatch (name, mv["sm"]);
  else
    Invalid ("game", mv);
}

void
MoveProcessor::HandleStart (const std::string& name, const Json::Value& op)
{
  if (!op.isObject () || op.size () != 3)
    {
      Invalid ("start", op);
      return;
    }

  uint256 id;
  if (!Uint256FromJson (op["id"], id))
    {
      Invalid ("start", op);
      return;
    }

  /* Range checks of the stake are left to the game, so that they get
     reported with the proper error kind.  */
  const auto& stakeVal = op["stake"];
  if (!stakeVal.isInt64 ())
    {
      Invalid ("start", op);
      return;
    }
  const Amount stake = stakeVal.asInt64 ();

  const auto& commitmentsVal = op["c"];
  if (!commitmentsVal.isArray () || commitmentsVal.size () != NUM_ROUNDS)
    {
      Invalid ("start", op);
      return;
    }
  Commitments c;
  for (unsigned i = 0; i < NUM_ROUNDS; ++i)
    if (!Uint256FromJson (commitmentsVal[i], c[i]))
      {
        Invalid ("start", op);
        return;
      }

  Execute ("StartMatch by " + name, [&] ()
    {
      game.StartMatch (id, name, stake, c);
    });
}

void
MoveProcessor::HandleReveal (const std::string& name, const Json::Value& op)
{
  if (!op.isObject () || op.size () != 4)
    {
      Invalid ("reveal", op);
      return;
    }

  uint256 id;
  unsigned round;
  if (!Uint256FromJson (op["id"], id) || !RoundFromJson (op["round"], round))
    {
      Invalid ("reveal", op);
      return;
    }

  proto::RevealCredential cred;
  std::string proof;
  if (!BytesFromJson (op["proof"], proof))
    {
      Invalid ("reveal", op);
      return;
    }
  cred.set_proof (proof);

  const auto& inputsVal = op["inputs"];
  if (!inputsVal.isArray ())
    {
      Invalid ("reveal", op);
      return;
    }
  for (const auto& in : inputsVal)
    {
      std::string bytes;
      if (!BytesFromJson (in, bytes))
        {
          Invalid ("reveal", op);
          return;
        }
      cred.add_public_inputs (bytes);
    }

  Execute ("Reveal by " + name, [&] ()
    {
      game.SubmitReveal (id, name, round, cred);
    });
}

void
MoveProcessor::HandleSettleRound (const std::string& name,
                                  const Json::Value& op)
{
  if (!op.isObject () || op.size () != 2)
    {
      Invalid ("settle-round", op);
      return;
    }

  uint256 id;
  unsigned round;
  if (!Uint256FromJson (op["id"], id) || !RoundFromJson (op["round"], round))
    {
      Invalid ("settle-round", op);
      return;
    }

  Execute ("SettleRound by " + name, [&] ()
    {
      game.SettleRound (id, round);
    });
}

void
MoveProcessor::HandleSettleMatch (const std::string& name,
                                  const Json::Value& op)
{
  if (!op.isObject () || op.size () != 1)
    {
      Invalid ("settle-match", op);
      return;
    }

  uint256 id;
  if (!Uint256FromJson (op["id"], id))
    {
      Invalid ("settle-match", op);
      return;
    }

  Execute ("SettleMatch by " + name, [&] ()
    {
      game.SettleMatch (id);
    });
}

void
MoveProcessor::ProcessOne (const Json::Value& obj)
{
  if (!obj.isObject () || !obj["name"].isString ())
    {
      ++rejected;
      LOG (WARNING) << "Invalid move object: " << obj;
      return;
    }
  const std::string name = obj["name"].asString ();

  const auto& mv = obj["move"];

  if (mv.isObject ())
    HandleOperation (name, mv);
  else if (mv.isArray ())
    {
      for (const auto& op : mv)
        {
          if (op.isObject ())
            HandleOperation (name, op);
          else
            Invalid ("array-element", op);
        }
    }
  else
    Invalid ("move", mv);
}

void
MoveProcessor::ProcessAll (const Json::Value& moves)
{
  CHECK (moves.isArray ());
  LOG_IF (INFO, !moves.empty ())
      << "Processing " << moves.size () << " moves...";
  for (const auto& mv : moves)
    ProcessOne (mv);
}

} // namespace lastchair
