// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_MOVEPROCESSOR_HPP
#define LASTCHAIR_MOVEPROCESSOR_HPP

#include "game.hpp"

#include <json/json.h>

#include <functional>
#include <string>

namespace lastchair
{

/**
 * Parses moves given as JSON and forwards them to the Game.  A move is
 * an object with the caller's "name" and the actual "move", which is
 * either a single operation or an array of them.  Invalid operations
 * and operations rejected by the game are logged and otherwise ignored.
 */
class MoveProcessor
{

private:

  /** The game to which operations are forwarded.  */
  Game& game;

  /** Number of operations the game has accepted.  */
  unsigned accepted = 0;

  /** Number of operations that were invalid or rejected.  */
  unsigned rejected = 0;

  /**
   * Runs a game operation, catching and logging GameError.
   */
  void Execute (const std::string& what, const std::function<void ()>& op);

  /**
   * Marks an operation as invalid and logs a warning about it.
   */
  void Invalid (const std::string& what, const Json::Value& op);

  void HandleOperation (const std::string& name, const Json::Value& mv);

  /**
   * Handles a start-match operation, i.e. a move's "s" part.
   */
  void HandleStart (const std::string& name, const Json::Value& op);

  /**
   * Handles a reveal operation, i.e. a move's "r" part.
   */
  void HandleReveal (const std::string& name, const Json::Value& op);

  /**
   * Handles a settle-round operation ("sr").
   */
  void HandleSettleRound (const std::string& name, const Json::Value& op);

  /**
   * Handles a settle-match operation ("sm").
   */
  void HandleSettleMatch (const std::string& name, const Json::Value& op);

public:

  explicit MoveProcessor (Game& g)
    : game(g)
  {}

  MoveProcessor () = delete;
  MoveProcessor (const MoveProcessor&) = delete;
  void operator= (const MoveProcessor&) = delete;

  /**
   * Processes a single move object with name and move.
   */
  void ProcessOne (const Json::Value& obj);

  /**
   * Processes an array of moves in order.
   */
  void ProcessAll (const Json::Value& moves);

  unsigned
  GetNumAccepted () const
  {
    return accepted;
  }

  unsigned
  GetNumRejected () const
  {
    return rejected;
  }

};

} // namespace lastchair

#endif // LASTCHAIR_MOVEPROCESSOR_HPP
