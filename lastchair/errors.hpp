// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_ERRORS_HPP
#define LASTCHAIR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace lastchair
{

/**
 * The distinct reasons for which a game operation can be rejected.
 */
enum class ErrorKind
{

  /** The caller is not allowed to do this (e.g. not a player).  */
  UNAUTHORISED,

  /** The match or round is not in the state the operation requires.  */
  STATE_MISMATCH,

  /** The action has already been done and cannot be repeated.  */
  DUPLICATE_ACTION,

  /** A value does not match what was fixed before (e.g. the stake).  */
  VALUE_MISMATCH,

  /** Arguments are malformed or out of range.  */
  VALIDATION_FAILURE,

  /** The reveal credential was rejected.  */
  CRYPTO_FAILURE,

  /** The match does not exist.  */
  NOT_FOUND,

  /** The ledger could not lock the required funds.  */
  INSUFFICIENT_FUNDS,

};

/**
 * Returns a stable string name of the error kind.
 */
std::string ErrorKindToString (ErrorKind k);

/**
 * Exception thrown when a game operation is rejected.  Operations check
 * all preconditions before mutating anything, so when this is thrown,
 * no state has changed.
 */
class GameError : public std::runtime_error
{

private:

  /** The kind of error.  */
  const ErrorKind kind;

public:

  explicit GameError (const ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind(k)
  {}

  ErrorKind
  GetKind () const
  {
    return kind;
  }

};

} // namespace lastchair

#endif // LASTCHAIR_ERRORS_HPP
