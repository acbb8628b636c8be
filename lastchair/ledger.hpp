// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_LEDGER_HPP
#define LASTCHAIR_LEDGER_HPP

#include "rules.hpp"

#include <chairdb/database.hpp>

#include <string>

namespace lastchair
{

/**
 * Interface for the custody of stakes.  Amounts are locked from a player
 * into custody when they join a match, and paid out of custody when the
 * match is settled.
 */
class Ledger
{

public:

  Ledger () = default;
  virtual ~Ledger () = default;

  Ledger (const Ledger&) = delete;
  void operator= (const Ledger&) = delete;

  /**
   * Moves the given amount from the payer into custody.  Throws a GameError
   * with INSUFFICIENT_FUNDS if the payer cannot cover it.
   */
  virtual void Lock (const std::string& payer, Amount amount) = 0;

  /**
   * Moves the given (positive) amount out of custody to the recipient.
   */
  virtual void Pay (const std::string& recipient, Amount amount) = 0;

};

/**
 * Ledger implementation that keeps balances and the custody total
 * in tables of the game database.  Changes made through it are part of
 * whatever transaction is active on the database.
 */
class SQLiteLedger : public Ledger
{

private:

  /** The underlying database.  */
  SQLiteDatabase& db;

  /**
   * Sets the balance of an account, removing the row if it is zero.
   */
  void SetBalance (const std::string& name, Amount balance);

  /**
   * Adds the given (possibly negative) value to the custody total.
   */
  void UpdateCustody (Amount delta);

public:

  explicit SQLiteLedger (SQLiteDatabase& d)
    : db(d)
  {}

  void Lock (const std::string& payer, Amount amount) override;
  void Pay (const std::string& recipient, Amount amount) override;

  /**
   * Adds funds to an account from outside the game.
   */
  void Credit (const std::string& name, Amount amount);

  /**
   * Returns the balance of an account (zero if it has none).
   */
  Amount GetBalance (const std::string& name) const;

  /**
   * Returns the total amount held in custody.
   */
  Amount GetCustody () const;

};

} // namespace lastchair

#endif // LASTCHAIR_LEDGER_HPP
