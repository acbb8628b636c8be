// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <limits>
#include <sstream>

namespace lastchair
{

void
SQLiteLedger::SetBalance (const std::string& name, const Amount balance)
{
  CHECK_GE (balance, 0);

  if (balance == 0)
    {
      auto stmt = db.Prepare (R"(
        DELETE FROM `balances`
          WHERE `name` = ?1
      )");
      stmt.Bind (1, name);
      stmt.Execute ();
    }
  else
    {
      auto stmt = db.Prepare (R"(
        INSERT OR REPLACE INTO `balances`
            (`name`, `balance`)
            VALUES (?1, ?2)
      )");
      stmt.Bind (1, name);
      stmt.Bind<int64_t> (2, balance);
      stmt.Execute ();
    }
}

void
SQLiteLedger::UpdateCustody (const Amount delta)
{
  const Amount newCustody = GetCustody () + delta;
  CHECK_GE (newCustody, 0) << "Custody would become negative";

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `custody`
        (`id`, `amount`)
        VALUES (1, ?1)
  )");
  stmt.Bind<int64_t> (1, newCustody);
  stmt.Execute ();
}

void
SQLiteLedger::Lock (const std::string& payer, const Amount amount)
{
  CHECK_GT (amount, 0);

  const Amount balance = GetBalance (payer);
  if (balance < amount)
    {
      std::ostringstream msg;
      msg << payer << " has " << balance << " and cannot lock " << amount;
      throw GameError (ErrorKind::INSUFFICIENT_FUNDS, msg.str ());
    }

  SetBalance (payer, balance - amount);
  UpdateCustody (amount);
  LOG (INFO) << "Locked " << amount << " from " << payer;
}

void
SQLiteLedger::Pay (const std::string& recipient, const Amount amount)
{
  CHECK_GT (amount, 0);
  CHECK_LE (amount, GetCustody ())
      << "Paying out more than is held in custody";

  UpdateCustody (-amount);
  Credit (recipient, amount);
  LOG (INFO) << "Paid " << amount << " to " << recipient;
}

void
SQLiteLedger::Credit (const std::string& name, const Amount amount)
{
  CHECK_GT (amount, 0);

  const Amount oldBalance = GetBalance (name);
  CHECK_LE (amount, std::numeric_limits<Amount>::max () - oldBalance)
      << "Balance of " << name << " overflows";

  SetBalance (name, oldBalance + amount);
}

Amount
SQLiteLedger::GetBalance (const std::string& name) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `balance`
      FROM `balances`
      WHERE `name` = ?1
  )");
  stmt.Bind (1, name);

  if (!stmt.Step ())
    return 0;

  const Amount res = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());

  return res;
}

Amount
SQLiteLedger::GetCustody () const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `amount`
      FROM `custody`
  )");

  if (!stmt.Step ())
    return 0;

  const Amount res = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());

  return res;
}

} // namespace lastchair
