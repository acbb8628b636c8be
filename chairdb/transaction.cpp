// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "transaction.hpp"

#include <glog/logging.h>

namespace lastchair
{

SQLiteReadView::SQLiteReadView (const SQLiteDatabase& db)
  : lock(db.mutConnection)
{}

/* ************************************************************************** */

SQLiteTransaction::SQLiteTransaction (SQLiteDatabase& d, const std::string& n)
  : db(d), lock(d.mutConnection), name(n)
{
  VLOG (1) << "Starting transaction " << name;
  db.Prepare ("SAVEPOINT `" + name + "`").Execute ();
}

SQLiteTransaction::~SQLiteTransaction ()
{
  if (committed)
    return;

  LOG (INFO) << "Rolling back transaction " << name;
  db.Prepare ("ROLLBACK TO `" + name + "`").Execute ();
  db.Prepare ("RELEASE `" + name + "`").Execute ();
}

void
SQLiteTransaction::Commit ()
{
  CHECK (!committed) << "Transaction " << name << " is already committed";
  db.Prepare ("RELEASE `" + name + "`").Execute ();
  committed = true;
  VLOG (1) << "Committed transaction " << name;
}

} // namespace lastchair
