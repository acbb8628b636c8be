// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "errors.hpp"

#include <glog/logging.h>

namespace lastchair
{

std::string
ErrorKindToString (const ErrorKind k)
{
  switch (k)
    {
    case ErrorKind::UNAUTHORISED:
      return "unauthorised";
    case ErrorKind::STATE_MISMATCH:
      return "state mismatch";
    case ErrorKind::DUPLICATE_ACTION:
      return "duplicate action";
    case ErrorKind::VALUE_MISMATCH:
      return "value mismatch";
    case ErrorKind::VALIDATION_FAILURE:
      return "validation failure";
    case ErrorKind::CRYPTO_FAILURE:
      return "cryptographic failure";
    case ErrorKind::NOT_FOUND:
      return "not found";
    case ErrorKind::INSUFFICIENT_FUNDS:
      return "insufficient funds";
    }

  LOG (FATAL) << "Invalid error kind: " << static_cast<int> (k);
}

} // namespace lastchair
