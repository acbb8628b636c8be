// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hex.hpp"

#include <glog/logging.h>

#include <cstdint>

namespace lastchair
{

namespace
{

bool
ParseHexDigit (const char digit, uint_fast8_t& target)
{
  if (digit >= '0' && digit <= '9')
    {
      target = (digit - '0');
      return true;
    }

  if (digit >= 'a' && digit <= 'f')
    {
      target = 0xA + (digit - 'a');
      return true;
    }
  if (digit >= 'A' && digit <= 'F')
    {
      target = 0xA + (digit - 'A');
      return true;
    }

  VLOG (1) << "Invalid hex digit: '" << digit << "'";
  return false;
}

} // anonymous namespace

std::string
EncodeHex (const std::string& data)
{
  static constexpr char DIGITS[] = "0123456789abcdef";

  std::string result(data.size () * 2, 'x');
  for (size_t i = 0; i < data.size (); ++i)
    {
      const uint8_t val = static_cast<uint8_t> (data[i]);
      result[2 * i] = DIGITS[val >> 4];
      result[2 * i + 1] = DIGITS[val % 0x10];
    }
  return result;
}

bool
DecodeHex (const std::string& hex, std::string& data)
{
  if (hex.size () % 2 != 0)
    {
      VLOG (1) << "Hex string has odd length: " << hex;
      return false;
    }

  std::string res(hex.size () / 2, '\0');
  for (size_t i = 0; i < res.size (); ++i)
    {
      uint_fast8_t hi, lo;
      if (!ParseHexDigit (hex[2 * i], hi)
            || !ParseHexDigit (hex[2 * i + 1], lo))
        return false;
      res[i] = static_cast<char> ((hi << 4) | lo);
    }

  data = std::move (res);
  return true;
}

std::string
StripHexPrefix (const std::string& hex)
{
  if (hex.size () >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
    return hex.substr (2);
  return hex;
}

} // namespace lastchair
