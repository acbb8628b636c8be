// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "uint256.hpp"

#include "hex.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace lastchair
{

/** Number of trailing bytes that hold a 64-bit scalar.  */
constexpr size_t SCALAR_BYTES = sizeof (uint64_t);

std::string
uint256::ToHex () const
{
  return EncodeHex (GetBinaryString ());
}

bool
uint256::FromHex (const std::string& hex)
{
  std::string digits = StripHexPrefix (hex);
  if (digits.empty () || digits.size () > NUM_BYTES * 2)
    {
      LOG (WARNING) << "Invalid-sized string for uint256: " << hex;
      return false;
    }

  digits = std::string (NUM_BYTES * 2 - digits.size (), '0') + digits;

  std::string bytes;
  if (!DecodeHex (digits, bytes))
    {
      LOG (WARNING) << "Invalid hex string for uint256: " << hex;
      return false;
    }

  CHECK_EQ (bytes.size (), NUM_BYTES);
  return FromBinaryString (bytes);
}

std::string
uint256::GetBinaryString () const
{
  return std::string (reinterpret_cast<const char*> (GetBlob ()), NUM_BYTES);
}

void
uint256::FromBlob (const unsigned char* blob)
{
  std::copy (blob, blob + NUM_BYTES, data.data ());
}

bool
uint256::FromBinaryString (const std::string& str)
{
  if (str.size () != NUM_BYTES)
    return false;

  FromBlob (reinterpret_cast<const unsigned char*> (str.data ()));
  return true;
}

void
uint256::FromScalar (uint64_t val)
{
  SetNull ();
  for (size_t i = 0; i < SCALAR_BYTES; ++i)
    {
      data[NUM_BYTES - 1 - i] = val & 0xFF;
      val >>= 8;
    }
}

bool
uint256::ToScalar (uint64_t& val) const
{
  const auto scalarStart = data.end () - SCALAR_BYTES;
  if (!std::all_of (data.begin (), scalarStart,
                    [] (const Array::value_type b) { return b == 0; }))
    return false;

  val = 0;
  for (auto it = scalarStart; it != data.end (); ++it)
    val = (val << 8) | *it;

  return true;
}

bool
uint256::IsNull () const
{
  return std::all_of (data.begin (), data.end (),
                      [] (const Array::value_type val) { return val == 0; });
}

void
uint256::SetNull ()
{
  std::fill (data.begin (), data.end (), 0);
}

} // namespace lastchair
