// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAIRUTIL_UINT256_HPP
#define CHAIRUTIL_UINT256_HPP

#include <array>
#include <cstdint>
#include <string>

namespace lastchair
{

/**
 * A 256-bit unsigned value stored as 32 big-endian bytes.  It is used for
 * match IDs, commitments and the scalars inside reveal credentials.  Apart
 * from conversion to/from hex, raw bytes and small integers, it can only
 * be compared.
 */
class uint256 final
{

public:

  static constexpr size_t NUM_BYTES = 256 / 8;

private:

  using Array = std::array<unsigned char, NUM_BYTES>;

  /** The raw bytes, stored as big-endian.  */
  Array data;

public:

  /**
   * Constructs a "null" (all zeros) value.
   */
  uint256 ()
  {
    SetNull ();
  }

  uint256 (const uint256&) = default;
  uint256 (uint256&&) = default;

  uint256& operator= (const uint256&) = default;
  uint256& operator= (uint256&&) = default;

  /**
   * Converts the uint256 to a lower-case, big-endian hex string with
   * all 64 digits.
   */
  std::string ToHex () const;

  /**
   * Parses a hex string as big-endian into this object.  The string may
   * optionally start with "0x" and may be shorter than 64 digits, in which
   * case it is zero-padded from the left (so "0x8" is the scalar eight).
   * Returns false if the string is empty, too long or has invalid
   * characters.
   */
  bool FromHex (const std::string& hex);

  /**
   * Returns a pointer to the data blob that holds the raw binary data.
   * Its length is NUM_BYTES.
   */
  const unsigned char*
  GetBlob () const
  {
    return data.data ();
  }

  /**
   * Returns the raw data as binary string of length NUM_BYTES.
   */
  std::string GetBinaryString () const;

  /**
   * Sets the data from a raw blob of bytes, which must be of length NUM_BYTES.
   */
  void FromBlob (const unsigned char* blob);

  /**
   * Sets the data from a binary string.  Returns false if the string does
   * not have exactly NUM_BYTES bytes.
   */
  bool FromBinaryString (const std::string& str);

  /**
   * Sets the value to the given small integer.
   */
  void FromScalar (uint64_t val);

  /**
   * Extracts the value as 64-bit integer.  Returns false if it does not
   * fit into 64 bits.
   */
  bool ToScalar (uint64_t& val) const;

  /**
   * Checks if this number is all-zeros, which is used as "null" value.
   */
  bool IsNull () const;

  /**
   * Sets the value to all-zeros, corresponding to a "null" value.
   */
  void SetNull ();

  friend bool
  operator== (const uint256& a, const uint256& b)
  {
    return a.data == b.data;
  }

  friend bool
  operator!= (const uint256& a, const uint256& b)
  {
    return !(a == b);
  }

  friend bool
  operator< (const uint256& a, const uint256& b)
  {
    return a.data < b.data;
  }

};

} // namespace lastchair

#endif // CHAIRUTIL_UINT256_HPP
