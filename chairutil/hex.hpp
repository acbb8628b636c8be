// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAIRUTIL_HEX_HPP
#define CHAIRUTIL_HEX_HPP

#include <string>

namespace lastchair
{

/**
 * Converts a string of raw bytes to lower-case hex.
 */
std::string EncodeHex (const std::string& data);

/**
 * Decodes a hex string (without any prefix) into raw bytes.  Returns false
 * if the string has odd length or contains invalid characters.
 */
bool DecodeHex (const std::string& hex, std::string& data);

/**
 * Strips an optional "0x" / "0X" prefix from a hex string.  This is the
 * notation in which clients usually pass field elements around.
 */
std::string StripHexPrefix (const std::string& hex);

} // namespace lastchair

#endif // CHAIRUTIL_HEX_HPP
