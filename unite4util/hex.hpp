// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef UNITE4UTIL_HEX_HPP
#define UNITE4UTIL_HEX_HPP

#include <string>

namespace unite4
{

/**
 * Encodes binary data as lower-case hex string.
 */
std::string EncodeHex (const std::string& data);

/**
 * Decodes a hex string (upper or lower case) into binary data.  Returns
 * false if the string has odd length or contains invalid characters.
 */
bool DecodeHex (const std::string& hex, std::string& data);

} // namespace unite4

#endif // UNITE4UTIL_HEX_HPP
