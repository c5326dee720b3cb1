// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hex.hpp"

#include <cstddef>
#include <utility>

namespace unite4
{

namespace
{

constexpr const char* HEX_DIGITS = "0123456789abcdef";

/**
 * Returns the value of a single hex digit, or -1 if it is not a hex digit.
 */
int
HexDigitValue (const char c)
{
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // anonymous namespace

std::string
EncodeHex (const std::string& data)
{
  std::string res;
  res.reserve (2 * data.size ());

  for (const char c : data)
    {
      const auto byte = static_cast<unsigned char> (c);
      res.push_back (HEX_DIGITS[byte >> 4]);
      res.push_back (HEX_DIGITS[byte & 0x0F]);
    }

  return res;
}

bool
DecodeHex (const std::string& hex, std::string& data)
{
  if (hex.size () % 2 != 0)
    return false;

  std::string res;
  res.reserve (hex.size () / 2);
  for (size_t i = 0; i < hex.size (); i += 2)
    {
      const int hi = HexDigitValue (hex[i]);
      const int lo = HexDigitValue (hex[i + 1]);
      if (hi < 0 || lo < 0)
        return false;
      res.push_back (static_cast<char> ((hi << 4) | lo));
    }

  data = std::move (res);
  return true;
}

} // namespace unite4
