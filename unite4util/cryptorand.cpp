// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "cryptorand.hpp"

#include <glog/logging.h>

#include <openssl/rand.h>

#include <vector>

namespace unite4
{

namespace
{

/**
 * The alphabet for session IDs.  It has exactly 64 characters, so that
 * each random byte maps uniformly onto it by masking.
 */
constexpr const char* ID_ALPHABET
    = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-";

} // anonymous namespace

std::string
CryptoRand::GetBytes (const size_t n)
{
  std::vector<unsigned char> bytes(n);
  if (n > 0)
    CHECK_EQ (RAND_bytes (bytes.data (), n), 1);

  return std::string (bytes.begin (), bytes.end ());
}

std::string
CryptoRand::NewSessionId (const size_t len)
{
  const std::string bytes = GetBytes (len);

  std::string res;
  res.reserve (len);
  for (const char c : bytes)
    res.push_back (ID_ALPHABET[static_cast<unsigned char> (c) & 0x3F]);

  return res;
}

} // namespace unite4
