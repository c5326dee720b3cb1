// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef UNITE4UTIL_CRYPTORAND_HPP
#define UNITE4UTIL_CRYPTORAND_HPP

#include <cstddef>
#include <string>

namespace unite4
{

/**
 * Generator for secure random data.  It is used to create fresh session
 * paths for new games, which must not be guessable by third parties.
 */
class CryptoRand
{

public:

  /** Length of session IDs returned by NewSessionId by default.  */
  static constexpr size_t DEFAULT_ID_LENGTH = 21;

  CryptoRand () = default;

  CryptoRand (const CryptoRand&) = delete;
  void operator= (const CryptoRand&) = delete;

  /**
   * Returns the given number of random bytes.
   */
  std::string GetBytes (size_t n);

  /**
   * Returns a random ID consisting of URL-safe characters
   * (A-Z, a-z, 0-9, '_' and '-').
   */
  std::string NewSessionId (size_t len = DEFAULT_ID_LENGTH);

};

} // namespace unite4

#endif // UNITE4UTIL_CRYPTORAND_HPP
