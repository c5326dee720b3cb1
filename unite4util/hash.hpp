// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef UNITE4UTIL_HASH_HPP
#define UNITE4UTIL_HASH_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace unite4
{

/**
 * Incremental SHA-256 hasher.  This is used to compute the IDs of relay
 * events, which are the hash of their canonical serialisation.
 */
class SHA256
{

private:

  /**
   * Holder for the internal state.  The OpenSSL context is kept out of
   * the header so that users do not depend on it.
   */
  class State;

  /** The underlying current state of the hasher.  */
  std::unique_ptr<State> state;

public:

  /** Length of a digest in bytes.  */
  static constexpr size_t DIGEST_BYTES = 32;

  SHA256 ();
  ~SHA256 ();

  SHA256 (const SHA256&) = delete;
  void operator= (const SHA256&) = delete;

  SHA256& operator<< (const std::string& data);

  /**
   * Finalises the hash and returns the raw digest bytes.  After this has
   * been called, no more operations on the instance are allowed.
   */
  std::string Finalise ();

  /**
   * Returns the raw digest of the given data.
   */
  static std::string Hash (const std::string& data);

};

} // namespace unite4

#endif // UNITE4UTIL_HASH_HPP
