// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RELAYCHANNEL_IDENTITY_HPP
#define RELAYCHANNEL_IDENTITY_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace unite4
{

/**
 * A long-lived Ed25519 keypair.  Its public key (as lower-case hex) is the
 * address under which a player publishes events to relays.  Instances are
 * created once per client and persisted externally through the private key.
 */
class Identity
{

private:

  class Key;

  /** The OpenSSL key pair, hidden from the header.  */
  std::unique_ptr<Key> key;

  /** Cached hex form of the public key.  */
  std::string pubkeyHex;

  explicit Identity (std::unique_ptr<Key> k);

public:

  /** Length of raw public and private keys in bytes.  */
  static constexpr size_t KEY_BYTES = 32;

  ~Identity ();

  Identity () = delete;
  Identity (const Identity&) = delete;
  void operator= (const Identity&) = delete;

  /**
   * Creates a fresh random identity.
   */
  static std::unique_ptr<Identity> Generate ();

  /**
   * Restores an identity from its hex-encoded private key.  Returns nullptr
   * if the string is not a valid key.
   */
  static std::unique_ptr<Identity> FromPrivateKeyHex (const std::string& hex);

  /**
   * Returns the private key as hex, suitable for persisting.
   */
  std::string GetPrivateKeyHex () const;

  const std::string&
  GetPublicKeyHex () const
  {
    return pubkeyHex;
  }

  /**
   * Signs the given data and returns the signature as hex string.
   */
  std::string Sign (const std::string& data) const;

  /**
   * Verifies a hex signature against a hex public key.  Returns false
   * for invalid signatures as well as malformed inputs.
   */
  static bool Verify (const std::string& pubkeyHex, const std::string& data,
                      const std::string& sigHex);

};

} // namespace unite4

#endif // RELAYCHANNEL_IDENTITY_HPP
