// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "identity.hpp"

#include <unite4util/hex.hpp>

#include <glog/logging.h>

#include <openssl/evp.h>

#include <utility>

namespace unite4
{

namespace
{

/** Length of an Ed25519 signature in bytes.  */
constexpr size_t SIGNATURE_BYTES = 64;

/**
 * RAII wrapper for an EVP_MD_CTX used with DigestSign / DigestVerify.
 */
class DigestContext
{

private:

  EVP_MD_CTX* ctx;

public:

  DigestContext ()
    : ctx(EVP_MD_CTX_new ())
  {
    CHECK (ctx != nullptr);
  }

  ~DigestContext ()
  {
    EVP_MD_CTX_free (ctx);
  }

  DigestContext (const DigestContext&) = delete;
  void operator= (const DigestContext&) = delete;

  EVP_MD_CTX*
  Get ()
  {
    return ctx;
  }

};

const unsigned char*
AsBytes (const std::string& str)
{
  return reinterpret_cast<const unsigned char*> (str.data ());
}

} // anonymous namespace

/**
 * Owner of the underlying EVP_PKEY.
 */
class Identity::Key
{

private:

  EVP_PKEY* pkey;

public:

  explicit Key (EVP_PKEY* k)
    : pkey(k)
  {
    CHECK (pkey != nullptr);
  }

  ~Key ()
  {
    EVP_PKEY_free (pkey);
  }

  Key (const Key&) = delete;
  void operator= (const Key&) = delete;

  EVP_PKEY*
  Get () const
  {
    return pkey;
  }

};

Identity::Identity (std::unique_ptr<Key> k)
  : key(std::move (k))
{
  unsigned char raw[KEY_BYTES];
  size_t len = KEY_BYTES;
  CHECK_EQ (EVP_PKEY_get_raw_public_key (key->Get (), raw, &len), 1);
  CHECK_EQ (len, KEY_BYTES);

  pubkeyHex = EncodeHex (std::string (reinterpret_cast<const char*> (raw),
                                      len));
}

Identity::~Identity () = default;

std::unique_ptr<Identity>
Identity::Generate ()
{
  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id (EVP_PKEY_ED25519, nullptr);
  CHECK (ctx != nullptr);

  EVP_PKEY* pkey = nullptr;
  CHECK_EQ (EVP_PKEY_keygen_init (ctx), 1);
  CHECK_EQ (EVP_PKEY_keygen (ctx, &pkey), 1);
  EVP_PKEY_CTX_free (ctx);

  auto res = std::unique_ptr<Identity> (
      new Identity (std::make_unique<Key> (pkey)));
  LOG (INFO) << "Generated new identity " << res->GetPublicKeyHex ();

  return res;
}

std::unique_ptr<Identity>
Identity::FromPrivateKeyHex (const std::string& hex)
{
  std::string raw;
  if (!DecodeHex (hex, raw) || raw.size () != KEY_BYTES)
    {
      LOG (WARNING) << "Invalid private key for identity";
      return nullptr;
    }

  EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key (EVP_PKEY_ED25519, nullptr,
                                                 AsBytes (raw), raw.size ());
  if (pkey == nullptr)
    {
      LOG (WARNING) << "OpenSSL rejected the private key for identity";
      return nullptr;
    }

  return std::unique_ptr<Identity> (
      new Identity (std::make_unique<Key> (pkey)));
}

std::string
Identity::GetPrivateKeyHex () const
{
  unsigned char raw[KEY_BYTES];
  size_t len = KEY_BYTES;
  CHECK_EQ (EVP_PKEY_get_raw_private_key (key->Get (), raw, &len), 1);
  CHECK_EQ (len, KEY_BYTES);

  return EncodeHex (std::string (reinterpret_cast<const char*> (raw), len));
}

std::string
Identity::Sign (const std::string& data) const
{
  DigestContext ctx;
  CHECK_EQ (EVP_DigestSignInit (ctx.Get (), nullptr, nullptr, nullptr,
                                key->Get ()), 1);

  unsigned char sig[SIGNATURE_BYTES];
  size_t len = SIGNATURE_BYTES;
  CHECK_EQ (EVP_DigestSign (ctx.Get (), sig, &len,
                            AsBytes (data), data.size ()), 1);
  CHECK_EQ (len, SIGNATURE_BYTES);

  return EncodeHex (std::string (reinterpret_cast<const char*> (sig), len));
}

bool
Identity::Verify (const std::string& pubkeyHex, const std::string& data,
                  const std::string& sigHex)
{
  std::string pubkey, sig;
  if (!DecodeHex (pubkeyHex, pubkey) || pubkey.size () != KEY_BYTES)
    return false;
  if (!DecodeHex (sigHex, sig) || sig.size () != SIGNATURE_BYTES)
    return false;

  EVP_PKEY* raw = EVP_PKEY_new_raw_public_key (EVP_PKEY_ED25519, nullptr,
                                              AsBytes (pubkey),
                                              pubkey.size ());
  if (raw == nullptr)
    return false;
  const Key pkey(raw);

  DigestContext ctx;
  if (EVP_DigestVerifyInit (ctx.Get (), nullptr, nullptr, nullptr,
                            pkey.Get ()) != 1)
    return false;

  return EVP_DigestVerify (ctx.Get (), AsBytes (sig), sig.size (),
                           AsBytes (data), data.size ()) == 1;
}

} // namespace unite4
