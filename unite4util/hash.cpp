// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <glog/logging.h>

#include <openssl/evp.h>

namespace unite4
{

class SHA256::State
{

private:

  EVP_MD_CTX* ctx;

public:

  State ();
  ~State ();

  State (const State&) = delete;
  void operator= (const State&) = delete;

  void
  Update (const std::string& data)
  {
    CHECK_EQ (EVP_DigestUpdate (ctx, data.data (), data.size ()), 1);
  }

  std::string Finalise ();

};

SHA256::State::State ()
  : ctx(EVP_MD_CTX_new ())
{
  CHECK (ctx != nullptr);
  CHECK_EQ (EVP_DigestInit_ex (ctx, EVP_sha256 (), nullptr), 1);
}

SHA256::State::~State ()
{
  EVP_MD_CTX_free (ctx);
}

std::string
SHA256::State::Finalise ()
{
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned outLen;
  CHECK_EQ (EVP_DigestFinal_ex (ctx, out, &outLen), 1);
  CHECK_EQ (outLen, DIGEST_BYTES);

  return std::string (reinterpret_cast<const char*> (out), outLen);
}

SHA256::SHA256 ()
  : state(std::make_unique<State> ())
{}

SHA256::~SHA256 () = default;

SHA256&
SHA256::operator<< (const std::string& data)
{
  CHECK (state != nullptr) << "SHA256 instance has already been finalised";
  state->Update (data);
  return *this;
}

std::string
SHA256::Finalise ()
{
  CHECK (state != nullptr) << "SHA256 instance has already been finalised";
  const std::string res = state->Finalise ();
  state.reset ();
  return res;
}

std::string
SHA256::Hash (const std::string& data)
{
  SHA256 hasher;
  hasher << data;
  return hasher.Finalise ();
}

} // namespace unite4
