// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "identity.hpp"

#include <gtest/gtest.h>

namespace unite4
{
namespace
{

TEST (IdentityTests, GenerateIsRandom)
{
  auto a = Identity::Generate ();
  auto b = Identity::Generate ();
  ASSERT_NE (a, nullptr);
  ASSERT_NE (b, nullptr);

  EXPECT_EQ (a->GetPublicKeyHex ().size (), 2 * Identity::KEY_BYTES);
  EXPECT_NE (a->GetPublicKeyHex (), b->GetPublicKeyHex ());
}

TEST (IdentityTests, RestoreFromPrivateKey)
{
  auto orig = Identity::Generate ();
  const std::string priv = orig->GetPrivateKeyHex ();
  EXPECT_EQ (priv.size (), 2 * Identity::KEY_BYTES);

  auto restored = Identity::FromPrivateKeyHex (priv);
  ASSERT_NE (restored, nullptr);
  EXPECT_EQ (restored->GetPublicKeyHex (), orig->GetPublicKeyHex ());
  EXPECT_EQ (restored->GetPrivateKeyHex (), priv);
}

TEST (IdentityTests, InvalidPrivateKey)
{
  EXPECT_EQ (Identity::FromPrivateKeyHex (""), nullptr);
  EXPECT_EQ (Identity::FromPrivateKeyHex ("abcd"), nullptr);
  EXPECT_EQ (Identity::FromPrivateKeyHex (std::string (64, 'x')), nullptr);
  EXPECT_EQ (Identity::FromPrivateKeyHex (std::string (66, '0')), nullptr);
}

TEST (IdentityTests, SignAndVerify)
{
  auto id = Identity::Generate ();
  const std::string sig = id->Sign ("message");

  EXPECT_TRUE (Identity::Verify (id->GetPublicKeyHex (), "message", sig));
  EXPECT_FALSE (Identity::Verify (id->GetPublicKeyHex (), "other", sig));

  auto other = Identity::Generate ();
  EXPECT_FALSE (Identity::Verify (other->GetPublicKeyHex (), "message", sig));
}

TEST (IdentityTests, VerifyMalformedInputs)
{
  auto id = Identity::Generate ();
  const std::string sig = id->Sign ("message");

  EXPECT_FALSE (Identity::Verify ("zz", "message", sig));
  EXPECT_FALSE (Identity::Verify (id->GetPublicKeyHex (), "message", "00"));
  EXPECT_FALSE (Identity::Verify (id->GetPublicKeyHex (), "message",
                                  "not hex"));

  std::string tampered = sig;
  tampered[0] = (tampered[0] == '0' ? '1' : '0');
  EXPECT_FALSE (Identity::Verify (id->GetPublicKeyHex (), "message",
                                  tampered));
}

} // anonymous namespace
} // namespace unite4
