// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include "hex.hpp"

#include <gtest/gtest.h>

namespace unite4
{
namespace
{

class SHA256Tests : public testing::Test
{

protected:

  SHA256 hasher;

};

TEST_F (SHA256Tests, Empty)
{
  EXPECT_EQ (EncodeHex (hasher.Finalise ()),
     "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F (SHA256Tests, Incremental)
{
  hasher << "foo";
  hasher << "";
  hasher << "bar";

  EXPECT_EQ (EncodeHex (hasher.Finalise ()),
      "c3ab8ff13720e8ad9047dd39466b3c8974e592c2fa383d4a3960714caef0c4f2");
}

TEST_F (SHA256Tests, UtilityHash)
{
  const std::string digest = SHA256::Hash ("foobar");
  EXPECT_EQ (digest.size (), SHA256::DIGEST_BYTES);
  EXPECT_EQ (EncodeHex (digest),
      "c3ab8ff13720e8ad9047dd39466b3c8974e592c2fa383d4a3960714caef0c4f2");
}

TEST_F (SHA256Tests, UseAfterFinalise)
{
  hasher.Finalise ();
  EXPECT_DEATH (hasher << "foo", "already been finalised");
}

} // anonymous namespace
} // namespace unite4
