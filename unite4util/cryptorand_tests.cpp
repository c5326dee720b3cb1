// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "cryptorand.hpp"

#include <gtest/gtest.h>

#include <set>

namespace unite4
{
namespace
{

class CryptoRandTests : public testing::Test
{

protected:

  CryptoRand rnd;

};

TEST_F (CryptoRandTests, BytesHaveRequestedLength)
{
  EXPECT_EQ (rnd.GetBytes (0), "");
  EXPECT_EQ (rnd.GetBytes (32).size (), 32);
}

TEST_F (CryptoRandTests, SessionIdAlphabet)
{
  const std::string id = rnd.NewSessionId ();
  ASSERT_EQ (id.size (), CryptoRand::DEFAULT_ID_LENGTH);
  for (const char c : id)
    {
      const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
                        || (c >= '0' && c <= '9') || c == '_' || c == '-';
      EXPECT_TRUE (ok) << "Unexpected character: " << c;
    }

  EXPECT_EQ (rnd.NewSessionId (5).size (), 5);
}

TEST_F (CryptoRandTests, SessionIdsDiffer)
{
  std::set<std::string> seen;
  for (unsigned i = 0; i < 100; ++i)
    seen.insert (rnd.NewSessionId ());
  EXPECT_EQ (seen.size (), 100);
}

} // anonymous namespace
} // namespace unite4
