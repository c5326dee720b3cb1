// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hex.hpp"

#include <gtest/gtest.h>

namespace unite4
{
namespace
{

using HexTests = testing::Test;

TEST_F (HexTests, Encode)
{
  EXPECT_EQ (EncodeHex (""), "");
  EXPECT_EQ (EncodeHex ("abc"), "616263");
  EXPECT_EQ (EncodeHex (std::string ("\x00\xFF\x10", 3)), "00ff10");
}

TEST_F (HexTests, DecodeValid)
{
  std::string data;
  ASSERT_TRUE (DecodeHex ("616263", data));
  EXPECT_EQ (data, "abc");

  ASSERT_TRUE (DecodeHex ("00FF10", data));
  EXPECT_EQ (data, std::string ("\x00\xFF\x10", 3));

  ASSERT_TRUE (DecodeHex ("", data));
  EXPECT_EQ (data, "");
}

TEST_F (HexTests, DecodeInvalid)
{
  std::string data = "unchanged";
  EXPECT_FALSE (DecodeHex ("abc", data));
  EXPECT_FALSE (DecodeHex ("zz", data));
  EXPECT_FALSE (DecodeHex ("0x12", data));
  EXPECT_FALSE (DecodeHex (" 12", data));
  EXPECT_EQ (data, "unchanged");
}

} // anonymous namespace
} // namespace unite4
