// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settings.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

namespace connectfour
{
namespace
{

class JsonFileSettingsTests : public testing::Test
{

protected:

  const std::string file;

  JsonFileSettingsTests ()
    : file(testing::TempDir () + "unite4_settings_test.json")
  {
    std::remove (file.c_str ());
  }

  ~JsonFileSettingsTests ()
  {
    std::remove (file.c_str ());
  }

  void
  WriteFile (const std::string& content)
  {
    std::ofstream out(file);
    out << content;
  }

};

TEST_F (JsonFileSettingsTests, MissingFile)
{
  JsonFileSettings settings(file);
  EXPECT_EQ (settings.Get (SettingsStore::USERNAME), "");
  EXPECT_EQ (settings.Get (SettingsStore::RELAYS), "");
  EXPECT_EQ (settings.Get (SettingsStore::PRIVKEY), "");
}

TEST_F (JsonFileSettingsTests, Persisted)
{
  {
    JsonFileSettings settings(file);
    ASSERT_TRUE (settings.Set (SettingsStore::USERNAME, "alice"));
    ASSERT_TRUE (settings.Set (SettingsStore::RELAYS, "http://a, http://b"));
    EXPECT_EQ (settings.Get (SettingsStore::USERNAME), "alice");
  }

  JsonFileSettings settings(file);
  EXPECT_EQ (settings.Get (SettingsStore::USERNAME), "alice");
  EXPECT_EQ (settings.Get (SettingsStore::RELAYS), "http://a, http://b");
  EXPECT_EQ (settings.Get (SettingsStore::PRIVKEY), "");
}

TEST_F (JsonFileSettingsTests, InvalidFile)
{
  WriteFile ("this is not json");
  JsonFileSettings settings(file);
  EXPECT_EQ (settings.Get (SettingsStore::USERNAME), "");

  WriteFile (R"(["alice"])");
  JsonFileSettings arraySettings(file);
  EXPECT_EQ (arraySettings.Get (SettingsStore::USERNAME), "");
}

TEST_F (JsonFileSettingsTests, NonStringValue)
{
  WriteFile (R"({"username": 42, "relays": "http://relay"})");
  JsonFileSettings settings(file);
  EXPECT_EQ (settings.Get (SettingsStore::USERNAME), "");
  EXPECT_EQ (settings.Get (SettingsStore::RELAYS), "http://relay");
}

TEST_F (JsonFileSettingsTests, UnwritableFile)
{
  JsonFileSettings settings(testing::TempDir () + "no/such/dir/settings.json");
  EXPECT_FALSE (settings.Set (SettingsStore::USERNAME, "alice"));
}

TEST_F (JsonFileSettingsTests, IdentityCreatedOnce)
{
  std::string pubkey;
  {
    JsonFileSettings settings(file);
    const auto id = LoadOrCreateIdentity (settings);
    ASSERT_NE (id, nullptr);
    pubkey = id->GetPublicKeyHex ();
    EXPECT_EQ (settings.Get (SettingsStore::PRIVKEY), id->GetPrivateKeyHex ());
  }

  JsonFileSettings settings(file);
  const auto id = LoadOrCreateIdentity (settings);
  ASSERT_NE (id, nullptr);
  EXPECT_EQ (id->GetPublicKeyHex (), pubkey);
}

TEST_F (JsonFileSettingsTests, InvalidIdentityReplaced)
{
  WriteFile (R"({"privkey": "invalid"})");

  JsonFileSettings settings(file);
  const auto id = LoadOrCreateIdentity (settings);
  ASSERT_NE (id, nullptr);
  EXPECT_EQ (settings.Get (SettingsStore::PRIVKEY), id->GetPrivateKeyHex ());
}

} // anonymous namespace
} // namespace connectfour
