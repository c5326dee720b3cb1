// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CONNECTFOUR_SETTINGS_HPP
#define CONNECTFOUR_SETTINGS_HPP

#include <relaychannel/identity.hpp>

#include <json/json.h>

#include <memory>
#include <string>
#include <vector>

namespace connectfour
{

/**
 * Persistent key-value store for the client's settings.  Missing keys read
 * as empty strings.
 */
class SettingsStore
{

public:

  /** Key for the display name.  */
  static const std::string USERNAME;

  /** Key for the comma-separated list of relays.  */
  static const std::string RELAYS;

  /** Key for the hex private key of our identity.  */
  static const std::string PRIVKEY;

  SettingsStore () = default;
  virtual ~SettingsStore () = default;

  SettingsStore (const SettingsStore&) = delete;
  void operator= (const SettingsStore&) = delete;

  /**
   * Returns the value for a key, or the empty string if it is not set.
   */
  virtual std::string Get (const std::string& key) const = 0;

  /**
   * Sets the value for a key and persists it.  Returns false if the
   * data could not be written.
   */
  virtual bool Set (const std::string& key, const std::string& value) = 0;

};

/**
 * SettingsStore in a JSON file with one object of string values.  A missing
 * or unreadable file is treated as empty.
 */
class JsonFileSettings : public SettingsStore
{

private:

  /** The file the settings are stored in.  */
  const std::string file;

  /** The current settings as JSON object.  */
  Json::Value data;

public:

  explicit JsonFileSettings (const std::string& f);

  std::string Get (const std::string& key) const override;
  bool Set (const std::string& key, const std::string& value) override;

};

/**
 * Returns the identity stored in the settings.  If there is none (or it is
 * invalid), a new one is generated and stored.
 */
std::unique_ptr<unite4::Identity> LoadOrCreateIdentity (SettingsStore& s);

} // namespace connectfour

#endif // CONNECTFOUR_SETTINGS_HPP
