// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settings.hpp"

#include <glog/logging.h>

#include <fstream>

namespace connectfour
{

const std::string SettingsStore::USERNAME = "username";
const std::string SettingsStore::RELAYS = "relays";
const std::string SettingsStore::PRIVKEY = "privkey";

JsonFileSettings::JsonFileSettings (const std::string& f)
  : file(f), data(Json::objectValue)
{
  std::ifstream in(file);
  if (!in)
    {
      LOG (INFO) << "No settings file " << file << ", using defaults";
      return;
    }

  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = true;

  Json::Value parsed;
  std::string parseErrs;
  if (!Json::parseFromStream (rbuilder, in, &parsed, &parseErrs)
        || !parsed.isObject ())
    {
      LOG (WARNING)
          << "Ignoring invalid settings file " << file << ": " << parseErrs;
      return;
    }

  data = parsed;
}

std::string
JsonFileSettings::Get (const std::string& key) const
{
  const auto& val = data[key];
  if (!val.isString ())
    {
      if (!val.isNull ())
        LOG (WARNING) << "Ignoring non-string setting " << key;
      return "";
    }

  return val.asString ();
}

bool
JsonFileSettings::Set (const std::string& key, const std::string& value)
{
  data[key] = value;

  Json::StreamWriterBuilder wbuilder;
  wbuilder["indentation"] = "  ";

  std::ofstream out(file);
  if (!out)
    {
      LOG (ERROR) << "Could not open settings file " << file << " for writing";
      return false;
    }

  out << Json::writeString (wbuilder, data) << std::endl;
  if (!out)
    {
      LOG (ERROR) << "Failed to write settings file " << file;
      return false;
    }

  return true;
}

std::unique_ptr<unite4::Identity>
LoadOrCreateIdentity (SettingsStore& s)
{
  const std::string stored = s.Get (SettingsStore::PRIVKEY);
  if (!stored.empty ())
    {
      auto res = unite4::Identity::FromPrivateKeyHex (stored);
      if (res != nullptr)
        return res;
      LOG (WARNING) << "Stored identity is invalid, creating a new one";
    }

  auto res = unite4::Identity::Generate ();
  LOG (INFO) << "Created new identity " << res->GetPublicKeyHex ();
  if (!s.Set (SettingsStore::PRIVKEY, res->GetPrivateKeyHex ()))
    LOG (WARNING) << "The new identity could not be saved";

  return res;
}

} // namespace connectfour
