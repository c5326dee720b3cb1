// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "event.hpp"

#include <unite4util/hash.hpp>
#include <unite4util/hex.hpp>

#include <glog/logging.h>

#include <algorithm>
#include <chrono>

namespace unite4
{

const std::string TOPIC_TAG = "t";

namespace
{

/**
 * Returns the compact serialisation of a JSON value, as used for computing
 * event IDs.
 */
std::string
CompactJson (const Json::Value& val)
{
  Json::StreamWriterBuilder wbuilder;
  wbuilder["commentStyle"] = "None";
  wbuilder["indentation"] = "";
  wbuilder["emitUTF8"] = true;

  return Json::writeString (wbuilder, val);
}

Json::Value
TagsToJson (const std::vector<RelayEvent::Tag>& tags)
{
  Json::Value res(Json::arrayValue);
  for (const auto& t : tags)
    {
      Json::Value cur(Json::arrayValue);
      for (const auto& entry : t)
        cur.append (entry);
      res.append (cur);
    }

  return res;
}

/**
 * Reads a JSON string member into the given output.  Returns false if it
 * is missing or not a string.
 */
bool
GetString (const Json::Value& obj, const char* key, std::string& out)
{
  const auto& val = obj[key];
  if (!val.isString ())
    return false;
  out = val.asString ();
  return true;
}

} // anonymous namespace

std::string
RelayEvent::ComputeId () const
{
  Json::Value arr(Json::arrayValue);
  arr.append (0);
  arr.append (pubkey);
  arr.append (static_cast<Json::Int64> (createdAt));
  arr.append (kind);
  arr.append (TagsToJson (tags));
  arr.append (content);

  return EncodeHex (SHA256::Hash (CompactJson (arr)));
}

bool
RelayEvent::HasTag (const std::string& name, const std::string& value) const
{
  for (const auto& t : tags)
    if (t.size () >= 2 && t[0] == name && t[1] == value)
      return true;
  return false;
}

bool
RelayEvent::IsValid () const
{
  if (id != ComputeId ())
    {
      VLOG (1) << "Event ID mismatch for " << id;
      return false;
    }

  std::string rawId;
  if (!DecodeHex (id, rawId))
    return false;

  return Identity::Verify (pubkey, rawId, sig);
}

Json::Value
RelayEvent::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["id"] = id;
  res["pubkey"] = pubkey;
  res["created_at"] = static_cast<Json::Int64> (createdAt);
  res["kind"] = kind;
  res["tags"] = TagsToJson (tags);
  res["content"] = content;
  res["sig"] = sig;

  return res;
}

bool
RelayEvent::FromJson (const Json::Value& val, RelayEvent& ev)
{
  if (!val.isObject ())
    return false;

  RelayEvent res;
  if (!GetString (val, "id", res.id)
        || !GetString (val, "pubkey", res.pubkey)
        || !GetString (val, "content", res.content)
        || !GetString (val, "sig", res.sig))
    return false;

  const auto& created = val["created_at"];
  if (!created.isInt64 ())
    return false;
  res.createdAt = created.asInt64 ();

  const auto& kind = val["kind"];
  if (!kind.isInt ())
    return false;
  res.kind = kind.asInt ();

  const auto& tags = val["tags"];
  if (!tags.isArray ())
    return false;
  for (const auto& t : tags)
    {
      if (!t.isArray ())
        return false;
      Tag cur;
      for (const auto& entry : t)
        {
          if (!entry.isString ())
            return false;
          cur.push_back (entry.asString ());
        }
      res.tags.push_back (std::move (cur));
    }

  ev = std::move (res);
  return true;
}

RelayEvent
CreateSignedEvent (const Identity& author, const int kind,
                   const std::string& topic, const std::string& content,
                   const int64_t createdAt)
{
  RelayEvent ev;
  ev.pubkey = author.GetPublicKeyHex ();
  ev.createdAt = createdAt;
  ev.kind = kind;
  ev.tags.push_back ({TOPIC_TAG, topic});
  ev.content = content;
  ev.id = ev.ComputeId ();

  std::string rawId;
  CHECK (DecodeHex (ev.id, rawId));
  ev.sig = author.Sign (rawId);

  return ev;
}

int64_t
CurrentTimestamp ()
{
  const auto now = std::chrono::system_clock::now ();
  return std::chrono::duration_cast<std::chrono::seconds> (
      now.time_since_epoch ()).count ();
}

bool
RelayFilter::Matches (const RelayEvent& ev) const
{
  if (!kinds.empty ()
        && std::find (kinds.begin (), kinds.end (), ev.kind) == kinds.end ())
    return false;

  if (!topic.empty () && !ev.HasTag (TOPIC_TAG, topic))
    return false;

  if (!authors.empty ()
        && std::find (authors.begin (), authors.end (), ev.pubkey)
              == authors.end ())
    return false;

  if (since != 0 && ev.createdAt < since)
    return false;

  return true;
}

Json::Value
RelayFilter::ToJson () const
{
  Json::Value res(Json::objectValue);

  if (!kinds.empty ())
    {
      Json::Value arr(Json::arrayValue);
      for (const int k : kinds)
        arr.append (k);
      res["kinds"] = arr;
    }

  if (!topic.empty ())
    {
      Json::Value arr(Json::arrayValue);
      arr.append (topic);
      res["#" + TOPIC_TAG] = arr;
    }

  if (!authors.empty ())
    {
      Json::Value arr(Json::arrayValue);
      for (const auto& a : authors)
        arr.append (a);
      res["authors"] = arr;
    }

  if (since != 0)
    res["since"] = static_cast<Json::Int64> (since);

  return res;
}

bool
RelayFilter::FromJson (const Json::Value& val, RelayFilter& f)
{
  if (!val.isObject ())
    return false;

  RelayFilter res;
  for (const auto& key : val.getMemberNames ())
    {
      const auto& entry = val[key];

      if (key == "kinds")
        {
          if (!entry.isArray ())
            return false;
          for (const auto& k : entry)
            {
              if (!k.isInt ())
                return false;
              res.kinds.push_back (k.asInt ());
            }
        }
      else if (key == "#" + TOPIC_TAG)
        {
          /* We only support filtering on a single topic value.  */
          if (!entry.isArray () || entry.size () != 1 || !entry[0].isString ())
            return false;
          res.topic = entry[0].asString ();
        }
      else if (key == "authors")
        {
          if (!entry.isArray ())
            return false;
          for (const auto& a : entry)
            {
              if (!a.isString ())
                return false;
              res.authors.push_back (a.asString ());
            }
        }
      else if (key == "since")
        {
          if (!entry.isInt64 ())
            return false;
          res.since = entry.asInt64 ();
        }
      else
        {
          VLOG (1) << "Unsupported filter field: " << key;
          return false;
        }
    }

  f = std::move (res);
  return true;
}

} // namespace unite4
