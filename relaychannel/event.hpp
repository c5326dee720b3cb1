// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RELAYCHANNEL_EVENT_HPP
#define RELAYCHANNEL_EVENT_HPP

#include "identity.hpp"

#include <json/json.h>

#include <cstdint>
#include <string>
#include <vector>

namespace unite4
{

/** Name of the tag that scopes events to a topic (e.g. one match).  */
extern const std::string TOPIC_TAG;

/**
 * A signed event as stored and forwarded by relays.  The layout follows
 * the NIP-01 event structure.  The content is opaque to relays; games put
 * their own (textual) payload there.
 */
struct RelayEvent
{

  using Tag = std::vector<std::string>;

  /** Hex SHA-256 of the canonical serialisation.  */
  std::string id;

  /** Hex public key of the author.  */
  std::string pubkey;

  /** Creation time as UNIX timestamp in seconds.  */
  int64_t createdAt = 0;

  /** The event kind.  */
  int kind = 0;

  std::vector<Tag> tags;

  std::string content;

  /** Hex signature of the ID bytes by the author.  */
  std::string sig;

  /**
   * Computes the canonical ID of the event from all other fields.
   */
  std::string ComputeId () const;

  /**
   * Returns true if the event has a tag with the given name and value.
   */
  bool HasTag (const std::string& name, const std::string& value) const;

  /**
   * Checks that the ID matches the content and that the signature is
   * valid for the claimed author.
   */
  bool IsValid () const;

  Json::Value ToJson () const;

  /**
   * Parses an event from its JSON form.  Returns false if the JSON does
   * not have the expected structure.  This does not verify the ID
   * or signature.
   */
  static bool FromJson (const Json::Value& val, RelayEvent& ev);

};

/**
 * Builds and signs an event from the given identity.  The topic is added
 * as TOPIC_TAG tag.
 */
RelayEvent CreateSignedEvent (const Identity& author, int kind,
                              const std::string& topic,
                              const std::string& content, int64_t createdAt);

/**
 * Returns the current UNIX time in seconds.
 */
int64_t CurrentTimestamp ();

/**
 * Subscription filter selecting events on a relay.  Empty lists and
 * zero values mean "no restriction" for the corresponding field.
 */
struct RelayFilter
{

  std::vector<int> kinds;

  /** Required value of the TOPIC_TAG tag, if not empty.  */
  std::string topic;

  std::vector<std::string> authors;

  /** If non-zero, only events created at or after this time match.  */
  int64_t since = 0;

  bool Matches (const RelayEvent& ev) const;

  Json::Value ToJson () const;
  static bool FromJson (const Json::Value& val, RelayFilter& f);

};

} // namespace unite4

#endif // RELAYCHANNEL_EVENT_HPP
