// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CONNECTFOUR_MESSAGES_HPP
#define CONNECTFOUR_MESSAGES_HPP

#include "proto/messages.pb.h"

#include <relaychannel/channelbridge.hpp>

#include <string>

namespace connectfour
{

/** The relay event kind used for all game traffic.  */
constexpr int EVENT_KIND = 4444;

/** The default application domain that scopes game tags.  */
constexpr const char* DEFAULT_APP_DOMAIN = "unite4.luvnft.com";

/**
 * Computes the tag that scopes all traffic of the match with the given
 * session path.
 */
std::string GameTag (const std::string& appDomain,
                     const std::string& sessionPath);

/**
 * Encodes a protocol message into its textual (JSON) form that is put
 * as content into relay events.
 */
std::string EncodeMessage (const proto::ProtocolMessage& msg);

/**
 * Decodes a protocol message from its textual form.  Returns false if the
 * text is malformed or does not contain exactly one known payload case.
 * Join announcements must name two distinct player identities.
 */
bool DecodeMessage (const std::string& text, proto::ProtocolMessage& msg);

/**
 * Helper class that encodes protocol messages and queues them for
 * publication by the network actor.
 */
class MessageSender
{

private:

  /** The outbound queue into which messages are put.  */
  unite4::BoundedQueue<std::string>& outbound;

public:

  explicit MessageSender (unite4::ChannelBridge& bridge)
    : outbound(bridge.outbound)
  {}

  MessageSender () = delete;
  MessageSender (const MessageSender&) = delete;
  void operator= (const MessageSender&) = delete;

  /**
   * Queues a message.  Returns false if the outbound queue is full, in which
   * case the message is lost.
   */
  bool Send (const proto::ProtocolMessage& msg);

  bool SendNewGame (const std::string& name);
  bool SendJoin (const proto::Players& players);
  bool SendMove (int column);
  bool SendReset ();

};

} // namespace connectfour

#endif // CONNECTFOUR_MESSAGES_HPP
