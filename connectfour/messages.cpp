// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "messages.hpp"

#include <google/protobuf/util/json_util.h>

#include <glog/logging.h>

#include <utility>

namespace connectfour
{

using google::protobuf::util::JsonParseOptions;
using google::protobuf::util::JsonPrintOptions;
using google::protobuf::util::JsonStringToMessage;
using google::protobuf::util::MessageToJsonString;

std::string
GameTag (const std::string& appDomain, const std::string& sessionPath)
{
  return appDomain + " game_id=" + sessionPath;
}

std::string
EncodeMessage (const proto::ProtocolMessage& msg)
{
  CHECK_NE (msg.payload_case (), proto::ProtocolMessage::PAYLOAD_NOT_SET)
      << "Encoding protocol message without payload";

  JsonPrintOptions opts;
  opts.preserve_proto_field_names = true;
  opts.always_print_primitive_fields = false;

  std::string res;
  const auto status = MessageToJsonString (msg, &res, opts);
  CHECK (status.ok ())
      << "Failed to encode protocol message: " << status.ToString ();

  return res;
}

bool
DecodeMessage (const std::string& text, proto::ProtocolMessage& msg)
{
  JsonParseOptions opts;
  opts.ignore_unknown_fields = false;

  proto::ProtocolMessage res;
  const auto status = JsonStringToMessage (text, &res, opts);
  if (!status.ok ())
    {
      VLOG (1)
          << "Invalid protocol message " << text << ": " << status.ToString ();
      return false;
    }

  if (res.payload_case () == proto::ProtocolMessage::PAYLOAD_NOT_SET)
    {
      VLOG (1) << "Protocol message without payload: " << text;
      return false;
    }

  if (res.has_announce_join ())
    {
      const auto& players = res.announce_join ();
      if (players.p1_identity ().empty () || players.p2_identity ().empty ()
            || players.p1_identity () == players.p2_identity ())
        {
          VLOG (1) << "Join announcement with invalid players: " << text;
          return false;
        }
    }

  msg = std::move (res);
  return true;
}

bool
MessageSender::Send (const proto::ProtocolMessage& msg)
{
  std::string payload = EncodeMessage (msg);
  VLOG (1) << "Queueing message for publication: " << payload;

  return outbound.TryPush (std::move (payload));
}

bool
MessageSender::SendNewGame (const std::string& name)
{
  proto::ProtocolMessage msg;
  auto* announce = msg.mutable_announce_new_game ();
  if (!name.empty ())
    announce->set_name (name);
  return Send (msg);
}

bool
MessageSender::SendJoin (const proto::Players& players)
{
  proto::ProtocolMessage msg;
  *msg.mutable_announce_join () = players;
  return Send (msg);
}

bool
MessageSender::SendMove (const int column)
{
  proto::ProtocolMessage msg;
  msg.set_move_input (column);
  return Send (msg);
}

bool
MessageSender::SendReset ()
{
  proto::ProtocolMessage msg;
  msg.mutable_reset_session ();
  return Send (msg);
}

} // namespace connectfour
