// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include "messages.hpp"

#include <glog/logging.h>

namespace connectfour
{

const std::vector<int> DRAW_SEQUENCE = {
    3, 3, 3, 3, 3, 3,
    2, 2, 2, 2, 2, 2,
    4, 4, 4, 4, 4, 4,
    0, 1, 1, 1, 1, 1, 1,
    5, 5, 5, 5, 5, 5,
    0, 0, 0, 0, 0,
    6, 6, 6, 6, 6, 6,
};

void
RecordingAnimator::StartDrop (const PlayerMove& mv)
{
  drops.push_back (mv);
}

void
RecordingAnimator::Clear ()
{
  ++clears;
}

std::string
NewGameMessage (const std::string& name)
{
  proto::ProtocolMessage msg;
  auto* announce = msg.mutable_announce_new_game ();
  if (!name.empty ())
    announce->set_name (name);
  return EncodeMessage (msg);
}

std::string
JoinMessage (const std::string& p1, const std::string& p2)
{
  proto::ProtocolMessage msg;
  auto* players = msg.mutable_announce_join ();
  players->set_p1_identity (p1);
  players->set_p2_identity (p2);
  return EncodeMessage (msg);
}

std::string
MoveMessage (const int column)
{
  proto::ProtocolMessage msg;
  msg.set_move_input (column);
  return EncodeMessage (msg);
}

std::string
ResetMessage ()
{
  proto::ProtocolMessage msg;
  msg.mutable_reset_session ();
  return EncodeMessage (msg);
}

std::vector<proto::ProtocolMessage>
DrainOutbound (unite4::ChannelBridge& b)
{
  std::vector<proto::ProtocolMessage> res;
  for (const auto& payload : b.outbound.PopAll ())
    {
      proto::ProtocolMessage msg;
      CHECK (DecodeMessage (payload, msg)) << "Invalid outbound: " << payload;
      res.push_back (std::move (msg));
    }

  return res;
}

void
PushLive (unite4::ChannelBridge& b, const std::string& author,
          const std::string& content)
{
  unite4::InboundMessage msg;
  msg.events.push_back ({author, content});
  CHECK (b.inbound.TryPush (std::move (msg)));
}

void
PushBacklog (unite4::ChannelBridge& b,
             const std::vector<unite4::ReceivedEvent>& events)
{
  unite4::InboundMessage msg;
  msg.backlog = true;
  msg.events = events;
  CHECK (b.inbound.TryPush (std::move (msg)));
}

} // namespace connectfour
