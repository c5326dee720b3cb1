// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CONNECTFOUR_TESTUTILS_HPP
#define CONNECTFOUR_TESTUTILS_HPP

#include "board.hpp"
#include "movesync.hpp"
#include "proto/messages.pb.h"

#include <relaychannel/channelbridge.hpp>

#include <string>
#include <vector>

namespace connectfour
{

/**
 * DropAnimator that just records the moves it is asked to animate.  Tests
 * settle them explicitly.
 */
class RecordingAnimator : public DropAnimator
{

public:

  /** All moves passed to StartDrop.  */
  std::vector<PlayerMove> drops;

  /** Number of calls to Clear.  */
  int clears = 0;

  void StartDrop (const PlayerMove& mv) override;
  void Clear () override;

};

/** A sequence of columns that fills the board without a winner.  */
extern const std::vector<int> DRAW_SEQUENCE;

/* Encoded protocol messages for use as inbound event content.  */
std::string NewGameMessage (const std::string& name);
std::string JoinMessage (const std::string& p1, const std::string& p2);
std::string MoveMessage (int column);
std::string ResetMessage ();

/**
 * Pops and decodes all messages queued in the outbound queue.
 */
std::vector<proto::ProtocolMessage> DrainOutbound (unite4::ChannelBridge& b);

/**
 * Pushes a single live event to the inbound queue.
 */
void PushLive (unite4::ChannelBridge& b, const std::string& author,
               const std::string& content);

/**
 * Pushes a backlog snapshot to the inbound queue.
 */
void PushBacklog (unite4::ChannelBridge& b,
                  const std::vector<unite4::ReceivedEvent>& events);

} // namespace connectfour

#endif // CONNECTFOUR_TESTUTILS_HPP
