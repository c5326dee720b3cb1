// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "session.hpp"

#include <glog/logging.h>

#include <utility>

namespace connectfour
{

std::ostream&
operator<< (std::ostream& out, const Phase p)
{
  switch (p)
    {
    case Phase::AWAITING_OPPONENT:
      return out << "awaiting opponent";
    case Phase::IN_PROGRESS:
      return out << "in progress";
    case Phase::SETTLING_MOVE:
      return out << "settling move";
    case Phase::WON:
      return out << "won";
    case Phase::DRAWN:
      return out << "drawn";
    case Phase::REJECTED:
      return out << "rejected";
    }

  LOG (FATAL) << "Invalid phase: " << static_cast<int> (p);
}

GameSession::GameSession (std::shared_ptr<unite4::ChannelBridge> b,
                          const std::string& identity,
                          const std::string& gameTag,
                          const std::string& displayName)
  : bridge(std::move (b)), sender(*bridge),
    matchmaking(state, sender), moves(board, state, sender)
{
  state.identity = identity;
  state.gameTag = gameTag;
  state.displayName = displayName;
}

GameSession::DispatchResult
GameSession::Dispatch (const PendingEvent& p)
{
  const auto& ev = p.event;

  proto::ProtocolMessage msg;
  if (!DecodeMessage (ev.content, msg))
    {
      LOG (WARNING)
          << "Dropping malformed message from " << ev.author << ": "
          << ev.content;
      return DispatchResult::CONTINUE;
    }

  switch (msg.payload_case ())
    {
    case proto::ProtocolMessage::kAnnounceNewGame:
      matchmaking.OnNewGame (ev.author, msg.announce_new_game ());
      return DispatchResult::CONTINUE;

    case proto::ProtocolMessage::kAnnounceJoin:
      matchmaking.OnJoin (ev.author, msg.announce_join ());
      return DispatchResult::CONTINUE;

    case proto::ProtocolMessage::kMoveInput:
      {
        MoveOutcome outcome;
        if (ev.author == state.identity)
          {
            /* Our own moves only matter when restoring the game from
               the backlog.  Live, we know them already.  */
            if (!p.backlog)
              return DispatchResult::CONTINUE;
            outcome = moves.ReplayLocalMove (msg.move_input ());
          }
        else if (ev.author != state.GetOpponent ())
          {
            VLOG (1) << "Ignoring move by " << ev.author
                     << ", who is not our opponent";
            return DispatchResult::CONTINUE;
          }
        else
          outcome = moves.ReceiveRemoteMove (msg.move_input ());

        switch (outcome)
          {
          case MoveOutcome::ACCEPTED:
            return DispatchResult::MOVE_ACCEPTED;
          case MoveOutcome::DEFERRED:
            return DispatchResult::RETRY;
          case MoveOutcome::REJECTED:
            return DispatchResult::CONTINUE;
          }
        break;
      }

    case proto::ProtocolMessage::kResetSession:
      moves.Reset ();
      return DispatchResult::CONTINUE;

    case proto::ProtocolMessage::PAYLOAD_NOT_SET:
      break;
    }

  LOG (FATAL) << "Unexpected message: " << ev.content;
}

void
GameSession::Tick ()
{
  /* Pending events are bounded by the inbound queue's capacity.  Further
     messages stay in the queue until the pending ones are processed.  */
  const size_t maxPending = bridge->inbound.GetCapacity ();
  while (pending.size () < maxPending)
    {
      unite4::InboundMessage msg;
      if (!bridge->inbound.TryPop (msg))
        break;

      if (msg.backlog)
        {
          if (matchmaking.HasProcessedBacklog ())
            {
              LOG (WARNING) << "Ignoring second backlog snapshot";
              continue;
            }

          if (msg.failed)
            {
              matchmaking.ProcessUnavailableBacklog ();
              continue;
            }

          for (auto& ev : matchmaking.ProcessBacklog (msg.events))
            pending.push_back ({std::move (ev), true});
          continue;
        }

      for (auto& ev : msg.events)
        pending.push_back ({std::move (ev), false});
    }

  while (!pending.empty ())
    {
      const DispatchResult res = Dispatch (pending.front ());
      if (res == DispatchResult::RETRY)
        break;

      pending.pop_front ();
      if (res == DispatchResult::MOVE_ACCEPTED)
        break;
    }
}

Phase
GameSession::GetPhase () const
{
  if (state.role == Role::REJECTED)
    return Phase::REJECTED;
  if (!state.started)
    return Phase::AWAITING_OPPONENT;

  if (board.IsInProgress ())
    return Phase::SETTLING_MOVE;
  if (board.HasWinner ())
    return Phase::WON;
  if (board.IsFull ())
    return Phase::DRAWN;

  return Phase::IN_PROGRESS;
}

std::string
GameSession::GetStatusText () const
{
  switch (GetPhase ())
    {
    case Phase::REJECTED:
      return "not your game";
    case Phase::AWAITING_OPPONENT:
      return "waiting for opponent";
    case Phase::WON:
      if (board.GetWinner () == state.GetLocalPlayer ())
        return "you win!!";
      return "you lose";
    case Phase::DRAWN:
      return "draw";
    case Phase::IN_PROGRESS:
    case Phase::SETTLING_MOVE:
      if (board.GetPlayerTurn () == state.GetLocalPlayer ())
        return "your turn";
      return "waiting..";
    }

  LOG (FATAL) << "Invalid phase";
}

} // namespace connectfour
