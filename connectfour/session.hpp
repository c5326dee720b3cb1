// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CONNECTFOUR_SESSION_HPP
#define CONNECTFOUR_SESSION_HPP

#include "board.hpp"
#include "matchmaking.hpp"
#include "messages.hpp"
#include "movesync.hpp"

#include <relaychannel/channelbridge.hpp>

#include <deque>
#include <memory>
#include <ostream>
#include <string>

namespace connectfour
{

/**
 * The phase a game session is in, as shown to the user.
 */
enum class Phase
{
  AWAITING_OPPONENT,
  IN_PROGRESS,
  SETTLING_MOVE,
  WON,
  DRAWN,
  REJECTED,
};

std::ostream& operator<< (std::ostream& out, Phase p);

/**
 * One match as seen by the frame loop.  It owns the game state and
 * processes messages from the inbound queue on every tick.  All methods
 * must be called from the frame loop's thread only.
 */
class GameSession
{

private:

  /** An inbound event waiting to be processed.  */
  struct PendingEvent
  {

    unite4::ReceivedEvent event;

    /** Whether the event is part of the backlog.  */
    bool backlog;

  };

  /** Result of processing a single inbound event.  */
  enum class DispatchResult
  {

    /** The event has been handled, go on with the next.  */
    CONTINUE,

    /** A move was accepted, stop processing for this tick.  */
    MOVE_ACCEPTED,

    /** The event must wait, retry it on the next tick.  */
    RETRY,

  };

  std::shared_ptr<unite4::ChannelBridge> bridge;

  SessionState state;
  Board board;

  MessageSender sender;
  MatchmakingProtocol matchmaking;
  MoveSynchronizer moves;

  /** Events received but not yet processed, in order.  */
  std::deque<PendingEvent> pending;

  /**
   * Decodes and processes one inbound event.
   */
  DispatchResult Dispatch (const PendingEvent& p);

public:

  explicit GameSession (std::shared_ptr<unite4::ChannelBridge> b,
                        const std::string& identity,
                        const std::string& gameTag,
                        const std::string& displayName);

  GameSession () = delete;
  GameSession (const GameSession&) = delete;
  void operator= (const GameSession&) = delete;

  void
  SetAnimator (DropAnimator& a)
  {
    moves.SetAnimator (a);
  }

  const SessionState&
  GetState () const
  {
    return state;
  }

  const Board&
  GetBoard () const
  {
    return board;
  }

  /**
   * Returns the number of inbound events that wait to be processed.
   */
  size_t
  GetPendingCount () const
  {
    return pending.size ();
  }

  /**
   * Runs one tick of the frame loop:  Takes the available inbound messages
   * and processes them in order, until a move is accepted or an event has
   * to wait for the current move to settle.  At most as many events as the
   * inbound queue's capacity are held back for later ticks; further
   * messages stay in the inbound queue meanwhile.
   */
  void Tick ();

  MoveOutcome
  SubmitLocalMove (const int column)
  {
    return moves.SubmitLocalMove (column);
  }

  void
  OnMoveSettled (const PlayerMove& mv)
  {
    moves.OnMoveSettled (mv);
  }

  bool
  RequestReplay ()
  {
    return moves.RequestReplay ();
  }

  Phase GetPhase () const;

  /**
   * Returns the status line shown to the user.
   */
  std::string GetStatusText () const;

};

} // namespace connectfour

#endif // CONNECTFOUR_SESSION_HPP
