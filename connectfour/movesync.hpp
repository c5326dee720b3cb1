// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CONNECTFOUR_MOVESYNC_HPP
#define CONNECTFOUR_MOVESYNC_HPP

#include "board.hpp"
#include "matchmaking.hpp"
#include "messages.hpp"

#include <ostream>

namespace connectfour
{

/**
 * Result of trying to apply a move.
 */
enum class MoveOutcome
{

  /** The move has been added to the board.  */
  ACCEPTED,

  /** The move is invalid and has been ignored.  */
  REJECTED,

  /**
   * The move cannot be applied yet because the previous one is still
   * settling.  It should be retried later.
   */
  DEFERRED,

};

std::ostream& operator<< (std::ostream& out, MoveOutcome o);

/**
 * The collaborator that animates dropped pieces.  For each move passed
 * to StartDrop, it must call MoveSynchronizer::OnMoveSettled exactly once
 * when the piece has landed (unless it is cleared before).
 */
class DropAnimator
{

public:

  DropAnimator () = default;
  virtual ~DropAnimator () = default;

  /**
   * Starts animating the given move.
   */
  virtual void StartDrop (const PlayerMove& mv) = 0;

  /**
   * Cancels all running animations, because the board has been reset.
   */
  virtual void Clear () = 0;

};

/**
 * Validates local and remote moves and applies them to the board, runs
 * win detection when they settle, and handles resets of the session.
 */
class MoveSynchronizer
{

private:

  Board& board;
  const SessionState& state;
  MessageSender& sender;

  /**
   * The animator used for dropped pieces.  If none is set, moves settle
   * right away.
   */
  DropAnimator* animator = nullptr;

  /**
   * Validates a move by the given player and adds it if possible.  For
   * remote moves, a move while the previous one settles is deferred
   * instead of rejected.
   */
  MoveOutcome TryMove (int player, int column, bool remote);

public:

  explicit MoveSynchronizer (Board& b, const SessionState& s,
                             MessageSender& snd)
    : board(b), state(s), sender(snd)
  {}

  MoveSynchronizer () = delete;
  MoveSynchronizer (const MoveSynchronizer&) = delete;
  void operator= (const MoveSynchronizer&) = delete;

  void
  SetAnimator (DropAnimator& a)
  {
    animator = &a;
  }

  /**
   * Returns true if the game is over, i.e. won or drawn (and the last
   * move has settled).
   */
  bool IsGameOver () const;

  /**
   * Makes a move for the local player (from user input) and publishes it.
   */
  MoveOutcome SubmitLocalMove (int column);

  /**
   * Applies a move by the local player that was found in the backlog (made
   * in an earlier run of the client).  It is not published again.
   */
  MoveOutcome ReplayLocalMove (int column);

  /**
   * Applies a move received from the opponent.
   */
  MoveOutcome ReceiveRemoteMove (int column);

  /**
   * Called when the piece of the given move has landed.  This checks for
   * a winner and passes the turn on otherwise.  Calls for moves that are not
   * the current settling move (e.g. from before a reset) are ignored.
   */
  void OnMoveSettled (const PlayerMove& mv);

  /**
   * Clears the board for a new game (e.g. when the opponent requested it).
   */
  void Reset ();

  /**
   * Requests a new game after the current one ended.  This resets the board
   * and notifies the opponent.  Returns false (and does nothing) if the game
   * is still running.
   */
  bool RequestReplay ();

};

} // namespace connectfour

#endif // CONNECTFOUR_MOVESYNC_HPP
