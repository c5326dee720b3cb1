// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "movesync.hpp"

#include "windetector.hpp"

#include <glog/logging.h>

namespace connectfour
{

std::ostream&
operator<< (std::ostream& out, const MoveOutcome o)
{
  switch (o)
    {
    case MoveOutcome::ACCEPTED:
      return out << "accepted";
    case MoveOutcome::REJECTED:
      return out << "rejected";
    case MoveOutcome::DEFERRED:
      return out << "deferred";
    }

  LOG (FATAL) << "Invalid move outcome: " << static_cast<int> (o);
}

bool
MoveSynchronizer::IsGameOver () const
{
  if (board.IsInProgress ())
    return false;

  return board.HasWinner () || board.IsFull ();
}

MoveOutcome
MoveSynchronizer::TryMove (const int player, const int column,
                           const bool remote)
{
  const int local = state.GetLocalPlayer ();
  if (local == NO_PLAYER)
    {
      VLOG (1) << "Ignoring move, we are not playing";
      return MoveOutcome::REJECTED;
    }

  if (board.HasWinner ())
    {
      VLOG (1) << "Ignoring move after the game was won";
      return MoveOutcome::REJECTED;
    }

  if (!Board::IsValidColumn (column))
    {
      VLOG (1) << "Ignoring move into invalid column " << column;
      return MoveOutcome::REJECTED;
    }

  if (board.IsInProgress ())
    {
      if (remote)
        {
          VLOG (1) << "Deferring remote move while the last one settles";
          return MoveOutcome::DEFERRED;
        }
      VLOG (1) << "Ignoring local move while the last one settles";
      return MoveOutcome::REJECTED;
    }

  if (board.GetPlayerTurn () != player)
    {
      VLOG (1) << "Ignoring move by player " << player << " out of turn";
      return MoveOutcome::REJECTED;
    }

  if (board.IsColumnFull (column))
    {
      VLOG (1) << "Ignoring move into full column " << column;
      return MoveOutcome::REJECTED;
    }

  const PlayerMove mv = board.AddMove (player, column);
  VLOG (1) << "Added move " << mv;

  if (animator != nullptr)
    animator->StartDrop (mv);
  else
    OnMoveSettled (mv);

  return MoveOutcome::ACCEPTED;
}

MoveOutcome
MoveSynchronizer::SubmitLocalMove (const int column)
{
  const MoveOutcome res = TryMove (state.GetLocalPlayer (), column, false);
  if (res == MoveOutcome::ACCEPTED && !sender.SendMove (column))
    LOG (ERROR) << "Could not queue our move into column " << column;

  return res;
}

MoveOutcome
MoveSynchronizer::ReplayLocalMove (const int column)
{
  return TryMove (state.GetLocalPlayer (), column, true);
}

MoveOutcome
MoveSynchronizer::ReceiveRemoteMove (const int column)
{
  const int local = state.GetLocalPlayer ();
  if (local == NO_PLAYER)
    {
      VLOG (1) << "Ignoring remote move, we are not playing";
      return MoveOutcome::REJECTED;
    }

  return TryMove (OtherPlayer (local), column, true);
}

void
MoveSynchronizer::OnMoveSettled (const PlayerMove& mv)
{
  const auto& moves = board.GetMoves ();
  if (!board.IsInProgress () || moves.empty () || moves.back () != mv)
    {
      VLOG (1) << "Ignoring stale settlement of " << mv;
      return;
    }

  if (HasWinningLine (moves))
    {
      LOG (INFO) << "Player " << mv.player << " won the game";
      board.Settle (mv.player);
      return;
    }

  board.Settle (NO_PLAYER);
  if (board.IsFull ())
    LOG (INFO) << "The game ended in a draw";
}

void
MoveSynchronizer::Reset ()
{
  LOG (INFO) << "Resetting the board";
  board.Reset ();
  if (animator != nullptr)
    animator->Clear ();
}

bool
MoveSynchronizer::RequestReplay ()
{
  if (!IsGameOver ())
    {
      VLOG (1) << "Replay requested while the game is still running";
      return false;
    }

  Reset ();
  if (!sender.SendReset ())
    LOG (ERROR) << "Could not queue the reset request";

  return true;
}

} // namespace connectfour
