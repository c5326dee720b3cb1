// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "board.hpp"

#include <glog/logging.h>

namespace connectfour
{

int
OtherPlayer (const int player)
{
  switch (player)
    {
    case 1:
      return 2;
    case 2:
      return 1;
    }

  LOG (FATAL) << "Invalid player: " << player;
}

bool
operator== (const PlayerMove& a, const PlayerMove& b)
{
  return a.player == b.player && a.column == b.column && a.row == b.row;
}

bool
operator!= (const PlayerMove& a, const PlayerMove& b)
{
  return !(a == b);
}

std::ostream&
operator<< (std::ostream& out, const PlayerMove& mv)
{
  out << "(P" << mv.player << ", col " << mv.column << ", row " << mv.row
      << ")";
  return out;
}

bool
Board::IsValidColumn (const int column)
{
  return column >= 0 && column < COLUMNS;
}

int
Board::CountInColumn (const int column) const
{
  CHECK (IsValidColumn (column)) << "Invalid column: " << column;

  int res = 0;
  for (const auto& mv : moves)
    if (mv.column == column)
      ++res;

  return res;
}

int
Board::GetCell (const int column, const int row) const
{
  for (const auto& mv : moves)
    if (mv.column == column && mv.row == row)
      return mv.player;

  return NO_PLAYER;
}

PlayerMove
Board::AddMove (const int player, const int column)
{
  CHECK (player == 1 || player == 2) << "Invalid player: " << player;
  CHECK (!HasWinner ()) << "Move added after the game was won";
  CHECK (!inProgress) << "Move added while the previous one is settling";

  const int row = CountInColumn (column);
  CHECK_LT (row, ROWS) << "Column " << column << " is full";

  moves.emplace_back (player, column, row);
  inProgress = true;

  return moves.back ();
}

void
Board::Settle (const int newWinner)
{
  CHECK (inProgress) << "There is no move to settle";
  CHECK (!HasWinner ());
  inProgress = false;

  if (newWinner != NO_PLAYER)
    {
      CHECK (newWinner == 1 || newWinner == 2)
          << "Invalid winner: " << newWinner;
      winner = newWinner;
      return;
    }

  playerTurn = OtherPlayer (playerTurn);
}

void
Board::Reset ()
{
  moves.clear ();
  playerTurn = 1;
  winner = NO_PLAYER;
  inProgress = false;
}

} // namespace connectfour
