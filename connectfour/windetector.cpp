// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "windetector.hpp"

#include <array>

namespace connectfour
{

namespace
{

/**
 * An axis along which lines are scanned, given as the step in column
 * and row direction.  Each axis is scanned both forwards and backwards.
 */
struct Axis
{
  int dColumn;
  int dRow;
};

/** The four axes:  horizontal, vertical and the two diagonals.  */
constexpr std::array<Axis, 4> AXES = {{
  {1, 0},
  {0, 1},
  {1, 1},
  {1, -1},
}};

/**
 * The cells of the board, indexed by column and row.
 */
class Grid
{

private:

  std::array<std::array<int, Board::ROWS>, Board::COLUMNS> cells;

public:

  explicit Grid (const std::vector<PlayerMove>& moves)
  {
    for (auto& col : cells)
      col.fill (NO_PLAYER);

    for (const auto& mv : moves)
      if (IsOnBoard (mv.column, mv.row))
        cells[mv.column][mv.row] = mv.player;
  }

  static bool
  IsOnBoard (const int column, const int row)
  {
    return column >= 0 && column < Board::COLUMNS
              && row >= 0 && row < Board::ROWS;
  }

  int
  Get (const int column, const int row) const
  {
    if (!IsOnBoard (column, row))
      return NO_PLAYER;
    return cells[column][row];
  }

  /**
   * Counts how many cells starting next to (column, row) in the given
   * direction belong to the player, until the first one that does not.
   */
  int
  CountFrom (const int column, const int row, const int dColumn,
             const int dRow, const int player) const
  {
    int res = 0;
    int c = column + dColumn;
    int r = row + dRow;
    while (Get (c, r) == player)
      {
        ++res;
        c += dColumn;
        r += dRow;
      }

    return res;
  }

};

} // anonymous namespace

bool
HasWinningLine (const std::vector<PlayerMove>& moves)
{
  const Grid grid(moves);

  for (const auto& mv : moves)
    {
      if (mv.player == NO_PLAYER || !Grid::IsOnBoard (mv.column, mv.row))
        continue;

      /* With duplicate cells, only the move that is actually on the
         grid counts.  */
      if (grid.Get (mv.column, mv.row) != mv.player)
        continue;

      for (const auto& axis : AXES)
        {
          const int total
              = 1
                + grid.CountFrom (mv.column, mv.row,
                                  axis.dColumn, axis.dRow, mv.player)
                + grid.CountFrom (mv.column, mv.row,
                                  -axis.dColumn, -axis.dRow, mv.player);
          if (total >= WINNING_LENGTH)
            return true;
        }
    }

  return false;
}

} // namespace connectfour
