// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CONNECTFOUR_BOARD_HPP
#define CONNECTFOUR_BOARD_HPP

#include <cstddef>
#include <ostream>
#include <vector>

namespace connectfour
{

/** Value used for "no player" (e.g. empty cells or no winner).  */
constexpr int NO_PLAYER = 0;

/**
 * Returns the other player (1 for 2 and 2 for 1).
 */
int OtherPlayer (int player);

/**
 * A single piece dropped by one of the players.  The row is the number of
 * pieces that were in the column before (row 0 is the bottom).
 */
struct PlayerMove
{

  int player;
  int column;
  int row;

  PlayerMove (const int p, const int c, const int r)
    : player(p), column(c), row(r)
  {}

  friend bool operator== (const PlayerMove& a, const PlayerMove& b);
  friend bool operator!= (const PlayerMove& a, const PlayerMove& b);

};

std::ostream& operator<< (std::ostream& out, const PlayerMove& mv);

/**
 * The logical state of one game:  The moves made so far, whose turn it is,
 * the winner (if any) and whether a dropped piece is still settling.
 *
 * The board enforces its structural invariants with CHECKs.  Validating
 * moves against the game rules is up to MoveSynchronizer.
 */
class Board
{

private:

  /** All moves in the order they were made.  */
  std::vector<PlayerMove> moves;

  /** The player whose turn it is.  */
  int playerTurn = 1;

  /** The winner, or NO_PLAYER.  */
  int winner = NO_PLAYER;

  /** Whether the last move is still being animated.  */
  bool inProgress = false;

public:

  /** Number of columns on the board.  */
  static constexpr int COLUMNS = 7;

  /** Number of rows, i.e. the capacity of each column.  */
  static constexpr int ROWS = 6;

  /** Total number of cells.  */
  static constexpr int CELLS = COLUMNS * ROWS;

  Board () = default;

  Board (const Board&) = delete;
  void operator= (const Board&) = delete;

  /**
   * Returns true if the given value is a column on the board.
   */
  static bool IsValidColumn (int column);

  const std::vector<PlayerMove>&
  GetMoves () const
  {
    return moves;
  }

  int
  GetPlayerTurn () const
  {
    return playerTurn;
  }

  bool
  HasWinner () const
  {
    return winner != NO_PLAYER;
  }

  int
  GetWinner () const
  {
    return winner;
  }

  bool
  IsInProgress () const
  {
    return inProgress;
  }

  /**
   * Returns the number of pieces in the given column.
   */
  int CountInColumn (int column) const;

  bool
  IsColumnFull (const int column) const
  {
    return CountInColumn (column) >= ROWS;
  }

  bool
  IsFull () const
  {
    return moves.size () >= static_cast<size_t> (CELLS);
  }

  /**
   * Returns the player owning the given cell, or NO_PLAYER if it is empty
   * (or off the board).
   */
  int GetCell (int column, int row) const;

  /**
   * Appends a move by the given player into a column.  The column must not be
   * full.  The move is marked as in progress until it is settled.
   */
  PlayerMove AddMove (int player, int column);

  /**
   * Marks the last move as settled.  If winner is not NO_PLAYER, the game
   * ends with that winner.  Otherwise the turn passes to the other player.
   */
  void Settle (int newWinner);

  /**
   * Clears the board for a new game, starting with player 1.
   */
  void Reset ();

};

} // namespace connectfour

#endif // CONNECTFOUR_BOARD_HPP
