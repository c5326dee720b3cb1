// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "board.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace connectfour
{
namespace
{

using testing::ElementsAre;
using testing::IsEmpty;

TEST (OtherPlayerTests, Works)
{
  EXPECT_EQ (OtherPlayer (1), 2);
  EXPECT_EQ (OtherPlayer (2), 1);
  EXPECT_DEATH (OtherPlayer (0), "Invalid player");
}

class BoardTests : public testing::Test
{

protected:

  Board board;

};

TEST_F (BoardTests, Initial)
{
  EXPECT_THAT (board.GetMoves (), IsEmpty ());
  EXPECT_EQ (board.GetPlayerTurn (), 1);
  EXPECT_FALSE (board.HasWinner ());
  EXPECT_EQ (board.GetWinner (), NO_PLAYER);
  EXPECT_FALSE (board.IsInProgress ());
  EXPECT_FALSE (board.IsFull ());
}

TEST_F (BoardTests, ValidColumns)
{
  EXPECT_FALSE (Board::IsValidColumn (-1));
  EXPECT_TRUE (Board::IsValidColumn (0));
  EXPECT_TRUE (Board::IsValidColumn (6));
  EXPECT_FALSE (Board::IsValidColumn (7));
}

TEST_F (BoardTests, RowsAreStacked)
{
  EXPECT_EQ (board.AddMove (1, 3), PlayerMove (1, 3, 0));
  EXPECT_TRUE (board.IsInProgress ());
  board.Settle (NO_PLAYER);
  EXPECT_FALSE (board.IsInProgress ());

  EXPECT_EQ (board.AddMove (2, 3), PlayerMove (2, 3, 1));
  board.Settle (NO_PLAYER);
  EXPECT_EQ (board.AddMove (1, 0), PlayerMove (1, 0, 0));
  board.Settle (NO_PLAYER);

  EXPECT_THAT (board.GetMoves (), ElementsAre (PlayerMove (1, 3, 0),
                                               PlayerMove (2, 3, 1),
                                               PlayerMove (1, 0, 0)));
  EXPECT_EQ (board.CountInColumn (3), 2);
  EXPECT_EQ (board.CountInColumn (0), 1);
  EXPECT_EQ (board.CountInColumn (6), 0);

  EXPECT_EQ (board.GetCell (3, 0), 1);
  EXPECT_EQ (board.GetCell (3, 1), 2);
  EXPECT_EQ (board.GetCell (3, 2), NO_PLAYER);
  EXPECT_EQ (board.GetCell (-1, 0), NO_PLAYER);
}

TEST_F (BoardTests, TurnAlternates)
{
  for (int i = 0; i < 5; ++i)
    {
      EXPECT_EQ (board.GetPlayerTurn (), i % 2 == 0 ? 1 : 2);
      board.AddMove (board.GetPlayerTurn (), i);
      board.Settle (NO_PLAYER);
    }
  EXPECT_EQ (board.GetPlayerTurn (), 2);
}

TEST_F (BoardTests, WinnerFreezesTurn)
{
  board.AddMove (1, 0);
  board.Settle (1);

  EXPECT_TRUE (board.HasWinner ());
  EXPECT_EQ (board.GetWinner (), 1);
  EXPECT_EQ (board.GetPlayerTurn (), 1);
  EXPECT_FALSE (board.IsInProgress ());
}

TEST_F (BoardTests, FullColumn)
{
  for (int i = 0; i < Board::ROWS; ++i)
    {
      EXPECT_FALSE (board.IsColumnFull (2));
      board.AddMove (board.GetPlayerTurn (), 2);
      board.Settle (NO_PLAYER);
    }

  EXPECT_TRUE (board.IsColumnFull (2));
  EXPECT_DEATH (board.AddMove (1, 2), "is full");
}

TEST_F (BoardTests, InvalidOperations)
{
  EXPECT_DEATH (board.AddMove (1, 7), "Invalid column");
  EXPECT_DEATH (board.AddMove (3, 0), "Invalid player");
  EXPECT_DEATH (board.Settle (NO_PLAYER), "no move to settle");

  board.AddMove (1, 0);
  EXPECT_DEATH (board.AddMove (2, 1), "previous one is settling");
}

TEST_F (BoardTests, Reset)
{
  board.AddMove (1, 0);
  board.Settle (NO_PLAYER);
  board.AddMove (2, 0);
  board.Settle (2);

  board.Reset ();
  EXPECT_THAT (board.GetMoves (), IsEmpty ());
  EXPECT_EQ (board.GetPlayerTurn (), 1);
  EXPECT_FALSE (board.HasWinner ());
  EXPECT_FALSE (board.IsInProgress ());

  board.AddMove (1, 0);
  board.Reset ();
  EXPECT_FALSE (board.IsInProgress ());
}

} // anonymous namespace
} // namespace connectfour
