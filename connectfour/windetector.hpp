// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CONNECTFOUR_WINDETECTOR_HPP
#define CONNECTFOUR_WINDETECTOR_HPP

#include "board.hpp"

#include <vector>

namespace connectfour
{

/** Number of contiguous pieces needed to win.  */
constexpr int WINNING_LENGTH = 4;

/**
 * Returns true if some player has WINNING_LENGTH or more contiguous pieces
 * in a row, column or diagonal.  The result depends only on the set of
 * moves, not on their order.  Moves off the board are ignored.
 */
bool HasWinningLine (const std::vector<PlayerMove>& moves);

} // namespace connectfour

#endif // CONNECTFOUR_WINDETECTOR_HPP
