#pragma once

#include "core/board.hpp"
#include "core/gameStatus.hpp"

#include <array>

namespace ttt {

using Line = std::array<Coord, BOARD_SIZE>;

//! The 8 winning lines: 3 rows, 3 columns, 2 diagonals.
inline constexpr std::array<Line, 8> LINES{{
        {{{0u, 0u}, {0u, 1u}, {0u, 2u}}},
        {{{1u, 0u}, {1u, 1u}, {1u, 2u}}},
        {{{2u, 0u}, {2u, 1u}, {2u, 2u}}},
        {{{0u, 0u}, {1u, 0u}, {2u, 0u}}},
        {{{0u, 1u}, {1u, 1u}, {2u, 1u}}},
        {{{0u, 2u}, {1u, 2u}, {2u, 2u}}},
        {{{0u, 0u}, {1u, 1u}, {2u, 2u}}},
        {{{0u, 2u}, {1u, 1u}, {2u, 0u}}},
}};

//! True if mark occupies all three cells of any line.
bool hasWon(const Board& board, Mark mark);

//! True if all cells are occupied, regardless of mark.
//! \note Only means a draw once neither player has won.
bool isFull(const Board& board);

//! Status of a board. A First win beats a Second win, any win beats a full board.
GameStatus evaluateStatus(const Board& board);

} // namespace ttt
