#pragma once

#include <cstddef>

namespace ttt {

inline constexpr std::size_t BOARD_SIZE = 3u;                      //!< Rows and columns of the grid.
inline constexpr std::size_t CELL_COUNT = BOARD_SIZE * BOARD_SIZE; //!< Number of cells on the board.

using Id = unsigned; //!< Row or column index used by the core library.

//! Coordinate pair for the board.
//! \note Origin (0,0) is the top left cell.
struct Coord {
	Id row, col;
};

//! True if the coordinate addresses a cell of the 3x3 grid.
inline constexpr bool isOnBoard(const Coord c) {
	return c.row < BOARD_SIZE && c.col < BOARD_SIZE;
}

//! The two player symbols. First is rendered as X and always opens the game.
enum class Mark { First = 1, Second = 2 };

//! Returns the opponent enum value of input mark.
inline constexpr Mark opponent(const Mark mark) {
	return mark == Mark::First ? Mark::Second : Mark::First;
}

//! Character used to display a mark.
inline constexpr char toSymbol(const Mark mark) {
	return mark == Mark::First ? 'X' : 'O';
}

} // namespace ttt
