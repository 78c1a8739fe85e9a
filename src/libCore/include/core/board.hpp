#pragma once

#include "core/types.hpp"

#include <array>
#include <optional>

namespace ttt {

//! A single grid position. Empty or holding exactly one mark.
using Cell = std::optional<Mark>;

//! Immutable 3x3 board.
//! Cells are stored row major (row * 3 + col). Updates return a new board and leave the original untouched.
class Board {
public:
	Board() = default;

	Cell getAt(Coord c) const;                //!< Get the cell at (row, col) \in [0, 2].
	Board withMark(Coord c, Mark mark) const; //!< Copy of this board with the cell at c set to mark.

	bool isEmpty(Coord c) const;       //!< True if no mark occupies the given cell.
	std::size_t occupiedCount() const; //!< Number of cells holding a mark.

	bool operator==(const Board&) const = default;

private:
	std::array<Cell, CELL_COUNT> m_cells{}; //!< Board values.
};

} // namespace ttt
