#include "core/board.hpp"

#include <algorithm>
#include <cassert>

namespace ttt {

static std::size_t toIndex(const Coord c) {
	return c.row * BOARD_SIZE + c.col;
}

Cell Board::getAt(const Coord c) const {
	assert(isOnBoard(c)); // Callers validate coordinates before touching the board.

	return m_cells[toIndex(c)];
}

Board Board::withMark(const Coord c, const Mark mark) const {
	assert(isOnBoard(c));

	Board next = *this;
	next.m_cells[toIndex(c)] = mark;
	return next;
}

bool Board::isEmpty(const Coord c) const {
	return !getAt(c).has_value();
}

std::size_t Board::occupiedCount() const {
	return static_cast<std::size_t>(std::count_if(m_cells.begin(), m_cells.end(), [](const Cell& cell) { return cell.has_value(); }));
}

} // namespace ttt
