#include "core/winChecker.hpp"

#include <algorithm>

namespace ttt {

bool hasWon(const Board& board, const Mark mark) {
	return std::any_of(LINES.begin(), LINES.end(), [&](const Line& line) {
		return std::all_of(line.begin(), line.end(), [&](const Coord c) { return board.getAt(c) == mark; });
	});
}

bool isFull(const Board& board) {
	return board.occupiedCount() == CELL_COUNT;
}

GameStatus evaluateStatus(const Board& board) {
	if (hasWon(board, Mark::First)) {
		return GameStatus::FirstWin;
	}
	if (hasWon(board, Mark::Second)) {
		return GameStatus::SecondWin;
	}
	if (isFull(board)) {
		return GameStatus::Draw;
	}
	return GameStatus::Active;
}

} // namespace ttt
