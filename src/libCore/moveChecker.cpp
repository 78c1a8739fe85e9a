#include "core/moveChecker.hpp"

#include "core/winChecker.hpp"

namespace ttt {

MoveResult applyMove(const GameState& state, const Coord c) {
	if (isTerminal(evaluateStatus(state.board))) {
		return MoveError::GameOver;
	}
	if (!isOnBoard(c)) {
		return MoveError::OutOfRange;
	}
	if (!state.board.isEmpty(c)) {
		return MoveError::InvalidMove;
	}

	return state.played(c);
}

} // namespace ttt
