#include "core/gameState.hpp"

namespace ttt {

GameState GameState::played(const Coord c) const {
	return GameState{
	        .board     = board.withMark(c, toMove),
	        .toMove    = opponent(toMove),
	        .moveCount = moveCount + 1,
	};
}

} // namespace ttt
