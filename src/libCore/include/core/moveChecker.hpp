#pragma once

#include "core/gameState.hpp"
#include "core/types.hpp"

#include <variant>

namespace ttt {

//! Reasons a move is rejected. The state stays unchanged for all of them.
enum class MoveError {
	InvalidMove, //!< Target cell already occupied.
	OutOfRange,  //!< Row or column outside [0, 2].
	GameOver     //!< The game already ended.
};

//! Either the state after the move or the reason it was rejected.
using MoveResult = std::variant<GameState, MoveError>;

//! Validate a move for the player to move and compute the resulting state.
//! Checks, in this order: game not over, coordinate on the board, target cell empty.
MoveResult applyMove(const GameState& state, Coord c);

} // namespace ttt
