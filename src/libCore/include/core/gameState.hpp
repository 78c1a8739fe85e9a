#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

namespace ttt {

//! The current game position.
struct GameState {
	Board board;              //!< Current board.
	Mark toMove{Mark::First}; //!< Player making the next move.
	unsigned moveCount{0};    //!< Moves applied so far. Equals the occupied cell count.

public:
	//! State after the player to move marks the cell at c.
	//! \note Assumes the move is legal.
	GameState played(Coord c) const;

	bool operator==(const GameState&) const = default;
};

} // namespace ttt
