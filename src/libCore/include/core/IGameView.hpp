#pragma once

#include "core/board.hpp"
#include "core/gameStatus.hpp"
#include "core/moveChecker.hpp"

namespace ttt {

//! Everything the game loop shows to the players.
class IGameView {
public:
	virtual ~IGameView() = default;

	virtual void showBanner()                   = 0; //!< Instructions, shown once before the first board.
	virtual void showBoard(const Board& board)  = 0;
	virtual void showIllegalInput()             = 0;
	virtual void showMoveError(MoveError error) = 0;
	virtual void showResult(GameStatus status)  = 0; //!< Shown exactly once when the game ends.
};

} // namespace ttt
