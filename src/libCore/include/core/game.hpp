#pragma once

#include "core/IGameView.hpp"
#include "core/IPlayerInput.hpp"
#include "core/gameState.hpp"
#include "core/gameStatus.hpp"
#include "core/userInput.hpp"

namespace ttt {

//! Core game setup.
//! Owns the turn loop. Reading moves and displaying the game is delegated to the input and view.
class Game {
public:
	//! Setup a game with an empty board and X to move, without starting the game loop.
	Game(IPlayerInput& input, IGameView& view);

	//! Run the main game loop until the game ends or the player quits (blocking).
	//! \returns Final status of the game; Active if the player quit.
	GameStatus run();

	const GameState& state() const; //!< Current position.
	GameStatus status() const;      //!< Status of the current position.
	bool isActive() const;          //!< Return if the game loop is running.

private:
	void handleInput(const MoveInput& input);
	void handleInput(const QuitInput& input);
	void handleInput(const IllegalInput& input);

private:
	bool m_gameActive{false};
	GameState m_state{};
	GameStatus m_status{GameStatus::Active};

	IPlayerInput& m_input;
	IGameView& m_view;
};

} // namespace ttt
