#include "core/game.hpp"
#include "core/moveChecker.hpp"
#include "core/winChecker.hpp"

#include "Logging.hpp"

#include <format>
#include <string_view>
#include <variant>

namespace ttt {

static std::string_view toString(const GameStatus status) {
	switch (status) {
	case GameStatus::Active:
		return "active";
	case GameStatus::FirstWin:
		return "X won";
	case GameStatus::SecondWin:
		return "O won";
	case GameStatus::Draw:
		return "draw";
	}
	return "unknown";
}

static std::string_view toString(const MoveError error) {
	switch (error) {
	case MoveError::InvalidMove:
		return "cell occupied";
	case MoveError::OutOfRange:
		return "out of range";
	case MoveError::GameOver:
		return "game over";
	}
	return "unknown";
}

Game::Game(IPlayerInput& input, IGameView& view) : m_input{input}, m_view{view} {
}

GameStatus Game::run() {
	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, "[Game] Game started.");

	m_view.showBanner();
	m_view.showBoard(m_state.board);

	m_gameActive = true;
	while (m_gameActive) {
		m_status = evaluateStatus(m_state.board);
		if (isTerminal(m_status)) {
			m_gameActive = false;
			m_view.showResult(m_status);
			logger.Log(Logging::LogLevel::Info, std::format("[Game] Game over after {} moves: {}.", m_state.moveCount, toString(m_status)));
			break;
		}

		const auto input = m_input.nextInput(m_state.toMove);
		std::visit([&](auto&& in) { handleInput(in); }, input);
	}

	return m_status;
}

const GameState& Game::state() const {
	return m_state;
}

GameStatus Game::status() const {
	return m_status;
}

bool Game::isActive() const {
	return m_gameActive;
}

void Game::handleInput(const MoveInput& input) {
	auto logger = Logger();

	const auto result = applyMove(m_state, input.c);
	if (const auto* error = std::get_if<MoveError>(&result)) {
		logger.Log(Logging::LogLevel::Info,
		           std::format("[Game] Rejected move {},{} by {}: {}.", input.c.row, input.c.col, toSymbol(m_state.toMove), toString(*error)));
		m_view.showMoveError(*error);
		return;
	}

	logger.Log(Logging::LogLevel::Debug, std::format("[Game] Move {}: {} at {},{}.", m_state.moveCount + 1, toSymbol(m_state.toMove), input.c.row, input.c.col));
	m_state = std::get<GameState>(result);
	m_view.showBoard(m_state.board);
}

void Game::handleInput(const QuitInput&) {
	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[Game] {} quit after {} moves.", toSymbol(m_state.toMove), m_state.moveCount));

	m_gameActive = false;
}

void Game::handleInput(const IllegalInput&) {
	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[Game] Illegal input from {}.", toSymbol(m_state.toMove)));

	m_view.showIllegalInput();
}

} // namespace ttt
