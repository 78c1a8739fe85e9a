#include "app/consoleView.hpp"

#include "app/messages.hpp"

#include <format>

namespace ttt::app {

static char cellSymbol(const Cell& cell) {
	return cell ? toSymbol(*cell) : ' ';
}

ConsoleView::ConsoleView(std::ostream& out) : m_out{out} {
}

void ConsoleView::showBanner() {
	m_out << MSG_BANNER << '\n';
}

void ConsoleView::showBoard(const Board& board) {
	m_out << '\n';
	for (Id row = 0u; row != BOARD_SIZE; ++row) {
		if (row != 0u) {
			m_out << ROW_DIVIDER << '\n';
		}
		printRow(board, row);
	}
	m_out << '\n';
}

void ConsoleView::printRow(const Board& board, const Id row) {
	m_out << std::format(" {} | {} | {} \n", cellSymbol(board.getAt({row, 0u})), cellSymbol(board.getAt({row, 1u})), cellSymbol(board.getAt({row, 2u})));
}

void ConsoleView::showIllegalInput() {
	m_out << MSG_ILLEGAL_MOVE << '\n';
}

void ConsoleView::showMoveError(const MoveError error) {
	switch (error) {
	case MoveError::InvalidMove:
		m_out << MSG_INVALID_MOVE << '\n';
		break;
	case MoveError::OutOfRange:
		m_out << MSG_ILLEGAL_MOVE << '\n';
		break;
	case MoveError::GameOver:
		m_out << MSG_GAME_OVER << '\n';
		break;
	}
}

void ConsoleView::showResult(const GameStatus status) {
	switch (status) {
	case GameStatus::FirstWin:
		m_out << MSG_FIRST_WON << '\n';
		break;
	case GameStatus::SecondWin:
		m_out << MSG_SECOND_WON << '\n';
		break;
	case GameStatus::Draw:
		m_out << MSG_DRAW << '\n';
		break;
	case GameStatus::Active:
		break;
	}
}

} // namespace ttt::app
