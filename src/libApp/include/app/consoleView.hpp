#pragma once

#include "core/IGameView.hpp"

#include <ostream>

namespace ttt::app {

//! Renders the game as plain text.
class ConsoleView : public IGameView {
public:
	explicit ConsoleView(std::ostream& out);

	void showBanner() override;
	void showBoard(const Board& board) override;
	void showIllegalInput() override;
	void showMoveError(MoveError error) override;
	void showResult(GameStatus status) override;

private:
	void printRow(const Board& board, Id row);

private:
	std::ostream& m_out;
};

} // namespace ttt::app
