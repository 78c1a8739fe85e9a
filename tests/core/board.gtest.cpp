#include "core/board.hpp"
#include "core/gameState.hpp"

#include <gtest/gtest.h>

namespace ttt::gtest {

TEST(Board, EmptyOnConstruction) {
	const Board board;
	for (Id row = 0u; row != BOARD_SIZE; ++row) {
		for (Id col = 0u; col != BOARD_SIZE; ++col) {
			EXPECT_FALSE(board.getAt({row, col}).has_value());
			EXPECT_TRUE(board.isEmpty({row, col}));
		}
	}
	EXPECT_EQ(board.occupiedCount(), 0u);
}

// Every cell can be set and no other cell changes
TEST(Board, WithMarkSetsOnlyTargetCell) {
	for (Id row = 0u; row != BOARD_SIZE; ++row) {
		for (Id col = 0u; col != BOARD_SIZE; ++col) {
			const Board board = Board{}.withMark({1u, 1u}, Mark::Second);
			if (row == 1u && col == 1u) {
				continue;
			}

			const Board next = board.withMark({row, col}, Mark::First);
			EXPECT_EQ(next.getAt({row, col}), Mark::First);
			EXPECT_EQ(next.occupiedCount(), 2u);

			for (Id r = 0u; r != BOARD_SIZE; ++r) {
				for (Id c = 0u; c != BOARD_SIZE; ++c) {
					if (r != row || c != col) {
						EXPECT_EQ(next.getAt({r, c}), board.getAt({r, c}));
					}
				}
			}
		}
	}
}

TEST(Board, WithMarkKeepsOriginal) {
	const Board board    = Board{}.withMark({0u, 2u}, Mark::First);
	const Board snapshot = board;

	const Board next = board.withMark({2u, 0u}, Mark::Second);

	EXPECT_EQ(board, snapshot);
	EXPECT_TRUE(board.isEmpty({2u, 0u}));
	EXPECT_EQ(next.getAt({2u, 0u}), Mark::Second);
	EXPECT_NE(next, board);
}

TEST(GameState, Initial) {
	const GameState state;
	EXPECT_EQ(state.board, Board{});
	EXPECT_EQ(state.toMove, Mark::First);
	EXPECT_EQ(state.moveCount, 0u);
}

TEST(GameState, PlayedTogglesMover) {
	const GameState start;

	const auto first = start.played({0u, 0u});
	EXPECT_EQ(first.board.getAt({0u, 0u}), Mark::First);
	EXPECT_EQ(first.toMove, Mark::Second);
	EXPECT_EQ(first.moveCount, 1u);

	const auto second = first.played({1u, 1u});
	EXPECT_EQ(second.board.getAt({1u, 1u}), Mark::Second);
	EXPECT_EQ(second.toMove, Mark::First);
	EXPECT_EQ(second.moveCount, 2u);
	EXPECT_EQ(second.board.occupiedCount(), second.moveCount);

	// Input states untouched
	EXPECT_EQ(start, GameState{});
	EXPECT_TRUE(first.board.isEmpty({1u, 1u}));
}

TEST(Types, Opponent) {
	EXPECT_EQ(opponent(Mark::First), Mark::Second);
	EXPECT_EQ(opponent(Mark::Second), Mark::First);
	EXPECT_EQ(opponent(opponent(Mark::First)), Mark::First);

	EXPECT_EQ(toSymbol(Mark::First), 'X');
	EXPECT_EQ(toSymbol(Mark::Second), 'O');
}

TEST(Types, IsOnBoard) {
	EXPECT_TRUE(isOnBoard({0u, 0u}));
	EXPECT_TRUE(isOnBoard({2u, 2u}));
	EXPECT_FALSE(isOnBoard({3u, 0u}));
	EXPECT_FALSE(isOnBoard({0u, 3u}));
	EXPECT_FALSE(isOnBoard({5u, 5u}));
}

} // namespace ttt::gtest
