#include "app/inputParser.hpp"

#include <gtest/gtest.h>

#include <string>

namespace ttt::gtest {

TEST(InputParser, Quit) {
	EXPECT_TRUE(std::holds_alternative<QuitInput>(app::parseInput("q")));
	EXPECT_TRUE(std::holds_alternative<QuitInput>(app::parseInput("  q \t")));
}

TEST(InputParser, MoveValid) {
	for (Id first = 0u; first != 3u; ++first) {
		for (Id second = 0u; second != 3u; ++second) {
			const auto input = app::parseInput(std::to_string(first) + "," + std::to_string(second));
			ASSERT_TRUE(std::holds_alternative<MoveInput>(input));

			const auto c = std::get<MoveInput>(input).c;
			EXPECT_EQ(c.row, first);
			EXPECT_EQ(c.col, second);
		}
	}
}

TEST(InputParser, FirstDigitIsRow) {
	const auto input = app::parseInput(" 0,2\r");
	ASSERT_TRUE(std::holds_alternative<MoveInput>(input));
	EXPECT_EQ(std::get<MoveInput>(input).c.row, 0u);
	EXPECT_EQ(std::get<MoveInput>(input).c.col, 2u);
}

TEST(InputParser, MoveInvalid) {
	for (const char* line: {"", " ", "5,5", "3,0", "0,3", "0,", ",0", "00", "0;0", "0, 0", "1,1,1", "a,b", "-1,0", "Q", "quit", "qq"}) {
		EXPECT_TRUE(std::holds_alternative<IllegalInput>(app::parseInput(line))) << "'" << line << "'";
	}
}

} // namespace ttt::gtest
