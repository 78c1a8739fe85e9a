#include "app/inputParser.hpp"

#include "app/messages.hpp"

#include <algorithm>
#include <cctype>

namespace ttt::app {

namespace {

void trimInPlace(std::string& text) {
	auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
	auto first   = std::find_if_not(text.begin(), text.end(), isSpace);
	if (first == text.end()) {
		text.clear();
		return;
	}
	auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
	text.assign(first, last);
}

bool isIndexDigit(const char c) {
	return c >= '0' && c < static_cast<char>('0' + BOARD_SIZE);
}

} // namespace

UserInput parseInput(std::string line) {
	trimInPlace(line);

	if (line == CMD_QUIT) {
		return QuitInput{};
	}

	// Expect "row,col"
	if (line.size() != 3u || line[1u] != ',' || !isIndexDigit(line[0u]) || !isIndexDigit(line[2u])) {
		return IllegalInput{};
	}

	return MoveInput{.c = {static_cast<Id>(line[0u] - '0'), static_cast<Id>(line[2u] - '0')}};
}

} // namespace ttt::app
