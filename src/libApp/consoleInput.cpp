#include "app/consoleInput.hpp"

#include "app/inputParser.hpp"
#include "app/logging.hpp"
#include "app/messages.hpp"

#include <format>
#include <string>
#include <utility>

namespace ttt::app {

ConsoleInput::ConsoleInput(std::istream& in, std::ostream& out) : m_in{in}, m_out{out} {
}

UserInput ConsoleInput::nextInput(const Mark toMove) {
	m_out << std::format(MSG_PROMPT, toSymbol(toMove)) << std::flush;

	std::string line;
	if (!std::getline(m_in, line)) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Warning, "[ConsoleInput] Input stream closed, quitting.");
		return QuitInput{};
	}

	return parseInput(std::move(line));
}

} // namespace ttt::app
