#include "app/consoleInput.hpp"
#include "app/consoleView.hpp"
#include "app/logging.hpp"
#include "core/game.hpp"

#include <exception>
#include <format>
#include <iostream>

int main(int, char**) {
	try {
		ttt::app::ConsoleInput input(std::cin, std::cout);
		ttt::app::ConsoleView view(std::cout);

		ttt::Game game(input, view);
		game.run();
	} catch (const std::exception& e) {
		auto logger = ttt::app::Logger();
		logger.Log(Logging::LogLevel::Error, std::format("[Main] Unexpected error: {}", e.what()));
		std::cerr << "Unexpected error: " << e.what() << '\n';
	}

	// Every way the game ends is a normal exit.
	return 0;
}
