#pragma once

#include "core/userInput.hpp"

#include <string>

namespace ttt::app {

//! Console line to user input.
//! Accepts "q" or "<row>,<col>" with digits 0-2, ignoring surrounding whitespace. Anything else is illegal.
UserInput parseInput(std::string line);

} // namespace ttt::app
