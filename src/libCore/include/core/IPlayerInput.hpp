#pragma once

#include "core/types.hpp"
#include "core/userInput.hpp"

namespace ttt {

//! Source of player decisions. Blocks until the player made one.
class IPlayerInput {
public:
	virtual ~IPlayerInput()                  = default;
	virtual UserInput nextInput(Mark toMove) = 0;
};

} // namespace ttt
