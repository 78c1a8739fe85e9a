#pragma once

#include "core/IPlayerInput.hpp"

#include <istream>
#include <ostream>

namespace ttt::app {

//! Reads one move per line from a text stream after prompting the player to move.
//! \note Running out of input counts as a quit request.
class ConsoleInput : public IPlayerInput {
public:
	ConsoleInput(std::istream& in, std::ostream& out);

	UserInput nextInput(Mark toMove) override;

private:
	std::istream& m_in;
	std::ostream& m_out;
};

} // namespace ttt::app
