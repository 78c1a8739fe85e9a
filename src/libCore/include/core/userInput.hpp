#pragma once

#include "core/types.hpp"

#include <variant>

namespace ttt {

struct MoveInput {
	Coord c;
};
struct QuitInput {};
struct IllegalInput {}; //!< Input that does not follow the move grammar.

using UserInput = std::variant<MoveInput, QuitInput, IllegalInput>;

} // namespace ttt
