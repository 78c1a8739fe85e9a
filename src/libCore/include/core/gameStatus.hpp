#pragma once

namespace ttt {

enum class GameStatus {
	Active,    //!< Game being played.
	FirstWin,  //!< X completed a line.
	SecondWin, //!< O completed a line.
	Draw       //!< Board full without a line.
};

//! True for every status that ends the game.
inline constexpr bool isTerminal(const GameStatus status) {
	return status != GameStatus::Active;
}

} // namespace ttt
