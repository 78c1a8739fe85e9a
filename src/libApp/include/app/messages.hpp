#pragma once

#include <string_view>

namespace ttt::app {

// Console texts
inline constexpr std::string_view MSG_BANNER       = "row and col each can be 0, 1, or 2.  Top left is 0,0.";
inline constexpr std::string_view MSG_PROMPT       = "Enter row,col for next move for {}, or q to quit: ";
inline constexpr std::string_view MSG_INVALID_MOVE = "Invalid move.";
inline constexpr std::string_view MSG_ILLEGAL_MOVE = "Illegal move.";
inline constexpr std::string_view MSG_GAME_OVER    = "Game over.";
inline constexpr std::string_view MSG_FIRST_WON    = "Player X has won -- game over.";
inline constexpr std::string_view MSG_SECOND_WON   = "Player O has won -- game over.";
inline constexpr std::string_view MSG_DRAW         = "The board is full, no winner -- game over.";

inline constexpr std::string_view ROW_DIVIDER = "-----------";
inline constexpr std::string_view CMD_QUIT    = "q";

} // namespace ttt::app
