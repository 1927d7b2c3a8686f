#pragma once

#include "core/gameState.hpp"
#include "core/piece.hpp"

#include <string>
#include <string_view>

namespace unvoid::console {

//! Unicode chess glyph of the piece.
std::string_view glyph(Piece piece);

//! Draw the board with coordinates, the selected square and the reachable squares of the selection.
//! \note Top row first. Empty squares: '.' plain move, '•' capture move of the selected piece.
std::string renderBoard(const GameState& game);

//! "Turn: White" or the winner announcement of a finished game.
std::string turnInfo(const GameState& game);

} // namespace unvoid::console
