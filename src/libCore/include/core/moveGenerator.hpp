#pragma once

#include "core/board.hpp"
#include "core/move.hpp"
#include "core/piece.hpp"

namespace unvoid {

//! Royal: one step in any of the 8 directions onto an empty or opponent square.
MoveList royalMoves(const Board& board, Coord from, Player color);

//! Leaper: the 8 L-shaped offsets onto an empty or opponent square.
MoveList leaperMoves(const Board& board, Coord from, Player color);

//! Runner: 1 to 3 squares along the 8 directions onto an empty square.
//! A single opponent piece between origin and destination is captured, own pieces block the jump.
MoveList runnerMoves(const Board& board, Coord from, Player color);

//! All moves of the piece as if it was standing at `from`. Does not modify the board.
MoveList legalMoves(const Board& board, Coord from, Piece piece);

//! Returns the move to `to` from the list, if present.
std::optional<MoveDetail> findMove(const MoveList& moves, Coord to);

} // namespace unvoid
