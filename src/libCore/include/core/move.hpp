#pragma once

#include "core/types.hpp"

#include <optional>
#include <vector>

namespace unvoid {

//! A candidate move of one piece. Only valid for the board state it was generated from.
struct MoveDetail {
	Coord to;                           //!< Destination square.
	bool isCapture{false};              //!< Move removes an opponent piece.
	std::optional<Coord> jumpedPiece{}; //!< Runner captures only: square of the piece jumped over.
};

using MoveList = std::vector<MoveDetail>;

} // namespace unvoid
