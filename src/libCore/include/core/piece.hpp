#pragma once

#include "core/types.hpp"

#include <string_view>

namespace unvoid {

enum class PieceType {
	Runner, //!< Jumps 1-3 squares in a line. Captures by jumping over a single opponent piece.
	Leaper, //!< L-shaped jumps. Captures by landing on the opponent piece.
	Royal   //!< One square in any direction. Losing it loses the game.
};

//! A piece on the board. Pieces are values and are moved between squares, never shared.
struct Piece {
	PieceType type;
	Player color;

	bool operator==(const Piece&) const = default;
};

inline constexpr std::string_view toString(PieceType type) {
	switch (type) {
	case PieceType::Runner:
		return "Runner";
	case PieceType::Leaper:
		return "Leaper";
	case PieceType::Royal:
		return "Royal";
	}
	return "Unknown";
}

} // namespace unvoid
