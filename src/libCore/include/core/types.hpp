#pragma once

#include <cstddef>
#include <string_view>

namespace unvoid {

using Id = unsigned; //!< Board index used by the core library.

static constexpr std::size_t kMinBoardDimension = 6u;  //!< Smallest allowed board width/height.
static constexpr std::size_t kMaxBoardDimension = 12u; //!< Largest allowed board width/height.

//! Coordinate pair for the board.
//! \note Origin is at the bottom left of the board. Column: A->0, B->1, etc. Row 1 -> 0.
struct Coord {
	Id x, y;

	bool operator==(const Coord&) const = default;
};

enum class Player { White = 1, Black = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::White ? Player::Black : Player::White;
}

inline constexpr std::string_view toString(Player player) {
	return player == Player::White ? "White" : "Black";
}

} // namespace unvoid
