#pragma once

#include "core/piece.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>

namespace unvoid {

//! Types of signals.
enum GameSignal : std::uint64_t {
	GS_None            = 0,
	GS_BoardChange     = 1 << 0, //!< Board was modified.
	GS_PlayerChange    = 1 << 1, //!< Active player changed.
	GS_StateChange     = 1 << 2, //!< Game state changed. Restarted or finished.
	GS_SelectionChange = 1 << 3, //!< A piece was selected and its moves computed.
};

//! Symbolises the game state change after one move.
struct MoveDelta {
	unsigned moveId;                 //!< Move number.
	Player player;                   //!< Player who made the move.
	Piece piece;                     //!< Moved piece.
	Coord from;                      //!< Origin square.
	Coord to;                        //!< Destination square.
	std::optional<Piece> captured;   //!< Captured piece if any.
	std::optional<Coord> capturedAt; //!< Square the captured piece was removed from.
	Player nextPlayer;               //!< Next player to make a move.
	bool gameOver;                   //!< Game over after the move.
};

} // namespace unvoid
