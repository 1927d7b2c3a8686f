#pragma once

#include <string_view>

namespace unvoid {

//! Outcome of an engine operation. Everything except Ok is a recoverable error.
enum class Status {
	Ok,
	InvalidFormat,      //!< Square label is malformed.
	OutOfRange,         //!< Square label lies outside the board.
	NoPiece,            //!< Source square is empty.
	WrongColor,         //!< Piece belongs to the opponent.
	SameSquare,         //!< Source and destination are identical.
	IllegalDestination, //!< Destination is not in the legal move set.
	GameOver            //!< A royal piece was captured. Only a restart is possible.
};

//! Human readable description of the status.
std::string_view toString(Status status);

} // namespace unvoid
