#include "core/status.hpp"

namespace unvoid {

std::string_view toString(const Status status) {
	switch (status) {
	case Status::Ok:
		return "Ok.";
	case Status::InvalidFormat:
		return "Invalid coordinate format.";
	case Status::OutOfRange:
		return "Coordinate is outside the board.";
	case Status::NoPiece:
		return "There is no piece on that square.";
	case Status::WrongColor:
		return "You can't use your opponent's piece.";
	case Status::SameSquare:
		return "Destination must be different from origin.";
	case Status::IllegalDestination:
		return "The piece can't move to that square.";
	case Status::GameOver:
		return "The game is over.";
	}
	return "Unknown status.";
}

} // namespace unvoid
