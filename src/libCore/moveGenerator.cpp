#include "core/moveGenerator.hpp"

#include <array>
#include <utility>

namespace unvoid {

using Offset = std::pair<int, int>; //!< Column and row offset.

static constexpr std::array<Offset, 8> kDirections{{{-1, -1}, {0, -1}, {1, -1}, {-1, 0}, {1, 0}, {-1, 1}, {0, 1}, {1, 1}}};
static constexpr std::array<Offset, 8> kLeaperOffsets{{{2, 1}, {-2, 1}, {2, -1}, {-2, -1}, {1, 2}, {-1, 2}, {1, -2}, {-1, -2}}};
static constexpr int kRunnerRange = 3;

//! Returns the coordinate at the offset if it lies on the board.
static std::optional<Coord> shifted(const Board& board, const Coord c, const int dx, const int dy) {
	const int nx = static_cast<int>(c.x) + dx;
	const int ny = static_cast<int>(c.y) + dy;
	if (nx < 0 || ny < 0 || nx >= static_cast<int>(board.width()) || ny >= static_cast<int>(board.height()))
		return std::nullopt;

	return Coord{static_cast<Id>(nx), static_cast<Id>(ny)};
}

//! Shared rule of Royal and Leaper: land on empty squares or capture by landing on an opponent.
template <std::size_t N>
static MoveList landingMoves(const Board& board, const Coord from, const Player color, const std::array<Offset, N>& offsets) {
	MoveList moves;
	for (const auto& [dx, dy]: offsets) {
		const auto to = shifted(board, from, dx, dy);
		if (!to)
			continue;

		const auto target = board.get(*to);
		if (!target) {
			moves.push_back({.to = *to, .isCapture = false});
		} else if (target->color != color) {
			moves.push_back({.to = *to, .isCapture = true});
		}
	}
	return moves;
}

MoveList royalMoves(const Board& board, const Coord from, const Player color) {
	return landingMoves(board, from, color, kDirections);
}

MoveList leaperMoves(const Board& board, const Coord from, const Player color) {
	return landingMoves(board, from, color, kLeaperOffsets);
}

MoveList runnerMoves(const Board& board, const Coord from, const Player color) {
	MoveList moves;
	for (const auto& [dx, dy]: kDirections) {
		for (int distance = 1; distance <= kRunnerRange; ++distance) {
			const auto to = shifted(board, from, dx * distance, dy * distance);
			if (!to)
				break;
			// Runner only lands on empty squares but may still pass the occupied one.
			if (board.get(*to))
				continue;

			std::optional<Coord> jumped{};
			bool blocked = false;
			for (int step = 1; step < distance; ++step) {
				const Coord onPath{static_cast<Id>(static_cast<int>(from.x) + dx * step), static_cast<Id>(static_cast<int>(from.y) + dy * step)};
				const auto piece = board.get(onPath);
				if (!piece)
					continue;

				// Own pieces can't be jumped and only a single opponent piece can be captured.
				if (piece->color == color || jumped) {
					blocked = true;
					break;
				}
				jumped = onPath;
			}

			// Each distance is checked on its own. A blocked path does not end the direction.
			if (blocked)
				continue;

			moves.push_back({.to = *to, .isCapture = jumped.has_value(), .jumpedPiece = jumped});
		}
	}
	return moves;
}

MoveList legalMoves(const Board& board, const Coord from, const Piece piece) {
	switch (piece.type) {
	case PieceType::Runner:
		return runnerMoves(board, from, piece.color);
	case PieceType::Leaper:
		return leaperMoves(board, from, piece.color);
	case PieceType::Royal:
		return royalMoves(board, from, piece.color);
	}
	return {};
}

std::optional<MoveDetail> findMove(const MoveList& moves, const Coord to) {
	for (const auto& move: moves) {
		if (move.to == to) {
			return move;
		}
	}
	return std::nullopt;
}

} // namespace unvoid
