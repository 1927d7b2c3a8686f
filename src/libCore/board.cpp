#include "core/board.hpp"
#include "core/label.hpp"
#include "core/moveGenerator.hpp"

#include "Logging.hpp"

#include <cassert>
#include <format>

namespace unvoid {

Board::Board(const std::size_t width, const std::size_t height) : m_width(width), m_height(height), m_board(width * height) {
	assert(width >= kMinBoardDimension && width <= kMaxBoardDimension);
	assert(height >= kMinBoardDimension && height <= kMaxBoardDimension);
	setup();
}

std::size_t Board::width() const {
	return m_width;
}

std::size_t Board::height() const {
	return m_height;
}

bool Board::isInside(const Coord c) const {
	return c.x < m_width && c.y < m_height;
}

Board::Square Board::get(const Coord c) const {
	if (!isInside(c)) {
		return std::nullopt;
	}
	return m_board[index(c)];
}

void Board::place(const Coord c, const Piece piece) {
	assert(isInside(c));         // Caller should verify valid coordinate.
	assert(!m_board[index(c)]); // Use remove first.

	m_board[index(c)] = piece;
}

Board::Square Board::remove(const Coord c) {
	assert(isInside(c)); // Caller should verify valid coordinate.

	Square removed{};
	removed.swap(m_board[index(c)]);
	return removed;
}

void Board::clear() {
	for (auto& square: m_board) {
		square.reset();
	}
}

void Board::setup() {
	clear();

	// White starts from the bottom left corner, black mirrors on the top right.
	const auto top = static_cast<Id>(m_height - 1u);
	const auto end = static_cast<Id>(m_width - 1u);
	if (m_width >= 1u) {
		place({0u, 0u}, {PieceType::Royal, Player::White});
		place({end, top}, {PieceType::Royal, Player::Black});
	}
	if (m_width >= 2u) {
		place({1u, 0u}, {PieceType::Runner, Player::White});
		place({end - 1u, top}, {PieceType::Runner, Player::Black});
	}
	if (m_width >= 3u) {
		place({2u, 0u}, {PieceType::Leaper, Player::White});
		place({end - 2u, top}, {PieceType::Leaper, Player::Black});
	}
}

Status Board::movePiece(const Coord from, const Coord to, const Player mover, const MoveList& moves, std::optional<Piece>& captured) {
	auto logger = Logger();

	const auto moving = get(from);
	if (!moving) {
		logger.Log(Logging::LogLevel::Debug, std::format("[Board] Rejected move: No piece at {}.", toLabel(from)));
		return Status::NoPiece;
	}
	if (moving->color != mover) {
		logger.Log(Logging::LogLevel::Debug, std::format("[Board] Rejected move: {} can't move the piece at {}.", toString(mover), toLabel(from)));
		return Status::WrongColor;
	}
	if (from == to) {
		logger.Log(Logging::LogLevel::Debug, std::format("[Board] Rejected move: {} to itself.", toLabel(from)));
		return Status::SameSquare;
	}

	const auto detail = findMove(moves, to);
	if (!detail || !isInside(to)) {
		logger.Log(Logging::LogLevel::Debug,
		           std::format("[Board] Rejected move: {} can't move from {} to {}.", toString(moving->type), toLabel(from), toLabel(to)));
		return Status::IllegalDestination;
	}

	// Resolve which square loses its piece before touching the board.
	std::optional<Coord> removeAt{};
	if (detail->isCapture) {
		if (moving->type == PieceType::Runner) {
			if (!detail->jumpedPiece) {
				logger.Log(Logging::LogLevel::Error, std::format("[Board] Runner capture to {} without jumped piece.", toLabel(to)));
				return Status::IllegalDestination;
			}
			removeAt = detail->jumpedPiece;
		} else {
			removeAt = to;
		}
	}

	// The move list may be stale. Never stack pieces or remove own pieces.
	const auto target = get(to);
	if (target && removeAt != to) {
		logger.Log(Logging::LogLevel::Error, std::format("[Board] Destination {} is occupied. Move list is stale.", toLabel(to)));
		return Status::IllegalDestination;
	}
	if (removeAt) {
		const auto victim = get(*removeAt);
		if (victim && victim->color == mover) {
			logger.Log(Logging::LogLevel::Error, std::format("[Board] Capture at {} hits own piece. Move list is stale.", toLabel(*removeAt)));
			return Status::IllegalDestination;
		}
	}

	// Validation done. Apply the move.
	auto piece = remove(from);
	captured   = removeAt ? remove(*removeAt) : std::nullopt;

	m_board[index(to)] = piece;

	return Status::Ok;
}

std::size_t Board::index(const Coord c) const {
	return static_cast<std::size_t>(c.y) * m_width + c.x;
}

} // namespace unvoid
