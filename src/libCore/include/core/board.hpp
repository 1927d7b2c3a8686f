#pragma once

#include "core/move.hpp"
#include "core/piece.hpp"
#include "core/status.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace unvoid {

//! Rectangular game board. Owns all pieces.
//! \note Game coordinates origin is at bottom left of board and start at 0. Column: A->0, B->1, etc
class Board {
public:
	using Square = std::optional<Piece>; //!< Empty squares hold no value.

public:
	//! Create a board with the initial piece setup.
	//! \note Dimensions are expected to be within [kMinBoardDimension, kMaxBoardDimension].
	Board(std::size_t width, std::size_t height);

	std::size_t width() const;
	std::size_t height() const;

	bool isInside(Coord c) const;       //!< True if the coordinate lies on the board.
	Square get(Coord c) const;          //!< Piece at the coordinate. Empty when free or outside the board.
	void place(Coord c, Piece piece);   //!< Put a piece on a free square (x,y) on the board.
	Square remove(Coord c);             //!< Take the piece from the square (x,y). Returns what was there.
	void clear();                       //!< Remove all pieces.
	void setup();                       //!< Clear the board and place the initial pieces of both players.

	//! Execute a move of the piece at `from` if it is listed in `moves`.
	//! Checks in order: piece at from, owned by mover, from != to, destination in moves.
	//! \param captured Set to the removed opponent piece, if any.
	//! \note Either the full move is applied or the board stays untouched.
	Status movePiece(Coord from, Coord to, Player mover, const MoveList& moves, std::optional<Piece>& captured);

private:
	std::size_t index(Coord c) const;

private:
	std::size_t m_width;           //!< Number of columns.
	std::size_t m_height;          //!< Number of rows.
	std::vector<Square> m_board{}; //!< Row major squares, row 0 first.
};

} // namespace unvoid
