#include "boardPrinter.hpp"

#include "core/moveGenerator.hpp"

#include <format>

namespace unvoid::console {

std::string_view glyph(const Piece piece) {
	const bool white = piece.color == Player::White;
	switch (piece.type) {
	case PieceType::Royal:
		return white ? "♔" : "♚";
	case PieceType::Runner:
		return white ? "♖" : "♜";
	case PieceType::Leaper:
		return white ? "♘" : "♞";
	}
	return "?";
}

//! Content of an empty square. Marks reachable squares of the selected piece.
static std::string_view emptySquare(const GameState& game, const Coord c) {
	const auto& moves = game.selectedMoves();
	if (!moves) {
		return " ";
	}

	const auto move = findMove(*moves, c);
	if (!move) {
		return " ";
	}
	return move->isCapture ? "•" : ".";
}

static std::string frame(const std::size_t width) {
	std::string line = "  +";
	for (std::size_t x = 0u; x != width; ++x) {
		line += "---";
	}
	line += "+\n";
	return line;
}

std::string renderBoard(const GameState& game) {
	const auto& board    = game.board();
	const auto selection = game.selection();

	std::string out = "\n   ";
	for (std::size_t x = 0u; x != board.width(); ++x) {
		out += std::format(" {} ", char('A' + x));
	}
	out += "\n";
	out += frame(board.width());

	for (std::size_t row = board.height(); row != 0u; --row) {
		const auto y = static_cast<Id>(row - 1u);
		out += std::format("{:2}|", row);

		for (Id x = 0u; x != board.width(); ++x) {
			const Coord c{x, y};
			const auto piece   = board.get(c);
			const auto content = piece ? glyph(*piece) : emptySquare(game, c);

			if (selection && *selection == c) {
				out += std::format("[{}]", content);
			} else {
				out += std::format(" {} ", content);
			}
		}
		out += "|\n";
	}
	out += frame(board.width());

	return out;
}

std::string turnInfo(const GameState& game) {
	if (game.isOver()) {
		const auto winner = game.winner();
		if (!winner) {
			return "Game over!";
		}
		return std::format("{} wins!\nType \"restart\" to play again or \"exit\" to leave.", toString(*winner));
	}
	return std::format("Turn: {}", toString(game.currentPlayer()));
}

} // namespace unvoid::console
