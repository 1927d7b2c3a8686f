#pragma once

#include "core/board.hpp"
#include "core/eventHub.hpp"
#include "core/move.hpp"
#include "core/status.hpp"
#include "core/types.hpp"

#include <optional>

namespace unvoid {

//! A running match: board, player to move, current selection and outcome.
//! White moves first. The game ends when a royal piece is captured.
class GameState {
public:
	//! Setup a new match on a board of the given size.
	GameState(std::size_t width, std::size_t height);

	//! Continue a match from a prepared board.
	explicit GameState(Board board, Player toMove = Player::White);

	//! Select a piece of the current player and cache its legal moves for display.
	Status select(Coord c);

	//! Move the piece at `from` to `to` for the current player.
	//! \param captured Set to the captured piece, if any.
	Status attemptMove(Coord from, Coord to, std::optional<Piece>& captured);
	Status attemptMove(Coord from, Coord to);

	//! Start a new match on a fresh board. Drops selection and outcome.
	void restart(std::size_t width, std::size_t height);

	const Board& board() const;                           //!< Get board data for rendering.
	Player currentPlayer() const;                         //!< Returns the currently active player.
	std::optional<Coord> selection() const;               //!< Currently selected square.
	const std::optional<MoveList>& selectedMoves() const; //!< Cached moves of the selected piece.
	bool isOver() const;                                  //!< True once a royal piece was captured.
	std::optional<Player> winner() const;                 //!< Winner of a finished game.
	unsigned moveId() const;                              //!< Number of moves played.

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	//! Moves of the current player's piece at `from`. Reuses the selection cache when it belongs to `from`.
	Status movesFor(Coord from, MoveList& out) const;
	void switchPlayer();

private:
	Board m_board;
	Player m_currentPlayer{Player::White};

	std::optional<Coord> m_selected{};         //!< Selected square.
	std::optional<MoveList> m_selectedMoves{}; //!< Legal moves of the selected piece.

	bool m_gameOver{false};
	std::optional<Player> m_winner{};
	unsigned m_moveId{0u};

	EventHub m_eventHub; //!< Hub to signal updates of the game state to external components.
};

} // namespace unvoid
