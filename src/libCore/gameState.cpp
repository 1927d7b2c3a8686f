#include "core/gameState.hpp"
#include "core/label.hpp"
#include "core/moveGenerator.hpp"

#include "Logging.hpp"

#include <format>
#include <utility>

namespace unvoid {

GameState::GameState(const std::size_t width, const std::size_t height) : m_board{width, height} {
}

GameState::GameState(Board board, const Player toMove) : m_board{std::move(board)}, m_currentPlayer{toMove} {
}

Status GameState::select(const Coord c) {
	auto logger = Logger();

	if (m_gameOver) {
		return Status::GameOver;
	}

	const auto piece = m_board.get(c);
	if (!piece) {
		return Status::NoPiece;
	}
	if (piece->color != m_currentPlayer) {
		logger.Log(Logging::LogLevel::Debug, std::format("[GameState] {} tried to select opponent piece at {}.", toString(m_currentPlayer), toLabel(c)));
		return Status::WrongColor;
	}

	m_selected      = c;
	m_selectedMoves = legalMoves(m_board, c, *piece);

	logger.Log(Logging::LogLevel::Debug,
	           std::format("[GameState] {} selected {} at {} with {} moves.", toString(m_currentPlayer), toString(piece->type), toLabel(c),
	                       m_selectedMoves->size()));
	m_eventHub.signal(GS_SelectionChange);
	return Status::Ok;
}

Status GameState::attemptMove(const Coord from, const Coord to) {
	std::optional<Piece> captured{};
	return attemptMove(from, to, captured);
}

Status GameState::attemptMove(const Coord from, const Coord to, std::optional<Piece>& captured) {
	auto logger = Logger();

	if (m_gameOver) {
		return Status::GameOver;
	}

	MoveList moves;
	if (const auto status = movesFor(from, moves); status != Status::Ok) {
		return status;
	}

	const auto piece = m_board.get(from);
	std::optional<Piece> taken{};
	const auto detail = findMove(moves, to);
	if (const auto status = m_board.movePiece(from, to, m_currentPlayer, moves, taken); status != Status::Ok) {
		return status;
	}

	const auto mover = m_currentPlayer;
	++m_moveId;
	logger.Log(Logging::LogLevel::Info, std::format("[GameState] Move {}: {} {} from {} to {}.", m_moveId, toString(mover), toString(piece->type),
	                                                toLabel(from), toLabel(to)));

	if (taken) {
		logger.Log(Logging::LogLevel::Info, std::format("[GameState] {} captured {} {}.", toString(mover), toString(taken->color), toString(taken->type)));
		if (taken->type == PieceType::Royal) {
			m_gameOver = true;
			m_winner   = mover;
			logger.Log(Logging::LogLevel::Info, std::format("[GameState] Game over. {} wins.", toString(mover)));
		}
	}

	if (m_gameOver) {
		m_selected.reset();
		m_selectedMoves.reset();
	} else {
		switchPlayer();
	}

	captured = taken;

	std::optional<Coord> capturedAt{};
	if (taken) {
		capturedAt = detail->jumpedPiece ? *detail->jumpedPiece : to;
	}

	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(m_gameOver ? GS_StateChange : GS_PlayerChange);
	m_eventHub.signalDelta(MoveDelta{
	        .moveId     = m_moveId,
	        .player     = mover,
	        .piece      = *piece,
	        .from       = from,
	        .to         = to,
	        .captured   = taken,
	        .capturedAt = capturedAt,
	        .nextPlayer = m_currentPlayer,
	        .gameOver   = m_gameOver,
	});
	return Status::Ok;
}

void GameState::restart(const std::size_t width, const std::size_t height) {
	m_board         = Board{width, height};
	m_currentPlayer = Player::White;
	m_selected.reset();
	m_selectedMoves.reset();
	m_gameOver = false;
	m_winner.reset();
	m_moveId = 0u;

	Logger().Log(Logging::LogLevel::Info, std::format("[GameState] Restarted on a {}x{} board.", width, height));

	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(GS_PlayerChange);
	m_eventHub.signal(GS_StateChange);
}

const Board& GameState::board() const {
	return m_board;
}

Player GameState::currentPlayer() const {
	return m_currentPlayer;
}

std::optional<Coord> GameState::selection() const {
	return m_selected;
}

const std::optional<MoveList>& GameState::selectedMoves() const {
	return m_selectedMoves;
}

bool GameState::isOver() const {
	return m_gameOver;
}

std::optional<Player> GameState::winner() const {
	return m_winner;
}

unsigned GameState::moveId() const {
	return m_moveId;
}

void GameState::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void GameState::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void GameState::subscribeState(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void GameState::unsubscribeState(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

Status GameState::movesFor(const Coord from, MoveList& out) const {
	const auto piece = m_board.get(from);

	// Only trust the cache if it was computed for this square and the piece is still ours.
	if (m_selected == from && m_selectedMoves && piece && piece->color == m_currentPlayer) {
		out = *m_selectedMoves;
		return Status::Ok;
	}

	if (!piece) {
		return Status::NoPiece;
	}
	if (piece->color != m_currentPlayer) {
		return Status::WrongColor;
	}

	out = legalMoves(m_board, from, *piece);
	return Status::Ok;
}

void GameState::switchPlayer() {
	m_currentPlayer = opponent(m_currentPlayer);
	m_selected.reset();
	m_selectedMoves.reset();
}

} // namespace unvoid
