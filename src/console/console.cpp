#include "console.hpp"

#include "Logging.hpp"
#include "boardPrinter.hpp"

#include "core/label.hpp"

#include <cctype>
#include <format>
#include <istream>
#include <ostream>
#include <string>

namespace unvoid::console {

static std::string upper(std::string text) {
	for (auto& ch: text) {
		ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
	}
	return text;
}

static std::string lower(std::string_view text) {
	std::string result{text};
	for (auto& ch: result) {
		ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
	}
	return result;
}

Console::Console(std::istream& in, std::ostream& out) : m_in(in), m_out(out) {
}

Console::~Console() {
	if (m_game) {
		m_game->unsubscribeState(this);
	}
}

int Console::run(std::optional<Settings> settings) {
	auto logger = Logger();

	m_out << "Welcome to Unvoid Chess!\n";
	if (!settings) {
		const auto width  = promptDimension("Enter board width (6-12): ");
		const auto height = width ? promptDimension("Enter board height (6-12): ") : std::nullopt;
		if (!width || !height) {
			logger.Log(Logging::LogLevel::Warning, "[Console] Input ended before the board size was set.");
			return 1;
		}
		settings = Settings{.width = *width, .height = *height};
	}

	m_out << std::format("Starting match on the ({} x {}) board...\n", settings->width, settings->height);
	start(*settings);

	std::string line;
	while (true) {
		m_out << renderBoard(*m_game);
		m_out << turnInfo(*m_game) << "\n";
		if (!m_game->isOver()) {
			m_out << "Type a command (type \"help\" for options):\n> ";
		}
		m_out.flush();

		if (!std::getline(m_in, line)) {
			logger.Log(Logging::LogLevel::Info, "[Console] Input closed.");
			return 0;
		}
		if (!handleCommand(parseCommand(line))) {
			return 0;
		}
		m_out << "\n";
	}
}

bool Console::handleCommand(const Command& command) {
	const bool allowed = std::holds_alternative<RestartCommand>(command) || std::holds_alternative<ExitCommand>(command) ||
	                     std::holds_alternative<EmptyCommand>(command);
	if (m_game->isOver() && !allowed) {
		m_out << "Game is over. Type \"restart\" to play again or \"exit\" to leave.\n";
		return true;
	}

	return std::visit([&](const auto& c) { return handle(c); }, command);
}

void Console::start(const Settings settings) {
	m_settings = settings;

	if (m_game) {
		m_game->restart(settings.width, settings.height);
		return;
	}
	m_game = std::make_unique<GameState>(settings.width, settings.height);
	m_game->subscribeState(this);

	Logger().Log(Logging::LogLevel::Info, std::format("[Console] Match started on a {}x{} board.", settings.width, settings.height));
}

const GameState& Console::game() const {
	return *m_game;
}

void Console::onMoveDelta(const MoveDelta& delta) {
	m_out << std::format("Moved {} from {} to {}.", glyph(delta.piece), toLabel(delta.from), toLabel(delta.to));
	if (delta.captured) {
		m_out << std::format(" Captured {}.", glyph(*delta.captured));
	}
	m_out << "\n";
}

std::optional<std::size_t> Console::promptDimension(const std::string_view prompt) {
	std::string line;
	while (true) {
		m_out << prompt;
		m_out.flush();

		if (!std::getline(m_in, line)) {
			return std::nullopt;
		}
		if (const auto value = parseDimension(line)) {
			return value;
		}
		m_out << std::format("Invalid input. Please enter a number between {} and {}.\n", kMinBoardDimension, kMaxBoardDimension);
	}
}

bool Console::handle(const EmptyCommand&) {
	return true;
}

bool Console::handle(const HelpCommand&) {
	m_out << "Available commands:\n"
	         "  move <from> <to>    Move a piece (e.g. move B1 C3)\n"
	         "  select <square>     Highlight piece (e.g. select B1)\n"
	         "  restart             Restart the match\n"
	         "  exit                Exit the game\n"
	         "  help                Show this list\n";
	return true;
}

bool Console::handle(const ExitCommand&) {
	m_out << "Exiting Unvoid Chess. Goodbye!\n";
	Logger().Log(Logging::LogLevel::Info, "[Console] Exit requested.");
	return false;
}

bool Console::handle(const RestartCommand&) {
	m_out << "Restarting match...\n";
	start(m_settings);
	return true;
}

bool Console::handle(const SelectCommand& command) {
	const auto& board = m_game->board();

	Coord c{};
	if (fromLabel(command.square, board.height(), board.width(), c) != Status::Ok) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Console] Invalid square '{}'.", command.square));
		m_out << std::format("Invalid input: {} is not a valid square on the board.\n", upper(command.square));
		m_out << std::format("Please enter coordinates from A1 to {}.\n", toLabel({static_cast<Id>(board.width() - 1u), static_cast<Id>(board.height() - 1u)}));
		return true;
	}

	const auto status = m_game->select(c);
	switch (status) {
	case Status::Ok:
		break;
	case Status::NoPiece:
		m_out << std::format("Invalid input: There is no piece at {}.\n", toLabel(c));
		return true;
	case Status::WrongColor:
		m_out << std::format("Invalid input: You cannot select a {} piece on {}'s turn.\n", lower(toString(board.get(c)->color)),
		                     toString(m_game->currentPlayer()));
		return true;
	default:
		m_out << toString(status) << "\n";
		return true;
	}

	const auto piece  = *board.get(c);
	const auto& moves = *m_game->selectedMoves();
	if (moves.empty()) {
		m_out << std::format("Selected: {} at {}. No available moves.\n", glyph(piece), toLabel(c));
		return true;
	}

	m_out << std::format("Selected: {} at {}. Available moves: ", glyph(piece), toLabel(c));
	for (std::size_t i = 0u; i != moves.size(); ++i) {
		if (i)
			m_out << ", ";
		m_out << toLabel(moves[i].to);
	}
	m_out << "\n";
	return true;
}

bool Console::handle(const MoveCommand& command) {
	const auto& board = m_game->board();

	Coord from{};
	Coord to{};
	if (fromLabel(command.from, board.height(), board.width(), from) != Status::Ok) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Console] Invalid square '{}'.", command.from));
		m_out << std::format("Invalid input: {} is not a valid 'from' square.\n", upper(command.from));
		return true;
	}
	if (fromLabel(command.to, board.height(), board.width(), to) != Status::Ok) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Console] Invalid square '{}'.", command.to));
		m_out << std::format("Invalid input: {} is not a valid 'to' square.\n", upper(command.to));
		return true;
	}

	const auto moving = board.get(from);
	const auto status = m_game->attemptMove(from, to);
	switch (status) {
	case Status::Ok:
		break;
	case Status::NoPiece:
		m_out << std::format("Invalid move: There is no piece at {}.\n", toLabel(from));
		break;
	case Status::WrongColor:
		m_out << "Invalid move: You can't move your opponent's piece.\n";
		break;
	case Status::SameSquare:
		m_out << "Invalid move: Destination must be different from origin.\n";
		break;
	case Status::IllegalDestination:
		m_out << std::format("Invalid move: {} can't move to {}.\n", glyph(*moving), toLabel(to));
		break;
	case Status::GameOver:
		m_out << "The game is over. Type 'restart' or 'exit'.\n";
		break;
	default:
		m_out << toString(status) << "\n";
		break;
	}
	return true;
}

bool Console::handle(const UsageError& command) {
	if (command.command == "select") {
		m_out << "Invalid input: The 'select' command takes only one coordinate.\n"
		         "Usage: select <square>\n"
		         "Example: select C1\n";
	} else {
		m_out << "Invalid input: The 'move' command requires <from> and <to> coordinates.\n"
		         "Usage: move <from_square> <to_square>\n"
		         "Example: move B1 C3\n";
	}
	return true;
}

bool Console::handle(const UnknownCommand& command) {
	Logger().Log(Logging::LogLevel::Warning, std::format("[Console] Unknown command '{}'.", command.name));
	m_out << std::format("Unknown command: {}\nType \"help\" to see a list of valid commands.\n", command.name);
	return true;
}

} // namespace unvoid::console
