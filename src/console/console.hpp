#pragma once

#include "command.hpp"
#include "settings.hpp"

#include "core/IGameStateListener.hpp"
#include "core/gameState.hpp"

#include <iosfwd>
#include <memory>
#include <optional>

namespace unvoid::console {

//! Text front end of a match. Reads commands from `in` and reports to `out`.
class Console : public IGameStateListener {
public:
	Console(std::istream& in, std::ostream& out);
	~Console() override;

	//! Play until the user exits or input ends.
	//! \param settings Board size. Prompted for when empty.
	//! \return Process exit code.
	int run(std::optional<Settings> settings);

	//! Handle a single command. Returns false once the user wants to exit.
	//! \note Requires a started match.
	bool handleCommand(const Command& command);

	//! Start a new match on a board of the given size.
	void start(Settings settings);

	const GameState& game() const;

	void onMoveDelta(const MoveDelta& delta) override;

private:
	std::optional<std::size_t> promptDimension(std::string_view prompt);

	bool handle(const EmptyCommand&);
	bool handle(const HelpCommand&);
	bool handle(const ExitCommand&);
	bool handle(const RestartCommand&);
	bool handle(const SelectCommand& command);
	bool handle(const MoveCommand& command);
	bool handle(const UsageError& command);
	bool handle(const UnknownCommand& command);

private:
	std::istream& m_in;
	std::ostream& m_out;

	Settings m_settings{};
	std::unique_ptr<GameState> m_game; //!< Running match. Empty until started.
};

} // namespace unvoid::console
