#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace unvoid::console {

struct EmptyCommand {};
struct HelpCommand {};
struct ExitCommand {};
struct RestartCommand {};
struct SelectCommand {
	std::string square;
};
struct MoveCommand {
	std::string from;
	std::string to;
};
//! Known command with the wrong number of arguments.
struct UsageError {
	std::string command;
};
struct UnknownCommand {
	std::string name;
};

using Command = std::variant<EmptyCommand, HelpCommand, ExitCommand, RestartCommand, SelectCommand, MoveCommand, UsageError, UnknownCommand>;

//! Parse one line of user input. The command word is case-insensitive, arguments are kept as typed.
Command parseCommand(std::string_view line);

} // namespace unvoid::console
