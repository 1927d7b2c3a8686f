#include "command.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace unvoid::console {

static std::vector<std::string> splitWords(const std::string_view line) {
	std::vector<std::string> words;

	std::size_t pos = 0u;
	while (pos < line.size()) {
		while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])))
			++pos;
		const auto start = pos;
		while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos])))
			++pos;
		if (pos > start)
			words.emplace_back(line.substr(start, pos - start));
	}
	return words;
}

Command parseCommand(const std::string_view line) {
	const auto words = splitWords(line);
	if (words.empty()) {
		return EmptyCommand{};
	}

	auto name = words.front();
	std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

	if (name == "help") {
		return HelpCommand{};
	}
	if (name == "exit") {
		return ExitCommand{};
	}
	if (name == "restart") {
		return RestartCommand{};
	}
	if (name == "select") {
		if (words.size() != 2u) {
			return UsageError{name};
		}
		return SelectCommand{.square = words[1]};
	}
	if (name == "move") {
		if (words.size() != 3u) {
			return UsageError{name};
		}
		return MoveCommand{.from = words[1], .to = words[2]};
	}

	return UnknownCommand{name};
}

} // namespace unvoid::console
