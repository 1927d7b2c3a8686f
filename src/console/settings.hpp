#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace unvoid::console {

//! Board dimensions of a match.
struct Settings {
	std::size_t width;
	std::size_t height;
};

//! Parse a board dimension. Empty if not a number within the allowed board dimensions.
std::optional<std::size_t> parseDimension(std::string_view text);

//! Read "<width> <height>" from the command line. Empty if missing or invalid.
std::optional<Settings> settingsFromArgs(int argc, const char* const* argv);

} // namespace unvoid::console
