#include "settings.hpp"

#include "core/types.hpp"

#include <cctype>
#include <charconv>

namespace unvoid::console {

std::optional<std::size_t> parseDimension(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
		text.remove_prefix(1u);
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
		text.remove_suffix(1u);

	std::size_t value    = 0u;
	const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
		return std::nullopt;
	}
	if (value < kMinBoardDimension || value > kMaxBoardDimension) {
		return std::nullopt;
	}
	return value;
}

std::optional<Settings> settingsFromArgs(const int argc, const char* const* argv) {
	if (argc != 3) {
		return std::nullopt;
	}

	const auto width  = parseDimension(argv[1]);
	const auto height = parseDimension(argv[2]);
	if (!width || !height) {
		return std::nullopt;
	}
	return Settings{.width = *width, .height = *height};
}

} // namespace unvoid::console
