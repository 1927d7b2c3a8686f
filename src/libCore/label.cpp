#include "core/label.hpp"

#include <cctype>
#include <charconv>

namespace unvoid {

Status fromLabel(const std::string_view label, const std::size_t height, const std::size_t width, Coord& out) {
	if (label.size() < 2u) {
		return Status::InvalidFormat;
	}

	const auto column = static_cast<unsigned char>(label.front());
	if (!std::isalpha(column)) {
		return Status::InvalidFormat;
	}

	// Remaining characters have to form the full row number.
	const auto rowText = label.substr(1u);
	std::size_t row    = 0u;

	const auto [end, ec] = std::from_chars(rowText.data(), rowText.data() + rowText.size(), row);
	if (ec != std::errc{} || end != rowText.data() + rowText.size()) {
		return Status::InvalidFormat;
	}

	if (row == 0u || row > height) {
		return Status::OutOfRange;
	}
	const auto x = static_cast<std::size_t>(std::toupper(column) - 'A');
	if (x >= width) {
		return Status::OutOfRange;
	}

	out = {static_cast<Id>(x), static_cast<Id>(row - 1u)};
	return Status::Ok;
}

std::string toLabel(const Coord c) {
	std::string label{char('A' + c.x)};
	label += std::to_string(c.y + 1u);
	return label;
}

} // namespace unvoid
