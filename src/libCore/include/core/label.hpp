#pragma once

#include "core/status.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace unvoid {

//! Convert a square label like "C3" (case-insensitive column letter, 1-based row) to a board coordinate.
//! Returns InvalidFormat for malformed labels and OutOfRange for squares outside a board of the given size.
//! \param out Only written on success.
Status fromLabel(std::string_view label, std::size_t height, std::size_t width, Coord& out);

//! Convert a board coordinate to its square label.
std::string toLabel(Coord c);

} // namespace unvoid
