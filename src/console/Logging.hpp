#pragma once

#include "Logger/Logger.hpp"

namespace unvoid::console {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace unvoid::console
