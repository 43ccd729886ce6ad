#pragma once

#include "Logger/Logger.hpp"

namespace checkers::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace checkers::app
