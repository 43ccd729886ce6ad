#pragma once

#include "Logger/Logger.hpp"

namespace checkers::gameNet {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace checkers::gameNet
