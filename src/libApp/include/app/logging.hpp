#pragma once

#include "Logger/Logger.hpp"

namespace ttt::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace ttt::app
