#pragma once

#include "Logger/Logger.hpp"

namespace tether::relay {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace tether::relay
