#pragma once

#include "Logger/Logger.hpp"

namespace tether::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace tether::network
