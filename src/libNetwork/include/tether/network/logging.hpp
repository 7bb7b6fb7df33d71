#pragma once

#include "Logger/LogConfig.hpp"

#include <string_view>

namespace tether::network {

//! Log to "Tether/<module>/log.txt" in the default log directory, and to the console in debug builds.
//! Release builds skip debug entries.
void configureLogging(Logging::LogConfig& config, std::string_view module);

} // namespace tether::network
