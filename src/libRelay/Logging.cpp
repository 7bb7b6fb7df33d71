#include "Logging.hpp"

#include "tether/network/logging.hpp"

#include <mutex>

namespace tether::relay {

static Logging::LogConfig config;

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, [] { network::configureLogging(config, "Relay"); });

	return Logging::Logger(config);
}

} // namespace tether::relay
