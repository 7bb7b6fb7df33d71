#include "Logging.hpp"
#include "tether/network/logging.hpp"

#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace tether::network {

static Logging::LogConfig config;

void configureLogging(Logging::LogConfig& logConfig, std::string_view module) {
	logConfig.SetLogEnabled(true);
#ifdef NDEBUG
	logConfig.SetMinLogLevel(Logging::LogLevel::Info);
#else
	logConfig.SetMinLogLevel(Logging::LogLevel::Any);
#endif

	const auto logPath = Logging::GetDefaultLogDir(std::format("Tether/{}", module));

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (ec) {
		std::cerr << std::format("[Logger] Could not create directory: {}\n{} will not log to file.\n", logPath.string(), module);
	} else {
		logConfig.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "log.txt"));
	}

#ifndef NDEBUG
	logConfig.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif
}

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, [] { configureLogging(config, "Network"); });

	return Logging::Logger(config);
}

} // namespace tether::network
