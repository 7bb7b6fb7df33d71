#include "tether/relay/relayServer.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <format>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static constexpr auto TICK_INTERVAL   = std::chrono::microseconds{1'000'000 / 120};
static constexpr auto REPORT_INTERVAL = 5s;

int main(int argc, char** argv) {
	tether::network::ServerConfig config;
	try {
		if (argc > 1) {
			config.host = argv[1];
		}
		if (argc > 2) {
			config.port = static_cast<std::uint16_t>(std::stoul(argv[2]));
		}
		if (argc > 3) {
			config.maxConnections = std::stoul(argv[3]);
		}
	} catch (const std::exception&) {
		std::cerr << std::format("Usage: {} [host] [port] [maxConnections]\n", argv[0]);
		return 1;
	}

	tether::relay::RelayServer server(config);
	if (!server.start()) {
		std::cerr << std::format("Could not start relay on {}:{}.\n", config.host, config.port);
		return 1;
	}
	std::cout << std::format("Relay listening on {}:{}. Type 'quit' to stop.\n", server.tcpServer().host(), server.tcpServer().port());

	std::atomic<bool> running{true};
	std::thread ticker([&] {
		auto nextTick   = std::chrono::steady_clock::now();
		auto lastReport = nextTick;
		while (running) {
			server.tick();

			const auto now = std::chrono::steady_clock::now();
			if (now - lastReport >= REPORT_INTERVAL) {
				const std::chrono::duration<double> window = now - lastReport;
				std::cout << std::format("{:.2f} packets/s from {} players\n", server.throughput(window), server.playerCount());
				lastReport = now;
			}

			nextTick += TICK_INTERVAL;
			std::this_thread::sleep_until(nextTick);
		}
	});

	// Keep the server process alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	running = false;
	ticker.join();

	try {
		server.stop();
	} catch (const std::exception& ex) {
		std::cerr << std::format("Relay stopped with error: {}\n", ex.what());
		return 1;
	}
	return 0;
}
