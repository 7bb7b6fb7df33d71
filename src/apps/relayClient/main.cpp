#include "tether/network/tcpClient.hpp"
#include "tether/relay/relayMessages.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <iostream>
#include <sstream>
#include <string>

namespace {

//! Print a message received from the relay.
struct Printer {
	void operator()(const tether::relay::PlayerPosition& m) const {
		std::cout << std::format("[Client] Position ({}, {})\n", m.x, m.y);
	}
	void operator()(const tether::relay::ChatLine& m) const {
		std::cout << std::format("[Client] Chat: {}\n", m.text);
	}
	void operator()(const tether::relay::PlayerInfo& m) const {
		std::cout << std::format("[Client] Player {} is {} ({}, {}, {})\n", m.id, m.name, m.color[0], m.color[1], m.color[2]);
	}
	void operator()(const tether::relay::PeerPositions& m) const {
		std::string positions;
		for (const auto& [id, p]: m.positions) {
			positions += std::format(" {}:({}, {})", id, p.x, p.y);
		}
		std::cout << std::format("[Client] Peers:{}\n", positions);
	}
};

//! "pos x y" becomes a position, "name text r g b" a player info, anything else a chat line.
tether::relay::RelayMessage parseInput(const std::string& line) {
	std::istringstream stream(line);
	std::string command;
	if (!(stream >> command)) {
		return tether::relay::ChatLine{.text = line};
	}

	double x{};
	double y{};
	if (command == "pos" && stream >> x >> y) {
		return tether::relay::PlayerPosition{.x = x, .y = y};
	}

	std::string name;
	unsigned r{};
	unsigned g{};
	unsigned b{};
	if (command == "name" && stream >> name >> r >> g >> b && r < 256u && g < 256u && b < 256u) {
		return tether::relay::PlayerInfo{
		        .name = name, .color = {static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(g), static_cast<std::uint8_t>(b)}};
	}
	return tether::relay::ChatLine{.text = line};
}

} // namespace

int main(int argc, char** argv) {
	tether::network::ClientConfig config;
	try {
		if (argc > 1) {
			config.host = argv[1];
		}
		if (argc > 2) {
			config.port = static_cast<std::uint16_t>(std::stoul(argv[2]));
		}
	} catch (const std::exception&) {
		std::cerr << std::format("Usage: {} [host] [port]\n", argv[0]);
		return 1;
	}

	tether::network::TcpClient client(config);
	auto& events = client.events();
	events.onConnect.subscribe([] { std::cout << "[Client] Connected\n"; });
	events.onDisconnect.subscribe([] { std::cout << "[Client] Disconnected\n"; });
	events.onPacket.subscribe([](const tether::network::Packet& packet) {
		const auto message = tether::relay::fromMessage(packet.payload);
		if (!message) {
			std::cout << std::format("[Client] Packet: {}\n", packet.payload);
			return;
		}
		std::visit(Printer{}, *message);
	});

	if (!client.connect()) {
		std::cerr << std::format("Could not connect to {}:{}.\n", config.host, config.port);
		return 1;
	}

	std::string line;
	while (client.isConnected() && std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
		if (line == "latency") {
			const auto latency = std::chrono::duration<double, std::milli>(client.latency());
			std::cout << std::format("[Client] Latency {:.3f}ms\n", latency.count());
			continue;
		}

		if (!client.send(tether::relay::toMessage(parseInput(line)))) {
			std::cerr << "[Client] Message was not sent.\n";
		}
	}

	client.disconnect();
	return 0;
}
