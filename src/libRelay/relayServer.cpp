#include "tether/relay/relayServer.hpp"

#include "Logging.hpp"

#include <format>
#include <utility>
#include <vector>

namespace tether::relay {

RelayServer::RelayServer(network::ServerConfig config) : m_network(std::move(config)) {
	auto& events = m_network.events();
	events.onReady.subscribe([this] {
		Logger().Log(Logging::LogLevel::Info, std::format("[Relay] Relay ready at {}:{}.", m_network.host(), m_network.port()));
	});
	events.onConnect.subscribe([this](network::Connection& connection) { onConnect(connection); });
	events.onDisconnect.subscribe([this](network::Connection& connection) { onDisconnect(connection); });
	events.onPacket.subscribe([this](const network::Packet& packet, network::Connection& connection) { onPacket(packet, connection); });
}

bool RelayServer::start() {
	return m_network.start();
}

void RelayServer::stop() {
	m_network.stop();

	std::lock_guard<std::mutex> lock(m_playersMutex);
	m_players.clear();
}

void RelayServer::tick() {
	std::map<network::ConnectionId, PlayerPosition> positions;
	{
		std::lock_guard<std::mutex> lock(m_playersMutex);
		for (const auto& [id, player]: m_players) {
			positions.emplace(id, player.position);
		}
	}

	for (const auto& connection: m_network.connections()) {
		PeerPositions peers{.positions = positions};
		peers.positions.erase(connection->id());

		if (!peers.positions.empty()) {
			connection->send(toMessage(peers));
		}
	}
}

double RelayServer::throughput(std::chrono::duration<double> window) {
	const auto packets = m_network.resetPacketCount();
	if (window.count() <= 0.0) {
		return 0.0;
	}
	return static_cast<double>(packets) / window.count();
}

std::size_t RelayServer::playerCount() const {
	std::lock_guard<std::mutex> lock(m_playersMutex);
	return m_players.size();
}

network::TcpServer& RelayServer::tcpServer() {
	return m_network;
}

void RelayServer::onConnect(network::Connection& connection) {
	{
		std::lock_guard<std::mutex> lock(m_playersMutex);
		m_players[connection.id()] = Player{.info = PlayerInfo{.id = connection.id()}};
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[Relay] Player {} joined from {}:{}.", connection.id(), connection.remoteAddress(),
	                                                  connection.remotePort()));
}

void RelayServer::onDisconnect(network::Connection& connection) {
	{
		std::lock_guard<std::mutex> lock(m_playersMutex);
		m_players.erase(connection.id());
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[Relay] Player {} left.", connection.id()));
}

void RelayServer::onPacket(const network::Packet& packet, network::Connection& connection) {
	const auto message = fromMessage(packet.payload);
	if (!message) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Relay] Dropped invalid message from player {}.", connection.id()));
		return;
	}

	std::visit([&](const auto& m) { handleMessage(connection, m); }, *message);
}

void RelayServer::handleMessage(network::Connection& connection, const PlayerPosition& message) {
	std::lock_guard<std::mutex> lock(m_playersMutex);
	if (const auto it = m_players.find(connection.id()); it != m_players.end()) {
		it->second.position = message;
	}
}

void RelayServer::handleMessage(network::Connection& connection, const ChatLine& message) {
	const auto payload = toMessage(message);
	for (const auto& other: m_network.connections()) {
		if (other.get() != &connection) {
			other->send(payload);
		}
	}
}

void RelayServer::handleMessage(network::Connection& connection, const PlayerInfo& message) {
	// The sender cannot choose its id.
	const PlayerInfo announced{.id = connection.id(), .name = message.name, .color = message.color};

	std::map<network::ConnectionId, PlayerInfo> others;
	{
		std::lock_guard<std::mutex> lock(m_playersMutex);
		const auto it = m_players.find(connection.id());
		if (it == m_players.end()) {
			return;
		}
		it->second.info = announced;

		for (const auto& [id, player]: m_players) {
			if (id != connection.id()) {
				others.emplace(id, player.info);
			}
		}
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[Relay] Player {} is called '{}'.", connection.id(), announced.name));

	const auto payload = toMessage(announced);
	for (const auto& other: m_network.connections()) {
		const auto it = others.find(other->id());
		if (it == others.end()) {
			continue;
		}
		other->send(payload);
		connection.send(toMessage(it->second));
	}
}

void RelayServer::handleMessage(network::Connection& connection, const PeerPositions&) {
	Logger().Log(Logging::LogLevel::Warning, std::format("[Relay] Player {} sent a server message.", connection.id()));
}

} // namespace tether::relay
