#pragma once

#include "tether/network/tcpServer.hpp"
#include "tether/relay/relayMessages.hpp"

#include <chrono>
#include <map>
#include <mutex>

namespace tether::relay {

//! Position relay on top of a TcpServer.
//! Players report their position, tick() hands every player the positions of all others.
//! A PlayerInfo from one player is announced to all others and answered with theirs.
class RelayServer {
public:
	explicit RelayServer(network::ServerConfig config = {});

	bool start();
	void stop();

	//! Send every connected player the positions of all other players. Call at a fixed rate.
	void tick();

	//! Packets per second received since the last call, given the time that passed.
	//! Resets the packet counter.
	double throughput(std::chrono::duration<double> window);

	std::size_t playerCount() const;
	network::TcpServer& tcpServer();

private:
	void onConnect(network::Connection& connection);
	void onDisconnect(network::Connection& connection);
	void onPacket(const network::Packet& packet, network::Connection& connection);

	void handleMessage(network::Connection& connection, const PlayerPosition& message);
	void handleMessage(network::Connection& connection, const ChatLine& message);
	void handleMessage(network::Connection& connection, const PlayerInfo& message);
	void handleMessage(network::Connection& connection, const PeerPositions& message);

private:
	struct Player {
		PlayerInfo info;
		PlayerPosition position; //!< Last reported position.
	};

	mutable std::mutex m_playersMutex;
	std::map<network::ConnectionId, Player> m_players;

	network::TcpServer m_network; //!< Declared last: its shutdown still reports disconnects to the members above.
};

} // namespace tether::relay
