#pragma once

#include "tether/network/connection.hpp"
#include "tether/network/event.hpp"
#include "tether/network/protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tether {
namespace network {

//! How accepted connections get their id.
enum class ConnectionIdPolicy {
	Monotonic,   //!< 0, 1, 2, ... never reused during the server's lifetime.
	RegistrySize //!< Number of live connections at accept time. Ids can repeat, even among live connections.
};

struct ServerConfig {
	std::string host{"127.0.0.1"};
	std::uint16_t port{DEFAULT_PORT}; //!< 0 picks an ephemeral port, see TcpServer::port().
	int backlog{DEFAULT_BACKLOG};     //!< Connections the OS queues before accept.
	std::size_t maxConnections{0u};   //!< Live connection cap. 0 means no limit.
	ConnectionIdPolicy idPolicy{ConnectionIdPolicy::Monotonic};
};

//! Hooks of a server. Handlers run on library threads, keep them short.
struct ServerEvents {
	Event<> onReady;                            //!< Listening. Caller of start().
	Event<Connection&> onConnect;               //!< Accepted, before its threads start. Accept thread.
	Event<Connection&> onDisconnect;            //!< Connection left the registry. Disconnecting thread.
	Event<const Packet&, Connection&> onPacket; //!< Application packet. The connection's dispatch thread.
};

//! TCP server running an accept thread plus three worker threads per connection.
//! \example Usage: subscribe to events(), start() once, send() from handlers or any thread, stop() once.
class TcpServer {
public:
	explicit TcpServer(ServerConfig config = {});
	~TcpServer();

	TcpServer(const TcpServer&)            = delete;
	TcpServer& operator=(const TcpServer&) = delete;
	TcpServer(TcpServer&&)                 = delete;
	TcpServer& operator=(TcpServer&&)      = delete;

	ServerEvents& events();

	//! Bind, listen, trigger onReady and start accepting. Returns false if already running or the socket setup failed.
	bool start();

	//! Stop accepting, disconnect every client and join all threads.
	//! \throws The error that terminated the accept loop, if any.
	//! \note Call once, and never from an event handler.
	void stop();

	bool isRunning() const;

	bool send(ConnectionId connectionId, Payload payload); //!< Queue payload for a live connection. Returns false if not found.
	std::size_t broadcast(const Payload& payload);         //!< Queue payload for every live connection. Returns the number queued.

	std::vector<std::shared_ptr<Connection>> connections() const; //!< Snapshot of live connections.
	std::size_t connectionCount() const;

	std::uint64_t packetCount() const; //!< Application packets received since the last reset.
	std::uint64_t resetPacketCount();  //!< Returns the count before the reset.

	const std::string& host() const;
	std::uint16_t port() const; //!< Bound port once started, configured port before.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace network
} // namespace tether
