#pragma once

#include "tether/network/connection.hpp"
#include "tether/network/event.hpp"
#include "tether/network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

namespace tether {
namespace network {

struct ClientConfig {
	std::string host{"127.0.0.1"};
	std::uint16_t port{DEFAULT_PORT};
	std::chrono::milliseconds heartbeatInterval{HEARTBEAT_INTERVAL}; //!< Minimum time between two pings.
};

//! Hooks of a client. Handlers run on library threads, keep them short.
struct ClientEvents {
	Event<> onConnect;              //!< Connected, before the worker threads start. Caller of connect().
	Event<> onDisconnect;           //!< Connection lost or closed. Disconnecting thread.
	Event<const Packet&> onPacket; //!< Application packet. Dispatch thread.
};

//! TCP client with the same three worker threads as a server connection plus periodic heartbeats.
class TcpClient {
public:
	explicit TcpClient(ClientConfig config = {});
	~TcpClient();

	TcpClient(const TcpClient&)            = delete;
	TcpClient& operator=(const TcpClient&) = delete;
	TcpClient(TcpClient&&)                 = delete;
	TcpClient& operator=(TcpClient&&)      = delete;

	ClientEvents& events();

	//! Connect to the configured server and start the worker threads.
	//! Returns false if already connected or the server cannot be reached.
	//! \note May be called again after a disconnect, but not from an event handler.
	bool connect();

	//! Close the connection. No-op when not connected.
	void disconnect();

	bool isConnected() const;

	bool send(Payload payload);           //!< Queue payload. Returns false when not connected or too large.
	bool sendRaw(const Payload& payload); //!< Write payload immediately on the calling thread.

	std::chrono::nanoseconds latency() const; //!< Last heartbeat round trip. Zero until the first pong.
	ConnectionProfile profile() const;
	std::exception_ptr failure() const; //!< Error that terminated the current connection, if any.

	const std::string& host() const;
	std::uint16_t port() const;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace network
} // namespace tether
