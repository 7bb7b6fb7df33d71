#pragma once

#include "tether/network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

namespace tether::network {

using ConnectionId = std::uint32_t; //!< Identifies a connection on the server.

//! Cost of the last completed iteration of each worker loop.
struct ConnectionProfile {
	std::chrono::nanoseconds listenerTime{};  //!< Receive loop.
	std::chrono::nanoseconds processerTime{}; //!< Dispatch loop.
	std::chrono::nanoseconds senderTime{};    //!< Send loop.
};

//! One live TCP connection, served by a receive, a dispatch and a send thread.
//! \note Created by TcpServer and TcpClient. Handed to event handlers by reference.
class Connection {
public:
	class Implementation;

	explicit Connection(std::unique_ptr<Implementation> implementation);
	~Connection();

	Connection(const Connection&)            = delete;
	Connection& operator=(const Connection&) = delete;
	Connection(Connection&&)                 = delete;
	Connection& operator=(Connection&&)      = delete;

	//! Queue a payload for the send thread. Never blocks.
	//! Returns false if the connection is stopped or the payload is too large for one frame.
	bool send(Payload payload);

	//! Write a payload immediately on the calling thread, ahead of anything queued.
	//! Returns false if the connection is stopped, the payload is too large or the peer went away.
	bool sendRaw(const Payload& payload);

	//! Stop the worker loops and close the socket. Safe to call repeatedly and from any thread.
	void disconnect();

	bool isRunning() const;

	ConnectionId id() const;
	const std::string& remoteAddress() const;
	std::uint16_t remotePort() const;
	std::chrono::system_clock::time_point connectedAt() const;

	ConnectionProfile profile() const;
	std::chrono::nanoseconds latency() const; //!< Last heartbeat round trip. Zero until the first pong.

	//! Exception that terminated one of the worker loops. Null after a regular disconnect.
	std::exception_ptr failure() const;

	Implementation& implementation();

private:
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace tether::network
