#pragma once

#include "tether/network/connection.hpp"
#include "tether/network/safeQueue.hpp"

#include <asio.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <string_view>
#include <thread>

namespace tether::network {

//! Client connections ping the server, server connections answer.
enum class HeartbeatMode { Passive, Active };

//! The worker triple behind a Connection.
class Connection::Implementation {
public:
	struct Callbacks {
		std::function<void(Connection&, const Packet&)> onPacket; //!< Dispatch thread, application packets only.
		std::function<void(Connection&)> onReceive;                //!< Receive thread, after an application packet was queued.
		std::function<void(Connection&)> onDisconnect;             //!< Disconnecting thread, socket still open.
		std::function<void(Connection&)> onClosed;                 //!< Disconnecting thread, socket closed.
	};

	struct Options {
		ConnectionId id{0u};
		HeartbeatMode heartbeat{HeartbeatMode::Passive};
		std::chrono::milliseconds heartbeatInterval{HEARTBEAT_INTERVAL};
	};

	Implementation(asio::ip::tcp::socket socket, Options options, Callbacks callbacks);
	~Implementation();

	void attach(Connection& owner); //!< Set the facade handed to callbacks. Called once by Connection.

	void start();      //!< Spawn the three worker threads.
	void disconnect(); //!< Idempotent teardown. Rethrows a failure of the onDisconnect callback after closing.
	void join();       //!< Join every worker thread except the calling one.
	bool finished() const;

	bool send(Payload payload);
	bool sendRaw(const Payload& payload);

	bool isRunning() const;
	ConnectionId id() const;
	const std::string& remoteAddress() const;
	std::uint16_t remotePort() const;
	std::chrono::system_clock::time_point connectedAt() const;
	ConnectionProfile profile() const;
	std::chrono::nanoseconds latency() const;
	std::exception_ptr failure() const;

private:
	//! Thread entry: runs a loop and turns an escaping exception into a recorded failure plus disconnect.
	void runLoop(std::string_view name, void (Implementation::*loop)());

	void receiveLoop();
	void dispatchLoop();
	void sendLoop();

	bool readExactly(char* data, std::size_t size);                  //!< False when the loop has to stop.
	bool writeFrame(PacketFormat format, std::string_view payload); //!< Serialized with all other writes.
	void handleSocketError(const asio::error_code& ec, std::string_view operation);
	void closeSocket();

	bool sendHeartbeatIfDue();
	void completeHeartbeat(TimePoint receivedAt);
	std::chrono::milliseconds untilNextHeartbeat() const;

private:
	Connection* m_owner{nullptr};
	Options m_options;
	Callbacks m_callbacks; //!< Used to signal to the parent.

	asio::ip::tcp::socket m_socket; //!< Peer socket.
	std::mutex m_writeMutex;        //!< One frame on the wire at a time.

	std::string m_remoteAddress;
	std::uint16_t m_remotePort{0u};
	std::chrono::system_clock::time_point m_connectedAt;

	std::atomic<bool> m_running{true};  //!< Flipped to false exactly once.
	std::atomic<bool> m_started{false}; //!< Worker threads spawned.
	std::atomic<int> m_activeLoops{0};  //!< Worker loops not yet returned.

	SafeQueue<Packet> m_inbound;   //!< Receive thread -> dispatch thread.
	SafeQueue<Payload> m_outbound; //!< Application -> send thread.

	std::thread m_receiveThread;
	std::thread m_dispatchThread;
	std::thread m_sendThread;
	std::mutex m_joinMutex;

	std::atomic<std::int64_t> m_listenerTime{0};
	std::atomic<std::int64_t> m_processerTime{0};
	std::atomic<std::int64_t> m_senderTime{0};

	struct Heartbeat {
		TimePoint lastSentAt{};
		TimePoint dispatchedAt{};
		bool pending{false};
		std::chrono::nanoseconds latency{};
	};
	mutable std::mutex m_heartbeatMutex;
	Heartbeat m_heartbeat;

	mutable std::mutex m_failureMutex;
	std::exception_ptr m_failure;
};

} // namespace tether::network
