#include "connectionImpl.hpp"

#include "Logging.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <utility>

namespace tether::network {

static std::int64_t elapsedSince(TimePoint start) {
	return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count();
}

//! Peer went away without a clean close.
static bool isAbrupt(const asio::error_code& ec) {
	return ec == asio::error::connection_reset || ec == asio::error::connection_aborted || ec == asio::error::broken_pipe ||
	       ec == asio::error::not_connected || ec == asio::error::shut_down;
}

Connection::Implementation::Implementation(asio::ip::tcp::socket socket, Options options, Callbacks callbacks)
    : m_options(options), m_callbacks(std::move(callbacks)), m_socket(std::move(socket)), m_connectedAt(std::chrono::system_clock::now()) {
	asio::error_code ec;
	const auto endpoint = m_socket.remote_endpoint(ec);
	if (!ec) {
		m_remoteAddress = endpoint.address().to_string();
		m_remotePort    = endpoint.port();
	}
}

Connection::Implementation::~Implementation() {
	try {
		disconnect();
	} catch (const std::exception& ex) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Connection {} disconnect handler failed: {}", m_options.id, ex.what()));
	}
	join();
}

void Connection::Implementation::attach(Connection& owner) {
	m_owner = &owner;
}

void Connection::Implementation::start() {
	if (!m_running || m_started.exchange(true)) {
		return;
	}

	m_activeLoops = 3;
	m_receiveThread  = std::thread([this] { runLoop("receive", &Implementation::receiveLoop); });
	m_dispatchThread = std::thread([this] { runLoop("dispatch", &Implementation::dispatchLoop); });
	m_sendThread     = std::thread([this] { runLoop("send", &Implementation::sendLoop); });
}

void Connection::Implementation::disconnect() {
	// Any of the three loops and the application may get here at the same time.
	if (!m_running.exchange(false)) {
		return;
	}

	m_inbound.Release();
	m_outbound.Release();

	std::exception_ptr handlerFailure;
	try {
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(*m_owner);
		}
	} catch (const std::exception&) { handlerFailure = std::current_exception(); }

	closeSocket();

	if (m_callbacks.onClosed) {
		m_callbacks.onClosed(*m_owner);
	}

	if (handlerFailure) {
		std::rethrow_exception(handlerFailure);
	}
}

void Connection::Implementation::join() {
	std::lock_guard<std::mutex> lock(m_joinMutex);

	for (auto* thread: {&m_receiveThread, &m_dispatchThread, &m_sendThread}) {
		if (thread->joinable() && thread->get_id() != std::this_thread::get_id()) {
			thread->join();
		}
	}
}

bool Connection::Implementation::finished() const {
	return !m_running && m_activeLoops == 0;
}

bool Connection::Implementation::send(Payload payload) {
	if (!m_running || payload.size() > MAX_PAYLOAD_BYTES) {
		return false;
	}

	m_outbound.Push(std::move(payload));
	return true;
}

bool Connection::Implementation::sendRaw(const Payload& payload) {
	if (!m_running || payload.size() > MAX_PAYLOAD_BYTES) {
		return false;
	}
	return writeFrame(PacketFormat::Raw, payload);
}

bool Connection::Implementation::isRunning() const {
	return m_running;
}

ConnectionId Connection::Implementation::id() const {
	return m_options.id;
}

const std::string& Connection::Implementation::remoteAddress() const {
	return m_remoteAddress;
}

std::uint16_t Connection::Implementation::remotePort() const {
	return m_remotePort;
}

std::chrono::system_clock::time_point Connection::Implementation::connectedAt() const {
	return m_connectedAt;
}

ConnectionProfile Connection::Implementation::profile() const {
	return ConnectionProfile{
	        .listenerTime  = std::chrono::nanoseconds{m_listenerTime.load(std::memory_order_relaxed)},
	        .processerTime = std::chrono::nanoseconds{m_processerTime.load(std::memory_order_relaxed)},
	        .senderTime    = std::chrono::nanoseconds{m_senderTime.load(std::memory_order_relaxed)},
	};
}

std::chrono::nanoseconds Connection::Implementation::latency() const {
	std::lock_guard<std::mutex> lock(m_heartbeatMutex);
	return m_heartbeat.latency;
}

std::exception_ptr Connection::Implementation::failure() const {
	std::lock_guard<std::mutex> lock(m_failureMutex);
	return m_failure;
}

void Connection::Implementation::runLoop(std::string_view name, void (Implementation::*loop)()) {
	try {
		(this->*loop)();
	} catch (const std::exception& ex) {
		{
			std::lock_guard<std::mutex> lock(m_failureMutex);
			if (!m_failure) {
				m_failure = std::current_exception();
			}
		}
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Connection {} {} loop failed: {}", m_options.id, name, ex.what()));

		try {
			disconnect();
		} catch (const std::exception& disconnectEx) {
			Logger().Log(Logging::LogLevel::Error,
			             std::format("[Network] Connection {} disconnect handler failed: {}", m_options.id, disconnectEx.what()));
		}
	}

	--m_activeLoops;
}

void Connection::Implementation::receiveLoop() {
	std::array<char, HEADER_BYTES> headerBytes{};

	while (m_running) {
		const auto frameStart = Clock::now();

		if (!readExactly(headerBytes.data(), headerBytes.size())) {
			return;
		}
		const auto header = decodeHeader(std::string_view{headerBytes.data(), headerBytes.size()});

		Payload payload(header.length, '\0');
		if (header.length > 0u && !readExactly(payload.data(), payload.size())) {
			return;
		}
		const auto receivedAt = Clock::now();

		// Closed while receiving: do not issue any more packets.
		if (!m_running) {
			return;
		}

		const bool isApplication = header.format == PacketFormat::Raw;
		m_inbound.Push(Packet{.payload = std::move(payload), .header = header, .receivedAt = receivedAt});
		if (isApplication && m_callbacks.onReceive) {
			m_callbacks.onReceive(*m_owner);
		}

		m_listenerTime.store(elapsedSince(frameStart), std::memory_order_relaxed);
	}
}

void Connection::Implementation::dispatchLoop() {
	while (m_running) {
		const auto frameStart = Clock::now();

		auto packet = m_inbound.Pop(POLL_INTERVAL);
		if (!packet) {
			continue;
		}

		switch (packet->header.format) {
		case PacketFormat::HeartbeatPing:
			// Straight to the socket. A pong must not wait behind application traffic.
			if (!writeFrame(PacketFormat::HeartbeatPong, {})) {
				return;
			}
			break;
		case PacketFormat::HeartbeatPong:
			completeHeartbeat(packet->receivedAt);
			break;
		case PacketFormat::Raw:
			if (m_callbacks.onPacket) {
				m_callbacks.onPacket(*m_owner, *packet);
			}
			break;
		}

		m_processerTime.store(elapsedSince(frameStart), std::memory_order_relaxed);
	}
}

void Connection::Implementation::sendLoop() {
	const bool activeHeartbeat = m_options.heartbeat == HeartbeatMode::Active;

	while (m_running) {
		const auto frameStart = Clock::now();

		auto wait = std::chrono::milliseconds{POLL_INTERVAL};
		if (activeHeartbeat) {
			if (!sendHeartbeatIfDue()) {
				return;
			}
			wait = std::min(wait, untilNextHeartbeat());
		}

		auto payload = m_outbound.Pop(wait);
		if (!payload) {
			continue;
		}

		if (!writeFrame(PacketFormat::Raw, *payload)) {
			return;
		}

		m_senderTime.store(elapsedSince(frameStart), std::memory_order_relaxed);
	}
}

bool Connection::Implementation::readExactly(char* data, std::size_t size) {
	asio::error_code ec;
	asio::read(m_socket, asio::buffer(data, size), ec);
	if (!ec) {
		return true;
	}

	handleSocketError(ec, "read");
	return false;
}

bool Connection::Implementation::writeFrame(PacketFormat format, std::string_view payload) {
	const auto frame = encodePacket(format, payload);

	asio::error_code ec;
	{
		std::lock_guard<std::mutex> lock(m_writeMutex);
		if (!m_socket.is_open()) {
			return false;
		}
		asio::write(m_socket, asio::buffer(frame), ec);
	}
	if (!ec) {
		return true;
	}

	handleSocketError(ec, "write");
	return false;
}

void Connection::Implementation::handleSocketError(const asio::error_code& ec, std::string_view operation) {
	// Errors after a local disconnect are the closing socket talking.
	if (!m_running) {
		return;
	}

	if (ec == asio::error::eof) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Network] Connection {} closed by peer.", m_options.id));
		disconnect();
		return;
	}

	if (isAbrupt(ec)) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Network] Connection {} lost on {}: {}", m_options.id, operation, ec.message()));
		disconnect();
		return;
	}

	throw asio::system_error(ec, std::format("Connection {} {} failed", m_options.id, operation));
}

void Connection::Implementation::closeSocket() {
	asio::error_code ec;
	// Shutdown first: wakes a read or write blocked on another thread.
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);

	std::lock_guard<std::mutex> lock(m_writeMutex);
	m_socket.close(ec);
}

bool Connection::Implementation::sendHeartbeatIfDue() {
	{
		std::lock_guard<std::mutex> lock(m_heartbeatMutex);

		const auto now = Clock::now();
		if (m_heartbeat.pending || now - m_heartbeat.lastSentAt < m_options.heartbeatInterval) {
			return true;
		}

		m_heartbeat.pending      = true;
		m_heartbeat.lastSentAt   = now;
		m_heartbeat.dispatchedAt = now;
	}

	return writeFrame(PacketFormat::HeartbeatPing, {});
}

void Connection::Implementation::completeHeartbeat(TimePoint receivedAt) {
	if (m_options.heartbeat != HeartbeatMode::Active) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Network] Connection {} dropped unsolicited {} packet.", m_options.id, toString(PacketFormat::HeartbeatPong)));
		return;
	}

	std::lock_guard<std::mutex> lock(m_heartbeatMutex);
	if (!m_heartbeat.pending) {
		return;
	}

	m_heartbeat.pending = false;
	m_heartbeat.latency = std::chrono::duration_cast<std::chrono::nanoseconds>(receivedAt - m_heartbeat.dispatchedAt);
}

std::chrono::milliseconds Connection::Implementation::untilNextHeartbeat() const {
	std::lock_guard<std::mutex> lock(m_heartbeatMutex);
	if (m_heartbeat.pending) {
		return POLL_INTERVAL;
	}

	const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(m_heartbeat.lastSentAt + m_options.heartbeatInterval - Clock::now());
	return std::max(remaining, std::chrono::milliseconds{1});
}


Connection::Connection(std::unique_ptr<Implementation> implementation) : m_pimpl(std::move(implementation)) {
	m_pimpl->attach(*this);
}

Connection::~Connection() {
	// Stop the threads while the facade handed to callbacks is still intact.
	try {
		m_pimpl->disconnect();
	} catch (const std::exception& ex) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Connection {} disconnect handler failed: {}", m_pimpl->id(), ex.what()));
	}
	m_pimpl->join();
}

bool Connection::send(Payload payload) {
	return m_pimpl->send(std::move(payload));
}

bool Connection::sendRaw(const Payload& payload) {
	return m_pimpl->sendRaw(payload);
}

void Connection::disconnect() {
	m_pimpl->disconnect();
}

bool Connection::isRunning() const {
	return m_pimpl->isRunning();
}

ConnectionId Connection::id() const {
	return m_pimpl->id();
}

const std::string& Connection::remoteAddress() const {
	return m_pimpl->remoteAddress();
}

std::uint16_t Connection::remotePort() const {
	return m_pimpl->remotePort();
}

std::chrono::system_clock::time_point Connection::connectedAt() const {
	return m_pimpl->connectedAt();
}

ConnectionProfile Connection::profile() const {
	return m_pimpl->profile();
}

std::chrono::nanoseconds Connection::latency() const {
	return m_pimpl->latency();
}

std::exception_ptr Connection::failure() const {
	return m_pimpl->failure();
}

Connection::Implementation& Connection::implementation() {
	return *m_pimpl;
}

} // namespace tether::network
