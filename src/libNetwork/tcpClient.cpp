#include "tether/network/tcpClient.hpp"

#include "Logging.hpp"
#include "connectionImpl.hpp"

#include <asio.hpp>
#include <asio/connect.hpp>

#include <format>
#include <mutex>
#include <utility>

namespace tether {
namespace network {

class TcpClient::Implementation {
public:
	explicit Implementation(ClientConfig config);
	~Implementation();

	ClientEvents& events();

	bool connect();
	void disconnect();
	bool isConnected() const;

	bool send(Payload payload);
	bool sendRaw(const Payload& payload);

	std::chrono::nanoseconds latency() const;
	ConnectionProfile profile() const;
	std::exception_ptr failure() const;

	const std::string& host() const;
	std::uint16_t port() const;

private:
	std::shared_ptr<Connection> current() const; //!< Snapshot of the current connection, may be null.
	Connection::Implementation::Callbacks makeCallbacks();

private:
	const ClientConfig m_config;
	ClientEvents m_events;

	asio::io_context m_ioContext{};
	std::mutex m_connectMutex; //!< Serializes connect() calls.

	mutable std::mutex m_connectionMutex;
	std::shared_ptr<Connection> m_connection; //!< Last established connection. Kept after a disconnect until the next connect.
};


TcpClient::Implementation::Implementation(ClientConfig config) : m_config(std::move(config)) {
}

TcpClient::Implementation::~Implementation() {
	disconnect();

	std::lock_guard<std::mutex> lock(m_connectionMutex);
	m_connection.reset();
}

ClientEvents& TcpClient::Implementation::events() {
	return m_events;
}

bool TcpClient::Implementation::connect() {
	std::lock_guard<std::mutex> connectLock(m_connectMutex);

	const auto previous = current();
	if (previous && previous->isRunning()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Network] Already connected to {}:{}.", m_config.host, m_config.port));
		return false;
	}
	if (previous) {
		previous->implementation().join();
	}

	asio::error_code ec;
	asio::ip::tcp::resolver resolver(m_ioContext);
	const auto endpoints = resolver.resolve(m_config.host, std::to_string(m_config.port), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Could not resolve {}:{} - {}", m_config.host, m_config.port, ec.message()));
		return false;
	}

	asio::ip::tcp::socket socket(m_ioContext);
	asio::connect(socket, endpoints, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Could not connect to {}:{} - {}", m_config.host, m_config.port, ec.message()));
		return false;
	}

	const Connection::Implementation::Options options{
	        .id = 0u, .heartbeat = HeartbeatMode::Active, .heartbeatInterval = m_config.heartbeatInterval};
	auto connection = std::make_shared<Connection>(std::make_unique<Connection::Implementation>(std::move(socket), options, makeCallbacks()));
	{
		std::lock_guard<std::mutex> lock(m_connectionMutex);
		m_connection = connection;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Network] Connected to {}:{}.", m_config.host, m_config.port));

	try {
		m_events.onConnect.trigger();
	} catch (const std::exception&) {
		connection->disconnect();
		throw;
	}

	connection->implementation().start();
	return true;
}

void TcpClient::Implementation::disconnect() {
	const auto connection = current();
	if (!connection) {
		return;
	}

	try {
		connection->disconnect();
	} catch (const std::exception& ex) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Disconnect handler failed: {}", ex.what()));
	}
	connection->implementation().join();
}

bool TcpClient::Implementation::isConnected() const {
	const auto connection = current();
	return connection && connection->isRunning();
}

bool TcpClient::Implementation::send(Payload payload) {
	const auto connection = current();
	return connection && connection->send(std::move(payload));
}

bool TcpClient::Implementation::sendRaw(const Payload& payload) {
	const auto connection = current();
	return connection && connection->sendRaw(payload);
}

std::chrono::nanoseconds TcpClient::Implementation::latency() const {
	const auto connection = current();
	return connection ? connection->latency() : std::chrono::nanoseconds{0};
}

ConnectionProfile TcpClient::Implementation::profile() const {
	const auto connection = current();
	return connection ? connection->profile() : ConnectionProfile{};
}

std::exception_ptr TcpClient::Implementation::failure() const {
	const auto connection = current();
	return connection ? connection->failure() : nullptr;
}

const std::string& TcpClient::Implementation::host() const {
	return m_config.host;
}

std::uint16_t TcpClient::Implementation::port() const {
	return m_config.port;
}

std::shared_ptr<Connection> TcpClient::Implementation::current() const {
	std::lock_guard<std::mutex> lock(m_connectionMutex);
	return m_connection;
}

Connection::Implementation::Callbacks TcpClient::Implementation::makeCallbacks() {
	Connection::Implementation::Callbacks callbacks;
	callbacks.onPacket     = [this](Connection&, const Packet& packet) { m_events.onPacket.trigger(packet); };
	callbacks.onDisconnect = [this](Connection&) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Network] Disconnected from {}:{}.", m_config.host, m_config.port));
		m_events.onDisconnect.trigger();
	};
	return callbacks;
}


TcpClient::TcpClient(ClientConfig config) : m_pimpl(std::make_unique<Implementation>(std::move(config))) {
}

TcpClient::~TcpClient() = default;

ClientEvents& TcpClient::events() {
	return m_pimpl->events();
}

bool TcpClient::connect() {
	return m_pimpl->connect();
}

void TcpClient::disconnect() {
	m_pimpl->disconnect();
}

bool TcpClient::isConnected() const {
	return m_pimpl->isConnected();
}

bool TcpClient::send(Payload payload) {
	return m_pimpl->send(std::move(payload));
}

bool TcpClient::sendRaw(const Payload& payload) {
	return m_pimpl->sendRaw(payload);
}

std::chrono::nanoseconds TcpClient::latency() const {
	return m_pimpl->latency();
}

ConnectionProfile TcpClient::profile() const {
	return m_pimpl->profile();
}

std::exception_ptr TcpClient::failure() const {
	return m_pimpl->failure();
}

const std::string& TcpClient::host() const {
	return m_pimpl->host();
}

std::uint16_t TcpClient::port() const {
	return m_pimpl->port();
}

} // namespace network
} // namespace tether
