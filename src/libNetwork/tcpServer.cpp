#include "tether/network/tcpServer.hpp"

#include "Logging.hpp"
#include "connectionImpl.hpp"

#include <asio.hpp>
#include <asio/ip/tcp.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <iterator>
#include <mutex>
#include <semaphore>
#include <thread>
#include <utility>

namespace tether::network {

class TcpServer::Implementation {
public:
	explicit Implementation(ServerConfig config);

	ServerEvents& events();

	bool start();
	void stop();
	void shutdown(); //!< stop() without rethrowing accept loop failures.
	bool isRunning() const;

	bool send(ConnectionId connectionId, Payload payload);
	std::size_t broadcast(const Payload& payload);

	std::vector<std::shared_ptr<Connection>> connections() const;
	std::size_t connectionCount() const;

	std::uint64_t packetCount() const;
	std::uint64_t resetPacketCount();

	const std::string& host() const;
	std::uint16_t port() const;

private:
	bool setupAcceptor();                                  //!< Open, bind and listen. Stays in error_code land.
	void runAcceptLoop();                                  //!< Accept thread entry.
	void acceptLoop();                                     //!< Admission, accept, register, start.
	asio::error_code accept(asio::ip::tcp::socket& socket); //!< Blocking accept that stop() can interrupt.
	void addConnection(asio::ip::tcp::socket socket);
	Connection::Implementation::Callbacks makeCallbacks();

	void retire(Connection& connection); //!< Move a disconnected connection from the registry to the retired list.
	void reapRetired();                  //!< Drop retired connections whose threads have all returned.

private:
	const ServerConfig m_config;
	ServerEvents m_events;

	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::atomic<std::uint16_t> m_boundPort{0u};

	std::thread m_acceptThread;         //!< Runs the accept loop.
	std::atomic<bool> m_running{false}; //!< TCP Server running.
	std::counting_semaphore<> m_slots;  //!< Admission permits, one per allowed live connection.

	mutable std::mutex m_connectionsMutex;
	std::vector<std::shared_ptr<Connection>> m_connections; //!< Live connections in accept order.
	std::vector<std::shared_ptr<Connection>> m_retired;     //!< Disconnected, threads possibly still winding down.
	ConnectionId m_nextId{0u};

	std::atomic<std::uint64_t> m_packetCount{0u};

	std::mutex m_failureMutex;
	std::exception_ptr m_acceptFailure;
};


TcpServer::Implementation::Implementation(ServerConfig config)
    : m_config(std::move(config)), m_acceptor(m_ioContext), m_slots(static_cast<std::ptrdiff_t>(m_config.maxConnections)) {
}

ServerEvents& TcpServer::Implementation::events() {
	return m_events;
}

bool TcpServer::Implementation::start() {
	if (m_running || m_acceptThread.joinable()) {
		return false;
	}

	if (!setupAcceptor()) {
		return false;
	}

	m_running = true;
	Logger().Log(Logging::LogLevel::Info, std::format("[Network] Listening on {}:{}.", m_config.host, port()));
	m_events.onReady.trigger();

	m_acceptThread = std::thread([this] { runAcceptLoop(); });
	return true;
}

bool TcpServer::Implementation::setupAcceptor() {
	auto fail = [this](std::string_view step, const asio::error_code& ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Server {} {}:{} failed - {}", step, m_config.host, m_config.port, ec.message()));
		asio::error_code closeEc;
		m_acceptor.close(closeEc);
		return false;
	};

	asio::error_code ec;
	asio::ip::tcp::resolver resolver(m_ioContext);
	const auto endpoints = resolver.resolve(m_config.host, std::to_string(m_config.port), ec);
	if (ec || endpoints.empty()) {
		return fail("resolve", ec);
	}
	const auto endpoint = endpoints.begin()->endpoint();

	m_acceptor.open(endpoint.protocol(), ec);
	if (ec) {
		return fail("open", ec);
	}
	m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
	if (ec) {
		return fail("configure", ec);
	}
	m_acceptor.bind(endpoint, ec);
	if (ec) {
		return fail("bind", ec);
	}
	m_acceptor.listen(m_config.backlog, ec);
	if (ec) {
		return fail("listen", ec);
	}

	const auto local = m_acceptor.local_endpoint(ec);
	m_boundPort      = ec ? m_config.port : local.port();
	return true;
}

void TcpServer::Implementation::stop() {
	shutdown();

	std::exception_ptr failure;
	{
		std::lock_guard<std::mutex> lock(m_failureMutex);
		failure = std::exchange(m_acceptFailure, nullptr);
	}
	if (failure) {
		std::rethrow_exception(failure);
	}
}

void TcpServer::Implementation::shutdown() {
	const bool wasRunning = m_running.exchange(false);
	if (wasRunning) {
		// Closing on the io thread aborts a pending accept.
		asio::post(m_ioContext, [this] {
			asio::error_code ec;
			m_acceptor.close(ec);
		});
		// Unpark an accept loop waiting for a free slot.
		if (m_config.maxConnections > 0u) {
			m_slots.release();
		}
	}

	if (m_acceptThread.joinable()) {
		m_acceptThread.join();
	}

	asio::error_code ec;
	m_acceptor.close(ec);

	std::vector<std::shared_ptr<Connection>> live;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		live = m_connections;
	}
	for (auto& connection: live) {
		try {
			connection->disconnect();
		} catch (const std::exception& ex) {
			Logger().Log(Logging::LogLevel::Error, std::format("[Network] Disconnect handler of connection {} failed: {}", connection->id(), ex.what()));
		}
	}

	// A worker already inside disconnect() may not have retired itself yet. Join the live snapshot as well.
	std::vector<std::shared_ptr<Connection>> retired;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		retired.swap(m_retired);
		m_connections.clear();
	}
	for (auto& connection: live) {
		connection->implementation().join();
	}
	for (auto& connection: retired) {
		connection->implementation().join();
	}

	if (wasRunning) {
		Logger().Log(Logging::LogLevel::Info, "[Network] Server stopped.");
	}
}

bool TcpServer::Implementation::isRunning() const {
	return m_running;
}

bool TcpServer::Implementation::send(ConnectionId connectionId, Payload payload) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = std::ranges::find_if(m_connections, [&](const auto& connection) { return connection->id() == connectionId; });
	if (it == m_connections.end()) {
		return false;
	}
	return (*it)->send(std::move(payload));
}

std::size_t TcpServer::Implementation::broadcast(const Payload& payload) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	std::size_t queued = 0u;
	for (const auto& connection: m_connections) {
		if (connection->send(payload)) {
			++queued;
		}
	}
	return queued;
}

std::vector<std::shared_ptr<Connection>> TcpServer::Implementation::connections() const {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);
	return m_connections;
}

std::size_t TcpServer::Implementation::connectionCount() const {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);
	return m_connections.size();
}

std::uint64_t TcpServer::Implementation::packetCount() const {
	return m_packetCount.load();
}

std::uint64_t TcpServer::Implementation::resetPacketCount() {
	return m_packetCount.exchange(0u);
}

const std::string& TcpServer::Implementation::host() const {
	return m_config.host;
}

std::uint16_t TcpServer::Implementation::port() const {
	const auto bound = m_boundPort.load();
	return bound != 0u ? bound : m_config.port;
}

void TcpServer::Implementation::runAcceptLoop() {
	try {
		acceptLoop();
	} catch (const std::exception& ex) {
		{
			std::lock_guard<std::mutex> lock(m_failureMutex);
			m_acceptFailure = std::current_exception();
		}
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Accept loop failed - {}", ex.what()));
	}
}

void TcpServer::Implementation::acceptLoop() {
	while (m_running) {
		reapRetired();

		// Block while the connection cap is reached. Excess clients wait in the OS backlog.
		if (m_config.maxConnections > 0u) {
			m_slots.acquire();
			if (!m_running) {
				break;
			}
		}

		asio::ip::tcp::socket socket(m_ioContext);
		const auto ec = accept(socket);
		if (ec) {
			if (!m_running) {
				break;
			}
			throw asio::system_error(ec, "Accept failed");
		}

		addConnection(std::move(socket));
	}
}

asio::error_code TcpServer::Implementation::accept(asio::ip::tcp::socket& socket) {
	asio::error_code result = asio::error::operation_aborted;
	m_acceptor.async_accept(socket, [&result](const asio::error_code& ec) { result = ec; });

	m_ioContext.restart();
	m_ioContext.run();
	return result;
}

void TcpServer::Implementation::addConnection(asio::ip::tcp::socket socket) {
	std::shared_ptr<Connection> connection;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);

		const auto connectionId =
		        m_config.idPolicy == ConnectionIdPolicy::RegistrySize ? static_cast<ConnectionId>(m_connections.size()) : m_nextId++;
		const Connection::Implementation::Options options{.id = connectionId, .heartbeat = HeartbeatMode::Passive};

		connection = std::make_shared<Connection>(std::make_unique<Connection::Implementation>(std::move(socket), options, makeCallbacks()));
		m_connections.push_back(connection);
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Network] Connection {} accepted from '{}:{}'.", connection->id(),
	                                                  connection->remoteAddress(), connection->remotePort()));

	try {
		m_events.onConnect.trigger(*connection);
	} catch (const std::exception&) {
		connection->disconnect();
		throw;
	}

	connection->implementation().start();
}

Connection::Implementation::Callbacks TcpServer::Implementation::makeCallbacks() {
	Connection::Implementation::Callbacks callbacks;
	callbacks.onPacket  = [this](Connection& connection, const Packet& packet) { m_events.onPacket.trigger(packet, connection); };
	callbacks.onReceive = [this](Connection&) { m_packetCount.fetch_add(1u, std::memory_order_relaxed); };
	callbacks.onDisconnect = [this](Connection& connection) {
		retire(connection);
		Logger().Log(Logging::LogLevel::Info, std::format("[Network] Connection {} disconnected.", connection.id()));
		m_events.onDisconnect.trigger(connection);
	};
	callbacks.onClosed = [this](Connection&) {
		if (m_config.maxConnections > 0u) {
			m_slots.release();
		}
	};
	return callbacks;
}

void TcpServer::Implementation::retire(Connection& connection) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = std::ranges::find_if(m_connections, [&](const auto& entry) { return entry.get() == &connection; });
	if (it == m_connections.end()) {
		return;
	}
	m_retired.push_back(std::move(*it));
	m_connections.erase(it);
}

void TcpServer::Implementation::reapRetired() {
	std::vector<std::shared_ptr<Connection>> done;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);

		const auto firstDone = std::partition(m_retired.begin(), m_retired.end(), [](const auto& connection) {
			return !connection->implementation().finished();
		});
		std::move(firstDone, m_retired.end(), std::back_inserter(done));
		m_retired.erase(firstDone, m_retired.end());
	}

	for (auto& connection: done) {
		connection->implementation().join();
	}
}


TcpServer::TcpServer(ServerConfig config) : m_pimpl(std::make_unique<Implementation>(std::move(config))) {
}

TcpServer::~TcpServer() {
	m_pimpl->shutdown();
}

ServerEvents& TcpServer::events() {
	return m_pimpl->events();
}

bool TcpServer::start() {
	return m_pimpl->start();
}

void TcpServer::stop() {
	m_pimpl->stop();
}

bool TcpServer::isRunning() const {
	return m_pimpl->isRunning();
}

bool TcpServer::send(ConnectionId connectionId, Payload payload) {
	return m_pimpl->send(connectionId, std::move(payload));
}

std::size_t TcpServer::broadcast(const Payload& payload) {
	return m_pimpl->broadcast(payload);
}

std::vector<std::shared_ptr<Connection>> TcpServer::connections() const {
	return m_pimpl->connections();
}

std::size_t TcpServer::connectionCount() const {
	return m_pimpl->connectionCount();
}

std::uint64_t TcpServer::packetCount() const {
	return m_pimpl->packetCount();
}

std::uint64_t TcpServer::resetPacketCount() {
	return m_pimpl->resetPacketCount();
}

const std::string& TcpServer::host() const {
	return m_pimpl->host();
}

std::uint16_t TcpServer::port() const {
	return m_pimpl->port();
}

} // namespace tether::network
