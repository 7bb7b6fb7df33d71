#include "network/recorder.hpp"

#include "tether/network/tcpClient.hpp"
#include "tether/network/tcpServer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace tether::gtest {

//! Server on an ephemeral loopback port.
static network::ServerConfig loopback(std::size_t maxConnections = 0u) {
	return network::ServerConfig{.host = "127.0.0.1", .port = 0u, .maxConnections = maxConnections};
}

static std::unique_ptr<network::TcpClient> makeClient(const network::TcpServer& server) {
	return std::make_unique<network::TcpClient>(network::ClientConfig{.host = "127.0.0.1", .port = server.port()});
}

TEST(TcpServer, StartTriggersReady) {
	network::TcpServer server(loopback());
	int readyCalls = 0;
	server.events().onReady.subscribe([&] { ++readyCalls; });

	ASSERT_TRUE(server.start());
	EXPECT_TRUE(server.isRunning());
	EXPECT_NE(server.port(), 0u);
	EXPECT_EQ(readyCalls, 1);

	EXPECT_FALSE(server.start());
	server.stop();
	EXPECT_FALSE(server.isRunning());
}

TEST(TcpServer, StartFailsOnUsedPort) {
	network::TcpServer first(loopback());
	ASSERT_TRUE(first.start());

	network::TcpServer second(network::ServerConfig{.host = "127.0.0.1", .port = first.port()});
	EXPECT_FALSE(second.start());
	EXPECT_FALSE(second.isRunning());

	first.stop();
}

TEST(TcpServer, RelaysHelloBetweenClients) {
	network::TcpServer server(loopback());
	server.events().onPacket.subscribe([&](const network::Packet& packet, network::Connection& sender) {
		for (const auto& connection: server.connections()) {
			if (connection.get() != &sender) {
				connection->send(packet.payload);
			}
		}
	});
	Recorder<network::ConnectionId> connected;
	server.events().onConnect.subscribe([&](network::Connection& connection) { connected.push(connection.id()); });
	ASSERT_TRUE(server.start());

	auto clientA = makeClient(server);
	auto clientB = makeClient(server);
	Recorder<std::string> receivedA;
	Recorder<std::string> receivedB;
	clientA->events().onPacket.subscribe([&](const network::Packet& packet) { receivedA.push(packet.payload); });
	clientB->events().onPacket.subscribe([&](const network::Packet& packet) { receivedB.push(packet.payload); });

	ASSERT_TRUE(clientA->connect());
	ASSERT_TRUE(clientB->connect());
	ASSERT_TRUE(connected.waitFor(2u));

	EXPECT_TRUE(clientA->send("hello"));
	ASSERT_TRUE(receivedB.waitFor(1u));
	EXPECT_EQ(receivedB.entries().front(), "hello");
	EXPECT_EQ(receivedA.size(), 0u);

	clientA->disconnect();
	clientB->disconnect();
	server.stop();
}

TEST(TcpServer, PreservesPayloadOrder) {
	constexpr std::size_t count = 1000u;

	network::TcpServer server(loopback());
	Recorder<std::string> received;
	server.events().onPacket.subscribe([&](const network::Packet& packet, network::Connection&) { received.push(packet.payload); });
	ASSERT_TRUE(server.start());

	auto client = makeClient(server);
	ASSERT_TRUE(client->connect());
	for (std::size_t i = 0u; i < count; ++i) {
		ASSERT_TRUE(client->send(std::to_string(i)));
	}

	ASSERT_TRUE(received.waitFor(count, 10s));
	const auto payloads = received.entries();
	for (std::size_t i = 0u; i < count; ++i) {
		EXPECT_EQ(payloads[i], std::to_string(i));
	}

	client->disconnect();
	server.stop();
}

TEST(TcpServer, ServerToClientOrder) {
	constexpr std::size_t count = 200u;

	network::TcpServer server(loopback());
	Recorder<network::ConnectionId> connected;
	server.events().onConnect.subscribe([&](network::Connection& connection) { connected.push(connection.id()); });
	ASSERT_TRUE(server.start());

	auto client = makeClient(server);
	Recorder<std::string> received;
	client->events().onPacket.subscribe([&](const network::Packet& packet) { received.push(packet.payload); });
	ASSERT_TRUE(client->connect());
	ASSERT_TRUE(connected.waitFor(1u));

	const auto id = connected.entries().front();
	for (std::size_t i = 0u; i < count; ++i) {
		ASSERT_TRUE(server.send(id, std::to_string(i)));
	}
	EXPECT_FALSE(server.send(id + 100u, "nobody"));

	ASSERT_TRUE(received.waitFor(count, 10s));
	const auto payloads = received.entries();
	for (std::size_t i = 0u; i < count; ++i) {
		EXPECT_EQ(payloads[i], std::to_string(i));
	}

	client->disconnect();
	server.stop();
}

TEST(TcpServer, AdmissionControl) {
	network::TcpServer server(loopback(2u));
	Recorder<network::ConnectionId> connected;
	server.events().onConnect.subscribe([&](network::Connection& connection) { connected.push(connection.id()); });
	ASSERT_TRUE(server.start());

	// All three complete the handshake through the backlog, only two get accepted.
	std::vector<std::unique_ptr<network::TcpClient>> clients;
	for (int i = 0; i < 3; ++i) {
		clients.push_back(makeClient(server));
		ASSERT_TRUE(clients.back()->connect());
	}

	ASSERT_TRUE(connected.waitFor(2u));
	std::this_thread::sleep_for(300ms);
	EXPECT_EQ(connected.size(), 2u);
	EXPECT_EQ(server.connectionCount(), 2u);

	clients.front()->disconnect();
	ASSERT_TRUE(connected.waitFor(3u));
	EXPECT_TRUE(waitUntil([&] { return server.connectionCount() == 2u; }));

	for (auto& client: clients) {
		client->disconnect();
	}
	server.stop();
}

TEST(TcpServer, StopDisconnectsClients) {
	network::TcpServer server(loopback());
	Recorder<network::ConnectionId> connected;
	server.events().onConnect.subscribe([&](network::Connection& connection) { connected.push(connection.id()); });
	ASSERT_TRUE(server.start());

	auto client = makeClient(server);
	Recorder<bool> clientDisconnected;
	client->events().onDisconnect.subscribe([&] { clientDisconnected.push(true); });
	ASSERT_TRUE(client->connect());
	ASSERT_TRUE(connected.waitFor(1u));

	const auto start = std::chrono::steady_clock::now();
	server.stop();
	EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

	// One poll interval plus slack.
	ASSERT_TRUE(clientDisconnected.waitFor(1u, 250ms));
	EXPECT_FALSE(client->isConnected());
	EXPECT_EQ(server.connectionCount(), 0u);
}

TEST(TcpServer, ConcurrentDisconnectReportsOnce) {
	network::TcpServer server(loopback());
	Recorder<std::shared_ptr<network::Connection>> connected;
	Recorder<network::ConnectionId> disconnected;
	server.events().onConnect.subscribe([&](network::Connection& connection) {
		for (const auto& entry: server.connections()) {
			if (entry.get() == &connection) {
				connected.push(entry);
			}
		}
	});
	server.events().onDisconnect.subscribe([&](network::Connection& connection) { disconnected.push(connection.id()); });
	ASSERT_TRUE(server.start());

	auto client = makeClient(server);
	ASSERT_TRUE(client->connect());
	ASSERT_TRUE(connected.waitFor(1u));
	const auto connection = connected.entries().front();

	std::vector<std::thread> threads;
	for (int i = 0; i < 4; ++i) {
		threads.emplace_back([&] { connection->disconnect(); });
	}
	for (auto& thread: threads) {
		thread.join();
	}
	connection->disconnect();

	ASSERT_TRUE(disconnected.waitFor(1u));
	std::this_thread::sleep_for(200ms);
	EXPECT_EQ(disconnected.size(), 1u);
	EXPECT_FALSE(connection->isRunning());
	EXPECT_FALSE(connection->send("late"));
	EXPECT_EQ(connection->failure(), nullptr);
	EXPECT_EQ(server.connectionCount(), 0u);

	client->disconnect();
	server.stop();
}

TEST(TcpServer, ClientLeavingIsReported) {
	network::TcpServer server(loopback());
	Recorder<network::ConnectionId> disconnected;
	server.events().onDisconnect.subscribe([&](network::Connection& connection) { disconnected.push(connection.id()); });
	ASSERT_TRUE(server.start());

	auto client = makeClient(server);
	ASSERT_TRUE(client->connect());
	ASSERT_TRUE(waitUntil([&] { return server.connectionCount() == 1u; }));

	client->disconnect();
	ASSERT_TRUE(disconnected.waitFor(1u));
	EXPECT_EQ(server.connectionCount(), 0u);

	server.stop();
}

TEST(TcpServer, StopJoinsConnectionsStillDisconnecting) {
	// Repeat to hit both orders of the client leaving and stop().
	for (int round = 0; round < 10; ++round) {
		network::TcpServer server(loopback(1u));
		std::atomic<bool> handlerDone{false};
		server.events().onDisconnect.subscribe([&](network::Connection&) {
			std::this_thread::sleep_for(20ms);
			handlerDone = true;
		});
		ASSERT_TRUE(server.start());

		auto client = makeClient(server);
		ASSERT_TRUE(client->connect());
		ASSERT_TRUE(waitUntil([&] { return server.connectionCount() == 1u; }));
		const auto held = server.connections();

		client->disconnect();
		server.stop();

		// stop() returns only once the worker that reports the disconnect has finished.
		EXPECT_TRUE(handlerDone) << "round " << round;
		ASSERT_EQ(held.size(), 1u);
		EXPECT_FALSE(held.front()->isRunning());
	}
}

TEST(TcpServer, ProfilesEveryLoop) {
	network::TcpServer server(loopback());
	server.events().onPacket.subscribe([](const network::Packet& packet, network::Connection& sender) { sender.send(packet.payload); });
	ASSERT_TRUE(server.start());

	auto client = makeClient(server);
	Recorder<std::string> echoed;
	client->events().onPacket.subscribe([&](const network::Packet& packet) { echoed.push(packet.payload); });
	ASSERT_TRUE(client->connect());
	ASSERT_TRUE(waitUntil([&] { return server.connectionCount() == 1u; }));
	const auto connection = server.connections().front();

	for (int i = 0; i < 3; ++i) {
		ASSERT_TRUE(client->send(std::to_string(i)));
	}
	ASSERT_TRUE(echoed.waitFor(3u));

	const auto allRecorded = [](const network::ConnectionProfile& profile) {
		return profile.listenerTime > std::chrono::nanoseconds{0} && profile.processerTime > std::chrono::nanoseconds{0} &&
		       profile.senderTime > std::chrono::nanoseconds{0};
	};
	EXPECT_TRUE(waitUntil([&] { return allRecorded(client->profile()); }));
	EXPECT_TRUE(waitUntil([&] { return allRecorded(connection->profile()); }));

	client->disconnect();
	server.stop();
}

TEST(TcpServer, CountsApplicationPackets) {
	network::TcpServer server(loopback());
	Recorder<std::string> received;
	server.events().onPacket.subscribe([&](const network::Packet& packet, network::Connection&) { received.push(packet.payload); });
	ASSERT_TRUE(server.start());

	auto client = makeClient(server);
	ASSERT_TRUE(client->connect());
	for (int i = 0; i < 10; ++i) {
		ASSERT_TRUE(client->send("packet"));
	}
	ASSERT_TRUE(received.waitFor(10u));

	// Heartbeats are not counted.
	EXPECT_EQ(server.packetCount(), 10u);
	EXPECT_EQ(server.resetPacketCount(), 10u);
	EXPECT_EQ(server.packetCount(), 0u);

	client->disconnect();
	server.stop();
}

TEST(TcpServer, BroadcastReachesEveryClient) {
	network::TcpServer server(loopback());
	ASSERT_TRUE(server.start());

	auto clientA = makeClient(server);
	auto clientB = makeClient(server);
	Recorder<std::string> received;
	clientA->events().onPacket.subscribe([&](const network::Packet& packet) { received.push("A:" + packet.payload); });
	clientB->events().onPacket.subscribe([&](const network::Packet& packet) { received.push("B:" + packet.payload); });
	ASSERT_TRUE(clientA->connect());
	ASSERT_TRUE(clientB->connect());
	ASSERT_TRUE(waitUntil([&] { return server.connectionCount() == 2u; }));

	EXPECT_EQ(server.broadcast("news"), 2u);
	ASSERT_TRUE(received.waitFor(2u));

	clientA->disconnect();
	clientB->disconnect();
	server.stop();
}

TEST(TcpServer, RegistrySizeIdsRepeat) {
	auto config     = loopback();
	config.idPolicy = network::ConnectionIdPolicy::RegistrySize;
	network::TcpServer server(config);
	Recorder<network::ConnectionId> connected;
	Recorder<network::ConnectionId> disconnected;
	server.events().onConnect.subscribe([&](network::Connection& connection) { connected.push(connection.id()); });
	server.events().onDisconnect.subscribe([&](network::Connection& connection) { disconnected.push(connection.id()); });
	ASSERT_TRUE(server.start());

	auto first  = makeClient(server);
	auto second = makeClient(server);
	ASSERT_TRUE(first->connect());
	ASSERT_TRUE(connected.waitFor(1u));
	ASSERT_TRUE(second->connect());
	ASSERT_TRUE(connected.waitFor(2u));

	first->disconnect();
	ASSERT_TRUE(disconnected.waitFor(1u));

	auto third = makeClient(server);
	ASSERT_TRUE(third->connect());
	ASSERT_TRUE(connected.waitFor(3u));

	// One live connection left when the third arrived, so it reuses the second's id.
	EXPECT_EQ(connected.entries(), (std::vector<network::ConnectionId>{0u, 1u, 1u}));

	second->disconnect();
	third->disconnect();
	server.stop();
}

TEST(TcpServer, MonotonicIdsAreUnique) {
	network::TcpServer server(loopback());
	Recorder<network::ConnectionId> connected;
	server.events().onConnect.subscribe([&](network::Connection& connection) { connected.push(connection.id()); });
	ASSERT_TRUE(server.start());

	for (int i = 0; i < 3; ++i) {
		auto client = makeClient(server);
		ASSERT_TRUE(client->connect());
		ASSERT_TRUE(connected.waitFor(static_cast<std::size_t>(i) + 1u));
		client->disconnect();
	}
	EXPECT_EQ(connected.entries(), (std::vector<network::ConnectionId>{0u, 1u, 2u}));

	server.stop();
}

TEST(TcpServer, HandlerFailureClosesOnlyThatConnection) {
	network::TcpServer server(loopback());
	server.events().onPacket.subscribe([](const network::Packet& packet, network::Connection&) {
		if (packet.payload == "fail") {
			throw std::runtime_error("handler failed");
		}
	});
	Recorder<bool> failureRecorded;
	server.events().onDisconnect.subscribe([&](network::Connection& connection) { failureRecorded.push(connection.failure() != nullptr); });
	ASSERT_TRUE(server.start());

	auto failing = makeClient(server);
	auto healthy = makeClient(server);
	Recorder<bool> failingClosed;
	failing->events().onDisconnect.subscribe([&] { failingClosed.push(true); });
	ASSERT_TRUE(failing->connect());
	ASSERT_TRUE(healthy->connect());
	ASSERT_TRUE(waitUntil([&] { return server.connectionCount() == 2u; }));

	ASSERT_TRUE(failing->send("fail"));
	ASSERT_TRUE(failingClosed.waitFor(1u));
	ASSERT_TRUE(failureRecorded.waitFor(1u));
	EXPECT_TRUE(failureRecorded.entries().front());

	EXPECT_TRUE(healthy->isConnected());
	EXPECT_EQ(server.connectionCount(), 1u);

	healthy->disconnect();
	EXPECT_NO_THROW(server.stop());
}

} // namespace tether::gtest
