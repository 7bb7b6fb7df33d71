#pragma once

#include "tether/network/connection.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace tether::relay {

// Client -> server
struct PlayerPosition {
	double x{};
	double y{};
};

// Both directions. The server forwards chat lines unchanged.
struct ChatLine {
	std::string text;
};

// Both directions.
//! Name and color of a player. Clients send it after connecting, the server fills in the id
//! and announces the player to its peers.
struct PlayerInfo {
	network::ConnectionId id{};
	std::string name{"unknown"};
	std::array<std::uint8_t, 3> color{}; //!< RGB
};

// Server -> client
//! Last known positions of every other connected player, keyed by player id.
struct PeerPositions {
	std::map<network::ConnectionId, PlayerPosition> positions;
};

using RelayMessage = std::variant<PlayerPosition, ChatLine, PlayerInfo, PeerPositions>;

// Serialize typed messages to JSON payloads.
std::string toMessage(const RelayMessage& message);

// Parse JSON payloads into typed messages. Returns empty on invalid input.
std::optional<RelayMessage> fromMessage(const std::string& message);

} // namespace tether::relay
