#include "tether/relay/relayMessages.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <limits>
#include <string_view>

namespace tether::relay {

using nlohmann::json;

static constexpr std::string_view TYPE_POSITION = "position";
static constexpr std::string_view TYPE_CHAT     = "chat";
static constexpr std::string_view TYPE_PLAYER   = "player";
static constexpr std::string_view TYPE_PEERS    = "peers";

static json toJson(const PlayerPosition& m) {
	return json{{"type", TYPE_POSITION}, {"x", m.x}, {"y", m.y}};
}
static json toJson(const ChatLine& m) {
	return json{{"type", TYPE_CHAT}, {"text", m.text}};
}
static json toJson(const PlayerInfo& m) {
	return json{{"type", TYPE_PLAYER}, {"id", m.id}, {"name", m.name}, {"color", json::array({m.color[0], m.color[1], m.color[2]})}};
}
static json toJson(const PeerPositions& m) {
	// JSON object keys are strings, ids are written in decimal.
	auto positions = json::object();
	for (const auto& [id, position]: m.positions) {
		positions[std::to_string(id)] = json::array({position.x, position.y});
	}
	return json{{"type", TYPE_PEERS}, {"positions", std::move(positions)}};
}

std::string toMessage(const RelayMessage& message) {
	return std::visit([](const auto& m) { return toJson(m).dump(); }, message);
}

static std::optional<PlayerPosition> readCoordinates(const json& x, const json& y) {
	if (!x.is_number() || !y.is_number()) {
		return {};
	}
	return PlayerPosition{.x = x.get<double>(), .y = y.get<double>()};
}

static std::optional<network::ConnectionId> readId(std::string_view text) {
	network::ConnectionId id{};
	const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), id);
	if (error != std::errc{} || end != text.data() + text.size()) {
		return {};
	}
	return id;
}

static std::optional<PlayerInfo> readPlayer(const json& j) {
	const auto idIt    = j.find("id");
	const auto nameIt  = j.find("name");
	const auto colorIt = j.find("color");
	if (idIt == j.end() || !idIt->is_number_unsigned() || nameIt == j.end() || !nameIt->is_string() || colorIt == j.end() ||
	    !colorIt->is_array() || colorIt->size() != 3u) {
		return {};
	}
	if (idIt->get<std::uint64_t>() > std::numeric_limits<network::ConnectionId>::max()) {
		return {};
	}

	PlayerInfo player{.id = idIt->get<network::ConnectionId>(), .name = nameIt->get<std::string>()};
	for (std::size_t i = 0; i < 3u; ++i) {
		const auto& channel = (*colorIt)[i];
		if (!channel.is_number_unsigned() || channel.get<std::uint64_t>() > 255u) {
			return {};
		}
		player.color[i] = channel.get<std::uint8_t>();
	}
	return player;
}

std::optional<RelayMessage> fromMessage(const std::string& message) {
	const auto j = json::parse(message, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		return {};
	}

	const auto typeIt = j.find("type");
	if (typeIt == j.end() || !typeIt->is_string()) {
		return {};
	}
	const auto type = typeIt->get<std::string>();

	if (type == TYPE_POSITION) {
		if (!j.contains("x") || !j.contains("y")) {
			return {};
		}
		const auto position = readCoordinates(j.at("x"), j.at("y"));
		if (!position) {
			return {};
		}
		return *position;
	}

	if (type == TYPE_CHAT) {
		const auto textIt = j.find("text");
		if (textIt == j.end() || !textIt->is_string()) {
			return {};
		}
		return ChatLine{.text = textIt->get<std::string>()};
	}

	if (type == TYPE_PLAYER) {
		const auto player = readPlayer(j);
		if (!player) {
			return {};
		}
		return *player;
	}

	if (type == TYPE_PEERS) {
		const auto positionsIt = j.find("positions");
		if (positionsIt == j.end() || !positionsIt->is_object()) {
			return {};
		}

		PeerPositions peers;
		for (const auto& [key, entry]: positionsIt->items()) {
			// Expect "id": [x, y]
			const auto id = readId(key);
			if (!id || !entry.is_array() || entry.size() != 2u) {
				return {};
			}
			const auto position = readCoordinates(entry[0], entry[1]);
			if (!position) {
				return {};
			}
			peers.positions[*id] = *position;
		}
		return peers;
	}

	// Unknown type
	return {};
}

} // namespace tether::relay
