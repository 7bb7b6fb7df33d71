#include "tether/network/protocol.hpp"

#include <format>

namespace tether::network {

static bool isKnownFormat(std::uint8_t code) {
	switch (static_cast<PacketFormat>(code)) {
	case PacketFormat::Raw:
	case PacketFormat::HeartbeatPing:
	case PacketFormat::HeartbeatPong:
		return true;
	}
	return false;
}

std::string encodeHeader(PacketFormat format, std::size_t length) {
	if (length > MAX_PAYLOAD_BYTES) {
		throw ProtocolError(std::format("Payload of {} bytes exceeds the {} byte frame limit.", length, MAX_PAYLOAD_BYTES));
	}

	std::string header;
	header.reserve(HEADER_BYTES);
	header.push_back(static_cast<char>(format));
	header += std::format("{:05}", length);
	return header;
}

std::string encodePacket(PacketFormat format, std::string_view payload) {
	auto packet = encodeHeader(format, payload.size());
	packet.append(payload);
	return packet;
}

Header decodeHeader(std::string_view bytes) {
	if (bytes.size() != HEADER_BYTES) {
		throw ProtocolError(std::format("Header must be {} bytes, got {}.", HEADER_BYTES, bytes.size()));
	}

	const auto code = static_cast<std::uint8_t>(bytes[0]);
	if (!isKnownFormat(code)) {
		throw ProtocolError(std::format("Unknown packet format code {}.", code));
	}

	std::uint32_t length = 0u;
	for (const char digit: bytes.substr(1)) {
		if (digit < '0' || digit > '9') {
			throw ProtocolError("Header length field is not decimal.");
		}
		length = length * 10u + static_cast<std::uint32_t>(digit - '0');
	}

	return Header{.format = static_cast<PacketFormat>(code), .length = length};
}

Packet decodePacket(std::string_view bytes) {
	if (bytes.size() < HEADER_BYTES) {
		throw ProtocolError("Frame is shorter than its header.");
	}

	const auto header  = decodeHeader(bytes.substr(0, HEADER_BYTES));
	const auto payload = bytes.substr(HEADER_BYTES);
	if (payload.size() != header.length) {
		throw ProtocolError(std::format("Header announces {} payload bytes, frame carries {}.", header.length, payload.size()));
	}

	return Packet{.payload = Payload{payload}, .header = header, .receivedAt = Clock::now()};
}

std::string_view toString(PacketFormat format) {
	switch (format) {
	case PacketFormat::Raw:
		return "Raw";
	case PacketFormat::HeartbeatPing:
		return "HeartbeatPing";
	case PacketFormat::HeartbeatPong:
		return "HeartbeatPong";
	}
	return "Unknown";
}

} // namespace tether::network
