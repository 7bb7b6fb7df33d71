#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tether {
namespace network {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Payload   = std::string; //!< Opaque application bytes.

inline constexpr std::uint16_t DEFAULT_PORT = 65432;
inline constexpr int DEFAULT_BACKLOG        = 5;

//! Wait limit for queue pops. Bounds how long a loop takes to observe shutdown.
inline constexpr std::chrono::milliseconds POLL_INTERVAL{100};
//! Minimum time between two heartbeat pings sent by a client.
inline constexpr std::chrono::milliseconds HEARTBEAT_INTERVAL{500};

inline constexpr std::size_t HEADER_BYTES        = 6;
inline constexpr std::size_t LENGTH_DIGITS       = 5;
inline constexpr std::uint32_t MAX_PAYLOAD_BYTES = 99999; //!< Largest length the 5 digit field can carry.

//! Wire format code. The numeric values are part of the protocol.
enum class PacketFormat : std::uint8_t {
	Raw           = 0, //!< Application payload.
	HeartbeatPing = 1, //!< Sent by clients. Empty payload.
	HeartbeatPong = 2, //!< Reply to a ping. Empty payload.
};

struct Header {
	PacketFormat format{PacketFormat::Raw};
	std::uint32_t length{}; //!< Payload bytes following the header.
};

//! A fully received frame.
struct Packet {
	Payload payload;
	Header header;
	TimePoint receivedAt; //!< Time the last payload byte arrived.
};

//! Thrown on frames that cannot be encoded or decoded.
class ProtocolError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Build the 6 byte header: format byte followed by the zero padded decimal length.
//! \throws ProtocolError if length exceeds MAX_PAYLOAD_BYTES.
std::string encodeHeader(PacketFormat format, std::size_t length);

//! Header followed by payload.
std::string encodePacket(PacketFormat format, std::string_view payload);

//! Parse a 6 byte header.
//! \throws ProtocolError on wrong size, unknown format code or non-digit length.
Header decodeHeader(std::string_view bytes);

//! Parse one complete frame. The packet is stamped with the current time.
//! \throws ProtocolError if the frame is malformed or the payload size does not match the header.
Packet decodePacket(std::string_view bytes);

std::string_view toString(PacketFormat format);

} // namespace network
} // namespace tether
