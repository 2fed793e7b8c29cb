#pragma once

#include <cstdint>
#include <vector>


namespace meshlink::core {

// Raw byte payloads exchanged with the radio
using Bytes = std::vector<std::uint8_t>;

// Mesh packet identifier (never zero for a live packet)
using PacketId = std::uint32_t;

// Mesh node number
using NodeId = std::uint32_t;

// Notification topic (a port number for payload frames, reserved values for control frames)
using Topic = std::uint32_t;

// Per-operation token used to match link completions with the in-flight operation
using OpToken = std::uint64_t;

inline constexpr PacketId INVALID_PACKET_ID = 0;
inline constexpr NodeId   BROADCAST_NODE    = 0xFFFFFFFFu;
inline constexpr OpToken  INVALID_OP_TOKEN  = 0;

} // namespace meshlink::core
