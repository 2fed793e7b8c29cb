#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <variant>

#include "meshlink/core/types.hpp"


namespace meshlink::core::protocol {

// Reserved topics under which control frames are dispatched
namespace topic {
    inline constexpr Topic QUEUE_STATUS    = 0xFFFF0001u;
    inline constexpr Topic ROUTING         = 0xFFFF0002u;
    inline constexpr Topic CONFIG_COMPLETE = 0xFFFF0003u;

    [[nodiscard]]
    inline constexpr bool is_reserved(Topic t) noexcept {
        return t >= QUEUE_STATUS && t <= CONFIG_COMPLETE;
    }
} // namespace topic

// Radio transmit queue report for one packet
//
//   result == 0, free == 0 : radio queue is full (informational)
//   result != 0            : the radio rejected packet_id
struct QueueStatus {
    std::int32_t result{0};
    std::uint32_t free{0};
    PacketId packet_id{INVALID_PACKET_ID};
};

// Mesh-level acknowledgment for request_id. error_reason == 0 means success.
struct Routing {
    PacketId request_id{INVALID_PACKET_ID};
    NodeId from{0};
    std::uint32_t error_reason{0};
};

// Terminates a configuration download started with the matching nonce
struct ConfigComplete {
    std::uint32_t nonce{0};
};

// Application payload addressed to a topic (port)
struct Payload {
    Topic topic{0};
    NodeId from{0};
    Bytes data{};
};

struct Frame {
    std::variant<Payload, QueueStatus, Routing, ConfigComplete> body;

    [[nodiscard]]
    Topic topic() const noexcept {
        switch (body.index()) {
        case 1:  return topic::QUEUE_STATUS;
        case 2:  return topic::ROUTING;
        case 3:  return topic::CONFIG_COMPLETE;
        default: return std::get<Payload>(body).topic;
        }
    }
};

// -----------------------------------------------------------------------------
// FrameCodecConcept
// -----------------------------------------------------------------------------
//
// Radio wire encoding. The session never inspects frame bytes itself.
//
template<class C>
concept FrameCodecConcept =
requires(C codec, PacketId id, NodeId destination, bool want_ack,
         const Bytes& bytes, std::uint32_t nonce) {
    { codec.encode_packet(id, destination, want_ack, bytes) } -> std::same_as<Bytes>;
    { codec.encode_want_config(nonce) } -> std::same_as<Bytes>;
    { codec.decode(bytes) } -> std::same_as<std::optional<Frame>>;
};

} // namespace meshlink::core::protocol
