#pragma once

#include <cstdint>
#include <optional>
#include <utility>

#include "meshlink/core/types.hpp"
#include "meshlink/core/protocol/frame.hpp"


namespace meshlink::examples {

using core::Bytes;

// -----------------------------------------------------------------------------
// DemoCodec
// -----------------------------------------------------------------------------
//
// Big-endian tag/value framing shared by the examples and SimulatedRadio:
//
//   'P' id dest ack payload...     outbound packet
//   'W' nonce                      configuration request
//   'q' result free id             queue status
//   'r' id from error              routing report
//   'c' nonce                      configuration complete
//   'd' topic from data...         application payload
//
struct DemoCodec {
    Bytes encode_packet(core::PacketId id, core::NodeId destination, bool want_ack, const Bytes& payload) const {
        Bytes out{'P'};
        put_(out, id);
        put_(out, destination);
        out.push_back(want_ack ? 1 : 0);
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }

    Bytes encode_want_config(std::uint32_t nonce) const {
        Bytes out{'W'};
        put_(out, nonce);
        return out;
    }

    std::optional<core::protocol::Frame> decode(const Bytes& raw) const {
        using namespace core::protocol;
        if (raw.empty()) {
            return std::nullopt;
        }
        switch (raw[0]) {
        case 'q':
            if (raw.size() != 7) return std::nullopt;
            return Frame{QueueStatus{static_cast<std::int8_t>(raw[1]), raw[2], get_(raw, 3)}};
        case 'r':
            if (raw.size() != 10) return std::nullopt;
            return Frame{Routing{get_(raw, 1), get_(raw, 5), raw[9]}};
        case 'c':
            if (raw.size() != 5) return std::nullopt;
            return Frame{ConfigComplete{get_(raw, 1)}};
        case 'd':
            if (raw.size() < 9) return std::nullopt;
            return Frame{Payload{get_(raw, 1), get_(raw, 5), Bytes(raw.begin() + 9, raw.end())}};
        default:
            return std::nullopt;
        }
    }

    // Radio side
    static Bytes queue_status(std::int8_t result, std::uint8_t free, core::PacketId id) {
        Bytes out{'q', static_cast<std::uint8_t>(result), free};
        put_(out, id);
        return out;
    }

    static Bytes routing(core::PacketId id, core::NodeId from, std::uint8_t error = 0) {
        Bytes out{'r'};
        put_(out, id);
        put_(out, from);
        out.push_back(error);
        return out;
    }

    static Bytes config_complete(std::uint32_t nonce) {
        Bytes out{'c'};
        put_(out, nonce);
        return out;
    }

    static Bytes payload(core::Topic topic, core::NodeId from, const Bytes& data) {
        Bytes out{'d'};
        put_(out, topic);
        put_(out, from);
        out.insert(out.end(), data.begin(), data.end());
        return out;
    }

    static std::uint32_t get_(const Bytes& in, std::size_t offset) {
        return (static_cast<std::uint32_t>(in[offset]) << 24) |
               (static_cast<std::uint32_t>(in[offset + 1]) << 16) |
               (static_cast<std::uint32_t>(in[offset + 2]) << 8) |
                static_cast<std::uint32_t>(in[offset + 3]);
    }

private:
    static void put_(Bytes& out, std::uint32_t v) {
        out.push_back(static_cast<std::uint8_t>(v >> 24));
        out.push_back(static_cast<std::uint8_t>(v >> 16));
        out.push_back(static_cast<std::uint8_t>(v >> 8));
        out.push_back(static_cast<std::uint8_t>(v));
    }
};

static_assert(core::protocol::FrameCodecConcept<DemoCodec>);

} // namespace meshlink::examples
