#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "meshlink/core/types.hpp"
#include "meshlink/core/error.hpp"
#include "meshlink/core/link/endpoint.hpp"


namespace meshlink::core::link {

// Completion of a queued primitive (write, read, set_notify, reliable_write)
struct OpCompleted {
    OpToken token{INVALID_OP_TOKEN};
    Error error{Error::None};
    int status{0};      // platform status code
    Bytes data{};       // read payload
};

struct LinkUp {};

struct LinkDown {
    int reason_code{0}; // platform disconnect code
};

// Outcome of an out-of-band pairing request
struct Authorization {
    bool granted{false};
};

struct MtuNegotiated {
    bool success{false};
    std::uint16_t mtu{0};
};

struct ServicesDiscovered {
    bool success{false};
    std::vector<Characteristic> characteristics{};
};

// Value change pushed by the remote device
struct Notification {
    Characteristic source{Characteristic::FromNum};
    Bytes data{};
};

struct AdapterRestarted {
    bool success{false};
};

using Event = std::variant<
    std::monostate,
    OpCompleted,
    LinkUp,
    LinkDown,
    Authorization,
    MtuNegotiated,
    ServicesDiscovered,
    Notification,
    AdapterRestarted
>;

} // namespace meshlink::core::link
