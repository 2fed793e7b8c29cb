#pragma once

#include <cstddef>

namespace meshlink::core::config::link {

// Link events buffered between the transport callback thread and poll()
inline constexpr static std::size_t EVENT_RING_CAPACITY = 256;

// Lifecycle signals buffered until drained by poll_signal()
inline constexpr static std::size_t SIGNAL_RING_CAPACITY = 32;

// Link events processed per poll() call
inline constexpr static std::size_t MAX_EVENTS_PER_POLL = 64;

} // namespace meshlink::core::config::link
