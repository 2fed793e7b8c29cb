#pragma once

#include "meshlink/core/config/link.hpp"
#include "meshlink/core/link/event.hpp"
#include "meshlink/core/lockfree/spsc_ring.hpp"


namespace meshlink::core::link {

// Transport implementations push platform callbacks into an EventRing from
// their own thread and hand them to the session through poll_event().
using EventRing = lockfree::SpscRing<Event, config::link::EVENT_RING_CAPACITY>;

} // namespace meshlink::core::link
