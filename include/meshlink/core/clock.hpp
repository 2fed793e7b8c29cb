#pragma once

#include <chrono>
#include <concepts>


namespace meshlink::core {

using TimePoint = std::chrono::steady_clock::time_point;

// A clock source for timers. std::chrono::steady_clock satisfies it; tests
// substitute a manually advanced clock.
template<class C>
concept ClockConcept = requires {
    { C::now() } -> std::same_as<TimePoint>;
};

static_assert(ClockConcept<std::chrono::steady_clock>);

} // namespace meshlink::core
