#pragma once

#include <cstdint>
#include <type_traits>


namespace meshlink::core::metrics {

// ---------------------------------------------------------------------------
// Counter - monotonically increasing value
// ---------------------------------------------------------------------------
//
// Session components run on one serialized context, so no atomics are used.
// ---------------------------------------------------------------------------
template<typename T = std::uint64_t>
struct Counter {
public:
    constexpr Counter() noexcept = default;

    Counter(const Counter&) = delete;
    Counter& operator=(const Counter&) = delete;

    inline constexpr T load() const noexcept { return value_; }
    inline constexpr void inc(T n = 1) noexcept { value_ += n; }
    inline constexpr void reset() noexcept { value_ = 0; }

private:
    T value_{0};
};

using Counter32 = Counter<std::uint32_t>;
using Counter64 = Counter<std::uint64_t>;
static_assert(std::is_standard_layout_v<Counter64>);

} // namespace meshlink::core::metrics
