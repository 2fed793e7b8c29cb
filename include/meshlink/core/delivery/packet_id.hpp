#pragma once

#include <cstdint>

#include "meshlink/core/types.hpp"


namespace meshlink::core::delivery {

// -----------------------------------------------------------------------------
// PacketIdSequence
// -----------------------------------------------------------------------------
//
// Cycles through 1..0xFFFFFFFF and wraps back to 1. Zero is never produced.
//
class PacketIdSequence {
public:
    static constexpr PacketId MAX_ID = 0xFFFFFFFFu;

    constexpr PacketIdSequence() noexcept = default;

    // Next id produced is (last % MAX_ID) + 1
    constexpr explicit PacketIdSequence(PacketId last) noexcept
        : last_(last)
    {}

    [[nodiscard]]
    constexpr PacketId next() noexcept {
        last_ = (last_ % MAX_ID) + 1;
        return last_;
    }

    // Skips ids for which in_use(id) holds
    template<class Predicate>
    [[nodiscard]]
    PacketId next_unused(Predicate&& in_use) noexcept(noexcept(in_use(PacketId{}))) {
        PacketId id = next();
        while (in_use(id)) {
            id = next();
        }
        return id;
    }

    [[nodiscard]]
    constexpr PacketId last() const noexcept { return last_; }

private:
    PacketId last_{0};
};

static_assert(PacketIdSequence{}.next() == 1);
static_assert(PacketIdSequence{PacketIdSequence::MAX_ID}.next() == 1);

} // namespace meshlink::core::delivery
