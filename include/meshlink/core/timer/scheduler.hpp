#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

#include "meshlink/core/clock.hpp"


namespace meshlink::core::timer {

using TimerId = std::uint64_t;

inline constexpr TimerId INVALID_TIMER_ID = 0;

// -----------------------------------------------------------------------------
// Scheduler
// -----------------------------------------------------------------------------
//
// Deadline-ordered one-shot timers, fired from poll() on the session's
// serialized context. Timers sharing a deadline fire in scheduling order.
// A task may schedule or cancel other timers while it runs.
//
template<ClockConcept Clock>
class Scheduler {
public:
    using Task = std::function<void()>;

    Scheduler() = default;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    [[nodiscard]]
    TimerId schedule_after(std::chrono::milliseconds delay, Task task) {
        const TimerId id = next_id_++;
        auto it = timers_.emplace(Clock::now() + delay, Entry{id, std::move(task)});
        index_.emplace(id, it);
        return id;
    }

    // Returns true if the timer was still pending
    bool cancel(TimerId id) noexcept {
        if (id == INVALID_TIMER_ID) {
            return false;
        }
        auto idx = index_.find(id);
        if (idx == index_.end()) {
            return false;
        }
        timers_.erase(idx->second);
        index_.erase(idx);
        return true;
    }

    [[nodiscard]]
    bool is_pending(TimerId id) const noexcept {
        return index_.find(id) != index_.end();
    }

    // Fire every timer whose deadline has been reached. Returns the number fired.
    std::size_t poll() {
        const TimePoint now = Clock::now();
        std::size_t fired = 0;
        while (!timers_.empty()) {
            auto it = timers_.begin();
            if (it->first > now) {
                break;
            }
            Task task = std::move(it->second.task);
            index_.erase(it->second.id);
            timers_.erase(it);
            ++fired;
            task();
        }
        return fired;
    }

    [[nodiscard]]
    std::optional<TimePoint> next_deadline() const noexcept {
        if (timers_.empty()) {
            return std::nullopt;
        }
        return timers_.begin()->first;
    }

    [[nodiscard]]
    std::size_t pending() const noexcept {
        return timers_.size();
    }

    void clear() noexcept {
        timers_.clear();
        index_.clear();
    }

private:
    struct Entry {
        TimerId id;
        Task task;
    };

    using TimerMap = std::multimap<TimePoint, Entry>;

    TimerMap timers_;
    std::unordered_map<TimerId, typename TimerMap::iterator> index_;
    TimerId next_id_{1};
};

} // namespace meshlink::core::timer
