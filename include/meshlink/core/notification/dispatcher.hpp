#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <unordered_map>
#include <utility>

#include "meshlink/core/types.hpp"
#include "meshlink/core/telemetry.hpp"
#include "meshlink/core/telemetry/session.hpp"
#include "meshlink/log/logger.hpp"


namespace meshlink::core::notification {

/*
================================================================================
 Dispatcher<MessageT>
================================================================================

Routes inbound messages to the handler registered for their topic.

  - One handler per topic; registering again replaces the previous handler.
  - remove() is idempotent.
  - Dispatch is synchronous, in arrival order, on the caller's context.
  - Messages for topics without a handler are dropped.
  - A throwing handler is logged and counted; dispatch of later messages and
    the handler's registration are unaffected.

MessageT must expose `Topic topic() const`.

================================================================================
*/

template<class MessageT>
class Dispatcher {
public:
    using Handler = std::function<void(const MessageT&)>;

    explicit Dispatcher(telemetry::Dispatch& telemetry)
        : telemetry_(telemetry)
    {}

    // Returns true if an existing handler was replaced
    bool add(Topic topic, Handler handler) {
        auto [it, inserted] = handlers_.insert_or_assign(topic, std::move(handler));
        if (!inserted) {
            ML_DEBUG("[DISPATCH] Replaced handler for topic " << topic);
        }
        return !inserted;
    }

    // Returns true if a handler was removed
    bool remove(Topic topic) noexcept {
        return handlers_.erase(topic) > 0;
    }

    [[nodiscard]]
    bool contains(Topic topic) const noexcept {
        return handlers_.find(topic) != handlers_.end();
    }

    // Returns true if a handler was invoked (even if it threw)
    bool dispatch(const MessageT& message) {
        const Topic topic = message.topic();
        auto it = handlers_.find(topic);
        if (it == handlers_.end()) {
            ML_TRACE("[DISPATCH] No handler for topic " << topic << ", dropping");
            ML_TL1(telemetry_.unhandled_total.inc());
            ++unhandled_;
            return false;
        }

        // Copy: the handler may unregister or replace itself
        Handler handler = it->second;
        ML_TL1(telemetry_.dispatched_total.inc());
        try {
            handler(message);
        }
        catch (const std::exception& e) {
            ML_ERROR("[DISPATCH] Handler for topic " << topic << " threw: " << e.what());
            ML_TL1(telemetry_.handler_failures_total.inc());
            ++handler_failures_;
        }
        return true;
    }

    [[nodiscard]] std::size_t size() const noexcept { return handlers_.size(); }
    [[nodiscard]] std::uint64_t unhandled_count() const noexcept { return unhandled_; }
    [[nodiscard]] std::uint64_t handler_failure_count() const noexcept { return handler_failures_; }

    void clear() noexcept { handlers_.clear(); }

private:
    telemetry::Dispatch& telemetry_;
    std::unordered_map<Topic, Handler> handlers_;
    std::uint64_t unhandled_{0};
    std::uint64_t handler_failures_{0};
};

} // namespace meshlink::core::notification
