/*
===============================================================================
 notification::Dispatcher - Unit Tests
===============================================================================

Scope:
------
Topic routing of inbound messages to registered handlers.

Covered Requirements:
---------------------
N1. Messages reach the handler registered for their topic, in arrival order
N2. Registering a topic again replaces the previous handler
N3. remove() is idempotent
N4. Messages for unknown topics are dropped and counted
N5. A throwing handler does not affect later dispatch or its registration
N6. Handlers may unregister themselves while running

===============================================================================
*/

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "meshlink/core/notification/dispatcher.hpp"
#include "meshlink/core/telemetry/session.hpp"
#include "meshlink/log/logger.hpp"
#include "common/test_check.hpp"

using namespace meshlink::core;

struct TestMessage {
    Topic topic_id{0};
    std::string text{};

    [[nodiscard]] Topic topic() const noexcept { return topic_id; }
};

using DispatcherUnderTest = notification::Dispatcher<TestMessage>;


// -----------------------------------------------------------------------------
// N1. Routing
// -----------------------------------------------------------------------------
void test_routing() {
    std::cout << "[TEST] Group N1: messages reach their topic handler in order\n";
    telemetry::Dispatch telemetry;
    DispatcherUnderTest dispatcher{telemetry};

    std::vector<std::string> a;
    std::vector<std::string> b;
    TEST_CHECK(!dispatcher.add(1, [&](const TestMessage& m) { a.push_back(m.text); }));
    TEST_CHECK(!dispatcher.add(2, [&](const TestMessage& m) { b.push_back(m.text); }));
    TEST_CHECK(dispatcher.size() == 2);

    TEST_CHECK(dispatcher.dispatch({1, "x"}));
    TEST_CHECK(dispatcher.dispatch({2, "y"}));
    TEST_CHECK(dispatcher.dispatch({1, "z"}));

    TEST_CHECK((a == std::vector<std::string>{"x", "z"}));
    TEST_CHECK((b == std::vector<std::string>{"y"}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// N2. Replace
// -----------------------------------------------------------------------------
void test_replace() {
    std::cout << "[TEST] Group N2: registering a topic again replaces the handler\n";
    telemetry::Dispatch telemetry;
    DispatcherUnderTest dispatcher{telemetry};

    int first = 0;
    int second = 0;
    TEST_CHECK(!dispatcher.add(7, [&](const TestMessage&) { ++first; }));
    TEST_CHECK(dispatcher.add(7, [&](const TestMessage&) { ++second; }));
    TEST_CHECK(dispatcher.size() == 1);

    TEST_CHECK(dispatcher.dispatch({7, ""}));
    TEST_CHECK(first == 0);
    TEST_CHECK(second == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// N3. Remove
// -----------------------------------------------------------------------------
void test_remove_idempotent() {
    std::cout << "[TEST] Group N3: remove is idempotent\n";
    telemetry::Dispatch telemetry;
    DispatcherUnderTest dispatcher{telemetry};

    int calls = 0;
    (void)dispatcher.add(3, [&](const TestMessage&) { ++calls; });
    TEST_CHECK(dispatcher.contains(3));
    TEST_CHECK(dispatcher.remove(3));
    TEST_CHECK(!dispatcher.remove(3));
    TEST_CHECK(!dispatcher.remove(99));
    TEST_CHECK(!dispatcher.contains(3));

    TEST_CHECK(!dispatcher.dispatch({3, ""}));
    TEST_CHECK(calls == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// N4. Unhandled topics
// -----------------------------------------------------------------------------
void test_unhandled_dropped() {
    std::cout << "[TEST] Group N4: unknown topics are dropped\n";
    telemetry::Dispatch telemetry;
    DispatcherUnderTest dispatcher{telemetry};

    TEST_CHECK(!dispatcher.dispatch({42, "lost"}));
    TEST_CHECK(!dispatcher.dispatch({43, "lost"}));
    TEST_CHECK(dispatcher.unhandled_count() == 2);
    TEST_CHECK(dispatcher.handler_failure_count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// N5. Handler failure isolation
// -----------------------------------------------------------------------------
void test_throwing_handler_isolated() {
    std::cout << "[TEST] Group N5: a throwing handler does not break dispatch\n";
    telemetry::Dispatch telemetry;
    DispatcherUnderTest dispatcher{telemetry};

    int thrown = 0;
    int other = 0;
    (void)dispatcher.add(1, [&](const TestMessage& m) {
        ++thrown;
        if (m.text == "bad") {
            throw std::runtime_error("malformed payload");
        }
    });
    (void)dispatcher.add(2, [&](const TestMessage&) { ++other; });

    TEST_CHECK(dispatcher.dispatch({1, "bad"}));
    TEST_CHECK(dispatcher.dispatch({2, ""}));
    TEST_CHECK(dispatcher.dispatch({1, "good"}));

    TEST_CHECK(thrown == 2);
    TEST_CHECK(other == 1);
    TEST_CHECK(dispatcher.handler_failure_count() == 1);
    TEST_CHECK(dispatcher.contains(1));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// N6. Self-removal
// -----------------------------------------------------------------------------
void test_self_removal() {
    std::cout << "[TEST] Group N6: a handler may remove itself while running\n";
    telemetry::Dispatch telemetry;
    DispatcherUnderTest dispatcher{telemetry};

    int calls = 0;
    (void)dispatcher.add(5, [&](const TestMessage&) {
        ++calls;
        (void)dispatcher.remove(5);
    });

    TEST_CHECK(dispatcher.dispatch({5, ""}));
    TEST_CHECK(!dispatcher.dispatch({5, ""}));
    TEST_CHECK(calls == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    meshlink::log::Logger::instance().set_level(meshlink::log::Level::Trace);

    test_routing();
    test_replace();
    test_remove_idempotent();
    test_unhandled_dropped();
    test_throwing_handler_isolated();
    test_self_removal();

    std::cout << "\n[DISPATCHER TESTS PASSED]\n";
    return 0;
}
