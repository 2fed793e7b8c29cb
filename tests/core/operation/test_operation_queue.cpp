/*
===============================================================================
 operation::Queue - Unit Tests
===============================================================================

Scope:
------
Serialization, timeout, retry and flush semantics of the GATT operation
queue, driven through a scripted link and a manual clock.

Covered Requirements:
---------------------
Q1. At most one operation in flight; operations start in FIFO order
Q2. Timeout completes the operation with OperationTimeout and escalates;
    the late link completion is ignored
Q3. Read retries re-enter at the head of the queue, bounded by max attempts
Q4. ReliableWrite retries after a backoff while holding the in-flight slot
Q5. Write and SetNotify are never retried
Q6. TransportUnavailable fails immediately without retry or escalation
Q7. reset() fails in-flight, parked and pending operations, then the queue
    is usable again
Q8. Completion is idempotent (duplicate and unknown tokens ignored)
Q9. Sinks may enqueue re-entrantly

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "meshlink/core/operation/queue.hpp"
#include "meshlink/core/policy/operation.hpp"
#include "meshlink/core/telemetry/session.hpp"
#include "meshlink/core/timer/scheduler.hpp"
#include "meshlink/log/logger.hpp"
#include "common/manual_clock.hpp"
#include "common/mock_link.hpp"
#include "common/test_check.hpp"

using namespace std::chrono_literals;
using namespace meshlink::core;
using namespace meshlink::test;

using LinkUnderTest  = MockLink<true>;
using Kind           = LinkUnderTest::Kind;
using PolicyUnderTest = policy::operation::Retry<3, 4000, 200>;
using QueueUnderTest = operation::Queue<LinkUnderTest, ManualClock, PolicyUnderTest>;


// -----------------------------------------------------------------------------
// Fixture
// -----------------------------------------------------------------------------
struct Fixture {
    LinkUnderTest radio;
    timer::Scheduler<ManualClock> scheduler;
    telemetry::Operations stats;
    QueueUnderTest queue{radio, scheduler, stats};
    std::vector<Error> escalations;
    std::vector<std::string> log;

    Fixture() {
        ManualClock::reset();
        queue.set_escalation_handler([this](Error e) { escalations.push_back(e); });
    }

    operation::ResultSink sink(std::string name) {
        return [this, name](const operation::Result& r) {
            log.push_back(name + ":" + std::string{to_string(r.error)});
        };
    }

    void pump() {
        link::Event ev;
        while (radio.poll_event(ev)) {
            if (const auto* c = std::get_if<link::OpCompleted>(&ev)) {
                queue.on_completed(*c);
            }
        }
        scheduler.poll();
    }

    void advance(std::chrono::milliseconds d) {
        ManualClock::advance(d);
        pump();
    }

    void complete_last(Error error = Error::None, Bytes data = {}) {
        const auto* call = radio.last_primitive();
        TEST_CHECK(call != nullptr);
        radio.complete(call->token, error, std::move(data));
        pump();
    }
};

// -----------------------------------------------------------------------------
// Q1. Single in-flight, FIFO
// -----------------------------------------------------------------------------
void test_single_in_flight_fifo() {
    std::cout << "[TEST] Group Q1: one operation in flight, FIFO start order\n";
    Fixture f;

    f.queue.enqueue(operation::Write{link::Characteristic::ToRadio, {1}, f.sink("A")});
    f.queue.enqueue(operation::Read{link::Characteristic::FromRadio, f.sink("B")});
    f.queue.enqueue(operation::SetNotify{link::Characteristic::FromNum, true, f.sink("C")});

    TEST_CHECK(f.radio.calls().size() == 1);
    TEST_CHECK(f.radio.calls()[0].kind == Kind::Write);
    TEST_CHECK(f.queue.busy());
    TEST_CHECK(f.queue.depth() == 2);

    f.complete_last();
    TEST_CHECK(f.radio.calls().size() == 2);
    TEST_CHECK(f.radio.calls()[1].kind == Kind::Read);

    f.complete_last(Error::None, Bytes{7});
    TEST_CHECK(f.radio.calls().size() == 3);
    TEST_CHECK(f.radio.calls()[2].kind == Kind::SetNotify);
    TEST_CHECK(f.radio.calls()[2].enable);

    f.complete_last();
    TEST_CHECK(f.queue.idle());
    TEST_CHECK((f.log == std::vector<std::string>{"A:None", "B:None", "C:None"}));
    TEST_CHECK(f.escalations.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q2. Timeout
// -----------------------------------------------------------------------------
void test_timeout() {
    std::cout << "[TEST] Group Q2: timeout fails the operation and escalates\n";
    Fixture f;

    f.queue.enqueue(operation::Write{link::Characteristic::ToRadio, {1}, f.sink("W")});
    f.queue.enqueue(operation::SetNotify{link::Characteristic::FromNum, true, f.sink("N")});
    const OpToken first = f.radio.last_primitive()->token;

    f.advance(3999ms);
    TEST_CHECK(f.log.empty());

    f.advance(1ms);
    TEST_CHECK(f.log.size() == 1);
    TEST_CHECK(f.log[0] == "W:OperationTimeout");
    TEST_CHECK(f.escalations.size() == 1);
    TEST_CHECK(f.escalations[0] == Error::OperationTimeout);

    // Next operation started
    TEST_CHECK(f.radio.calls().back().kind == Kind::SetNotify);

    // Late completion of the timed-out write is ignored
    f.radio.complete(first);
    f.pump();
    TEST_CHECK(f.log.size() == 1);
    TEST_CHECK(f.queue.busy());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q3. Read retries at the head
// -----------------------------------------------------------------------------
void test_read_retry_at_head() {
    std::cout << "[TEST] Group Q3: read retries re-enter at the head\n";
    Fixture f;

    f.queue.enqueue(operation::Read{link::Characteristic::FromRadio, f.sink("R")});
    f.queue.enqueue(operation::Write{link::Characteristic::ToRadio, {2}, f.sink("W")});

    f.complete_last(Error::OperationFailed);
    TEST_CHECK(f.radio.calls().back().kind == Kind::Read);
    TEST_CHECK(f.radio.count(Kind::Read) == 2);
    TEST_CHECK(f.radio.count(Kind::Write) == 0);

    // Timeout counts as a failed attempt too
    f.advance(4000ms);
    TEST_CHECK(f.radio.count(Kind::Read) == 3);
    TEST_CHECK(f.radio.count(Kind::Write) == 0);
    TEST_CHECK(f.log.empty());

    f.complete_last(Error::OperationFailed);
    TEST_CHECK(f.radio.count(Kind::Read) == 3);
    TEST_CHECK(f.log.size() == 1);
    TEST_CHECK(f.log[0] == "R:OperationFailed");
    TEST_CHECK(f.escalations.size() == 1);
    TEST_CHECK(f.radio.calls().back().kind == Kind::Write);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q4. ReliableWrite backoff
// -----------------------------------------------------------------------------
void test_reliable_write_backoff() {
    std::cout << "[TEST] Group Q4: reliable write retries after backoff, slot held\n";
    Fixture f;

    f.queue.enqueue(operation::ReliableWrite{link::Characteristic::ToRadio, {9}, f.sink("RW")});
    f.queue.enqueue(operation::Write{link::Characteristic::ToRadio, {2}, f.sink("W")});

    f.complete_last(Error::OperationFailed);
    TEST_CHECK(f.radio.count(Kind::ReliableWrite) == 1);
    TEST_CHECK(f.radio.count(Kind::Write) == 0);
    TEST_CHECK(f.queue.busy());
    TEST_CHECK(f.queue.backing_off());

    f.advance(199ms);
    TEST_CHECK(f.radio.count(Kind::ReliableWrite) == 1);

    f.advance(1ms);
    TEST_CHECK(f.radio.count(Kind::ReliableWrite) == 2);
    TEST_CHECK(f.radio.last(Kind::ReliableWrite)->data == Bytes{9});
    TEST_CHECK(!f.queue.backing_off());

    f.complete_last();
    TEST_CHECK(f.log.size() == 1);
    TEST_CHECK(f.log[0] == "RW:None");
    TEST_CHECK(f.radio.count(Kind::Write) == 1);
    TEST_CHECK(f.escalations.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q5. Write / SetNotify not retried
// -----------------------------------------------------------------------------
void test_write_not_retried() {
    std::cout << "[TEST] Group Q5: write and set-notify are not retried\n";
    Fixture f;

    f.queue.enqueue(operation::Write{link::Characteristic::ToRadio, {1}, f.sink("W")});
    f.complete_last(Error::OperationFailed);
    TEST_CHECK(f.radio.count(Kind::Write) == 1);
    TEST_CHECK(f.log.back() == "W:OperationFailed");

    f.queue.enqueue(operation::SetNotify{link::Characteristic::FromNum, true, f.sink("N")});
    f.complete_last(Error::OperationFailed);
    TEST_CHECK(f.radio.count(Kind::SetNotify) == 1);
    TEST_CHECK(f.log.back() == "N:OperationFailed");

    TEST_CHECK(f.escalations.size() == 2);
    TEST_CHECK(f.queue.idle());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q6. TransportUnavailable
// -----------------------------------------------------------------------------
void test_transport_unavailable() {
    std::cout << "[TEST] Group Q6: transport unavailable fails immediately\n";
    Fixture f;
    f.radio.set_primitive_result(Error::TransportUnavailable);

    f.queue.enqueue(operation::Read{link::Characteristic::FromRadio, f.sink("R")});
    f.queue.enqueue(operation::ReliableWrite{link::Characteristic::ToRadio, {1}, f.sink("RW")});

    TEST_CHECK(f.radio.count(Kind::Read) == 1);
    TEST_CHECK(f.radio.count(Kind::ReliableWrite) == 1);
    TEST_CHECK((f.log == std::vector<std::string>{"R:TransportUnavailable", "RW:TransportUnavailable"}));
    TEST_CHECK(f.escalations.empty());
    TEST_CHECK(f.queue.idle());
    TEST_CHECK(f.scheduler.pending() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q7. reset()
// -----------------------------------------------------------------------------
void test_reset() {
    std::cout << "[TEST] Group Q7: reset fails everything and leaves the queue idle\n";
    Fixture f;

    f.queue.enqueue(operation::Read{link::Characteristic::FromRadio, f.sink("R")});
    f.queue.enqueue(operation::Write{link::Characteristic::ToRadio, {1}, f.sink("W")});
    f.queue.enqueue(operation::SetNotify{link::Characteristic::FromNum, true, f.sink("N")});
    const OpToken in_flight = f.radio.last_primitive()->token;

    f.queue.reset(Error::LinkReset);
    TEST_CHECK((f.log == std::vector<std::string>{"R:LinkReset", "W:LinkReset", "N:LinkReset"}));
    TEST_CHECK(f.queue.idle());
    TEST_CHECK(f.escalations.empty());
    TEST_CHECK(f.scheduler.pending() == 0);

    // Stale completion after reset is ignored
    f.radio.complete(in_flight);
    f.pump();
    TEST_CHECK(f.log.size() == 3);

    // Reset while a reliable write is parked in backoff
    f.queue.enqueue(operation::ReliableWrite{link::Characteristic::ToRadio, {5}, f.sink("RW")});
    f.complete_last(Error::OperationFailed);
    TEST_CHECK(f.queue.backing_off());
    f.queue.reset(Error::LinkReset);
    TEST_CHECK(f.log.back() == "RW:LinkReset");
    TEST_CHECK(!f.queue.backing_off());
    f.advance(1s);
    TEST_CHECK(f.radio.count(Kind::ReliableWrite) == 1);

    // Usable again
    f.queue.enqueue(operation::Write{link::Characteristic::ToRadio, {1}, f.sink("W2")});
    f.complete_last();
    TEST_CHECK(f.log.back() == "W2:None");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q8. Idempotent completion
// -----------------------------------------------------------------------------
void test_idempotent_completion() {
    std::cout << "[TEST] Group Q8: duplicate and unknown completions are ignored\n";
    Fixture f;

    f.queue.enqueue(operation::Write{link::Characteristic::ToRadio, {1}, f.sink("A")});
    f.queue.enqueue(operation::Write{link::Characteristic::ToRadio, {2}, f.sink("B")});
    const OpToken first = f.radio.last_primitive()->token;

    f.radio.complete(first + 1000);
    f.pump();
    TEST_CHECK(f.log.empty());

    f.radio.complete(first);
    f.radio.complete(first);
    f.pump();
    TEST_CHECK((f.log == std::vector<std::string>{"A:None"}));
    TEST_CHECK(f.queue.busy());
    TEST_CHECK(f.radio.count(Kind::Write) == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q9. Re-entrant enqueue from a sink
// -----------------------------------------------------------------------------
void test_reentrant_enqueue() {
    std::cout << "[TEST] Group Q9: sinks may enqueue follow-up operations\n";
    Fixture f;

    f.queue.enqueue(operation::Read{link::Characteristic::FromRadio, [&f](const operation::Result& r) {
        f.log.push_back("R:" + std::string{to_string(r.error)});
        f.queue.enqueue(operation::Read{link::Characteristic::FromRadio, f.sink("R2")});
    }});
    f.queue.enqueue(operation::Write{link::Characteristic::ToRadio, {1}, f.sink("W")});

    f.complete_last(Error::None, Bytes{1});
    // The write was queued first, so it runs before the follow-up read
    TEST_CHECK(f.radio.calls().back().kind == Kind::Write);
    f.complete_last();
    TEST_CHECK(f.radio.calls().back().kind == Kind::Read);
    f.complete_last();
    TEST_CHECK((f.log == std::vector<std::string>{"R:None", "W:None", "R2:None"}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    meshlink::log::Logger::instance().set_level(meshlink::log::Level::Trace);

    test_single_in_flight_fifo();
    test_timeout();
    test_read_retry_at_head();
    test_reliable_write_backoff();
    test_write_not_retried();
    test_transport_unavailable();
    test_reset();
    test_idempotent_completion();
    test_reentrant_enqueue();

    std::cout << "\n[OPERATION QUEUE TESTS PASSED]\n";
    return 0;
}
