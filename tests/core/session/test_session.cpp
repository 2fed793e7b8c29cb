/*
===============================================================================
 Session - Integration Tests
===============================================================================

Scope:
------
End-to-end behavior of the composed session: delivery across reconnects,
inbound frame routing and connection teardown.

Covered Requirements:
---------------------
E1. Packets submitted before Ready are transmitted once the link is ready
E2. Acks arriving as inbound frames resolve tracked packets
E3. Tracked packets in flight survive a link drop and are replayed exactly
    once each, in submission order
E4. A FromNum notification drains FromRadio; payloads reach the application
    handler until the backlog is empty
E5. Reserved control topics cannot be claimed by the application
E6. disconnect() fails every pending packet with LinkReset
E7. A terminal connection failure fails pending packets with its error
E8. Undecodable frames are dropped without disturbing the link

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <vector>

#include "meshlink/log/logger.hpp"
#include "common/harness/session.hpp"

using namespace std::chrono_literals;
using delivery::DeliveryResult;
using delivery::MessageStatus;
using link::Stage;

constexpr NodeId REMOTE_NODE = 0x00C0FFEE;
constexpr Topic TEXT_TOPIC   = 1;
constexpr Topic TELEMETRY_TOPIC = 67;

struct Recorder {
    std::vector<DeliveryResult> results;

    delivery::DeliveryCallback callback() {
        return [this](const DeliveryResult& r) { results.push_back(r); };
    }

    [[nodiscard]]
    std::vector<MessageStatus> statuses(PacketId id) const {
        std::vector<MessageStatus> out;
        for (const auto& r : results) {
            if (r.packet_id == id) {
                out.push_back(r.status);
            }
        }
        return out;
    }
};

static std::vector<PacketId> ids_of(const std::vector<TestCodec::DecodedPacket>& packets) {
    std::vector<PacketId> ids;
    for (const auto& p : packets) {
        ids.push_back(p.id);
    }
    return ids;
}

static void inbound(SessionHarness& h, const Bytes& frame) {
    h.radio.emit(link::Notification{link::Characteristic::FromRadio, frame});
    h.poll();
}


// -----------------------------------------------------------------------------
// E1 + E2. Submitted early, acknowledged by the destination
// -----------------------------------------------------------------------------
void test_submit_before_ready() {
    std::cout << "[TEST] Group E1/E2: early submission is sent on Ready and acked\n";
    SessionHarness h;
    Recorder rec;

    const PacketId id = h.session.submit_packet(Bytes{'h', 'i'}, 501, true, rec.callback(), REMOTE_NODE);
    TEST_CHECK(id != INVALID_PACKET_ID);
    TEST_CHECK(h.packets_written().empty());

    h.bring_up();
    auto written = h.packets_written();
    TEST_CHECK(written.size() == 1);
    TEST_CHECK(written[0].id == id);
    TEST_CHECK(written[0].destination == REMOTE_NODE);
    TEST_CHECK(written[0].want_ack);
    TEST_CHECK(written[0].payload == (Bytes{'h', 'i'}));

    h.complete_packet_write(id);
    inbound(h, TestCodec::routing(id, REMOTE_NODE));

    TEST_CHECK((rec.statuses(id) == std::vector<MessageStatus>{MessageStatus::Sent, MessageStatus::Received}));
    TEST_CHECK(rec.results.back().correlation_id == 501);
    TEST_CHECK(h.session.delivery().pending_count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E3. Replay after link drop
// -----------------------------------------------------------------------------
void test_replay_after_reconnect() {
    std::cout << "[TEST] Group E3: tracked packets are replayed once after reconnect\n";
    SessionHarness h;
    Recorder rec;
    h.bring_up();

    const PacketId a = h.session.submit_packet(Bytes{1}, 1, true, rec.callback(), REMOTE_NODE);
    h.complete_packet_write(a);
    const PacketId b = h.session.submit_packet(Bytes{2}, 2, true, rec.callback(), REMOTE_NODE);
    h.complete_packet_write(b);
    TEST_CHECK(h.session.delivery().status_of(a) == MessageStatus::Sent);
    TEST_CHECK(h.session.delivery().status_of(b) == MessageStatus::Sent);

    h.radio.emit(link::LinkDown{8});
    h.poll();
    TEST_CHECK(h.stage() == Stage::WaitingReconnect);
    TEST_CHECK(h.session.delivery().pending_count() == 2);

    h.advance(1000ms);
    h.bring_up_again();

    // a is in flight again; b follows once a's write completes
    TEST_CHECK((ids_of(h.packets_written()) == std::vector<PacketId>{a, b, a}));
    h.complete_packet_write(a);
    TEST_CHECK((ids_of(h.packets_written()) == std::vector<PacketId>{a, b, a, b}));
    h.complete_packet_write(b);

    inbound(h, TestCodec::routing(a, REMOTE_NODE));
    inbound(h, TestCodec::routing(b, REMOTE_NODE));
    TEST_CHECK((rec.statuses(a) == std::vector<MessageStatus>{MessageStatus::Sent, MessageStatus::Received}));
    TEST_CHECK((rec.statuses(b) == std::vector<MessageStatus>{MessageStatus::Sent, MessageStatus::Received}));

    // Nothing more goes out
    h.advance(60000ms);
    TEST_CHECK(h.packets_written().size() == 4);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E4. FromNum drain and payload dispatch
// -----------------------------------------------------------------------------
void test_notification_drain() {
    std::cout << "[TEST] Group E4: FromNum drains FromRadio and dispatches payloads\n";
    SessionHarness h;
    h.bring_up();

    std::vector<Bytes> texts;
    const bool registered = h.session.on_notification(TEXT_TOPIC, [&](const protocol::Payload& p) {
        TEST_CHECK(p.from == REMOTE_NODE);
        texts.push_back(p.data);
    });
    TEST_CHECK(registered);

    const std::size_t reads = h.radio.count(Kind::Read);
    h.radio.emit(link::Notification{link::Characteristic::FromNum, {}});
    h.poll();
    TEST_CHECK(h.radio.count(Kind::Read) == reads + 1);

    h.complete(Kind::Read, Error::None, TestCodec::payload(TEXT_TOPIC, REMOTE_NODE, Bytes{'a'}));
    TEST_CHECK(h.radio.count(Kind::Read) == reads + 2);

    // No handler for this topic: dropped, draining continues
    h.complete(Kind::Read, Error::None, TestCodec::payload(TELEMETRY_TOPIC, REMOTE_NODE, Bytes{0x01}));
    TEST_CHECK(h.radio.count(Kind::Read) == reads + 3);
    TEST_CHECK(h.session.dispatcher().unhandled_count() == 1);

    h.complete(Kind::Read, Error::None, TestCodec::payload(TEXT_TOPIC, REMOTE_NODE, Bytes{'b'}));
    h.complete(Kind::Read, Error::None, {});
    TEST_CHECK(h.radio.count(Kind::Read) == reads + 4);
    TEST_CHECK((texts == std::vector<Bytes>{Bytes{'a'}, Bytes{'b'}}));

    // A notification carrying the frame itself is dispatched directly
    inbound(h, TestCodec::payload(TEXT_TOPIC, REMOTE_NODE, Bytes{'c'}));
    TEST_CHECK(texts.size() == 3);
    TEST_CHECK(h.radio.count(Kind::Read) == reads + 4);

    // Drain restarts on the next FromNum
    h.radio.emit(link::Notification{link::Characteristic::FromNum, {}});
    h.poll();
    TEST_CHECK(h.radio.count(Kind::Read) == reads + 5);

    TEST_CHECK(h.session.remove_notification(TEXT_TOPIC));
    TEST_CHECK(!h.session.remove_notification(TEXT_TOPIC));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E5. Reserved topics
// -----------------------------------------------------------------------------
void test_reserved_topics() {
    std::cout << "[TEST] Group E5: reserved control topics are refused\n";
    SessionHarness h;
    Recorder rec;
    h.bring_up();

    TEST_CHECK(!h.session.on_notification(protocol::topic::ROUTING, [](const protocol::Payload&) {}));
    TEST_CHECK(!h.session.on_notification(protocol::topic::QUEUE_STATUS, [](const protocol::Payload&) {}));
    TEST_CHECK(!h.session.remove_notification(protocol::topic::CONFIG_COMPLETE));

    // Control routing still works
    const PacketId id = h.session.submit_packet(Bytes{9}, 3, true, rec.callback(), REMOTE_NODE);
    inbound(h, TestCodec::queue_status(0, 5, id));
    TEST_CHECK(h.session.delivery().status_of(id) == MessageStatus::Sent);
    inbound(h, TestCodec::routing(id, 0x1234));
    TEST_CHECK((rec.statuses(id) == std::vector<MessageStatus>{MessageStatus::Sent, MessageStatus::Delivered}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E6. disconnect() flushes
// -----------------------------------------------------------------------------
void test_disconnect_flushes() {
    std::cout << "[TEST] Group E6: disconnect fails pending packets\n";
    SessionHarness h;
    Recorder rec;
    h.bring_up();

    const PacketId a = h.session.submit_packet(Bytes{1}, 1, true, rec.callback(), REMOTE_NODE);
    h.complete_packet_write(a);
    const PacketId b = h.session.submit_packet(Bytes{2}, 2, true, rec.callback(), REMOTE_NODE);
    const PacketId c = h.session.submit_packet(Bytes{3}, 3, false, rec.callback());

    h.session.disconnect();
    TEST_CHECK((rec.statuses(a) == std::vector<MessageStatus>{MessageStatus::Sent, MessageStatus::Failed}));
    TEST_CHECK((rec.statuses(b) == std::vector<MessageStatus>{MessageStatus::Failed}));
    TEST_CHECK((rec.statuses(c) == std::vector<MessageStatus>{MessageStatus::Failed}));
    for (const auto& r : rec.results) {
        if (r.status == MessageStatus::Failed) {
            TEST_CHECK(r.error == Error::LinkReset);
        }
    }
    TEST_CHECK(h.session.delivery().pending_count() == 0);
    TEST_CHECK(h.session.operations().idle());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E7. Terminal failure flushes
// -----------------------------------------------------------------------------
void test_terminal_failure_flushes() {
    std::cout << "[TEST] Group E7: terminal failure fails pending packets with its error\n";
    SessionHarness h;
    Recorder rec;

    const PacketId id = h.session.submit_packet(Bytes{1}, 1, true, rec.callback(), REMOTE_NODE);
    TEST_CHECK(h.session.connect(nrf52_target()) == Error::None);
    h.radio.emit(link::Authorization{false});
    h.poll();

    TEST_CHECK(h.stage() == Stage::Failed);
    TEST_CHECK((rec.statuses(id) == std::vector<MessageStatus>{MessageStatus::Failed}));
    TEST_CHECK(rec.results.back().error == Error::AuthorizationDeclined);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E8. Undecodable frames
// -----------------------------------------------------------------------------
void test_undecodable_frames() {
    std::cout << "[TEST] Group E8: undecodable frames are dropped\n";
    SessionHarness h;
    h.bring_up();

    inbound(h, Bytes{0xEE, 0x01});
    inbound(h, Bytes{0x11, 0x00});
    TEST_CHECK(h.stage() == Stage::Ready);
    TEST_CHECK(h.session.dispatcher().unhandled_count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    meshlink::log::Logger::instance().set_level(meshlink::log::Level::Trace);

    test_submit_before_ready();
    test_replay_after_reconnect();
    test_notification_drain();
    test_reserved_topics();
    test_disconnect_flushes();
    test_terminal_failure_flushes();
    test_undecodable_frames();

    std::cout << "\n[SESSION TESTS PASSED]\n";
    return 0;
}
