#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "meshlink.hpp"
#include "common/cli/params.hpp"
#include "common/demo_codec.hpp"
#include "common/simulated_radio.hpp"

using namespace meshlink;
using namespace meshlink::core;
using namespace meshlink::examples;

constexpr NodeId SELF_NODE   = 0x0000A11C;
constexpr NodeId REMOTE_NODE = 0x0000B0B0;
constexpr Topic  TEXT_TOPIC  = 1;

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

// Polls until `done` holds or `timeout` elapses
template<class SessionT, class Predicate>
static bool poll_until(SessionT& session, Predicate done, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        if (session.poll() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        link::Signal sig;
        while (session.poll_signal(sig)) {
            std::cout << " -> SIGNAL " << to_string(sig) << std::endl;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    const auto params = cli::configure(argc, argv,
        "meshlink reconnect & replay example",
        "Sends tracked packets, drops the link with the given code and\n"
        "shows every packet being replayed once after the reconnect.");
    params.dump("Parameters", std::cout);
    log::Logger::instance().enable_color(true);

    // Runtime tables
    policy::DeviceQuirkTable quirks = policy::DeviceQuirkTable::defaults();
    policy::FailureCodeTable codes = policy::FailureCodeTable::defaults();
    std::string doc;
    if (!params.quirks_file.empty()) {
        if (!read_file(params.quirks_file, doc) || policy::load_device_quirks(doc, quirks) != Error::None) {
            std::cerr << "Cannot load device quirks from " << params.quirks_file << std::endl;
            return 1;
        }
    }
    if (!params.codes_file.empty()) {
        if (!read_file(params.codes_file, doc) || policy::load_failure_codes(doc, codes) != Error::None) {
            std::cerr << "Cannot load failure codes from " << params.codes_file << std::endl;
            return 1;
        }
    }

    SimulatedRadio radio{SELF_NODE};
    Session<SimulatedRadio, DemoCodec> session{radio, DemoCodec{}, std::move(quirks), std::move(codes)};

    session.subscribe_state([](const link::ConnectionState& s) {
        std::cout << " -> STATE " << to_string(s.kind);
        if (s.kind == link::ConnectionState::Kind::Failed) {
            std::cout << " (" << s.reason << ")";
        }
        std::cout << std::endl;
    });

    const bool registered = session.on_notification(TEXT_TOPIC, [](const protocol::Payload& p) {
        std::cout << " -> TEXT from " << p.from << " (" << p.data.size() << " bytes)" << std::endl;
    });
    if (!registered) {
        return 1;
    }

    if (session.connect(link::Target{params.address, params.device_name, false}) != Error::None) {
        std::cerr << "connect() rejected" << std::endl;
        return 1;
    }
    if (!poll_until(session, [&] { return session.lifecycle().is_ready(); }, std::chrono::seconds(5))) {
        std::cerr << "Radio never became ready" << std::endl;
        return 1;
    }
    std::cout << "[meshlink] Ready (class " << session.lifecycle().device_class().name << ")" << std::endl;

    // Submit everything, then drop the link once the first packet is on air
    std::vector<delivery::MessageStatus> final_status(params.packets, delivery::MessageStatus::Sending);
    std::size_t resolved = 0;
    for (std::size_t i = 0; i < params.packets; ++i) {
        const std::string text = "hello #" + std::to_string(i);
        const PacketId id = session.submit_packet(Bytes(text.begin(), text.end()), i, true,
            [&, i](const delivery::DeliveryResult& r) {
                std::cout << " -> PACKET " << r.packet_id << " (corr " << r.correlation_id << "): "
                          << to_string(r.status) << std::endl;
                if (delivery::is_terminal(r.status)) {
                    final_status[i] = r.status;
                    ++resolved;
                }
            },
            REMOTE_NODE);
        if (id == INVALID_PACKET_ID) {
            std::cerr << "Packet " << i << " rejected" << std::endl;
            return 1;
        }
    }

    (void)poll_until(session, [&] { return radio.packets_received() > 0; }, std::chrono::seconds(2));
    radio.drop(params.drop_code);

    const bool all_resolved = poll_until(session, [&] { return resolved == params.packets; }, std::chrono::seconds(30));

    std::size_t delivered = 0;
    for (auto s : final_status) {
        if (s == delivery::MessageStatus::Received || s == delivery::MessageStatus::Delivered) {
            ++delivered;
        }
    }

    std::cout << "\n========== SUMMARY ==========" << std::endl;
    std::cout << "Packets delivered   : " << delivered << "/" << params.packets << std::endl;
    std::cout << "Frames on air       : " << radio.packets_received() << std::endl;
    std::cout << "Cache invalidations : " << radio.cache_invalidations() << std::endl;
    std::cout << "Adapter restarts    : " << radio.adapter_restarts() << std::endl;
    std::cout << "Final state         : " << to_string(session.connection_state().kind) << std::endl;

    session.disconnect();

    if (all_resolved && delivered == params.packets) {
        std::cout << "[meshlink] Reconnect & replay example PASSED" << std::endl;
        return 0;
    }
    std::cout << "[meshlink] Reconnect & replay example FAILED" << std::endl;
    return 1;
}
