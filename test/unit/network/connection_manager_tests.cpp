// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for ConnectionManager (both roles) against a hand-driven transport

#include <catch2/catch_test_macros.hpp>

#include "common/mock_platform.hpp"
#include "infra/test_access.hpp"
#include "network/connection_manager.hpp"
#include "network/frame_codec.hpp"
#include "util/logging.hpp"

#include <chrono>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace proximity;
using namespace proximity::network;
using namespace proximity::test;
using namespace std::chrono_literals;

using CS = ConnectionState;

namespace {

std::vector<uint8_t> Bytes(size_t n, uint8_t seed = 0) {
    std::vector<uint8_t> v(n);
    std::iota(v.begin(), v.end(), seed);
    return v;
}

struct ConnectionFixture {
    asio::io_context io;
    std::shared_ptr<MockLinkTransport> transport = std::make_shared<MockLinkTransport>();
    PeerRegistry registry;
    EventRecorder recorder;
    ConnectionManager::Config config;
    std::unique_ptr<ConnectionManager> cm;
    LinkId next_inbound{1000};

    ConnectionFixture() {
        util::LogManager::SetLogLevel("off");
        config.local_peer_id = "B";
        config.connect_timeout = 10s;
        config.discovery_timeout = 10s;
        config.disconnect_timeout = 10s;
        config.reconnect = util::BackoffPolicy{20ms, 20ms, 0.0, 2};
        config.rng_seed = 1;
    }

    ConnectionManager& make() {
        cm = std::make_unique<ConnectionManager>(io, transport, registry, recorder.sink(), config);
        cm->Start();
        return *cm;
    }

    // Drive an outbound connection to Ready
    LinkId ready_client(const PeerId& peer, const std::vector<ServiceLayout>& services = ChatServices()) {
        cm->connect(peer);
        const LinkId link = transport->next_link - 1;
        transport->complete_connect(link);
        Drain(io);
        transport->complete_discovery(link, ErrorCode::Success, services);
        Drain(io);
        return link;
    }

    LinkId ready_server(const PeerId& peer) {
        const LinkId link = next_inbound++;
        transport->inbound(link, peer);
        Drain(io);
        return link;
    }

    // Acknowledge writes until none are outstanding
    void ack_all() {
        while (transport->ack_write()) {
            Drain(io);
        }
    }
};

}  // namespace

TEST_CASE("ConnectionManager - Construction", "[network][connection]") {
    asio::io_context io;
    PeerRegistry registry;

    SECTION("Requires a transport") {
        CHECK_THROWS_AS(ConnectionManager(io, nullptr, registry, [](EngineEvent) {}), std::invalid_argument);
    }

    SECTION("Rejects a frame limit the header cannot express") {
        ConnectionManager::Config config;
        config.max_frame_size = 70000;
        CHECK_THROWS_AS(
            ConnectionManager(io, std::make_shared<MockLinkTransport>(), registry, [](EngineEvent) {}, config),
            std::invalid_argument);
    }
}

TEST_CASE("ConnectionManager - Client connect reaches Ready", "[network][connection]") {
    ConnectionFixture f;
    auto& cm = f.make();

    const LinkId link = f.ready_client("C");

    CHECK(f.recorder.states("C") == std::vector<CS>{CS::Connecting, CS::Discovering, CS::Ready});
    CHECK(cm.get_state("C") == CS::Ready);

    auto handle = cm.get_handle("C");
    REQUIRE(handle.has_value());
    CHECK(handle->role == ConnectionRole::Client);
    CHECK(handle->link == link);

    auto record = f.registry.get("C");
    REQUIRE(record.has_value());
    CHECK(record->connection_state == CS::Ready);
    CHECK(record->connection_handle == handle);

    CHECK(cm.connected_peers() == std::vector<PeerId>{"C"});
    CHECK(cm.outbound_count() == 1);
    CHECK(cm.inbound_count() == 0);
    CHECK_FALSE(cm.remote_exposes_payment("C"));

    SECTION("Connect while connected reuses the link") {
        cm.connect("C");
        Drain(f.io);
        CHECK(f.transport->connect_calls == 1);
        CHECK(f.recorder.states("C").size() == 3);
    }
}

TEST_CASE("ConnectionManager - Remote payment service is detected", "[network][connection]") {
    ConnectionFixture f;
    auto& cm = f.make();
    f.ready_client("C", ChatServices(true));
    CHECK(cm.remote_exposes_payment("C"));

    cm.send("C", 1, {1, 2, 3}, Channel::Payment);
    REQUIRE(f.transport->writes.size() == 1);
    CHECK(f.transport->writes[0].characteristic == protocol::characteristics::PAYMENT);
}

TEST_CASE("ConnectionManager - Missing message characteristic fails without retry", "[network][connection]") {
    ConnectionFixture f;
    auto& cm = f.make();

    cm.connect("C");
    f.transport->complete_connect(1);
    Drain(f.io);
    f.transport->complete_discovery(1, ErrorCode::Success, {{0x180F, {0x2A19}}});
    Drain(f.io);
    RunFor(f.io, 60ms);

    CHECK(f.recorder.states("C") == std::vector<CS>{CS::Connecting, CS::Discovering, CS::Failed, CS::Disconnected});
    auto changes = f.recorder.all<ConnectionStateChanged>();
    CHECK(changes.back().reason == ErrorCode::ServiceNotFound);
    CHECK(f.transport->was_disconnected(1));
    CHECK(f.transport->connect_calls == 1);
}

TEST_CASE("ConnectionManager - Transient connect failures are retried with backoff", "[network][connection]") {
    ConnectionFixture f;
    auto& cm = f.make();

    cm.connect("C");
    f.transport->complete_connect(1, ErrorCode::LinkTimeout);
    Drain(f.io);
    CHECK(cm.get_state("C") == CS::Failed);

    RunFor(f.io, 60ms);
    CHECK(f.transport->connect_calls == 2);
    CHECK(cm.get_state("C") == CS::Connecting);

    f.transport->complete_connect(2, ErrorCode::LinkTimeout);
    Drain(f.io);
    RunFor(f.io, 60ms);
    CHECK(f.transport->connect_calls == 3);

    // Attempts exhausted after the second retry
    f.transport->complete_connect(3, ErrorCode::LinkTimeout);
    Drain(f.io);
    RunFor(f.io, 60ms);
    CHECK(f.transport->connect_calls == 3);
    CHECK(cm.get_state("C") == CS::Disconnected);

    auto changes = f.recorder.all<ConnectionStateChanged>();
    REQUIRE_FALSE(changes.empty());
    CHECK(changes.back().state == CS::Disconnected);
    CHECK(changes.back().reason == ErrorCode::LinkTimeout);

    SECTION("Explicit connect starts over") {
        cm.connect("C");
        CHECK(f.transport->connect_calls == 4);
        CHECK(ConnectionManagerTestAccess::ReconnectAttempts(cm, "C") == 0);
    }
}

TEST_CASE("ConnectionManager - Explicit connect skips the reconnect delay", "[network][connection]") {
    ConnectionFixture f;
    f.config.reconnect = util::BackoffPolicy{10s, 10s, 0.0, 3};
    auto& cm = f.make();

    cm.connect("C");
    f.transport->complete_connect(1, ErrorCode::LinkLost);
    Drain(f.io);
    REQUIRE(cm.get_state("C") == CS::Failed);

    cm.connect("C");
    CHECK(cm.get_state("C") == CS::Connecting);
    CHECK(f.transport->connect_calls == 2);
}

TEST_CASE("ConnectionManager - Timeouts", "[network][connection]") {
    ConnectionFixture f;
    f.config.reconnect.max_attempts = 0;

    SECTION("Connect timeout") {
        f.config.connect_timeout = 5ms;
        auto& cm = f.make();
        cm.connect("C");
        RunFor(f.io, 40ms);

        CHECK(f.recorder.states("C") == std::vector<CS>{CS::Connecting, CS::Failed, CS::Disconnected});
        CHECK(f.recorder.all<ConnectionStateChanged>()[1].reason == ErrorCode::LinkTimeout);
        CHECK(f.transport->was_disconnected(1));
    }

    SECTION("Service discovery timeout") {
        f.config.discovery_timeout = 5ms;
        auto& cm = f.make();
        cm.connect("C");
        f.transport->complete_connect(1);
        Drain(f.io);
        RunFor(f.io, 40ms);

        CHECK(f.recorder.states("C") ==
              std::vector<CS>{CS::Connecting, CS::Discovering, CS::Failed, CS::Disconnected});

        // A late discovery result is ignored
        f.transport->complete_discovery(1, ErrorCode::Success, ChatServices());
        Drain(f.io);
        CHECK(cm.get_state("C") == CS::Disconnected);
    }

    SECTION("Disconnect timeout forces cleanup") {
        f.config.disconnect_timeout = 5ms;
        auto& cm = f.make();
        f.ready_client("C");
        cm.disconnect("C");
        CHECK(cm.get_state("C") == CS::Disconnecting);

        RunFor(f.io, 40ms);
        CHECK(cm.get_state("C") == CS::Disconnected);
        CHECK(ConnectionManagerTestAccess::TrackedLinks(cm) == 0);
    }
}

TEST_CASE("ConnectionManager - Outbound limit", "[network][connection]") {
    ConnectionFixture f;
    f.config.max_outbound = 1;
    auto& cm = f.make();

    cm.connect("C");
    cm.connect("D");

    CHECK(f.transport->connect_calls == 1);
    CHECK(f.recorder.states("D") == std::vector<CS>{CS::Failed, CS::Disconnected});
    CHECK(f.recorder.all<ConnectionStateChanged>().back().reason == ErrorCode::ResourceExhausted);

    RunFor(f.io, 60ms);
    CHECK(f.transport->connect_calls == 1);
}

TEST_CASE("ConnectionManager - Transport refuses to start a link", "[network][connection]") {
    ConnectionFixture f;
    f.config.reconnect.max_attempts = 0;
    auto& cm = f.make();
    f.transport->refuse_connect = true;

    cm.connect("C");
    CHECK(f.recorder.states("C") == std::vector<CS>{CS::Connecting, CS::Failed, CS::Disconnected});
    CHECK(cm.get_state("C") == CS::Disconnected);
}

TEST_CASE("ConnectionManager - Inbound links", "[network][connection]") {
    ConnectionFixture f;

    SECTION("Accepted and immediately Ready") {
        auto& cm = f.make();
        const LinkId link = f.ready_server("C");

        CHECK(f.recorder.states("C") == std::vector<CS>{CS::Ready});
        auto handle = cm.get_handle("C");
        REQUIRE(handle.has_value());
        CHECK(handle->role == ConnectionRole::Server);
        CHECK(handle->link == link);
        CHECK(cm.inbound_count() == 1);
    }

    SECTION("Remote payment capability comes from its advertisement") {
        auto& cm = f.make();
        CapabilitySet caps;
        caps.payment_capable = true;
        f.registry.observe("C", caps, std::chrono::steady_clock::now());
        f.ready_server("C");
        CHECK(cm.remote_exposes_payment("C"));
    }

    SECTION("Limit reached rejects further links") {
        f.config.max_inbound = 1;
        auto& cm = f.make();
        f.ready_server("C");
        const LinkId rejected = f.ready_server("D");

        CHECK(f.transport->was_disconnected(rejected));
        CHECK(cm.get_state("D") == CS::Disconnected);
        CHECK(f.recorder.states("D").empty());
        CHECK(cm.inbound_count() == 1);
    }

    SECTION("Second link from a Ready peer is rejected") {
        auto& cm = f.make();
        const LinkId first = f.ready_server("C");
        const LinkId second = f.ready_server("C");

        CHECK(f.transport->was_disconnected(second));
        CHECK_FALSE(f.transport->was_disconnected(first));
        CHECK(cm.get_handle("C")->link == first);
    }

    SECTION("Link loss does not trigger a reconnect") {
        auto& cm = f.make();
        const LinkId link = f.ready_server("C");
        f.transport->lose(link);
        Drain(f.io);
        RunFor(f.io, 60ms);

        CHECK(cm.get_state("C") == CS::Disconnected);
        CHECK(f.transport->connect_calls == 0);
    }
}

TEST_CASE("ConnectionManager - Simultaneous connect tie-break", "[network][connection]") {
    ConnectionFixture f;

    SECTION("Lower local id keeps its outbound attempt") {
        auto& cm = f.make();  // local "B"
        cm.connect("C");
        const LinkId outbound = 1;

        f.transport->inbound(500, "C");
        Drain(f.io);

        CHECK(f.transport->was_disconnected(500));
        CHECK(cm.get_state("C") == CS::Connecting);
        CHECK(ConnectionManagerTestAccess::CurrentLink(cm, "C") == outbound);

        f.transport->complete_connect(outbound);
        Drain(f.io);
        f.transport->complete_discovery(outbound, ErrorCode::Success, ChatServices());
        Drain(f.io);
        CHECK(cm.get_handle("C")->role == ConnectionRole::Client);
    }

    SECTION("Higher local id abandons its attempt and accepts") {
        auto& cm = f.make();
        cm.connect("A");
        const LinkId outbound = 1;

        f.transport->inbound(500, "A");
        Drain(f.io);

        CHECK(f.transport->was_disconnected(outbound));
        auto handle = cm.get_handle("A");
        REQUIRE(handle.has_value());
        CHECK(handle->role == ConnectionRole::Server);
        CHECK(handle->link == 500);

        // The abandoned attempt completing later changes nothing
        f.transport->complete_connect(outbound);
        f.transport->lose(outbound);
        Drain(f.io);
        CHECK(cm.get_state("A") == CS::Ready);
        CHECK(cm.get_handle("A")->link == 500);
    }

    SECTION("Without a local id the inbound link wins") {
        f.config.local_peer_id.clear();
        auto& cm = f.make();
        cm.connect("C");
        f.transport->complete_connect(1);
        Drain(f.io);
        REQUIRE(cm.get_state("C") == CS::Discovering);

        f.transport->inbound(500, "C");
        Drain(f.io);
        CHECK(cm.get_handle("C")->link == 500);
        CHECK(f.transport->was_disconnected(1));
    }
}

TEST_CASE("ConnectionManager - Sending", "[network][connection]") {
    ConnectionFixture f;
    auto& cm = f.make();
    f.ready_client("C");

    SECTION("Frames are split into MTU-sized writes, one in flight") {
        const auto payload = Bytes(50);
        cm.send("C", 7, payload);

        REQUIRE(f.transport->writes.size() == 1);
        CHECK(f.transport->writes[0].chunk.size() == 20);
        CHECK(f.transport->writes[0].characteristic == protocol::characteristics::MESSAGE);
        CHECK(ConnectionManagerTestAccess::WriteInFlight(cm, "C"));

        while (f.transport->ack_write()) {
            CHECK(f.transport->outstanding_writes() == 0);
            Drain(f.io);
            CHECK(f.transport->outstanding_writes() <= 1);
        }

        CHECK(f.transport->writes.size() == 3);  // 52 bytes at MTU 20
        CHECK(f.transport->written_bytes() == FrameCodec::encode(payload));
        auto sent = f.recorder.all<FrameSent>();
        REQUIRE(sent.size() == 1);
        CHECK(sent[0].send_id == 7);
        CHECK(sent[0].peer == "C");
    }

    SECTION("Per-peer FIFO") {
        const auto a = Bytes(30, 1);
        const auto b = Bytes(5, 2);
        const auto c = Bytes(45, 3);
        cm.send("C", 1, a);
        cm.send("C", 2, b);
        cm.send("C", 3, c);
        CHECK(ConnectionManagerTestAccess::QueuedFrames(cm, "C") == 3);

        f.ack_all();

        std::vector<uint8_t> expected;
        for (const auto& p : {a, b, c}) {
            auto frame = FrameCodec::encode(p);
            expected.insert(expected.end(), frame.begin(), frame.end());
        }
        CHECK(f.transport->written_bytes() == expected);

        auto sent = f.recorder.all<FrameSent>();
        REQUIRE(sent.size() == 3);
        CHECK(sent[0].send_id == 1);
        CHECK(sent[1].send_id == 2);
        CHECK(sent[2].send_id == 3);
    }

    SECTION("Oversize payload is refused before anything is written") {
        cm.send("C", 9, Bytes(protocol::DEFAULT_MAX_FRAME_SIZE + 1));
        CHECK(f.transport->writes.empty());
        auto failed = f.recorder.all<SendFailed>();
        REQUIRE(failed.size() == 1);
        CHECK(failed[0].reason == ErrorCode::FrameTooLarge);
        CHECK(failed[0].send_id == 9);
    }

    SECTION("Unknown peer is NotConnected; oversize wins over state") {
        cm.send("Z", 1, {1});
        cm.send("Z", 2, Bytes(protocol::DEFAULT_MAX_FRAME_SIZE + 1));
        auto failed = f.recorder.all<SendFailed>();
        REQUIRE(failed.size() == 2);
        CHECK(failed[0].reason == ErrorCode::NotConnected);
        CHECK(failed[1].reason == ErrorCode::FrameTooLarge);
    }

    SECTION("Payment channel to a peer without the payment service") {
        cm.send("C", 4, {1}, Channel::Payment);
        auto failed = f.recorder.all<SendFailed>();
        REQUIRE(failed.size() == 1);
        CHECK(failed[0].reason == ErrorCode::ServiceNotFound);
    }

    SECTION("Write failure drops the link") {
        cm.send("C", 1, Bytes(50));
        cm.send("C", 2, Bytes(5));
        f.transport->ack_write(ErrorCode::LinkLost);
        Drain(f.io);

        auto failed = f.recorder.all<SendFailed>();
        REQUIRE(failed.size() == 2);
        CHECK(failed[0].reason == ErrorCode::LinkLost);
        CHECK(failed[1].reason == ErrorCode::LinkLost);
        CHECK(cm.get_state("C") == CS::Failed);
        CHECK(f.transport->was_disconnected(1));
        CHECK(cm.live_outbound_queues() == 0);
    }
}

TEST_CASE("ConnectionManager - Bounded outbound queue", "[network][connection]") {
    ConnectionFixture f;
    f.config.max_queued_frames = 2;
    auto& cm = f.make();
    f.ready_client("C");

    cm.send("C", 1, {1});
    cm.send("C", 2, {2});
    cm.send("C", 3, {3});

    auto failed = f.recorder.all<SendFailed>();
    REQUIRE(failed.size() == 1);
    CHECK(failed[0].send_id == 3);
    CHECK(failed[0].reason == ErrorCode::ResourceExhausted);

    f.ack_all();
    CHECK(f.recorder.count<FrameSent>() == 2);
}

TEST_CASE("ConnectionManager - Fallback MTU when the transport reports none", "[network][connection]") {
    ConnectionFixture f;
    f.config.fallback_mtu = 8;
    f.transport->link_mtu = 0;
    auto& cm = f.make();
    f.ready_client("C");

    cm.send("C", 1, Bytes(30));
    f.ack_all();
    for (const auto& w : f.transport->writes) {
        CHECK(w.chunk.size() <= 8);
    }
    CHECK(f.recorder.count<FrameSent>() == 1);
}

TEST_CASE("ConnectionManager - Receiving", "[network][connection]") {
    ConnectionFixture f;
    f.config.max_frame_size = 100;
    auto& cm = f.make();
    const LinkId link = f.ready_server("C");

    SECTION("Chunks reassemble into one frame") {
        const auto payload = Bytes(60);
        for (const auto& chunk : FrameCodec::fragment(FrameCodec::encode(payload), 20)) {
            f.transport->data(link, protocol::characteristics::MESSAGE, chunk);
        }
        Drain(f.io);

        auto received = f.recorder.all<FrameReceived>();
        REQUIRE(received.size() == 1);
        CHECK(received[0].payload == payload);
        CHECK(received[0].channel == Channel::Message);
        CHECK(received[0].peer == "C");
    }

    SECTION("Payment characteristic maps to the payment channel") {
        f.transport->data(link, protocol::characteristics::PAYMENT, FrameCodec::encode({5, 6}));
        Drain(f.io);
        auto received = f.recorder.all<FrameReceived>();
        REQUIRE(received.size() == 1);
        CHECK(received[0].channel == Channel::Payment);
    }

    SECTION("Channels reassemble independently") {
        auto msg = FrameCodec::encode(Bytes(10, 1));
        auto pay = FrameCodec::encode(Bytes(10, 2));
        f.transport->data(link, protocol::characteristics::MESSAGE, {msg.begin(), msg.begin() + 5});
        f.transport->data(link, protocol::characteristics::PAYMENT, pay);
        f.transport->data(link, protocol::characteristics::MESSAGE, {msg.begin() + 5, msg.end()});
        Drain(f.io);

        auto received = f.recorder.all<FrameReceived>();
        REQUIRE(received.size() == 2);
        CHECK(received[0].channel == Channel::Payment);
        CHECK(received[1].payload == Bytes(10, 1));
        CHECK(cm.live_reassembly_buffers() == 2);
    }

    SECTION("Oversize inbound frame is rejected, the stream continues") {
        auto big = FrameCodec::encode(Bytes(150));
        auto small = FrameCodec::encode({42});
        for (const auto& chunk : FrameCodec::fragment(big, 20)) {
            f.transport->data(link, protocol::characteristics::MESSAGE, chunk);
        }
        f.transport->data(link, protocol::characteristics::MESSAGE, small);
        Drain(f.io);

        auto rejected = f.recorder.all<FrameRejected>();
        REQUIRE(rejected.size() == 1);
        CHECK(rejected[0].reason == ErrorCode::FrameTooLarge);
        auto received = f.recorder.all<FrameReceived>();
        REQUIRE(received.size() == 1);
        CHECK(received[0].payload == std::vector<uint8_t>{42});
        CHECK(cm.get_state("C") == CS::Ready);
    }

    SECTION("Unknown characteristic and untracked links are ignored") {
        f.transport->data(link, 0x9999, FrameCodec::encode({1}));
        f.transport->data(77, protocol::characteristics::MESSAGE, FrameCodec::encode({1}));
        Drain(f.io);
        CHECK(f.recorder.count<FrameReceived>() == 0);
        CHECK(cm.live_reassembly_buffers() == 0);
    }
}

TEST_CASE("ConnectionManager - Data during service discovery is accepted", "[network][connection]") {
    ConnectionFixture f;
    auto& cm = f.make();
    cm.connect("C");
    f.transport->complete_connect(1);
    Drain(f.io);
    REQUIRE(cm.get_state("C") == CS::Discovering);

    f.transport->data(1, protocol::characteristics::MESSAGE, FrameCodec::encode({1, 2}));
    Drain(f.io);
    CHECK(f.recorder.count<FrameReceived>() == 1);
}

TEST_CASE("ConnectionManager - Disconnect releases everything", "[network][connection]") {
    ConnectionFixture f;

    SECTION("During service discovery") {
        auto& cm = f.make();
        cm.connect("C");
        f.transport->complete_connect(1);
        Drain(f.io);

        // Partial inbound frame allocates a reassembly buffer
        auto frame = FrameCodec::encode(Bytes(40));
        f.transport->data(1, protocol::characteristics::MESSAGE, {frame.begin(), frame.begin() + 10});
        Drain(f.io);
        REQUIRE(cm.live_reassembly_buffers() == 1);

        cm.disconnect("C");
        CHECK(cm.get_state("C") == CS::Disconnecting);
        CHECK(cm.live_reassembly_buffers() == 0);
        CHECK(cm.live_outbound_queues() == 0);
        CHECK(f.transport->was_disconnected(1));

        f.transport->lose(1, ErrorCode::Success);
        Drain(f.io);
        RunFor(f.io, 60ms);

        CHECK(cm.get_state("C") == CS::Disconnected);
        CHECK(f.transport->connect_calls == 1);
        CHECK(ConnectionManagerTestAccess::TrackedLinks(cm) == 0);
        CHECK(cm.live_reassembly_buffers() == 0);
        CHECK(cm.live_outbound_queues() == 0);
    }

    SECTION("While connecting, before the link completes") {
        auto& cm = f.make();
        cm.connect("C");
        cm.disconnect("C");
        CHECK(cm.get_state("C") == CS::Disconnecting);

        // The connect completion arrives after the disconnect
        f.transport->complete_connect(1);
        f.transport->lose(1, ErrorCode::Success);
        Drain(f.io);
        CHECK(cm.get_state("C") == CS::Disconnected);
        CHECK(f.transport->pending_discoveries.empty());
        CHECK(cm.live_reassembly_buffers() == 0);
        CHECK(cm.live_outbound_queues() == 0);
    }

    SECTION("Queued sends fail with Cancelled") {
        auto& cm = f.make();
        f.ready_client("C");
        cm.send("C", 1, Bytes(50));
        cm.send("C", 2, Bytes(50));
        cm.send("C", 3, Bytes(50));

        cm.disconnect("C");
        auto failed = f.recorder.all<SendFailed>();
        REQUIRE(failed.size() == 3);
        for (const auto& sf : failed) {
            CHECK(sf.reason == ErrorCode::Cancelled);
        }
        CHECK(cm.live_outbound_queues() == 0);

        // Late ack of the in-flight write is ignored
        f.transport->ack_write();
        Drain(f.io);
        CHECK(f.recorder.count<FrameSent>() == 0);
    }

    SECTION("Failed peer: disconnect cancels the pending reconnect") {
        f.config.reconnect = util::BackoffPolicy{5ms, 5ms, 0.0, 3};
        auto& cm = f.make();
        cm.connect("C");
        f.transport->complete_connect(1, ErrorCode::LinkLost);
        Drain(f.io);
        REQUIRE(cm.get_state("C") == CS::Failed);

        cm.disconnect("C");
        RunFor(f.io, 30ms);
        CHECK(cm.get_state("C") == CS::Disconnected);
        CHECK(f.transport->connect_calls == 1);
    }
}

TEST_CASE("ConnectionManager - Remote loss with queued sends", "[network][connection]") {
    ConnectionFixture f;

    SECTION("Without retries") {
        f.config.reconnect.max_attempts = 0;
        auto& cm = f.make();
        const LinkId link = f.ready_client("C");
        cm.send("C", 1, Bytes(200));
        cm.send("C", 2, Bytes(200));
        cm.send("C", 3, Bytes(200));

        f.transport->lose(link);
        Drain(f.io);

        auto failed = f.recorder.all<SendFailed>();
        REQUIRE(failed.size() == 3);
        for (const auto& sf : failed) {
            CHECK(sf.reason == ErrorCode::LinkLost);
        }
        auto states = f.recorder.states("C");
        REQUIRE(states.size() >= 2);
        CHECK(states[states.size() - 2] == CS::Failed);
        CHECK(states.back() == CS::Disconnected);
        CHECK(cm.live_outbound_queues() == 0);
        CHECK(cm.live_reassembly_buffers() == 0);
    }

    SECTION("Client link is re-established") {
        auto& cm = f.make();
        const LinkId link = f.ready_client("C");
        f.transport->lose(link);
        Drain(f.io);
        CHECK(cm.get_state("C") == CS::Failed);

        RunFor(f.io, 60ms);
        CHECK(f.transport->connect_calls == 2);
        CHECK(cm.get_state("C") == CS::Connecting);

        // Loss of the old link is stale now
        f.transport->lose(link);
        Drain(f.io);
        CHECK(cm.get_state("C") == CS::Connecting);
    }
}

TEST_CASE("ConnectionManager - Shutdown", "[network][connection]") {
    ConnectionFixture f;
    auto& cm = f.make();
    f.ready_client("C");
    f.ready_server("D");
    cm.connect("E");
    cm.send("C", 1, Bytes(10));

    cm.Shutdown();

    CHECK(cm.get_state("C") == CS::Disconnected);
    CHECK(cm.get_state("D") == CS::Disconnected);
    CHECK(cm.get_state("E") == CS::Disconnected);
    CHECK(cm.connected_peers().empty());
    CHECK(cm.live_outbound_queues() == 0);
    CHECK(ConnectionManagerTestAccess::TrackedLinks(cm) == 0);
    CHECK(f.recorder.all<SendFailed>().size() == 1);

    SECTION("Operations after shutdown are ignored") {
        const int calls = f.transport->connect_calls;
        cm.connect("F");
        CHECK(f.transport->connect_calls == calls);

        f.transport->inbound(900, "G");
        Drain(f.io);
        CHECK(f.transport->was_disconnected(900));
        CHECK(cm.get_state("G") == CS::Disconnected);
    }

    SECTION("Idle peers are pruned") {
        CHECK(cm.prune_idle() == 3);
        CHECK(cm.tracked_peer_count() == 0);
    }
}
