// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license
// Session state machine tests over a scripted in-memory connection

#include <catch2/catch_test_macros.hpp>
#include "chain/ledger_handle.hpp"
#include "infra/fake_engine.hpp"
#include "infra/mock_connection.hpp"
#include "infra/test_helpers.hpp"
#include "metrics/metrics_registry.hpp"
#include "network/session.hpp"
#include "network/subscription_hub.hpp"
#include "rpc/rpc_dispatcher.hpp"

using namespace mintnode;
using namespace mintnode::network;
using namespace std::chrono_literals;
using mintnode::message::MessageType;
using mintnode::test::MockConnection;
using mintnode::test::RunUntil;

namespace {

struct SessionHarness {
    SessionHarness()
        : ledger(std::make_shared<chain::LedgerHandle>(io, std::make_unique<test::FakeEngine>())),
          hub(metrics),
          dispatcher(ledger, hub, metrics) {}

    struct Client {
        std::shared_ptr<MockConnection> conn;
        SessionPtr session;
        std::vector<CloseReason> closes;
    };

    std::unique_ptr<Client> open(uint64_t id, const Session::Config& config = Session::Config{}) {
        auto client = std::make_unique<Client>();
        client->conn = std::make_shared<MockConnection>(io);
        Client* raw = client.get();
        client->session = Session::create(io, client->conn, id, config, dispatcher, hub, metrics,
                                          [raw](uint64_t, CloseReason reason) {
                                              raw->closes.push_back(reason);
                                          });
        client->session->start();
        REQUIRE(RunUntil(io, [raw] { return raw->conn->started(); }));
        return client;
    }

    // Open and complete the handshake; the ack is the first written frame
    std::unique_ptr<Client> open_active(uint64_t id, const Session::Config& config = Session::Config{}) {
        auto client = open(id, config);
        client->conn->inject(test::HandshakeFrame(1));
        Client* raw = client.get();
        REQUIRE(RunUntil(io, [raw] { return raw->conn->write_count() >= 1; }));
        REQUIRE(client->session->state() == SessionState::ACTIVE);
        return client;
    }

    bool wait_closed(Client& c, std::chrono::milliseconds timeout = 3000ms) {
        return RunUntil(io, [&c] { return c.session->state() == SessionState::CLOSED; }, timeout);
    }

    bool wait_writes(Client& c, size_t n) {
        return RunUntil(io, [&c, n] { return c.conn->write_count() >= n; });
    }

    boost::asio::io_context io;
    metrics::MetricsRegistry metrics;
    chain::LedgerHandlePtr ledger;
    SubscriptionHub hub;
    rpc::RPCDispatcher dispatcher;
};

std::vector<uint8_t> unknown_type_frame(uint32_t id) {
    std::vector<uint8_t> payload{0, 1, static_cast<uint8_t>(id), static_cast<uint8_t>(id >> 8),
                                 static_cast<uint8_t>(id >> 16), static_cast<uint8_t>(id >> 24),
                                 0x7F};
    return encode_frame(payload);
}

std::vector<uint64_t> notification_heights(const MockConnection& conn) {
    std::vector<uint64_t> out;
    for (const auto& env : conn.decoded()) {
        if (env.msg->type() == MessageType::BLOCK_PRODUCED) {
            out.push_back(test::As<message::BlockProducedNotification>(env).block.height);
        }
    }
    return out;
}

} // namespace

TEST_CASE("Session handshake activates and acknowledges", "[network][session][handshake]") {
    SessionHarness h;
    auto c = h.open(7);
    CHECK(c->session->state() == SessionState::HANDSHAKING);
    CHECK(c->session->remote_address() == "127.0.0.1:40000");

    c->conn->inject(test::HandshakeFrame(3));
    REQUIRE(h.wait_writes(*c, 1));

    CHECK(c->session->state() == SessionState::ACTIVE);
    auto frames = c->conn->decoded();
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].msg->type() == MessageType::HANDSHAKE_ACK);
    CHECK(frames[0].kind == message::MessageKind::RESPONSE);
    REQUIRE(frames[0].id.has_value());
    CHECK(*frames[0].id == 3);
    CHECK(test::As<message::HandshakeResponse>(frames[0]).session_id == 7);

    c->session->close(CloseReason::SHUTDOWN);
    REQUIRE(h.wait_closed(*c));
}

TEST_CASE("Session handshake failures answer then close", "[network][session][handshake]") {
    SessionHarness h;
    std::vector<uint8_t> frame;

    SECTION("wrong network") {
        frame = test::HandshakeFrame(1, protocol::magic::MAINNET);
    }
    SECTION("protocol version too old") {
        frame = test::HandshakeFrame(1, protocol::magic::DEVNET, 0);
    }
    SECTION("request before handshake") {
        frame = test::RequestFrame(message::PingMessage(5), 1u);
    }
    SECTION("garbage before handshake") {
        frame = unknown_type_frame(1);
    }

    auto c = h.open(1);
    c->conn->set_stalled(true);
    c->conn->inject(frame);
    REQUIRE(h.wait_writes(*c, 1));

    // The error is on its way out; the session has not moved on yet
    test::RunFor(h.io, 20ms);
    CHECK(c->session->state() == SessionState::HANDSHAKING);
    CHECK(c->closes.empty());

    // Anything sent after the failure is ignored, even a valid handshake
    c->conn->inject(test::HandshakeFrame(2));
    test::RunFor(h.io, 20ms);
    CHECK(c->session->state() == SessionState::HANDSHAKING);
    CHECK(c->conn->write_count() == 1);

    c->conn->set_stalled(false);
    c->conn->release_writes();
    REQUIRE(h.wait_closed(*c));
    CHECK(c->session->close_reason() == CloseReason::HANDSHAKE_FAILED);
    auto frames = c->conn->decoded();
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].msg->type() == MessageType::ERROR);
    CHECK(test::As<message::ErrorResponse>(frames[0]).code == message::ErrorCode::HANDSHAKE_FAILED);
    CHECK(c->closes == std::vector<CloseReason>{CloseReason::HANDSHAKE_FAILED});
    CHECK(h.metrics.sessions_dropped_backpressure.value() == 0);
}

TEST_CASE("Session handshake timer bounds an unread handshake error", "[network][session][handshake]") {
    SessionHarness h;
    Session::Config config;
    config.handshake_timeout = 80ms;
    auto c = h.open(1, config);
    c->conn->set_stalled(true);
    c->conn->inject(test::HandshakeFrame(1, protocol::magic::MAINNET));

    REQUIRE(h.wait_closed(*c));
    CHECK(c->session->close_reason() == CloseReason::HANDSHAKE_FAILED);
    CHECK(c->conn->write_count() == 1);
}

TEST_CASE("Session closes when no handshake arrives in time", "[network][session][handshake]") {
    SessionHarness h;
    Session::Config config;
    config.handshake_timeout = 50ms;
    auto c = h.open(1, config);

    REQUIRE(h.wait_closed(*c));
    CHECK(c->session->close_reason() == CloseReason::HANDSHAKE_FAILED);
    CHECK(c->conn->write_count() == 0);
    CHECK_FALSE(c->conn->is_open());
}

TEST_CASE("Session answers pipelined requests in order with their ids", "[network][session]") {
    SessionHarness h;
    auto c = h.open_active(1);

    std::vector<uint8_t> chunk;
    for (uint32_t id = 10; id < 15; ++id) {
        auto f = test::RequestFrame(message::PingMessage(id * 100), id);
        chunk.insert(chunk.end(), f.begin(), f.end());
    }
    // Split mid-frame across two reads
    std::vector<uint8_t> first(chunk.begin(), chunk.begin() + 7);
    std::vector<uint8_t> rest(chunk.begin() + 7, chunk.end());
    c->conn->inject(first);
    c->conn->inject(rest);

    REQUIRE(h.wait_writes(*c, 6));
    auto frames = c->conn->decoded();
    REQUIRE(frames.size() == 6);
    for (uint32_t i = 0; i < 5; ++i) {
        const auto& env = frames[i + 1];
        REQUIRE(env.msg->type() == MessageType::PONG);
        CHECK(*env.id == 10 + i);
        CHECK(test::As<message::PongMessage>(env).nonce == (10 + i) * 100);
    }

    c->session->close(CloseReason::SHUTDOWN);
    REQUIRE(h.wait_closed(*c));
}

TEST_CASE("Session keeps request order across ledger and local requests", "[network][session]") {
    SessionHarness h;
    auto c = h.open_active(1);

    // Properties completes on the ledger strand; the ping behind it must wait
    std::vector<uint8_t> chunk = test::RequestFrame(message::GetPropertiesRequest{}, 20u);
    auto ping = test::RequestFrame(message::PingMessage(9), 21u);
    auto balance = test::RequestFrame(message::GetBalanceRequest("owner"), 22u);
    chunk.insert(chunk.end(), ping.begin(), ping.end());
    chunk.insert(chunk.end(), balance.begin(), balance.end());
    c->conn->inject(chunk);

    REQUIRE(h.wait_writes(*c, 4));
    auto frames = c->conn->decoded();
    REQUIRE(frames.size() == 4);
    CHECK(frames[1].msg->type() == MessageType::PROPERTIES);
    CHECK(*frames[1].id == 20);
    CHECK(frames[2].msg->type() == MessageType::PONG);
    CHECK(*frames[2].id == 21);
    CHECK(frames[3].msg->type() == MessageType::BALANCE);
    CHECK(*frames[3].id == 22);

    c->session->close(CloseReason::SHUTDOWN);
    REQUIRE(h.wait_closed(*c));
}

TEST_CASE("Session drops a peer that floods undecoded input", "[network][session][backpressure]") {
    SessionHarness h;
    Session::Config config;
    config.recv_flood_size = 256;
    auto c = h.open_active(1, config);

    // Header promises 1000 bytes; 300 arrive and sit in the decoder
    std::vector<uint8_t> partial{0xE8, 0x03, 0x00, 0x00};
    partial.resize(4 + 300, 0x00);
    c->conn->inject(partial);

    REQUIRE(h.wait_closed(*c));
    CHECK(c->session->close_reason() == CloseReason::RESOURCE_EXHAUSTED);
    CHECK(h.metrics.sessions_dropped_backpressure.value() == 1);
}

TEST_CASE("Session drops the connection on an oversized frame header", "[network][session][malformed]") {
    SessionHarness h;
    Session::Config config;
    config.max_frame_size = 1024;
    auto c = h.open_active(1, config);

    std::vector<uint8_t> header{0x01, 0x04, 0x00, 0x00}; // 1025
    c->conn->inject(header);

    REQUIRE(h.wait_closed(*c));
    CHECK(c->session->close_reason() == CloseReason::MALFORMED_FRAME);
    CHECK(h.metrics.frames_malformed.value() == 1);
    // Nothing beyond the handshake ack
    CHECK(c->conn->write_count() == 1);
}

TEST_CASE("Session unknown messages: lenient by default", "[network][session][unknown]") {
    SessionHarness h;
    auto c = h.open_active(1);

    c->conn->inject(unknown_type_frame(9));
    REQUIRE(h.wait_writes(*c, 2));
    auto frames = c->conn->decoded();
    REQUIRE(frames[1].msg->type() == MessageType::ERROR);
    CHECK(test::As<message::ErrorResponse>(frames[1]).code == message::ErrorCode::UNKNOWN_MESSAGE);
    REQUIRE(frames[1].id.has_value());
    CHECK(*frames[1].id == 9);

    // A response type sent by the client is unknown too
    c->conn->inject(test::RequestFrame(message::PongMessage(1), 10u));
    REQUIRE(h.wait_writes(*c, 3));

    // Still serving
    c->conn->inject(test::RequestFrame(message::PingMessage(77), 11u));
    REQUIRE(h.wait_writes(*c, 4));
    frames = c->conn->decoded();
    CHECK(frames[3].msg->type() == MessageType::PONG);
    CHECK(c->session->state() == SessionState::ACTIVE);

    c->session->close(CloseReason::SHUTDOWN);
    REQUIRE(h.wait_closed(*c));
}

TEST_CASE("Session unknown messages: strict mode closes after answering", "[network][session][unknown]") {
    SessionHarness h;
    Session::Config config;
    config.strict_mode = true;
    auto c = h.open_active(1, config);

    c->conn->inject(unknown_type_frame(4));
    REQUIRE(h.wait_closed(*c));
    CHECK(c->session->close_reason() == CloseReason::UNKNOWN_MESSAGE);

    auto frames = c->conn->decoded();
    REQUIRE(frames.size() == 2);
    CHECK(frames[1].msg->type() == MessageType::ERROR);
}

TEST_CASE("Session delivers block notifications to subscribers", "[network][session][subscription]") {
    SessionHarness h;
    auto c = h.open_active(1);

    c->conn->inject(test::RequestFrame(message::SubscribeRequest{}, 2u));
    REQUIRE(h.wait_writes(*c, 2));
    CHECK(h.hub.contains(1));

    for (uint64_t height = 1; height <= 3; ++height) {
        h.hub.broadcast(test::MakeBlock(height));
    }
    REQUIRE(h.wait_writes(*c, 5));
    CHECK(notification_heights(*c->conn) == std::vector<uint64_t>{1, 2, 3});

    auto frames = c->conn->decoded();
    CHECK(frames[2].kind == message::MessageKind::NOTIFICATION);
    CHECK_FALSE(frames[2].id.has_value());

    // Unsubscribed sessions get nothing more
    c->conn->inject(test::RequestFrame(message::UnsubscribeRequest{}, 3u));
    REQUIRE(h.wait_writes(*c, 6));
    CHECK_FALSE(h.hub.contains(1));
    h.hub.broadcast(test::MakeBlock(4));
    test::RunFor(h.io, 50ms);
    CHECK(c->conn->write_count() == 6);

    c->session->close(CloseReason::SHUTDOWN);
    REQUIRE(h.wait_closed(*c));
}

TEST_CASE("Subscribers share one encoded notification frame", "[network][session][subscription]") {
    SessionHarness h;
    auto a = h.open_active(1);
    auto b = h.open_active(2);
    a->conn->inject(test::RequestFrame(message::SubscribeRequest{}, 2u));
    b->conn->inject(test::RequestFrame(message::SubscribeRequest{}, 2u));
    REQUIRE(h.wait_writes(*a, 2));
    REQUIRE(h.wait_writes(*b, 2));

    h.hub.broadcast(test::MakeBlock(1));
    REQUIRE(h.wait_writes(*a, 3));
    REQUIRE(h.wait_writes(*b, 3));

    auto from_a = a->conn->written()[2];
    auto from_b = b->conn->written()[2];
    REQUIRE(from_a);
    CHECK(from_a.get() == from_b.get());
    CHECK(notification_heights(*a->conn) == std::vector<uint64_t>{1});

    a->session->close(CloseReason::SHUTDOWN);
    b->session->close(CloseReason::SHUTDOWN);
    REQUIRE(h.wait_closed(*a));
    REQUIRE(h.wait_closed(*b));
}

TEST_CASE("A stalled subscriber is dropped without delaying others", "[network][session][backpressure]") {
    SessionHarness h;
    Session::Config config;
    config.outbound_queue_capacity = 4;
    config.max_dropped_notifications = 3;
    config.drain_timeout = 1000ms;

    auto slow = h.open_active(1, config);
    auto fast = h.open_active(2, config);
    slow->conn->inject(test::RequestFrame(message::SubscribeRequest{}, 2u));
    fast->conn->inject(test::RequestFrame(message::SubscribeRequest{}, 2u));
    REQUIRE(h.wait_writes(*slow, 2));
    REQUIRE(h.wait_writes(*fast, 2));
    REQUIRE(h.hub.size() == 2);
    test::RunFor(h.io, 20ms);

    slow->conn->set_stalled(true);

    constexpr uint64_t kBlocks = 20;
    for (uint64_t height = 1; height <= kBlocks; ++height) {
        h.hub.broadcast(test::MakeBlock(height));
        size_t expected = 2 + height;
        REQUIRE(RunUntil(h.io, [&] { return fast->conn->write_count() >= expected; }));
    }

    // Drains first, then gives up on the stalled write with its own reason
    REQUIRE(RunUntil(h.io, [&] { return slow->session->state() != SessionState::ACTIVE; }));
    CHECK(slow->session->state() == SessionState::DRAINING);
    CHECK(h.metrics.sessions_dropped_backpressure.value() == 1);
    CHECK(h.metrics.notifications_dropped.value() >= 4);

    REQUIRE(h.wait_closed(*slow));
    CHECK(slow->session->close_reason() == CloseReason::RESOURCE_EXHAUSTED);
    CHECK(h.metrics.sessions_dropped_backpressure.value() == 1);
    CHECK_FALSE(h.hub.contains(1));

    // The fast subscriber saw every block, in order
    auto heights = notification_heights(*fast->conn);
    REQUIRE(heights.size() == kBlocks);
    for (size_t i = 0; i < heights.size(); ++i) {
        CHECK(heights[i] == i + 1);
    }
    CHECK(fast->session->state() == SessionState::ACTIVE);

    fast->session->close(CloseReason::SHUTDOWN);
    REQUIRE(h.wait_closed(*fast));
}

TEST_CASE("Session keeps only the newest notifications while a write is slow", "[network][session][backpressure]") {
    SessionHarness h;
    Session::Config config;
    config.outbound_queue_capacity = 2;
    config.max_dropped_notifications = 100;
    auto c = h.open_active(1, config);
    c->conn->inject(test::RequestFrame(message::SubscribeRequest{}, 2u));
    REQUIRE(h.wait_writes(*c, 2));
    test::RunFor(h.io, 20ms);

    c->conn->set_stalled(true);
    for (uint64_t height = 1; height <= 6; ++height) {
        h.hub.broadcast(test::MakeBlock(height));
    }
    test::RunFor(h.io, 50ms);
    // Block 1 is in flight; 2..4 were evicted; 5 and 6 wait
    CHECK(h.metrics.notifications_dropped.value() == 3);

    c->conn->set_stalled(false);
    c->conn->release_writes();
    REQUIRE(h.wait_writes(*c, 5));
    test::RunFor(h.io, 20ms);
    CHECK(notification_heights(*c->conn) == std::vector<uint64_t>{1, 5, 6});
    CHECK(c->session->state() == SessionState::ACTIVE);

    c->session->close(CloseReason::SHUTDOWN);
    REQUIRE(h.wait_closed(*c));
}

TEST_CASE("Session drains when responses alone fill the queue", "[network][session][backpressure]") {
    SessionHarness h;
    Session::Config config;
    config.outbound_queue_capacity = 2;
    auto c = h.open_active(1, config);
    c->conn->set_stalled(true);

    // Pong 1 is in flight, 2 and 3 fill the queue, 4 does not fit
    std::vector<uint8_t> chunk;
    for (uint32_t id = 1; id <= 4; ++id) {
        auto f = test::RequestFrame(message::PingMessage(id), id);
        chunk.insert(chunk.end(), f.begin(), f.end());
    }
    c->conn->inject(chunk);

    REQUIRE(RunUntil(h.io, [&] { return c->session->state() != SessionState::ACTIVE; }));
    CHECK(c->session->state() == SessionState::DRAINING);
    CHECK(h.metrics.sessions_dropped_backpressure.value() == 1);

    // Queued responses still reach the client before the close
    c->conn->set_stalled(false);
    c->conn->release_writes();
    REQUIRE(h.wait_closed(*c));
    CHECK(c->session->close_reason() == CloseReason::RESOURCE_EXHAUSTED);
    CHECK(c->closes == std::vector<CloseReason>{CloseReason::RESOURCE_EXHAUSTED});

    auto frames = c->conn->decoded();
    REQUIRE(frames.size() == 4);
    for (uint32_t i = 1; i <= 3; ++i) {
        REQUIRE(frames[i].msg->type() == MessageType::PONG);
        CHECK(*frames[i].id == i);
    }
}

TEST_CASE("Session lifecycle: peer close, write failure, idempotent close", "[network][session][lifecycle]") {
    SessionHarness h;

    SECTION("peer goes away") {
        auto c = h.open_active(1);
        c->conn->inject(test::RequestFrame(message::SubscribeRequest{}, 2u));
        REQUIRE(h.wait_writes(*c, 2));
        REQUIRE(h.hub.size() == 1);

        c->conn->peer_close();
        REQUIRE(h.wait_closed(*c));
        CHECK(c->session->close_reason() == CloseReason::PEER_CLOSED);
        CHECK(h.hub.size() == 0);
        CHECK(h.metrics.subscribers.value() == 0);
    }

    SECTION("write fails") {
        auto c = h.open_active(1);
        c->conn->set_fail_writes(true);
        c->conn->inject(test::RequestFrame(message::PingMessage(1), 2u));
        REQUIRE(h.wait_closed(*c));
        CHECK(c->session->close_reason() == CloseReason::TRANSPORT_ERROR);
    }

    SECTION("close twice reports once") {
        auto c = h.open_active(1);
        c->session->close(CloseReason::SHUTDOWN);
        c->session->close(CloseReason::TRANSPORT_ERROR);
        REQUIRE(h.wait_closed(*c));
        test::RunFor(h.io, 20ms);
        CHECK(c->session->close_reason() == CloseReason::SHUTDOWN);
        CHECK(c->closes == std::vector<CloseReason>{CloseReason::SHUTDOWN});
        CHECK(c->conn->close_calls() == 1);
    }
}

TEST_CASE("Session closes after a period of inactivity", "[network][session][timeout]") {
    SessionHarness h;
    Session::Config config;
    config.inactivity_timeout = 80ms;
    auto c = h.open_active(1, config);

    REQUIRE(h.wait_closed(*c));
    CHECK(c->session->close_reason() == CloseReason::INACTIVITY_TIMEOUT);
}

TEST_CASE("Session drain flushes queued output before closing", "[network][session][drain]") {
    SessionHarness h;

    SECTION("drains once the queue empties") {
        auto c = h.open_active(1);
        c->conn->set_stalled(true);
        c->conn->inject(test::RequestFrame(message::PingMessage(1), 2u));
        c->conn->inject(test::RequestFrame(message::PingMessage(2), 3u));
        REQUIRE(h.wait_writes(*c, 2));

        c->session->begin_drain();
        REQUIRE(RunUntil(h.io, [&] { return c->session->state() == SessionState::DRAINING; }));

        // Input is ignored while draining
        c->conn->inject(test::RequestFrame(message::PingMessage(3), 4u));

        c->conn->set_stalled(false);
        c->conn->release_writes();
        REQUIRE(h.wait_closed(*c));
        CHECK(c->session->close_reason() == CloseReason::SHUTDOWN);

        auto frames = c->conn->decoded();
        REQUIRE(frames.size() == 3);
        CHECK(*frames[2].id == 3);
    }

    SECTION("gives up after the drain timeout") {
        Session::Config config;
        config.drain_timeout = 50ms;
        auto c = h.open_active(1, config);
        c->conn->set_stalled(true);
        c->conn->inject(test::RequestFrame(message::PingMessage(1), 2u));
        REQUIRE(h.wait_writes(*c, 2));

        c->session->begin_drain();
        REQUIRE(h.wait_closed(*c));
        CHECK(c->session->close_reason() == CloseReason::DRAIN_TIMEOUT);
    }

    SECTION("an idle session closes immediately") {
        auto c = h.open_active(1);
        test::RunFor(h.io, 10ms);
        c->session->begin_drain();
        REQUIRE(h.wait_closed(*c));
        CHECK(c->session->close_reason() == CloseReason::SHUTDOWN);
    }
}

TEST_CASE("Session names for states and close reasons", "[network][session]") {
    CHECK(std::string(session_state_name(SessionState::DRAINING)) == "draining");
    CHECK(std::string(close_reason_name(CloseReason::RESOURCE_EXHAUSTED)) == "resource-exhausted");
    CHECK(std::string(close_reason_name(CloseReason::MALFORMED_FRAME)) == "malformed-frame");
}
