// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/ledger_handle.hpp"
#include "infra/fake_engine.hpp"
#include "infra/mock_connection.hpp"
#include "infra/test_helpers.hpp"
#include "metrics/metrics_registry.hpp"
#include "network/connection_manager.hpp"
#include "network/subscription_hub.hpp"
#include "rpc/rpc_dispatcher.hpp"

using namespace mintnode;
using namespace mintnode::network;
using namespace std::chrono_literals;
using mintnode::test::MockConnection;
using mintnode::test::MockTransport;
using mintnode::test::RunUntil;

namespace {
struct ManagerHarness {
    explicit ManagerHarness(size_t max_connections = 8)
        : ledger(std::make_shared<chain::LedgerHandle>(io, std::make_unique<test::FakeEngine>())),
          hub(metrics),
          dispatcher(ledger, hub, metrics),
          transport(std::make_shared<MockTransport>()) {
        ConnectionManager::Config config;
        config.listen_port = 0;
        config.max_connections = max_connections;
        manager = std::make_unique<ConnectionManager>(io, transport, dispatcher, hub, metrics, config);
    }

    std::shared_ptr<MockConnection> connect() {
        auto conn = std::make_shared<MockConnection>(io);
        transport->accept(conn);
        return conn;
    }

    // Connect and complete the handshake
    std::shared_ptr<MockConnection> connect_active() {
        auto conn = connect();
        REQUIRE(RunUntil(io, [&] { return conn->started(); }));
        conn->inject(test::HandshakeFrame(1));
        REQUIRE(RunUntil(io, [&] { return conn->write_count() >= 1; }));
        return conn;
    }

    boost::asio::io_context io;
    metrics::MetricsRegistry metrics;
    chain::LedgerHandlePtr ledger;
    SubscriptionHub hub;
    rpc::RPCDispatcher dispatcher;
    std::shared_ptr<MockTransport> transport;
    std::unique_ptr<ConnectionManager> manager;
};
}

TEST_CASE("ConnectionManager start and stop accepting", "[network][manager]") {
    ManagerHarness h;
    CHECK_FALSE(h.manager->is_accepting());

    // Connections before start are turned away
    auto early = std::make_shared<MockConnection>(h.io);
    h.manager->handle_inbound_connection(early);
    CHECK(early->close_calls() == 1);
    CHECK(h.manager->session_count() == 0);

    REQUIRE(h.manager->start());
    CHECK(h.manager->is_accepting());
    CHECK(h.transport->is_listening());
    CHECK(h.manager->listen_port() == 45678);
    CHECK_FALSE(h.manager->start());

    h.manager->stop_accepting();
    CHECK_FALSE(h.manager->is_accepting());
    CHECK_FALSE(h.transport->is_listening());
    h.manager->stop_accepting();
    CHECK(h.transport->stop_calls == 1);
}

TEST_CASE("ConnectionManager reports a listener failure", "[network][manager]") {
    ManagerHarness h;
    h.transport->fail_listen = true;
    CHECK_FALSE(h.manager->start());
    CHECK_FALSE(h.manager->is_accepting());
}

TEST_CASE("ConnectionManager with listening disabled", "[network][manager]") {
    boost::asio::io_context io;
    metrics::MetricsRegistry metrics;
    auto ledger = std::make_shared<chain::LedgerHandle>(io, std::make_unique<test::FakeEngine>());
    SubscriptionHub hub(metrics);
    rpc::RPCDispatcher dispatcher(ledger, hub, metrics);
    auto transport = std::make_shared<MockTransport>();

    ConnectionManager::Config config;
    config.listen_enabled = false;
    ConnectionManager manager(io, transport, dispatcher, hub, metrics, config);

    CHECK(manager.start());
    CHECK_FALSE(transport->is_listening());
}

TEST_CASE("ConnectionManager enforces the connection limit", "[network][manager][limits]") {
    ManagerHarness h(2);
    REQUIRE(h.manager->start());

    auto a = h.connect_active();
    auto b = h.connect_active();
    auto rejected = h.connect();

    CHECK(rejected->close_calls() == 1);
    CHECK_FALSE(rejected->started());
    CHECK(h.manager->session_count() == 2);
    CHECK(h.metrics.connections_accepted.value() == 3);
    CHECK(h.metrics.sessions_active.value() == 2);

    // A closed session frees its slot
    a->peer_close();
    REQUIRE(RunUntil(h.io, [&] { return h.manager->session_count() == 1; }));
    CHECK(h.metrics.sessions_active.value() == 1);

    auto c = h.connect();
    REQUIRE(RunUntil(h.io, [&] { return c->started(); }));
    CHECK(h.manager->session_count() == 2);

    h.manager->close_all(CloseReason::SHUTDOWN);
    REQUIRE(RunUntil(h.io, [&] { return h.manager->session_count() == 0; }));
}

TEST_CASE("ConnectionManager drains every session", "[network][manager][shutdown]") {
    ManagerHarness h;
    REQUIRE(h.manager->start());

    auto a = h.connect_active();
    auto b = h.connect_active();
    auto pending = h.connect(); // still handshaking
    REQUIRE(RunUntil(h.io, [&] { return pending->started(); }));
    REQUIRE(h.manager->session_count() == 3);

    // Nothing runs the io_context here, so sessions cannot close yet
    CHECK_FALSE(h.manager->wait_for_sessions(20ms));

    h.manager->stop_accepting();
    h.manager->drain_all();
    REQUIRE(RunUntil(h.io, [&] { return h.manager->session_count() == 0; }));
    CHECK(h.manager->wait_for_sessions(0ms));
    CHECK(h.metrics.sessions_active.value() == 0);
    CHECK_FALSE(a->is_open());
    CHECK_FALSE(b->is_open());
    CHECK_FALSE(pending->is_open());

    // No new sessions after shutdown began
    auto late = std::make_shared<MockConnection>(h.io);
    h.manager->handle_inbound_connection(late);
    CHECK(late->close_calls() == 1);
}

TEST_CASE("ConnectionManager force-closes sessions that cannot drain", "[network][manager][shutdown]") {
    ManagerHarness h;
    REQUIRE(h.manager->start());

    auto stuck = h.connect_active();
    test::RunFor(h.io, 20ms);
    stuck->set_stalled(true);
    stuck->inject(test::RequestFrame(message::PingMessage(1), 2u));
    REQUIRE(RunUntil(h.io, [&] { return stuck->write_count() >= 2; }));

    h.manager->drain_all();
    test::RunFor(h.io, 50ms);
    CHECK(h.manager->session_count() == 1);

    h.manager->close_all(CloseReason::SHUTDOWN);
    REQUIRE(RunUntil(h.io, [&] { return h.manager->session_count() == 0; }));
    CHECK_FALSE(stuck->is_open());
}
