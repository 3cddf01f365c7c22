// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license
// Mint scheduler tests: driven on a single-threaded io_context

#include <catch2/catch_test_macros.hpp>
#include "chain/ledger_handle.hpp"
#include "infra/fake_engine.hpp"
#include "infra/recording_sink.hpp"
#include "infra/test_helpers.hpp"
#include "metrics/metrics_registry.hpp"
#include "mining/mint_scheduler.hpp"
#include "network/subscription_hub.hpp"

using namespace mintnode;
using namespace std::chrono_literals;
using mintnode::mining::MintScheduler;
using mintnode::test::FakeEngine;

namespace {
struct SchedulerFixture {
    SchedulerFixture()
        : engine(new FakeEngine()),
          ledger(std::make_shared<chain::LedgerHandle>(io, std::unique_ptr<chain::LedgerEngine>(engine))),
          hub(metrics),
          sink(std::make_shared<test::RecordingSink>()) {
        hub.subscribe(1, sink);
    }

    std::unique_ptr<MintScheduler> make(std::chrono::milliseconds interval) {
        MintScheduler::Config config;
        config.interval = interval;
        return std::make_unique<MintScheduler>(
            io, ledger, hub, metrics, config,
            [this](const std::string& reason) {
                fatal_calls++;
                fatal_reason = reason;
            });
    }

    // ProduceNow and run the io_context until its callback fires
    chain::MintResult produce_now(MintScheduler& scheduler) {
        std::optional<chain::MintResult> result;
        scheduler.ProduceNow([&](const chain::MintResult& r) { result = r; });
        REQUIRE(test::RunUntil(io, [&] { return result.has_value(); }));
        return *result;
    }

    boost::asio::io_context io;
    FakeEngine* engine;
    metrics::MetricsRegistry metrics;
    chain::LedgerHandlePtr ledger;
    network::SubscriptionHub hub;
    std::shared_ptr<test::RecordingSink> sink;
    int fatal_calls{0};
    std::string fatal_reason;
};
}

TEST_CASE("MintScheduler validates its configuration", "[mining][scheduler]") {
    SchedulerFixture f;
    CHECK_THROWS_AS(f.make(0ms), std::invalid_argument);
    CHECK_THROWS_AS(f.make(-5ms), std::invalid_argument);

    MintScheduler::Config config;
    CHECK_THROWS_AS(MintScheduler(f.io, nullptr, f.hub, f.metrics, config), std::invalid_argument);
}

TEST_CASE("MintScheduler produces on each tick and publishes in height order", "[mining][scheduler]") {
    SchedulerFixture f;
    auto scheduler = f.make(20ms);
    REQUIRE(scheduler->Start());
    CHECK(scheduler->IsRunning());
    CHECK_FALSE(scheduler->Start());

    REQUIRE(test::RunUntil(f.io, [&] { return scheduler->GetBlocksProduced() >= 4; }));
    scheduler->Stop();
    test::RunFor(f.io, 50ms);

    auto heights = f.sink->heights();
    REQUIRE(heights.size() >= 4);
    for (size_t i = 0; i < heights.size(); ++i) {
        CHECK(heights[i] == i + 1);
    }
    CHECK(f.metrics.blocks_produced.value() == static_cast<int64_t>(heights.size()));
    CHECK(f.metrics.chain_height.value() == static_cast<int64_t>(heights.back()));
}

TEST_CASE("MintScheduler stops producing after Stop", "[mining][scheduler]") {
    SchedulerFixture f;
    auto scheduler = f.make(20ms);
    scheduler->Start();
    REQUIRE(test::RunUntil(f.io, [&] { return scheduler->GetBlocksProduced() >= 1; }));

    scheduler->Stop();
    CHECK_FALSE(scheduler->IsRunning());
    uint64_t produced = scheduler->GetBlocksProduced();
    test::RunFor(f.io, 100ms);
    CHECK(scheduler->GetBlocksProduced() == produced);

    // Stop is idempotent
    scheduler->Stop();
}

TEST_CASE("MintScheduler counts skipped intervals and keeps going", "[mining][scheduler]") {
    SchedulerFixture f;
    f.engine->script({FakeEngine::Scripted::SKIP, FakeEngine::Scripted::SKIP});
    auto scheduler = f.make(10ms);
    scheduler->Start();

    REQUIRE(test::RunUntil(f.io, [&] { return scheduler->GetBlocksProduced() >= 1; }));
    scheduler->Stop();

    CHECK(f.metrics.mint_skipped.value() == 2);
    CHECK(f.sink->heights().front() == 1);
    CHECK(f.fatal_calls == 0);
}

TEST_CASE("MintScheduler reports a fatal engine result once and stops", "[mining][scheduler]") {
    SchedulerFixture f;
    f.engine->script({FakeEngine::Scripted::PRODUCE, FakeEngine::Scripted::FATAL});
    auto scheduler = f.make(10ms);
    scheduler->Start();

    REQUIRE(test::RunUntil(f.io, [&] { return f.fatal_calls > 0; }));
    test::RunFor(f.io, 60ms);

    CHECK(f.fatal_calls == 1);
    CHECK(f.fatal_reason == "disk on fire");
    CHECK_FALSE(scheduler->IsRunning());
    CHECK(scheduler->GetBlocksProduced() == 1);
    CHECK(f.engine->produce_calls == 2);

    // No restart and no manual production after a fatal error
    CHECK_FALSE(scheduler->Start());
    CHECK(f.produce_now(*scheduler).status == chain::MintStatus::FATAL);
    CHECK(f.engine->produce_calls == 2);
}

TEST_CASE("MintScheduler treats an engine exception as fatal", "[mining][scheduler]") {
    SchedulerFixture f;
    f.engine->script({FakeEngine::Scripted::THROW});
    auto scheduler = f.make(10ms);

    auto result = f.produce_now(*scheduler);
    CHECK(result.status == chain::MintStatus::FATAL);
    CHECK(result.reason.find("engine exploded") != std::string::npos);
    CHECK(f.fatal_calls == 1);
    CHECK_FALSE(f.ledger->IsMintInFlight());
}

TEST_CASE("MintScheduler ProduceNow publishes immediately", "[mining][scheduler]") {
    SchedulerFixture f;
    auto scheduler = f.make(1h);

    auto result = f.produce_now(*scheduler);
    REQUIRE(result.status == chain::MintStatus::PRODUCED);
    CHECK(result.block->height == 1);
    CHECK(f.sink->heights() == std::vector<uint64_t>{1});
    CHECK(scheduler->GetBlocksProduced() == 1);
}

TEST_CASE("MintScheduler publishes concurrent requests in height order", "[mining][scheduler]") {
    SchedulerFixture f;
    auto scheduler = f.make(1h);

    // The second request overlaps the first and is skipped by the ledger
    std::vector<chain::MintStatus> statuses;
    scheduler->ProduceNow([&](const chain::MintResult& r) { statuses.push_back(r.status); });
    scheduler->ProduceNow([&](const chain::MintResult& r) { statuses.push_back(r.status); });
    REQUIRE(test::RunUntil(f.io, [&] { return statuses.size() == 2; }));
    CHECK(statuses[0] == chain::MintStatus::PRODUCED);
    CHECK(statuses[1] == chain::MintStatus::SKIPPED);

    CHECK(f.produce_now(*scheduler).status == chain::MintStatus::PRODUCED);
    CHECK(f.sink->heights() == std::vector<uint64_t>{1, 2});
    CHECK(f.metrics.mint_skipped.value() == 1);
}

TEST_CASE("MintScheduler next fire time never bursts to catch up", "[mining][scheduler]") {
    using clock = std::chrono::steady_clock;
    auto t0 = clock::time_point{} + 10s;

    SECTION("on schedule") {
        auto next = MintScheduler::ComputeNextFire(t0, t0 + 5ms, 100ms);
        CHECK(next == t0 + 100ms);
    }
    SECTION("late but within the interval keeps the grid") {
        auto next = MintScheduler::ComputeNextFire(t0, t0 + 90ms, 100ms);
        CHECK(next == t0 + 100ms);
    }
    SECTION("a full interval behind restarts from now") {
        auto now = t0 + 350ms;
        auto next = MintScheduler::ComputeNextFire(t0, now, 100ms);
        CHECK(next == now + 100ms);
    }
    SECTION("exactly one interval behind") {
        auto now = t0 + 100ms;
        CHECK(MintScheduler::ComputeNextFire(t0, now, 100ms) == now + 100ms);
    }
}
