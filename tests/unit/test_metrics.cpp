// Metrics Tests

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "control/metrics.hpp"
#include "gateway/pool.hpp"

using namespace sluice::control;
using sluice::gateway::PoolLease;
using sluice::gateway::PoolRegistry;

TEST_CASE("RelayMetrics basic operations", "[control][metrics]") {
    RelayMetrics metrics;

    SECTION("Initial state") {
        auto snap = metrics.snapshot();

        REQUIRE(snap.active_connections == 0);
        REQUIRE(snap.accepted_connections == 0);
        REQUIRE(snap.rejected_connections == 0);
        REQUIRE(snap.frames_from_client == 0);
        REQUIRE(snap.invalid_frames == 0);
        REQUIRE(snap.pools.empty());
    }

    SECTION("Connection lifecycle") {
        metrics.record_connection();
        metrics.record_connection();
        metrics.record_connection_close();

        auto snap = metrics.snapshot();
        REQUIRE(snap.active_connections == 1);
        REQUIRE(snap.accepted_connections == 2);
    }

    SECTION("Rejections and dial failures do not count as active") {
        metrics.record_connection_rejected();
        metrics.record_dial_failure();

        auto snap = metrics.snapshot();
        REQUIRE(snap.rejected_connections == 1);
        REQUIRE(snap.dial_failures == 1);
        REQUIRE(snap.active_connections == 0);
    }

    SECTION("Frames by direction") {
        metrics.record_frame(true, 100);
        metrics.record_frame(true, 50);
        metrics.record_frame(false, 30);
        metrics.record_invalid_frame();

        auto snap = metrics.snapshot();
        REQUIRE(snap.frames_from_client == 2);
        REQUIRE(snap.bytes_from_client == 150);
        REQUIRE(snap.frames_from_pool == 1);
        REQUIRE(snap.bytes_from_pool == 30);
        REQUIRE(snap.invalid_frames == 1);
    }

    SECTION("Batch of frames from one read") {
        metrics.record_frames(false, 3, 300);
        metrics.record_frame(false, 10);

        auto snap = metrics.snapshot();
        REQUIRE(snap.frames_from_pool == 4);
        REQUIRE(snap.bytes_from_pool == 310);
        REQUIRE(snap.frames_from_client == 0);
    }
}

TEST_CASE("Snapshot includes pools in registry order", "[control][metrics]") {
    PoolRegistry registry;
    registry.add_pool("a.example", 3333);
    registry.add_pool("b.example", 4444);
    registry.at(1).set_healthy(false);
    registry.at(1).dial_failures.fetch_add(2);

    PoolLease l1(registry.at(0));
    PoolLease l2(registry.at(0));

    RelayMetrics metrics;
    metrics.record_connection();

    auto snap = build_metrics_snapshot(metrics, registry);

    REQUIRE(snap.active_connections == 1);
    REQUIRE(snap.pools.size() == 2);

    REQUIRE(snap.pools[0].host == "a.example");
    REQUIRE(snap.pools[0].port == 3333);
    REQUIRE(snap.pools[0].healthy);
    REQUIRE(snap.pools[0].connections == 2);
    REQUIRE(snap.pools[0].total_connections == 2);

    REQUIRE(snap.pools[1].host == "b.example");
    REQUIRE_FALSE(snap.pools[1].healthy);
    REQUIRE(snap.pools[1].connections == 0);
    REQUIRE(snap.pools[1].dial_failures == 2);
}

TEST_CASE("Metrics JSON body", "[control][metrics]") {
    PoolRegistry registry;
    registry.add_pool("a.example", 3333);
    registry.add_pool("b.example", 4444);
    registry.at(0).set_healthy(false);
    PoolLease lease(registry.at(1));

    RelayMetrics metrics;
    metrics.record_connection();
    metrics.record_frame(true, 80);
    metrics.record_frame(false, 40);
    metrics.record_invalid_frame();
    metrics.record_connection_rejected();

    auto j = nlohmann::json::parse(to_json(build_metrics_snapshot(metrics, registry)));

    REQUIRE(j["totalConnections"] == 1);
    REQUIRE(j["acceptedConnections"] == 1);
    REQUIRE(j["rejectedConnections"] == 1);
    REQUIRE(j["dialFailures"] == 0);
    REQUIRE(j["frames"]["fromClient"] == 1);
    REQUIRE(j["frames"]["fromPool"] == 1);
    REQUIRE(j["frames"]["invalid"] == 1);
    REQUIRE(j["bytes"]["fromClient"] == 80);
    REQUIRE(j["bytes"]["fromPool"] == 40);

    REQUIRE(j["pools"].is_array());
    REQUIRE(j["pools"].size() == 2);
    REQUIRE(j["pools"][0]["host"] == "a.example");
    REQUIRE(j["pools"][0]["port"] == 3333);
    REQUIRE(j["pools"][0]["healthy"] == false);
    REQUIRE(j["pools"][0]["connections"] == 0);
    REQUIRE(j["pools"][1]["host"] == "b.example");
    REQUIRE(j["pools"][1]["healthy"] == true);
    REQUIRE(j["pools"][1]["connections"] == 1);
    REQUIRE(j["pools"][1]["totalConnections"] == 1);
}

TEST_CASE("Metrics JSON with no pools", "[control][metrics]") {
    PoolRegistry registry;
    RelayMetrics metrics;

    auto j = nlohmann::json::parse(to_json(build_metrics_snapshot(metrics, registry)));
    REQUIRE(j["totalConnections"] == 0);
    REQUIRE(j["pools"].is_array());
    REQUIRE(j["pools"].empty());
}
