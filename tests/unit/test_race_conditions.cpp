/*
 * Copyright 2025 Sluice Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Race Condition Tests
// Shared pool state touched by relay workers, the health monitor and the admin server

#include <atomic>
#include <barrier>
#include <catch2/catch_test_macros.hpp>
#include <thread>
#include <vector>

#include "../../src/control/metrics.hpp"
#include "../../src/gateway/pool.hpp"

using namespace sluice::gateway;
using namespace sluice::control;

// ============================================================================
// Test 1: Concurrent leases on one pool
// ============================================================================

TEST_CASE("Concurrent lease acquire/release leaves count unchanged", "[race][pool]") {
    PoolRegistry registry;
    registry.add_pool("A", 1);
    Pool& pool = registry.at(0);

    constexpr int num_threads = 8;
    constexpr int iterations_per_thread = 10000;

    std::barrier start_line(num_threads);
    std::vector<std::thread> threads;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&]() {
            start_line.arrive_and_wait();
            for (int j = 0; j < iterations_per_thread; ++j) {
                PoolLease lease(pool);
                if (j % 2 == 0) {
                    lease.release();  // Explicit release, destructor must not decrement again
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(pool.connections() == 0);
    REQUIRE(pool.total_connections.load() == num_threads * iterations_per_thread);
}

// ============================================================================
// Test 2: Health flips while workers select
// ============================================================================

TEST_CASE("Selection during concurrent health changes never returns null", "[race][selector]") {
    PoolRegistry registry;
    registry.add_pool("A", 1);
    registry.add_pool("B", 2);
    registry.add_pool("C", 3);
    PoolSelector selector(registry);

    std::atomic<bool> stop{false};
    std::atomic<int> null_selections{0};
    std::atomic<int> selections{0};

    // Writer: toggles health like a monitor tick would
    std::thread monitor([&]() {
        int n = 0;
        while (!stop.load()) {
            for (size_t i = 0; i < registry.size(); ++i) {
                registry.at(i).set_healthy(((n >> i) & 1) == 0);
            }
            ++n;
        }
    });

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&]() {
            for (int j = 0; j < 20000; ++j) {
                Pool* pool = selector.select();
                if (!pool) {
                    null_selections.fetch_add(1);
                } else {
                    PoolLease lease(*pool);
                }
                selections.fetch_add(1);
            }
        });
    }

    for (auto& w : workers) {
        w.join();
    }
    stop.store(true);
    monitor.join();

    REQUIRE(null_selections.load() == 0);
    REQUIRE(selections.load() == 4 * 20000);
    REQUIRE(registry.total_active_connections() == 0);
}

// ============================================================================
// Test 3: Relay counters from many workers
// ============================================================================

TEST_CASE("Relay metrics are consistent under concurrent updates", "[race][metrics]") {
    RelayMetrics metrics;

    constexpr int num_threads = 6;
    constexpr int iterations_per_thread = 5000;

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < iterations_per_thread; ++j) {
                metrics.record_connection();
                metrics.record_frame(i % 2 == 0, 10);
                metrics.record_connection_close();
            }
        });
    }

    // Reader: snapshots while writers run
    for (int k = 0; k < 100; ++k) {
        auto snap = metrics.snapshot();
        REQUIRE(snap.accepted_connections <= num_threads * iterations_per_thread);
    }

    for (auto& t : threads) {
        t.join();
    }

    auto snap = metrics.snapshot();
    REQUIRE(snap.active_connections == 0);
    REQUIRE(snap.accepted_connections == num_threads * iterations_per_thread);
    REQUIRE(snap.frames_from_client + snap.frames_from_pool == num_threads * iterations_per_thread);
    REQUIRE(snap.bytes_from_client == snap.frames_from_client * 10);
}
