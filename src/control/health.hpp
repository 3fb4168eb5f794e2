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


// Sluice Health Checks - Header
// Background TCP probing of upstream pools and health status reporting

#pragma once

#include <netinet/in.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "config.hpp"

namespace sluice::gateway {
class PoolRegistry;
struct Pool;
}

namespace sluice::control {

/// Health status levels
enum class HealthStatus {
    Healthy,    // All pools reachable
    Degraded,   // Some pools down, relay still has a healthy pool
    Unhealthy   // No healthy pool (or none configured)
};

/// Outcome of one TCP reachability probe
struct ProbeResult {
    bool reachable = false;
    std::chrono::milliseconds latency{0};
    std::string error;
};

/// Aggregate health of the pool registry
struct PoolHealthSummary {
    HealthStatus status = HealthStatus::Unhealthy;
    size_t healthy_pools = 0;
    size_t total_pools = 0;
};

/// Open a TCP connection to host:port and close it again.
/// Reachable only if the connect completes within timeout.
[[nodiscard]] ProbeResult probe_endpoint(
    const std::string& host,
    uint16_t port,
    std::chrono::milliseconds timeout);

/// Same, against an already resolved address
[[nodiscard]] ProbeResult probe_endpoint(const sockaddr_in& addr,
                                         std::chrono::milliseconds timeout);

/// Store a probe outcome on the pool; logs and returns true on a state change
bool apply_probe_result(gateway::Pool& pool, const ProbeResult& result);

/// Periodic pool prober
///
/// First tick runs as soon as start() is called, then one tick every interval.
/// A tick probes all pools concurrently (one thread per pool) and waits for all of
/// them, so at most one tick is ever in flight. Each tick also re-resolves the
/// pool hosts and refreshes their cached dial addresses.
class HealthMonitor {
public:
    HealthMonitor(gateway::PoolRegistry& registry, HealthCheckConfig config);
    ~HealthMonitor();

    // Non-copyable, non-movable
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// Start background probing (no-op if already running)
    void start();

    /// Stop and join the probing thread
    void stop();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /// Run one probe tick on the calling thread
    void probe_once();

    /// Completed ticks since construction
    [[nodiscard]] uint64_t ticks() const noexcept {
        return ticks_.load(std::memory_order_acquire);
    }

private:
    void run();

    gateway::PoolRegistry& registry_;
    HealthCheckConfig config_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;  // Guarded by mutex_

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
};

/// Health check response builder
class HealthResponse {
public:
    /// Summarize pool health from the registry
    [[nodiscard]] static PoolHealthSummary summarize(const gateway::PoolRegistry& registry);

    /// Build JSON health response
    [[nodiscard]] static std::string to_json(const PoolHealthSummary& summary);

    [[nodiscard]] static std::string_view status_name(HealthStatus status) noexcept;

    /// Determine HTTP status code based on health
    [[nodiscard]] static uint16_t to_http_status(HealthStatus status) noexcept {
        switch (status) {
            case HealthStatus::Healthy:
                return 200;  // OK
            case HealthStatus::Degraded:
                return 200;  // Still relaying
            case HealthStatus::Unhealthy:
                return 503;  // Service Unavailable
        }
        return 500;  // Internal Server Error
    }
};

} // namespace sluice::control
