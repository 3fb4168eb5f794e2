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


// Sluice Health Checks - Implementation

#include "health.hpp"

#include <poll.h>

#include <cerrno>

#include <nlohmann/json.hpp>
#include <vector>

#include "../core/logging.hpp"
#include "../core/socket.hpp"
#include "../gateway/pool.hpp"

namespace sluice::control {

ProbeResult probe_endpoint(
    const std::string& host,
    uint16_t port,
    std::chrono::milliseconds timeout) {

    sockaddr_in addr{};
    if (auto ec = core::resolve_ipv4(host, port, addr); ec) {
        ProbeResult result;
        result.error = "resolve failed: " + ec.message();
        return result;
    }
    return probe_endpoint(addr, timeout);
}

ProbeResult probe_endpoint(const sockaddr_in& addr, std::chrono::milliseconds timeout) {
    ProbeResult result;
    auto start = std::chrono::steady_clock::now();

    std::error_code ec;
    int fd = core::connect_nonblocking(addr, ec);
    if (fd < 0) {
        result.error = "connect failed: " + ec.message();
        return result;
    }

    // Wait for the connect to finish (writable) or time out
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;

    int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        result.error = "poll failed: " + std::error_code(errno, std::system_category()).message();
    } else if (ready == 0) {
        result.error = "connect timed out";
    } else if (auto err = core::socket_error(fd); err) {
        result.error = "connect failed: " + err.message();
    } else {
        result.reachable = true;
    }

    core::close_fd(fd);

    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

bool apply_probe_result(gateway::Pool& pool, const ProbeResult& result) {
    bool previous = pool.set_healthy(result.reachable);
    if (previous == result.reachable) {
        return false;
    }

    if (auto* logger = logging::get_logger()) {
        LOG_POOL_HEALTH(logger, pool.host, pool.port, previous ? "healthy" : "unhealthy",
                        result.reachable ? "healthy" : "unhealthy",
                        result.reachable ? std::string("probe succeeded") : result.error);
    }
    return true;
}

HealthMonitor::HealthMonitor(gateway::PoolRegistry& registry, HealthCheckConfig config)
    : registry_(registry), config_(config) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this] { run(); });
}

void HealthMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
}

void HealthMonitor::probe_once() {
    auto& pools = registry_.pools();
    std::vector<ProbeResult> results(pools.size());
    std::chrono::milliseconds timeout = std::chrono::seconds(config_.timeout);

    // One probe per pool, all in flight together
    std::vector<std::thread> probes;
    probes.reserve(pools.size());
    for (size_t i = 0; i < pools.size(); ++i) {
        probes.emplace_back([&, i] {
            // DNS is refreshed here so relay workers can dial the cached address
            if (auto ec = pools[i].refresh_address(); ec) {
                results[i].error = "resolve failed: " + ec.message();
                return;
            }
            sockaddr_in addr{};
            if (!pools[i].resolved_address(addr)) {
                results[i].error = "resolve failed: no IPv4 address";
                return;
            }
            results[i] = probe_endpoint(addr, timeout);
        });
    }
    for (auto& probe : probes) {
        probe.join();
    }

    for (size_t i = 0; i < pools.size(); ++i) {
        apply_probe_result(pools[i], results[i]);
    }

    ticks_.fetch_add(1, std::memory_order_acq_rel);
}

void HealthMonitor::run() {
    auto interval = std::chrono::seconds(config_.interval);

    while (true) {
        probe_once();

        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
            break;
        }
    }
}

// HealthResponse implementation

PoolHealthSummary HealthResponse::summarize(const gateway::PoolRegistry& registry) {
    PoolHealthSummary summary;
    summary.total_pools = registry.size();
    summary.healthy_pools = registry.healthy_count();

    if (summary.healthy_pools == 0) {
        summary.status = HealthStatus::Unhealthy;
    } else if (summary.healthy_pools < summary.total_pools) {
        summary.status = HealthStatus::Degraded;
    } else {
        summary.status = HealthStatus::Healthy;
    }
    return summary;
}

std::string HealthResponse::to_json(const PoolHealthSummary& summary) {
    nlohmann::json body = {
        {"status", status_name(summary.status)},
        {"healthy_pools", summary.healthy_pools},
        {"total_pools", summary.total_pools},
    };
    return body.dump();
}

std::string_view HealthResponse::status_name(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
    }
    return "unknown";
}

} // namespace sluice::control
