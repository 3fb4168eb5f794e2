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


// Sluice Server Runner - Header
// Multi-worker relay (SO_REUSEPORT, one epoll loop per thread)

#pragma once

#include <cstdint>
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "../gateway/pool.hpp"
#include "relay.hpp"

namespace sluice::core {

/// Number of workers to run for a configured worker_threads value (0 = CPU count)
[[nodiscard]] uint32_t resolve_worker_count(uint32_t configured) noexcept;

/// Runs N RelayServer workers on one shared port
///
/// start() binds every worker before any thread is spawned, so a bind failure is
/// reported without leaving half the workers running. With listen_port 0 the
/// first worker picks the port and the rest join it.
class RelayRunner {
public:
    RelayRunner(const control::ServerConfig& config,
                gateway::PoolRegistry& registry,
                control::RelayMetrics& metrics);
    ~RelayRunner();

    // Non-copyable, non-movable
    RelayRunner(const RelayRunner&) = delete;
    RelayRunner& operator=(const RelayRunner&) = delete;

    /// Bind all workers and start their threads
    [[nodiscard]] std::error_code start();

    /// Ask every worker to exit (safe from any thread)
    void stop() noexcept;

    /// Join worker threads; returns the first worker error, if any
    std::error_code wait();

    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] size_t worker_count() const noexcept { return workers_.size(); }

    /// Sessions currently open across all workers
    [[nodiscard]] size_t session_count() const noexcept;

private:
    control::ServerConfig config_;
    gateway::PoolRegistry& registry_;
    control::RelayMetrics& metrics_;

    uint16_t port_ = 0;
    std::vector<std::unique_ptr<RelayServer>> workers_;
    std::vector<std::thread> threads_;
    std::vector<std::error_code> results_;
};

} // namespace sluice::core
