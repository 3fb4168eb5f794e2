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


// Sluice Relay Server - Header
// Single-threaded epoll loop: accept, select pool, dial, pipe, teardown

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>
#include <system_error>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "../gateway/pool.hpp"
#include "containers.hpp"
#include "session.hpp"

namespace sluice::core {

/// Sent to a client when no pool is configured, then the socket is closed
constexpr std::string_view NO_POOLS_MESSAGE = "No pools available";

/// One relay worker
///
/// Owns a listening socket (SO_REUSEPORT, so several workers can share a port)
/// and an epoll instance. Every session accepted here lives and dies on the
/// thread calling run().
class RelayServer {
public:
    RelayServer(control::ServerConfig config,
                gateway::PoolRegistry& registry,
                control::RelayMetrics& metrics);
    ~RelayServer();

    // Non-copyable, non-movable
    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /// Bind listener and create epoll instance
    [[nodiscard]] std::error_code start();

    /// Event loop; returns after stop() once all sessions are torn down
    [[nodiscard]] std::error_code run();

    /// Request loop exit (safe from any thread)
    void stop() noexcept { running_.store(false, std::memory_order_release); }

    /// Port actually bound (resolves listen_port 0)
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    [[nodiscard]] size_t session_count() const noexcept {
        return session_count_.load(std::memory_order_acquire);
    }

private:
    void handle_accept();
    void open_session(int client_fd, std::string client_address);
    void refuse(int client_fd, std::string_view client_address);

    void handle_event(uint64_t token, uint32_t events);

    /// Drain a readable socket; returns false if the session was torn down
    bool read_side(Session& session, Side side);

    /// Push queued bytes to `to`; returns false if the session was torn down
    bool flush_side(Session& session, Side to);

    void teardown(Session& session, std::string_view reason);
    void teardown_all();

    [[nodiscard]] bool watch(int fd, uint64_t token);

    control::ServerConfig config_;
    gateway::PoolSelector selector_;
    control::RelayMetrics& metrics_;

    int listen_fd_ = -1;
    int epoll_fd_ = -1;
    uint16_t port_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<size_t> session_count_{0};

    uint64_t next_session_id_ = 1;
    fast_map<uint64_t, std::unique_ptr<Session>> sessions_;
};

}  // namespace sluice::core
