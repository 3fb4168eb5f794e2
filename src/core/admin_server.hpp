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

// Sluice Admin Server - Header
// Lightweight HTTP server for the metrics and health endpoints
// Runs on its own port (default 3000), bound to loopback unless configured otherwise

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "../gateway/pool.hpp"

namespace sluice::core {

/// Lightweight admin server for internal endpoints
/// Serves GET <metrics.path> and GET /health
/// Uses simple blocking I/O (not performance-critical)
class AdminServer {
public:
    AdminServer(control::MetricsConfig config,
                const gateway::PoolRegistry& registry,
                const control::RelayMetrics& metrics);
    ~AdminServer();

    // Non-copyable, non-movable
    AdminServer(const AdminServer&) = delete;
    AdminServer& operator=(const AdminServer&) = delete;

    /// Start admin server (bind and listen on metrics port)
    [[nodiscard]] std::error_code start();

    /// Stop admin server (run() returns within one poll interval)
    void stop() noexcept;

    /// Run server event loop (blocking, call in separate thread)
    void run();

    /// Check if server is running
    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    /// Port actually bound (resolves port 0)
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    /// Parsed request line
    struct SimpleRequest {
        std::string method;
        std::string path;
        bool valid = false;
    };

    struct Response {
        int status_code = 200;
        std::string content_type;
        std::string body;
    };

    /// Parse simple HTTP request (minimal parser, request line only)
    [[nodiscard]] static SimpleRequest parse_request(const char* data, size_t len);

    /// Route a parsed request
    [[nodiscard]] Response handle(const SimpleRequest& req) const;

private:
    control::MetricsConfig config_;
    const gateway::PoolRegistry& registry_;
    const control::RelayMetrics& metrics_;

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};

    /// Handle single client connection (blocking)
    void handle_connection(int client_fd);

    /// Send HTTP response
    void send_response(int fd, const Response& response);
};

}  // namespace sluice::core
