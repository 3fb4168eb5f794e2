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

// Sluice Admin Server - Implementation
// Lightweight HTTP server for internal admin endpoints

#include "admin_server.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include "../control/health.hpp"
#include "logging.hpp"
#include "socket.hpp"

namespace sluice::core {

namespace {
constexpr int ACCEPT_POLL_MS = 200;
constexpr int ADMIN_BACKLOG = 32;
}  // namespace

AdminServer::AdminServer(control::MetricsConfig config,
                         const gateway::PoolRegistry& registry,
                         const control::RelayMetrics& metrics)
    : config_(std::move(config)), registry_(registry), metrics_(metrics) {}

AdminServer::~AdminServer() {
    stop();
    close_fd(listen_fd_);
}

std::error_code AdminServer::start() {
    if (running_.load(std::memory_order_relaxed)) {
        return std::make_error_code(std::errc::operation_in_progress);
    }

    // Single listener, no SO_REUSEPORT: a second instance must fail to bind
    listen_fd_ = create_listening_socket(config_.listen_address,
                                         static_cast<uint16_t>(config_.port), ADMIN_BACKLOG,
                                         false);
    if (listen_fd_ < 0) {
        return std::error_code(errno, std::generic_category());
    }
    port_ = local_port(listen_fd_);

    running_.store(true, std::memory_order_relaxed);

    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger, "Metrics available on {}:{}{}", config_.listen_address, port_,
                 config_.path);
    }
    return {};
}

void AdminServer::stop() noexcept {
    running_.store(false, std::memory_order_relaxed);
}

void AdminServer::run() {
    while (running_.load(std::memory_order_relaxed)) {
        // Wait for a connection, waking up periodically to observe stop()
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int ready = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ready <= 0) {
            continue;  // Timeout or EINTR
        }

        int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            continue;  // EAGAIN (listener is non-blocking) or aborted connection
        }

        // Blocking I/O with a short timeout so one slow client cannot wedge the loop
        timeval tv{};
        tv.tv_sec = 2;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        handle_connection(client_fd);
        close_fd(client_fd);
    }
}

void AdminServer::handle_connection(int client_fd) {
    // Listener is non-blocking; the client socket must not be
    int flags = fcntl(client_fd, F_GETFL, 0);
    if (flags >= 0 && (flags & O_NONBLOCK)) {
        fcntl(client_fd, F_SETFL, flags & ~O_NONBLOCK);
    }

    // Read request (simple blocking read)
    char buffer[4096];
    ssize_t n = recv(client_fd, buffer, sizeof(buffer) - 1, 0);
    if (n <= 0) {
        return;
    }
    buffer[n] = '\0';

    auto req = parse_request(buffer, static_cast<size_t>(n));
    send_response(client_fd, handle(req));
}

AdminServer::Response AdminServer::handle(const SimpleRequest& req) const {
    if (!req.valid) {
        return {400, "text/plain", "Bad Request"};
    }

    if (req.method == "GET") {
        if (req.path == "/health" || req.path == "/_health") {
            auto summary = control::HealthResponse::summarize(registry_);
            return {control::HealthResponse::to_http_status(summary.status), "application/json",
                    control::HealthResponse::to_json(summary)};
        }

        if (req.path == "/metrics" || req.path == config_.path) {
            auto snapshot = control::build_metrics_snapshot(metrics_, registry_);
            return {200, "application/json", control::to_json(snapshot)};
        }
    }

    return {404, "text/plain", "Not Found"};
}

AdminServer::SimpleRequest AdminServer::parse_request(const char* data, size_t len) {
    SimpleRequest req;

    // Find first line (method and path)
    const char* line_end = static_cast<const char*>(memchr(data, '\n', len));
    if (!line_end) {
        return req;
    }

    // Parse "GET /path HTTP/1.1"
    const char* space1 = static_cast<const char*>(memchr(data, ' ', line_end - data));
    if (!space1 || space1 == data) {
        return req;
    }

    const char* space2 = static_cast<const char*>(memchr(space1 + 1, ' ', line_end - space1 - 1));
    if (!space2 || space2 == space1 + 1) {
        return req;
    }

    req.method = std::string(data, space1 - data);
    req.path = std::string(space1 + 1, space2 - space1 - 1);

    // Ignore any query string
    if (auto q = req.path.find('?'); q != std::string::npos) {
        req.path.resize(q);
    }

    req.valid = !req.path.empty() && req.path.front() == '/';
    return req;
}

void AdminServer::send_response(int fd, const Response& resp) {
    std::ostringstream response;

    // Status line
    response << "HTTP/1.1 " << resp.status_code << " ";
    switch (resp.status_code) {
        case 200:
            response << "OK";
            break;
        case 400:
            response << "Bad Request";
            break;
        case 404:
            response << "Not Found";
            break;
        case 503:
            response << "Service Unavailable";
            break;
        default:
            response << "Unknown";
            break;
    }
    response << "\r\n";

    // Headers
    response << "Content-Type: " << resp.content_type << "\r\n";
    response << "Content-Length: " << resp.body.size() << "\r\n";
    response << "Connection: close\r\n";
    response << "Server: Sluice-Admin/0.1.0\r\n";
    response << "\r\n";

    response << resp.body;

    std::string response_str = response.str();
    size_t sent = 0;
    while (sent < response_str.size()) {
        ssize_t n = send(fd, response_str.data() + sent, response_str.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            if (auto* logger = logging::get_logger()) {
                LOG_DEBUG(logger, "Admin response truncated after {} bytes", sent);
            }
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

}  // namespace sluice::core
