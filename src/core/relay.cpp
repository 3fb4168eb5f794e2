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


// Sluice Relay Server - Implementation

#include "relay.hpp"

#include <arpa/inet.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fmt/format.h>

#include <cerrno>
#include <vector>

#include "logging.hpp"
#include "socket.hpp"

namespace sluice::core {

namespace {

// epoll token layout: session id in the high bits, side in bit 0.
// Session ids start at 1, so token 0 is free for the listener.
constexpr uint64_t LISTEN_TOKEN = 0;

constexpr uint64_t make_token(uint64_t session_id, Side side) noexcept {
    return (session_id << 1) | static_cast<uint64_t>(side);
}

constexpr uint64_t token_session(uint64_t token) noexcept {
    return token >> 1;
}

constexpr Side token_side(uint64_t token) noexcept {
    return (token & 1) ? Side::Pool : Side::Client;
}

constexpr int MAX_EVENTS = 1024;
constexpr int EPOLL_TIMEOUT_MS = 200;
constexpr size_t READ_CHUNK_SIZE = 16384;

}  // namespace

RelayServer::RelayServer(control::ServerConfig config,
                         gateway::PoolRegistry& registry,
                         control::RelayMetrics& metrics)
    : config_(std::move(config)),
      selector_(registry),
      metrics_(metrics) {}

RelayServer::~RelayServer() {
    teardown_all();
    close_fd(epoll_fd_);
    close_fd(listen_fd_);
}

std::error_code RelayServer::start() {
    listen_fd_ = create_listening_socket(config_.listen_address,
                                         static_cast<uint16_t>(config_.listen_port),
                                         static_cast<int>(config_.backlog));
    if (listen_fd_ < 0) {
        return std::error_code(errno, std::system_category());
    }
    port_ = local_port(listen_fd_);

    epoll_fd_ = epoll_create1(0);
    if (epoll_fd_ < 0) {
        auto ec = std::error_code(errno, std::system_category());
        close_fd(listen_fd_);
        listen_fd_ = -1;
        return ec;
    }

    // Add listen socket to epoll (edge-triggered)
    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLET;
    ev.data.u64 = LISTEN_TOKEN;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, listen_fd_, &ev) < 0) {
        auto ec = std::error_code(errno, std::system_category());
        close_fd(epoll_fd_);
        close_fd(listen_fd_);
        epoll_fd_ = -1;
        listen_fd_ = -1;
        return ec;
    }

    running_.store(true, std::memory_order_release);

    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger, "Relay listening on {}:{}", config_.listen_address, port_);
    }
    return {};
}

std::error_code RelayServer::run() {
    if (epoll_fd_ < 0) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }

    std::vector<epoll_event> events(MAX_EVENTS);
    std::error_code result;

    while (running_.load(std::memory_order_acquire)) {
        int n_events = epoll_wait(epoll_fd_, events.data(), MAX_EVENTS, EPOLL_TIMEOUT_MS);

        if (n_events < 0) {
            if (errno == EINTR) continue;
            result = std::error_code(errno, std::system_category());
            break;
        }

        for (int i = 0; i < n_events; ++i) {
            uint64_t token = events[i].data.u64;
            if (token == LISTEN_TOKEN) {
                handle_accept();
            } else {
                handle_event(token, events[i].events);
            }
        }
    }

    // Cleanup: release every lease still held by this worker
    teardown_all();
    return result;
}

void RelayServer::handle_accept() {
    while (true) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);

        int client_fd = accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;  // No more connections to accept
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (auto* logger = logging::get_logger()) {
                LOG_ERROR(logger, "accept() failed: {}",
                          std::error_code(errno, std::system_category()).message());
            }
            break;
        }

        if (auto ec = set_nonblocking(client_fd); ec) {
            close_fd(client_fd);
            continue;
        }
        (void)set_nodelay(client_fd);

        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_str, sizeof(ip_str));
        std::string client_address =
            std::string(ip_str) + ":" + std::to_string(ntohs(client_addr.sin_port));

        open_session(client_fd, std::move(client_address));
    }
}

void RelayServer::refuse(int client_fd, std::string_view client_address) {
    // Best effort: the socket is freshly accepted, so its send buffer is empty
    ssize_t n = send(client_fd, NO_POOLS_MESSAGE.data(), NO_POOLS_MESSAGE.size(), MSG_NOSIGNAL);
    if (n < 0) {
        if (auto* logger = logging::get_logger()) {
            LOG_DEBUG(logger, "Refusal to {} not delivered: {}", client_address,
                      std::error_code(errno, std::system_category()).message());
        }
    }
    close_fd(client_fd);
    metrics_.record_connection_rejected();

    if (auto* logger = logging::get_logger()) {
        LOG_WARNING(logger, "Rejected client {}: {}", client_address, NO_POOLS_MESSAGE);
    }
}

void RelayServer::open_session(int client_fd, std::string client_address) {
    gateway::Pool* pool = selector_.select();
    if (!pool) {
        refuse(client_fd, client_address);
        return;
    }

    // Count the pair against the pool before dialing; the lease gives it back
    // on every exit path below.
    gateway::PoolLease lease(*pool);

    // Only the cached address is dialed; resolving here would stall every
    // session on this worker
    sockaddr_in pool_addr{};
    std::error_code ec;
    int pool_fd = -1;
    if (pool->resolved_address(pool_addr)) {
        pool_fd = connect_nonblocking(pool_addr, ec);
    } else {
        ec = std::make_error_code(std::errc::host_unreachable);
    }

    if (pool_fd < 0) {
        pool->dial_failures.fetch_add(1, std::memory_order_relaxed);
        metrics_.record_dial_failure();
        if (auto* logger = logging::get_logger()) {
            LOG_ERROR(logger, "Dial to pool {} failed for client {}: {}", pool->address(),
                      client_address, ec.message());
        }
        close_fd(client_fd);
        return;
    }

    uint64_t id = next_session_id_++;
    auto session = std::make_unique<Session>(id, client_fd, pool_fd, std::move(lease),
                                             config_.max_frame_size);
    session->correlation_id = logging::generate_correlation_id();
    session->client_address = std::move(client_address);

    Session& s = *session;
    sessions_.emplace(id, std::move(session));
    session_count_.store(sessions_.size(), std::memory_order_release);
    metrics_.record_connection();

    if (auto* logger = logging::get_logger()) {
        LOG_SESSION(logger, "opened", s.correlation_id, s.client_address, s.pool_address());
    }

    if (!watch(client_fd, make_token(id, Side::Client)) ||
        !watch(pool_fd, make_token(id, Side::Pool))) {
        teardown(s, "epoll registration failed");
    }
}

bool RelayServer::watch(int fd, uint64_t token) {
    // Edge-triggered; EPOLLOUT also reports completion of the pool dial
    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLOUT | EPOLLRDHUP | EPOLLET;
    ev.data.u64 = token;
    return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
}

void RelayServer::handle_event(uint64_t token, uint32_t events) {
    auto it = sessions_.find(token_session(token));
    if (it == sessions_.end()) {
        return;  // Torn down earlier in this batch
    }
    Session& session = *it->second;
    Side side = token_side(token);

    // Dialing: first writability (or error) on the pool socket settles the connect
    if (side == Side::Pool && !session.connected()) {
        if (events & (EPOLLOUT | EPOLLERR | EPOLLHUP)) {
            if (auto ec = socket_error(session.fd(Side::Pool)); ec || (events & EPOLLERR)) {
                if (auto* pool = session.pool()) {
                    pool->dial_failures.fetch_add(1, std::memory_order_relaxed);
                }
                metrics_.record_dial_failure();
                teardown(session, ec ? "pool dial failed: " + ec.message() : "pool dial failed");
                return;
            }
            session.mark_connected();
            if (!flush_side(session, Side::Pool)) {
                return;
            }
        }
    }

    if (events & EPOLLERR) {
        teardown(session, fmt::format("{} socket error", side_name(side)));
        return;
    }

    if (events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP)) {
        if (!read_side(session, side)) {
            return;
        }
    }

    if ((events & EPOLLOUT) && (side == Side::Client || session.connected())) {
        (void)flush_side(session, side);
    }
}

bool RelayServer::read_side(Session& session, Side side) {
    char buffer[READ_CHUNK_SIZE];
    int fd = session.fd(side);

    while (true) {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);

        if (n > 0) {
            PipeResult result = session.on_data(side, std::string_view(buffer, static_cast<size_t>(n)));

            if (!result.ok) {
                metrics_.record_invalid_frame();
                if (auto* logger = logging::get_logger()) {
                    std::string_view reason = result.overflow
                                                  ? std::string_view("frame exceeds max_frame_size")
                                                  : stratum::verdict_name(result.verdict);
                    LOG_INVALID_FRAME(logger, side_name(side), session.pool_address(), reason,
                                      session.correlation_id, result.rejected_frame);
                }
                teardown(session, "invalid frame");
                return false;
            }

            if (result.frames_forwarded > 0) {
                metrics_.record_frames(side == Side::Client, result.frames_forwarded,
                                       result.bytes_forwarded);
            }

            // Pool-bound bytes wait for the dial to complete
            Side to = opposite(side);
            if (to == Side::Client || session.connected()) {
                if (!flush_side(session, to)) {
                    return false;
                }
            }
            continue;
        }

        if (n == 0) {
            teardown(session, fmt::format("{} closed connection", side_name(side)));
            return false;
        }

        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;  // Drained (edge-triggered)
        }

        teardown(session, fmt::format("{} read error: {}", side_name(side),
                                      std::error_code(errno, std::system_category()).message()));
        return false;
    }
}

bool RelayServer::flush_side(Session& session, Side to) {
    if (session.outbound(to).empty()) {
        return true;
    }
    if (auto ec = session.flush(to); ec) {
        teardown(session, fmt::format("{} write error: {}", side_name(to), ec.message()));
        return false;
    }
    return true;
}

void RelayServer::teardown(Session& session, std::string_view reason) {
    uint64_t id = session.id();

    // Deregister before close so a reused fd number cannot inherit the interest
    for (Side side : {Side::Client, Side::Pool}) {
        if (int fd = session.fd(side); fd >= 0) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        }
    }

    if (session.teardown()) {
        metrics_.record_connection_close();
        if (auto* logger = logging::get_logger()) {
            LOG_SESSION(logger, "closed", session.correlation_id, session.client_address,
                        session.pool_address());
            LOG_DEBUG(logger, "Session {} teardown reason: {}", session.correlation_id, reason);
        }
    }

    sessions_.erase(id);
    session_count_.store(sessions_.size(), std::memory_order_release);
}

void RelayServer::teardown_all() {
    while (!sessions_.empty()) {
        teardown(*sessions_.begin()->second, "shutdown");
    }
}

}  // namespace sluice::core
