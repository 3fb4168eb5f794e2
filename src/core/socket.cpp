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

// Sluice Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

namespace sluice::core {

int create_listening_socket(std::string_view address, uint16_t port, int backlog,
                            bool reuse_port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }

    // SO_REUSEADDR - allows binding to same address immediately after restart
    if (auto ec = set_reuseaddr(fd); ec) {
        close_fd(fd);
        return -1;
    }

#ifdef SO_REUSEPORT
    // SO_REUSEPORT - every relay worker binds the same port, kernel spreads accepts
    if (reuse_port) {
        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt)) < 0) {
            close_fd(fd);
            return -1;
        }
    }
#else
    (void)reuse_port;
#endif

    // Bind
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        close_fd(fd);
        return -1;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close_fd(fd);
        return -1;
    }

    // Listen
    if (listen(fd, backlog) < 0) {
        close_fd(fd);
        return -1;
    }

    // Non-blocking
    if (auto ec = set_nonblocking(fd); ec) {
        close_fd(fd);
        return -1;
    }

    return fd;
}

uint16_t local_port(int fd) noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::error_code resolve_ipv4(const std::string& host, uint16_t port, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);

    // Try direct IP first
    if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) {
        return {};
    }

    // DNS resolution (blocking)
    addrinfo hints{};
    addrinfo* result = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return std::make_error_code(std::errc::host_unreachable);
    }

    out = *reinterpret_cast<sockaddr_in*>(result->ai_addr);
    out.sin_port = htons(port);
    freeaddrinfo(result);
    return {};
}

int connect_nonblocking(const sockaddr_in& addr, std::error_code& ec) {
    ec.clear();

    int sockfd = socket(AF_INET, SOCK_STREAM, 0);
    if (sockfd < 0) {
        ec = std::error_code(errno, std::system_category());
        return -1;
    }

    // Make socket non-blocking BEFORE connect
    if (auto err = set_nonblocking(sockfd); err) {
        ec = err;
        close_fd(sockfd);
        return -1;
    }

    // Stratum frames are small and latency-sensitive
    (void)set_nodelay(sockfd);

    // Non-blocking connect - EINPROGRESS is expected
    if (connect(sockfd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            ec = std::error_code(errno, std::system_category());
            close_fd(sockfd);
            return -1;
        }
    }

    return sockfd;
}

std::error_code socket_error(int fd) noexcept {
    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return std::error_code(errno, std::system_category());
    }
    if (err != 0) {
        return std::error_code(err, std::system_category());
    }
    return {};
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return std::error_code(errno, std::system_category());
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::error_code(errno, std::system_category());
    }

    return {};
}

std::error_code set_reuseaddr(int fd) {
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

std::error_code set_nodelay(int fd) {
    int flag = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

}  // namespace sluice::core
