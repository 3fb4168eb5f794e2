// Sluice Socket Utilities - Header

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include <netinet/in.h>

namespace sluice::core {

/// Create non-blocking listening socket (port 0 = ephemeral)
[[nodiscard]] int create_listening_socket(
    std::string_view address,
    uint16_t port,
    int backlog = 128,
    bool reuse_port = true);

/// Port actually bound by a listening socket (0 on error)
[[nodiscard]] uint16_t local_port(int fd) noexcept;

/// Resolve host (dotted IPv4 or DNS name) to an IPv4 address
[[nodiscard]] std::error_code resolve_ipv4(const std::string& host, uint16_t port,
                                           sockaddr_in& out);

/// Start a non-blocking connect; returns fd in connecting state, or -1
[[nodiscard]] int connect_nonblocking(const sockaddr_in& addr, std::error_code& ec);

/// Pending error of a socket whose non-blocking connect finished
[[nodiscard]] std::error_code socket_error(int fd) noexcept;

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_reuseaddr(int fd);
[[nodiscard]] std::error_code set_nodelay(int fd);

void close_fd(int fd);

} // namespace sluice::core
