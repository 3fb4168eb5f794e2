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

// Sluice Pool Registry - Header
// Upstream mining pools, their shared health/connection state, and failover selection

#pragma once

#include <netinet/in.h>

#include <atomic>
#include <cstdint>
#include <string>
#include <system_error>
#include <string_view>
#include <utility>
#include <vector>

namespace sluice::gateway {

/// Upstream pool endpoint
///
/// host/port are fixed after construction. healthy and active_connections are
/// written by relay workers and the health monitor concurrently, so they are atomics.
///
/// Relay workers dial the cached IPv4 address and never resolve host themselves;
/// the cache is filled by refresh_address() off the event loop.
struct Pool {
    std::string host;
    uint16_t port = 0;

    std::atomic<bool> healthy{true};
    std::atomic<uint32_t> active_connections{0};

    // Resolved IPv4 address, network byte order (0 = not resolved yet)
    std::atomic<uint32_t> cached_ipv4{0};

    // Statistics
    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> dial_failures{0};

    Pool() = default;
    /// IPv4 literals are cached immediately; DNS names wait for refresh_address()
    Pool(std::string h, uint16_t p);

    // Movable while the registry is being populated (atomics copied by value)
    Pool(Pool&& other) noexcept
        : host(std::move(other.host)),
          port(other.port),
          healthy(other.healthy.load()),
          active_connections(other.active_connections.load()),
          cached_ipv4(other.cached_ipv4.load()),
          total_connections(other.total_connections.load()),
          dial_failures(other.dial_failures.load()) {}

    Pool& operator=(Pool&& other) noexcept {
        if (this != &other) {
            host = std::move(other.host);
            port = other.port;
            healthy.store(other.healthy.load());
            active_connections.store(other.active_connections.load());
            cached_ipv4.store(other.cached_ipv4.load());
            total_connections.store(other.total_connections.load());
            dial_failures.store(other.dial_failures.load());
        }
        return *this;
    }

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    [[nodiscard]] bool is_healthy() const noexcept {
        return healthy.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t connections() const noexcept {
        return active_connections.load(std::memory_order_acquire);
    }

    /// Store new health state, returns previous state
    bool set_healthy(bool value) noexcept {
        return healthy.exchange(value, std::memory_order_acq_rel);
    }

    [[nodiscard]] std::string address() const { return host + ":" + std::to_string(port); }

    /// Resolve host (blocking) and cache the result; on failure the previous
    /// address, if any, stays cached
    std::error_code refresh_address();

    /// Cached dial target; false until a resolution has succeeded
    [[nodiscard]] bool resolved_address(sockaddr_in& out) const noexcept;
};

/// Ordered set of configured pools
///
/// Order is the configured order and is the failover priority.
/// Populate with add_pool() before handing the registry to workers; entries are
/// never added or removed afterwards, so Pool pointers stay valid for its lifetime.
class PoolRegistry {
public:
    PoolRegistry() = default;
    ~PoolRegistry() = default;

    // Non-copyable, non-movable (workers hold Pool pointers)
    PoolRegistry(const PoolRegistry&) = delete;
    PoolRegistry& operator=(const PoolRegistry&) = delete;

    void add_pool(std::string host, uint16_t port);

    /// refresh_address() on every pool; returns how many have an address cached
    size_t resolve_all();

    [[nodiscard]] bool empty() const noexcept { return pools_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return pools_.size(); }

    [[nodiscard]] Pool& at(size_t index) { return pools_.at(index); }
    [[nodiscard]] const Pool& at(size_t index) const { return pools_.at(index); }

    [[nodiscard]] std::vector<Pool>& pools() noexcept { return pools_; }
    [[nodiscard]] const std::vector<Pool>& pools() const noexcept { return pools_; }

    [[nodiscard]] size_t healthy_count() const noexcept;

    /// Sum of active connections across pools
    [[nodiscard]] uint64_t total_active_connections() const noexcept;

private:
    std::vector<Pool> pools_;
};

/// Ordered failover: first healthy pool in registry order, else the first pool.
/// Returns nullptr only for an empty registry.
class PoolSelector {
public:
    explicit PoolSelector(PoolRegistry& registry) : registry_(registry) {}

    [[nodiscard]] Pool* select() const noexcept;

private:
    PoolRegistry& registry_;
};

/// Counts one relayed connection against a pool
///
/// Increments active_connections on acquire and decrements exactly once, on the
/// first release() or on destruction, whichever comes first.
class PoolLease {
public:
    PoolLease() = default;
    explicit PoolLease(Pool& pool) noexcept;
    ~PoolLease() { release(); }

    PoolLease(PoolLease&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
    PoolLease& operator=(PoolLease&& other) noexcept;

    PoolLease(const PoolLease&) = delete;
    PoolLease& operator=(const PoolLease&) = delete;

    /// Decrement the pool's connection count (no-op after the first call)
    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return pool_ != nullptr; }
    [[nodiscard]] Pool* pool() const noexcept { return pool_; }

private:
    Pool* pool_ = nullptr;
};

}  // namespace sluice::gateway
