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

// Sluice Pool Registry - Implementation

#include "pool.hpp"

#include <arpa/inet.h>

#include <algorithm>

#include "../core/socket.hpp"

namespace sluice::gateway {

// Pool implementation

Pool::Pool(std::string h, uint16_t p) : host(std::move(h)), port(p) {
    in_addr literal{};
    if (inet_pton(AF_INET, host.c_str(), &literal) == 1) {
        cached_ipv4.store(literal.s_addr, std::memory_order_release);
    }
}

std::error_code Pool::refresh_address() {
    sockaddr_in addr{};
    if (auto ec = core::resolve_ipv4(host, port, addr); ec) {
        return ec;
    }
    cached_ipv4.store(addr.sin_addr.s_addr, std::memory_order_release);
    return {};
}

bool Pool::resolved_address(sockaddr_in& out) const noexcept {
    uint32_t ip = cached_ipv4.load(std::memory_order_acquire);
    if (ip == 0) {
        return false;
    }
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_addr.s_addr = ip;
    out.sin_port = htons(port);
    return true;
}

// PoolRegistry implementation

void PoolRegistry::add_pool(std::string host, uint16_t port) {
    pools_.emplace_back(std::move(host), port);
}

size_t PoolRegistry::resolve_all() {
    size_t resolved = 0;
    for (auto& pool : pools_) {
        sockaddr_in addr{};
        if (!pool.refresh_address() || pool.resolved_address(addr)) {
            resolved++;
        }
    }
    return resolved;
}

size_t PoolRegistry::healthy_count() const noexcept {
    return std::count_if(pools_.begin(), pools_.end(),
        [](const Pool& p) { return p.is_healthy(); });
}

uint64_t PoolRegistry::total_active_connections() const noexcept {
    uint64_t total = 0;
    for (const auto& pool : pools_) {
        total += pool.connections();
    }
    return total;
}

// PoolSelector implementation

Pool* PoolSelector::select() const noexcept {
    auto& pools = registry_.pools();
    if (pools.empty()) {
        return nullptr;
    }

    for (auto& pool : pools) {
        if (pool.is_healthy()) {
            return &pool;
        }
    }

    // Nothing healthy: last-resort fallback to the highest-priority pool
    return &pools.front();
}

// PoolLease implementation

PoolLease::PoolLease(Pool& pool) noexcept : pool_(&pool) {
    pool_->active_connections.fetch_add(1, std::memory_order_acq_rel);
    pool_->total_connections.fetch_add(1, std::memory_order_relaxed);
}

PoolLease& PoolLease::operator=(PoolLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        other.pool_ = nullptr;
    }
    return *this;
}

void PoolLease::release() noexcept {
    if (pool_ != nullptr) {
        pool_->active_connections.fetch_sub(1, std::memory_order_acq_rel);
        pool_ = nullptr;
    }
}

}  // namespace sluice::gateway
