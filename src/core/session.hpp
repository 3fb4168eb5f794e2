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


// Sluice Relay Session - Header
// One client connection paired with one pool connection

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "../gateway/pool.hpp"
#include "../stratum/framer.hpp"
#include "../stratum/validator.hpp"

namespace sluice::core {

/// Endpoint of a session
enum class Side : uint8_t {
    Client = 0,
    Pool = 1
};

[[nodiscard]] constexpr Side opposite(Side side) noexcept {
    return side == Side::Client ? Side::Pool : Side::Client;
}

[[nodiscard]] constexpr std::string_view side_name(Side side) noexcept {
    return side == Side::Client ? "client" : "pool";
}

/// Session state
enum class SessionState : uint8_t {
    Dialing,    // Pool connect in progress, client frames queue up
    Piping,     // Both ends connected
    Closed      // Torn down
};

/// Outcome of feeding one received chunk through the pipeline
struct PipeResult {
    bool ok = true;
    size_t frames_forwarded = 0;
    size_t bytes_forwarded = 0;   // Including appended delimiters

    // Set when ok == false
    stratum::Verdict verdict = stratum::Verdict::ValidRequest;
    bool overflow = false;
    std::string rejected_frame;
};

/// Client/pool connection pair
///
/// All methods are called from the owning worker thread only. The lease taken at
/// creation is released exactly once, by the first teardown() or by destruction.
class Session {
public:
    Session(uint64_t id,
            int client_fd,
            int pool_fd,
            gateway::PoolLease lease,
            size_t max_frame_size = stratum::DEFAULT_MAX_FRAME_SIZE);
    ~Session();

    // Non-copyable, non-movable (relay keys it by id)
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Reassemble and validate a chunk received from `from`
    ///
    /// Every valid frame is queued, with a single delimiter appended, on the
    /// opposite side's outbound buffer. Stops at the first invalid frame; frames
    /// after it in the same chunk are neither validated nor forwarded.
    [[nodiscard]] PipeResult on_data(Side from, std::string_view chunk);

    /// Write as much of `to`'s outbound buffer as the socket accepts
    /// (EAGAIN leaves the remainder queued; other errors are returned)
    [[nodiscard]] std::error_code flush(Side to);

    /// Mark the pool connect complete
    void mark_connected() noexcept;

    /// Close both sockets and release the pool lease.
    /// Returns false if the session was already torn down.
    bool teardown() noexcept;

    // Accessors
    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] int fd(Side side) const noexcept {
        return side == Side::Client ? client_fd_ : pool_fd_;
    }
    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] bool connected() const noexcept { return state_ == SessionState::Piping; }
    [[nodiscard]] bool closed() const noexcept { return state_ == SessionState::Closed; }
    [[nodiscard]] const std::string& outbound(Side to) const noexcept {
        return to == Side::Client ? to_client_ : to_pool_;
    }
    [[nodiscard]] gateway::Pool* pool() const noexcept { return lease_.pool(); }
    [[nodiscard]] std::string_view pool_address() const noexcept { return pool_address_; }

    // Logging context
    std::string correlation_id;
    std::string client_address;

private:
    [[nodiscard]] std::string& outbound_buffer(Side to) noexcept {
        return to == Side::Client ? to_client_ : to_pool_;
    }

    uint64_t id_;
    int client_fd_;
    int pool_fd_;
    gateway::PoolLease lease_;
    std::string pool_address_;
    SessionState state_ = SessionState::Dialing;

    // One reassembler per receiving socket
    stratum::LineFramer from_client_;
    stratum::LineFramer from_pool_;

    // Validated bytes waiting for the destination socket to accept them
    std::string to_client_;
    std::string to_pool_;
};

}  // namespace sluice::core
