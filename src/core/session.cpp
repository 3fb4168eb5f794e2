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


// Sluice Relay Session - Implementation

#include "session.hpp"

#include <sys/socket.h>

#include <cerrno>

#include "socket.hpp"

namespace sluice::core {

Session::Session(uint64_t id,
                 int client_fd,
                 int pool_fd,
                 gateway::PoolLease lease,
                 size_t max_frame_size)
    : id_(id),
      client_fd_(client_fd),
      pool_fd_(pool_fd),
      lease_(std::move(lease)),
      from_client_(max_frame_size),
      from_pool_(max_frame_size) {
    if (auto* p = lease_.pool()) {
        pool_address_ = p->address();
    }
}

Session::~Session() {
    teardown();
}

PipeResult Session::on_data(Side from, std::string_view chunk) {
    PipeResult result;
    if (closed()) {
        return result;
    }

    stratum::LineFramer& framer = from == Side::Client ? from_client_ : from_pool_;
    std::string& out = outbound_buffer(opposite(from));

    auto frames = framer.feed(chunk);

    for (auto& frame : frames) {
        stratum::Verdict verdict = stratum::classify(std::string_view{frame});
        if (!stratum::is_valid(verdict)) {
            result.ok = false;
            result.verdict = verdict;
            result.rejected_frame = std::move(frame);
            return result;
        }

        // Forward byte-identical, re-terminated
        out.append(frame);
        out.push_back(stratum::FRAME_DELIMITER);
        result.frames_forwarded++;
        result.bytes_forwarded += frame.size() + 1;
    }

    // A tail that can never be terminated within the limit is rejected as a whole
    if (framer.overflowed()) {
        result.ok = false;
        result.overflow = true;
        result.verdict = stratum::Verdict::NotJson;
    }

    return result;
}

std::error_code Session::flush(Side to) {
    std::string& out = outbound_buffer(to);
    int fd = this->fd(to);

    size_t written = 0;
    while (written < out.size()) {
        ssize_t n = send(fd, out.data() + written, out.size() - written, MSG_NOSIGNAL);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;  // Kernel buffer full, wait for EPOLLOUT
        }
        out.erase(0, written);
        return std::error_code(n < 0 ? errno : EPIPE, std::system_category());
    }

    out.erase(0, written);
    return {};
}

void Session::mark_connected() noexcept {
    if (state_ == SessionState::Dialing) {
        state_ = SessionState::Piping;
    }
}

bool Session::teardown() noexcept {
    if (state_ == SessionState::Closed) {
        return false;
    }
    state_ = SessionState::Closed;

    close_fd(client_fd_);
    close_fd(pool_fd_);
    client_fd_ = -1;
    pool_fd_ = -1;

    lease_.release();

    to_client_.clear();
    to_pool_.clear();
    from_client_.reset();
    from_pool_.reset();
    return true;
}

}  // namespace sluice::core
