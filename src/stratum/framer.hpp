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

// Sluice Line Framer - Header
// Incremental reassembly of newline-delimited Stratum frames

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sluice::stratum {

/// Frame terminator on the wire
constexpr char FRAME_DELIMITER = '\n';

/// Default cap on a single unterminated frame (64 KiB)
constexpr size_t DEFAULT_MAX_FRAME_SIZE = 65536;

/// Per-socket, per-direction reassembler
///
/// feed() appends a chunk to the pending tail and returns every complete frame
/// (terminator stripped) in arrival order. The trailing segment, possibly empty,
/// stays pending. A frame split across N chunks is returned exactly once, by the
/// call that delivers its terminator.
class LineFramer {
public:
    /// max_frame_size == 0 disables the overflow check
    explicit LineFramer(size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE)
        : max_frame_size_(max_frame_size) {}

    /// Consume a chunk and return the frames it completes
    [[nodiscard]] std::vector<std::string> feed(std::string_view chunk);

    /// Unterminated tail held for the next feed()
    [[nodiscard]] std::string_view pending() const noexcept { return pending_; }

    /// True once the pending tail grew past max_frame_size
    [[nodiscard]] bool overflowed() const noexcept { return overflowed_; }

    /// Drop buffered state
    void reset() noexcept {
        pending_.clear();
        overflowed_ = false;
    }

private:
    std::string pending_;
    size_t max_frame_size_;
    bool overflowed_ = false;
};

}  // namespace sluice::stratum
