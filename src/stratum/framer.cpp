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

// Sluice Line Framer - Implementation

#include "framer.hpp"

namespace sluice::stratum {

std::vector<std::string> LineFramer::feed(std::string_view chunk) {
    std::vector<std::string> frames;
    if (overflowed_) {
        return frames;
    }

    size_t start = 0;
    while (start <= chunk.size()) {
        size_t pos = chunk.find(FRAME_DELIMITER, start);
        if (pos == std::string_view::npos) {
            break;
        }

        // Complete frame: buffered prefix plus this slice of the chunk
        std::string_view slice = chunk.substr(start, pos - start);
        if (pending_.empty()) {
            frames.emplace_back(slice);
        } else {
            pending_.append(slice);
            frames.push_back(std::move(pending_));
            pending_.clear();
        }
        start = pos + 1;
    }

    pending_.append(chunk.substr(start));

    if (max_frame_size_ != 0 && pending_.size() > max_frame_size_) {
        overflowed_ = true;
        pending_.clear();
    }

    return frames;
}

}  // namespace sluice::stratum
