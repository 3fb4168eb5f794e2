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

// Sluice Stratum Validator - Header
// Stateless classification of a single Stratum frame (request or response)

#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string_view>

namespace sluice::stratum {

/// Maximum worker name length accepted in authorize/submit
constexpr size_t MAX_WORKER_NAME_LENGTH = 64;

/// Outcome of frame classification (first failed check wins)
enum class Verdict : uint8_t {
    ValidRequest,
    ValidResponse,
    NotJson,           // Frame does not parse, or parses to a non-object
    MissingId,         // id absent or null
    MissingBody,       // none of method/result/error present
    UnknownMethod,     // method not a string, or not in the supported set
    BadParams,         // params not an array
    BadSubscribe,
    BadAuthorize,
    BadSubmit,
    BadConfigure,
    BadError,          // response error present but not an array
    MissingResult      // response without result
};

/// Supported request methods
enum class Method : uint8_t {
    Subscribe,
    Authorize,
    Configure,
    Submit,
    ExtranonceSubscribe
};

/// Classify a frame (without its line terminator). Never throws.
[[nodiscard]] Verdict classify(std::string_view frame) noexcept;

/// Classify an already-parsed message
[[nodiscard]] Verdict classify(const nlohmann::json& message) noexcept;

/// True when classify() reports a valid request or response
[[nodiscard]] bool validate(std::string_view frame) noexcept;

[[nodiscard]] constexpr bool is_valid(Verdict verdict) noexcept {
    return verdict == Verdict::ValidRequest || verdict == Verdict::ValidResponse;
}

/// Human-readable verdict name (for logs)
[[nodiscard]] std::string_view verdict_name(Verdict verdict) noexcept;

/// Map a method string to the supported set
[[nodiscard]] bool parse_method(std::string_view name, Method& out) noexcept;

// Field-level checks (exposed for tests)

/// Printable ASCII (0x20-0x7E), 1..MAX_WORKER_NAME_LENGTH characters
[[nodiscard]] bool is_valid_worker_name(const nlohmann::json& value) noexcept;

/// Non-empty string of hex digits
[[nodiscard]] bool is_hex_string(const nlohmann::json& value) noexcept;

/// Non-empty, even-length hex string
[[nodiscard]] bool is_even_hex_string(const nlohmann::json& value) noexcept;

/// JSON number greater than zero with no fractional part (4, 4.0 and 1e3 all pass)
[[nodiscard]] bool is_positive_integer(const nlohmann::json& value) noexcept;

}  // namespace sluice::stratum
