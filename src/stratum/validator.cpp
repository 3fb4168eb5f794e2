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

// Sluice Stratum Validator - Implementation

#include "validator.hpp"

#include <array>
#include <cmath>
#include <string>
#include <utility>

namespace sluice::stratum {

namespace {

constexpr std::array<std::pair<std::string_view, Method>, 5> kMethods{{
    {"mining.subscribe", Method::Subscribe},
    {"mining.authorize", Method::Authorize},
    {"mining.configure", Method::Configure},
    {"mining.submit", Method::Submit},
    {"mining.extranonce.subscribe", Method::ExtranonceSubscribe},
}};

constexpr bool is_hex_digit(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// id must be present; null, false and "" count as absent, 0 does not
bool has_id(const nlohmann::json& message) {
    auto it = message.find("id");
    if (it == message.end() || it->is_null()) {
        return false;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        return !it->get_ref<const std::string&>().empty();
    }
    return true;
}

bool has_method(const nlohmann::json& message) {
    auto it = message.find("method");
    return it != message.end() && !it->is_null();
}

Verdict classify_request(const nlohmann::json& message) {
    const auto& method_value = message["method"];
    if (!method_value.is_string()) {
        return Verdict::UnknownMethod;
    }

    Method method;
    if (!parse_method(method_value.get_ref<const std::string&>(), method)) {
        return Verdict::UnknownMethod;
    }

    auto params_it = message.find("params");
    if (params_it == message.end() || !params_it->is_array()) {
        return Verdict::BadParams;
    }
    const auto& params = *params_it;

    switch (method) {
        case Method::Subscribe:
            if (params.size() < 2) {
                return Verdict::BadSubscribe;
            }
            break;

        case Method::Authorize:
            if (params.size() < 2 || !is_valid_worker_name(params[0]) || !params[1].is_string()) {
                return Verdict::BadAuthorize;
            }
            break;

        case Method::Submit:
            if (params.size() < 5 || !is_valid_worker_name(params[0]) ||
                !params[1].is_string() || !is_even_hex_string(params[2]) ||
                !is_even_hex_string(params[3]) || !is_even_hex_string(params[4])) {
                return Verdict::BadSubmit;
            }
            break;

        case Method::Configure:
            // params[1] carries the requested difficulty
            if (params.size() < 2 || !is_positive_integer(params[1])) {
                return Verdict::BadConfigure;
            }
            break;

        case Method::ExtranonceSubscribe:
            break;
    }

    return Verdict::ValidRequest;
}

Verdict classify_response(const nlohmann::json& message) {
    auto error_it = message.find("error");
    if (error_it != message.end() && !error_it->is_null() && !error_it->is_array()) {
        return Verdict::BadError;
    }

    // "result": null is an explicit value and passes
    if (!message.contains("result")) {
        return Verdict::MissingResult;
    }

    return Verdict::ValidResponse;
}

}  // namespace

bool parse_method(std::string_view name, Method& out) noexcept {
    for (const auto& [method_name, method] : kMethods) {
        if (method_name == name) {
            out = method;
            return true;
        }
    }
    return false;
}

bool is_valid_worker_name(const nlohmann::json& value) noexcept {
    if (!value.is_string()) {
        return false;
    }

    const auto& name = value.get_ref<const std::string&>();
    if (name.empty() || name.size() > MAX_WORKER_NAME_LENGTH) {
        return false;
    }

    for (char c : name) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte > 0x7E) {
            return false;
        }
    }
    return true;
}

bool is_hex_string(const nlohmann::json& value) noexcept {
    if (!value.is_string()) {
        return false;
    }

    const auto& text = value.get_ref<const std::string&>();
    if (text.empty()) {
        return false;
    }

    for (char c : text) {
        if (!is_hex_digit(c)) {
            return false;
        }
    }
    return true;
}

bool is_even_hex_string(const nlohmann::json& value) noexcept {
    return is_hex_string(value) && value.get_ref<const std::string&>().size() % 2 == 0;
}

bool is_positive_integer(const nlohmann::json& value) noexcept {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>() > 0;
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>() > 0;
    }
    // Integral values written in float notation (4.0, 1e3)
    if (value.is_number_float()) {
        double d = value.get<double>();
        return std::isfinite(d) && d > 0 && d == std::trunc(d);
    }
    return false;
}

Verdict classify(const nlohmann::json& message) noexcept {
    try {
        if (!message.is_object()) {
            return Verdict::NotJson;
        }

        if (!has_id(message)) {
            return Verdict::MissingId;
        }

        bool request = has_method(message);
        if (!request && !message.contains("result") && !message.contains("error")) {
            return Verdict::MissingBody;
        }

        return request ? classify_request(message) : classify_response(message);
    } catch (const nlohmann::json::exception&) {
        // Type mismatch on a field we did not expect to be malformed
        return Verdict::NotJson;
    }
}

Verdict classify(std::string_view frame) noexcept {
    // Parse without exceptions: a malformed frame yields a discarded value
    auto message = nlohmann::json::parse(frame, nullptr, false);
    if (message.is_discarded()) {
        return Verdict::NotJson;
    }
    return classify(message);
}

bool validate(std::string_view frame) noexcept {
    return is_valid(classify(frame));
}

std::string_view verdict_name(Verdict verdict) noexcept {
    switch (verdict) {
        case Verdict::ValidRequest:
            return "valid_request";
        case Verdict::ValidResponse:
            return "valid_response";
        case Verdict::NotJson:
            return "not_json";
        case Verdict::MissingId:
            return "missing_id";
        case Verdict::MissingBody:
            return "missing_method_result_error";
        case Verdict::UnknownMethod:
            return "unknown_method";
        case Verdict::BadParams:
            return "bad_params";
        case Verdict::BadSubscribe:
            return "bad_subscribe";
        case Verdict::BadAuthorize:
            return "bad_authorize";
        case Verdict::BadSubmit:
            return "bad_submit";
        case Verdict::BadConfigure:
            return "bad_configure";
        case Verdict::BadError:
            return "bad_error";
        case Verdict::MissingResult:
            return "missing_result";
    }
    return "unknown";
}

}  // namespace sluice::stratum
