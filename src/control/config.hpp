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

// Sluice Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../stratum/framer.hpp"

namespace sluice::control {

/// Relay listener settings
// Ports and worker_threads stay wide until ConfigLoader::validate range-checks them
struct ServerConfig {
    int64_t worker_threads = 1;  // 0 = auto-detect CPU count

    std::string listen_address = "0.0.0.0";
    int64_t listen_port = 3333;
    uint32_t backlog = 128;

    // Longest unterminated frame accepted from either side
    uint32_t max_frame_size = static_cast<uint32_t>(stratum::DEFAULT_MAX_FRAME_SIZE);
};

/// Upstream pool endpoint (order = failover priority)
struct PoolConfig {
    std::string host;
    int64_t port = 3333;
};

/// Background pool probing
struct HealthCheckConfig {
    bool enabled = true;
    uint32_t interval = 30;  // seconds
    uint32_t timeout = 5;    // seconds
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";      // debug, info, warning, error
    std::string format = "json";     // json, text
    std::string output = "logs";     // Log directory
    std::string file = "proxy.log";  // File name inside output

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Metrics endpoint configuration
struct MetricsConfig {
    bool enabled = true;
    std::string listen_address = "127.0.0.1";
    int64_t port = 3000;
    std::string path = "/metrics";
};

/// Full Sluice configuration
struct Config {
    ServerConfig server;
    std::vector<PoolConfig> pools;
    HealthCheckConfig health_check;

    // Observability
    LogConfig logging;
    MetricsConfig metrics;
};

// Custom from_json/to_json so that every field is optional with a default

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.worker_threads = j.value("worker_threads", int64_t(1));
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", int64_t(3333));
    s.backlog = j.value("backlog", 128u);
    s.max_frame_size =
        j.value("max_frame_size", static_cast<uint32_t>(stratum::DEFAULT_MAX_FRAME_SIZE));
}

inline void from_json(const nlohmann::json& j, PoolConfig& p) {
    p.host = j.value("host", std::string());
    p.port = j.value("port", int64_t(3333));
}

inline void from_json(const nlohmann::json& j, HealthCheckConfig& h) {
    h.enabled = j.value("enabled", true);
    h.interval = j.value("interval", 30u);
    h.timeout = j.value("timeout", 5u);
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("logs"));
    l.file = j.value("file", std::string("proxy.log"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, MetricsConfig& m) {
    m.enabled = j.value("enabled", true);
    m.listen_address = j.value("listen_address", std::string("127.0.0.1"));
    m.port = j.value("port", int64_t(3000));
    m.path = j.value("path", std::string("/metrics"));
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get_to() for nested structs
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("pools")) {
        j.at("pools").get_to(c.pools);
    }
    if (j.contains("health_check")) {
        j.at("health_check").get_to(c.health_check);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("metrics")) {
        j.at("metrics").get_to(c.metrics);
    }

    // Flat legacy keys: {"pools": [...], "proxyPort": 3333, "metricsPort": 3000}
    if (j.contains("proxyPort")) {
        j.at("proxyPort").get_to(c.server.listen_port);
    }
    if (j.contains("metricsPort")) {
        j.at("metricsPort").get_to(c.metrics.port);
    }
}

// ============================================================================
// to_json functions
// ============================================================================

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"worker_threads", s.worker_threads},
                       {"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"max_frame_size", s.max_frame_size}};
}

inline void to_json(nlohmann::json& j, const PoolConfig& p) {
    j = nlohmann::json{{"host", p.host}, {"port", p.port}};
}

inline void to_json(nlohmann::json& j, const HealthCheckConfig& h) {
    j = nlohmann::json{{"enabled", h.enabled}, {"interval", h.interval}, {"timeout", h.timeout}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"file", l.file},
                       {"rotation",
                        {{"max_size_mb", l.rotation.max_size_mb},
                         {"max_files", l.rotation.max_files}}}};
}

inline void to_json(nlohmann::json& j, const MetricsConfig& m) {
    j = nlohmann::json{{"enabled", m.enabled},
                       {"listen_address", m.listen_address},
                       {"port", m.port},
                       {"path", m.path}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["server"] = c.server;
    j["pools"] = c.pools;
    j["health_check"] = c.health_check;
    j["logging"] = c.logging;
    j["metrics"] = c.metrics;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path,
                                                              ValidationResult* result = nullptr);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json,
                                                              ValidationResult* result = nullptr);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace sluice::control
