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

// Sluice Configuration - Implementation

#include "config.hpp"

#include <fstream>
#include <sstream>

namespace sluice::control {

namespace {

constexpr int64_t MAX_PORT = 65535;
constexpr int64_t MAX_WORKER_THREADS = 1024;
constexpr uint32_t MAX_LOG_FILE_SIZE_MB = 1024 * 1024;  // 1 TiB

bool is_valid_port(int64_t port) noexcept {
    return port >= 1 && port <= MAX_PORT;
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path,
                                                   ValidationResult* result) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        if (result) {
            result->add_error("Cannot open configuration file '" + path_str + "'");
        }
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json, result);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json,
                                                   ValidationResult* result) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        if (result) {
            result->add_error(std::string("JSON parsing error: ") + e.what());
        }
        return std::nullopt;
    }

    auto validation = validate(config);
    bool failed = validation.has_errors();
    if (result) {
        *result = std::move(validation);
    }

    if (failed) {
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Validate server configuration
    if (!is_valid_port(config.server.listen_port)) {
        result.add_error("Server listen_port must be in 1..65535, got " +
                         std::to_string(config.server.listen_port));
    }

    if (config.server.worker_threads < 0 || config.server.worker_threads > MAX_WORKER_THREADS) {
        result.add_error("Server worker_threads must be in 0..1024 (0 = one per CPU), got " +
                         std::to_string(config.server.worker_threads));
    }

    if (config.server.backlog == 0) {
        result.add_error("Server backlog must be > 0");
    }

    if (config.server.max_frame_size == 0) {
        result.add_error("Server max_frame_size must be > 0");
    }

    // Validate pools
    if (config.pools.empty()) {
        result.add_warning("No pools configured (every client will be refused)");
    }

    for (size_t i = 0; i < config.pools.size(); ++i) {
        const auto& pool = config.pools[i];
        if (pool.host.empty()) {
            result.add_error("Pool #" + std::to_string(i) + " host cannot be empty");
        }

        if (!is_valid_port(pool.port)) {
            result.add_error("Pool '" + pool.host + "' port must be in 1..65535, got " +
                             std::to_string(pool.port));
        }

        for (size_t k = 0; k < i; ++k) {
            if (config.pools[k].host == pool.host && config.pools[k].port == pool.port) {
                result.add_warning("Pool '" + pool.host + ":" + std::to_string(pool.port) +
                                   "' is listed more than once");
                break;
            }
        }
    }

    // Validate health checks
    if (config.health_check.enabled) {
        if (config.health_check.interval == 0) {
            result.add_error("Health check interval must be > 0");
        }
        if (config.health_check.timeout == 0) {
            result.add_error("Health check timeout must be > 0");
        }
        if (config.health_check.timeout >= config.health_check.interval &&
            config.health_check.interval != 0) {
            result.add_warning("Health check timeout >= interval, probes may overlap ticks");
        }
    }

    // Validate logging level
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    // Validate logging format
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    if (config.logging.rotation.max_size_mb == 0 ||
        config.logging.rotation.max_size_mb > MAX_LOG_FILE_SIZE_MB) {
        result.add_error("Logging rotation max_size_mb must be in 1..1048576");
    }

    if (config.logging.file.empty()) {
        result.add_error("Logging file name cannot be empty");
    }

    // Validate metrics endpoint
    if (config.metrics.enabled) {
        if (!is_valid_port(config.metrics.port)) {
            result.add_error("Metrics port must be in 1..65535, got " +
                             std::to_string(config.metrics.port));
        }
        if (config.metrics.port == config.server.listen_port) {
            result.add_error("Metrics port conflicts with relay listen_port");
        }
        if (config.metrics.path.empty() || config.metrics.path.front() != '/') {
            result.add_error("Metrics path must start with '/'");
        }
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    nlohmann::json j = config;
    return j.dump(2);
}

}  // namespace sluice::control
