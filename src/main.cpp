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

// Sluice Stratum Relay - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>

#include "control/config.hpp"
#include "control/health.hpp"
#include "control/metrics.hpp"
#include "core/admin_server.hpp"
#include "core/logging.hpp"
#include "core/server_runner.hpp"
#include "gateway/pool.hpp"

namespace {
std::atomic<bool> g_server_running{true};

void print_validation(const sluice::control::ValidationResult& validation) {
    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    if (!validation.warnings.empty()) {
        fprintf(stderr, "Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            fprintf(stderr, "  - %s\n", warning.c_str());
        }
    }
}
}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_server_running.store(false);
    }
}

int main(int argc, char* argv[]) {
    printf("Sluice Stratum Relay v0.1.0\n");
    printf("Transparent validating relay for Stratum mining pools\n\n");

    std::string config_path = "config.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            fprintf(stderr, "Usage: %s [--config <config.json>]\n", argv[0]);
            return EXIT_FAILURE;
        }
    }

    printf("Loading configuration from %s...\n", config_path.c_str());
    sluice::control::ValidationResult validation;
    auto config_opt = sluice::control::ConfigLoader::load_from_file(config_path, &validation);
    print_validation(validation);
    if (!config_opt) {
        fprintf(stderr, "Failed to load configuration\n");
        return EXIT_FAILURE;
    }
    const sluice::control::Config& config = *config_opt;

    // Logging
    sluice::logging::init_logging_system();
    quill::Logger* logger = nullptr;
    try {
        logger = sluice::logging::init_logger(config.logging);
    } catch (const std::exception& e) {
        // Log directory not creatable or sink file not openable
        fprintf(stderr, "Cannot open log file in '%s': %s\n", config.logging.output.c_str(),
                e.what());
        sluice::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    // Pools, in configured order (failover priority)
    sluice::gateway::PoolRegistry registry;
    for (const auto& pool : config.pools) {
        registry.add_pool(pool.host, static_cast<uint16_t>(pool.port));
    }
    sluice::control::RelayMetrics metrics;

    LOG_INFO(logger, "Starting relay with {} pool(s)", registry.size());

    // Health monitor
    std::unique_ptr<sluice::control::HealthMonitor> health_monitor;
    if (config.health_check.enabled && !registry.empty()) {
        health_monitor =
            std::make_unique<sluice::control::HealthMonitor>(registry, config.health_check);
        health_monitor->start();
    }

    // Admin server (metrics + health)
    std::unique_ptr<sluice::core::AdminServer> admin_server;
    std::thread admin_thread;
    if (config.metrics.enabled) {
        admin_server =
            std::make_unique<sluice::core::AdminServer>(config.metrics, registry, metrics);
        if (auto ec = admin_server->start(); ec) {
            fprintf(stderr, "Failed to start metrics server on %s:%u: %s\n",
                    config.metrics.listen_address.c_str(),
                    static_cast<unsigned>(config.metrics.port),
                    ec.message().c_str());
            LOG_ERROR(logger, "Failed to start metrics server: {}", ec.message());
            sluice::logging::shutdown_logging();
            return EXIT_FAILURE;
        }
        admin_thread = std::thread([&admin_server]() { admin_server->run(); });
        printf("Metrics available on %s:%u%s\n", config.metrics.listen_address.c_str(),
               admin_server->port(), config.metrics.path.c_str());
    }

    // Relay workers
    sluice::core::RelayRunner relay(config.server, registry, metrics);
    if (auto ec = relay.start(); ec) {
        fprintf(stderr, "Failed to listen on %s:%u: %s\n", config.server.listen_address.c_str(),
                static_cast<unsigned>(config.server.listen_port), ec.message().c_str());
        LOG_ERROR(logger, "Failed to start relay: {}", ec.message());
        if (admin_server) {
            admin_server->stop();
            admin_thread.join();
        }
        sluice::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    printf("Listening on %s:%u with %zu worker thread(s)\n",
           config.server.listen_address.c_str(), relay.port(), relay.worker_count());

    // Install signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
    std::signal(SIGPIPE, SIG_IGN);

    while (g_server_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    printf("\nReceived shutdown signal, stopping...\n");
    LOG_INFO(logger, "Shutting down");

    // Reverse order of startup
    relay.stop();
    std::error_code relay_ec = relay.wait();
    if (relay_ec) {
        LOG_ERROR(logger, "Relay worker error: {}", relay_ec.message());
    }

    if (admin_server) {
        admin_server->stop();
        admin_thread.join();
    }

    if (health_monitor) {
        health_monitor->stop();
    }

    sluice::logging::shutdown_logging();
    printf("Sluice stopped.\n");
    return relay_ec ? EXIT_FAILURE : EXIT_SUCCESS;
}
