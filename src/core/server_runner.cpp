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


// Sluice Server Runner - Implementation

#include "server_runner.hpp"

#include "logging.hpp"

namespace sluice::core {

uint32_t resolve_worker_count(uint32_t configured) noexcept {
    if (configured != 0) {
        return configured;
    }
    unsigned int cpus = std::thread::hardware_concurrency();
    return cpus == 0 ? 1 : cpus;
}

RelayRunner::RelayRunner(const control::ServerConfig& config,
                         gateway::PoolRegistry& registry,
                         control::RelayMetrics& metrics)
    : config_(config), registry_(registry), metrics_(metrics) {}

RelayRunner::~RelayRunner() {
    stop();
    (void)wait();
}

std::error_code RelayRunner::start() {
    uint32_t num_workers = resolve_worker_count(static_cast<uint32_t>(config_.worker_threads));

    // Resolve pool hosts here, before any worker runs; workers dial cached addresses
    size_t resolved = registry_.resolve_all();
    if (resolved < registry_.size()) {
        if (auto* logger = logging::get_logger()) {
            LOG_WARNING(logger, "{} of {} pool host(s) did not resolve; dials to them fail "
                        "until the health monitor resolves them",
                        registry_.size() - resolved, registry_.size());
        }
    }

    control::ServerConfig worker_config = config_;
    workers_.reserve(num_workers);

    // Bind every worker first (SO_REUSEPORT)
    for (uint32_t i = 0; i < num_workers; ++i) {
        auto worker = std::make_unique<RelayServer>(worker_config, registry_, metrics_);
        if (auto ec = worker->start(); ec) {
            workers_.clear();
            return ec;
        }

        // Later workers join whatever port the first one got
        if (i == 0) {
            port_ = worker->port();
            worker_config.listen_port = port_;
        }
        workers_.push_back(std::move(worker));
    }

    // Spawn worker threads
    results_.assign(workers_.size(), std::error_code{});
    threads_.reserve(workers_.size());
    for (size_t i = 0; i < workers_.size(); ++i) {
        threads_.emplace_back([this, i]() {
            results_[i] = workers_[i]->run();
        });
    }

    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger, "Relay started with {} worker(s) on port {}", workers_.size(), port_);
    }
    return {};
}

void RelayRunner::stop() noexcept {
    for (auto& worker : workers_) {
        worker->stop();
    }
}

std::error_code RelayRunner::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    for (const auto& ec : results_) {
        if (ec) {
            return ec;
        }
    }
    return {};
}

size_t RelayRunner::session_count() const noexcept {
    size_t total = 0;
    for (const auto& worker : workers_) {
        total += worker->session_count();
    }
    return total;
}

} // namespace sluice::core
