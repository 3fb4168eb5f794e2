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

// Sluice Metrics - Implementation

#include "metrics.hpp"

#include <nlohmann/json.hpp>

#include "../gateway/pool.hpp"

namespace sluice::control {

MetricsSnapshot build_metrics_snapshot(const RelayMetrics& metrics,
                                      const gateway::PoolRegistry& registry) {
    MetricsSnapshot snap = metrics.snapshot();

    snap.pools.reserve(registry.size());
    for (const auto& pool : registry.pools()) {
        PoolSnapshot ps;
        ps.host = pool.host;
        ps.port = pool.port;
        ps.healthy = pool.is_healthy();
        ps.connections = pool.connections();
        ps.total_connections = pool.total_connections.load(std::memory_order_relaxed);
        ps.dial_failures = pool.dial_failures.load(std::memory_order_relaxed);
        snap.pools.push_back(std::move(ps));
    }

    return snap;
}

std::string to_json(const MetricsSnapshot& snapshot) {
    nlohmann::json pools = nlohmann::json::array();
    for (const auto& pool : snapshot.pools) {
        pools.push_back({{"host", pool.host},
                         {"port", pool.port},
                         {"healthy", pool.healthy},
                         {"connections", pool.connections},
                         {"totalConnections", pool.total_connections},
                         {"dialFailures", pool.dial_failures}});
    }

    nlohmann::json body = {
        {"totalConnections", snapshot.active_connections},
        {"acceptedConnections", snapshot.accepted_connections},
        {"rejectedConnections", snapshot.rejected_connections},
        {"dialFailures", snapshot.dial_failures},
        {"frames",
         {{"fromClient", snapshot.frames_from_client},
          {"fromPool", snapshot.frames_from_pool},
          {"invalid", snapshot.invalid_frames}}},
        {"bytes", {{"fromClient", snapshot.bytes_from_client}, {"fromPool", snapshot.bytes_from_pool}}},
        {"pools", std::move(pools)},
    };

    return body.dump();
}

}  // namespace sluice::control
