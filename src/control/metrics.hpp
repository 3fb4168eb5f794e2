// Sluice Metrics - Header
// Lock-free relay counters and the snapshot served by the metrics endpoint

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace sluice::gateway {
class PoolRegistry;
}

namespace sluice::control {

/// Per-pool view at a point in time
struct PoolSnapshot {
    std::string host;
    uint16_t port = 0;
    bool healthy = false;
    uint32_t connections = 0;
    uint64_t total_connections = 0;
    uint64_t dial_failures = 0;
};

/// Metrics snapshot at a point in time
struct MetricsSnapshot {
    // Connection metrics
    uint64_t active_connections = 0;    // Client connections currently open
    uint64_t accepted_connections = 0;  // Client connections relayed since start
    uint64_t rejected_connections = 0;  // Refused: no pool configured
    uint64_t dial_failures = 0;

    // Frame metrics
    uint64_t frames_from_client = 0;
    uint64_t frames_from_pool = 0;
    uint64_t invalid_frames = 0;

    // Bandwidth metrics (bytes)
    uint64_t bytes_from_client = 0;
    uint64_t bytes_from_pool = 0;

    std::vector<PoolSnapshot> pools;
};

/// Relay-wide counters shared by all workers (lock-free)
class RelayMetrics {
public:
    RelayMetrics() = default;
    ~RelayMetrics() = default;

    // Non-copyable, non-movable (std::atomic is not movable)
    RelayMetrics(const RelayMetrics&) = delete;
    RelayMetrics& operator=(const RelayMetrics&) = delete;
    RelayMetrics(RelayMetrics&&) = delete;
    RelayMetrics& operator=(RelayMetrics&&) = delete;

    /// Record a new relayed client connection
    void record_connection() noexcept {
        accepted_connections_.fetch_add(1, std::memory_order_relaxed);
        active_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    /// Record a closed relayed client connection
    void record_connection_close() noexcept {
        active_connections_.fetch_sub(1, std::memory_order_relaxed);
    }

    /// Record a client refused for lack of pools
    void record_connection_rejected() noexcept {
        rejected_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_dial_failure() noexcept {
        dial_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_invalid_frame() noexcept {
        invalid_frames_.fetch_add(1, std::memory_order_relaxed);
    }

    /// Record forwarded frames and their total size (terminators included)
    void record_frames(bool from_client, uint64_t frames, uint64_t bytes) noexcept {
        if (from_client) {
            frames_from_client_.fetch_add(frames, std::memory_order_relaxed);
            bytes_from_client_.fetch_add(bytes, std::memory_order_relaxed);
        } else {
            frames_from_pool_.fetch_add(frames, std::memory_order_relaxed);
            bytes_from_pool_.fetch_add(bytes, std::memory_order_relaxed);
        }
    }

    void record_frame(bool from_client, uint64_t bytes) noexcept {
        record_frames(from_client, 1, bytes);
    }

    /// Get current counters (pools left empty)
    [[nodiscard]] MetricsSnapshot snapshot() const noexcept {
        MetricsSnapshot snap;

        snap.active_connections = active_connections_.load(std::memory_order_relaxed);
        snap.accepted_connections = accepted_connections_.load(std::memory_order_relaxed);
        snap.rejected_connections = rejected_connections_.load(std::memory_order_relaxed);
        snap.dial_failures = dial_failures_.load(std::memory_order_relaxed);

        snap.frames_from_client = frames_from_client_.load(std::memory_order_relaxed);
        snap.frames_from_pool = frames_from_pool_.load(std::memory_order_relaxed);
        snap.invalid_frames = invalid_frames_.load(std::memory_order_relaxed);

        snap.bytes_from_client = bytes_from_client_.load(std::memory_order_relaxed);
        snap.bytes_from_pool = bytes_from_pool_.load(std::memory_order_relaxed);

        return snap;
    }

private:
    // Connection counters
    std::atomic<uint64_t> active_connections_{0};
    std::atomic<uint64_t> accepted_connections_{0};
    std::atomic<uint64_t> rejected_connections_{0};
    std::atomic<uint64_t> dial_failures_{0};

    // Frame counters
    std::atomic<uint64_t> frames_from_client_{0};
    std::atomic<uint64_t> frames_from_pool_{0};
    std::atomic<uint64_t> invalid_frames_{0};

    // Bandwidth counters
    std::atomic<uint64_t> bytes_from_client_{0};
    std::atomic<uint64_t> bytes_from_pool_{0};
};

/// Combine relay counters with the current pool states
[[nodiscard]] MetricsSnapshot build_metrics_snapshot(const RelayMetrics& metrics,
                                                    const gateway::PoolRegistry& registry);

/// Render snapshot as the metrics endpoint's JSON body
///   {"totalConnections": N, "pools": [{"host", "port", "healthy", "connections"}], ...}
[[nodiscard]] std::string to_json(const MetricsSnapshot& snapshot);

} // namespace sluice::control
