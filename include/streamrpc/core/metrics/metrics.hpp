#pragma once
#include <atomic>
#include <cstdint>

namespace StreamRpc {

/**
 * @brief Per-service counters
 *
 * All counters are lock-free atomics updated with relaxed ordering.
 */
struct Metrics {
    // Call lifecycle
    std::atomic<uint64_t> total_calls_started{0};
    std::atomic<uint64_t> total_calls_completed{0};
    std::atomic<uint64_t> total_calls_failed{0};
    std::atomic<uint64_t> total_calls_cancelled{0};

    // Streaming
    std::atomic<uint64_t> total_messages_sent{0};        // frames written to clients
    std::atomic<uint64_t> total_messages_received{0};    // frames read from clients
    std::atomic<uint64_t> total_backpressure_waits{0};   // producer suspended on a full path

    // Latency (nanoseconds)
    std::atomic<uint64_t> total_processing_time_ns{0};
    std::atomic<uint64_t> max_processing_time_ns{0};

    std::atomic<uint64_t> active_calls{0};
};

/**
 * Non-atomic copy of Metrics for logging and tests
 */
struct MetricSnapshot {
    uint64_t total_calls_started;
    uint64_t total_calls_completed;
    uint64_t total_calls_failed;
    uint64_t total_calls_cancelled;
    uint64_t total_messages_sent;
    uint64_t total_messages_received;
    uint64_t total_backpressure_waits;
    uint64_t total_processing_time_ns;
    uint64_t max_processing_time_ns;
    uint64_t active_calls;

    uint64_t get_avg_latency_ns() const {
        uint64_t finished = total_calls_completed + total_calls_failed + total_calls_cancelled;
        return finished > 0 ? total_processing_time_ns / finished : 0;
    }
};

} // namespace StreamRpc
