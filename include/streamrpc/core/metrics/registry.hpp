#pragma once
#include <streamrpc/core/metrics/metrics.hpp>
#include <unordered_map>
#include <string>
#include <string_view>
#include <mutex>
#include <optional>

namespace StreamRpc {

// Compile-time metric names, one per exposed service
namespace MetricNames {
    constexpr std::string_view PAYMENT = "PaymentService";
    constexpr std::string_view HISTORY = "TransactionHistoryService";
    constexpr std::string_view CHAT = "ChatService";
}

class MetricRegistry {
public:
    static MetricRegistry& getInstance();

    Metrics& getMetrics(std::string_view name);
    std::unordered_map<std::string, MetricSnapshot> getSnapshots();
    std::optional<MetricSnapshot> getSnapshot(std::string_view name);

    // Record how long one call took (updates total and max)
    void recordLatency(std::string_view name, uint64_t elapsed_ns);

    void logSummary();

    // Zero every counter; tests share the singleton
    void reset();

private:
    // Metrics hold atomics and never move once inserted
    std::unordered_map<std::string, Metrics> metrics_map_;
    mutable std::mutex mtx_;

    static MetricSnapshot buildSnapshot(const Metrics& m);

    MetricRegistry() = default;
    ~MetricRegistry() = default;
    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;
};

} // namespace StreamRpc
