#include <streamrpc/core/metrics/registry.hpp>
#include <spdlog/spdlog.h>

namespace StreamRpc {

MetricRegistry& MetricRegistry::getInstance() {
    static MetricRegistry instance;
    return instance;
}

Metrics& MetricRegistry::getMetrics(std::string_view name) {
    std::lock_guard<std::mutex> lock(mtx_);
    // try_emplace constructs in place; atomics are not copyable
    auto [it, inserted] = metrics_map_.try_emplace(std::string(name));
    return it->second;
}

std::unordered_map<std::string, MetricSnapshot> MetricRegistry::getSnapshots() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::unordered_map<std::string, MetricSnapshot> snaps;
    snaps.reserve(metrics_map_.size());
    for (const auto& [name, m] : metrics_map_) {
        snaps[name] = buildSnapshot(m);
    }
    return snaps;
}

std::optional<MetricSnapshot> MetricRegistry::getSnapshot(std::string_view name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = metrics_map_.find(std::string(name));
    if (it == metrics_map_.end()) return std::nullopt;
    return buildSnapshot(it->second);
}

void MetricRegistry::recordLatency(std::string_view name, uint64_t elapsed_ns) {
    Metrics& m = getMetrics(name);
    m.total_processing_time_ns.fetch_add(elapsed_ns, std::memory_order_relaxed);

    uint64_t prev = m.max_processing_time_ns.load(std::memory_order_relaxed);
    while (elapsed_ns > prev &&
           !m.max_processing_time_ns.compare_exchange_weak(prev, elapsed_ns, std::memory_order_relaxed)) {
    }
}

void MetricRegistry::logSummary() {
    for (const auto& [name, snap] : getSnapshots()) {
        spdlog::info("[Metrics] {}: started={} completed={} failed={} cancelled={} sent={} received={} "
                     "backpressure_waits={} avg_latency={}us max_latency={}us",
                     name, snap.total_calls_started, snap.total_calls_completed,
                     snap.total_calls_failed, snap.total_calls_cancelled,
                     snap.total_messages_sent, snap.total_messages_received,
                     snap.total_backpressure_waits, snap.get_avg_latency_ns() / 1000,
                     snap.max_processing_time_ns / 1000);
    }
}

void MetricRegistry::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& [name, m] : metrics_map_) {
        m.total_calls_started.store(0, std::memory_order_relaxed);
        m.total_calls_completed.store(0, std::memory_order_relaxed);
        m.total_calls_failed.store(0, std::memory_order_relaxed);
        m.total_calls_cancelled.store(0, std::memory_order_relaxed);
        m.total_messages_sent.store(0, std::memory_order_relaxed);
        m.total_messages_received.store(0, std::memory_order_relaxed);
        m.total_backpressure_waits.store(0, std::memory_order_relaxed);
        m.total_processing_time_ns.store(0, std::memory_order_relaxed);
        m.max_processing_time_ns.store(0, std::memory_order_relaxed);
        m.active_calls.store(0, std::memory_order_relaxed);
    }
}

MetricSnapshot MetricRegistry::buildSnapshot(const Metrics& m) {
    MetricSnapshot snap{};
    snap.total_calls_started = m.total_calls_started.load(std::memory_order_relaxed);
    snap.total_calls_completed = m.total_calls_completed.load(std::memory_order_relaxed);
    snap.total_calls_failed = m.total_calls_failed.load(std::memory_order_relaxed);
    snap.total_calls_cancelled = m.total_calls_cancelled.load(std::memory_order_relaxed);
    snap.total_messages_sent = m.total_messages_sent.load(std::memory_order_relaxed);
    snap.total_messages_received = m.total_messages_received.load(std::memory_order_relaxed);
    snap.total_backpressure_waits = m.total_backpressure_waits.load(std::memory_order_relaxed);
    snap.total_processing_time_ns = m.total_processing_time_ns.load(std::memory_order_relaxed);
    snap.max_processing_time_ns = m.max_processing_time_ns.load(std::memory_order_relaxed);
    snap.active_calls = m.active_calls.load(std::memory_order_relaxed);
    return snap;
}

} // namespace StreamRpc
