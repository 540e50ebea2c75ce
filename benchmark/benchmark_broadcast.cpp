// ============================================================================
// CHAT BROADCAST BENCHMARK
// ============================================================================
// Fan-out throughput and end-to-end latency of SessionManager::broadcast
// over in-process streams, with and without one slow receiver.
// Usage: ./streamrpc_benchmark [messages] [receivers]

#include <streamrpc/core/chat/session_manager.hpp>
#include <streamrpc/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace StreamRpc;
using namespace std::chrono;

// Produces `total` messages carrying their send time, then half-closes
class SourceStream : public ChatStream {
public:
    explicit SourceStream(size_t total) : total_(total) {}

    ReadStatus read(ChatMessage& out) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return started_ || finished_; });
            if (finished_) return ReadStatus::CANCELLED;
        }
        if (produced_ >= total_) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return finished_; });
            return ReadStatus::CANCELLED;
        }
        ++produced_;
        out.sender = "bench";
        out.text = std::to_string(Clock::now_ns());
        return ReadStatus::MESSAGE;
    }

    bool write(const ChatMessage&) override { return true; }

    void finish(std::optional<ErrorCode>, const std::string&) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        cv_.notify_all();
    }

    std::string peer() const override { return "bench-source"; }

    void start() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            started_ = true;
        }
        cv_.notify_all();
    }

private:
    const size_t total_;
    size_t produced_ = 0;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool started_ = false;
    bool finished_ = false;
};

// Records delivery latency; optionally sleeps per write to simulate a slow client
class SinkStream : public ChatStream {
public:
    SinkStream(size_t expected, microseconds perWriteDelay)
        : expected_(expected), delay_(perWriteDelay) {
        latencies_.reserve(expected);
    }

    ReadStatus read(ChatMessage&) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return finished_; });
        return ReadStatus::CANCELLED;
    }

    bool write(const ChatMessage& message) override {
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        uint64_t sent = std::stoull(message.text);
        std::lock_guard<std::mutex> lock(mutex_);
        latencies_.push_back(Clock::now_ns() - sent);
        if (latencies_.size() >= expected_) {
            cv_.notify_all();
        }
        return !finished_;
    }

    void finish(std::optional<ErrorCode>, const std::string&) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        cv_.notify_all();
    }

    std::string peer() const override { return "bench-sink"; }

    bool waitAll(seconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return latencies_.size() >= expected_; });
    }

    std::vector<uint64_t> latencies() {
        std::lock_guard<std::mutex> lock(mutex_);
        return latencies_;
    }

private:
    const size_t expected_;
    const microseconds delay_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<uint64_t> latencies_;
    bool finished_ = false;
};

static void printPercentiles(const char* label, std::vector<uint64_t> values) {
    if (values.empty()) {
        std::cout << "  " << label << ": no samples\n";
        return;
    }
    std::sort(values.begin(), values.end());
    std::cout << "  " << label << " latency (us): "
              << "p50=" << values[values.size() * 50 / 100] / 1000 << " "
              << "p95=" << values[values.size() * 95 / 100] / 1000 << " "
              << "p99=" << values[values.size() * 99 / 100] / 1000 << "\n";
}

static void runScenario(const char* name, size_t messages, size_t receivers, bool withSlowReceiver) {
    std::cout << "\n--- " << name << " ---\n";

    SessionManager::Options options;
    options.outboundQueueDepth = 64;
    options.maxSessions = receivers + 2;
    options.maxPendingPerSource = messages;
    SessionManager manager(options);

    std::vector<std::shared_ptr<SinkStream>> sinks;
    for (size_t i = 0; i < receivers; ++i) {
        sinks.push_back(std::make_shared<SinkStream>(messages, microseconds(0)));
        manager.admit(sinks.back());
    }
    std::shared_ptr<SinkStream> slow;
    if (withSlowReceiver) {
        slow = std::make_shared<SinkStream>(messages, microseconds(200));
        manager.admit(slow);
    }

    auto source = std::make_shared<SourceStream>(messages);
    manager.admit(source);

    uint64_t start = Clock::now_ns();
    source->start();

    bool complete = true;
    for (auto& sink : sinks) {
        complete = sink->waitAll(seconds(60)) && complete;
    }
    uint64_t fastDone = Clock::now_ns();
    if (slow) {
        complete = slow->waitAll(seconds(120)) && complete;
    }
    uint64_t allDone = Clock::now_ns();

    double fastSec = (fastDone - start) / 1e9;
    auto stats = manager.stats();

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Messages: " << messages << " x " << receivers << " receivers"
              << (slow ? " + 1 slow" : "") << (complete ? "" : " (INCOMPLETE)") << "\n";
    std::cout << "  Fast receivers done in: " << fastSec << " sec ("
              << (messages * receivers / fastSec / 1e3) << "K deliveries/sec)\n";
    if (slow) {
        std::cout << "  Slow receiver done in: " << (allDone - start) / 1e9 << " sec\n";
    }
    std::cout << "  Deferred deliveries: " << stats.backpressureWaits << "\n";

    std::vector<uint64_t> all;
    for (auto& sink : sinks) {
        auto l = sink->latencies();
        all.insert(all.end(), l.begin(), l.end());
    }
    printPercentiles("Fast receivers", all);
    if (slow) {
        printPercentiles("Slow receiver", slow->latencies());
    }

    manager.shutdown();
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    size_t messages = argc > 1 ? std::strtoul(argv[1], nullptr, 10) : 20'000;
    size_t receivers = argc > 2 ? std::strtoul(argv[2], nullptr, 10) : 8;

    std::cout << "===============================================================\n";
    std::cout << "  CHAT BROADCAST BENCHMARK\n";
    std::cout << "===============================================================\n";

    runScenario("All receivers keeping up", messages, receivers, false);
    runScenario("One slow receiver", std::min<size_t>(messages, 2'000), receivers, true);

    std::cout << "\n===============================================================\n";
    std::cout << "  Benchmark complete\n";
    std::cout << "===============================================================\n\n";
    return 0;
}
