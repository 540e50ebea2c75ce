#include <streamrpc/core/utils/thread_pool.hpp>
#include <spdlog/spdlog.h>

namespace StreamRpc {

ThreadPool::ThreadPool(size_t numThreads) : isRunning(true) {
    if (numThreads == 0) {
        numThreads = 1;
    }
    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
    spdlog::info("[ThreadPool] Started {} workers", numThreads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.load(std::memory_order_acquire)) {
            return false;
        }
        tasks.push(std::move(task));
    }
    condition.notify_one();
    return true;
}

size_t ThreadPool::getPendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return tasks.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.exchange(false, std::memory_order_acq_rel) && workers.empty()) {
            return;
        }
    }
    condition.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
    spdlog::info("[ThreadPool] Stopped");
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this] {
                return !isRunning.load(std::memory_order_acquire) || !tasks.empty();
            });
            if (tasks.empty()) {
                return;  // stopped and drained
            }
            task = std::move(tasks.front());
            tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[ThreadPool] Task threw: {}", e.what());
        }
    }
}

} // namespace StreamRpc
