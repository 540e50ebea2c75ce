#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <condition_variable>
#include <mutex>

namespace StreamRpc {

/**
 * @brief Fixed-size worker pool running unary and server-stream calls
 * off the transport's callback threads.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @return false if the pool is shut down and the task was not queued
     */
    bool submit(std::function<void()> task);
    size_t getPendingTasks() const;
    size_t size() const { return workers.size(); }

    // Finishes queued tasks, then joins the workers
    void shutdown();
private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;  // mutable for const getPendingTasks
    std::condition_variable condition;
    std::atomic<bool> isRunning;
};

} // namespace StreamRpc
