#include <egress/core/utils/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace Egress {

ThreadPool::ThreadPool(size_t numThreads) : isRunning(true) {
    if (numThreads == 0) numThreads = 1;
    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
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
    // Concurrent callers wait here; the second finds workers already joined
    std::lock_guard<std::mutex> join_lock(joinMutex);
    if (workers.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        isRunning.store(false, std::memory_order_release);
    }
    condition.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this]() {
                return !tasks.empty() || !isRunning.load(std::memory_order_acquire);
            });
            // Drain remaining work before exiting
            if (tasks.empty()) {
                return;
            }
            task = std::move(tasks.front());
            tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[ThreadPool] Task failed: {}", e.what());
        }
    }
}

} // namespace Egress
