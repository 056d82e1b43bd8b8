#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <condition_variable>
#include <mutex>

namespace Egress {

/**
 * @brief Fixed-size worker pool, FIFO task order
 *
 * Workers start in the constructor. shutdown() lets queued tasks finish,
 * then joins; submit() after shutdown is refused. shutdown() may be called
 * from several threads at once.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    bool submit(std::function<void()> task);
    size_t getPendingTasks() const;
    void shutdown();
private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;  // mutable for const getPendingTasks
    std::condition_variable condition;
    std::mutex joinMutex;           // serializes shutdown(), guards workers
    std::atomic<bool> isRunning;
};

} // namespace Egress
