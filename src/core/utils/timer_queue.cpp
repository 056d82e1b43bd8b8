#include <egress/core/utils/timer_queue.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace Egress {

TimerQueue::TimerQueue() {
    worker_ = std::thread(&TimerQueue::loop, this);
}

TimerQueue::~TimerQueue() noexcept {
    shutdown();
}

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay, Callback fn) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            spdlog::warn("[TimerQueue] schedule() after shutdown, timer dropped");
            return 0;
        }
        id = next_id_++;
        auto deadline = std::chrono::steady_clock::now() + delay;
        timers_.emplace(Key{deadline, id}, std::move(fn));
        deadlines_.emplace(id, deadline);
    }
    cv_.notify_one();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) {
        return false;
    }
    timers_.erase(Key{it->second, id});
    deadlines_.erase(it);
    return true;
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void TimerQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!timers_.empty()) {
        spdlog::debug("[TimerQueue] Discarding {} pending timers", timers_.size());
        timers_.clear();
        deadlines_.clear();
    }
}

void TimerQueue::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
        if (timers_.empty()) {
            cv_.wait(lock, [this]() {
                return !timers_.empty() || !running_.load(std::memory_order_acquire);
            });
            continue;
        }

        auto first = timers_.begin();
        auto deadline = first->first.first;
        if (std::chrono::steady_clock::now() < deadline) {
            // Woken early by a new, earlier timer or by shutdown
            cv_.wait_until(lock, deadline);
            continue;
        }

        Callback fn = std::move(first->second);
        deadlines_.erase(first->first.second);
        timers_.erase(first);

        lock.unlock();
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("[TimerQueue] Timer callback failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace Egress
