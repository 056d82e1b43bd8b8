#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace Egress {

/**
 * @class TimerQueue
 * @brief One-shot timers served by a single worker thread
 *
 * Callbacks run on the worker thread, outside the queue lock, in deadline
 * order. A callback may schedule further timers. Timers still pending at
 * shutdown() are discarded.
 */
class TimerQueue {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;

    TimerQueue();
    ~TimerQueue() noexcept;

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /**
     * @brief Run fn once, delay from now
     * @return Id usable with cancel(), 0 if the queue is shut down
     */
    TimerId schedule(std::chrono::milliseconds delay, Callback fn);

    /**
     * @brief Drop a timer that has not fired yet
     * @return true if the timer was pending
     */
    bool cancel(TimerId id);

    size_t pending() const;
    void shutdown();

private:
    using Deadline = std::chrono::steady_clock::time_point;
    using Key = std::pair<Deadline, TimerId>;

    void loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<Key, Callback> timers_;
    std::unordered_map<TimerId, Deadline> deadlines_;
    TimerId next_id_{1};
    std::atomic<bool> running_{true};
    std::thread worker_;
};

} // namespace Egress
