#pragma once
#include <egress/core/events/message_bus.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Egress {

/**
 * @class LocalSubscription
 * @brief Bounded per-subscriber queue fed by LocalBus
 *
 * Overflow drops the oldest message so a stalled reader cannot block
 * publishers. The close hook runs once, on close() or destruction,
 * outside the queue lock.
 */
class LocalSubscription : public Subscription {
public:
    static constexpr size_t DEFAULT_CAPACITY = 4096;
    using CloseHook = std::function<void(const std::string& topic)>;

    LocalSubscription(std::string topic, size_t capacity = DEFAULT_CAPACITY,
                      CloseHook on_close = nullptr);
    ~LocalSubscription() override;

    std::optional<std::string> next(std::chrono::milliseconds timeout) override;
    std::optional<std::string> tryNext() override;
    void close() override;
    bool isClosed() const override { return closed_.load(std::memory_order_acquire); }
    const std::string& topic() const override { return topic_; }

    // Called by LocalBus; false once closed
    bool deliver(const std::string& payload);

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return dq_.size();
    }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    const std::string topic_;
    const size_t capacity_;
    CloseHook on_close_;

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<std::string> dq_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> dropped_{0};
};

/**
 * @class LocalBus
 * @brief In-process broadcast multiplexer
 *
 * Each topic keeps the set of subscriptions currently registered.
 * subscribe()/close() race safely with publish(): a subscription sees only
 * what is published after it is registered. A subscription removes itself
 * when closed or dropped, and a topic with no subscriptions left is erased,
 * so per-request reply topics do not accumulate.
 */
class LocalBus : public MessageBus {
public:
    LocalBus() = default;
    ~LocalBus() override = default;

    void publish(const std::string& topic, const std::string& payload) override;
    SubscriptionPtr subscribe(const std::string& topic) override;

    size_t subscriberCount(const std::string& topic) const;
    // Topics with at least one registered subscription
    size_t topicCount() const;
    uint64_t totalPublished() const { return total_published_.load(std::memory_order_relaxed); }

private:
    using Subscribers = std::vector<std::weak_ptr<LocalSubscription>>;

    // Outlived by subscriptions through weak references in their close hooks
    struct TopicTable {
        mutable std::shared_mutex share_mutex;
        std::unordered_map<std::string, Subscribers> topics;
    };

    static void prune(TopicTable& table, const std::string& topic);

    std::shared_ptr<TopicTable> table_ = std::make_shared<TopicTable>();
    std::atomic<uint64_t> total_published_{0};
};

} // namespace Egress
