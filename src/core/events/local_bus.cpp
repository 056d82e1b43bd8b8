#include <egress/core/events/local_bus.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace Egress {

// ============================================================================
// LocalSubscription
// ============================================================================

LocalSubscription::LocalSubscription(std::string topic, size_t capacity, CloseHook on_close)
    : topic_(std::move(topic)),
      capacity_(capacity == 0 ? 1 : capacity),
      on_close_(std::move(on_close)) {
}

LocalSubscription::~LocalSubscription() {
    close();
}

bool LocalSubscription::deliver(const std::string& payload) {
    {
        std::lock_guard<std::mutex> lock(m_);
        if (closed_.load(std::memory_order_acquire)) {
            return false;
        }
        if (dq_.size() >= capacity_) {
            dq_.pop_front();
            dropped_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("[LocalBus] Subscriber on {} is {} messages behind, dropped oldest",
                         topic_, capacity_);
        }
        dq_.push_back(payload);
    }
    cv_.notify_one();
    return true;
}

std::optional<std::string> LocalSubscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_);
    if (!cv_.wait_for(lock, timeout, [this] {
            return !dq_.empty() || closed_.load(std::memory_order_acquire);
        })) {
        return std::nullopt;
    }
    if (dq_.empty()) {
        return std::nullopt;
    }
    std::string payload = std::move(dq_.front());
    dq_.pop_front();
    return payload;
}

std::optional<std::string> LocalSubscription::tryNext() {
    std::lock_guard<std::mutex> lock(m_);
    if (dq_.empty()) {
        return std::nullopt;
    }
    std::string payload = std::move(dq_.front());
    dq_.pop_front();
    return payload;
}

void LocalSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(m_);
        if (closed_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        dq_.clear();
    }
    cv_.notify_all();
    if (on_close_) {
        on_close_(topic_);
    }
}

// ============================================================================
// LocalBus
// ============================================================================

void LocalBus::publish(const std::string& topic, const std::string& payload) {
    // Strong refs are released after the lock: a last ref runs the close hook
    std::vector<std::shared_ptr<LocalSubscription>> targets;
    bool needs_prune = false;
    {
        std::shared_lock<std::shared_mutex> lock(table_->share_mutex);
        auto it = table_->topics.find(topic);
        if (it != table_->topics.end()) {
            targets.reserve(it->second.size());
            for (const auto& weak : it->second) {
                auto sub = weak.lock();
                if (!sub || !sub->deliver(payload)) {
                    needs_prune = true;
                }
                if (sub) {
                    targets.push_back(std::move(sub));
                }
            }
        }
    }
    total_published_.fetch_add(1, std::memory_order_relaxed);
    targets.clear();

    if (needs_prune) {
        prune(*table_, topic);
    }
}

void LocalBus::prune(TopicTable& table, const std::string& topic) {
    std::vector<std::shared_ptr<LocalSubscription>> released;    // destroyed after the lock
    std::unique_lock<std::shared_mutex> lock(table.share_mutex);
    auto it = table.topics.find(topic);
    if (it == table.topics.end()) {
        return;
    }
    auto& subs = it->second;
    subs.erase(std::remove_if(subs.begin(), subs.end(), [&released](const std::weak_ptr<LocalSubscription>& w) {
        auto sub = w.lock();
        bool dead = !sub || sub->isClosed();
        if (sub) {
            released.push_back(std::move(sub));
        }
        return dead;
    }), subs.end());
    if (subs.empty()) {
        table.topics.erase(it);
    }
}

SubscriptionPtr LocalBus::subscribe(const std::string& topic) {
    std::weak_ptr<TopicTable> weak_table = table_;
    auto sub = std::make_shared<LocalSubscription>(topic, LocalSubscription::DEFAULT_CAPACITY,
        [weak_table](const std::string& t) {
            if (auto table = weak_table.lock()) {
                prune(*table, t);
            }
        });
    {
        std::unique_lock<std::shared_mutex> lock(table_->share_mutex);
        table_->topics[topic].push_back(sub);
    }
    spdlog::debug("[LocalBus] New subscription on {}", topic);
    return sub;
}

size_t LocalBus::subscriberCount(const std::string& topic) const {
    std::vector<std::shared_ptr<LocalSubscription>> live;
    {
        std::shared_lock<std::shared_mutex> lock(table_->share_mutex);
        auto it = table_->topics.find(topic);
        if (it == table_->topics.end()) {
            return 0;
        }
        for (const auto& weak : it->second) {
            if (auto sub = weak.lock()) {
                live.push_back(std::move(sub));
            }
        }
    }
    return static_cast<size_t>(std::count_if(live.begin(), live.end(),
        [](const std::shared_ptr<LocalSubscription>& sub) { return !sub->isClosed(); }));
}

size_t LocalBus::topicCount() const {
    std::shared_lock<std::shared_mutex> lock(table_->share_mutex);
    return table_->topics.size();
}

} // namespace Egress
