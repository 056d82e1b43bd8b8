#pragma once
#include <egress/core/events/message_bus.hpp>
#include <egress/core/jobs/egress_types.hpp>
#include <atomic>
#include <cstdint>
#include <string>

namespace Egress {

/**
 * @class UpdatePublisher
 * @brief Broadcasts lifecycle transitions as encoded EgressInfo
 *
 * Every transition goes to the global update topic and to the job's own
 * topic (<update_topic>/<egress_id>). There is no replay: a subscriber
 * opened after a transition does not see it. Callers publish while holding
 * the job table lock so per-job order matches apply order.
 */
class UpdatePublisher {
public:
    UpdatePublisher(MessageBus& bus, std::string update_topic);

    void publish(const EgressInfo& info);

    SubscriptionPtr subscribeAll();
    SubscriptionPtr subscribeJob(const std::string& egress_id);

    const std::string& updateTopic() const { return update_topic_; }
    static std::string jobTopic(const std::string& update_topic, const std::string& egress_id) {
        return update_topic + "/" + egress_id;
    }

    uint64_t totalPublished() const { return total_published_.load(std::memory_order_relaxed); }

private:
    MessageBus& bus_;
    const std::string update_topic_;
    std::atomic<uint64_t> total_published_{0};
};

} // namespace Egress
