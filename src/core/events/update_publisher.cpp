#include <egress/core/events/update_publisher.hpp>
#include <egress/core/codec/egress_codec.hpp>
#include <spdlog/spdlog.h>

namespace Egress {

UpdatePublisher::UpdatePublisher(MessageBus& bus, std::string update_topic)
    : bus_(bus), update_topic_(std::move(update_topic)) {
}

void UpdatePublisher::publish(const EgressInfo& info) {
    std::string payload = Codec::encodeEgressInfo(info);
    bus_.publish(update_topic_, payload);
    bus_.publish(jobTopic(update_topic_, info.egress_id), payload);
    total_published_.fetch_add(1, std::memory_order_relaxed);

    spdlog::debug("[UpdatePublisher] {} -> {}", info.egress_id, toString(info.status));
}

SubscriptionPtr UpdatePublisher::subscribeAll() {
    return bus_.subscribe(update_topic_);
}

SubscriptionPtr UpdatePublisher::subscribeJob(const std::string& egress_id) {
    return bus_.subscribe(jobTopic(update_topic_, egress_id));
}

} // namespace Egress
