#pragma once

#include <egress/core/events/message_bus.hpp>
#include <egress/core/jobs/egress_types.hpp>
#include <egress/core/service/rpc_messages.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace Egress {

/**
 * @class RpcClient
 * @brief Request/reply client for a remote egress node
 *
 * Each call subscribes to a reply topic unique to the request before
 * publishing it, then waits up to the timeout. No reply within the timeout
 * raises EgressError(UNAVAILABLE).
 */
class RpcClient {
public:
    RpcClient(MessageBus& bus,
              std::string request_topic,
              std::string update_topic,
              std::string client_id,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    /**
     * @return The job as admitted, or a failed info with error set
     *         (status ABORTED for a refused start)
     * @throws EgressError(UNAVAILABLE) on timeout
     */
    EgressInfo startEgress(const StartEgressRequest& request);
    EgressInfo stopEgress(const std::string& egress_id);

    /**
     * @throws EgressError carrying the node's error code on failure
     */
    std::vector<EgressInfo> listEgress();

    // Full response, for callers that need the error code
    RpcResponse call(RpcRequest request);

    SubscriptionPtr subscribeUpdates();
    SubscriptionPtr subscribeJob(const std::string& egress_id);

    // Decode one payload read from an update subscription
    static EgressInfo decodeUpdate(const std::string& payload);

private:
    EgressInfo single(RpcRequest request);

    MessageBus& bus_;
    const std::string request_topic_;
    const std::string update_topic_;
    const std::string client_id_;
    const std::chrono::milliseconds timeout_;
    std::atomic<uint64_t> next_request_id_{1};
};

} // namespace Egress
