#include <egress/core/service/rpc_client.hpp>
#include <egress/core/codec/egress_codec.hpp>
#include <egress/core/errors.hpp>
#include <egress/core/events/update_publisher.hpp>
#include <egress/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

namespace Egress {

RpcClient::RpcClient(MessageBus& bus,
                     std::string request_topic,
                     std::string update_topic,
                     std::string client_id,
                     std::chrono::milliseconds timeout)
    : bus_(bus),
      request_topic_(std::move(request_topic)),
      update_topic_(std::move(update_topic)),
      client_id_(std::move(client_id)),
      timeout_(timeout) {
}

RpcResponse RpcClient::call(RpcRequest request) {
    request.request_id = client_id_ + "-" + std::to_string(next_request_id_.fetch_add(1, std::memory_order_relaxed));
    request.reply_topic = request_topic_ + "/reply/" + client_id_ + "/" + request.request_id;

    auto reply = bus_.subscribe(request.reply_topic);
    bus_.publish(request_topic_, Codec::encodeRequest(request));

    const uint64_t deadline = Clock::now_ms() + static_cast<uint64_t>(timeout_.count());
    while (true) {
        uint64_t now = Clock::now_ms();
        if (now >= deadline) {
            break;
        }
        auto payload = reply->next(std::chrono::milliseconds(deadline - now));
        if (!payload) {
            continue;
        }

        RpcResponse response;
        try {
            response = Codec::decodeResponse(*payload);
        } catch (const std::exception& e) {
            spdlog::warn("[RpcClient] Ignoring malformed reply on {}: {}", request.reply_topic, e.what());
            continue;
        }
        if (response.request_id != request.request_id) {
            continue;
        }
        reply->close();
        return response;
    }

    reply->close();
    spdlog::warn("[RpcClient] No reply to {} within {}ms", request.request_id, timeout_.count());
    throw EgressError(ErrorCode::UNAVAILABLE, "no response from egress service");
}

EgressInfo RpcClient::single(RpcRequest request) {
    RpcResponse response = call(std::move(request));
    if (!response.items.empty()) {
        EgressInfo info = response.items.front();
        if (response.code != ErrorCode::OK && info.error.empty()) {
            info.error = response.error;
        }
        return info;
    }
    if (response.code != ErrorCode::OK) {
        throw EgressError(response.code, response.error);
    }
    throw EgressError(ErrorCode::MALFORMED, "empty response");
}

EgressInfo RpcClient::startEgress(const StartEgressRequest& request) {
    RpcRequest req;
    req.type = RpcType::START;
    req.start = request;
    return single(std::move(req));
}

EgressInfo RpcClient::stopEgress(const std::string& egress_id) {
    RpcRequest req;
    req.type = RpcType::STOP;
    req.stop.egress_id = egress_id;
    return single(std::move(req));
}

std::vector<EgressInfo> RpcClient::listEgress() {
    RpcRequest req;
    req.type = RpcType::LIST;
    RpcResponse response = call(std::move(req));
    if (response.code != ErrorCode::OK) {
        throw EgressError(response.code, response.error);
    }
    return response.items;
}

SubscriptionPtr RpcClient::subscribeUpdates() {
    return bus_.subscribe(update_topic_);
}

SubscriptionPtr RpcClient::subscribeJob(const std::string& egress_id) {
    return bus_.subscribe(UpdatePublisher::jobTopic(update_topic_, egress_id));
}

EgressInfo RpcClient::decodeUpdate(const std::string& payload) {
    return Codec::decodeEgressInfo(payload);
}

} // namespace Egress
