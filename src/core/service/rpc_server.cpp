#include <egress/core/service/rpc_server.hpp>
#include <egress/core/codec/egress_codec.hpp>
#include <egress/core/errors.hpp>
#include <spdlog/spdlog.h>

namespace Egress {

namespace {
constexpr std::chrono::milliseconds kPollInterval{100};
}

RpcServer::RpcServer(MessageBus& bus, Service& service, std::string request_topic, size_t handler_threads)
    : bus_(bus),
      service_(service),
      request_topic_(std::move(request_topic)),
      handler_threads_(handler_threads == 0 ? 1 : handler_threads) {
}

RpcServer::~RpcServer() noexcept {
    spdlog::info("[DESTRUCTOR] RpcServer being destroyed...");
    stop();
    spdlog::info("[DESTRUCTOR] RpcServer destroyed successfully");
}

void RpcServer::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    // Subscribe before the listener runs so nothing published after start() is missed
    subscription_ = bus_.subscribe(request_topic_);
    pool_ = std::make_unique<ThreadPool>(handler_threads_);
    listener_thread_ = std::thread(&RpcServer::listenLoop, this);
    spdlog::info("[RpcServer] Listening on '{}' with {} handler threads", request_topic_, handler_threads_);
}

void RpcServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    if (subscription_) {
        subscription_->close();
    }
    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
    // Let in-flight requests reply
    if (pool_) {
        pool_->shutdown();
    }
    spdlog::info("[RpcServer] Stopped. Handled: {}, malformed: {}",
                 handled_.load(), malformed_.load());
}

void RpcServer::listenLoop() {
    while (running_.load(std::memory_order_acquire)) {
        auto payload = subscription_->next(kPollInterval);
        if (!payload) {
            if (subscription_->isClosed()) {
                break;
            }
            continue;
        }

        auto data = std::make_shared<std::string>(std::move(*payload));
        if (!pool_->submit([this, data]() { dispatch(*data); })) {
            spdlog::warn("[RpcServer] Handler pool closed, dropping request");
        }
    }
}

void RpcServer::dispatch(const std::string& payload) {
    RpcRequest request;
    try {
        request = Codec::decodeRequest(payload);
    } catch (const std::exception& e) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[RpcServer] Dropping malformed request ({} bytes): {}", payload.size(), e.what());
        return;
    }

    RpcResponse response = handle(request);
    if (request.reply_topic.empty()) {
        return;
    }
    bus_.publish(request.reply_topic, Codec::encodeResponse(response));
}

RpcResponse RpcServer::handle(const RpcRequest& request) {
    RpcResponse response;
    response.request_id = request.request_id;
    handled_.fetch_add(1, std::memory_order_relaxed);

    try {
        switch (request.type) {
            case RpcType::START:
                response.items.push_back(service_.startEgress(request.start));
                break;
            case RpcType::STOP:
                response.items.push_back(service_.stopEgress(request.stop.egress_id));
                break;
            case RpcType::LIST:
                response.items = service_.listEgress();
                break;
        }
    } catch (const EgressError& e) {
        response.code = e.code();
        response.error = e.what();

        if (request.type == RpcType::START) {
            // Failed starts still answer with the shape of the job that was refused
            EgressInfo info;
            info.room_id = request.start.room_id;
            info.kind = request.start.kind();
            info.status = EgressStatus::ABORTED;
            info.error = e.what();
            response.items.push_back(std::move(info));
        } else if (request.type == RpcType::STOP) {
            EgressInfo info = service_.getEgress(request.stop.egress_id).value_or(EgressInfo{});
            info.egress_id = request.stop.egress_id;
            info.error = e.what();
            response.items.push_back(std::move(info));
        }
        spdlog::debug("[RpcServer] Request {} failed: {} ({})",
                      request.request_id, e.what(), EgressError::codeString(e.code()));
    } catch (const std::exception& e) {
        response.code = ErrorCode::UNAVAILABLE;
        response.error = e.what();
        response.items.clear();
        spdlog::error("[RpcServer] Request {} failed unexpectedly: {}", request.request_id, e.what());
    }

    return response;
}

} // namespace Egress
