#pragma once

#include <egress/core/events/message_bus.hpp>
#include <egress/core/service/rpc_messages.hpp>
#include <egress/core/service/service.hpp>
#include <egress/core/utils/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace Egress {

/**
 * @class RpcServer
 * @brief Serves Start/Stop/List requests arriving on the request topic
 *
 * One listener thread reads the request subscription and hands each message
 * to the handler pool, so a slow request never holds up the next one.
 * Undecodable requests are logged and dropped (there is no reply topic to
 * answer on).
 */
class RpcServer {
public:
    RpcServer(MessageBus& bus, Service& service, std::string request_topic, size_t handler_threads);
    ~RpcServer() noexcept;

    RpcServer(const RpcServer&) = delete;
    RpcServer& operator=(const RpcServer&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    uint64_t handledCount() const { return handled_.load(std::memory_order_relaxed); }
    uint64_t malformedCount() const { return malformed_.load(std::memory_order_relaxed); }

    // Exposed for tests; runs the request synchronously
    RpcResponse handle(const RpcRequest& request);

private:
    void listenLoop();
    void dispatch(const std::string& payload);

    MessageBus& bus_;
    Service& service_;
    const std::string request_topic_;
    const size_t handler_threads_;

    SubscriptionPtr subscription_;
    std::unique_ptr<ThreadPool> pool_;
    std::thread listener_thread_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> handled_{0};
    std::atomic<uint64_t> malformed_{0};
};

} // namespace Egress
