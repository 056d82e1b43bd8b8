#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace Egress {

/**
 * @class Subscription
 * @brief Readable stream of payloads published on one topic
 *
 * Only messages published while the subscription is open are delivered,
 * in publish order. close() is idempotent; reads after close return nullopt.
 */
class Subscription {
public:
    virtual ~Subscription() = default;

    virtual std::optional<std::string> next(std::chrono::milliseconds timeout) = 0;
    virtual std::optional<std::string> tryNext() = 0;
    virtual void close() = 0;
    virtual bool isClosed() const = 0;
    virtual const std::string& topic() const = 0;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * @class MessageBus
 * @brief Topic-based publish/subscribe transport
 *
 * publish() never blocks on slow subscribers.
 */
class MessageBus {
public:
    virtual ~MessageBus() = default;

    virtual void publish(const std::string& topic, const std::string& payload) = 0;
    virtual SubscriptionPtr subscribe(const std::string& topic) = 0;
};

} // namespace Egress
