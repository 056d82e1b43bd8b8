/**
 * @file health_server.hpp
 * @brief Minimal HTTP status endpoint for an egress node
 *
 * GET / answers 200 with the service status JSON. Any other path gets 404,
 * any other method 405. Connections are served one at a time on the accept
 * thread and closed after the response.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace egress::microservice {

class HealthServer {
public:
    using StatusProvider = std::function<std::string()>;

    /**
     * @param port TCP port; 0 binds an ephemeral port (see bound_port())
     */
    HealthServer(int port, StatusProvider provider);
    ~HealthServer() noexcept;

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

    /**
     * @return false if the socket could not be bound
     */
    bool start();
    void stop();

    int bound_port() const { return bound_port_.load(std::memory_order_acquire); }
    uint64_t requests_served() const { return requests_served_.load(std::memory_order_relaxed); }

    /**
     * @brief Build the full HTTP response for one raw request
     */
    std::string respond(const std::string& raw_request) const;

private:
    void accept_loop();
    void handle_client(int client_fd);

    const int port_;
    StatusProvider provider_;

    int server_fd_ = -1;
    std::atomic<int> bound_port_{0};
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::atomic<uint64_t> requests_served_{0};
};

} // namespace egress::microservice
