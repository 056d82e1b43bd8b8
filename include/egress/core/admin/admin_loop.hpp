#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <egress/core/metrics/registry.hpp>
#include <egress/core/service/service.hpp>

namespace Egress {

/**
 * @brief One reporting cycle's view of the node
 */
struct AdminReport {
    double cpu_load_percent = 0.0;
    double idle_cpus = 0.0;
    double pending_cpus = 0.0;
    bool available = false;
    size_t live_jobs = 0;
    size_t retained_jobs = 0;
    std::unordered_map<std::string, MetricSnapshot> per_type;
};

/**
 * Periodic node reporter
 * - Reads CPU and admission state from the service
 * - Reads per-type snapshots from the registry
 * - Logs a report box every interval, at warn level while the node
 *   cannot take the cheapest request type
 */
class Admin {
public:
    Admin(Service& service,
          std::chrono::milliseconds interval,
          MetricRegistry& registry = MetricRegistry::getInstance());
    ~Admin() noexcept;

    void start();
    void stop();

    AdminReport collect() const;

private:
    void loop();
    void reportMetrics(const AdminReport& report);

    Service& service_;
    MetricRegistry& registry_;
    const std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::thread worker_thread_;

    // For interruptible sleep during shutdown
    mutable std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace Egress
