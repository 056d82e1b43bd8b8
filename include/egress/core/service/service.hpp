#pragma once

#include <egress/core/admission/admission_controller.hpp>
#include <egress/core/admission/cpu_sampler.hpp>
#include <egress/core/events/message_bus.hpp>
#include <egress/core/events/update_publisher.hpp>
#include <egress/core/jobs/job_table.hpp>
#include <egress/core/metrics/registry.hpp>
#include <egress/core/pipeline/pipeline.hpp>
#include <egress/core/utils/timer_queue.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Egress {

struct ServiceOptions {
    std::string node_id = "egress";
    CpuCostConfig cpu_cost;
    double num_cpus = 0.0;      // 0 uses the hardware thread count
    std::string update_topic = "egress_updates";
    std::chrono::milliseconds shutdown_timeout{30000};
    std::chrono::milliseconds terminal_retention{10000};
};

/**
 * @class Service
 * @brief Egress orchestrator for one node
 *
 * Start/Stop/List/Status never wait on pipeline work. Pipeline reports come
 * back through onPipelineStatus(), are checked against the lifecycle by the
 * job table and published while the table lock is held. Terminal jobs stay
 * listed for terminal_retention, then are evicted.
 */
class Service : public PipelineListener {
public:
    Service(ServiceOptions options,
            MessageBus& bus,
            PipelineFactory& factory,
            MetricRegistry& registry = MetricRegistry::getInstance());
    ~Service() noexcept override;

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    /**
     * @brief Validate CPU costs and begin accepting requests
     * @param sampler Optional idle-CPU source; must outlive the service
     * @throws EgressError(CONFIG_ERROR) if the node cannot serve any type
     */
    void start(CpuSampler* sampler = nullptr);

    /**
     * @throws EgressError RESOURCE_EXHAUSTED, UNAVAILABLE or PIPELINE_FAILURE
     *
     * A pipeline whose start() throws is recorded as ABORTED before the
     * PIPELINE_FAILURE is raised.
     */
    EgressInfo startEgress(const StartEgressRequest& request);

    /**
     * @throws EgressError NOT_FOUND or INVALID_STATE
     */
    EgressInfo stopEgress(const std::string& egress_id);

    std::vector<EgressInfo> listEgress() const;
    std::optional<EgressInfo> getEgress(const std::string& egress_id) const;

    // {"<egress id>": {...}, ..., "CpuLoad": <percent>}, live jobs only
    nlohmann::json statusJson() const;
    std::string status() const { return statusJson().dump(); }

    /**
     * @brief Stop accepting and terminate all jobs
     *
     * graceful waits up to shutdown_timeout for jobs to finish by themselves
     * before killing the rest; otherwise kills at once. Safe to call twice.
     */
    void shutdown(bool graceful);

    bool isAccepting() const { return accepting_.load(std::memory_order_acquire); }

    void onPipelineStatus(const std::string& egress_id,
                          EgressStatus status,
                          const std::string& error) override;

    AdmissionController& admission() { return admission_; }
    const AdmissionController& admission() const { return admission_; }
    const JobTable& jobs() const { return jobs_; }
    UpdatePublisher& publisher() { return publisher_; }
    const ServiceOptions& options() const { return options_; }

private:
    static constexpr std::chrono::milliseconds kKillGrace{1000};

    std::string newEgressId() const;
    void onApplied(const EgressInfo& info);
    void scheduleEviction(const std::string& egress_id);
    void evict(const std::string& egress_id);
    void terminateAll();
    void releaseAll();
    void refreshAvailable();

    const ServiceOptions options_;
    PipelineFactory& factory_;
    MetricRegistry& registry_;

    TimerQueue timers_;
    AdmissionController admission_;
    JobTable jobs_;
    UpdatePublisher publisher_;

    CpuSampler* sampler_ = nullptr;
    std::atomic<bool> accepting_{false};
    std::atomic<bool> stopped_{false};
    std::mutex shutdown_mutex_;
    std::shared_mutex start_gate_;
};

} // namespace Egress
