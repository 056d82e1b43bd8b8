#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <egress/core/admission/cpu_cost.hpp>
#include <egress/core/metrics/registry.hpp>
#include <egress/core/utils/timer_queue.hpp>

namespace Egress {

/**
 * @brief Mutable admission counters, one instance per controller
 *
 * Shared with the release timers so a timer firing after the controller is
 * gone still has a valid cell to subtract from.
 */
struct AdmissionState {
    std::atomic<double> idle_cpus{0.0};
    // Fixed-point so that add/sub of the same amount cancels exactly
    std::atomic<int64_t> pending_millicores{0};
};

/**
 * @class AdmissionController
 * @brief CPU-cost admission for new egress requests
 *
 * available = idle - pending; a request is admitted when available is
 * strictly greater than its cost. reserve() holds the cost as pending for a
 * fixed kReservationHold, covering the window before the sampler sees the
 * new pipeline's real usage. The release is unconditional and is not tied
 * to the job's outcome.
 *
 * idle is written by the sampler only; pending is updated by reserve(),
 * tryReserve() and their timers with atomic operations, so no lock is taken
 * on either path.
 */
class AdmissionController {
public:
    static constexpr std::chrono::milliseconds kReservationHold{1000};

    explicit AdmissionController(TimerQueue& timers,
                                 MetricRegistry& registry = MetricRegistry::getInstance());
    ~AdmissionController() = default;

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    /**
     * @brief Validate costs against the CPU count and adopt them
     * @throws EgressError(CONFIG_ERROR) when num_cpus is below every cost
     *
     * Idle CPU starts at num_cpus until the first sample arrives.
     */
    void configure(const CpuCostConfig& costs, double num_cpus);

    // Advisory only, no side effect
    bool canAccept(RequestKind kind) const;

    void reserve(RequestKind kind);

    /**
     * @brief canAccept() and reserve() as one step
     *
     * The pending hold is claimed with compare-and-swap against the same
     * pending value the decision was made on, so concurrent callers can never
     * admit more than the available CPU covers between them.
     * @return false (nothing reserved) when the request does not fit
     */
    bool tryReserve(RequestKind kind);

    // Sampler callback, idle_cpus in cores
    void updateIdle(double idle_cpus);

    double loadPercent() const;

    double numCpus() const { return num_cpus_; }
    double idleCpus() const { return state_->idle_cpus.load(std::memory_order_acquire); }
    double pendingReservation() const;
    double availableCpus() const { return idleCpus() - pendingReservation(); }
    const CpuCostConfig& costs() const { return costs_; }

    /**
     * @brief true when at least the cheapest request type fits right now
     */
    bool canAcceptAny() const;

    // Observability only, no effect on admission math
    void jobStarted(RequestKind kind);
    void jobEnded(RequestKind kind, bool aborted);
    void jobRejected(RequestKind kind);

    static double hardwareCpus();

private:
    static int64_t toMillicores(double cores);
    void scheduleRelease(int64_t hold);
    void checkCpuConfig(const CpuCostConfig& costs, double num_cpus) const;

    TimerQueue& timers_;
    MetricRegistry& registry_;

    CpuCostConfig costs_;
    double num_cpus_ = 0.0;

    std::shared_ptr<AdmissionState> state_;
};

} // namespace Egress
