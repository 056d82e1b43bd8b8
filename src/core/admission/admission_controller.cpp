#include <egress/core/admission/admission_controller.hpp>
#include <egress/core/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <thread>

namespace Egress {

AdmissionController::AdmissionController(TimerQueue& timers, MetricRegistry& registry)
    : timers_(timers),
      registry_(registry),
      state_(std::make_shared<AdmissionState>()) {
}

double AdmissionController::hardwareCpus() {
    unsigned n = std::thread::hardware_concurrency();
    return n > 0 ? static_cast<double>(n) : 1.0;
}

int64_t AdmissionController::toMillicores(double cores) {
    return static_cast<int64_t>(std::llround(cores * 1000.0));
}

// ============================================================================
// Configuration
// ============================================================================

void AdmissionController::configure(const CpuCostConfig& costs, double num_cpus) {
    checkCpuConfig(costs, num_cpus);

    costs_ = costs;
    num_cpus_ = num_cpus;
    state_->idle_cpus.store(num_cpus, std::memory_order_release);

    // Register every request type up front; later only values change
    for (auto name : {MetricNames::ROOM_COMPOSITE, MetricNames::WEB,
                      MetricNames::TRACK_COMPOSITE, MetricNames::TRACK}) {
        registry_.getMetrics(name);
    }
    registry_.node().cpu_load.store(0.0, std::memory_order_relaxed);

    spdlog::info("[Admission] Configured: cpus={}, room_composite={}, web={}, track_composite={}, track={}",
                 num_cpus, costs.room_composite_cpu_cost, costs.web_cpu_cost,
                 costs.track_composite_cpu_cost, costs.track_cpu_cost);
}

void AdmissionController::checkCpuConfig(const CpuCostConfig& costs, double num_cpus) const {
    if (costs.room_composite_cpu_cost < CpuCostFloor::ROOM_COMPOSITE) {
        spdlog::warn("[Admission] room composite requirement too low: config value={}, minimum value={}, recommended value={}",
                     costs.room_composite_cpu_cost, CpuCostFloor::ROOM_COMPOSITE,
                     CpuCostFloor::ROOM_COMPOSITE_RECOMMENDED);
    }
    if (costs.web_cpu_cost < CpuCostFloor::WEB) {
        spdlog::warn("[Admission] web requirement too low: config value={}, minimum value={}, recommended value={}",
                     costs.web_cpu_cost, CpuCostFloor::WEB, CpuCostFloor::WEB_RECOMMENDED);
    }
    if (costs.track_composite_cpu_cost < CpuCostFloor::TRACK_COMPOSITE) {
        spdlog::warn("[Admission] track composite requirement too low: config value={}, minimum value={}, recommended value={}",
                     costs.track_composite_cpu_cost, CpuCostFloor::TRACK_COMPOSITE,
                     CpuCostFloor::TRACK_COMPOSITE_RECOMMENDED);
    }
    if (costs.track_cpu_cost < CpuCostFloor::TRACK) {
        spdlog::warn("[Admission] track requirement too low: config value={}, minimum value={}, recommended value={}",
                     costs.track_cpu_cost, CpuCostFloor::TRACK, CpuCostFloor::TRACK_RECOMMENDED);
    }

    std::array<double, kRequestKindCount> requirements = {
        costs.room_composite_cpu_cost,
        costs.web_cpu_cost,
        costs.track_composite_cpu_cost,
        costs.track_cpu_cost,
    };
    std::sort(requirements.begin(), requirements.end());

    double recommended = std::max(requirements[2], 3.0);

    if (num_cpus < requirements[0]) {
        spdlog::error("[Admission] not enough cpu: minimum cpu={}, recommended={}, available={}",
                      requirements[0], recommended, num_cpus);
        throw EgressError(ErrorCode::CONFIG_ERROR, "not enough cpu");
    }

    if (num_cpus < requirements[3]) {
        spdlog::error("[Admission] not enough cpu for some egress types: minimum cpu={}, recommended={}, available={}",
                      requirements[3], recommended, num_cpus);
    }
}

// ============================================================================
// Admission
// ============================================================================

double AdmissionController::pendingReservation() const {
    return static_cast<double>(state_->pending_millicores.load(std::memory_order_acquire)) / 1000.0;
}

bool AdmissionController::canAccept(RequestKind kind) const {
    double available = availableCpus();
    bool accept = available > costs_.costFor(kind);

    spdlog::debug("[Admission] cpu request: type={}, accepted={}, availableCPUs={}, numCPUs={}",
                  toString(kind), accept, available, num_cpus_);
    return accept;
}

bool AdmissionController::canAcceptAny() const {
    double cheapest = std::min({costs_.room_composite_cpu_cost, costs_.web_cpu_cost,
                                costs_.track_composite_cpu_cost, costs_.track_cpu_cost});
    return availableCpus() > cheapest;
}

void AdmissionController::reserve(RequestKind kind) {
    int64_t hold = toMillicores(costs_.costFor(kind));
    state_->pending_millicores.fetch_add(hold, std::memory_order_acq_rel);
    scheduleRelease(hold);
}

bool AdmissionController::tryReserve(RequestKind kind) {
    double cost = costs_.costFor(kind);
    int64_t hold = toMillicores(cost);

    int64_t pending = state_->pending_millicores.load(std::memory_order_acquire);
    for (;;) {
        double available = idleCpus() - static_cast<double>(pending) / 1000.0;
        if (!(available > cost)) {
            spdlog::debug("[Admission] cpu request: type={}, accepted=false, availableCPUs={}, numCPUs={}",
                          toString(kind), available, num_cpus_);
            return false;
        }
        // On failure pending is reloaded and the decision is made again
        if (state_->pending_millicores.compare_exchange_weak(pending, pending + hold,
                                                             std::memory_order_acq_rel,
                                                             std::memory_order_acquire)) {
            spdlog::debug("[Admission] cpu request: type={}, accepted=true, availableCPUs={}, numCPUs={}",
                          toString(kind), available, num_cpus_);
            break;
        }
    }

    scheduleRelease(hold);
    return true;
}

void AdmissionController::scheduleRelease(int64_t hold) {
    std::weak_ptr<AdmissionState> weak = state_;
    auto id = timers_.schedule(kReservationHold, [weak, hold]() {
        if (auto state = weak.lock()) {
            state->pending_millicores.fetch_sub(hold, std::memory_order_acq_rel);
        }
    });
    if (id == 0) {
        // Timers are gone, release now rather than leak the hold
        state_->pending_millicores.fetch_sub(hold, std::memory_order_acq_rel);
    }
}

void AdmissionController::updateIdle(double idle_cpus) {
    state_->idle_cpus.store(idle_cpus, std::memory_order_release);
    if (num_cpus_ > 0.0) {
        registry_.node().cpu_load.store(1.0 - idle_cpus / num_cpus_, std::memory_order_relaxed);
    }
}

double AdmissionController::loadPercent() const {
    if (num_cpus_ <= 0.0) {
        return 0.0;
    }
    return (num_cpus_ - idleCpus()) / num_cpus_ * 100.0;
}

// ============================================================================
// Metrics
// ============================================================================

void AdmissionController::jobStarted(RequestKind kind) {
    auto& m = registry_.getMetrics(kind);
    m.active_requests.fetch_add(1, std::memory_order_relaxed);
    m.total_started.fetch_add(1, std::memory_order_relaxed);
    registry_.touch(kind);
}

void AdmissionController::jobEnded(RequestKind kind, bool aborted) {
    auto& m = registry_.getMetrics(kind);
    m.active_requests.fetch_sub(1, std::memory_order_relaxed);
    m.total_ended.fetch_add(1, std::memory_order_relaxed);
    if (aborted) {
        m.total_aborted.fetch_add(1, std::memory_order_relaxed);
    }
    registry_.touch(kind);
}

void AdmissionController::jobRejected(RequestKind kind) {
    registry_.getMetrics(kind).total_rejected.fetch_add(1, std::memory_order_relaxed);
}

} // namespace Egress
