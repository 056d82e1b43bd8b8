#include <egress/core/service/service.hpp>
#include <egress/core/errors.hpp>
#include <spdlog/spdlog.h>
#include <random>

namespace Egress {

Service::Service(ServiceOptions options,
                 MessageBus& bus,
                 PipelineFactory& factory,
                 MetricRegistry& registry)
    : options_(std::move(options)),
      factory_(factory),
      registry_(registry),
      admission_(timers_, registry),
      publisher_(bus, options_.update_topic) {
    spdlog::info("[Service] Initialized node {}", options_.node_id);
}

Service::~Service() noexcept {
    spdlog::info("[DESTRUCTOR] Service being destroyed...");
    shutdown(false);
    // Pending evictions are dropped; release pipelines while still alive
    timers_.shutdown();
    releaseAll();
    spdlog::info("[DESTRUCTOR] Service destroyed successfully");
}

// ============================================================================
// Lifecycle
// ============================================================================

void Service::start(CpuSampler* sampler) {
    double cpus = options_.num_cpus > 0.0 ? options_.num_cpus : AdmissionController::hardwareCpus();
    admission_.configure(options_.cpu_cost, cpus);

    if (sampler) {
        sampler_ = sampler;
        sampler_->start([this](double idle_cpus) {
            admission_.updateIdle(idle_cpus);
            refreshAvailable();
        });
    }

    accepting_.store(true, std::memory_order_release);
    refreshAvailable();
    spdlog::info("[Service] Accepting requests, cpus={}", cpus);
}

void Service::shutdown(bool graceful) {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    {
        // Starts already past the accepting check finish inserting first
        std::unique_lock<std::shared_mutex> gate(start_gate_);
        accepting_.store(false, std::memory_order_release);
    }
    refreshAvailable();
    if (sampler_) {
        sampler_->stop();
    }

    size_t live = jobs_.liveCount();
    spdlog::info("[Service] Shutting down ({}), {} live jobs", graceful ? "graceful" : "immediate", live);

    if (graceful && live > 0) {
        if (jobs_.waitAllTerminal(options_.shutdown_timeout)) {
            spdlog::info("[Service] All jobs finished");
        } else {
            spdlog::warn("[Service] Shutdown timeout after {}ms, {} jobs still live, terminating",
                         options_.shutdown_timeout.count(), jobs_.liveCount());
        }
    }

    terminateAll();
    spdlog::info("[Service] Shutdown complete");
}

void Service::terminateAll() {
    auto pipelines = jobs_.livePipelines();
    if (pipelines.empty()) {
        return;
    }

    for (auto& [id, pipeline] : pipelines) {
        spdlog::warn("[Service] Killing pipeline {}", id);
        pipeline->kill();
    }

    // Give executors a moment to report ABORTED themselves
    if (jobs_.waitAllTerminal(kKillGrace)) {
        return;
    }

    for (const auto& info : jobs_.live()) {
        auto outcome = jobs_.transition(info.egress_id, EgressStatus::ABORTED, "shutdown",
                                        [this](const EgressInfo& i) { onApplied(i); });
        if (outcome.result == TransitionResult::APPLIED) {
            scheduleEviction(info.egress_id);
        }
    }
}

void Service::releaseAll() {
    // Destroy pipelines outside the table lock: their destructors join threads
    for (const auto& info : jobs_.list()) {
        PipelinePtr pipeline = jobs_.evict(info.egress_id);
        pipeline.reset();
    }
}

// ============================================================================
// Requests
// ============================================================================

EgressInfo Service::startEgress(const StartEgressRequest& request) {
    // Held until the job is in the table and started; shutdown() waits for it
    std::shared_lock<std::shared_mutex> gate(start_gate_);
    if (!isAccepting()) {
        throw EgressError(ErrorCode::UNAVAILABLE, "egress service is not accepting requests");
    }

    RequestKind kind = request.kind();
    if (!admission_.tryReserve(kind)) {
        admission_.jobRejected(kind);
        spdlog::warn("[Service] Rejected {} request for room {}: not enough CPU (available={:.2f}, cost={})",
                     toString(kind), request.room_id, admission_.availableCpus(),
                     admission_.costs().costFor(kind));
        refreshAvailable();
        throw EgressError(ErrorCode::RESOURCE_EXHAUSTED, "not enough CPU for this request");
    }
    refreshAvailable();

    EgressInfo info;
    info.egress_id = newEgressId();
    info.room_id = request.room_id;
    info.kind = kind;
    info.status = EgressStatus::STARTING;

    PipelinePtr pipeline;
    try {
        pipeline = factory_.create(info.egress_id, request, *this);
    } catch (const std::exception& e) {
        spdlog::error("[Service] Failed to create pipeline for {}: {}", info.egress_id, e.what());
        throw EgressError(ErrorCode::PIPELINE_FAILURE, e.what());
    }
    if (!pipeline) {
        throw EgressError(ErrorCode::PIPELINE_FAILURE, "pipeline factory returned no pipeline");
    }

    bool inserted = jobs_.insert(info, pipeline, [this](const EgressInfo& i) {
        admission_.jobStarted(i.kind);
        publisher_.publish(i);
    });
    if (!inserted) {
        throw EgressError(ErrorCode::PIPELINE_FAILURE, "egress id collision");
    }

    spdlog::info("[Service] Started egress {} ({}) for room {}", info.egress_id, toString(kind), info.room_id);
    try {
        pipeline->start();
    } catch (const std::exception& e) {
        spdlog::error("[Service] Failed to start pipeline for {}: {}", info.egress_id, e.what());
        auto outcome = jobs_.transition(info.egress_id, EgressStatus::ABORTED, e.what(),
                                        [this](const EgressInfo& i) { onApplied(i); });
        if (outcome.result == TransitionResult::APPLIED) {
            scheduleEviction(info.egress_id);
        }
        throw EgressError(ErrorCode::PIPELINE_FAILURE, e.what());
    }
    return info;
}

EgressInfo Service::stopEgress(const std::string& egress_id) {
    auto outcome = jobs_.transition(egress_id, EgressStatus::ENDING, "",
                                    [this](const EgressInfo& i) { onApplied(i); });

    switch (outcome.result) {
        case TransitionResult::NOT_FOUND:
            throw EgressError(ErrorCode::NOT_FOUND, "egress " + egress_id + " not found");
        case TransitionResult::REJECTED:
            spdlog::warn("[Service] Stop rejected for {}: already {}", egress_id, toString(outcome.previous));
            throw EgressError(ErrorCode::INVALID_STATE,
                              "egress " + egress_id + " cannot be stopped in state " + toString(outcome.previous));
        case TransitionResult::APPLIED:
            break;
    }

    // Signal outside the table lock; the pipeline reports back through onPipelineStatus
    if (auto pipeline = jobs_.pipeline(egress_id)) {
        pipeline->stop();
    }

    spdlog::info("[Service] Stopping egress {}", egress_id);
    return outcome.info;
}

std::vector<EgressInfo> Service::listEgress() const {
    return jobs_.list();
}

std::optional<EgressInfo> Service::getEgress(const std::string& egress_id) const {
    return jobs_.get(egress_id);
}

nlohmann::json Service::statusJson() const {
    nlohmann::json status = nlohmann::json::object();
    for (const auto& info : jobs_.live()) {
        status[info.egress_id] = {
            {"roomId", info.room_id},
            {"type", metricLabel(info.kind)},
            {"status", toString(info.status)},
            {"startedAt", info.started_at},
        };
    }
    status["CpuLoad"] = admission_.loadPercent();
    return status;
}

// ============================================================================
// Pipeline reports
// ============================================================================

void Service::onPipelineStatus(const std::string& egress_id,
                               EgressStatus status,
                               const std::string& error) {
    auto outcome = jobs_.transition(egress_id, status, error,
                                    [this](const EgressInfo& i) { onApplied(i); });

    switch (outcome.result) {
        case TransitionResult::NOT_FOUND:
            spdlog::warn("[Service] Status {} for unknown egress {}", toString(status), egress_id);
            return;
        case TransitionResult::REJECTED:
            spdlog::warn("[Service] Invalid transition for {}: {} -> {}, dropped",
                         egress_id, toString(outcome.previous), toString(status));
            return;
        case TransitionResult::APPLIED:
            break;
    }

    if (status == EgressStatus::ABORTED) {
        spdlog::error("[Service] Egress {} aborted: {}", egress_id, error);
    } else {
        spdlog::info("[Service] Egress {} is {}", egress_id, toString(status));
    }

    if (JobLifecycle::isTerminal(status)) {
        scheduleEviction(egress_id);
    }
}

void Service::onApplied(const EgressInfo& info) {
    publisher_.publish(info);
    if (JobLifecycle::isTerminal(info.status)) {
        admission_.jobEnded(info.kind, info.status == EgressStatus::ABORTED);
    }
}

// ============================================================================
// Eviction
// ============================================================================

void Service::scheduleEviction(const std::string& egress_id) {
    timers_.schedule(options_.terminal_retention, [this, egress_id]() { evict(egress_id); });
}

void Service::evict(const std::string& egress_id) {
    PipelinePtr pipeline = jobs_.evict(egress_id);
    pipeline.reset();
}

// ============================================================================
// Helpers
// ============================================================================

void Service::refreshAvailable() {
    bool available = isAccepting() && admission_.canAcceptAny();
    registry_.node().available.store(available, std::memory_order_relaxed);
}

std::string Service::newEgressId() const {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(kAlphabet) - 2);

    std::string id = "EG_";
    for (int i = 0; i < 12; ++i) {
        id.push_back(kAlphabet[pick(rng)]);
    }
    return id;
}

} // namespace Egress
