#include <egress/core/admin/admin_loop.hpp>
#include <spdlog/spdlog.h>

namespace Egress {

Admin::Admin(Service& service, std::chrono::milliseconds interval, MetricRegistry& registry)
    : service_(service), registry_(registry), interval_(interval) {
    spdlog::info("[Admin] Initialized");
}

Admin::~Admin() noexcept {
    spdlog::info("[Admin] Shutting down...");
    stop();
}

void Admin::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_thread_ = std::thread(&Admin::loop, this);
    spdlog::info("[Admin] Started report loop (interval: {}ms)", interval_.count());
}

void Admin::stop() {
    running_.store(false, std::memory_order_release);
    sleep_cv_.notify_all();  // Wake up sleeping thread immediately
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::info("[Admin] Stopped");
    }
}

AdminReport Admin::collect() const {
    AdminReport report;
    const auto& admission = service_.admission();
    report.cpu_load_percent = admission.loadPercent();
    report.idle_cpus = admission.idleCpus();
    report.pending_cpus = admission.pendingReservation();
    report.available = registry_.node().available.load(std::memory_order_relaxed);
    report.live_jobs = service_.jobs().liveCount();
    report.retained_jobs = service_.jobs().size();
    report.per_type = registry_.getSnapshots();
    return report;
}

void Admin::loop() {
    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, interval_, [this]() {
                return !running_.load(std::memory_order_acquire);
            });
        }

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        reportMetrics(collect());
    }
}

void Admin::reportMetrics(const AdminReport& report) {
    auto log_level = report.available ? spdlog::level::info : spdlog::level::warn;

    spdlog::log(log_level, "╔════════════════════════════════════════════════════════════╗");
    spdlog::log(log_level, "║              EGRESS NODE REPORT                            ║");
    spdlog::log(log_level, "╠════════════════════════════════════════════════════════════╣");

    uint64_t started = 0;
    uint64_t rejected = 0;
    uint64_t aborted = 0;
    for (const auto& [name, snap] : report.per_type) {
        started += snap.total_started;
        rejected += snap.total_rejected;
        aborted += snap.total_aborted;

        spdlog::log(log_level, "║ {:16} │ Active: {:4} │ Started: {:6} │ Rej: {:5} │ Abrt: {:5} ║",
                    name, snap.active_requests, snap.total_started,
                    snap.total_rejected, snap.total_aborted);
    }

    spdlog::log(log_level, "╠════════════════════════════════════════════════════════════╣");
    spdlog::log(log_level, "║ CPU load: {:5.1f}% │ Idle: {:5.2f} │ Pending: {:5.2f} │ {:11} ║",
                report.cpu_load_percent, report.idle_cpus, report.pending_cpus,
                report.available ? "AVAILABLE" : "UNAVAILABLE");
    spdlog::log(log_level, "║ Jobs: {} live, {} retained │ Total: {} started, {} rejected, {} aborted ║",
                report.live_jobs, report.retained_jobs, started, rejected, aborted);
    spdlog::log(log_level, "╚════════════════════════════════════════════════════════════╝");
}

} // namespace Egress
