#include <egress/core/admission/cpu_sampler.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace Egress {

ProcStatCpuSampler::ProcStatCpuSampler(double num_cpus,
                                       std::chrono::milliseconds interval,
                                       std::string stat_path)
    : num_cpus_(num_cpus), interval_(interval), stat_path_(std::move(stat_path)) {
}

ProcStatCpuSampler::~ProcStatCpuSampler() noexcept {
    stop();
}

void ProcStatCpuSampler::start(IdleCallback callback) {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    callback_ = std::move(callback);
    worker_thread_ = std::thread(&ProcStatCpuSampler::loop, this);
    spdlog::info("[CpuSampler] Started sampling {} every {}ms", stat_path_, interval_.count());
}

void ProcStatCpuSampler::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::info("[CpuSampler] Stopped");
    }
}

std::optional<ProcStatTimes> ProcStatCpuSampler::parse(const std::string& content) {
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        // "cpu " is the aggregate; "cpu0", "cpu1"... are per core
        if (line.rfind("cpu ", 0) != 0) {
            continue;
        }
        std::istringstream fields(line.substr(4));
        ProcStatTimes t;
        if (!(fields >> t.user >> t.nice >> t.system >> t.idle)) {
            return std::nullopt;
        }
        // Older kernels stop after idle
        fields >> t.iowait >> t.irq >> t.softirq >> t.steal;
        return t;
    }
    return std::nullopt;
}

std::optional<double> ProcStatCpuSampler::idleFraction(const ProcStatTimes& prev, const ProcStatTimes& cur) {
    if (cur.total() <= prev.total() || cur.idleTotal() < prev.idleTotal()) {
        return std::nullopt;
    }
    double total = static_cast<double>(cur.total() - prev.total());
    double idle = static_cast<double>(cur.idleTotal() - prev.idleTotal());
    double fraction = idle / total;
    if (fraction > 1.0) fraction = 1.0;
    return fraction;
}

std::optional<ProcStatTimes> ProcStatCpuSampler::readStat() const {
    std::ifstream file(stat_path_);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

void ProcStatCpuSampler::loop() {
    auto prev = readStat();
    if (!prev) {
        spdlog::warn("[CpuSampler] Cannot read {}, idle CPU will not be updated", stat_path_);
    }

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

        auto cur = readStat();
        if (!cur) {
            continue;
        }
        if (prev) {
            if (auto fraction = idleFraction(*prev, *cur)) {
                callback_(*fraction * num_cpus_);
            }
        }
        prev = cur;
    }
}

} // namespace Egress
