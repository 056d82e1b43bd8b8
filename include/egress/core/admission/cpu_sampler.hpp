#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace Egress {

/**
 * @brief Periodic source of idle-CPU samples
 *
 * The callback receives idle capacity in cores (idle fraction * cpu count).
 */
class CpuSampler {
public:
    using IdleCallback = std::function<void(double idle_cpus)>;

    virtual ~CpuSampler() = default;
    virtual void start(IdleCallback callback) = 0;
    virtual void stop() = 0;
};

/**
 * Aggregate "cpu" line of /proc/stat, in USER_HZ ticks
 */
struct ProcStatTimes {
    uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0;
    uint64_t irq = 0, softirq = 0, steal = 0;

    uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
    uint64_t idleTotal() const { return idle + iowait; }
};

/**
 * @class ProcStatCpuSampler
 * @brief Samples /proc/stat once per interval on its own thread
 *
 * Idle fraction is the idle share of ticks elapsed between two reads.
 */
class ProcStatCpuSampler : public CpuSampler {
public:
    explicit ProcStatCpuSampler(double num_cpus,
                                std::chrono::milliseconds interval = std::chrono::milliseconds(1000),
                                std::string stat_path = "/proc/stat");
    ~ProcStatCpuSampler() noexcept override;

    void start(IdleCallback callback) override;
    void stop() override;

    /**
     * @brief Parse the aggregate cpu line out of /proc/stat content
     */
    static std::optional<ProcStatTimes> parse(const std::string& content);

    /**
     * @brief Idle fraction (0..1) between two reads, nullopt if no ticks elapsed
     */
    static std::optional<double> idleFraction(const ProcStatTimes& prev, const ProcStatTimes& cur);

private:
    void loop();
    std::optional<ProcStatTimes> readStat() const;

    double num_cpus_;
    std::chrono::milliseconds interval_;
    std::string stat_path_;
    IdleCallback callback_;

    std::atomic<bool> running_{false};
    std::thread worker_thread_;
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace Egress
