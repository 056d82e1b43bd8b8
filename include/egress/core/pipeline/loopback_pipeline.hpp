#pragma once

#include <egress/core/pipeline/pipeline.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace Egress {

struct LoopbackOptions {
    std::chrono::milliseconds startup_delay{500};
    std::chrono::milliseconds shutdown_delay{200};
    // 0 runs until stopped
    std::chrono::milliseconds max_duration{0};
};

/**
 * @class LoopbackPipeline
 * @brief Stand-in executor that produces no media
 *
 * Reports ACTIVE after startup_delay, COMPLETE shutdown_delay after stop(),
 * ABORTED on kill(). With max_duration set it ends by itself, reporting
 * ENDING then COMPLETE.
 */
class LoopbackPipeline : public Pipeline {
public:
    LoopbackPipeline(std::string egress_id, PipelineListener& listener, LoopbackOptions options);
    ~LoopbackPipeline() noexcept override;

    void start() override;
    void stop() override;
    void kill() override;

private:
    enum class Signal : uint8_t { NONE, STOP, KILL };

    void run();
    // Sleeps up to d; returns the signal that interrupted it, NONE on timeout
    Signal waitFor(std::chrono::milliseconds d);
    void report(EgressStatus status, const std::string& error = "");

    const std::string egress_id_;
    PipelineListener& listener_;
    const LoopbackOptions options_;

    std::mutex mutex_;
    std::condition_variable cv_;
    Signal signal_ = Signal::NONE;
    std::atomic<bool> started_{false};
    std::thread worker_thread_;
};

class LoopbackPipelineFactory : public PipelineFactory {
public:
    explicit LoopbackPipelineFactory(LoopbackOptions options = {}) : options_(options) {}

    PipelinePtr create(const std::string& egress_id,
                       const StartEgressRequest& request,
                       PipelineListener& listener) override;

private:
    LoopbackOptions options_;
};

} // namespace Egress
