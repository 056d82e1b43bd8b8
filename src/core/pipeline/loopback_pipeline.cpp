#include <egress/core/pipeline/loopback_pipeline.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace Egress {

LoopbackPipeline::LoopbackPipeline(std::string egress_id, PipelineListener& listener, LoopbackOptions options)
    : egress_id_(std::move(egress_id)), listener_(listener), options_(options) {
}

LoopbackPipeline::~LoopbackPipeline() noexcept {
    kill();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void LoopbackPipeline::start() {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_thread_ = std::thread(&LoopbackPipeline::run, this);
}

void LoopbackPipeline::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (signal_ == Signal::NONE) {
            signal_ = Signal::STOP;
        }
    }
    cv_.notify_all();
}

void LoopbackPipeline::kill() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        signal_ = Signal::KILL;
    }
    cv_.notify_all();
}

LoopbackPipeline::Signal LoopbackPipeline::waitFor(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (d.count() == 0) {
        cv_.wait(lock, [this]() { return signal_ != Signal::NONE; });
    } else {
        cv_.wait_for(lock, d, [this]() { return signal_ != Signal::NONE; });
    }
    return signal_;
}

void LoopbackPipeline::report(EgressStatus status, const std::string& error) {
    listener_.onPipelineStatus(egress_id_, status, error);
}

void LoopbackPipeline::run() {
    try {
        Signal sig = waitFor(options_.startup_delay);
        if (sig == Signal::KILL) {
            report(EgressStatus::ABORTED, "pipeline killed");
            return;
        }
        if (sig == Signal::NONE) {
            report(EgressStatus::ACTIVE);
            sig = waitFor(options_.max_duration);
            if (sig == Signal::KILL) {
                report(EgressStatus::ABORTED, "pipeline killed");
                return;
            }
            if (sig == Signal::NONE) {
                spdlog::info("[Loopback] {} reached max duration", egress_id_);
                report(EgressStatus::ENDING);
            }
        }

        // Finishing output; a kill here still aborts
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, options_.shutdown_delay, [this]() { return signal_ == Signal::KILL; });
            if (signal_ == Signal::KILL) {
                lock.unlock();
                report(EgressStatus::ABORTED, "pipeline killed");
                return;
            }
        }
        report(EgressStatus::COMPLETE);
    } catch (const std::exception& e) {
        spdlog::error("[Loopback] {} failed: {}", egress_id_, e.what());
        report(EgressStatus::ABORTED, e.what());
    }
}

PipelinePtr LoopbackPipelineFactory::create(const std::string& egress_id,
                                            const StartEgressRequest& request,
                                            PipelineListener& listener) {
    spdlog::debug("[Loopback] Creating {} pipeline for {} in room {}",
                  toString(request.kind()), egress_id, request.room_id);
    return std::make_shared<LoopbackPipeline>(egress_id, listener, options_);
}

} // namespace Egress
