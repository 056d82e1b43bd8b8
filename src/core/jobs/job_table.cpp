#include <egress/core/jobs/job_table.hpp>
#include <egress/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

namespace Egress {

bool JobTable::insert(const EgressInfo& info,
                      PipelinePtr pipeline,
                      const AppliedCallback& on_inserted) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = jobs_.try_emplace(info.egress_id, Entry{info, std::move(pipeline)});
    if (!inserted) {
        spdlog::error("[JobTable] Duplicate egress id {}", info.egress_id);
        return false;
    }
    if (on_inserted) {
        on_inserted(it->second.info);
    }
    return true;
}

TransitionOutcome JobTable::transition(const std::string& egress_id,
                                       EgressStatus next,
                                       const std::string& error,
                                       const AppliedCallback& on_applied) {
    TransitionOutcome outcome;
    bool drained = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(egress_id);
        if (it == jobs_.end()) {
            outcome.result = TransitionResult::NOT_FOUND;
            return outcome;
        }

        EgressInfo& info = it->second.info;
        outcome.previous = info.status;

        if (!JobLifecycle::canTransition(info.status, next)) {
            outcome.result = TransitionResult::REJECTED;
            outcome.info = info;
            return outcome;
        }

        info.status = next;
        switch (next) {
            case EgressStatus::ACTIVE:
                info.started_at = Clock::epoch_ns();
                break;
            case EgressStatus::ABORTED:
                info.error = error;
                info.ended_at = Clock::epoch_ns();
                break;
            case EgressStatus::COMPLETE:
                info.ended_at = Clock::epoch_ns();
                break;
            case EgressStatus::STARTING:
            case EgressStatus::ENDING:
                break;
        }

        outcome.result = TransitionResult::APPLIED;
        outcome.info = info;

        if (on_applied) {
            on_applied(info);
        }
        drained = JobLifecycle::isTerminal(next) && liveCountLocked() == 0;
    }

    if (drained) {
        drained_cv_.notify_all();
    }
    return outcome;
}

std::optional<EgressInfo> JobTable::get(const std::string& egress_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(egress_id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second.info;
}

PipelinePtr JobTable::pipeline(const std::string& egress_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(egress_id);
    if (it == jobs_.end()) return nullptr;
    return it->second.pipeline;
}

std::vector<EgressInfo> JobTable::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EgressInfo> out;
    out.reserve(jobs_.size());
    for (const auto& [id, entry] : jobs_) {
        out.push_back(entry.info);
    }
    return out;
}

std::vector<EgressInfo> JobTable::live() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EgressInfo> out;
    for (const auto& [id, entry] : jobs_) {
        if (!JobLifecycle::isTerminal(entry.info.status)) {
            out.push_back(entry.info);
        }
    }
    return out;
}

std::vector<std::pair<std::string, PipelinePtr>> JobTable::livePipelines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, PipelinePtr>> out;
    for (const auto& [id, entry] : jobs_) {
        if (!JobLifecycle::isTerminal(entry.info.status) && entry.pipeline) {
            out.emplace_back(id, entry.pipeline);
        }
    }
    return out;
}

PipelinePtr JobTable::evict(const std::string& egress_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(egress_id);
    if (it == jobs_.end() || !JobLifecycle::isTerminal(it->second.info.status)) {
        return nullptr;
    }
    PipelinePtr pipeline = std::move(it->second.pipeline);
    jobs_.erase(it);
    spdlog::debug("[JobTable] Evicted {}", egress_id);
    return pipeline;
}

bool JobTable::waitAllTerminal(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_cv_.wait_for(lock, timeout, [this]() { return liveCountLocked() == 0; });
}

size_t JobTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

size_t JobTable::liveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return liveCountLocked();
}

size_t JobTable::liveCountLocked() const {
    size_t n = 0;
    for (const auto& [id, entry] : jobs_) {
        if (!JobLifecycle::isTerminal(entry.info.status)) {
            ++n;
        }
    }
    return n;
}

} // namespace Egress
