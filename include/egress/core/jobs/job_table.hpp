#pragma once

#include <egress/core/jobs/egress_types.hpp>
#include <egress/core/jobs/job_state.hpp>
#include <egress/core/pipeline/pipeline.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Egress {

enum class TransitionResult : uint8_t {
    APPLIED = 0,
    NOT_FOUND = 1,
    REJECTED = 2    // Not reachable from the current state, job unchanged
};

struct TransitionOutcome {
    TransitionResult result = TransitionResult::NOT_FOUND;
    EgressStatus previous = EgressStatus::STARTING;
    EgressInfo info;    // State after the call (unchanged when rejected)
};

/**
 * @class JobTable
 * @brief egress id -> job, the single writer of job status
 *
 * All mutations happen under one mutex. The callbacks passed to insert()
 * and transition() run while that mutex is held, which is what keeps the
 * published order of one job's transitions equal to the order in which they
 * were applied. Callbacks must not call back into the table.
 */
class JobTable {
public:
    using AppliedCallback = std::function<void(const EgressInfo&)>;

    JobTable() = default;
    ~JobTable() = default;

    JobTable(const JobTable&) = delete;
    JobTable& operator=(const JobTable&) = delete;

    /**
     * @return false if the id is already present
     */
    bool insert(const EgressInfo& info,
                PipelinePtr pipeline,
                const AppliedCallback& on_inserted = nullptr);

    /**
     * @brief Validate and apply one lifecycle step
     *
     * Sets started_at on ACTIVE, ended_at on COMPLETE/ABORTED, and error on
     * ABORTED only.
     */
    TransitionOutcome transition(const std::string& egress_id,
                                 EgressStatus next,
                                 const std::string& error = "",
                                 const AppliedCallback& on_applied = nullptr);

    std::optional<EgressInfo> get(const std::string& egress_id) const;
    PipelinePtr pipeline(const std::string& egress_id) const;

    // Every retained job, terminal ones included
    std::vector<EgressInfo> list() const;
    // Non-terminal jobs only
    std::vector<EgressInfo> live() const;
    std::vector<std::pair<std::string, PipelinePtr>> livePipelines() const;

    /**
     * @brief Remove a terminal job
     * @return Its pipeline, to be released by the caller outside the lock;
     *         nullptr (and nothing removed) if missing or not terminal
     */
    PipelinePtr evict(const std::string& egress_id);

    /**
     * @brief Block until no job is live or the timeout passes
     * @return true if the table drained
     */
    bool waitAllTerminal(std::chrono::milliseconds timeout) const;

    size_t size() const;
    size_t liveCount() const;

private:
    struct Entry {
        EgressInfo info;
        PipelinePtr pipeline;
    };

    size_t liveCountLocked() const;

    mutable std::mutex mutex_;
    mutable std::condition_variable drained_cv_;
    std::map<std::string, Entry> jobs_;
};

} // namespace Egress
