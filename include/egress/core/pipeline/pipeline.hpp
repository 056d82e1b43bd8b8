#pragma once

#include <egress/core/jobs/egress_types.hpp>
#include <memory>
#include <string>

namespace Egress {

/**
 * @brief Receives lifecycle reports from a running pipeline
 *
 * Reports are requests, not writes: the job table validates each one
 * against the lifecycle and drops those that do not fit.
 */
class PipelineListener {
public:
    virtual ~PipelineListener() = default;
    virtual void onPipelineStatus(const std::string& egress_id,
                                  EgressStatus status,
                                  const std::string& error) = 0;
};

/**
 * @class Pipeline
 * @brief One egress job's media pipeline, running on its own thread
 *
 * start() returns immediately. stop() asks for a clean finish (flush and
 * close the output, then report ENDING/COMPLETE). kill() tears down
 * at once and reports ABORTED. Both may be called more than once and after
 * the pipeline has finished. The destructor joins the pipeline thread.
 */
class Pipeline {
public:
    virtual ~Pipeline() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual void kill() = 0;
};

using PipelinePtr = std::shared_ptr<Pipeline>;

class PipelineFactory {
public:
    virtual ~PipelineFactory() = default;

    virtual PipelinePtr create(const std::string& egress_id,
                               const StartEgressRequest& request,
                               PipelineListener& listener) = 0;
};

} // namespace Egress
