#pragma once
#include <egress/core/jobs/egress_types.hpp>

namespace Egress {

/**
 * Job lifecycle state machine
 *
 *   STARTING -> ACTIVE -> ENDING -> COMPLETE
 *       |          |        |
 *       +----------+--------+-----> ABORTED
 *
 * STARTING -> ENDING is the stop-before-active path.
 * Movement is forward only, terminal states have no successors.
 */
class JobLifecycle {
public:
    static bool isTerminal(EgressStatus status) {
        return status == EgressStatus::COMPLETE || status == EgressStatus::ABORTED;
    }

    /**
     * A stop request is only honoured while the pipeline is starting or running
     */
    static bool isStoppable(EgressStatus status) {
        return status == EgressStatus::STARTING || status == EgressStatus::ACTIVE;
    }

    static bool canTransition(EgressStatus from, EgressStatus to);
};

} // namespace Egress
