#include <egress/core/jobs/job_state.hpp>

namespace Egress {

bool JobLifecycle::canTransition(EgressStatus from, EgressStatus to) {
    switch (from) {
        case EgressStatus::STARTING:
            return to == EgressStatus::ACTIVE
                || to == EgressStatus::ENDING
                || to == EgressStatus::ABORTED;
        case EgressStatus::ACTIVE:
            return to == EgressStatus::ENDING || to == EgressStatus::ABORTED;
        case EgressStatus::ENDING:
            return to == EgressStatus::COMPLETE || to == EgressStatus::ABORTED;
        case EgressStatus::COMPLETE:
        case EgressStatus::ABORTED:
            return false;
    }
    return false;
}

const char* toString(EgressStatus status) {
    switch (status) {
        case EgressStatus::STARTING:  return "EGRESS_STARTING";
        case EgressStatus::ACTIVE:    return "EGRESS_ACTIVE";
        case EgressStatus::ENDING:    return "EGRESS_ENDING";
        case EgressStatus::COMPLETE:  return "EGRESS_COMPLETE";
        case EgressStatus::ABORTED:   return "EGRESS_ABORTED";
    }
    return "UNKNOWN";
}

const char* toString(RequestKind kind) {
    switch (kind) {
        case RequestKind::ROOM_COMPOSITE:   return "RoomComposite";
        case RequestKind::WEB:              return "Web";
        case RequestKind::TRACK_COMPOSITE:  return "TrackComposite";
        case RequestKind::TRACK:            return "Track";
    }
    return "Unknown";
}

const char* metricLabel(RequestKind kind) {
    switch (kind) {
        case RequestKind::ROOM_COMPOSITE:   return "room_composite";
        case RequestKind::WEB:              return "web";
        case RequestKind::TRACK_COMPOSITE:  return "track_composite";
        case RequestKind::TRACK:            return "track";
    }
    return "unknown";
}

} // namespace Egress
