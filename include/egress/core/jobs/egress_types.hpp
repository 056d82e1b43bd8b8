#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace Egress {

// ============================================================================
// LIFECYCLE STATUS
// ============================================================================

enum class EgressStatus : uint8_t {
    STARTING = 0,   // Admitted, pipeline not yet running
    ACTIVE = 1,     // Pipeline running
    ENDING = 2,     // Stop requested, pipeline finishing output
    COMPLETE = 3,   // Terminal: finished cleanly
    ABORTED = 4     // Terminal: failed or killed
};

// ============================================================================
// REQUEST KINDS
// ============================================================================
// Variant alternatives are declared in RequestKind order, so the variant
// index is the discriminant.

enum class RequestKind : uint8_t {
    ROOM_COMPOSITE = 0,
    WEB = 1,
    TRACK_COMPOSITE = 2,
    TRACK = 3
};

constexpr size_t kRequestKindCount = 4;

struct RoomCompositeRequest {
    std::string room_name;
    std::string layout;
    std::string filepath;
};

struct WebRequest {
    std::string url;
    std::string filepath;
};

struct TrackCompositeRequest {
    std::string audio_track_id;
    std::string video_track_id;
    std::string filepath;
};

struct TrackRequest {
    std::string track_id;
    std::string filepath;
};

using EgressPayload = std::variant<RoomCompositeRequest,
                                   WebRequest,
                                   TrackCompositeRequest,
                                   TrackRequest>;

static_assert(std::variant_size_v<EgressPayload> == kRequestKindCount,
              "EgressPayload alternatives must match RequestKind");

struct StartEgressRequest {
    std::string room_id;
    std::string ws_url;
    EgressPayload payload;

    RequestKind kind() const {
        return static_cast<RequestKind>(payload.index());
    }
};

struct StopEgressRequest {
    std::string egress_id;
};

// ============================================================================
// EGRESS INFO
// ============================================================================

struct EgressInfo {
    std::string egress_id;
    std::string room_id;
    RequestKind kind = RequestKind::ROOM_COMPOSITE;
    EgressStatus status = EgressStatus::STARTING;
    int64_t started_at = 0;   // epoch ns, 0 when unset
    int64_t ended_at = 0;     // epoch ns, 0 when unset
    std::string error;        // empty when none
};

const char* toString(EgressStatus status);
const char* toString(RequestKind kind);

/**
 * @brief Metric label for a request kind ("room_composite", "web", ...)
 */
const char* metricLabel(RequestKind kind);

} // namespace Egress
