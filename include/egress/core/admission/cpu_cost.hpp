#pragma once

#include <egress/core/jobs/egress_types.hpp>

namespace Egress {

/**
 * @struct CpuCostConfig
 * @brief Static CPU cost (in cores) charged per request type at admission
 *
 * The recommended floors encode the headroom an encoder needs while it
 * starts up; configuring below them is allowed but logged.
 */
struct CpuCostConfig {
    double room_composite_cpu_cost = 3.0;
    double web_cpu_cost = 3.0;
    double track_composite_cpu_cost = 2.0;
    double track_cpu_cost = 1.0;

    double costFor(RequestKind kind) const {
        switch (kind) {
            case RequestKind::ROOM_COMPOSITE:   return room_composite_cpu_cost;
            case RequestKind::WEB:              return web_cpu_cost;
            case RequestKind::TRACK_COMPOSITE:  return track_composite_cpu_cost;
            case RequestKind::TRACK:            return track_cpu_cost;
        }
        return room_composite_cpu_cost;
    }
};

namespace CpuCostFloor {
    constexpr double ROOM_COMPOSITE = 2.5;
    constexpr double WEB = 2.5;
    constexpr double TRACK_COMPOSITE = 1.0;
    constexpr double TRACK = 0.5;

    // Suggested values printed next to a below-floor warning
    constexpr double ROOM_COMPOSITE_RECOMMENDED = 3.0;
    constexpr double WEB_RECOMMENDED = 3.0;
    constexpr double TRACK_COMPOSITE_RECOMMENDED = 2.0;
    constexpr double TRACK_RECOMMENDED = 1.0;
}

} // namespace Egress
