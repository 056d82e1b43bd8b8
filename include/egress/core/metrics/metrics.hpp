#pragma once
#include <atomic>
#include <cstdint>

namespace Egress {

/**
 * @brief Per request-type metrics
 *
 * All counters are lock-free atomic, relaxed ordering.
 * active_requests is a gauge (started - ended), the rest only grow.
 */
struct Metrics {
    std::atomic<int64_t> active_requests{0};
    std::atomic<uint64_t> total_started{0};
    std::atomic<uint64_t> total_ended{0};
    std::atomic<uint64_t> total_aborted{0};
    std::atomic<uint64_t> total_rejected{0};

    std::atomic<uint64_t> last_event_timestamp_ms{0};
};

/**
 * @brief Node-wide gauges
 */
struct NodeGauges {
    std::atomic<double> cpu_load{0.0};      // 0..1, refreshed by every CPU sample
    std::atomic<bool> available{false};     // accepting and able to serve the cheapest job type
};

/**
 * Non-atomic snapshot for consistent reads by the reporter and status handler
 */
struct MetricSnapshot {
    int64_t active_requests;
    uint64_t total_started;
    uint64_t total_ended;
    uint64_t total_aborted;
    uint64_t total_rejected;
    uint64_t last_event_timestamp_ms;
};

} // namespace Egress
