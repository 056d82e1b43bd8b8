#pragma once
#include <egress/core/metrics/metrics.hpp>
#include <egress/core/jobs/egress_types.hpp>
#include <unordered_map>
#include <string>
#include <string_view>
#include <mutex>
#include <optional>

namespace Egress {

namespace MetricNames {
    constexpr std::string_view ROOM_COMPOSITE = "room_composite";
    constexpr std::string_view WEB = "web";
    constexpr std::string_view TRACK_COMPOSITE = "track_composite";
    constexpr std::string_view TRACK = "track";
}

/**
 * @class MetricRegistry
 * @brief Named metric sets plus node gauges
 *
 * Entries are created once (normally at configure time) and never removed,
 * so references returned by getMetrics() stay valid for the registry's life.
 * The process-wide instance is used by the daemon; tests construct their own.
 */
class MetricRegistry {
public:
    MetricRegistry() = default;
    ~MetricRegistry() = default;
    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;

    static MetricRegistry& getInstance();

    Metrics& getMetrics(std::string_view name);
    Metrics& getMetrics(RequestKind kind) { return getMetrics(metricLabel(kind)); }
    NodeGauges& node() { return node_; }

    std::unordered_map<std::string, MetricSnapshot> getSnapshots() const;
    std::optional<MetricSnapshot> getSnapshot(const std::string& name) const;

    void touch(RequestKind kind);

private:
    static uint64_t now();
    static MetricSnapshot buildSnapshot(const Metrics& m);

    // Node-based container: references into it survive rehash
    std::unordered_map<std::string, Metrics> metrics_map_;
    mutable std::mutex mtx_;
    NodeGauges node_;
};

} // namespace Egress
