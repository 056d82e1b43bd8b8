#include <egress/core/metrics/registry.hpp>
#include <egress/core/utils/clock.hpp>

namespace Egress {

MetricRegistry& MetricRegistry::getInstance() {
    static MetricRegistry instance;
    return instance;
}

Metrics& MetricRegistry::getMetrics(std::string_view name) {
    std::lock_guard<std::mutex> lock(mtx_);
    // try_emplace: Metrics holds atomics and cannot be copied
    auto [it, inserted] = metrics_map_.try_emplace(std::string(name));
    return it->second;
}

std::unordered_map<std::string, MetricSnapshot> MetricRegistry::getSnapshots() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::unordered_map<std::string, MetricSnapshot> snaps;
    snaps.reserve(metrics_map_.size());
    for (const auto& [name, m] : metrics_map_) {
        snaps[name] = buildSnapshot(m);
    }
    return snaps;
}

std::optional<MetricSnapshot> MetricRegistry::getSnapshot(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = metrics_map_.find(name);
    if (it == metrics_map_.end()) return std::nullopt;
    return buildSnapshot(it->second);
}

void MetricRegistry::touch(RequestKind kind) {
    getMetrics(kind).last_event_timestamp_ms.store(now(), std::memory_order_relaxed);
}

uint64_t MetricRegistry::now() {
    return Clock::epoch_ms();
}

MetricSnapshot MetricRegistry::buildSnapshot(const Metrics& m) {
    MetricSnapshot snap{};
    snap.active_requests = m.active_requests.load(std::memory_order_relaxed);
    snap.total_started = m.total_started.load(std::memory_order_relaxed);
    snap.total_ended = m.total_ended.load(std::memory_order_relaxed);
    snap.total_aborted = m.total_aborted.load(std::memory_order_relaxed);
    snap.total_rejected = m.total_rejected.load(std::memory_order_relaxed);
    snap.last_event_timestamp_ms = m.last_event_timestamp_ms.load(std::memory_order_relaxed);
    return snap;
}

} // namespace Egress
