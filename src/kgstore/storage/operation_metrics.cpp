#include "kgstore/storage/operation_metrics.h"

#include <algorithm>
#include <cmath>

namespace kgstore {
namespace storage {

namespace {

// Nearest-rank percentile of an ascending sequence
double Percentile(const std::vector<double>& sorted, double fraction) {
    if (sorted.empty()) return 0.0;
    auto rank = static_cast<size_t>(std::ceil(fraction * static_cast<double>(sorted.size())));
    if (rank == 0) rank = 1;
    return sorted[std::min(rank, sorted.size()) - 1];
}

}  // namespace

const char* OperationKindName(OperationKind kind) {
    switch (kind) {
        case OperationKind::CREATE_ENTITIES: return "create_entities";
        case OperationKind::ADD_OBSERVATIONS: return "add_observations";
        case OperationKind::DELETE_ENTITIES: return "delete_entities";
        case OperationKind::DELETE_OBSERVATIONS: return "delete_observations";
        case OperationKind::CREATE_RELATIONS: return "create_relations";
        case OperationKind::DELETE_RELATIONS: return "delete_relations";
        case OperationKind::SEARCH_NODES: return "search_nodes";
        case OperationKind::OPEN_NODES: return "open_nodes";
        case OperationKind::READ_GRAPH: return "read_graph";
        case OperationKind::UPDATE_ENTITY: return "update_entity";
        case OperationKind::ENTITY_STATISTICS: return "get_entity_statistics";
        case OperationKind::RELATION_SUMMARY: return "get_relation_summary";
        case OperationKind::ENTITY_AT_TIME: return "get_entity_at_time";
        case OperationKind::ENTITY_CHANGES: return "get_entity_changes";
        case OperationKind::RELATIONS_AT_TIME: return "get_relations_at_time";
        case OperationKind::CHANGES_IN_PERIOD: return "get_changes_in_period";
        case OperationKind::RELATION_CHANGES: return "get_relation_changes";
        case OperationKind::GRAPH_AT_TIME: return "get_graph_at_time";
        case OperationKind::CHANGE_SUMMARY: return "get_change_summary";
        case OperationKind::MAINTENANCE: return "maintenance";
    }
    return "unknown";
}

// ============================================================================
// Timer
// ============================================================================

OperationMetrics::Timer::Timer(OperationMetrics* metrics, OperationKind kind)
    : metrics_(metrics), kind_(kind), start_(std::chrono::steady_clock::now()) {}

OperationMetrics::Timer::Timer(Timer&& other) noexcept
    : metrics_(other.metrics_),
      kind_(other.kind_),
      start_(other.start_),
      success_(other.success_),
      cache_hit_(other.cache_hit_) {
    other.metrics_ = nullptr;
}

OperationMetrics::Timer::~Timer() {
    if (metrics_) {
        metrics_->record(kind_, std::chrono::steady_clock::now() - start_, success_, cache_hit_);
    }
}

// ============================================================================
// OperationMetrics
// ============================================================================

OperationMetrics::OperationMetrics(size_t window) : window_(window > 0 ? window : 1) {}

void OperationMetrics::record(OperationKind kind, std::chrono::nanoseconds duration, bool success,
                              std::optional<bool> cache_hit) {
    auto& series = series_[static_cast<size_t>(kind)];
    double ms = std::chrono::duration<double, std::milli>(duration).count();

    std::lock_guard<std::mutex> lock(series.mutex);
    ++series.count;
    if (!success) ++series.errors;
    if (cache_hit) {
        if (*cache_hit) {
            ++series.cache_hits;
        } else {
            ++series.cache_misses;
        }
    }
    series.total_ms += ms;
    series.samples.push_back(ms);
    while (series.samples.size() > window_) {
        series.samples.pop_front();
    }
}

OperationStats OperationMetrics::snapshot(OperationKind kind) const {
    const auto& series = series_[static_cast<size_t>(kind)];
    OperationStats stats;
    stats.kind = kind;

    std::vector<double> sorted;
    {
        std::lock_guard<std::mutex> lock(series.mutex);
        stats.count = series.count;
        stats.errors = series.errors;
        stats.cache_hits = series.cache_hits;
        stats.cache_misses = series.cache_misses;
        if (series.count > 0) {
            stats.avg_duration_ms = series.total_ms / static_cast<double>(series.count);
        }
        sorted.assign(series.samples.begin(), series.samples.end());
    }

    std::sort(sorted.begin(), sorted.end());
    stats.p95_ms = Percentile(sorted, 0.95);
    stats.p99_ms = Percentile(sorted, 0.99);

    uint64_t lookups = stats.cache_hits + stats.cache_misses;
    if (lookups > 0) {
        stats.cache_hit_rate = static_cast<double>(stats.cache_hits) / static_cast<double>(lookups);
    }
    return stats;
}

std::vector<OperationStats> OperationMetrics::snapshot_all() const {
    std::vector<OperationStats> all;
    for (size_t i = 0; i < kOperationKindCount; ++i) {
        auto stats = snapshot(static_cast<OperationKind>(i));
        if (stats.count > 0) {
            all.push_back(stats);
        }
    }
    return all;
}

void OperationMetrics::reset() {
    for (auto& series : series_) {
        std::lock_guard<std::mutex> lock(series.mutex);
        series.count = 0;
        series.errors = 0;
        series.cache_hits = 0;
        series.cache_misses = 0;
        series.total_ms = 0.0;
        series.samples.clear();
    }
}

} // namespace storage
} // namespace kgstore
