#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kgstore {
namespace storage {

enum class OperationKind : size_t {
    CREATE_ENTITIES = 0,
    ADD_OBSERVATIONS,
    DELETE_ENTITIES,
    DELETE_OBSERVATIONS,
    CREATE_RELATIONS,
    DELETE_RELATIONS,
    SEARCH_NODES,
    OPEN_NODES,
    READ_GRAPH,
    UPDATE_ENTITY,
    ENTITY_STATISTICS,
    RELATION_SUMMARY,
    ENTITY_AT_TIME,
    ENTITY_CHANGES,
    RELATIONS_AT_TIME,
    CHANGES_IN_PERIOD,
    RELATION_CHANGES,
    GRAPH_AT_TIME,
    CHANGE_SUMMARY,
    MAINTENANCE
};

constexpr size_t kOperationKindCount = static_cast<size_t>(OperationKind::MAINTENANCE) + 1;

const char* OperationKindName(OperationKind kind);

/**
 * @brief Point-in-time view of one operation kind's counters
 */
struct OperationStats {
    OperationKind kind = OperationKind::CREATE_ENTITIES;
    uint64_t count = 0;
    uint64_t errors = 0;
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    double avg_duration_ms = 0.0;
    double p95_ms = 0.0;     // Over the most recent window of samples
    double p99_ms = 0.0;
    double cache_hit_rate = 0.0;  // hits / (hits + misses), 0 when never looked up
};

/**
 * @brief Per-operation latency and cache counters
 *
 * Counts and averages cover the process lifetime; percentiles cover the
 * last `window` samples. Recording never touches storage.
 */
class OperationMetrics {
public:
    /**
     * @brief Records one operation when destroyed
     */
    class Timer {
    public:
        Timer(OperationMetrics* metrics, OperationKind kind);
        ~Timer();

        Timer(Timer&& other) noexcept;
        Timer(const Timer&) = delete;
        Timer& operator=(const Timer&) = delete;
        Timer& operator=(Timer&&) = delete;

        void set_success(bool success) { success_ = success; }
        void set_cache_hit(bool hit) { cache_hit_ = hit; }

    private:
        OperationMetrics* metrics_;
        OperationKind kind_;
        std::chrono::steady_clock::time_point start_;
        bool success_ = false;
        std::optional<bool> cache_hit_;
    };

    explicit OperationMetrics(size_t window = 1000);

    OperationMetrics(const OperationMetrics&) = delete;
    OperationMetrics& operator=(const OperationMetrics&) = delete;

    Timer start(OperationKind kind) { return Timer(this, kind); }

    void record(OperationKind kind, std::chrono::nanoseconds duration, bool success,
                std::optional<bool> cache_hit = std::nullopt);

    OperationStats snapshot(OperationKind kind) const;

    /**
     * @brief Stats for every kind recorded at least once
     */
    std::vector<OperationStats> snapshot_all() const;

    void reset();

private:
    struct Series {
        mutable std::mutex mutex;
        uint64_t count = 0;
        uint64_t errors = 0;
        uint64_t cache_hits = 0;
        uint64_t cache_misses = 0;
        double total_ms = 0.0;
        std::deque<double> samples;
    };

    size_t window_;
    std::array<Series, kOperationKindCount> series_;
};

} // namespace storage
} // namespace kgstore
