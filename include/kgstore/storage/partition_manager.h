#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "kgstore/core/config.h"
#include "kgstore/core/result.h"
#include "kgstore/core/types.h"
#include "kgstore/storage/connection_pool.h"
#include "kgstore/storage/operation_metrics.h"
#include "kgstore/storage/result_cache.h"

namespace kgstore {
namespace storage {

/**
 * @brief Partition an entity created at `created_at` belongs in at `now`
 *
 * recent: age < recent_age; intermediate: recent_age <= age < archive_age;
 * archive: age >= archive_age.
 */
core::Partition PartitionFor(core::Timestamp created_at, core::Timestamp now,
                             const core::PartitionConfig& config);

/**
 * @brief Outcome of one maintenance pass
 */
struct MaintenanceReport {
    core::Timestamp started_at = 0;
    int64_t moved_to_intermediate = 0;
    int64_t moved_to_archive = 0;
    int64_t entity_types = 0;      // Rows written to entity_type_stats
    int64_t relation_types = 0;    // Rows written to relation_type_stats
    std::chrono::milliseconds duration{0};
    bool skipped = false;          // Another pass was already running
    bool succeeded = false;
    std::string error;
};

/**
 * @brief Migrates aging entity rows between partitions and refreshes the summary tables
 *
 * One pass runs in a single IMMEDIATE transaction: recent -> intermediate,
 * intermediate -> archive, then the summary rebuild. Passes never overlap;
 * a caller that finds one in flight gets a skipped report. Failures are
 * logged and left for the next tick; they never reach serving callers.
 *
 * Moving rows does not change any logical read, so the result cache is
 * only invalidated for the summary queries.
 */
class PartitionManager {
public:
    PartitionManager(ConnectionPool& pool, ResultCache& results, OperationMetrics& metrics,
                     core::PartitionConfig config, core::Clock clock);
    ~PartitionManager();

    PartitionManager(const PartitionManager&) = delete;
    PartitionManager& operator=(const PartitionManager&) = delete;

    /**
     * @brief Starts the periodic maintenance thread (idempotent)
     */
    void start();

    /**
     * @brief Stops the maintenance thread and waits for it (idempotent)
     */
    void stop();

    bool is_running() const { return running_.load(std::memory_order_relaxed); }

    /**
     * @brief Runs one maintenance pass now
     */
    core::Result<MaintenanceReport> run_maintenance();

    /**
     * @brief Number of entity rows physically stored in each partition
     */
    core::Result<std::map<core::Partition, int64_t>> partition_counts();

    /**
     * @brief Partition the named live entity is stored in
     */
    core::Result<std::optional<core::Partition>> partition_of(const std::string& name);

    std::optional<MaintenanceReport> last_report() const;

    const core::PartitionConfig& config() const { return config_; }

private:
    void maintenance_loop();
    core::Result<MaintenanceReport> migrate_and_refresh(Connection& conn, core::Timestamp now);

    ConnectionPool& pool_;
    ResultCache& results_;
    OperationMetrics& metrics_;
    core::PartitionConfig config_;
    core::Clock clock_;

    std::mutex run_mutex_;   // Held for the duration of a pass

    mutable std::mutex report_mutex_;
    std::optional<MaintenanceReport> last_report_;

    std::atomic<bool> running_{false};
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::thread maintenance_thread_;
};

} // namespace storage
} // namespace kgstore
