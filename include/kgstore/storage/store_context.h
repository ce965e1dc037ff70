#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kgstore/core/config.h"
#include "kgstore/core/result.h"
#include "kgstore/storage/connection_pool.h"
#include "kgstore/storage/graph_store.h"
#include "kgstore/storage/operation_metrics.h"
#include "kgstore/storage/partition_manager.h"
#include "kgstore/storage/result_cache.h"
#include "kgstore/storage/statement_cache.h"
#include "kgstore/storage/temporal_engine.h"

namespace kgstore {
namespace storage {

/**
 * @brief Point-in-time view of the store's resources
 *
 * Assembled from in-memory counters and file sizes only; building one
 * never waits on the database.
 */
struct HealthReport {
    std::string db_path;
    PoolStats pool;
    uint64_t db_file_bytes = 0;
    uint64_t wal_file_bytes = 0;
    uint64_t shm_file_bytes = 0;
    size_t statement_cache_size = 0;
    size_t statement_cache_capacity = 0;
    double statement_cache_hit_ratio = 0.0;
    size_t result_cache_size = 0;
    size_t result_cache_capacity = 0;
    bool maintenance_running = false;
    std::optional<MaintenanceReport> last_maintenance;
    std::vector<OperationStats> operations;  // Kinds that ran at least once

    std::string ToJson() const;
};

/**
 * @brief Resolves "sqlite://<path>" or a bare path to a file path
 */
core::Result<std::string> ParseConnectionString(const std::string& connection_string);

core::Result<void> ValidateConfig(const core::StoreConfig& config);

/**
 * @brief Owns every component of one open store
 *
 * Members are declared in dependency order so that destruction tears the
 * maintenance thread down before the pool it uses.
 */
class StoreContext {
public:
    static core::Result<std::unique_ptr<StoreContext>> Open(
        const std::string& connection_string,
        const core::StoreConfig& config = core::StoreConfig::Default());

    ~StoreContext();

    StoreContext(const StoreContext&) = delete;
    StoreContext& operator=(const StoreContext&) = delete;

    GraphStore& graph() { return *graph_; }
    TemporalEngine& temporal() { return *temporal_; }
    PartitionManager& partitions() { return *partitions_; }
    ConnectionPool& pool() { return *pool_; }
    OperationMetrics& metrics() { return metrics_; }
    StatementCache& statements() { return statements_; }
    ResultCache& results() { return results_; }

    const std::string& db_path() const { return db_path_; }
    const core::StoreConfig& config() const { return config_; }

    HealthReport health() const;

private:
    StoreContext(std::string db_path, const core::StoreConfig& config);

    std::string db_path_;
    core::StoreConfig config_;

    StatementCache statements_;
    ResultCache results_;
    OperationMetrics metrics_;
    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<TemporalEngine> temporal_;
    std::unique_ptr<GraphStore> graph_;
    std::unique_ptr<PartitionManager> partitions_;
};

} // namespace storage
} // namespace kgstore
