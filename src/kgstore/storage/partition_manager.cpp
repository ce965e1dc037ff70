#include "kgstore/storage/partition_manager.h"

#include "kgstore/common/logger.h"
#include "kgstore/storage/schema.h"
#include "kgstore/storage/transaction.h"

namespace kgstore {
namespace storage {

namespace {

// Moves rows created at or before `cutoff` from one partition table to another
core::Result<int64_t> MoveRows(Connection& conn, const char* from_table, const char* to_table,
                               core::Timestamp cutoff) {
    const std::string columns(schema::kEntityColumns);
    auto copied = conn.execute(std::string("INSERT INTO ") + to_table + " (" + columns + ") "
                               "SELECT " + columns + " FROM " + from_table +
                               " WHERE created_at <= ?",
                               {cutoff});
    if (!copied.ok()) return copied.error_info();

    auto removed = conn.execute(std::string("DELETE FROM ") + from_table + " WHERE created_at <= ?",
                                {cutoff});
    if (!removed.ok()) return removed.error_info();

    if (copied.value() != removed.value()) {
        return core::InternalError("Partition move " + std::string(from_table) + " -> " + to_table +
                                   " copied " + std::to_string(copied.value()) + " rows but removed " +
                                   std::to_string(removed.value()));
    }
    return static_cast<int64_t>(copied.value());
}

}  // namespace

core::Partition PartitionFor(core::Timestamp created_at, core::Timestamp now,
                             const core::PartitionConfig& config) {
    core::Duration age = now - created_at;
    if (age >= config.archive_age) {
        return core::Partition::ARCHIVE;
    }
    if (age >= config.recent_age) {
        return core::Partition::INTERMEDIATE;
    }
    return core::Partition::RECENT;
}

PartitionManager::PartitionManager(ConnectionPool& pool, ResultCache& results,
                                   OperationMetrics& metrics, core::PartitionConfig config,
                                   core::Clock clock)
    : pool_(pool),
      results_(results),
      metrics_(metrics),
      config_(config),
      clock_(std::move(clock)) {}

PartitionManager::~PartitionManager() {
    stop();
}

void PartitionManager::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }
    maintenance_thread_ = std::thread(&PartitionManager::maintenance_loop, this);
}

void PartitionManager::stop() {
    if (!running_.exchange(false)) {
        return;  // Not running
    }
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
    }
    loop_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
}

void PartitionManager::maintenance_loop() {
    KGSTORE_INFO("Partition maintenance scheduled every {} ms",
                 config_.maintenance_interval.count());
    std::unique_lock<std::mutex> lock(loop_mutex_);
    while (running_.load()) {
        loop_cv_.wait_for(lock, config_.maintenance_interval, [this] { return !running_.load(); });
        if (!running_.load()) {
            break;
        }

        lock.unlock();
        auto result = run_maintenance();
        if (!result.ok()) {
            KGSTORE_WARN("Scheduled partition maintenance failed; retrying in {} ms",
                         config_.maintenance_interval.count());
        }
        lock.lock();
    }
    KGSTORE_DEBUG("Partition maintenance thread stopped");
}

core::Result<MaintenanceReport> PartitionManager::run_maintenance() {
    std::unique_lock<std::mutex> guard(run_mutex_, std::try_to_lock);
    if (!guard.owns_lock()) {
        KGSTORE_DEBUG("Partition maintenance already in progress; skipping");
        MaintenanceReport skipped;
        skipped.started_at = clock_();
        skipped.skipped = true;
        return skipped;
    }

    auto timer = metrics_.start(OperationKind::MAINTENANCE);
    const auto started = std::chrono::steady_clock::now();
    const core::Timestamp now = clock_();

    auto conn = pool_.acquire();
    if (!conn.ok()) {
        KGSTORE_ERROR("Partition maintenance could not get a connection: {}", conn.error());
        MaintenanceReport failed;
        failed.started_at = now;
        failed.error = conn.error();
        std::lock_guard<std::mutex> lock(report_mutex_);
        last_report_ = failed;
        return conn.error_info();
    }

    Connection& c = *conn.value();
    auto result = RunInTransaction(c, [this, now](Connection& txn_conn) {
        return migrate_and_refresh(txn_conn, now);
    });

    if (!result.ok()) {
        KGSTORE_ERROR("Partition maintenance failed: {}", result.error());
        MaintenanceReport failed;
        failed.started_at = now;
        failed.error = result.error();
        failed.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        std::lock_guard<std::mutex> lock(report_mutex_);
        last_report_ = failed;
        return result;
    }

    auto optimized = c.exec_script("PRAGMA optimize");
    if (!optimized.ok()) {
        KGSTORE_WARN("PRAGMA optimize failed after maintenance: {}", optimized.error());
    }
    auto analyzed = c.exec_script("ANALYZE");
    if (!analyzed.ok()) {
        KGSTORE_WARN("ANALYZE failed after maintenance: {}", analyzed.error());
    }

    MaintenanceReport report = result.take_value();
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    report.succeeded = true;

    // Published before the handle goes back to the pool
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        last_report_ = report;
    }
    conn.value().release();
    results_.invalidate("_type_stats");

    if (report.moved_to_intermediate > 0 || report.moved_to_archive > 0) {
        KGSTORE_INFO("Partition maintenance moved {} rows to intermediate, {} to archive in {} ms",
                     report.moved_to_intermediate, report.moved_to_archive,
                     report.duration.count());
    } else {
        KGSTORE_DEBUG("Partition maintenance found nothing to move ({} ms)",
                      report.duration.count());
    }

    timer.set_success(true);
    return report;
}

core::Result<MaintenanceReport> PartitionManager::migrate_and_refresh(Connection& conn,
                                                                      core::Timestamp now) {
    MaintenanceReport report;
    report.started_at = now;

    auto to_intermediate = MoveRows(conn, schema::kRecentTable, schema::kIntermediateTable,
                                    now - config_.recent_age);
    if (!to_intermediate.ok()) return to_intermediate.error_info();
    report.moved_to_intermediate = to_intermediate.value();

    auto to_archive = MoveRows(conn, schema::kIntermediateTable, schema::kArchiveTable,
                               now - config_.archive_age);
    if (!to_archive.ok()) return to_archive.error_info();
    report.moved_to_archive = to_archive.value();

    auto cleared = conn.exec_script("DELETE FROM entity_type_stats; DELETE FROM relation_type_stats;");
    if (!cleared.ok()) return cleared.error_info();

    auto entity_stats = conn.execute(
        "INSERT INTO entity_type_stats "
        "(entity_type, entity_count, avg_confidence, first_created, last_updated, refreshed_at) "
        "SELECT entity_type, COUNT(*), AVG(confidence_score), MIN(created_at), MAX(last_updated), ? "
        "FROM entities GROUP BY entity_type",
        {now});
    if (!entity_stats.ok()) return entity_stats.error_info();
    report.entity_types = entity_stats.value();

    auto relation_stats = conn.execute(
        "INSERT INTO relation_type_stats "
        "(relation_type, relation_count, source_count, target_count, refreshed_at) "
        "SELECT relation_type, COUNT(*), COUNT(DISTINCT from_entity), COUNT(DISTINCT to_entity), ? "
        "FROM relations GROUP BY relation_type",
        {now});
    if (!relation_stats.ok()) return relation_stats.error_info();
    report.relation_types = relation_stats.value();

    return report;
}

core::Result<std::map<core::Partition, int64_t>> PartitionManager::partition_counts() {
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    std::map<core::Partition, int64_t> counts;
    for (auto partition : {core::Partition::RECENT, core::Partition::INTERMEDIATE,
                           core::Partition::ARCHIVE}) {
        auto count = conn.value()->query_int(std::string("SELECT COUNT(*) FROM ") +
                                             schema::TableFor(partition));
        if (!count.ok()) return count.error_info();
        counts[partition] = count.value().value_or(0);
    }
    return counts;
}

core::Result<std::optional<core::Partition>> PartitionManager::partition_of(const std::string& name) {
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto names = conn.value()->query_list<std::string>(
        "SELECT partition_name FROM entities WHERE name = ?", {name},
        [](const Row& row) -> core::Result<std::string> { return row.get_text(0); });
    if (!names.ok()) return names.error_info();

    std::optional<core::Partition> partition;
    if (!names.value().empty()) {
        auto parsed = schema::PartitionFromName(names.value().front());
        if (!parsed.ok()) return parsed.error_info();
        partition = parsed.value();
    }
    return partition;
}

std::optional<MaintenanceReport> PartitionManager::last_report() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}

} // namespace storage
} // namespace kgstore
