#include "kgstore/storage/store_context.h"

#include <filesystem>
#include <system_error>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "kgstore/common/logger.h"
#include "kgstore/storage/schema.h"

namespace kgstore {
namespace storage {

namespace {

constexpr const char* kSqliteScheme = "sqlite://";

uint64_t FileSize(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

void WriteMaintenance(rapidjson::Writer<rapidjson::StringBuffer>& writer,
                      const MaintenanceReport& report) {
    writer.StartObject();
    writer.Key("started_at");
    writer.Int64(report.started_at);
    writer.Key("moved_to_intermediate");
    writer.Int64(report.moved_to_intermediate);
    writer.Key("moved_to_archive");
    writer.Int64(report.moved_to_archive);
    writer.Key("entity_types");
    writer.Int64(report.entity_types);
    writer.Key("relation_types");
    writer.Int64(report.relation_types);
    writer.Key("duration_ms");
    writer.Int64(report.duration.count());
    writer.Key("skipped");
    writer.Bool(report.skipped);
    writer.Key("succeeded");
    writer.Bool(report.succeeded);
    if (!report.error.empty()) {
        writer.Key("error");
        writer.String(report.error.c_str());
    }
    writer.EndObject();
}

}  // namespace

std::string HealthReport::ToJson() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("db_path");
    writer.String(db_path.c_str());

    writer.Key("pool");
    writer.StartObject();
    writer.Key("max_connections");
    writer.Uint64(pool.max_connections);
    writer.Key("active");
    writer.Uint64(pool.active);
    writer.Key("idle");
    writer.Uint64(pool.idle);
    writer.Key("available");
    writer.Uint64(pool.available);
    writer.Key("created");
    writer.Uint64(pool.created);
    writer.Key("exhausted");
    writer.Uint64(pool.exhausted);
    writer.EndObject();

    writer.Key("files");
    writer.StartObject();
    writer.Key("db_bytes");
    writer.Uint64(db_file_bytes);
    writer.Key("wal_bytes");
    writer.Uint64(wal_file_bytes);
    writer.Key("shm_bytes");
    writer.Uint64(shm_file_bytes);
    writer.EndObject();

    writer.Key("statement_cache");
    writer.StartObject();
    writer.Key("size");
    writer.Uint64(statement_cache_size);
    writer.Key("capacity");
    writer.Uint64(statement_cache_capacity);
    writer.Key("hit_ratio");
    writer.Double(statement_cache_hit_ratio);
    writer.EndObject();

    writer.Key("result_cache");
    writer.StartObject();
    writer.Key("size");
    writer.Uint64(result_cache_size);
    writer.Key("capacity");
    writer.Uint64(result_cache_capacity);
    writer.EndObject();

    writer.Key("maintenance_running");
    writer.Bool(maintenance_running);
    writer.Key("last_maintenance");
    if (last_maintenance) {
        WriteMaintenance(writer, *last_maintenance);
    } else {
        writer.Null();
    }

    writer.Key("operations");
    writer.StartArray();
    for (const auto& op : operations) {
        writer.StartObject();
        writer.Key("operation");
        writer.String(OperationKindName(op.kind));
        writer.Key("count");
        writer.Uint64(op.count);
        writer.Key("errors");
        writer.Uint64(op.errors);
        writer.Key("avg_ms");
        writer.Double(op.avg_duration_ms);
        writer.Key("p95_ms");
        writer.Double(op.p95_ms);
        writer.Key("p99_ms");
        writer.Double(op.p99_ms);
        writer.Key("cache_hit_rate");
        writer.Double(op.cache_hit_rate);
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

core::Result<std::string> ParseConnectionString(const std::string& connection_string) {
    std::string path = connection_string;
    if (path.compare(0, std::char_traits<char>::length(kSqliteScheme), kSqliteScheme) == 0) {
        path = path.substr(std::char_traits<char>::length(kSqliteScheme));
    }
    if (path.empty()) {
        return core::InvalidArgumentError("Connection string names no database file: '" +
                                          connection_string + "'");
    }
    return path;
}

core::Result<void> ValidateConfig(const core::StoreConfig& config) {
    if (config.pool.max_connections == 0) {
        return core::InvalidArgumentError("pool.max_connections must be positive");
    }
    if (config.pool.acquire_timeout.count() < 0) {
        return core::InvalidArgumentError("pool.acquire_timeout must not be negative");
    }
    if (config.result_cache.eviction_target <= 0.0 || config.result_cache.eviction_target > 1.0) {
        return core::InvalidArgumentError("result_cache.eviction_target must be in (0, 1]");
    }
    if (config.partition.recent_age <= 0 ||
        config.partition.archive_age <= config.partition.recent_age) {
        return core::InvalidArgumentError(
            "partition ages must satisfy 0 < recent_age < archive_age");
    }
    if (config.partition.maintenance_interval.count() <= 0) {
        return core::InvalidArgumentError("partition.maintenance_interval must be positive");
    }
    if (config.default_batch_size == 0) {
        return core::InvalidArgumentError("default_batch_size must be positive");
    }
    if (!config.clock) {
        return core::InvalidArgumentError("clock must be set");
    }
    return core::Result<void>();
}

StoreContext::StoreContext(std::string db_path, const core::StoreConfig& config)
    : db_path_(std::move(db_path)),
      config_(config),
      statements_(config.statement_cache),
      results_(config.result_cache),
      metrics_() {
    pool_ = std::make_unique<ConnectionPool>(db_path_, config_.pool, &statements_);
    pool_->set_acquire_hook([this]() { results_.maybe_cleanup(); });
    temporal_ = std::make_unique<TemporalEngine>(*pool_, metrics_);
    graph_ = std::make_unique<GraphStore>(*pool_, results_, *temporal_, metrics_, config_);
    partitions_ = std::make_unique<PartitionManager>(*pool_, results_, metrics_,
                                                     config_.partition, config_.clock);
}

StoreContext::~StoreContext() {
    if (partitions_) {
        partitions_->stop();
    }
    if (pool_) {
        pool_->shutdown();
    }
    KGSTORE_INFO("Closed store at {}", db_path_);
}

core::Result<std::unique_ptr<StoreContext>> StoreContext::Open(const std::string& connection_string,
                                                               const core::StoreConfig& config) {
    auto path = ParseConnectionString(connection_string);
    if (!path.ok()) return path.error_info();
    auto valid = ValidateConfig(config);
    if (!valid.ok()) return valid.error_info();

    const std::filesystem::path file(path.value());
    if (file.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            return core::StorageFailureError("Failed to create directory " +
                                             file.parent_path().string() + ": " + ec.message());
        }
    }

    std::unique_ptr<StoreContext> context(new StoreContext(path.value(), config));

    {
        auto conn = context->pool().acquire();
        if (!conn.ok()) return conn.error_info();
        auto initialized = schema::Initialize(*conn.value());
        if (!initialized.ok()) {
            KGSTORE_ERROR("Schema initialization failed for {}: {}", path.value(),
                          initialized.error());
            return initialized.error_info();
        }
    }

    if (config.partition.enable_background) {
        context->partitions().start();
    }

    KGSTORE_INFO("Opened store at {} (max_connections={}, background_maintenance={})",
                 path.value(), config.pool.max_connections, config.partition.enable_background);
    return std::move(context);
}

HealthReport StoreContext::health() const {
    HealthReport report;
    report.db_path = db_path_;
    report.pool = pool_->stats();
    report.db_file_bytes = FileSize(db_path_);
    report.wal_file_bytes = FileSize(db_path_ + "-wal");
    report.shm_file_bytes = FileSize(db_path_ + "-shm");
    report.statement_cache_size = statements_.size();
    report.statement_cache_capacity = statements_.capacity();
    report.statement_cache_hit_ratio = statements_.hit_ratio();
    report.result_cache_size = results_.size();
    report.result_cache_capacity = results_.capacity();
    report.maintenance_running = partitions_->is_running();
    report.last_maintenance = partitions_->last_report();
    for (const auto& stats : metrics_.snapshot_all()) {
        if (stats.count > 0) {
            report.operations.push_back(stats);
        }
    }
    return report;
}

} // namespace storage
} // namespace kgstore
