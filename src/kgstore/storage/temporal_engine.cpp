#include "kgstore/storage/temporal_engine.h"

#include <algorithm>

#include "kgstore/common/json.h"
#include "kgstore/common/logger.h"
#include "kgstore/storage/schema.h"

namespace kgstore {
namespace storage {

namespace {

const std::string kEntityVersionColumns =
    "entity_name, version_number, change_type, entity_type, observations, confidence_score, "
    "context_source, metadata, category_id, created_at, valid_from, valid_until, changed_by";

const std::string kPrefixedEntityVersionColumns =
    "ev.entity_name, ev.version_number, ev.change_type, ev.entity_type, ev.observations, "
    "ev.confidence_score, ev.context_source, ev.metadata, ev.category_id, ev.created_at, "
    "ev.valid_from, ev.valid_until, ev.changed_by";

const std::string kRelationVersionColumns =
    "from_entity, to_entity, relation_type, version_number, change_type, confidence_score, "
    "context_source, created_at, relation_valid_from, relation_valid_until, valid_from, "
    "valid_until, changed_by";

// Same order as schema::kRelationColumns so DecodeRelation applies
const std::string kRelationStateColumns =
    "from_entity, to_entity, relation_type, confidence_score, context_source, created_at, "
    "relation_valid_from, relation_valid_until";

// Interval test shared by every point-in-time query; ?1 is the instant
const std::string kOpenAtFirstParam =
    "change_type != 'delete' AND valid_from <= ?1 AND (valid_until IS NULL OR valid_until > ?1)";

const std::string kRelationValidAtFirstParam =
    "relation_valid_from <= ?1 AND (relation_valid_until IS NULL OR relation_valid_until > ?1)";

core::Result<core::ChangeType> DecodeChangeType(const std::string& name) {
    auto parsed = core::ParseChangeType(name);
    if (!parsed) {
        return core::StorageFailureError("Unknown change_type in version history: " + name);
    }
    return *parsed;
}

core::Result<core::EntityVersion> DecodeEntityVersion(const Row& row) {
    core::EntityVersion version;
    version.state.name = row.get_text(0);
    version.version_number = row.get_int(1);

    auto change_type = DecodeChangeType(row.get_text(2));
    if (!change_type.ok()) return change_type.error_info();
    version.change_type = change_type.value();

    version.state.entity_type = row.get_text(3);
    auto observations = common::DecodeStringList(row.get_text(4));
    if (!observations.ok()) return observations.error_info();
    version.state.observations = observations.take_value();
    version.state.confidence_score = row.get_double(5);
    version.state.context_source = row.get_optional_text(6);
    auto metadata = common::DecodeMetadata(row.get_text(7));
    if (!metadata.ok()) return metadata.error_info();
    version.state.metadata = metadata.take_value();
    version.state.category_id = row.get_optional_int(8);
    version.state.created_at = row.get_int(9);

    version.valid_from = row.get_int(10);
    version.valid_until = row.get_optional_int(11);
    version.changed_by = row.get_optional_text(12);
    version.state.last_updated = version.valid_from;
    return version;
}

core::Result<core::RelationVersion> DecodeRelationVersion(const Row& row) {
    core::RelationVersion version;
    version.state.from_entity = row.get_text(0);
    version.state.to_entity = row.get_text(1);
    version.state.relation_type = row.get_text(2);
    version.version_number = row.get_int(3);

    auto change_type = DecodeChangeType(row.get_text(4));
    if (!change_type.ok()) return change_type.error_info();
    version.change_type = change_type.value();

    version.state.confidence_score = row.get_double(5);
    version.state.context_source = row.get_optional_text(6);
    version.state.created_at = row.get_int(7);
    version.state.valid_from = row.get_int(8);
    version.state.valid_until = row.get_optional_int(9);
    version.valid_from = row.get_int(10);
    version.valid_until = row.get_optional_int(11);
    version.changed_by = row.get_optional_text(12);
    return version;
}

std::vector<std::string> ChangedFields(const core::Entity& before, const core::Entity& after) {
    std::vector<std::string> fields;
    if (before.entity_type != after.entity_type) fields.emplace_back("entity_type");
    if (before.observations != after.observations) fields.emplace_back("observations");
    if (before.confidence_score != after.confidence_score) fields.emplace_back("confidence_score");
    if (before.context_source != after.context_source) fields.emplace_back("context_source");
    if (before.metadata != after.metadata) fields.emplace_back("metadata");
    if (before.category_id != after.category_id) fields.emplace_back("category_id");
    return fields;
}

}  // namespace

TemporalEngine::TemporalEngine(ConnectionPool& pool, OperationMetrics& metrics)
    : pool_(pool), metrics_(metrics) {}

// ============================================================================
// Write side
// ============================================================================

core::Result<int64_t> TemporalEngine::record_entity_change(
    Connection& conn, const core::Entity& state, core::ChangeType change_type,
    core::Timestamp now, const std::optional<std::string>& changed_by) {
    int64_t max_version = 0;
    core::Timestamp latest_from = 0;
    auto history = conn.query(
        "SELECT COALESCE(MAX(version_number), 0), COALESCE(MAX(valid_from), 0) "
        "FROM entity_versions WHERE entity_name = ?",
        {state.name},
        [&](const Row& row) {
            max_version = row.get_int(0);
            latest_from = row.get_int(1);
            return false;
        });
    if (!history.ok()) return history.error_info();

    const core::Timestamp stamp = std::max(now, latest_from);

    auto closed = conn.execute(
        "UPDATE entity_versions SET valid_until = ? WHERE entity_name = ? AND valid_until IS NULL",
        {stamp, state.name});
    if (!closed.ok()) return closed.error_info();

    const int64_t version = max_version + 1;
    SqlParams params{
        state.name,
        version,
        std::string(core::ChangeTypeName(change_type)),
        state.entity_type,
        common::EncodeStringList(state.observations),
        state.confidence_score,
        OptionalText(state.context_source),
        common::EncodeMetadata(state.metadata),
        OptionalInt(state.category_id),
        state.created_at,
        stamp,
        change_type == core::ChangeType::DELETE ? SqlValue(stamp) : SqlValue(std::monostate{}),
        OptionalText(changed_by),
    };
    auto inserted = conn.execute("INSERT INTO entity_versions (" + kEntityVersionColumns +
                                     ") VALUES (" + schema::Placeholders(13) + ")",
                                 params);
    if (!inserted.ok()) return inserted.error_info();

    KGSTORE_TRACE("Entity {} -> version {} ({})", state.name, version,
                  core::ChangeTypeName(change_type));
    return version;
}

core::Result<int64_t> TemporalEngine::record_relation_change(
    Connection& conn, const core::Relation& state, core::ChangeType change_type,
    core::Timestamp now, const std::optional<std::string>& changed_by) {
    const SqlParams key{state.from_entity, state.to_entity, state.relation_type};

    int64_t max_version = 0;
    core::Timestamp latest_from = 0;
    auto history = conn.query(
        "SELECT COALESCE(MAX(version_number), 0), COALESCE(MAX(valid_from), 0) "
        "FROM relation_versions WHERE from_entity = ? AND to_entity = ? AND relation_type = ?",
        key,
        [&](const Row& row) {
            max_version = row.get_int(0);
            latest_from = row.get_int(1);
            return false;
        });
    if (!history.ok()) return history.error_info();

    const core::Timestamp stamp = std::max(now, latest_from);

    SqlParams close_params{stamp};
    close_params.insert(close_params.end(), key.begin(), key.end());
    auto closed = conn.execute(
        "UPDATE relation_versions SET valid_until = ? "
        "WHERE from_entity = ? AND to_entity = ? AND relation_type = ? AND valid_until IS NULL",
        close_params);
    if (!closed.ok()) return closed.error_info();

    const int64_t version = max_version + 1;
    SqlParams params{
        state.from_entity,
        state.to_entity,
        state.relation_type,
        version,
        std::string(core::ChangeTypeName(change_type)),
        state.confidence_score,
        OptionalText(state.context_source),
        state.created_at,
        state.valid_from,
        OptionalInt(state.valid_until),
        stamp,
        change_type == core::ChangeType::DELETE ? SqlValue(stamp) : SqlValue(std::monostate{}),
        OptionalText(changed_by),
    };
    auto inserted = conn.execute("INSERT INTO relation_versions (" + kRelationVersionColumns +
                                     ") VALUES (" + schema::Placeholders(13) + ")",
                                 params);
    if (!inserted.ok()) return inserted.error_info();
    return version;
}

// ============================================================================
// Point-in-time and history queries
// ============================================================================

core::Result<std::optional<core::EntityVersion>> TemporalEngine::get_entity_at_time(
    const std::string& name, core::Timestamp t) {
    auto timer = metrics_.start(OperationKind::ENTITY_AT_TIME);

    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto versions = conn.value()->query_list<core::EntityVersion>(
        "SELECT " + kEntityVersionColumns + " FROM entity_versions "
        "WHERE " + kOpenAtFirstParam + " AND entity_name = ?2 "
        "ORDER BY version_number DESC LIMIT 1",
        {t, name}, DecodeEntityVersion);
    if (!versions.ok()) return versions.error_info();

    timer.set_success(true);
    std::optional<core::EntityVersion> found;
    if (!versions.value().empty()) {
        found = versions.value().front();
    }
    return found;
}

core::Result<std::vector<core::EntityVersion>> TemporalEngine::get_entity_changes(
    const std::string& name, std::optional<core::Timestamp> start,
    std::optional<core::Timestamp> end) {
    auto timer = metrics_.start(OperationKind::ENTITY_CHANGES);
    if (start && end && *start > *end) {
        return core::InvalidArgumentError("Change range start is after its end");
    }

    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto versions = conn.value()->query_list<core::EntityVersion>(
        "SELECT " + kEntityVersionColumns + " FROM entity_versions "
        "WHERE entity_name = ?1 "
        "AND (?2 IS NULL OR valid_from >= ?2) AND (?3 IS NULL OR valid_from <= ?3) "
        "ORDER BY valid_from ASC, version_number ASC",
        {name, OptionalInt(start), OptionalInt(end)}, DecodeEntityVersion);
    timer.set_success(versions.ok());
    return versions;
}

core::Result<std::vector<core::Relation>> TemporalEngine::get_relations_at_time(
    const std::string& name, core::Timestamp t, core::Direction direction) {
    auto timer = metrics_.start(OperationKind::RELATIONS_AT_TIME);

    std::string endpoint;
    switch (direction) {
        case core::Direction::OUTGOING: endpoint = "from_entity = ?2"; break;
        case core::Direction::INCOMING: endpoint = "to_entity = ?2"; break;
        case core::Direction::BOTH: endpoint = "(from_entity = ?2 OR to_entity = ?2)"; break;
    }

    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto relations = conn.value()->query_list<core::Relation>(
        "SELECT " + kRelationStateColumns + " FROM relation_versions "
        "WHERE " + kOpenAtFirstParam + " AND " + kRelationValidAtFirstParam + " AND " + endpoint +
        " ORDER BY from_entity, to_entity, relation_type",
        {t, name}, [](const Row& row) { return schema::DecodeRelation(row); });
    timer.set_success(relations.ok());
    return relations;
}

core::Result<std::vector<core::EntityVersion>> TemporalEngine::get_changes_in_period(
    core::Timestamp start, core::Timestamp end, const std::optional<std::string>& entity_type,
    std::optional<core::ChangeType> change_type) {
    auto timer = metrics_.start(OperationKind::CHANGES_IN_PERIOD);
    if (start > end) {
        return core::InvalidArgumentError("Change period start is after its end");
    }

    SqlValue change_filter = std::monostate{};
    if (change_type) {
        change_filter = std::string(core::ChangeTypeName(*change_type));
    }

    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto versions = conn.value()->query_list<core::EntityVersion>(
        "SELECT " + kPrefixedEntityVersionColumns + " FROM entity_versions ev "
        "LEFT JOIN entities e ON e.name = ev.entity_name "
        "WHERE ev.valid_from >= ?1 AND ev.valid_from <= ?2 "
        "AND (?3 IS NULL OR COALESCE(e.entity_type, ev.entity_type) = ?3) "
        "AND (?4 IS NULL OR ev.change_type = ?4) "
        "ORDER BY ev.valid_from DESC, ev.entity_name ASC, ev.version_number DESC",
        {start, end, OptionalText(entity_type), change_filter}, DecodeEntityVersion);
    timer.set_success(versions.ok());
    return versions;
}

core::Result<std::vector<core::RelationVersion>> TemporalEngine::get_relation_changes(
    const core::RelationKey& key) {
    auto timer = metrics_.start(OperationKind::RELATION_CHANGES);

    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto versions = conn.value()->query_list<core::RelationVersion>(
        "SELECT " + kRelationVersionColumns + " FROM relation_versions "
        "WHERE from_entity = ? AND to_entity = ? AND relation_type = ? "
        "ORDER BY version_number ASC",
        {key.from_entity, key.to_entity, key.relation_type}, DecodeRelationVersion);
    timer.set_success(versions.ok());
    return versions;
}

core::Result<core::KnowledgeGraph> TemporalEngine::get_graph_at_time(core::Timestamp t) {
    auto timer = metrics_.start(OperationKind::GRAPH_AT_TIME);

    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto versions = conn.value()->query_list<core::EntityVersion>(
        "SELECT " + kEntityVersionColumns + " FROM entity_versions WHERE " + kOpenAtFirstParam +
        " ORDER BY entity_name",
        {t}, DecodeEntityVersion);
    if (!versions.ok()) return versions.error_info();

    auto relations = conn.value()->query_list<core::Relation>(
        "SELECT " + kRelationStateColumns + " FROM relation_versions "
        "WHERE " + kOpenAtFirstParam + " AND " + kRelationValidAtFirstParam +
        " ORDER BY from_entity, to_entity, relation_type",
        {t}, [](const Row& row) { return schema::DecodeRelation(row); });
    if (!relations.ok()) return relations.error_info();

    core::KnowledgeGraph graph;
    graph.entities.reserve(versions.value().size());
    for (auto& version : versions.value()) {
        graph.entities.push_back(std::move(version.state));
    }
    graph.relations = relations.take_value();

    timer.set_success(true);
    return graph;
}

core::Result<std::vector<core::VersionDiff>> TemporalEngine::get_change_summary(
    const std::string& name) {
    auto timer = metrics_.start(OperationKind::CHANGE_SUMMARY);

    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto versions = conn.value()->query_list<core::EntityVersion>(
        "SELECT " + kEntityVersionColumns + " FROM entity_versions "
        "WHERE entity_name = ? ORDER BY version_number ASC",
        {name}, DecodeEntityVersion);
    if (!versions.ok()) return versions.error_info();

    std::vector<core::VersionDiff> summary;
    const core::Entity empty{};
    const core::Entity* previous = &empty;
    for (const auto& version : versions.value()) {
        core::VersionDiff diff;
        diff.version_number = version.version_number;
        diff.change_type = version.change_type;
        diff.valid_from = version.valid_from;
        if (version.change_type != core::ChangeType::DELETE) {
            // A re-creation after a delete is compared against nothing
            const core::Entity& before =
                version.change_type == core::ChangeType::CREATE ? empty : *previous;
            diff.changed_fields = ChangedFields(before, version.state);
        }
        summary.push_back(std::move(diff));
        previous = &version.state;
    }

    timer.set_success(true);
    return summary;
}

} // namespace storage
} // namespace kgstore
