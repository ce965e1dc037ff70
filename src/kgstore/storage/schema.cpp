#include "kgstore/storage/schema.h"

#include "kgstore/common/json.h"
#include "kgstore/common/logger.h"
#include "kgstore/storage/transaction.h"

namespace kgstore {
namespace storage {
namespace schema {

namespace {

std::string PartitionTableDdl(const char* table) {
    std::string t(table);
    return "CREATE TABLE IF NOT EXISTS " + t + " ("
           "  name TEXT PRIMARY KEY,"
           "  entity_type TEXT NOT NULL,"
           "  observations TEXT NOT NULL DEFAULT '[]',"
           "  confidence_score REAL NOT NULL DEFAULT 1.0,"
           "  context_source TEXT,"
           "  metadata TEXT NOT NULL DEFAULT '{}',"
           "  category_id INTEGER,"
           "  created_at INTEGER NOT NULL,"
           "  last_updated INTEGER NOT NULL"
           ");"
           "CREATE INDEX IF NOT EXISTS idx_" + t + "_type ON " + t + "(entity_type);"
           "CREATE INDEX IF NOT EXISTS idx_" + t + "_created ON " + t + "(created_at);";
}

std::string EntitiesViewDdl() {
    std::string columns(kEntityColumns);
    return std::string("CREATE VIEW IF NOT EXISTS ") + kEntitiesView + " AS "
           "SELECT " + columns + ", 'recent' AS partition_name FROM " + kRecentTable +
           " UNION ALL "
           "SELECT " + columns + ", 'intermediate' AS partition_name FROM " + kIntermediateTable +
           " UNION ALL "
           "SELECT " + columns + ", 'archive' AS partition_name FROM " + kArchiveTable + ";";
}

const char* kRelationsDdl =
    "CREATE TABLE IF NOT EXISTS relations ("
    "  from_entity TEXT NOT NULL,"
    "  to_entity TEXT NOT NULL,"
    "  relation_type TEXT NOT NULL,"
    "  confidence_score REAL NOT NULL DEFAULT 1.0,"
    "  context_source TEXT,"
    "  created_at INTEGER NOT NULL,"
    "  valid_from INTEGER NOT NULL,"
    "  valid_until INTEGER,"
    "  PRIMARY KEY (from_entity, to_entity, relation_type)"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_relations_to ON relations(to_entity);"
    "CREATE INDEX IF NOT EXISTS idx_relations_type ON relations(relation_type);";

const char* kVersionsDdl =
    "CREATE TABLE IF NOT EXISTS entity_versions ("
    "  entity_name TEXT NOT NULL,"
    "  version_number INTEGER NOT NULL,"
    "  change_type TEXT NOT NULL CHECK (change_type IN ('create', 'update', 'delete')),"
    "  entity_type TEXT NOT NULL,"
    "  observations TEXT NOT NULL,"
    "  confidence_score REAL NOT NULL,"
    "  context_source TEXT,"
    "  metadata TEXT NOT NULL,"
    "  category_id INTEGER,"
    "  created_at INTEGER NOT NULL,"
    "  valid_from INTEGER NOT NULL,"
    "  valid_until INTEGER,"
    "  changed_by TEXT,"
    "  PRIMARY KEY (entity_name, version_number)"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_entity_versions_valid_from ON entity_versions(valid_from);"
    "CREATE TABLE IF NOT EXISTS relation_versions ("
    "  from_entity TEXT NOT NULL,"
    "  to_entity TEXT NOT NULL,"
    "  relation_type TEXT NOT NULL,"
    "  version_number INTEGER NOT NULL,"
    "  change_type TEXT NOT NULL CHECK (change_type IN ('create', 'update', 'delete')),"
    "  confidence_score REAL NOT NULL,"
    "  context_source TEXT,"
    "  created_at INTEGER NOT NULL,"
    "  relation_valid_from INTEGER NOT NULL,"
    "  relation_valid_until INTEGER,"
    "  valid_from INTEGER NOT NULL,"
    "  valid_until INTEGER,"
    "  changed_by TEXT,"
    "  PRIMARY KEY (from_entity, to_entity, relation_type, version_number)"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_relation_versions_to ON relation_versions(to_entity);"
    "CREATE INDEX IF NOT EXISTS idx_relation_versions_valid_from ON relation_versions(valid_from);";

const char* kSummaryDdl =
    "CREATE TABLE IF NOT EXISTS entity_type_stats ("
    "  entity_type TEXT PRIMARY KEY,"
    "  entity_count INTEGER NOT NULL,"
    "  avg_confidence REAL NOT NULL,"
    "  first_created INTEGER NOT NULL,"
    "  last_updated INTEGER NOT NULL,"
    "  refreshed_at INTEGER NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS relation_type_stats ("
    "  relation_type TEXT PRIMARY KEY,"
    "  relation_count INTEGER NOT NULL,"
    "  source_count INTEGER NOT NULL,"
    "  target_count INTEGER NOT NULL,"
    "  refreshed_at INTEGER NOT NULL"
    ");";

}  // namespace

const char* TableFor(core::Partition partition) {
    switch (partition) {
        case core::Partition::RECENT: return kRecentTable;
        case core::Partition::INTERMEDIATE: return kIntermediateTable;
        case core::Partition::ARCHIVE: return kArchiveTable;
    }
    return kRecentTable;
}

core::Result<core::Partition> PartitionFromName(const std::string& name) {
    if (name == "recent") return core::Partition::RECENT;
    if (name == "intermediate") return core::Partition::INTERMEDIATE;
    if (name == "archive") return core::Partition::ARCHIVE;
    return core::InternalError("Unknown partition: " + name);
}

core::Result<void> Initialize(Connection& conn) {
    auto created = RunInTransaction(conn, [](Connection& c) -> core::Result<void> {
        std::string ddl = PartitionTableDdl(kRecentTable) +
                          PartitionTableDdl(kIntermediateTable) +
                          PartitionTableDdl(kArchiveTable) +
                          EntitiesViewDdl() + kRelationsDdl + kVersionsDdl + kSummaryDdl;
        return c.exec_script(ddl);
    });
    if (!created.ok()) {
        KGSTORE_ERROR("Schema initialization failed: {}", created.error());
        return created;
    }
    KGSTORE_DEBUG("Schema ready on {}", conn.path());
    return created;
}

core::Result<core::Entity> DecodeEntity(const Row& row, int first) {
    core::Entity entity;
    entity.name = row.get_text(first);
    entity.entity_type = row.get_text(first + 1);

    auto observations = common::DecodeStringList(row.get_text(first + 2));
    if (!observations.ok()) return observations.error_info();
    entity.observations = observations.take_value();

    entity.confidence_score = row.get_double(first + 3);
    entity.context_source = row.get_optional_text(first + 4);

    auto metadata = common::DecodeMetadata(row.get_text(first + 5));
    if (!metadata.ok()) return metadata.error_info();
    entity.metadata = metadata.take_value();

    entity.category_id = row.get_optional_int(first + 6);
    entity.created_at = row.get_int(first + 7);
    entity.last_updated = row.get_int(first + 8);
    return entity;
}

core::Result<core::Relation> DecodeRelation(const Row& row, int first) {
    core::Relation relation;
    relation.from_entity = row.get_text(first);
    relation.to_entity = row.get_text(first + 1);
    relation.relation_type = row.get_text(first + 2);
    relation.confidence_score = row.get_double(first + 3);
    relation.context_source = row.get_optional_text(first + 4);
    relation.created_at = row.get_int(first + 5);
    relation.valid_from = row.get_int(first + 6);
    relation.valid_until = row.get_optional_int(first + 7);
    return relation;
}

SqlParams EntityParams(const core::Entity& entity) {
    return SqlParams{
        entity.name,
        entity.entity_type,
        common::EncodeStringList(entity.observations),
        entity.confidence_score,
        OptionalText(entity.context_source),
        common::EncodeMetadata(entity.metadata),
        OptionalInt(entity.category_id),
        entity.created_at,
        entity.last_updated,
    };
}

SqlParams RelationParams(const core::Relation& relation) {
    return SqlParams{
        relation.from_entity,
        relation.to_entity,
        relation.relation_type,
        relation.confidence_score,
        OptionalText(relation.context_source),
        relation.created_at,
        relation.valid_from,
        OptionalInt(relation.valid_until),
    };
}

std::string Placeholders(size_t count) {
    std::string out;
    out.reserve(count * 3);
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) out += ", ";
        out += "?";
    }
    return out;
}

} // namespace schema
} // namespace storage
} // namespace kgstore
