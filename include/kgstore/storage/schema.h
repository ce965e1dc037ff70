#pragma once

#include <string>

#include "kgstore/core/result.h"
#include "kgstore/core/types.h"
#include "kgstore/storage/connection.h"

namespace kgstore {
namespace storage {
namespace schema {

constexpr const char* kRecentTable = "entities_recent";
constexpr const char* kIntermediateTable = "entities_intermediate";
constexpr const char* kArchiveTable = "entities_archive";

// UNION ALL of the three partitions plus a partition_name column
constexpr const char* kEntitiesView = "entities";

constexpr const char* kRelationsTable = "relations";
constexpr const char* kEntityVersionsTable = "entity_versions";
constexpr const char* kRelationVersionsTable = "relation_versions";
constexpr const char* kEntityTypeStatsTable = "entity_type_stats";
constexpr const char* kRelationTypeStatsTable = "relation_type_stats";

/**
 * @brief Entity columns shared by the partition tables and the view, in decode order
 */
constexpr const char* kEntityColumns =
    "name, entity_type, observations, confidence_score, context_source, "
    "metadata, category_id, created_at, last_updated";

/**
 * @brief Relation columns, in decode order
 */
constexpr const char* kRelationColumns =
    "from_entity, to_entity, relation_type, confidence_score, context_source, "
    "created_at, valid_from, valid_until";

const char* TableFor(core::Partition partition);
core::Result<core::Partition> PartitionFromName(const std::string& name);

/**
 * @brief Creates every table, index and view that does not exist yet
 */
core::Result<void> Initialize(Connection& conn);

/**
 * @brief Decodes kEntityColumns starting at `first`
 */
core::Result<core::Entity> DecodeEntity(const Row& row, int first = 0);

/**
 * @brief Decodes kRelationColumns starting at `first`
 */
core::Result<core::Relation> DecodeRelation(const Row& row, int first = 0);

/**
 * @brief Bind values for kEntityColumns, in order
 */
SqlParams EntityParams(const core::Entity& entity);

/**
 * @brief Bind values for kRelationColumns, in order
 */
SqlParams RelationParams(const core::Relation& relation);

/**
 * @brief "?, ?, ..." with `count` placeholders
 */
std::string Placeholders(size_t count);

} // namespace schema
} // namespace storage
} // namespace kgstore
