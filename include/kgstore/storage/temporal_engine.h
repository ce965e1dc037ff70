#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kgstore/core/result.h"
#include "kgstore/core/types.h"
#include "kgstore/storage/connection.h"
#include "kgstore/storage/connection_pool.h"
#include "kgstore/storage/operation_metrics.h"

namespace kgstore {
namespace storage {

/**
 * @brief Append-only version history for entities and relations
 *
 * Every identity has versions 1..k with no gaps and at most one open
 * version (valid_until unset). A change closes the open version at the
 * change time and appends max+1. Deletes append a zero-width tombstone
 * ([t, t)), so no point-in-time query ever returns a deleted state.
 *
 * Version intervals never run backwards: a change is stamped with
 * max(now, latest valid_from of the identity).
 *
 * The record_* methods are called by the operation layer on the
 * connection that holds its open transaction; the get_* methods borrow
 * their own pooled connection.
 */
class TemporalEngine {
public:
    TemporalEngine(ConnectionPool& pool, OperationMetrics& metrics);

    TemporalEngine(const TemporalEngine&) = delete;
    TemporalEngine& operator=(const TemporalEngine&) = delete;

    /**
     * @brief Appends a version carrying `state` and returns its number
     */
    core::Result<int64_t> record_entity_change(Connection& conn, const core::Entity& state,
                                               core::ChangeType change_type, core::Timestamp now,
                                               const std::optional<std::string>& changed_by);

    core::Result<int64_t> record_relation_change(Connection& conn, const core::Relation& state,
                                                 core::ChangeType change_type, core::Timestamp now,
                                                 const std::optional<std::string>& changed_by);

    /**
     * @brief State of the entity at `t`, or nullopt if it did not exist then
     */
    core::Result<std::optional<core::EntityVersion>> get_entity_at_time(const std::string& name,
                                                                       core::Timestamp t);

    /**
     * @brief Versions whose valid_from lies in [start, end], oldest first
     */
    core::Result<std::vector<core::EntityVersion>> get_entity_changes(
        const std::string& name,
        std::optional<core::Timestamp> start = std::nullopt,
        std::optional<core::Timestamp> end = std::nullopt);

    /**
     * @brief Relations touching `name` that were recorded and valid at `t`
     */
    core::Result<std::vector<core::Relation>> get_relations_at_time(const std::string& name,
                                                                   core::Timestamp t,
                                                                   core::Direction direction);

    /**
     * @brief Entity versions started in [start, end], newest first
     *
     * entity_type filters on the entity's current type, or on the type of
     * the version itself once the entity has been deleted.
     */
    core::Result<std::vector<core::EntityVersion>> get_changes_in_period(
        core::Timestamp start, core::Timestamp end,
        const std::optional<std::string>& entity_type = std::nullopt,
        std::optional<core::ChangeType> change_type = std::nullopt);

    core::Result<std::vector<core::RelationVersion>> get_relation_changes(
        const core::RelationKey& key);

    /**
     * @brief Entities and relations as they were at `t`
     */
    core::Result<core::KnowledgeGraph> get_graph_at_time(core::Timestamp t);

    /**
     * @brief For every version of `name`, the fields that differ from the previous one
     */
    core::Result<std::vector<core::VersionDiff>> get_change_summary(const std::string& name);

private:
    ConnectionPool& pool_;
    OperationMetrics& metrics_;
};

} // namespace storage
} // namespace kgstore
