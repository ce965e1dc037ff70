#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kgstore/core/config.h"
#include "kgstore/core/result.h"
#include "kgstore/core/types.h"
#include "kgstore/storage/connection_pool.h"
#include "kgstore/storage/operation_metrics.h"
#include "kgstore/storage/result_cache.h"
#include "kgstore/storage/temporal_engine.h"

namespace kgstore {
namespace storage {

/**
 * @brief Batched entity/relation operations over the partitioned store
 *
 * Every mutating call validates its whole input before writing, then runs
 * on one pooled connection inside one transaction: it either applies
 * completely or not at all. Each row-level change appends a version
 * through the TemporalEngine in the same transaction. After a commit the
 * whole result cache is invalidated.
 *
 * batch_size bounds how many names go into one IN (...) lookup; 0 means
 * the configured default. It never splits the transaction.
 *
 * Reads see all three partitions through the `entities` view.
 */
class GraphStore {
public:
    GraphStore(ConnectionPool& pool, ResultCache& results, TemporalEngine& temporal,
               OperationMetrics& metrics, const core::StoreConfig& config);

    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    /**
     * @brief Creates entities; any existing or repeated name fails the whole call
     *
     * created_at == 0 means now; an older created_at places the row straight
     * into the partition matching its age.
     * @return The stored records
     */
    core::Result<std::vector<core::Entity>> create_entities(
        std::vector<core::Entity> entities, size_t batch_size = 0,
        const std::optional<std::string>& changed_by = std::nullopt);

    /**
     * @brief Appends observations, keeping order and duplicates
     * @return Entity name to the observations added to it
     */
    core::Result<std::map<std::string, std::vector<std::string>>> add_observations(
        const std::vector<core::ObservationAddition>& additions, size_t batch_size = 0,
        const std::optional<std::string>& changed_by = std::nullopt);

    /**
     * @brief Deletes entities and every relation touching them; absent names are ignored
     * @return Names that were deleted
     */
    core::Result<std::vector<std::string>> delete_entities(
        const std::vector<std::string>& names, size_t batch_size = 0,
        const std::optional<std::string>& changed_by = std::nullopt);

    /**
     * @brief Removes observations by exact match; absent entities are ignored
     * @return Entity name to the observations removed from it
     */
    core::Result<std::map<std::string, std::vector<std::string>>> delete_observations(
        const std::vector<core::ObservationDeletion>& deletions, size_t batch_size = 0,
        const std::optional<std::string>& changed_by = std::nullopt);

    /**
     * @brief Creates relations between live entities; exact duplicates are skipped
     * @return Relations that were newly inserted
     */
    core::Result<std::vector<core::Relation>> create_relations(
        std::vector<core::Relation> relations, size_t batch_size = 0,
        const std::optional<std::string>& changed_by = std::nullopt);

    /**
     * @brief Deletes relations by identity; absent ones are ignored
     * @return Relations that were deleted
     */
    core::Result<std::vector<core::Relation>> delete_relations(
        const std::vector<core::RelationKey>& keys, size_t batch_size = 0,
        const std::optional<std::string>& changed_by = std::nullopt);

    /**
     * @brief Case-insensitive substring match on name, type and observations
     *
     * Returns the matches plus the relations with both endpoints among them.
     * Cached under "search:" + query until the next write.
     */
    core::Result<core::KnowledgeGraph> search_nodes(const std::string& query);

    /**
     * @brief Exactly the named entities plus the relations among them
     */
    core::Result<core::KnowledgeGraph> open_nodes(const std::vector<std::string>& names);

    /**
     * @brief Every live entity and relation
     */
    core::Result<core::KnowledgeGraph> read_graph();

    core::Result<core::Entity> update_entity(
        const std::string& name, const core::EntityUpdate& update,
        const std::optional<std::string>& changed_by = std::nullopt);

    /**
     * @brief Per-type summary as of the last maintenance pass
     */
    core::Result<std::vector<core::EntityTypeStats>> get_entity_statistics();

    core::Result<std::vector<core::RelationTypeSummary>> get_relation_summary();

private:
    struct StoredEntity {
        core::Entity entity;
        core::Partition partition = core::Partition::RECENT;
    };
    using StoredMap = std::map<std::string, StoredEntity>;

    size_t effective_batch(size_t batch_size) const;

    core::Result<StoredMap> load_stored(Connection& conn, const std::vector<std::string>& names,
                                        size_t batch_size);
    core::Result<std::vector<core::Relation>> load_relations_among(
        Connection& conn, const std::vector<std::string>& names, size_t batch_size);
    core::Result<void> insert_entity(Connection& conn, const core::Entity& entity,
                                     core::Partition partition);
    core::Result<void> rewrite_entity(Connection& conn, const StoredEntity& stored);

    template <typename T>
    core::Result<T> finish_write(core::Result<T> result);

    ConnectionPool& pool_;
    ResultCache& results_;
    TemporalEngine& temporal_;
    OperationMetrics& metrics_;
    core::StoreConfig config_;
};

} // namespace storage
} // namespace kgstore
