#include "kgstore/storage/graph_store.h"

#include <algorithm>
#include <set>
#include <unordered_set>

#include "kgstore/common/json.h"
#include "kgstore/common/logger.h"
#include "kgstore/storage/partition_manager.h"
#include "kgstore/storage/sanitizer.h"
#include "kgstore/storage/schema.h"
#include "kgstore/storage/transaction.h"

namespace kgstore {
namespace storage {

namespace {

const std::string kEntityColumns(schema::kEntityColumns);
const std::string kRelationColumns(schema::kRelationColumns);

const std::string kSelectAllEntities =
    "SELECT " + kEntityColumns + " FROM entities ORDER BY name";
const std::string kSelectAllRelations =
    "SELECT " + kRelationColumns + " FROM relations ORDER BY from_entity, to_entity, relation_type";

const std::string kSelectEntityStats =
    "SELECT entity_type, entity_count, avg_confidence, first_created, last_updated "
    "FROM entity_type_stats ORDER BY entity_type";
const std::string kSelectRelationStats =
    "SELECT relation_type, relation_count, source_count, target_count "
    "FROM relation_type_stats ORDER BY relation_type";

core::Result<core::Entity> DecodeEntityRow(const Row& row) {
    return schema::DecodeEntity(row);
}

core::Result<core::Relation> DecodeRelationRow(const Row& row) {
    return schema::DecodeRelation(row);
}

std::vector<std::string> UniqueInOrder(const std::vector<std::string>& names) {
    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (const auto& name : names) {
        if (!name.empty() && seen.insert(name).second) {
            unique.push_back(name);
        }
    }
    return unique;
}

bool IsUniqueViolation(int extended_code) {
    return extended_code == SQLITE_CONSTRAINT_PRIMARYKEY ||
           extended_code == SQLITE_CONSTRAINT_UNIQUE;
}

}  // namespace

GraphStore::GraphStore(ConnectionPool& pool, ResultCache& results, TemporalEngine& temporal,
                       OperationMetrics& metrics, const core::StoreConfig& config)
    : pool_(pool), results_(results), temporal_(temporal), metrics_(metrics), config_(config) {}

size_t GraphStore::effective_batch(size_t batch_size) const {
    if (batch_size > 0) return batch_size;
    return config_.default_batch_size > 0 ? config_.default_batch_size : 1000;
}

template <typename T>
core::Result<T> GraphStore::finish_write(core::Result<T> result) {
    if (result.ok()) {
        results_.invalidate_all();
    }
    return result;
}

// ============================================================================
// Row helpers
// ============================================================================

core::Result<GraphStore::StoredMap> GraphStore::load_stored(Connection& conn,
                                                            const std::vector<std::string>& names,
                                                            size_t batch_size) {
    StoredMap stored;
    const auto unique = UniqueInOrder(names);
    for (size_t offset = 0; offset < unique.size(); offset += batch_size) {
        const size_t end = std::min(offset + batch_size, unique.size());
        SqlParams params(unique.begin() + offset, unique.begin() + end);

        auto rows = conn.query_list<StoredEntity>(
            "SELECT " + kEntityColumns + ", partition_name FROM entities WHERE name IN (" +
                schema::Placeholders(params.size()) + ")",
            params, [](const Row& row) -> core::Result<StoredEntity> {
                auto entity = schema::DecodeEntity(row);
                if (!entity.ok()) return entity.error_info();
                auto partition = schema::PartitionFromName(row.get_text(9));
                if (!partition.ok()) return partition.error_info();
                StoredEntity item;
                item.entity = entity.take_value();
                item.partition = partition.value();
                return item;
            });
        if (!rows.ok()) return rows.error_info();

        for (auto& item : rows.value()) {
            std::string name = item.entity.name;
            stored.emplace(std::move(name), std::move(item));
        }
    }
    return stored;
}

core::Result<std::vector<core::Relation>> GraphStore::load_relations_among(
    Connection& conn, const std::vector<std::string>& names, size_t batch_size) {
    std::vector<core::Relation> relations;
    const auto unique = UniqueInOrder(names);
    const std::set<std::string> members(unique.begin(), unique.end());

    for (size_t offset = 0; offset < unique.size(); offset += batch_size) {
        const size_t end = std::min(offset + batch_size, unique.size());
        SqlParams params(unique.begin() + offset, unique.begin() + end);

        auto rows = conn.query_list<core::Relation>(
            "SELECT " + kRelationColumns + " FROM relations WHERE from_entity IN (" +
                schema::Placeholders(params.size()) + ")",
            params, DecodeRelationRow);
        if (!rows.ok()) return rows.error_info();

        for (auto& relation : rows.value()) {
            if (members.count(relation.to_entity) > 0) {
                relations.push_back(std::move(relation));
            }
        }
    }

    std::sort(relations.begin(), relations.end(),
              [](const core::Relation& a, const core::Relation& b) { return a.key() < b.key(); });
    return relations;
}

core::Result<void> GraphStore::insert_entity(Connection& conn, const core::Entity& entity,
                                             core::Partition partition) {
    auto inserted = conn.execute(std::string("INSERT INTO ") + schema::TableFor(partition) + " (" +
                                     kEntityColumns + ") VALUES (" + schema::Placeholders(9) + ")",
                                 schema::EntityParams(entity));
    if (!inserted.ok()) {
        if (IsUniqueViolation(conn.extended_error_code())) {
            return core::EntityAlreadyExistsError("Entity already exists: " + entity.name);
        }
        return inserted.error_info();
    }
    return core::Result<void>();
}

core::Result<void> GraphStore::rewrite_entity(Connection& conn, const StoredEntity& stored) {
    const core::Entity& e = stored.entity;
    auto updated = conn.execute(
        std::string("UPDATE ") + schema::TableFor(stored.partition) +
            " SET entity_type = ?, observations = ?, confidence_score = ?, context_source = ?, "
            "metadata = ?, category_id = ?, last_updated = ? WHERE name = ?",
        {e.entity_type, common::EncodeStringList(e.observations), e.confidence_score,
         OptionalText(e.context_source), common::EncodeMetadata(e.metadata),
         OptionalInt(e.category_id), e.last_updated, e.name});
    if (!updated.ok()) return updated.error_info();
    if (updated.value() != 1) {
        return core::InternalError("Entity row for " + e.name + " vanished from partition " +
                                   core::PartitionName(stored.partition));
    }
    return core::Result<void>();
}

// ============================================================================
// Entities
// ============================================================================

core::Result<std::vector<core::Entity>> GraphStore::create_entities(
    std::vector<core::Entity> entities, size_t batch_size,
    const std::optional<std::string>& changed_by) {
    auto timer = metrics_.start(OperationKind::CREATE_ENTITIES);
    if (entities.empty()) {
        timer.set_success(true);
        return entities;
    }

    const core::Timestamp now = config_.clock();
    std::unordered_set<std::string> seen;
    for (auto& entity : entities) {
        SanitizeEntity(entity);
        auto valid = ValidateEntity(entity);
        if (!valid.ok()) return valid.error_info();
        if (!seen.insert(entity.name).second) {
            return core::EntityAlreadyExistsError("Entity appears more than once in the request: " +
                                                  entity.name);
        }
        if (entity.created_at == 0) entity.created_at = now;
        entity.last_updated = now;
    }

    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    const size_t batch = effective_batch(batch_size);
    auto result = RunInTransaction(
        *conn.value(), [&](Connection& c) -> core::Result<std::vector<core::Entity>> {
            for (size_t offset = 0; offset < entities.size(); offset += batch) {
                const size_t end = std::min(offset + batch, entities.size());

                std::vector<std::string> names;
                for (size_t i = offset; i < end; ++i) names.push_back(entities[i].name);
                auto existing = load_stored(c, names, batch);
                if (!existing.ok()) return existing.error_info();
                for (const auto& name : names) {
                    if (existing.value().count(name) > 0) {
                        return core::EntityAlreadyExistsError("Entity already exists: " + name);
                    }
                }

                for (size_t i = offset; i < end; ++i) {
                    const core::Entity& entity = entities[i];
                    auto inserted = insert_entity(
                        c, entity, PartitionFor(entity.created_at, now, config_.partition));
                    if (!inserted.ok()) return inserted.error_info();
                    auto versioned = temporal_.record_entity_change(c, entity, core::ChangeType::CREATE,
                                                                    now, changed_by);
                    if (!versioned.ok()) return versioned.error_info();
                }
            }
            return entities;
        });

    timer.set_success(result.ok());
    if (result.ok()) {
        KGSTORE_DEBUG("Created {} entities", result.value().size());
    }
    return finish_write(std::move(result));
}

core::Result<std::map<std::string, std::vector<std::string>>> GraphStore::add_observations(
    const std::vector<core::ObservationAddition>& additions, size_t batch_size,
    const std::optional<std::string>& changed_by) {
    using AddedMap = std::map<std::string, std::vector<std::string>>;
    auto timer = metrics_.start(OperationKind::ADD_OBSERVATIONS);

    std::vector<core::ObservationAddition> cleaned;
    cleaned.reserve(additions.size());
    for (const auto& addition : additions) {
        core::ObservationAddition item;
        item.entity_name = SanitizeName(addition.entity_name);
        if (item.entity_name.empty()) {
            return core::InvalidArgumentError("Observation target entity name must not be empty");
        }
        for (const auto& content : addition.contents) {
            item.contents.push_back(SanitizeText(content));
        }
        cleaned.push_back(std::move(item));
    }
    if (cleaned.empty()) {
        timer.set_success(true);
        return AddedMap();
    }

    const core::Timestamp now = config_.clock();
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    const size_t batch = effective_batch(batch_size);
    auto result = RunInTransaction(*conn.value(), [&](Connection& c) -> core::Result<AddedMap> {
        AddedMap added;
        for (size_t offset = 0; offset < cleaned.size(); offset += batch) {
            const size_t end = std::min(offset + batch, cleaned.size());

            std::vector<std::string> names;
            for (size_t i = offset; i < end; ++i) names.push_back(cleaned[i].entity_name);
            auto loaded = load_stored(c, names, batch);
            if (!loaded.ok()) return loaded.error_info();
            StoredMap& stored = loaded.value();

            for (size_t i = offset; i < end; ++i) {
                const auto& addition = cleaned[i];
                auto it = stored.find(addition.entity_name);
                if (it == stored.end()) {
                    return core::EntityNotFoundError("Entity not found: " + addition.entity_name);
                }
                auto& out = added[addition.entity_name];
                if (addition.contents.empty()) {
                    continue;
                }

                core::Entity& entity = it->second.entity;
                entity.observations.insert(entity.observations.end(), addition.contents.begin(),
                                           addition.contents.end());
                entity.last_updated = now;

                auto rewritten = rewrite_entity(c, it->second);
                if (!rewritten.ok()) return rewritten.error_info();
                auto versioned = temporal_.record_entity_change(c, entity, core::ChangeType::UPDATE,
                                                                now, changed_by);
                if (!versioned.ok()) return versioned.error_info();

                out.insert(out.end(), addition.contents.begin(), addition.contents.end());
            }
        }
        return added;
    });

    timer.set_success(result.ok());
    return finish_write(std::move(result));
}

core::Result<std::vector<std::string>> GraphStore::delete_entities(
    const std::vector<std::string>& names, size_t batch_size,
    const std::optional<std::string>& changed_by) {
    auto timer = metrics_.start(OperationKind::DELETE_ENTITIES);

    std::vector<std::string> cleaned;
    cleaned.reserve(names.size());
    for (const auto& name : names) {
        cleaned.push_back(SanitizeName(name));
    }
    cleaned = UniqueInOrder(cleaned);
    if (cleaned.empty()) {
        timer.set_success(true);
        return cleaned;
    }

    const core::Timestamp now = config_.clock();
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    const size_t batch = effective_batch(batch_size);
    auto result = RunInTransaction(
        *conn.value(), [&](Connection& c) -> core::Result<std::vector<std::string>> {
            std::vector<std::string> deleted;
            for (size_t offset = 0; offset < cleaned.size(); offset += batch) {
                const size_t end = std::min(offset + batch, cleaned.size());
                std::vector<std::string> chunk(cleaned.begin() + offset, cleaned.begin() + end);

                auto loaded = load_stored(c, chunk, batch);
                if (!loaded.ok()) return loaded.error_info();

                for (const auto& name : chunk) {
                    auto it = loaded.value().find(name);
                    if (it == loaded.value().end()) {
                        continue;  // Already gone
                    }

                    auto touching = c.query_list<core::Relation>(
                        "SELECT " + kRelationColumns +
                            " FROM relations WHERE from_entity = ?1 OR to_entity = ?1",
                        {name}, DecodeRelationRow);
                    if (!touching.ok()) return touching.error_info();
                    for (const auto& relation : touching.value()) {
                        auto versioned = temporal_.record_relation_change(
                            c, relation, core::ChangeType::DELETE, now, changed_by);
                        if (!versioned.ok()) return versioned.error_info();
                    }
                    auto unlinked = c.execute(
                        "DELETE FROM relations WHERE from_entity = ?1 OR to_entity = ?1", {name});
                    if (!unlinked.ok()) return unlinked.error_info();

                    auto removed = c.execute(std::string("DELETE FROM ") +
                                                 schema::TableFor(it->second.partition) +
                                                 " WHERE name = ?",
                                             {name});
                    if (!removed.ok()) return removed.error_info();

                    auto versioned = temporal_.record_entity_change(
                        c, it->second.entity, core::ChangeType::DELETE, now, changed_by);
                    if (!versioned.ok()) return versioned.error_info();

                    deleted.push_back(name);
                }
            }
            return deleted;
        });

    timer.set_success(result.ok());
    if (result.ok() && !result.value().empty()) {
        KGSTORE_DEBUG("Deleted {} entities", result.value().size());
    }
    return finish_write(std::move(result));
}

core::Result<std::map<std::string, std::vector<std::string>>> GraphStore::delete_observations(
    const std::vector<core::ObservationDeletion>& deletions, size_t batch_size,
    const std::optional<std::string>& changed_by) {
    using RemovedMap = std::map<std::string, std::vector<std::string>>;
    auto timer = metrics_.start(OperationKind::DELETE_OBSERVATIONS);

    std::vector<core::ObservationDeletion> cleaned;
    cleaned.reserve(deletions.size());
    for (const auto& deletion : deletions) {
        core::ObservationDeletion item;
        item.entity_name = SanitizeName(deletion.entity_name);
        if (item.entity_name.empty()) {
            continue;
        }
        for (const auto& observation : deletion.observations) {
            item.observations.push_back(SanitizeText(observation));
        }
        cleaned.push_back(std::move(item));
    }
    if (cleaned.empty()) {
        timer.set_success(true);
        return RemovedMap();
    }

    const core::Timestamp now = config_.clock();
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    const size_t batch = effective_batch(batch_size);
    auto result = RunInTransaction(*conn.value(), [&](Connection& c) -> core::Result<RemovedMap> {
        RemovedMap removed_by_entity;
        for (size_t offset = 0; offset < cleaned.size(); offset += batch) {
            const size_t end = std::min(offset + batch, cleaned.size());

            std::vector<std::string> names;
            for (size_t i = offset; i < end; ++i) names.push_back(cleaned[i].entity_name);
            auto loaded = load_stored(c, names, batch);
            if (!loaded.ok()) return loaded.error_info();
            StoredMap& stored = loaded.value();

            for (size_t i = offset; i < end; ++i) {
                const auto& deletion = cleaned[i];
                auto it = stored.find(deletion.entity_name);
                if (it == stored.end()) {
                    continue;
                }

                const std::unordered_set<std::string> targets(deletion.observations.begin(),
                                                              deletion.observations.end());
                core::Entity& entity = it->second.entity;
                std::vector<std::string> kept;
                std::vector<std::string> removed;
                for (auto& observation : entity.observations) {
                    if (targets.count(observation) > 0) {
                        removed.push_back(std::move(observation));
                    } else {
                        kept.push_back(std::move(observation));
                    }
                }
                entity.observations = std::move(kept);
                if (removed.empty()) {
                    continue;
                }
                entity.last_updated = now;

                auto rewritten = rewrite_entity(c, it->second);
                if (!rewritten.ok()) return rewritten.error_info();
                auto versioned = temporal_.record_entity_change(c, entity, core::ChangeType::UPDATE,
                                                                now, changed_by);
                if (!versioned.ok()) return versioned.error_info();

                auto& out = removed_by_entity[deletion.entity_name];
                out.insert(out.end(), removed.begin(), removed.end());
            }
        }
        return removed_by_entity;
    });

    timer.set_success(result.ok());
    return finish_write(std::move(result));
}

core::Result<core::Entity> GraphStore::update_entity(const std::string& name,
                                                     const core::EntityUpdate& update,
                                                     const std::optional<std::string>& changed_by) {
    auto timer = metrics_.start(OperationKind::UPDATE_ENTITY);

    const std::string target = SanitizeName(name);
    if (target.empty()) {
        return core::InvalidArgumentError("Entity name must not be empty");
    }
    if (update.empty()) {
        return core::InvalidArgumentError("Entity update for " + target + " has no fields");
    }

    core::EntityUpdate cleaned = update;
    if (cleaned.entity_type) {
        cleaned.entity_type = SanitizeName(*cleaned.entity_type);
        if (cleaned.entity_type->empty()) {
            return core::InvalidArgumentError("Entity type must not be empty for entity: " + target);
        }
    }
    if (cleaned.confidence_score) {
        auto valid = ValidateConfidence(*cleaned.confidence_score);
        if (!valid.ok()) return valid.error_info();
    }
    if (cleaned.observations) {
        for (auto& observation : *cleaned.observations) observation = SanitizeText(observation);
    }
    if (cleaned.context_source) {
        cleaned.context_source = SanitizeText(*cleaned.context_source);
    }

    const core::Timestamp now = config_.clock();
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto result = RunInTransaction(*conn.value(), [&](Connection& c) -> core::Result<core::Entity> {
        auto loaded = load_stored(c, {target}, 1);
        if (!loaded.ok()) return loaded.error_info();
        auto it = loaded.value().find(target);
        if (it == loaded.value().end()) {
            return core::EntityNotFoundError("Entity not found: " + target);
        }

        core::Entity& entity = it->second.entity;
        if (cleaned.entity_type) entity.entity_type = *cleaned.entity_type;
        if (cleaned.observations) entity.observations = *cleaned.observations;
        if (cleaned.confidence_score) entity.confidence_score = *cleaned.confidence_score;
        if (cleaned.context_source) entity.context_source = cleaned.context_source;
        if (cleaned.metadata) entity.metadata = *cleaned.metadata;
        if (cleaned.category_id) entity.category_id = cleaned.category_id;
        entity.last_updated = now;

        auto rewritten = rewrite_entity(c, it->second);
        if (!rewritten.ok()) return rewritten.error_info();
        auto versioned = temporal_.record_entity_change(c, entity, core::ChangeType::UPDATE, now,
                                                        changed_by);
        if (!versioned.ok()) return versioned.error_info();
        return entity;
    });

    timer.set_success(result.ok());
    return finish_write(std::move(result));
}

// ============================================================================
// Relations
// ============================================================================

core::Result<std::vector<core::Relation>> GraphStore::create_relations(
    std::vector<core::Relation> relations, size_t batch_size,
    const std::optional<std::string>& changed_by) {
    auto timer = metrics_.start(OperationKind::CREATE_RELATIONS);

    const core::Timestamp now = config_.clock();
    std::vector<core::Relation> cleaned;
    std::set<core::RelationKey> seen;
    for (auto& relation : relations) {
        SanitizeRelation(relation);
        auto valid = ValidateRelation(relation);
        if (!valid.ok()) return valid.error_info();
        if (!seen.insert(relation.key()).second) {
            continue;
        }
        relation.created_at = now;
        if (relation.valid_from == 0) relation.valid_from = now;
        if (relation.valid_until && *relation.valid_until <= relation.valid_from) {
            return core::InvalidArgumentError("Relation valid_until must be after valid_from");
        }
        cleaned.push_back(std::move(relation));
    }
    if (cleaned.empty()) {
        timer.set_success(true);
        return cleaned;
    }

    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    const size_t batch = effective_batch(batch_size);
    auto result = RunInTransaction(
        *conn.value(), [&](Connection& c) -> core::Result<std::vector<core::Relation>> {
            std::vector<core::Relation> created;
            for (size_t offset = 0; offset < cleaned.size(); offset += batch) {
                const size_t end = std::min(offset + batch, cleaned.size());

                std::vector<std::string> endpoints;
                for (size_t i = offset; i < end; ++i) {
                    endpoints.push_back(cleaned[i].from_entity);
                    endpoints.push_back(cleaned[i].to_entity);
                }
                auto existing = load_stored(c, endpoints, batch);
                if (!existing.ok()) return existing.error_info();

                for (size_t i = offset; i < end; ++i) {
                    const core::Relation& relation = cleaned[i];
                    for (const auto* endpoint : {&relation.from_entity, &relation.to_entity}) {
                        if (existing.value().count(*endpoint) == 0) {
                            return core::EntityNotFoundError("Entity not found: " + *endpoint);
                        }
                    }

                    auto inserted = c.execute(
                        "INSERT INTO relations (" + kRelationColumns + ") VALUES (" +
                            schema::Placeholders(8) +
                            ") ON CONFLICT(from_entity, to_entity, relation_type) DO NOTHING",
                        schema::RelationParams(relation));
                    if (!inserted.ok()) return inserted.error_info();
                    if (inserted.value() == 0) {
                        continue;  // Already present
                    }

                    auto versioned = temporal_.record_relation_change(
                        c, relation, core::ChangeType::CREATE, now, changed_by);
                    if (!versioned.ok()) return versioned.error_info();
                    created.push_back(relation);
                }
            }
            return created;
        });

    timer.set_success(result.ok());
    return finish_write(std::move(result));
}

core::Result<std::vector<core::Relation>> GraphStore::delete_relations(
    const std::vector<core::RelationKey>& keys, size_t batch_size,
    const std::optional<std::string>& changed_by) {
    auto timer = metrics_.start(OperationKind::DELETE_RELATIONS);

    std::vector<core::RelationKey> cleaned;
    std::set<core::RelationKey> seen;
    for (const auto& key : keys) {
        core::RelationKey item{SanitizeName(key.from_entity), SanitizeName(key.to_entity),
                               SanitizeName(key.relation_type)};
        if (item.from_entity.empty() || item.to_entity.empty() || item.relation_type.empty()) {
            return core::InvalidArgumentError("Relation to delete must name both endpoints and a type");
        }
        if (seen.insert(item).second) {
            cleaned.push_back(std::move(item));
        }
    }
    if (cleaned.empty()) {
        timer.set_success(true);
        return std::vector<core::Relation>();
    }

    const core::Timestamp now = config_.clock();
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    const size_t batch = effective_batch(batch_size);
    auto result = RunInTransaction(
        *conn.value(), [&](Connection& c) -> core::Result<std::vector<core::Relation>> {
            std::vector<core::Relation> deleted;
            for (size_t offset = 0; offset < cleaned.size(); offset += batch) {
                const size_t end = std::min(offset + batch, cleaned.size());
                for (size_t i = offset; i < end; ++i) {
                    const SqlParams key{cleaned[i].from_entity, cleaned[i].to_entity,
                                        cleaned[i].relation_type};
                    auto current = c.query_list<core::Relation>(
                        "SELECT " + kRelationColumns + " FROM relations "
                        "WHERE from_entity = ? AND to_entity = ? AND relation_type = ?",
                        key, DecodeRelationRow);
                    if (!current.ok()) return current.error_info();
                    if (current.value().empty()) {
                        continue;
                    }

                    auto removed = c.execute(
                        "DELETE FROM relations "
                        "WHERE from_entity = ? AND to_entity = ? AND relation_type = ?",
                        key);
                    if (!removed.ok()) return removed.error_info();

                    const core::Relation& relation = current.value().front();
                    auto versioned = temporal_.record_relation_change(
                        c, relation, core::ChangeType::DELETE, now, changed_by);
                    if (!versioned.ok()) return versioned.error_info();
                    deleted.push_back(relation);
                }
            }
            return deleted;
        });

    timer.set_success(result.ok());
    return finish_write(std::move(result));
}

// ============================================================================
// Reads
// ============================================================================

core::Result<core::KnowledgeGraph> GraphStore::search_nodes(const std::string& query) {
    auto timer = metrics_.start(OperationKind::SEARCH_NODES);

    const std::string needle = SanitizeName(query);
    if (needle.empty()) {
        return core::InvalidArgumentError("Search query must not be empty");
    }

    const std::string cache_key = "search:" + query;
    if (auto cached = results_.get_as<core::KnowledgeGraph>(cache_key)) {
        timer.set_cache_hit(true);
        timer.set_success(true);
        return std::move(*cached);
    }
    timer.set_cache_hit(false);

    const uint64_t generation = results_.generation();
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    const std::string pattern = "%" + EscapeLike(needle) + "%";
    auto entities = conn.value()->query_list<core::Entity>(
        "SELECT " + kEntityColumns + " FROM entities e "
        "WHERE e.name LIKE ?1 ESCAPE '\\' "
        "OR e.entity_type LIKE ?1 ESCAPE '\\' "
        "OR EXISTS (SELECT 1 FROM json_each(e.observations) "
        "           WHERE json_each.value LIKE ?1 ESCAPE '\\') "
        "ORDER BY e.name",
        {pattern}, DecodeEntityRow);
    if (!entities.ok()) return entities.error_info();

    std::vector<std::string> names;
    for (const auto& entity : entities.value()) names.push_back(entity.name);
    auto relations = load_relations_among(*conn.value(), names, effective_batch(0));
    if (!relations.ok()) return relations.error_info();

    core::KnowledgeGraph graph;
    graph.entities = entities.take_value();
    graph.relations = relations.take_value();

    results_.put(cache_key, graph, std::nullopt, generation);
    timer.set_success(true);
    return graph;
}

core::Result<core::KnowledgeGraph> GraphStore::open_nodes(const std::vector<std::string>& names) {
    auto timer = metrics_.start(OperationKind::OPEN_NODES);

    std::vector<std::string> cleaned;
    for (const auto& name : names) cleaned.push_back(SanitizeName(name));
    cleaned = UniqueInOrder(cleaned);

    core::KnowledgeGraph graph;
    if (cleaned.empty()) {
        timer.set_success(true);
        return graph;
    }

    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    const size_t batch = effective_batch(0);
    auto loaded = load_stored(*conn.value(), cleaned, batch);
    if (!loaded.ok()) return loaded.error_info();

    std::vector<std::string> found;
    for (auto& [name, stored] : loaded.value()) {
        found.push_back(name);
        graph.entities.push_back(std::move(stored.entity));
    }
    auto relations = load_relations_among(*conn.value(), found, batch);
    if (!relations.ok()) return relations.error_info();
    graph.relations = relations.take_value();

    timer.set_success(true);
    return graph;
}

core::Result<core::KnowledgeGraph> GraphStore::read_graph() {
    auto timer = metrics_.start(OperationKind::READ_GRAPH);

    const std::string cache_key = ResultCache::MakeKey(kSelectAllEntities + ";" + kSelectAllRelations, {});
    if (auto cached = results_.get_as<core::KnowledgeGraph>(cache_key)) {
        timer.set_cache_hit(true);
        timer.set_success(true);
        return std::move(*cached);
    }
    timer.set_cache_hit(false);

    const uint64_t generation = results_.generation();
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto entities = conn.value()->query_list<core::Entity>(kSelectAllEntities, {}, DecodeEntityRow);
    if (!entities.ok()) return entities.error_info();
    auto relations = conn.value()->query_list<core::Relation>(kSelectAllRelations, {}, DecodeRelationRow);
    if (!relations.ok()) return relations.error_info();

    core::KnowledgeGraph graph;
    graph.entities = entities.take_value();
    graph.relations = relations.take_value();

    results_.put(cache_key, graph, std::nullopt, generation);
    timer.set_success(true);
    return graph;
}

core::Result<std::vector<core::EntityTypeStats>> GraphStore::get_entity_statistics() {
    using StatsList = std::vector<core::EntityTypeStats>;
    auto timer = metrics_.start(OperationKind::ENTITY_STATISTICS);

    const std::string cache_key = ResultCache::MakeKey(kSelectEntityStats, {});
    if (auto cached = results_.get_as<StatsList>(cache_key)) {
        timer.set_cache_hit(true);
        timer.set_success(true);
        return std::move(*cached);
    }
    timer.set_cache_hit(false);

    const uint64_t generation = results_.generation();
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto stats = conn.value()->query_list<core::EntityTypeStats>(
        kSelectEntityStats, {}, [](const Row& row) -> core::Result<core::EntityTypeStats> {
            core::EntityTypeStats item;
            item.entity_type = row.get_text(0);
            item.entity_count = row.get_int(1);
            item.avg_confidence = row.get_double(2);
            item.first_created = row.get_int(3);
            item.last_updated = row.get_int(4);
            return item;
        });
    if (!stats.ok()) return stats.error_info();

    results_.put(cache_key, stats.value(), std::nullopt, generation);
    timer.set_success(true);
    return stats;
}

core::Result<std::vector<core::RelationTypeSummary>> GraphStore::get_relation_summary() {
    using SummaryList = std::vector<core::RelationTypeSummary>;
    auto timer = metrics_.start(OperationKind::RELATION_SUMMARY);

    const std::string cache_key = ResultCache::MakeKey(kSelectRelationStats, {});
    if (auto cached = results_.get_as<SummaryList>(cache_key)) {
        timer.set_cache_hit(true);
        timer.set_success(true);
        return std::move(*cached);
    }
    timer.set_cache_hit(false);

    const uint64_t generation = results_.generation();
    auto conn = pool_.acquire();
    if (!conn.ok()) return conn.error_info();

    auto summary = conn.value()->query_list<core::RelationTypeSummary>(
        kSelectRelationStats, {}, [](const Row& row) -> core::Result<core::RelationTypeSummary> {
            core::RelationTypeSummary item;
            item.relation_type = row.get_text(0);
            item.relation_count = row.get_int(1);
            item.source_count = row.get_int(2);
            item.target_count = row.get_int(3);
            return item;
        });
    if (!summary.ok()) return summary.error_info();

    results_.put(cache_key, summary.value(), std::nullopt, generation);
    timer.set_success(true);
    return summary;
}

} // namespace storage
} // namespace kgstore
