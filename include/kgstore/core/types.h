#ifndef KGSTORE_CORE_TYPES_H_
#define KGSTORE_CORE_TYPES_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kgstore {
namespace core {

/**
 * @brief Milliseconds since the Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Duration in milliseconds
 */
using Duration = int64_t;

constexpr Duration kMillisPerDay = 86'400'000;

/**
 * @brief Wall-clock time in milliseconds
 */
Timestamp NowMillis();

/**
 * @brief Opaque string-keyed metadata attached to an entity
 */
using Metadata = std::map<std::string, std::string>;

/**
 * @brief Clamps a confidence score into [0, 1]; NaN becomes 0
 */
double ClampConfidence(double score);

/**
 * @brief Age bucket an entity row physically lives in
 */
enum class Partition {
    RECENT,
    INTERMEDIATE,
    ARCHIVE
};

const char* PartitionName(Partition partition);

enum class ChangeType {
    CREATE,
    UPDATE,
    DELETE
};

const char* ChangeTypeName(ChangeType type);
std::optional<ChangeType> ParseChangeType(const std::string& name);

/**
 * @brief Which side of a relation an entity must be on
 */
enum class Direction {
    OUTGOING,
    INCOMING,
    BOTH
};

/**
 * @brief A named node of the knowledge graph
 *
 * The name is the identity and is unique among live entities. The
 * constructor clamps the confidence score; direct field assignment does not,
 * and the operation layer rejects out-of-range values it finds there.
 */
struct Entity {
    std::string name;
    std::string entity_type;
    std::vector<std::string> observations;
    double confidence_score = 1.0;
    std::optional<std::string> context_source;
    Metadata metadata;
    Timestamp created_at = 0;    // 0 on input means "now"
    Timestamp last_updated = 0;
    std::optional<int64_t> category_id;

    Entity() = default;
    Entity(std::string name, std::string entity_type,
           std::vector<std::string> observations = {},
           double confidence = 1.0);

    bool operator==(const Entity& other) const;
    bool operator!=(const Entity& other) const { return !(*this == other); }
};

/**
 * @brief Identity of a relation
 */
struct RelationKey {
    std::string from_entity;
    std::string to_entity;
    std::string relation_type;

    bool operator==(const RelationKey& other) const {
        return from_entity == other.from_entity && to_entity == other.to_entity &&
               relation_type == other.relation_type;
    }
    bool operator<(const RelationKey& other) const;
};

/**
 * @brief Typed directed edge between two live entities
 */
struct Relation {
    std::string from_entity;
    std::string to_entity;
    std::string relation_type;
    double confidence_score = 1.0;
    std::optional<std::string> context_source;
    Timestamp created_at = 0;
    Timestamp valid_from = 0;                 // 0 on input means "now"
    std::optional<Timestamp> valid_until;     // nullopt: still valid

    Relation() = default;
    Relation(std::string from, std::string to, std::string type,
             double confidence = 1.0);

    RelationKey key() const { return RelationKey{from_entity, to_entity, relation_type}; }
    bool operator==(const Relation& other) const;
};

struct KnowledgeGraph {
    std::vector<Entity> entities;
    std::vector<Relation> relations;
};

struct ObservationAddition {
    std::string entity_name;
    std::vector<std::string> contents;
};

struct ObservationDeletion {
    std::string entity_name;
    std::vector<std::string> observations;
};

/**
 * @brief Partial update of an entity; unset fields are left unchanged
 */
struct EntityUpdate {
    std::optional<std::string> entity_type;
    std::optional<std::vector<std::string>> observations;
    std::optional<double> confidence_score;
    std::optional<std::string> context_source;
    std::optional<Metadata> metadata;
    std::optional<int64_t> category_id;

    bool empty() const {
        return !entity_type && !observations && !confidence_score &&
               !context_source && !metadata && !category_id;
    }
};

/**
 * @brief Immutable snapshot of an entity over [valid_from, valid_until)
 */
struct EntityVersion {
    int64_t version_number = 0;
    ChangeType change_type = ChangeType::CREATE;
    Entity state;
    Timestamp valid_from = 0;
    std::optional<Timestamp> valid_until;
    std::optional<std::string> changed_by;
};

/**
 * @brief Immutable snapshot of a relation over [valid_from, valid_until)
 *
 * The interval is the version's transaction-time interval; state.valid_from
 * and state.valid_until are the relation's own validity.
 */
struct RelationVersion {
    int64_t version_number = 0;
    ChangeType change_type = ChangeType::CREATE;
    Relation state;
    Timestamp valid_from = 0;
    std::optional<Timestamp> valid_until;
    std::optional<std::string> changed_by;
};

/**
 * @brief Field-level difference between a version and its predecessor
 */
struct VersionDiff {
    int64_t version_number = 0;
    ChangeType change_type = ChangeType::CREATE;
    Timestamp valid_from = 0;
    std::vector<std::string> changed_fields;
};

struct EntityTypeStats {
    std::string entity_type;
    int64_t entity_count = 0;
    double avg_confidence = 0.0;
    Timestamp first_created = 0;
    Timestamp last_updated = 0;
};

struct RelationTypeSummary {
    std::string relation_type;
    int64_t relation_count = 0;
    int64_t source_count = 0;
    int64_t target_count = 0;
};

} // namespace core
} // namespace kgstore

#endif // KGSTORE_CORE_TYPES_H_
