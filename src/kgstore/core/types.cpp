#include "kgstore/core/types.h"

#include <chrono>
#include <cmath>
#include <tuple>

namespace kgstore {
namespace core {

Timestamp NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

double ClampConfidence(double score) {
    if (std::isnan(score)) return 0.0;
    if (score < 0.0) return 0.0;
    if (score > 1.0) return 1.0;
    return score;
}

const char* PartitionName(Partition partition) {
    switch (partition) {
        case Partition::RECENT: return "recent";
        case Partition::INTERMEDIATE: return "intermediate";
        case Partition::ARCHIVE: return "archive";
    }
    return "recent";
}

const char* ChangeTypeName(ChangeType type) {
    switch (type) {
        case ChangeType::CREATE: return "create";
        case ChangeType::UPDATE: return "update";
        case ChangeType::DELETE: return "delete";
    }
    return "create";
}

std::optional<ChangeType> ParseChangeType(const std::string& name) {
    if (name == "create") return ChangeType::CREATE;
    if (name == "update") return ChangeType::UPDATE;
    if (name == "delete") return ChangeType::DELETE;
    return std::nullopt;
}

Entity::Entity(std::string name, std::string entity_type,
               std::vector<std::string> observations, double confidence)
    : name(std::move(name)),
      entity_type(std::move(entity_type)),
      observations(std::move(observations)),
      confidence_score(ClampConfidence(confidence)) {}

bool Entity::operator==(const Entity& other) const {
    return name == other.name && entity_type == other.entity_type &&
           observations == other.observations &&
           confidence_score == other.confidence_score &&
           context_source == other.context_source && metadata == other.metadata &&
           created_at == other.created_at && last_updated == other.last_updated &&
           category_id == other.category_id;
}

bool RelationKey::operator<(const RelationKey& other) const {
    return std::tie(from_entity, to_entity, relation_type) <
           std::tie(other.from_entity, other.to_entity, other.relation_type);
}

Relation::Relation(std::string from, std::string to, std::string type, double confidence)
    : from_entity(std::move(from)),
      to_entity(std::move(to)),
      relation_type(std::move(type)),
      confidence_score(ClampConfidence(confidence)) {}

bool Relation::operator==(const Relation& other) const {
    return from_entity == other.from_entity && to_entity == other.to_entity &&
           relation_type == other.relation_type &&
           confidence_score == other.confidence_score &&
           context_source == other.context_source && created_at == other.created_at &&
           valid_from == other.valid_from && valid_until == other.valid_until;
}

}  // namespace core
}  // namespace kgstore
