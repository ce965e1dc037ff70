#include "kgstore/storage/sanitizer.h"

#include <cmath>

namespace kgstore {
namespace storage {

namespace {

bool IsControl(unsigned char ch) {
    return ch < 0x20 || ch == 0x7f;
}

bool IsSpace(unsigned char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

}  // namespace

std::string SanitizeName(const std::string& value) {
    std::string cleaned;
    cleaned.reserve(value.size());
    for (char ch : value) {
        unsigned char uch = static_cast<unsigned char>(ch);
        if (IsControl(uch)) {
            // Tabs and newlines collapse to a space so words stay separated
            if (IsSpace(uch)) cleaned.push_back(' ');
            continue;
        }
        cleaned.push_back(ch);
    }

    size_t begin = 0;
    while (begin < cleaned.size() && IsSpace(static_cast<unsigned char>(cleaned[begin]))) ++begin;
    size_t end = cleaned.size();
    while (end > begin && IsSpace(static_cast<unsigned char>(cleaned[end - 1]))) --end;
    return cleaned.substr(begin, end - begin);
}

std::string SanitizeText(const std::string& value) {
    std::string cleaned;
    cleaned.reserve(value.size());
    for (char ch : value) {
        if (ch != '\0') cleaned.push_back(ch);
    }
    return cleaned;
}

std::string EscapeLike(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '\\' || ch == '%' || ch == '_') {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

void SanitizeEntity(core::Entity& entity) {
    entity.name = SanitizeName(entity.name);
    entity.entity_type = SanitizeName(entity.entity_type);
    for (auto& observation : entity.observations) {
        observation = SanitizeText(observation);
    }
    if (entity.context_source) {
        entity.context_source = SanitizeText(*entity.context_source);
    }
}

void SanitizeRelation(core::Relation& relation) {
    relation.from_entity = SanitizeName(relation.from_entity);
    relation.to_entity = SanitizeName(relation.to_entity);
    relation.relation_type = SanitizeName(relation.relation_type);
    if (relation.context_source) {
        relation.context_source = SanitizeText(*relation.context_source);
    }
}

core::Result<void> ValidateConfidence(double score) {
    if (std::isnan(score) || score < 0.0 || score > 1.0) {
        return core::InvalidArgumentError(
            "confidence_score must be within [0, 1], got " + std::to_string(score));
    }
    return core::Result<void>();
}

core::Result<void> ValidateEntity(const core::Entity& entity) {
    if (entity.name.empty()) {
        return core::InvalidArgumentError("Entity name must not be empty");
    }
    if (entity.entity_type.empty()) {
        return core::InvalidArgumentError("Entity type must not be empty for entity: " + entity.name);
    }
    return ValidateConfidence(entity.confidence_score);
}

core::Result<void> ValidateRelation(const core::Relation& relation) {
    if (relation.from_entity.empty() || relation.to_entity.empty()) {
        return core::InvalidArgumentError("Relation endpoints must not be empty");
    }
    if (relation.relation_type.empty()) {
        return core::InvalidArgumentError("Relation type must not be empty for " +
                                          relation.from_entity + " -> " + relation.to_entity);
    }
    if (relation.valid_until && relation.valid_from != 0 &&
        *relation.valid_until <= relation.valid_from) {
        return core::InvalidArgumentError("Relation valid_until must be after valid_from");
    }
    return ValidateConfidence(relation.confidence_score);
}

} // namespace storage
} // namespace kgstore
