#pragma once

#include <string>
#include <vector>

#include "kgstore/core/result.h"
#include "kgstore/core/types.h"

namespace kgstore {
namespace storage {

/**
 * @brief Cleans an identifier-like field (entity name, type, relation type)
 *
 * Removes NUL and other control characters and trims surrounding
 * whitespace. Case is preserved; names are matched case-sensitively.
 */
std::string SanitizeName(const std::string& value);

/**
 * @brief Cleans free text (observations, context source); only NUL is removed
 */
std::string SanitizeText(const std::string& value);

/**
 * @brief Escapes `\`, `%` and `_` for use inside `LIKE ? ESCAPE '\'`
 */
std::string EscapeLike(const std::string& value);

/**
 * @brief Sanitizes every user-supplied string field of an entity in place
 */
void SanitizeEntity(core::Entity& entity);

/**
 * @brief Sanitizes every user-supplied string field of a relation in place
 */
void SanitizeRelation(core::Relation& relation);

core::Result<void> ValidateConfidence(double score);

/**
 * @brief Requires non-empty name and type and a confidence score in [0, 1]
 */
core::Result<void> ValidateEntity(const core::Entity& entity);

/**
 * @brief Requires non-empty endpoints and type, a confidence score in [0, 1]
 * and, when set, valid_until after valid_from
 */
core::Result<void> ValidateRelation(const core::Relation& relation);

} // namespace storage
} // namespace kgstore
