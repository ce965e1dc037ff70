#ifndef KGSTORE_COMMON_JSON_H_
#define KGSTORE_COMMON_JSON_H_

#include <string>
#include <vector>

#include "kgstore/core/result.h"
#include "kgstore/core/types.h"

namespace kgstore {
namespace common {

/**
 * @brief Encodes an ordered list of strings as a JSON array
 */
std::string EncodeStringList(const std::vector<std::string>& values);

/**
 * @brief Decodes a JSON array of strings; an empty document is an empty list
 */
core::Result<std::vector<std::string>> DecodeStringList(const std::string& json);

/**
 * @brief Encodes metadata as a flat JSON object of strings
 */
std::string EncodeMetadata(const core::Metadata& metadata);

/**
 * @brief Decodes a flat JSON object; non-string members are re-serialized as JSON text
 */
core::Result<core::Metadata> DecodeMetadata(const std::string& json);

} // namespace common
} // namespace kgstore

#endif // KGSTORE_COMMON_JSON_H_
