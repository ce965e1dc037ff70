#include "kgstore/core/error.h"

namespace kgstore {
namespace core {

const char* CodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::ENTITY_NOT_FOUND: return "ENTITY_NOT_FOUND";
        case Error::Code::ENTITY_ALREADY_EXISTS: return "ENTITY_ALREADY_EXISTS";
        case Error::Code::POOL_EXHAUSTED: return "POOL_EXHAUSTED";
        case Error::Code::STORAGE_FAILURE: return "STORAGE_FAILURE";
        case Error::Code::INTERNAL: return "INTERNAL";
    }
    return "UNKNOWN";
}

}  // namespace core
}  // namespace kgstore
