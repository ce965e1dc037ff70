#ifndef KGSTORE_CORE_ERROR_H_
#define KGSTORE_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace kgstore {
namespace core {

/**
 * @brief Base class for all kgstore errors
 *
 * Errors are carried inside core::Result by value; they are only thrown
 * by code that wants exception semantics on top of a Result.
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        ENTITY_NOT_FOUND = 2,
        ENTITY_ALREADY_EXISTS = 3,
        POOL_EXHAUSTED = 4,
        STORAGE_FAILURE = 5,
        INTERNAL = 6
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Stable name of an error code, e.g. "ENTITY_NOT_FOUND"
 */
const char* CodeName(Error::Code code);

/**
 * @brief Empty required field, out-of-range score, empty query, nested transaction
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief A referenced entity is not live
 */
class EntityNotFoundError : public Error {
public:
    explicit EntityNotFoundError(const std::string& message)
        : Error(message, Code::ENTITY_NOT_FOUND) {}
    explicit EntityNotFoundError(const char* message)
        : Error(message, Code::ENTITY_NOT_FOUND) {}
};

/**
 * @brief Uniqueness violation on create
 */
class EntityAlreadyExistsError : public Error {
public:
    explicit EntityAlreadyExistsError(const std::string& message)
        : Error(message, Code::ENTITY_ALREADY_EXISTS) {}
    explicit EntityAlreadyExistsError(const char* message)
        : Error(message, Code::ENTITY_ALREADY_EXISTS) {}
};

/**
 * @brief No pooled connection became available before the deadline
 */
class PoolExhaustedError : public Error {
public:
    explicit PoolExhaustedError(const std::string& message)
        : Error(message, Code::POOL_EXHAUSTED) {}
    explicit PoolExhaustedError(const char* message)
        : Error(message, Code::POOL_EXHAUSTED) {}
};

/**
 * @brief The storage engine reported an I/O or engine error
 */
class StorageFailureError : public Error {
public:
    explicit StorageFailureError(const std::string& message)
        : Error(message, Code::STORAGE_FAILURE) {}
    explicit StorageFailureError(const char* message)
        : Error(message, Code::STORAGE_FAILURE) {}
};

class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
    explicit InternalError(const char* message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace kgstore

#endif // KGSTORE_CORE_ERROR_H_
