#ifndef KGSTORE_CORE_RESULT_H_
#define KGSTORE_CORE_RESULT_H_

#include <string>
#include <optional>
#include <utility>
#include <stdexcept>
#include "kgstore/core/error.h"

namespace kgstore {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Carries either a value or a typed core::Error. Errors travel by return
 * value; nothing in the storage layer unwinds through a caller.
 *
 * Usage:
 * ```
 * Result<Entity> find(const std::string& name) {
 *     if (missing) {
 *         return EntityNotFoundError("entity not found: " + name);
 *     }
 *     return Result<Entity>(entity);
 * }
 *
 * auto result = find("alice");
 * if (result.ok()) {
 *     const Entity& e = result.value();
 * } else if (result.code() == Error::Code::ENTITY_NOT_FOUND) {
 *     std::string message = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(std::nullopt) {}

    // Implicit so that `return SomeError("...")` and `return other.error_info()` work
    Result(Error error) : value_(), error_(std::move(error)) {}

    Result(Result&& other) = default;
    Result& operator=(Result&& other) = default;

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_.has_value(); }
    bool has_error() const { return error_.has_value(); }

    std::string error() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return error_->what();
    }

    Error::Code code() const { return error_ ? error_->code() : Error::Code::UNKNOWN; }

    const Error& error_info() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_;
    }

    const T& value() const { return value_; }
    T& value() { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message,
                           Error::Code code = Error::Code::INTERNAL) {
        return Result<T>(Error(message, code));
    }

private:
    T value_;
    std::optional<Error> error_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    bool has_error() const { return error_.has_value(); }

    std::string error() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return error_->what();
    }

    Error::Code code() const { return error_ ? error_->code() : Error::Code::UNKNOWN; }

    const Error& error_info() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_;
    }

    static Result<void> error(const std::string& message,
                              Error::Code code = Error::Code::INTERNAL) {
        return Result<void>(Error(message, code));
    }

private:
    std::optional<Error> error_;
};

} // namespace core
} // namespace kgstore

#endif // KGSTORE_CORE_RESULT_H_
