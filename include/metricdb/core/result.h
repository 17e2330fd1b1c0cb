#ifndef METRICDB_CORE_RESULT_H_
#define METRICDB_CORE_RESULT_H_

#include <string>
#include <optional>
#include <type_traits>
#include <memory>
#include <stdexcept>
#include <vector>
#include "metricdb/core/error.h"

namespace metricdb {
namespace core {

/**
 * @brief Result type for operations that can fail
 * 
 * A result holds either a value or an error code with a message, never both.
 *
 * Usage:
 * ```
 * Result<int> foo() {
 *     if (error_condition) {
 *         return Result<int>::error(Error::Code::NOT_FOUND, "error message");
 *     }
 *     return Result<int>(42);
 * }
 * 
 * auto result = foo();
 * if (result.ok()) {
 *     int value = result.value();
 * } else {
 *     std::string error = result.error();
 *     Error::Code code = result.code();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}
    
    struct ErrorTag {};
    explicit Result(Error::Code code, std::string error_msg, ErrorTag)
        : value_(), error_msg_(std::move(error_msg)), code_(code) {}
    
    Result(Result&& other) noexcept 
        : value_(std::move(other.value_)), error_msg_(std::move(other.error_msg_)), code_(other.code_) {}
    
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
            code_ = other.code_;
        }
        return *this;
    }
    
    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;
    
    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const { 
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code code() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error code of ok result");
        }
        return code_;
    }
    const T& value() const {
        if (error_msg_) {
            throw std::runtime_error("Attempting to access value of failed result: " + *error_msg_);
        }
        return value_;
    }
    T&& take_value() {
        if (error_msg_) {
            throw std::runtime_error("Attempting to take value of failed result: " + *error_msg_);
        }
        return std::move(value_);
    }
    
    static Result<T> error(Error::Code code, const std::string& message) {
        return Result<T>(code, message, ErrorTag{});
    }
    
    static Result<T> error(const std::string& message) {
        return Result<T>(Error::Code::UNKNOWN, message, ErrorTag{});
    }
    
    static Result<T> from_error(const Error& error) {
        return Result<T>(error.code(), error.what(), ErrorTag{});
    }
    
private:
    T value_;
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}
    
    struct ErrorTag {};
    explicit Result(Error::Code code, std::string error_msg, ErrorTag)
        : error_msg_(std::move(error_msg)), code_(code) {}
    
    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const { 
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code code() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error code of ok result");
        }
        return code_;
    }
    
    static Result<void> error(Error::Code code, const std::string& message) {
        return Result<void>(code, message, ErrorTag{});
    }
    
    static Result<void> error(const std::string& message) {
        return Result<void>(Error::Code::UNKNOWN, message, ErrorTag{});
    }
    
    static Result<void> from_error(const Error& error) {
        return Result<void>(error.code(), error.what(), ErrorTag{});
    }
    
private:
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

// Common template instantiations declarations
extern template class Result<std::string>;
extern template class Result<size_t>;

} // namespace core
} // namespace metricdb

#endif // METRICDB_CORE_RESULT_H_
