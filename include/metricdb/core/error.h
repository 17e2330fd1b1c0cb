#ifndef METRICDB_CORE_ERROR_H_
#define METRICDB_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace metricdb {
namespace core {

/**
 * @brief Base class for all metricdb errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        CONFLICT = 3,
        TIMEOUT = 4,
        CANCELLED = 5,
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
 * @brief Stable name of an error code ("NotFound", "Conflict", ...)
 */
const char* ErrorCodeName(Error::Code code);

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message) 
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message) 
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating an unknown metric
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message) 
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message) 
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error indicating a metric already exists with a different kind
 */
class ConflictError : public Error {
public:
    explicit ConflictError(const std::string& message) 
        : Error(message, Code::CONFLICT) {}
    explicit ConflictError(const char* message) 
        : Error(message, Code::CONFLICT) {}
};

/**
 * @brief Error indicating a query exceeded its time budget
 */
class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message) 
        : Error(message, Code::TIMEOUT) {}
    explicit TimeoutError(const char* message) 
        : Error(message, Code::TIMEOUT) {}
};

/**
 * @brief Error indicating a query was cancelled by its caller
 */
class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message) 
        : Error(message, Code::CANCELLED) {}
    explicit CancelledError(const char* message) 
        : Error(message, Code::CANCELLED) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message) 
        : Error(message, Code::INTERNAL) {}
    explicit InternalError(const char* message) 
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace metricdb

#endif // METRICDB_CORE_ERROR_H_
