// include/histshard/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace histshard {

/**
 * @brief Error codes for the shard query engine
 * Defines all possible error conditions that can occur
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATABASE_ERROR = 4,
    DATA_NOT_FOUND = 5,
    INVALID_DATA = 6,
    CONVERSION_ERROR = 7,

    // Routing errors
    NOT_FOUND = 8,
    INVALID_RANGE = 9,
    UNSUPPORTED_GRANULARITY = 10,

    // Shard access errors
    SHARD_UNAVAILABLE = 11,
    NO_DATA_SOURCE = 12,

    // Pricing errors
    IV_CONVERGENCE_FAILED = 13,

    // System errors
    TIMEOUT_ERROR = 14,
    CANCELLED = 15,

    // File and I/O errors
    FILE_NOT_FOUND = 16,
    FILE_IO_ERROR = 17,
    PERMISSION_ERROR = 18,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 19,

    // Security and encryption errors
    DECRYPTION_ERROR = 20,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Name of an error code, for logs and serialized metadata
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::INVALID_RANGE:
            return "INVALID_RANGE";
        case ErrorCode::UNSUPPORTED_GRANULARITY:
            return "UNSUPPORTED_GRANULARITY";
        case ErrorCode::SHARD_UNAVAILABLE:
            return "SHARD_UNAVAILABLE";
        case ErrorCode::NO_DATA_SOURCE:
            return "NO_DATA_SOURCE";
        case ErrorCode::IV_CONVERGENCE_FAILED:
            return "IV_CONVERGENCE_FAILED";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::CANCELLED:
            return "CANCELLED";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::PERMISSION_ERROR:
            return "PERMISSION_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::DECRYPTION_ERROR:
            return "DECRYPTION_ERROR";
        default:
            return "CUSTOM_ERROR";
    }
}

/**
 * @brief Exception type carried by failed results
 */
class QueryError : public std::runtime_error {
public:
    /**
     * @brief Constructor for QueryError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    QueryError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    /**
     * @brief Get the error code
     * @return ErrorCode representing the type of error
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     * @return String identifying the component
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     * @tparam U The type of the successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<QueryError> error) : value_(), error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    /**
     * @brief Check if result represents success
     * @return true if operation was successful
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     * @return true if operation failed
     */
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws QueryError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the success value for moving out move-only payloads
     * @throws QueryError if result represents an error
     */
    T& value() {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const QueryError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<QueryError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<QueryError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const QueryError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<QueryError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<QueryError>(code, message, component));
}

/**
 * @brief Re-wrap an existing error for a different result type
 */
template <typename T>
Result<T> forward_error(const QueryError* error) {
    return Result<T>(std::make_unique<QueryError>(error->code(), error->what(),
                                                  error->component()));
}

}  // namespace histshard
