// include/backsim/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace backsim {

/**
 * @brief Error codes for the simulation engine
 * Defines all error conditions a backtest run or its collaborators can report
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Configuration errors
    INVALID_CONFIG = 4,
    UNKNOWN_STRATEGY = 5,

    // Data errors
    INVALID_DATA = 6,
    CONVERSION_ERROR = 7,

    // Strategy errors
    STRATEGY_ERROR = 8,

    // File and I/O errors
    FILE_NOT_FOUND = 9,
    FILE_IO_ERROR = 10,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 11
};

/**
 * @brief Exception type carried by failed results
 */
class BacksimError : public std::runtime_error {
public:
    /**
     * @brief Constructor for BacksimError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    BacksimError(ErrorCode code, const std::string& message, const std::string& component = "")
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
        return "Error in " + component_ + ": " + what() +
               " (Code: " + std::to_string(static_cast<int>(code_)) + ")";
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
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<BacksimError> error) : error_(std::move(error)) {}

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

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws BacksimError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws BacksimError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const BacksimError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<BacksimError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<BacksimError> error) : error_(std::move(error)) {}

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

    const BacksimError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<BacksimError> error_;
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
    return Result<T>(std::make_unique<BacksimError>(code, message, component));
}

}  // namespace backsim
