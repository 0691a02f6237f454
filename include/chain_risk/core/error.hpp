// include/chain_risk/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace chain_risk {

/**
 * @brief Failure conditions a caller of the analytics engine can observe
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    INVALID_DATA = 3,

    // Option chain errors
    NO_VALID_OPTIONS_DATA = 10,
    INSUFFICIENT_OPTIONS_DATA = 11,
    IV_SOLVER_ERROR = 12,
    API_ERROR = 13,  // Exchange reported a failed request

    // File and parsing errors
    FILE_NOT_FOUND = 20,
    FILE_IO_ERROR = 21,
    JSON_PARSE_ERROR = 22
};

/**
 * @brief Stable upper-case name of an error code, e.g. "NO_VALID_OPTIONS_DATA"
 */
inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::NO_VALID_OPTIONS_DATA:
            return "NO_VALID_OPTIONS_DATA";
        case ErrorCode::INSUFFICIENT_OPTIONS_DATA:
            return "INSUFFICIENT_OPTIONS_DATA";
        case ErrorCode::IV_SOLVER_ERROR:
            return "IV_SOLVER_ERROR";
        case ErrorCode::API_ERROR:
            return "API_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
    }
    return "UNKNOWN_ERROR";
}

/**
 * @brief Error carried by a failed Result and thrown by Result::value()
 */
class AnalysisError : public std::runtime_error {
public:
    /**
     * @param code The error code
     * @param message Human-readable description
     * @param component Stage that raised the error, e.g. "ChainFilter"
     */
    AnalysisError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief "Error in <component>: <message> (<CODE_NAME>)"
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_name(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Value or error returned by stages that can fail as a whole
 *
 * Move-only. Numeric kernels return sentinels instead.
 * @tparam T Type of the successful value
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<AnalysisError> error) : error_(std::move(error)) {}

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
     * @throws AnalysisError if the result holds an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @return The error, or nullptr on success
     */
    const AnalysisError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<AnalysisError> error_;
};

template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<AnalysisError> error) : error_(std::move(error)) {}

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

    const AnalysisError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<AnalysisError> error_;
};

/**
 * @brief Build a failed Result
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<AnalysisError>(code, message, component));
}

/**
 * @brief Re-raise an upstream error as a Result of another type
 *
 * Keeps the code and message; the component becomes the forwarding stage.
 */
template <typename T>
Result<T> forward_error(const AnalysisError& error, const std::string& component) {
    return make_error<T>(error.code(), error.what(), component);
}

}  // namespace chain_risk
