#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace sieve {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    ValidationError,
    NotFound,
    InvalidData,
    InvalidState,
    NetworkError,
    IOError,
    Timeout,
    Unavailable,
    CircuitOpen,
    OperationCancelled,
    ResourceExhausted,
    NotInitialized,
    InternalError,
    Unknown
};

constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Unavailable: return "Service unavailable";
        case ErrorCode::CircuitOpen: return "Circuit open";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Transient errors are worth retrying and count against a circuit breaker.
constexpr bool isTransient(ErrorCode error) {
    switch (error) {
        case ErrorCode::NetworkError:
        case ErrorCode::IOError:
        case ErrorCode::Timeout:
        case ErrorCode::Unavailable:
            return true;
        default:
            return false;
    }
}

struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

    template <typename U> T value_or(U&& fallback) const& {
        return has_value() ? std::get<T>(data_) : static_cast<T>(std::forward<U>(fallback));
    }

private:
    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace sieve
