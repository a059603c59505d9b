// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Error and Result Types                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace primdb {

// ==============================================================================
// Error Codes
// ==============================================================================

enum class ErrorCode : std::uint32_t {
    Success = 0,

    // Command text
    ParseError = 100,

    // Catalog level
    TableNotFound = 200,
    DuplicateTable = 201,
    DuplicateColumn = 202,
    InvalidType = 203,
    InvalidName = 204,

    // Row level
    ColumnCountMismatch = 300,
    ColumnNotFound = 301,
    TypeError = 302,
    ImmutableColumn = 303,

    // Storage
    StorageError = 400,
    Corrupted = 401,

    InternalError = 999,
};

[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ParseError: return "Parse error";
        case ErrorCode::TableNotFound: return "Table not found";
        case ErrorCode::DuplicateTable: return "Table already exists";
        case ErrorCode::DuplicateColumn: return "Duplicate column";
        case ErrorCode::InvalidType: return "Invalid type";
        case ErrorCode::InvalidName: return "Invalid name";
        case ErrorCode::ColumnCountMismatch: return "Column count mismatch";
        case ErrorCode::ColumnNotFound: return "Column not found";
        case ErrorCode::TypeError: return "Type error";
        case ErrorCode::ImmutableColumn: return "Immutable column";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::Corrupted: return "Corrupted table file";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

class Error {
public:
    Error() noexcept : code_(ErrorCode::Success) {}

    explicit Error(ErrorCode code) noexcept : code_(code) {}

    Error(ErrorCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] bool ok() const noexcept { return code_ == ErrorCode::Success; }

    [[nodiscard]] std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_to_string(code_));
        }
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ==============================================================================
// Result<T>
// ==============================================================================

struct ErrorTag {};
inline constexpr ErrorTag error_tag{};

/// Value of an operation that either succeeds with T or fails with an Error
template<typename T>
class Result {
public:
    using value_type = T;
    using error_type = Error;

    Result(const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

    Result(ErrorTag, const Error& err) : storage_(std::in_place_index<1>, err) {}
    Result(ErrorTag, Error&& err) : storage_(std::in_place_index<1>, std::move(err)) {}
    Result(ErrorTag, ErrorCode code, std::string msg)
        : storage_(std::in_place_index<1>, Error(code, std::move(msg))) {}

    [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().to_string());
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().to_string());
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().to_string());
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const Error& error() const& {
        if (has_value()) throw std::runtime_error("Result has value, not error");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(value()); }

private:
    std::variant<T, Error> storage_;
};

template<>
class Result<void> {
public:
    using value_type = void;
    using error_type = Error;

    Result() : has_value_(true) {}

    Result(ErrorTag, const Error& err) : error_(err), has_value_(false) {}
    Result(ErrorTag, Error&& err) : error_(std::move(err)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code, std::string msg)
        : error_(code, std::move(msg)), has_value_(false) {}

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] const Error& error() const& {
        if (has_value_) throw std::runtime_error("Result has value, not error");
        return error_;
    }

private:
    Error error_;
    bool has_value_;
};

/// Status is an alias for Result<void>
using Status = Result<void>;

// ==============================================================================
// Factory functions
// ==============================================================================

template<typename T>
[[nodiscard]] Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline Status Ok() {
    return Status();
}

template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(error_tag, code, std::move(message));
}

template<typename T>
[[nodiscard]] Result<T> Err(const Error& error) {
    return Result<T>(error_tag, error);
}

[[nodiscard]] inline Status Err(ErrorCode code, std::string message) {
    return Status(error_tag, code, std::move(message));
}

[[nodiscard]] inline Status Err(const Error& error) {
    return Status(error_tag, error);
}

} // namespace primdb
