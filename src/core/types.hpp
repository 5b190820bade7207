#pragma once

#include <string>
#include <cstdint>

// Failure categories. Each maps to its own process exit code so scripts can
// branch on the outcome (see exit_code_for).
enum class ErrorKind {
    None,
    DatabaseNotFound,
    CredentialNotFound,
    CredentialsNotStored,
    Io,
    Deserialization,
    PathResolution,
    Serialization,
    DuplicateService,
    Locked,
    Config,
    InvalidArgument,
    UserCancelled,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    ErrorKind kind;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ErrorKind::None, ""};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, kind, err};
    }

    // Re-wrap the failure of another result without touching its kind.
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.kind, other.error};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    ErrorKind kind;
    std::string error;

    static Result<void> Ok() {
        return {true, ErrorKind::None, ""};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, kind, err};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.kind, other.error};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Process exit code for a failure kind. UserCancelled sits in its own band
// (100) so it is never mistaken for a data error.
int exit_code_for(ErrorKind kind);

// Short stable name, used in log lines.
const char* error_kind_name(ErrorKind kind);
