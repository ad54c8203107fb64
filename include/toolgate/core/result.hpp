/*
 * toolgate C++17 - Typed results
 *
 * Every fallible engine operation returns Result<T>. Failures carry an
 * ErrorKind so callers can branch on the kind instead of parsing text.
 */
#ifndef toolgate_CORE_RESULT_HPP
#define toolgate_CORE_RESULT_HPP

#include <string>
#include <utility>
#include <cstddef>

namespace toolgate {

enum class ErrorKind {
    None,
    // policy
    Blocked,
    // scope
    NotAbsolute,
    OutsideAllowedScope,
    NotAFile,
    NotADirectory,
    ParentMissing,
    // match
    MatchNotFound,
    AmbiguousMatch,
    // runtime
    NotFound,
    NotText,
    NotWritable,
    TooLarge,
    StillRunning,
    SpawnFailed,
    IoError,
    InvalidArgument,
    Internal            // unexpected exception inside a tool
};

enum class ErrorCategory {
    None,
    Policy,
    Scope,
    Match,
    Runtime
};

// Stable snake_case names used on the wire
const char* error_kind_name(ErrorKind kind);
const char* error_category_name(ErrorCategory category);
ErrorCategory error_category(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;
    size_t match_count;     // AmbiguousMatch only

    Error() : kind(ErrorKind::None), match_count(0) {}
    Error(ErrorKind k, const std::string& msg, size_t count = 0)
        : kind(k), message(msg), match_count(count) {}
};

template<typename T>
class Result {
public:
    static Result success(T value) {
        Result r;
        r.ok_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result failure(ErrorKind kind, const std::string& message, size_t match_count = 0) {
        Result r;
        r.ok_ = false;
        r.error_ = Error(kind, message, match_count);
        return r;
    }

    static Result failure(const Error& error) {
        Result r;
        r.ok_ = false;
        r.error_ = error;
        return r;
    }

    bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }

    const T& value() const { return value_; }
    T& value() { return value_; }

    const Error& error() const { return error_; }
    ErrorKind kind() const { return error_.kind; }

private:
    Result() : ok_(false), value_() {}

    bool ok_;
    T value_;
    Error error_;
};

} // namespace toolgate

#endif // toolgate_CORE_RESULT_HPP
