#include <toolgate/core/result.hpp>

namespace toolgate {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Blocked: return "blocked";
        case ErrorKind::NotAbsolute: return "not_absolute";
        case ErrorKind::OutsideAllowedScope: return "outside_allowed_scope";
        case ErrorKind::NotAFile: return "not_a_file";
        case ErrorKind::NotADirectory: return "not_a_directory";
        case ErrorKind::ParentMissing: return "parent_missing";
        case ErrorKind::MatchNotFound: return "match_not_found";
        case ErrorKind::AmbiguousMatch: return "ambiguous_match";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::NotText: return "not_text";
        case ErrorKind::NotWritable: return "not_writable";
        case ErrorKind::TooLarge: return "too_large";
        case ErrorKind::StillRunning: return "still_running";
        case ErrorKind::SpawnFailed: return "spawn_failed";
        case ErrorKind::IoError: return "io_error";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "none";
        case ErrorCategory::Policy: return "policy";
        case ErrorCategory::Scope: return "scope";
        case ErrorCategory::Match: return "match";
        case ErrorCategory::Runtime: return "runtime";
    }
    return "unknown";
}

ErrorCategory error_category(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return ErrorCategory::None;
        case ErrorKind::Blocked:
            return ErrorCategory::Policy;
        case ErrorKind::NotAbsolute:
        case ErrorKind::OutsideAllowedScope:
        case ErrorKind::NotAFile:
        case ErrorKind::NotADirectory:
        case ErrorKind::ParentMissing:
            return ErrorCategory::Scope;
        case ErrorKind::MatchNotFound:
        case ErrorKind::AmbiguousMatch:
            return ErrorCategory::Match;
        default:
            return ErrorCategory::Runtime;
    }
}

} // namespace toolgate
