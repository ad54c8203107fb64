/*
 * toolgate C++17 - Path Guard Implementation
 */
#include <toolgate/core/path_guard.hpp>
#include <toolgate/core/sandbox.hpp>
#include <toolgate/core/logger.hpp>
#include <toolgate/core/utils.hpp>

#include <climits>
#include <cstdlib>
#include <sys/stat.h>

namespace toolgate {

PathGuard::PathGuard(const std::vector<std::string>& roots) {
    for (size_t i = 0; i < roots.size(); ++i) {
        std::string canonical;
        if (Sandbox::canonical_directory(roots[i], false, canonical)) {
            roots_.push_back(canonical);
        } else {
            LOG_WARN("[PathGuard] Ignoring root that is not an existing directory: %s",
                     roots[i].c_str());
        }
    }
}

PathGuard PathGuard::from_sandbox() {
    return PathGuard(Sandbox::instance().roots());
}

std::string PathGuard::canonicalize(const std::string& absolute, bool& exists) {
    char resolved[PATH_MAX];
    if (realpath(absolute.c_str(), resolved)) {
        exists = true;
        return std::string(resolved);
    }
    exists = false;

    // Walk up to the deepest ancestor that resolves
    std::string head = absolute;
    std::vector<std::string> tail;
    while (head != "/") {
        tail.push_back(base_name(head));
        head = parent_path(head);
        if (realpath(head.c_str(), resolved)) {
            std::string out = resolved;
            for (std::vector<std::string>::reverse_iterator it = tail.rbegin(); it != tail.rend(); ++it) {
                out = join_path(out, *it);
            }
            return out;
        }
    }
    return absolute;
}

bool PathGuard::is_within_roots(const std::string& canonical) const {
    for (size_t i = 0; i < roots_.size(); ++i) {
        const std::string& root = roots_[i];
        if (root == "/") {
            return true;
        }
        if (canonical.size() >= root.size() &&
            canonical.compare(0, root.size(), root) == 0) {
            if (canonical.size() == root.size() || canonical[root.size()] == '/') {
                return true;
            }
        }
    }
    return false;
}

Result<std::string> PathGuard::resolve(const std::string& path, PathTarget target) const {
    if (path.empty() || path[0] != '/') {
        return Result<std::string>::failure(ErrorKind::NotAbsolute,
            "Path must be absolute: " + path);
    }

    const std::string lexical = normalize_path(path);
    bool exists = false;
    const std::string canonical = canonicalize(lexical, exists);

    if (!is_within_roots(canonical)) {
        LOG_WARN("[PathGuard] Rejected path outside allowed roots: %s -> %s",
                 path.c_str(), canonical.c_str());
        return Result<std::string>::failure(ErrorKind::OutsideAllowedScope,
            "Path is outside the allowed directories: " + path);
    }

    if (target == PathTarget::Any) {
        return Result<std::string>::success(canonical);
    }

    struct stat st;
    bool have_stat = exists && stat(canonical.c_str(), &st) == 0;

    switch (target) {
        case PathTarget::Directory:
            if (!have_stat) {
                return Result<std::string>::failure(ErrorKind::NotFound,
                    "Directory does not exist: " + path);
            }
            if (!S_ISDIR(st.st_mode)) {
                return Result<std::string>::failure(ErrorKind::NotADirectory,
                    "Path is not a directory: " + path);
            }
            break;

        case PathTarget::ExistingFile:
            if (!have_stat) {
                return Result<std::string>::failure(ErrorKind::NotFound,
                    "File does not exist: " + path);
            }
            if (!S_ISREG(st.st_mode)) {
                return Result<std::string>::failure(ErrorKind::NotAFile,
                    S_ISDIR(st.st_mode) ? "Path is a directory, not a file: " + path
                                        : "Path is not a regular file: " + path);
            }
            break;

        case PathTarget::WritableFile: {
            if (have_stat) {
                if (!S_ISREG(st.st_mode)) {
                    return Result<std::string>::failure(ErrorKind::NotAFile,
                        S_ISDIR(st.st_mode) ? "Path is a directory, not a file: " + path
                                            : "Path is not a regular file: " + path);
                }
                break;
            }
            struct stat parent_st;
            const std::string parent = parent_path(canonical);
            if (stat(parent.c_str(), &parent_st) != 0 || !S_ISDIR(parent_st.st_mode)) {
                return Result<std::string>::failure(ErrorKind::ParentMissing,
                    "Parent directory does not exist: " + parent_path(lexical));
            }
            break;
        }

        case PathTarget::Any:
            break;
    }

    return Result<std::string>::success(canonical);
}

} // namespace toolgate
