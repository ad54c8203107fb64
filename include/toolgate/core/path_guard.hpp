/*
 * toolgate C++17 - Path Guard
 *
 * Resolves a caller-supplied path to its canonical form and checks it stays
 * under one of the allowed roots. Every file and command operation that
 * takes a path goes through resolve() before touching the filesystem.
 */
#ifndef toolgate_CORE_PATH_GUARD_HPP
#define toolgate_CORE_PATH_GUARD_HPP

#include "result.hpp"
#include <string>
#include <vector>

namespace toolgate {

// What the caller intends to do with the resolved path
enum class PathTarget {
    Any,            // scope check only
    Directory,      // must be an existing directory
    ExistingFile,   // must be an existing regular file
    WritableFile    // may be created; parent must exist, must not be a directory
};

class PathGuard {
public:
    // Roots are canonicalized; entries that are not existing directories are dropped
    explicit PathGuard(const std::vector<std::string>& roots);

    // Guard over the process-wide roots in Sandbox::instance()
    static PathGuard from_sandbox();

    // Canonical absolute path, or NotAbsolute / OutsideAllowedScope /
    // NotFound / NotAFile / NotADirectory / ParentMissing
    Result<std::string> resolve(const std::string& path, PathTarget target = PathTarget::Any) const;

    // `canonical` must already be canonical
    bool is_within_roots(const std::string& canonical) const;

    const std::vector<std::string>& roots() const { return roots_; }

private:
    // realpath() that tolerates missing trailing components: the deepest
    // existing ancestor is resolved and the rest appended lexically.
    static std::string canonicalize(const std::string& absolute, bool& exists);

    std::vector<std::string> roots_;
};

} // namespace toolgate

#endif // toolgate_CORE_PATH_GUARD_HPP
