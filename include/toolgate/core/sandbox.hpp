/*
 * toolgate C++17 - Allowed roots
 *
 * Process-wide set of directories under which every file and command path
 * must resolve: the project root, a scratch root, and any configured extras.
 * Established once at startup and read-only afterwards.
 *
 * This is path-level confinement only. Child processes are not isolated
 * from the rest of the filesystem; a command can still touch anything the
 * host user can.
 */
#ifndef toolgate_CORE_SANDBOX_HPP
#define toolgate_CORE_SANDBOX_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace toolgate {

class Sandbox {
public:
    static Sandbox& instance();

    // Canonicalize and freeze the allowed roots. The project root must be an
    // existing directory; the scratch root is created if missing. Only the
    // first successful call has any effect; later calls return false.
    bool init(const std::string& project_root,
              const std::string& scratch_root,
              const std::vector<std::string>& extra_roots = std::vector<std::string>());

    const std::string& project_root() const { return project_root_; }

    // All roots, canonical, project root first
    const std::vector<std::string>& roots() const { return roots_; }

    // Resolve `path` to a canonical existing directory, creating it first
    // when `create` is set. Returns false if that is not possible.
    static bool canonical_directory(const std::string& path, bool create, std::string& out);

private:
    Sandbox();
    Sandbox(const Sandbox&);
    Sandbox& operator=(const Sandbox&);

    static bool ensure_directory(const std::string& path);

    std::atomic<bool> initialized_;
    std::mutex init_mutex_;
    std::string project_root_;
    std::vector<std::string> roots_;
};

} // namespace toolgate

#endif // toolgate_CORE_SANDBOX_HPP
