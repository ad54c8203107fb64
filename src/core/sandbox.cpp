/*
 * toolgate C++17 - Allowed roots Implementation
 */
#include <toolgate/core/sandbox.hpp>
#include <toolgate/core/logger.hpp>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace toolgate {

Sandbox& Sandbox::instance() {
    static Sandbox s;
    return s;
}

Sandbox::Sandbox() : initialized_(false) {}

bool Sandbox::ensure_directory(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    size_t pos = path.rfind('/');
    if (pos != std::string::npos && pos > 0) {
        std::string parent = path.substr(0, pos);
        if (!ensure_directory(parent)) {
            return false;
        }
    }
    return mkdir(path.c_str(), 0700) == 0 || errno == EEXIST;
}

bool Sandbox::canonical_directory(const std::string& path, bool create, std::string& out) {
    if (path.empty() || path[0] != '/') {
        return false;
    }
    if (create && !ensure_directory(path)) {
        return false;
    }

    char resolved[PATH_MAX];
    if (!realpath(path.c_str(), resolved)) {
        return false;
    }

    struct stat st;
    if (stat(resolved, &st) != 0 || !S_ISDIR(st.st_mode)) {
        return false;
    }
    out = resolved;
    return true;
}

bool Sandbox::init(const std::string& project_root,
                   const std::string& scratch_root,
                   const std::vector<std::string>& extra_roots) {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_.load()) {
        LOG_WARN("[Sandbox] Allowed roots already initialized, ignoring re-init");
        return false;
    }

    std::string project;
    if (!canonical_directory(project_root, false, project)) {
        LOG_ERROR("[Sandbox] Project root is not an existing absolute directory: %s",
                  project_root.c_str());
        return false;
    }

    std::string scratch;
    if (!canonical_directory(scratch_root, true, scratch)) {
        LOG_ERROR("[Sandbox] Cannot use scratch root %s (%s)",
                  scratch_root.c_str(), strerror(errno));
        return false;
    }

    std::vector<std::string> roots;
    roots.push_back(project);
    if (scratch != project) {
        roots.push_back(scratch);
    }

    for (size_t i = 0; i < extra_roots.size(); ++i) {
        std::string extra;
        if (!canonical_directory(extra_roots[i], false, extra)) {
            LOG_WARN("[Sandbox] Skipping extra root (not an absolute directory): %s",
                     extra_roots[i].c_str());
            continue;
        }
        if (std::find(roots.begin(), roots.end(), extra) == roots.end()) {
            roots.push_back(extra);
        }
    }

    project_root_ = project;
    roots_ = roots;
    initialized_.store(true);

    LOG_INFO("[Sandbox] Allowed roots initialized:");
    for (size_t i = 0; i < roots_.size(); ++i) {
        LOG_INFO("[Sandbox]   %s", roots_[i].c_str());
    }
    return true;
}

} // namespace toolgate
