/*
 * toolgate C++17 - File Store Implementation
 */
#include <toolgate/core/file_store.hpp>
#include <toolgate/core/config.hpp>
#include <toolgate/core/logger.hpp>
#include <toolgate/core/text_matcher.hpp>
#include <toolgate/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <dirent.h>
#include <fcntl.h>
#include <fnmatch.h>
#include <sys/stat.h>
#include <unistd.h>

namespace toolgate {

namespace {

const size_t kBinarySampleBytes = 1024;

// Length of the UTF-8 sequence starting at data[i], or 0 if invalid.
// A sequence cut off by the end of the buffer counts as valid.
size_t utf8_sequence_length(const std::string& data, size_t i) {
    unsigned char c = static_cast<unsigned char>(data[i]);
    size_t len;
    if (c < 0x80) return 1;
    else if ((c & 0xE0) == 0xC0 && c >= 0xC2) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0 && c <= 0xF4) len = 4;
    else return 0;

    for (size_t k = 1; k < len; ++k) {
        if (i + k >= data.size()) return data.size() - i;
        if ((static_cast<unsigned char>(data[i + k]) & 0xC0) != 0x80) return 0;
    }
    return len;
}

bool is_text_control(unsigned char c) {
    return c == 7 || c == 8 || c == 9 || c == 10 || c == 12 || c == 13 || c == 27;
}

// Split into lines; a trailing newline ends the last line instead of
// starting an empty one. A CR before the LF is dropped from the text.
std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        size_t end = nl == std::string::npos ? content.size() : nl;
        std::string line = content.substr(start, end - start);
        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }
        lines.push_back(line);
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

// Path components of a glob pattern ("src/**/*.cpp" -> src, **, *.cpp)
std::vector<std::string> pattern_parts(const std::string& pattern) {
    std::vector<std::string> parts;
    std::vector<std::string> raw = split(pattern, '/');
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i].empty() || raw[i] == ".") continue;
        // "a/**/**/b" is the same as "a/**/b"
        if (raw[i] == "**" && !parts.empty() && parts.back() == "**") continue;
        parts.push_back(raw[i]);
    }
    return parts;
}

struct DirEntry {
    std::string name;
    std::string path;
    bool is_dir;        // real directory, symlinks excluded
    bool is_file;       // regular file, symlinks followed
    int64_t mtime;
};

std::vector<DirEntry> list_directory(const std::string& dir) {
    std::vector<DirEntry> entries;
    DIR* d = opendir(dir.c_str());
    if (!d) {
        LOG_DEBUG("[Files] Cannot open directory %s: %s", dir.c_str(), strerror(errno));
        return entries;
    }

    struct dirent* ent;
    while ((ent = readdir(d)) != NULL) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;

        DirEntry e;
        e.name = name;
        e.path = join_path(dir, name);
        e.is_dir = false;
        e.is_file = false;
        e.mtime = 0;

        struct stat lst;
        if (lstat(e.path.c_str(), &lst) != 0) continue;
        if (S_ISDIR(lst.st_mode)) {
            e.is_dir = true;
            e.mtime = static_cast<int64_t>(lst.st_mtime);
        } else if (S_ISLNK(lst.st_mode)) {
            struct stat st;
            if (stat(e.path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
                e.is_file = true;
                e.mtime = static_cast<int64_t>(st.st_mtime);
            }
        } else if (S_ISREG(lst.st_mode)) {
            e.is_file = true;
            e.mtime = static_cast<int64_t>(lst.st_mtime);
        }
        entries.push_back(e);
    }
    closedir(d);
    return entries;
}

bool name_matches(const std::string& part, const std::string& name) {
    return fnmatch(part.c_str(), name.c_str(), FNM_CASEFOLD) == 0;
}

void glob_walk(const std::string& dir, const std::vector<std::string>& parts, size_t idx,
               std::set<std::string>& seen, std::vector<GlobMatch>& out) {
    if (idx >= parts.size()) return;

    const std::string& part = parts[idx];
    const bool last = idx + 1 == parts.size();
    std::vector<DirEntry> entries = list_directory(dir);

    if (part == "**") {
        // Zero directories
        if (!last) {
            glob_walk(dir, parts, idx + 1, seen, out);
        }
        for (size_t i = 0; i < entries.size(); ++i) {
            const DirEntry& e = entries[i];
            if (e.is_dir) {
                glob_walk(e.path, parts, idx, seen, out);
            } else if (last && e.is_file && seen.insert(e.path).second) {
                GlobMatch m;
                m.path = e.path;
                m.mtime = e.mtime;
                out.push_back(m);
            }
        }
        return;
    }

    for (size_t i = 0; i < entries.size(); ++i) {
        const DirEntry& e = entries[i];
        if (!name_matches(part, e.name)) continue;
        if (last) {
            if (e.is_file && seen.insert(e.path).second) {
                GlobMatch m;
                m.path = e.path;
                m.mtime = e.mtime;
                out.push_back(m);
            }
        } else if (e.is_dir) {
            glob_walk(e.path, parts, idx + 1, seen, out);
        }
    }
}

bool newer_first(const GlobMatch& a, const GlobMatch& b) {
    if (a.mtime != b.mtime) return a.mtime > b.mtime;
    return a.path < b.path;
}

// "*.{cpp,hpp}" -> *.cpp, *.hpp. Braces do not nest.
std::vector<std::string> expand_braces(const std::string& pattern) {
    std::vector<std::string> out;
    size_t open = pattern.find('{');
    size_t close = open == std::string::npos ? std::string::npos : pattern.find('}', open);
    if (close == std::string::npos) {
        out.push_back(pattern);
        return out;
    }

    std::string head = pattern.substr(0, open);
    std::string tail = pattern.substr(close + 1);
    std::vector<std::string> alts = split(pattern.substr(open + 1, close - open - 1), ',');
    for (size_t i = 0; i < alts.size(); ++i) {
        std::vector<std::string> rest = expand_braces(head + alts[i] + tail);
        out.insert(out.end(), rest.begin(), rest.end());
    }
    return out;
}

// Slice [offset, offset + limit) out of `all`; limit 0 keeps the rest
template <typename T>
std::vector<T> page(const std::vector<T>& all, int64_t offset, int64_t limit, bool& has_more) {
    std::vector<T> out;
    has_more = false;
    size_t first = static_cast<size_t>(offset);
    if (first >= all.size()) return out;

    size_t end = all.size();
    if (limit > 0 && static_cast<uint64_t>(limit) < all.size() - first) {
        end = first + static_cast<size_t>(limit);
        has_more = true;
    }
    out.assign(all.begin() + first, all.begin() + end);
    return out;
}

std::string render_grep_lines(const std::vector<GrepLine>& lines) {
    std::ostringstream out;
    for (size_t i = 0; i < lines.size(); ++i) {
        const GrepLine& line = lines[i];
        if (i > 0) {
            const GrepLine& prev = lines[i - 1];
            out << "\n";
            if (prev.path != line.path || prev.number + 1 != line.number) {
                out << "--\n";
            }
        }
        const char sep = line.match ? ':' : '-';
        out << line.path << sep << line.number << sep << line.text;
    }
    return out.str();
}

} // namespace

// ============================================================================
// Options
// ============================================================================

const char* grep_output_name(GrepOutput mode) {
    switch (mode) {
        case GrepOutput::FilesWithMatches: return "files_with_matches";
        case GrepOutput::Content: return "content";
        case GrepOutput::Count: return "count";
    }
    return "unknown";
}

bool parse_grep_output(const std::string& name, GrepOutput& out) {
    if (name == "files_with_matches") {
        out = GrepOutput::FilesWithMatches;
    } else if (name == "content") {
        out = GrepOutput::Content;
    } else if (name == "count") {
        out = GrepOutput::Count;
    } else {
        return false;
    }
    return true;
}

FileStoreOptions FileStoreOptions::from_config(const Config& cfg, const std::string& default_directory) {
    FileStoreOptions opts;
    int64_t size_limit = cfg.get_int("files.size_limit", 10 * 1024 * 1024);
    if (size_limit > 0) opts.size_limit = static_cast<uint64_t>(size_limit);

    int64_t max_lines = cfg.get_int("files.max_lines", 2000);
    if (max_lines > 0) opts.max_lines = max_lines;

    int64_t max_line_length = cfg.get_int("files.max_line_length", 2000);
    if (max_line_length > 0) opts.max_line_length = static_cast<size_t>(max_line_length);

    opts.default_directory = default_directory;
    return opts;
}

// ============================================================================
// FileStore
// ============================================================================

FileStore::FileStore(const FileStoreOptions& options, const PathGuard& guard)
    : options_(options)
    , guard_(guard) {}

bool FileStore::looks_binary(const std::string& data) {
    std::string head = data.substr(0, kBinarySampleBytes);
    if (head.empty()) return false;

    if (starts_with(head, "\xEF\xBB\xBF") || starts_with(head, "\xFF\xFE") || starts_with(head, "\xFE\xFF")) {
        return false;
    }
    if (head.find('\0') != std::string::npos) {
        return true;
    }

    size_t non_text = 0;
    size_t i = 0;
    while (i < head.size()) {
        unsigned char c = static_cast<unsigned char>(head[i]);
        if (c < 0x20) {
            if (!is_text_control(c)) ++non_text;
            ++i;
            continue;
        }
        size_t len = utf8_sequence_length(head, i);
        if (len == 0) {
            ++non_text;
            ++i;
        } else {
            i += len;
        }
    }
    return non_text * 100 > head.size() * 30;
}

Result<std::string> FileStore::load(const std::string& canonical) const {
    struct stat st;
    if (stat(canonical.c_str(), &st) != 0) {
        return Result<std::string>::failure(ErrorKind::IoError,
            "Cannot stat " + canonical + ": " + strerror(errno));
    }
    if (static_cast<uint64_t>(st.st_size) > options_.size_limit) {
        return Result<std::string>::failure(ErrorKind::TooLarge,
            "File is too large (" + std::to_string(static_cast<long long>(st.st_size)) +
            " bytes, limit " + std::to_string(options_.size_limit) + ")");
    }

    std::ifstream file(canonical.c_str(), std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::failure(ErrorKind::IoError,
            "Cannot open " + canonical + ": " + strerror(errno));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Result<std::string>::failure(ErrorKind::IoError, "Error reading " + canonical);
    }
    return Result<std::string>::success(buffer.str());
}

Result<size_t> FileStore::replace_atomically(const std::string& target, const std::string& content,
                                             unsigned int mode) {
    std::string tmpl = join_path(parent_path(target), "." + base_name(target) + ".toolgate-XXXXXX");
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    int fd = mkstemp(&name[0]);
    if (fd < 0) {
        return Result<size_t>::failure(ErrorKind::NotWritable,
            "Cannot create temporary file beside " + target + ": " + strerror(errno));
    }
    const std::string tmp(&name[0]);

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = strerror(errno);
            close(fd);
            unlink(tmp.c_str());
            return Result<size_t>::failure(ErrorKind::NotWritable,
                "Write to " + target + " failed: " + err);
        }
        written += static_cast<size_t>(n);
    }

    if (fchmod(fd, static_cast<mode_t>(mode)) != 0 || fsync(fd) != 0) {
        std::string err = strerror(errno);
        close(fd);
        unlink(tmp.c_str());
        return Result<size_t>::failure(ErrorKind::NotWritable,
            "Cannot finish writing " + target + ": " + err);
    }
    if (close(fd) != 0) {
        std::string err = strerror(errno);
        unlink(tmp.c_str());
        return Result<size_t>::failure(ErrorKind::NotWritable,
            "Cannot finish writing " + target + ": " + err);
    }

    if (rename(tmp.c_str(), target.c_str()) != 0) {
        std::string err = strerror(errno);
        unlink(tmp.c_str());
        return Result<size_t>::failure(ErrorKind::NotWritable,
            "Cannot replace " + target + ": " + err);
    }
    return Result<size_t>::success(written);
}

Result<ReadResult> FileStore::read_file(const FileReadSpec& spec) const {
    if (spec.offset < 0) {
        return Result<ReadResult>::failure(ErrorKind::InvalidArgument, "offset must be >= 0");
    }
    if (spec.limit < 0) {
        return Result<ReadResult>::failure(ErrorKind::InvalidArgument, "limit must be > 0");
    }
    const int64_t limit = spec.limit > 0 ? spec.limit : options_.max_lines;

    Result<std::string> path = guard_.resolve(spec.path, PathTarget::ExistingFile);
    if (!path) {
        return Result<ReadResult>::failure(path.error());
    }

    Result<std::string> data = load(path.value());
    if (!data) {
        return Result<ReadResult>::failure(data.error());
    }
    if (looks_binary(data.value())) {
        return Result<ReadResult>::failure(ErrorKind::NotText,
            "File does not appear to contain text: " + spec.path);
    }

    std::vector<std::string> all = split_lines(data.value());

    ReadResult result;
    result.path = path.value();
    result.total_lines = all.size();

    if (all.empty()) {
        result.content = "This file is empty";
        return Result<ReadResult>::success(result);
    }

    const size_t first = static_cast<size_t>(spec.offset);
    if (first < all.size()) {
        size_t end = all.size();
        if (static_cast<uint64_t>(limit) < all.size() - first) {
            end = first + static_cast<size_t>(limit);
        }
        result.has_more = end < all.size();

        std::ostringstream rendered;
        for (size_t i = first; i < end; ++i) {
            FileLine line;
            line.number = i + 1;
            if (all[i].size() > options_.max_line_length) {
                line.text = truncate_safe(all[i], options_.max_line_length) + "... truncated";
                line.truncated = true;
            } else {
                line.text = all[i];
            }
            char prefix[32];
            snprintf(prefix, sizeof(prefix), "%6zu\t", line.number);
            if (i > first) rendered << "\n";
            rendered << prefix << line.text;
            result.lines.push_back(line);
        }
        result.content = rendered.str();
    }

    LOG_DEBUG("[Files] Read %zu of %zu lines from %s", result.lines.size(),
              result.total_lines, result.path.c_str());
    return Result<ReadResult>::success(result);
}

Result<WriteResult> FileStore::write_file(const FileWriteSpec& spec) const {
    Result<std::string> path = guard_.resolve(spec.path, PathTarget::WritableFile);
    if (!path) {
        return Result<WriteResult>::failure(path.error());
    }
    const std::string& target = path.value();

    unsigned int mode = 0644;
    struct stat st;
    const bool exists = stat(target.c_str(), &st) == 0;
    if (exists) {
        if (access(target.c_str(), W_OK) != 0) {
            return Result<WriteResult>::failure(ErrorKind::NotWritable,
                "File is not writable: " + spec.path);
        }
        Result<std::string> current = load(target);
        if (current && looks_binary(current.value())) {
            return Result<WriteResult>::failure(ErrorKind::NotText,
                "Refusing to overwrite a binary file: " + spec.path);
        }
        mode = st.st_mode & 07777;
    }

    const std::string parent = parent_path(target);
    if (access(parent.c_str(), W_OK | X_OK) != 0) {
        return Result<WriteResult>::failure(ErrorKind::NotWritable,
            "Directory is not writable: " + parent);
    }

    Result<size_t> written = replace_atomically(target, spec.content, mode);
    if (!written) {
        LOG_ERROR("[Files] %s", written.error().message.c_str());
        return Result<WriteResult>::failure(written.error());
    }

    WriteResult result;
    result.path = target;
    result.new_file_created = !exists;
    result.bytes_written = written.value();

    LOG_DEBUG("[Files] %s %s (%zu bytes)", exists ? "Overwrote" : "Created",
              target.c_str(), result.bytes_written);
    return Result<WriteResult>::success(result);
}

Result<EditResult> FileStore::edit_file(const FileEditSpec& spec) const {
    if (spec.old_content.empty()) {
        return Result<EditResult>::failure(ErrorKind::InvalidArgument,
            "old_string must not be empty");
    }
    if (spec.old_content == spec.new_content) {
        return Result<EditResult>::failure(ErrorKind::InvalidArgument,
            "old_string and new_string are identical, nothing to change");
    }

    Result<std::string> path = guard_.resolve(spec.path, PathTarget::ExistingFile);
    if (!path) {
        return Result<EditResult>::failure(path.error());
    }
    const std::string& target = path.value();

    Result<std::string> data = load(target);
    if (!data) {
        return Result<EditResult>::failure(data.error());
    }
    if (looks_binary(data.value())) {
        return Result<EditResult>::failure(ErrorKind::NotText,
            "File does not appear to contain text: " + spec.path);
    }
    if (access(target.c_str(), W_OK) != 0) {
        return Result<EditResult>::failure(ErrorKind::NotWritable,
            "File is not writable: " + spec.path);
    }

    Result<Replacement> replaced = text_matcher::replace(data.value(), spec.old_content,
                                                         spec.new_content, spec.replace_all);
    if (!replaced) {
        return Result<EditResult>::failure(replaced.error());
    }

    struct stat st;
    unsigned int mode = stat(target.c_str(), &st) == 0 ? (st.st_mode & 07777) : 0644;
    Result<size_t> written = replace_atomically(target, replaced.value().content, mode);
    if (!written) {
        LOG_ERROR("[Files] %s", written.error().message.c_str());
        return Result<EditResult>::failure(written.error());
    }

    EditResult result;
    result.path = target;
    result.replacements = replaced.value().replacements;
    result.bytes_changed = result.replacements * (spec.old_content.size() + spec.new_content.size());
    result.new_size = written.value();

    LOG_DEBUG("[Files] Edited %s: %zu replacement(s), %zu -> %zu bytes", target.c_str(),
              result.replacements, data.value().size(), result.new_size);
    return Result<EditResult>::success(result);
}

Result<GlobResult> FileStore::glob_files(const std::string& pattern, const std::string& path) const {
    if (trim(pattern).empty()) {
        return Result<GlobResult>::failure(ErrorKind::InvalidArgument, "pattern must not be empty");
    }
    if (pattern[0] == '/') {
        return Result<GlobResult>::failure(ErrorKind::InvalidArgument,
            "pattern must be relative to the search directory");
    }

    const std::string dir = path.empty() ? options_.default_directory : path;
    Result<std::string> base = guard_.resolve(dir, PathTarget::Directory);
    if (!base) {
        return Result<GlobResult>::failure(base.error());
    }

    std::vector<std::string> parts = pattern_parts(pattern);
    if (parts.empty()) {
        return Result<GlobResult>::failure(ErrorKind::InvalidArgument,
            "pattern does not name any file: " + pattern);
    }

    std::set<std::string> seen;
    std::vector<GlobMatch> matches;
    glob_walk(base.value(), parts, 0, seen, matches);
    std::sort(matches.begin(), matches.end(), newer_first);

    GlobResult result;
    result.directory = base.value();
    for (size_t i = 0; i < matches.size(); ++i) {
        result.files.push_back(matches[i].path);
    }

    LOG_DEBUG("[Files] Glob '%s' in %s: %zu match(es)", pattern.c_str(),
              result.directory.c_str(), result.files.size());
    return Result<GlobResult>::success(result);
}

// ============================================================================
// grep
// ============================================================================

Result<GrepResult> FileStore::grep_files(const GrepSpec& spec) const {
    if (spec.pattern.empty()) {
        return Result<GrepResult>::failure(ErrorKind::InvalidArgument, "pattern must not be empty");
    }
    if (spec.before < 0 || spec.after < 0) {
        return Result<GrepResult>::failure(ErrorKind::InvalidArgument, "context must be >= 0");
    }
    if (spec.offset < 0) {
        return Result<GrepResult>::failure(ErrorKind::InvalidArgument, "offset must be >= 0");
    }
    if (spec.head_limit < 0) {
        return Result<GrepResult>::failure(ErrorKind::InvalidArgument, "head_limit must be >= 0");
    }

    std::regex re;
    try {
        std::regex::flag_type flags = std::regex::ECMAScript;
        if (spec.case_insensitive) flags |= std::regex::icase;
        re.assign(spec.pattern, flags);
    } catch (const std::regex_error& e) {
        return Result<GrepResult>::failure(ErrorKind::InvalidArgument,
            "Invalid regular expression '" + spec.pattern + "': " + e.what());
    }

    const std::string dir = spec.path.empty() ? options_.default_directory : spec.path;
    Result<std::string> base = guard_.resolve(dir, PathTarget::Any);
    if (!base) {
        return Result<GrepResult>::failure(base.error());
    }

    struct stat st;
    if (stat(base.value().c_str(), &st) != 0) {
        return Result<GrepResult>::failure(ErrorKind::NotFound, "Path does not exist: " + dir);
    }

    // An explicit file is searched whatever the glob says
    std::vector<GlobMatch> candidates;
    if (S_ISREG(st.st_mode)) {
        GlobMatch m;
        m.path = base.value();
        m.mtime = static_cast<int64_t>(st.st_mtime);
        candidates.push_back(m);
    } else if (S_ISDIR(st.st_mode)) {
        std::set<std::string> seen;
        std::vector<std::string> globs = expand_braces(spec.glob.empty() ? "*" : spec.glob);
        for (size_t i = 0; i < globs.size(); ++i) {
            std::string pattern = globs[i];
            if (pattern.find('/') == std::string::npos) {
                pattern = "**/" + pattern;
            }
            std::vector<std::string> parts = pattern_parts(pattern);
            if (!parts.empty()) {
                glob_walk(base.value(), parts, 0, seen, candidates);
            }
        }
        std::sort(candidates.begin(), candidates.end(), newer_first);
    } else {
        return Result<GrepResult>::failure(ErrorKind::NotAFile,
            "Not a regular file or directory: " + dir);
    }

    GrepResult result;
    result.path = base.value();
    result.output = spec.output;

    std::vector<GrepLine> all_lines;
    std::vector<std::string> all_files;
    std::vector<GrepCount> all_counts;

    for (size_t f = 0; f < candidates.size(); ++f) {
        const std::string& path = candidates[f].path;
        Result<std::string> data = load(path);
        if (!data) {
            LOG_DEBUG("[Files] grep skips %s: %s", path.c_str(), data.error().message.c_str());
            ++result.files_skipped;
            continue;
        }
        if (looks_binary(data.value())) {
            ++result.files_skipped;
            continue;
        }

        std::vector<std::string> lines = split_lines(data.value());
        std::vector<size_t> hits;
        try {
            for (size_t i = 0; i < lines.size(); ++i) {
                if (lines[i].size() > options_.max_line_length) continue;
                if (std::regex_search(lines[i], re)) hits.push_back(i);
            }
        } catch (const std::regex_error& e) {
            LOG_WARN("[Files] grep gave up on %s: %s", path.c_str(), e.what());
            ++result.files_skipped;
            continue;
        }
        ++result.files_searched;
        if (hits.empty()) continue;

        all_files.push_back(path);
        GrepCount count;
        count.path = path;
        count.count = hits.size();
        all_counts.push_back(count);

        if (spec.output != GrepOutput::Content) continue;

        size_t next = 0;
        for (size_t h = 0; h < hits.size(); ++h) {
            size_t before = static_cast<size_t>(spec.before);
            size_t from = hits[h] > before ? hits[h] - before : 0;
            size_t to = std::min(lines.size() - 1, hits[h] + static_cast<size_t>(spec.after));
            for (size_t k = std::max(from, next); k <= to; ++k) {
                GrepLine line;
                line.path = path;
                line.number = k + 1;
                line.match = std::binary_search(hits.begin(), hits.end(), k);
                if (lines[k].size() > options_.max_line_length) {
                    line.text = truncate_safe(lines[k], options_.max_line_length) + "... truncated";
                } else {
                    line.text = lines[k];
                }
                all_lines.push_back(line);
            }
            next = std::max(next, to + 1);
        }
    }

    switch (spec.output) {
        case GrepOutput::FilesWithMatches:
            result.total = all_files.size();
            result.files = page(all_files, spec.offset, spec.head_limit, result.has_more);
            break;
        case GrepOutput::Count:
            result.total = all_counts.size();
            result.counts = page(all_counts, spec.offset, spec.head_limit, result.has_more);
            break;
        case GrepOutput::Content: {
            int64_t limit = spec.head_limit > 0 ? spec.head_limit : options_.max_lines;
            result.total = all_lines.size();
            result.lines = page(all_lines, spec.offset, limit, result.has_more);
            result.content = render_grep_lines(result.lines);
            break;
        }
    }

    LOG_DEBUG("[Files] grep '%s' in %s: %zu file(s) searched, %zu entr%s",
              spec.pattern.c_str(), result.path.c_str(), result.files_searched,
              result.total, result.total == 1 ? "y" : "ies");
    return Result<GrepResult>::success(result);
}

} // namespace toolgate
