/*
 * toolgate C++17 - File Store
 *
 * Paginated reads, whole-file writes and exact-match edits of text files,
 * plus glob listing and regex search. Every path goes through PathGuard first; writes land
 * through a temp file and rename() so a failure never leaves a partial file.
 */
#ifndef toolgate_CORE_FILE_STORE_HPP
#define toolgate_CORE_FILE_STORE_HPP

#include "path_guard.hpp"
#include "result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace toolgate {

class Config;

struct FileStoreOptions {
    uint64_t size_limit;            // bytes; larger files are not read or edited
    int64_t max_lines;              // default read limit
    size_t max_line_length;         // longer lines are cut when read
    std::string default_directory;  // glob_files without a path

    FileStoreOptions()
        : size_limit(10 * 1024 * 1024)
        , max_lines(2000)
        , max_line_length(2000) {}

    static FileStoreOptions from_config(const Config& cfg, const std::string& default_directory);
};

struct FileReadSpec {
    std::string path;
    int64_t offset;     // lines to skip
    int64_t limit;      // 0: FileStoreOptions::max_lines

    FileReadSpec() : offset(0), limit(0) {}
    explicit FileReadSpec(const std::string& p) : path(p), offset(0), limit(0) {}
};

struct FileWriteSpec {
    std::string path;
    std::string content;
};

struct FileEditSpec {
    std::string path;
    std::string old_content;
    std::string new_content;
    bool replace_all;

    FileEditSpec() : replace_all(false) {}
};

struct FileLine {
    size_t number;      // 1-based
    std::string text;   // without the line terminator
    bool truncated;

    FileLine() : number(0), truncated(false) {}
};

struct ReadResult {
    std::string path;
    std::vector<FileLine> lines;
    size_t total_lines;
    bool has_more;
    std::string content;    // cat -n rendering of `lines`

    ReadResult() : total_lines(0), has_more(false) {}
};

struct WriteResult {
    std::string path;
    bool new_file_created;
    size_t bytes_written;

    WriteResult() : new_file_created(false), bytes_written(0) {}
};

struct EditResult {
    std::string path;
    size_t replacements;
    size_t bytes_changed;   // removed + inserted
    size_t new_size;

    EditResult() : replacements(0), bytes_changed(0), new_size(0) {}
};

struct GlobMatch {
    std::string path;
    int64_t mtime;
};

struct GlobResult {
    std::string directory;
    std::vector<std::string> files;     // newest first
};

enum class GrepOutput {
    FilesWithMatches,   // paths of files with at least one match
    Content,            // matching lines, with optional context
    Count               // matches per file
};

const char* grep_output_name(GrepOutput mode);
bool parse_grep_output(const std::string& name, GrepOutput& out);

struct GrepSpec {
    std::string pattern;        // ECMAScript regex, matched per line
    std::string path;           // file or directory; default directory when empty
    std::string glob;           // file name filter, "*.{cpp,hpp}" style
    GrepOutput output;
    bool case_insensitive;
    int64_t before;             // context lines, Content only
    int64_t after;
    int64_t head_limit;         // 0: unlimited (Content: max_lines)
    int64_t offset;             // entries skipped before head_limit

    GrepSpec()
        : output(GrepOutput::FilesWithMatches)
        , case_insensitive(false)
        , before(0)
        , after(0)
        , head_limit(0)
        , offset(0) {}
};

struct GrepLine {
    std::string path;
    size_t number;      // 1-based
    std::string text;
    bool match;         // false for context lines
};

struct GrepCount {
    std::string path;
    size_t count;
};

struct GrepResult {
    std::string path;
    GrepOutput output;
    std::vector<std::string> files;     // FilesWithMatches
    std::vector<GrepLine> lines;        // Content
    std::vector<GrepCount> counts;      // Count
    std::string content;                // rg-style rendering of lines
    size_t total;                       // entries before offset/head_limit
    bool has_more;
    size_t files_searched;
    size_t files_skipped;               // binary, too large or unreadable

    GrepResult()
        : output(GrepOutput::FilesWithMatches)
        , total(0)
        , has_more(false)
        , files_searched(0)
        , files_skipped(0) {}
};

class FileStore {
public:
    FileStore(const FileStoreOptions& options, const PathGuard& guard);

    Result<ReadResult> read_file(const FileReadSpec& spec) const;
    Result<WriteResult> write_file(const FileWriteSpec& spec) const;
    Result<EditResult> edit_file(const FileEditSpec& spec) const;

    // Files under `path` (default directory when empty) matching `pattern`
    Result<GlobResult> glob_files(const std::string& pattern, const std::string& path) const;

    // Lines matching `spec.pattern` in text files under `spec.path`. Binary
    // and oversized files are skipped, as are lines longer than
    // max_line_length.
    Result<GrepResult> grep_files(const GrepSpec& spec) const;

    // Heuristic over the first 1024 bytes of `data`
    static bool looks_binary(const std::string& data);

    const FileStoreOptions& options() const { return options_; }

private:
    // Read a whole regular file, enforcing the size limit
    Result<std::string> load(const std::string& canonical) const;

    // Write `content` to a temp file beside `target` and rename it over
    static Result<size_t> replace_atomically(const std::string& target, const std::string& content,
                                             unsigned int mode);

    FileStoreOptions options_;
    PathGuard guard_;
};

} // namespace toolgate

#endif // toolgate_CORE_FILE_STORE_HPP
