/*
 * toolgate C++17 - Built-in Tools
 *
 * Dispatch table for the tools exposed to the caller:
 * - run_command: Execute a shell command (foreground or background)
 * - poll_command: Snapshot of a background command
 * - collect_command: Final result of a finished background command
 * - list_commands: Snapshots of every tracked background command
 * - read_file: Read a range of lines from a text file
 * - write_file: Create or overwrite a file
 * - edit_file: Replace an exact text block in a file
 * - glob_files: Find files by glob pattern
 * - grep_files: Search file contents by regular expression
 *
 * Arguments are parsed into a closed ToolRequest variant before anything
 * runs; execution visits the variant.
 */
#ifndef toolgate_CORE_BUILTIN_TOOLS_HPP
#define toolgate_CORE_BUILTIN_TOOLS_HPP

#include "file_store.hpp"
#include "json.hpp"
#include "process_runner.hpp"
#include "result.hpp"
#include "tool.hpp"

#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace toolgate {

// ============================================================================
// Requests
// ============================================================================

struct RunCommandRequest {
    ExecutionRequest exec;
};

struct PollCommandRequest {
    std::string handle;
};

struct CollectCommandRequest {
    std::string handle;
};

struct ListCommandsRequest {
};

struct ReadFileRequest {
    FileReadSpec spec;
};

struct WriteFileRequest {
    FileWriteSpec spec;
};

struct EditFileRequest {
    FileEditSpec spec;
};

struct GlobFilesRequest {
    std::string pattern;
    std::string path;
};

struct GrepFilesRequest {
    GrepSpec spec;
};

typedef std::variant<RunCommandRequest,
                     PollCommandRequest,
                     CollectCommandRequest,
                     ListCommandsRequest,
                     ReadFileRequest,
                     WriteFileRequest,
                     EditFileRequest,
                     GlobFilesRequest,
                     GrepFilesRequest> ToolRequest;

typedef std::function<Result<ToolRequest>(const Json& params)> RequestParser;

struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    RequestParser parse;

    ToolDefinition() {}
    ToolDefinition(const std::string& n, const std::string& d, RequestParser p)
        : name(n), description(d), parse(p) {}
};

// ============================================================================
// Built-in Tools
// ============================================================================

class BuiltinTools {
public:
    BuiltinTools(ProcessRunner& runner, const FileStore& files);

    // Parse `params` for tool `name` and run it. Unknown tools and bad
    // parameters fail with InvalidArgument; nothing is executed for them.
    // An exception escaping a tool is reported as Internal.
    ToolResult execute(const std::string& name, const Json& params);

    // Add a tool, or replace the one with the same name
    void register_tool(const ToolDefinition& tool);

    // Arguments -> request, without executing
    Result<ToolRequest> parse(const std::string& name, const Json& params) const;

    ToolResult dispatch(const ToolRequest& request);

    // [{"name", "description", "parameters": <JSON schema>}, ...]
    Json describe() const;

    std::vector<std::string> tool_names() const;

    // JSON renderings shared with callers that bypass the dispatch table
    static Json execution_to_json(const ExecutionResult& result);
    static Json snapshot_to_json(const BackgroundProcess& process);

private:
    struct Executor;

    void register_tools();

    ToolResult do_run_command(const RunCommandRequest& request);
    ToolResult do_poll_command(const PollCommandRequest& request);
    ToolResult do_collect_command(const CollectCommandRequest& request);
    ToolResult do_list_commands(const ListCommandsRequest& request);
    ToolResult do_read_file(const ReadFileRequest& request) const;
    ToolResult do_write_file(const WriteFileRequest& request) const;
    ToolResult do_edit_file(const EditFileRequest& request) const;
    ToolResult do_glob_files(const GlobFilesRequest& request) const;
    ToolResult do_grep_files(const GrepFilesRequest& request) const;

    ProcessRunner& runner_;
    const FileStore& files_;
    std::vector<ToolDefinition> tools_;
    std::map<std::string, size_t> index_;
};

} // namespace toolgate

#endif // toolgate_CORE_BUILTIN_TOOLS_HPP
