/*
 * toolgate C++17 - Built-in Tools Implementation
 */
#include <toolgate/core/builtin_tools.hpp>
#include <toolgate/core/logger.hpp>
#include <toolgate/core/utils.hpp>

#include <exception>

namespace toolgate {

// ============================================================================
// Parameter Parsing
// ============================================================================

namespace builtin_tools {
namespace param {

// null counts as absent
bool present(const Json& params, const char* key) {
    return params.contains(key) && !params[key].is_null();
}

Error missing(const char* key) {
    return Error(ErrorKind::InvalidArgument, std::string("Missing required parameter: ") + key);
}

Error wrong_type(const char* key, const char* type) {
    return Error(ErrorKind::InvalidArgument,
                 std::string("Parameter '") + key + "' must be " + type);
}

bool string_value(const Json& params, const char* key, bool required, std::string& out, Error& error) {
    if (!present(params, key)) {
        if (required) {
            error = missing(key);
            return false;
        }
        return true;
    }
    if (!params[key].is_string()) {
        error = wrong_type(key, "a string");
        return false;
    }
    out = params[key].get<std::string>();
    return true;
}

bool int_value(const Json& params, const char* key, int64_t& out, bool& found, Error& error) {
    found = false;
    if (!present(params, key)) {
        return true;
    }
    const Json& v = params[key];
    if (!v.is_number_integer()) {
        error = wrong_type(key, "an integer");
        return false;
    }
    out = v.get<int64_t>();
    found = true;
    return true;
}

bool bool_value(const Json& params, const char* key, bool& out, Error& error) {
    if (!present(params, key)) {
        return true;
    }
    if (!params[key].is_boolean()) {
        error = wrong_type(key, "a boolean");
        return false;
    }
    out = params[key].get<bool>();
    return true;
}

} // namespace param

// ============================================================================
// Request Parsers
// ============================================================================

namespace parse {

Result<ToolRequest> run_command(const Json& params) {
    RunCommandRequest req;
    Error error;
    int64_t timeout = 0;
    bool has_timeout = false;

    if (!param::string_value(params, "command", true, req.exec.command, error) ||
        !param::string_value(params, "working_directory", false, req.exec.working_directory, error) ||
        !param::int_value(params, "timeout_seconds", timeout, has_timeout, error) ||
        !param::bool_value(params, "background", req.exec.background, error)) {
        return Result<ToolRequest>::failure(error);
    }
    if (trim(req.exec.command).empty()) {
        return Result<ToolRequest>::failure(ErrorKind::InvalidArgument, "command must not be empty");
    }
    if (has_timeout) {
        if (timeout <= 0) {
            return Result<ToolRequest>::failure(ErrorKind::InvalidArgument,
                "timeout_seconds must be greater than 0");
        }
        // Larger values are clamped by the runner; keep them in int range
        req.exec.timeout_seconds = timeout > 86400 ? 86400 : static_cast<int>(timeout);
    }
    return Result<ToolRequest>::success(req);
}

Result<ToolRequest> poll_command(const Json& params) {
    PollCommandRequest req;
    Error error;
    if (!param::string_value(params, "handle", true, req.handle, error)) {
        return Result<ToolRequest>::failure(error);
    }
    return Result<ToolRequest>::success(req);
}

Result<ToolRequest> collect_command(const Json& params) {
    CollectCommandRequest req;
    Error error;
    if (!param::string_value(params, "handle", true, req.handle, error)) {
        return Result<ToolRequest>::failure(error);
    }
    return Result<ToolRequest>::success(req);
}

Result<ToolRequest> list_commands(const Json&) {
    return Result<ToolRequest>::success(ListCommandsRequest());
}

Result<ToolRequest> read_file(const Json& params) {
    ReadFileRequest req;
    Error error;
    int64_t offset = 0;
    int64_t limit = 0;
    bool has_offset = false;
    bool has_limit = false;

    if (!param::string_value(params, "path", true, req.spec.path, error) ||
        !param::int_value(params, "offset", offset, has_offset, error) ||
        !param::int_value(params, "limit", limit, has_limit, error)) {
        return Result<ToolRequest>::failure(error);
    }
    if (has_offset && offset < 0) {
        return Result<ToolRequest>::failure(ErrorKind::InvalidArgument, "offset must be >= 0");
    }
    if (has_limit && limit <= 0) {
        return Result<ToolRequest>::failure(ErrorKind::InvalidArgument, "limit must be > 0");
    }
    req.spec.offset = offset;
    req.spec.limit = has_limit ? limit : 0;
    return Result<ToolRequest>::success(req);
}

Result<ToolRequest> write_file(const Json& params) {
    WriteFileRequest req;
    Error error;
    if (!param::string_value(params, "path", true, req.spec.path, error) ||
        !param::string_value(params, "content", true, req.spec.content, error)) {
        return Result<ToolRequest>::failure(error);
    }
    return Result<ToolRequest>::success(req);
}

Result<ToolRequest> edit_file(const Json& params) {
    EditFileRequest req;
    Error error;
    if (!param::string_value(params, "path", true, req.spec.path, error) ||
        !param::string_value(params, "old_string", true, req.spec.old_content, error) ||
        !param::string_value(params, "new_string", true, req.spec.new_content, error) ||
        !param::bool_value(params, "replace_all", req.spec.replace_all, error)) {
        return Result<ToolRequest>::failure(error);
    }
    return Result<ToolRequest>::success(req);
}

Result<ToolRequest> glob_files(const Json& params) {
    GlobFilesRequest req;
    Error error;
    if (!param::string_value(params, "pattern", true, req.pattern, error) ||
        !param::string_value(params, "path", false, req.path, error)) {
        return Result<ToolRequest>::failure(error);
    }
    return Result<ToolRequest>::success(req);
}

Result<ToolRequest> grep_files(const Json& params) {
    GrepFilesRequest req;
    GrepSpec& spec = req.spec;
    Error error;
    std::string output;
    int64_t context = 0;
    bool has_context = false;
    bool has_before = false;
    bool has_after = false;
    bool found = false;

    if (!param::string_value(params, "pattern", true, spec.pattern, error) ||
        !param::string_value(params, "path", false, spec.path, error) ||
        !param::string_value(params, "glob", false, spec.glob, error) ||
        !param::string_value(params, "output_mode", false, output, error) ||
        !param::bool_value(params, "case_insensitive", spec.case_insensitive, error) ||
        !param::int_value(params, "context", context, has_context, error) ||
        !param::int_value(params, "before", spec.before, has_before, error) ||
        !param::int_value(params, "after", spec.after, has_after, error) ||
        !param::int_value(params, "head_limit", spec.head_limit, found, error) ||
        !param::int_value(params, "offset", spec.offset, found, error)) {
        return Result<ToolRequest>::failure(error);
    }
    if (!output.empty() && !parse_grep_output(output, spec.output)) {
        return Result<ToolRequest>::failure(ErrorKind::InvalidArgument,
            "output_mode must be one of content, files_with_matches, count");
    }
    // before/after win over context
    if (has_context) {
        if (!has_before) spec.before = context;
        if (!has_after) spec.after = context;
    }
    return Result<ToolRequest>::success(req);
}

} // namespace parse
} // namespace builtin_tools

// ============================================================================
// BuiltinTools Implementation
// ============================================================================

struct BuiltinTools::Executor {
    BuiltinTools* self;

    ToolResult operator()(const RunCommandRequest& r) const { return self->do_run_command(r); }
    ToolResult operator()(const PollCommandRequest& r) const { return self->do_poll_command(r); }
    ToolResult operator()(const CollectCommandRequest& r) const { return self->do_collect_command(r); }
    ToolResult operator()(const ListCommandsRequest& r) const { return self->do_list_commands(r); }
    ToolResult operator()(const ReadFileRequest& r) const { return self->do_read_file(r); }
    ToolResult operator()(const WriteFileRequest& r) const { return self->do_write_file(r); }
    ToolResult operator()(const EditFileRequest& r) const { return self->do_edit_file(r); }
    ToolResult operator()(const GlobFilesRequest& r) const { return self->do_glob_files(r); }
    ToolResult operator()(const GrepFilesRequest& r) const { return self->do_grep_files(r); }
};

BuiltinTools::BuiltinTools(ProcessRunner& runner, const FileStore& files)
    : runner_(runner)
    , files_(files) {
    register_tools();
}

void BuiltinTools::register_tool(const ToolDefinition& tool) {
    std::map<std::string, size_t>::const_iterator it = index_.find(tool.name);
    if (it != index_.end()) {
        tools_[it->second] = tool;
        return;
    }
    index_[tool.name] = tools_.size();
    tools_.push_back(tool);
}

void BuiltinTools::register_tools() {
    // run_command - Execute shell commands
    {
        ToolDefinition tool("run_command",
            "Execute a shell command with /bin/sh and return its output and exit code. "
            "Commands matching the block list are refused; risky commands run with a warning. "
            "Set background=true for long-running processes and use the returned handle "
            "with poll_command / collect_command.",
            builtin_tools::parse::run_command);
        tool.params.push_back(ToolParamSchema("command", "string", "The shell command to execute", true));
        tool.params.push_back(ToolParamSchema("working_directory", "string",
            "Absolute working directory (default: project root)"));
        tool.params.push_back(ToolParamSchema("timeout_seconds", "integer",
            "Timeout for foreground commands (default 60, max 300)"));
        tool.params.push_back(ToolParamSchema("background", "boolean",
            "Return immediately with a handle instead of waiting (default false)"));
        register_tool(tool);
    }

    // poll_command - Snapshot of a background command
    {
        ToolDefinition tool("poll_command",
            "Show the state and output so far of a background command.",
            builtin_tools::parse::poll_command);
        tool.params.push_back(ToolParamSchema("handle", "string", "Handle returned by run_command", true));
        register_tool(tool);
    }

    // collect_command - Final result of a background command
    {
        ToolDefinition tool("collect_command",
            "Return the final result of a finished background command and forget it. "
            "Fails with still_running while it is alive.",
            builtin_tools::parse::collect_command);
        tool.params.push_back(ToolParamSchema("handle", "string", "Handle returned by run_command", true));
        register_tool(tool);
    }

    // list_commands - Every tracked background command
    {
        ToolDefinition tool("list_commands",
            "List every background command that has not been collected yet.",
            builtin_tools::parse::list_commands);
        register_tool(tool);
    }

    // read_file - Read a range of lines
    {
        ToolDefinition tool("read_file",
            "Read a text file. Returns numbered lines (cat -n format), up to 2000 lines "
            "by default; use offset and limit for long files. Lines longer than 2000 "
            "characters are truncated.",
            builtin_tools::parse::read_file);
        tool.params.push_back(ToolParamSchema("path", "string", "Absolute path to the file", true));
        tool.params.push_back(ToolParamSchema("offset", "integer", "Number of lines to skip (default 0)"));
        tool.params.push_back(ToolParamSchema("limit", "integer", "Maximum number of lines to return"));
        register_tool(tool);
    }

    // write_file - Create or overwrite
    {
        ToolDefinition tool("write_file",
            "Write content to a file. Creates the file if it doesn't exist, "
            "overwrites it if it does. The parent directory must exist.",
            builtin_tools::parse::write_file);
        tool.params.push_back(ToolParamSchema("path", "string", "Absolute path to the file", true));
        tool.params.push_back(ToolParamSchema("content", "string", "Full content of the file", true));
        register_tool(tool);
    }

    // edit_file - Exact replacement
    {
        ToolDefinition tool("edit_file",
            "Replace an exact block of text in a file. old_string must match the file "
            "byte for byte and must be unique unless replace_all is set.",
            builtin_tools::parse::edit_file);
        tool.params.push_back(ToolParamSchema("path", "string", "Absolute path to the file", true));
        tool.params.push_back(ToolParamSchema("old_string", "string", "Text to replace", true));
        tool.params.push_back(ToolParamSchema("new_string", "string", "Replacement text", true));
        tool.params.push_back(ToolParamSchema("replace_all", "boolean",
            "Replace every occurrence (default false)"));
        register_tool(tool);
    }

    // glob_files - Find files by pattern
    {
        ToolDefinition tool("glob_files",
            "Find files by glob pattern such as \"**/*.cpp\" or \"src/*.hpp\". "
            "Matching is case-insensitive; results are sorted newest first.",
            builtin_tools::parse::glob_files);
        tool.params.push_back(ToolParamSchema("pattern", "string", "Glob pattern relative to path", true));
        tool.params.push_back(ToolParamSchema("path", "string",
            "Absolute directory to search (default: project root)"));
        register_tool(tool);
    }

    // grep_files - Search file contents
    {
        ToolDefinition tool("grep_files",
            "Search text files for a regular expression (ECMAScript syntax), one line at a time. "
            "Binary files, files over the size limit and lines over 2000 characters are skipped. "
            "output_mode is files_with_matches (default), content or count.",
            builtin_tools::parse::grep_files);
        tool.params.push_back(ToolParamSchema("pattern", "string", "Regular expression to search for", true));
        tool.params.push_back(ToolParamSchema("path", "string",
            "Absolute file or directory to search (default: project root)"));
        tool.params.push_back(ToolParamSchema("glob", "string",
            "File name filter such as \"*.cpp\" or \"*.{c,h}\""));
        tool.params.push_back(ToolParamSchema("output_mode", "string",
            "files_with_matches, content or count"));
        tool.params.push_back(ToolParamSchema("case_insensitive", "boolean", "Ignore case (default false)"));
        tool.params.push_back(ToolParamSchema("context", "integer",
            "Lines shown before and after each match (content mode)"));
        tool.params.push_back(ToolParamSchema("before", "integer", "Lines shown before each match"));
        tool.params.push_back(ToolParamSchema("after", "integer", "Lines shown after each match"));
        tool.params.push_back(ToolParamSchema("head_limit", "integer",
            "Return at most this many entries (default: all; content: 2000 lines)"));
        tool.params.push_back(ToolParamSchema("offset", "integer", "Entries to skip before head_limit"));
        register_tool(tool);
    }
}

std::vector<std::string> BuiltinTools::tool_names() const {
    std::vector<std::string> names;
    for (size_t i = 0; i < tools_.size(); ++i) {
        names.push_back(tools_[i].name);
    }
    return names;
}

Json BuiltinTools::describe() const {
    Json out = Json::array();
    for (size_t i = 0; i < tools_.size(); ++i) {
        Json t;
        t["name"] = tools_[i].name;
        t["description"] = tools_[i].description;
        t["parameters"] = params_to_json_schema(tools_[i].params);
        out.push_back(t);
    }
    return out;
}

Result<ToolRequest> BuiltinTools::parse(const std::string& name, const Json& params) const {
    std::map<std::string, size_t>::const_iterator it = index_.find(name);
    if (it == index_.end()) {
        return Result<ToolRequest>::failure(ErrorKind::InvalidArgument,
            "Unknown tool: " + name + " (available: " + join(tool_names(), ", ") + ")");
    }
    if (!params.is_null() && !params.is_object()) {
        return Result<ToolRequest>::failure(ErrorKind::InvalidArgument,
            "arguments must be a JSON object");
    }

    try {
        return tools_[it->second].parse(params.is_null() ? Json::object() : params);
    } catch (const Json::exception& e) {
        return Result<ToolRequest>::failure(ErrorKind::InvalidArgument,
            std::string("Invalid arguments for ") + name + ": " + e.what());
    }
}

ToolResult BuiltinTools::execute(const std::string& name, const Json& params) {
    LOG_INFO("[Tools] %s", name.c_str());

    try {
        Result<ToolRequest> request = parse(name, params);
        if (!request) {
            LOG_DEBUG("[Tools] Rejected %s: %s", name.c_str(), request.error().message.c_str());
            return ToolResult::fail(request.error());
        }
        return dispatch(request.value());
    } catch (const std::exception& e) {
        LOG_ERROR("[Tools] %s failed: %s", name.c_str(), e.what());
        return ToolResult::fail(ErrorKind::Internal, std::string("Tool ") + name + " failed: " + e.what());
    }
}

ToolResult BuiltinTools::dispatch(const ToolRequest& request) {
    Executor executor;
    executor.self = this;
    return std::visit(executor, request);
}

// ============================================================================
// JSON renderings
// ============================================================================

Json BuiltinTools::execution_to_json(const ExecutionResult& result) {
    Json j;
    if (!result.handle.empty()) {
        j["handle"] = result.handle;
    }
    if (result.has_exit_code) {
        j["stdout"] = result.stdout_text;
        j["stderr"] = result.stderr_text;
        j["exit_code"] = result.exit_code;
        j["success"] = result.success;
        j["timed_out"] = result.timed_out;
        j["stdout_truncated"] = result.stdout_truncated;
        j["stderr_truncated"] = result.stderr_truncated;
    } else {
        j["state"] = process_state_name(ProcessState::Running);
    }
    j["working_directory"] = result.working_directory;
    j["elapsed_ms"] = result.elapsed_ms;
    if (!result.warning.empty()) {
        j["warning"] = result.warning;
    }
    return j;
}

Json BuiltinTools::snapshot_to_json(const BackgroundProcess& process) {
    Json j;
    j["handle"] = process.handle;
    j["pid"] = static_cast<int64_t>(process.pid);
    j["command"] = process.command;
    j["working_directory"] = process.working_directory;
    j["started_at"] = format_timestamp_ms(process.started_at_ms);
    j["state"] = process_state_name(process.state);
    j["stdout"] = process.stdout_text;
    j["stderr"] = process.stderr_text;
    j["stdout_truncated"] = process.stdout_truncated;
    j["stderr_truncated"] = process.stderr_truncated;
    if (process.has_exit_code) {
        j["exit_code"] = process.exit_code;
    }
    j["elapsed_ms"] = process.elapsed_ms;
    return j;
}

// ============================================================================
// BuiltinTools - Internal Implementations
// ============================================================================

ToolResult BuiltinTools::do_run_command(const RunCommandRequest& request) {
    Result<ExecutionResult> result = runner_.run(request.exec);
    if (!result) {
        return ToolResult::fail(result.error());
    }
    return ToolResult::ok(execution_to_json(result.value()));
}

ToolResult BuiltinTools::do_poll_command(const PollCommandRequest& request) {
    Result<BackgroundProcess> snap = runner_.poll(request.handle);
    if (!snap) {
        return ToolResult::fail(snap.error());
    }
    return ToolResult::ok(snapshot_to_json(snap.value()));
}

ToolResult BuiltinTools::do_collect_command(const CollectCommandRequest& request) {
    Result<ExecutionResult> result = runner_.collect(request.handle);
    if (!result) {
        return ToolResult::fail(result.error());
    }
    return ToolResult::ok(execution_to_json(result.value()));
}

ToolResult BuiltinTools::do_list_commands(const ListCommandsRequest&) {
    std::vector<BackgroundProcess> procs = runner_.list();
    Json list = Json::array();
    for (size_t i = 0; i < procs.size(); ++i) {
        Json entry = snapshot_to_json(procs[i]);
        // Output is only interesting per handle
        entry.erase("stdout");
        entry.erase("stderr");
        list.push_back(entry);
    }
    Json data;
    data["processes"] = list;
    return ToolResult::ok(data);
}

ToolResult BuiltinTools::do_read_file(const ReadFileRequest& request) const {
    Result<ReadResult> result = files_.read_file(request.spec);
    if (!result) {
        return ToolResult::fail(result.error());
    }

    const ReadResult& r = result.value();
    Json lines = Json::array();
    for (size_t i = 0; i < r.lines.size(); ++i) {
        Json line;
        line["line"] = r.lines[i].number;
        line["text"] = r.lines[i].text;
        lines.push_back(line);
    }

    Json data;
    data["path"] = r.path;
    data["lines"] = lines;
    data["total_lines"] = r.total_lines;
    data["has_more"] = r.has_more;
    data["content"] = r.content;
    return ToolResult::ok(data);
}

ToolResult BuiltinTools::do_write_file(const WriteFileRequest& request) const {
    Result<WriteResult> result = files_.write_file(request.spec);
    if (!result) {
        return ToolResult::fail(result.error());
    }
    Json data;
    data["path"] = result.value().path;
    data["new_file_created"] = result.value().new_file_created;
    data["bytes_written"] = result.value().bytes_written;
    return ToolResult::ok(data);
}

ToolResult BuiltinTools::do_edit_file(const EditFileRequest& request) const {
    Result<EditResult> result = files_.edit_file(request.spec);
    if (!result) {
        return ToolResult::fail(result.error());
    }
    Json data;
    data["path"] = result.value().path;
    data["replacements"] = result.value().replacements;
    data["bytes_changed"] = result.value().bytes_changed;
    data["new_size"] = result.value().new_size;
    return ToolResult::ok(data);
}

ToolResult BuiltinTools::do_glob_files(const GlobFilesRequest& request) const {
    Result<GlobResult> result = files_.glob_files(request.pattern, request.path);
    if (!result) {
        return ToolResult::fail(result.error());
    }
    Json data;
    data["directory"] = result.value().directory;
    data["files"] = result.value().files;
    data["count"] = result.value().files.size();
    return ToolResult::ok(data);
}

ToolResult BuiltinTools::do_grep_files(const GrepFilesRequest& request) const {
    Result<GrepResult> result = files_.grep_files(request.spec);
    if (!result) {
        return ToolResult::fail(result.error());
    }

    const GrepResult& r = result.value();
    Json data;
    data["path"] = r.path;
    data["output_mode"] = grep_output_name(r.output);
    switch (r.output) {
        case GrepOutput::FilesWithMatches:
            data["files"] = r.files;
            break;
        case GrepOutput::Count: {
            Json counts = Json::array();
            for (size_t i = 0; i < r.counts.size(); ++i) {
                Json c;
                c["path"] = r.counts[i].path;
                c["count"] = r.counts[i].count;
                counts.push_back(c);
            }
            data["counts"] = counts;
            break;
        }
        case GrepOutput::Content: {
            Json lines = Json::array();
            for (size_t i = 0; i < r.lines.size(); ++i) {
                Json line;
                line["path"] = r.lines[i].path;
                line["line"] = r.lines[i].number;
                line["text"] = r.lines[i].text;
                line["match"] = r.lines[i].match;
                lines.push_back(line);
            }
            data["lines"] = lines;
            data["content"] = r.content;
            break;
        }
    }
    data["total"] = r.total;
    data["has_more"] = r.has_more;
    data["files_searched"] = r.files_searched;
    data["files_skipped"] = r.files_skipped;
    return ToolResult::ok(data);
}

} // namespace toolgate
