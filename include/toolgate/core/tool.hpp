/*
 * toolgate C++17 - Tool definitions
 *
 * Call format (one JSON object per request):
 *   {"id": 7, "tool": "tool_name", "arguments": {"param1": "value1"}}
 *
 * Result format:
 *   {"id": 7, "tool": "tool_name", "success": true, "data": {...}}
 *   {"id": 7, "tool": "tool_name", "success": false,
 *    "error": {"kind": "...", "category": "...", "message": "..."}}
 */
#ifndef toolgate_CORE_TOOL_HPP
#define toolgate_CORE_TOOL_HPP

#include "json.hpp"
#include "result.hpp"
#include <string>
#include <vector>

namespace toolgate {

// Schema for a tool parameter
struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "integer", "boolean"
    std::string description;
    bool required;

    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

// Tool execution result
struct ToolResult {
    bool success;
    Json data;          // operation output when success
    Error error;        // kind and message when !success

    ToolResult() : success(false), data(Json::object()) {}

    static ToolResult ok(const Json& data) {
        ToolResult r;
        r.success = true;
        r.data = data;
        return r;
    }

    static ToolResult fail(const Error& error) {
        ToolResult r;
        r.success = false;
        r.error = error;
        return r;
    }

    static ToolResult fail(ErrorKind kind, const std::string& message) {
        return fail(Error(kind, message));
    }

    // {"kind", "category", "message", "match_count"?}
    Json error_json() const;
};

// JSON schema object ({"type": "object", "properties": ..., "required": ...})
Json params_to_json_schema(const std::vector<ToolParamSchema>& params);

} // namespace toolgate

#endif // toolgate_CORE_TOOL_HPP
