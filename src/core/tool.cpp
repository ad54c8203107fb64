/*
 * toolgate C++17 - Tool definitions Implementation
 */
#include <toolgate/core/tool.hpp>

namespace toolgate {

Json ToolResult::error_json() const {
    Json j;
    j["kind"] = error_kind_name(error.kind);
    j["category"] = error_category_name(error_category(error.kind));
    j["message"] = error.message;
    if (error.kind == ErrorKind::AmbiguousMatch) {
        j["match_count"] = error.match_count;
    }
    return j;
}

Json params_to_json_schema(const std::vector<ToolParamSchema>& params) {
    Json schema;
    schema["type"] = "object";
    schema["properties"] = Json::object();
    Json required = Json::array();

    for (size_t i = 0; i < params.size(); ++i) {
        const ToolParamSchema& p = params[i];
        Json prop;
        prop["type"] = p.type;
        prop["description"] = p.description;
        schema["properties"][p.name] = prop;
        if (p.required) {
            required.push_back(p.name);
        }
    }
    schema["required"] = required;
    return schema;
}

} // namespace toolgate
