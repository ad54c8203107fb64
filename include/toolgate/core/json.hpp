/*
 * toolgate C++17 - JSON type
 *
 * Tool arguments, results and the config file all go through nlohmann::json.
 */
#ifndef toolgate_CORE_JSON_HPP
#define toolgate_CORE_JSON_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace toolgate {

typedef nlohmann::json Json;

// Serialize without throwing on invalid UTF-8 (command output is arbitrary bytes)
inline std::string dump_json(const Json& j) {
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace toolgate

#endif // toolgate_CORE_JSON_HPP
