/*
 * toolgate C++17 - Configuration Implementation
 */
#include <toolgate/core/config.hpp>
#include <toolgate/core/logger.hpp>
#include <toolgate/core/utils.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace toolgate {

Config::Config() : root_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        LOG_DEBUG("Config file not readable: %s", path.c_str());
        return false;
    }
    std::ostringstream content;
    content << file.rdbuf();
    return load_string(content.str());
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        LOG_ERROR("Config is not valid JSON");
        return false;
    }
    if (!parsed.is_object()) {
        LOG_ERROR("Config root must be a JSON object");
        return false;
    }
    root_ = parsed;
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    const Json* node = find(key);
    if (!node || !node->is_string()) return default_value;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_value) const {
    const Json* node = find(key);
    if (!node || !node->is_number()) return default_value;
    // Out-of-range values saturate
    if (node->is_number_float()) {
        double d = node->get<double>();
        if (d >= 9223372036854775807.0) return std::numeric_limits<int64_t>::max();
        if (d <= -9223372036854775808.0) return std::numeric_limits<int64_t>::min();
        return static_cast<int64_t>(d);
    }
    if (node->is_number_unsigned()) {
        uint64_t u = node->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::numeric_limits<int64_t>::max();
        }
        return static_cast<int64_t>(u);
    }
    return node->get<int64_t>();
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    const Json* node = find(key);
    if (!node || !node->is_boolean()) return default_value;
    return node->get<bool>();
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Json* node = find(key);
    if (!node || !node->is_array()) return out;
    for (Json::const_iterator it = node->begin(); it != node->end(); ++it) {
        if (it->is_string()) {
            out.push_back(it->get<std::string>());
        }
    }
    return out;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

} // namespace toolgate
