/*
 * toolgate C++17 - Configuration
 *
 * JSON config file with dotted-key access ("shell.default_timeout").
 * Missing keys and type mismatches fall back to the supplied default.
 */
#ifndef toolgate_CORE_CONFIG_HPP
#define toolgate_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace toolgate {

class Config {
public:
    Config();

    // Parse a JSON object from disk. Returns false (and keeps the previous
    // contents) if the file cannot be read or is not a JSON object.
    bool load_file(const std::string& path);

    // Parse a JSON object from a string (same rules as load_file)
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_value) const;
    int64_t get_int(const std::string& key, int64_t default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;
    std::vector<std::string> get_string_list(const std::string& key) const;

    bool has(const std::string& key) const;

    const Json& raw() const { return root_; }

private:
    const Json* find(const std::string& key) const;

    Json root_;
};

} // namespace toolgate

#endif // toolgate_CORE_CONFIG_HPP
