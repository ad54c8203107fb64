#ifndef toolgate_CORE_UTILS_HPP
#define toolgate_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace toolgate {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Milliseconds on the monotonic clock (for deadlines and elapsed times)
int64_t monotonic_ms();

// Format millisecond timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter (empty fields are kept)
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Collapse runs of spaces/tabs into one space
std::string collapse_spaces(const std::string& s);

// ============ Path utilities ============

// Lexically normalize path (resolve . and .., drop duplicate slashes)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Directory part of an absolute path ("/a/b" -> "/a", "/a" -> "/")
std::string parent_path(const std::string& path);

// Last component of a path ("/a/b" -> "b")
std::string base_name(const std::string& path);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

} // namespace toolgate

#endif // toolgate_CORE_UTILS_HPP
