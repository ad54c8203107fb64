#include <toolgate/core/utils.hpp>
#include <toolgate/core/logger.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <unistd.h>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace toolgate {

// ============ Time utilities ============

void sleep_ms(int milliseconds) {
    if (milliseconds <= 0) return;
    usleep(static_cast<useconds_t>(milliseconds) * 1000);
}

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

int64_t monotonic_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string format_timestamp_ms(int64_t timestamp_ms) {
    time_t t = static_cast<time_t>(timestamp_ms / 1000);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    std::ostringstream oss;
    oss << buf << '.' << std::setfill('0') << std::setw(3) << (timestamp_ms % 1000) << 'Z';
    return oss.str();
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end;
    while ((end = s.find(delimiter, start)) != std::string::npos) {
        parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;

    // Back up so a multi-byte sequence is never split
    size_t len = max_len;
    while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) {
        --len;
    }
    return s.substr(0, len);
}

std::string collapse_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_space = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == ' ' || c == '\t') {
            if (!in_space) out.push_back(' ');
            in_space = true;
        } else {
            out.push_back(c);
            in_space = false;
        }
    }
    return out;
}

// ============ Path utilities ============

std::string normalize_path(const std::string& path) {
    if (path.empty()) return path;

    std::vector<std::string> parts = split(path, '/');
    std::vector<std::string> result;

    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty() || parts[i] == ".") {
            continue;
        }
        if (parts[i] == "..") {
            if (!result.empty() && result.back() != "..") {
                result.pop_back();
            } else if (path[0] != '/') {
                result.push_back("..");
            }
            // ".." above "/" stays at "/"
        } else {
            result.push_back(parts[i]);
        }
    }

    std::string normalized = join(result, "/");
    if (path[0] == '/') {
        normalized = "/" + normalized;
    }

    return normalized.empty() ? "." : normalized;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = a.back() == '/';
    bool b_starts_slash = b[0] == '/';

    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

std::string parent_path(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string base_name(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

// ============ UUID utilities ============

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, 16) != 1) {
        LOG_WARN("[Utils] RAND_bytes failed (error %lu), handle falls back to a time/pid seed",
                 ERR_get_error());
        unsigned int seed = static_cast<unsigned int>(current_timestamp_ms()) ^
                            static_cast<unsigned int>(getpid());
        for (int i = 0; i < 16; ++i) {
            bytes[i] = static_cast<unsigned char>(rand_r(&seed) & 0xFF);
        }
    }

    // Set version 4
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

} // namespace toolgate
