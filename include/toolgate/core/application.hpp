/*
 * toolgate C++17 - Application
 *
 * Process lifecycle: command line, config, logging, allowed roots, the
 * engines, and the JSON-lines request loop on stdin/stdout.
 */
#ifndef toolgate_CORE_APPLICATION_HPP
#define toolgate_CORE_APPLICATION_HPP

#include "builtin_tools.hpp"
#include "config.hpp"
#include "file_store.hpp"
#include "json.hpp"
#include "process_runner.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace toolgate {

struct AppInfo {
    static constexpr const char* NAME = "toolgate";
    static constexpr const char* VERSION = "0.3.0";
};

class Application {
public:
    static Application& instance();

    // false for --help/--version (is_running() is then false) or on a
    // fatal startup error
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_.store(false); }
    bool is_running() const { return running_.load(); }

    // One request line in, one response object out. Never throws.
    static Json handle_request(BuiltinTools& tools, const std::string& line);

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_sandbox();
    void setup_tools();

    // Next line from stdin; false at EOF or once stop() was called
    bool read_line(std::string& line);

    std::atomic<bool> running_;
    Config config_;
    std::string config_file_;
    bool config_explicit_;
    std::string root_override_;
    std::string input_buffer_;
    bool input_eof_;

    std::unique_ptr<ProcessRunner> runner_;
    std::unique_ptr<FileStore> files_;
    std::unique_ptr<BuiltinTools> tools_;
};

} // namespace toolgate

#endif // toolgate_CORE_APPLICATION_HPP
