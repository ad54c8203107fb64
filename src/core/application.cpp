/*
 * toolgate C++17 - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <toolgate/core/application.hpp>
#include <toolgate/core/logger.hpp>
#include <toolgate/core/path_guard.hpp>
#include <toolgate/core/sandbox.hpp>
#include <toolgate/core/utils.hpp>

#include <iostream>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

namespace toolgate {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - sandboxed command execution and file editing for agents\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -h, --help         Show this help message\n"
              << "  -v, --version      Show version\n"
              << "  --config PATH      Config file (default: config.json)\n"
              << "  --root DIR         Project root (overrides sandbox.project_root)\n\n"
              << "Requests are read from stdin, one JSON object per line:\n"
              << "  {\"id\": 1, \"tool\": \"read_file\", \"arguments\": {\"path\": \"/abs/file\"}}\n"
              << "  {\"tool\": \"describe\"}\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }

    Json error_response(const Json& id, const Json& tool, ErrorKind kind, const std::string& message) {
        Json resp;
        resp["id"] = id;
        resp["tool"] = tool;
        resp["success"] = false;
        resp["error"] = ToolResult::fail(kind, message).error_json();
        return resp;
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , config_file_("config.json")
    , config_explicit_(false)
    , input_eof_(false)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_.store(false);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_.store(false);
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            config_explicit_ = true;
            continue;
        }
        if (strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            root_override_ = std::string(argv[++i]);
            continue;
        }
        std::cerr << "Unknown option: " << argv[i] << "\n";
        print_usage(argv[0]);
        return false;
    }
    return true;
}

bool Application::load_config() {
    if (config_.load_file(config_file_)) {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
        return true;
    }
    if (config_explicit_) {
        LOG_ERROR("Failed to load config from %s, aborting!", config_file_.c_str());
        return false;
    }
    LOG_WARN("No usable %s, using defaults", config_file_.c_str());
    return true;
}

void Application::setup_logging() {
    std::string log_level = config_.get_string("log_level", "info");

    LogLevel level = LogLevel::INFO;
    if (parse_log_level(log_level, level)) {
        Logger::instance().set_level(level);
    } else {
        LOG_WARN("Unknown log_level '%s', keeping info", log_level.c_str());
    }

    if (config_.has("log_color")) {
        Logger::instance().set_color(config_.get_bool("log_color", false));
    }
}

bool Application::setup_sandbox() {
    std::string project_root = root_override_;
    if (project_root.empty()) {
        project_root = config_.get_string("sandbox.project_root", "");
    }
    if (project_root.empty()) {
        char cwd[PATH_MAX];
        if (!getcwd(cwd, sizeof(cwd))) {
            LOG_ERROR("Cannot determine the current directory: %s", strerror(errno));
            return false;
        }
        project_root = cwd;
    }

    std::string scratch_root = config_.get_string("sandbox.scratch_root", "/tmp");
    std::vector<std::string> extra_roots = config_.get_string_list("sandbox.extra_roots");

    if (!Sandbox::instance().init(project_root, scratch_root, extra_roots)) {
        LOG_ERROR("Failed to initialize allowed roots");
        return false;
    }
    return true;
}

void Application::setup_tools() {
    const std::string& project_root = Sandbox::instance().project_root();
    PathGuard guard = PathGuard::from_sandbox();
    CommandPolicy policy(config_);

    ProcessOptions process_options = ProcessOptions::from_config(config_, project_root);
    FileStoreOptions file_options = FileStoreOptions::from_config(config_, project_root);

    runner_.reset(new ProcessRunner(process_options, policy, guard));
    files_.reset(new FileStore(file_options, guard));
    tools_.reset(new BuiltinTools(*runner_, *files_));

    LOG_INFO("Shell: default timeout %ds, max %ds, output cap %zu bytes, working directory %s",
             process_options.default_timeout, process_options.max_timeout,
             process_options.max_output_bytes, process_options.working_directory.c_str());
    LOG_INFO("Registered %zu tools", tools_->tool_names().size());
}

bool Application::init(int argc, char* argv[]) {
    // Parse command line
    if (!parse_args(argc, argv)) {
        return false;
    }

    // Setup signal handlers without SA_RESTART so a blocked poll() wakes up
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, NULL);
    sigaction(SIGTERM, &sa, NULL);
    signal(SIGPIPE, SIG_IGN);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!load_config()) {
        return false;
    }

    setup_logging();

    if (!setup_sandbox()) {
        return false;
    }

    setup_tools();
    return true;
}

bool Application::read_line(std::string& line) {
    for (;;) {
        size_t nl = input_buffer_.find('\n');
        if (nl != std::string::npos) {
            line = input_buffer_.substr(0, nl);
            input_buffer_.erase(0, nl + 1);
            return true;
        }
        if (input_eof_) {
            if (input_buffer_.empty()) return false;
            line.swap(input_buffer_);
            input_buffer_.clear();
            return true;
        }
        if (!running_.load()) {
            return false;
        }

        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("poll on stdin failed: %s", strerror(errno));
            return false;
        }
        if (rc == 0) continue;

        char buf[65536];
        ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
        if (n > 0) {
            input_buffer_.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            input_eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            LOG_ERROR("read on stdin failed: %s", strerror(errno));
            return false;
        }
    }
}

Json Application::handle_request(BuiltinTools& tools, const std::string& line) {
    Json request = Json::parse(line, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        return error_response(nullptr, nullptr, ErrorKind::InvalidArgument,
                              "Request must be a JSON object");
    }

    Json id = request.contains("id") ? request["id"] : Json(nullptr);
    if (!request.contains("tool") || !request["tool"].is_string()) {
        return error_response(id, nullptr, ErrorKind::InvalidArgument,
                              "Missing required field: tool");
    }
    const std::string name = request["tool"].get<std::string>();

    Json resp;
    resp["id"] = id;
    resp["tool"] = name;

    if (name == "describe") {
        resp["success"] = true;
        resp["data"]["tools"] = tools.describe();
        return resp;
    }

    Json arguments = request.contains("arguments") ? request["arguments"] : Json::object();
    ToolResult result = tools.execute(name, arguments);
    resp["success"] = result.success;
    if (result.success) {
        resp["data"] = result.data;
    } else {
        resp["error"] = result.error_json();
    }
    return resp;
}

int Application::run() {
    LOG_INFO("Ready, reading requests from stdin");

    std::string line;
    while (running_.load() && read_line(line)) {
        if (trim(line).empty()) {
            continue;
        }
        Json resp = handle_request(*tools_, line);
        std::cout << dump_json(resp) << std::endl;
        if (!std::cout) {
            LOG_ERROR("stdout closed, stopping");
            break;
        }
    }

    if (!running_.load()) {
        LOG_INFO("Received shutdown signal");
    }
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    if (runner_) {
        runner_->shutdown();
        LOG_DEBUG("[App] Background processes stopped");
    }
    tools_.reset();
    files_.reset();
    runner_.reset();

    LOG_INFO("Goodbye!");
}

} // namespace toolgate
