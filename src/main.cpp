/*
 * toolgate C++17 - Sandboxed command execution and file editing for agents
 *
 * Usage:
 *   ./toolgate [--config config.json] [--root /path/to/project]
 *
 * Tool requests are read from stdin as JSON lines; results go to stdout.
 */
#include <toolgate/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = toolgate::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.is_running() ? 1 : 0;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
