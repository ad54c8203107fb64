/*
 * toolgate C++17 - Process Runner
 *
 * Runs screened shell commands under /bin/sh in their own process group.
 * Foreground runs block until exit or timeout; background runs return a
 * handle at once and are tracked in an in-memory registry until collected
 * or expired.
 */
#ifndef toolgate_CORE_PROCESS_RUNNER_HPP
#define toolgate_CORE_PROCESS_RUNNER_HPP

#include "command_policy.hpp"
#include "path_guard.hpp"
#include "result.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

namespace toolgate {

class Config;

// Exit code reported for a foreground command killed at its deadline
const int kTimeoutExitCode = 124;

// Longest command accepted. The kernel refuses a single exec argument of
// 128 KiB or more (MAX_ARG_STRLEN).
const size_t kMaxCommandBytes = 128 * 1024 - 1;

struct ProcessOptions {
    int default_timeout;            // seconds
    int max_timeout;                // seconds; larger requests are clamped
    size_t max_output_bytes;        // per stream
    int retention_seconds;          // finished background entries
    std::string working_directory;  // used when a request names none

    ProcessOptions()
        : default_timeout(60)
        , max_timeout(300)
        , max_output_bytes(30000)
        , retention_seconds(600) {}

    // shell.* keys; working_directory falls back to `default_directory`
    static ProcessOptions from_config(const Config& cfg, const std::string& default_directory);
};

struct ExecutionRequest {
    std::string command;
    std::string working_directory;  // empty: ProcessOptions::working_directory
    int timeout_seconds;            // 0: ProcessOptions::default_timeout
    bool background;

    ExecutionRequest() : timeout_seconds(0), background(false) {}
    explicit ExecutionRequest(const std::string& cmd)
        : command(cmd), timeout_seconds(0), background(false) {}
};

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code;
    bool has_exit_code;         // false for a background launch
    bool success;               // exit_code == 0
    bool timed_out;
    bool stdout_truncated;
    bool stderr_truncated;
    std::string handle;         // background launch only
    std::string warning;        // policy warning and/or timeout clamp notice
    std::string working_directory;
    int64_t elapsed_ms;

    ExecutionResult()
        : exit_code(0), has_exit_code(false), success(false), timed_out(false)
        , stdout_truncated(false), stderr_truncated(false), elapsed_ms(0) {}
};

enum class ProcessState {
    Running,
    Completed,  // exited 0
    Failed,     // exited non-zero
    Killed      // terminated by a signal
};

const char* process_state_name(ProcessState state);

// Read-only copy of a registry entry
struct BackgroundProcess {
    std::string handle;
    pid_t pid;
    std::string command;
    std::string working_directory;
    int64_t started_at_ms;      // wall clock
    int64_t elapsed_ms;
    ProcessState state;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated;
    bool stderr_truncated;
    int exit_code;
    bool has_exit_code;

    BackgroundProcess()
        : pid(0), started_at_ms(0), elapsed_ms(0), state(ProcessState::Running)
        , stdout_truncated(false), stderr_truncated(false)
        , exit_code(0), has_exit_code(false) {}
};

// Keeps the last `capacity` bytes written to it
class OutputBuffer {
public:
    explicit OutputBuffer(size_t capacity = 30000);

    void append(const char* data, size_t len);

    // Kept tail, prefixed with a marker when anything was dropped
    std::string text() const;
    bool truncated() const { return total_ > capacity_; }
    size_t total_bytes() const { return total_; }

private:
    size_t capacity_;
    size_t total_;
    std::string data_;
};

class ProcessRunner {
public:
    ProcessRunner(const ProcessOptions& options, const CommandPolicy& policy, const PathGuard& guard);
    ~ProcessRunner();

    // Blocked / NotAbsolute / OutsideAllowedScope / NotFound / NotADirectory /
    // InvalidArgument / SpawnFailed. A timeout is not a failure: the result
    // has timed_out set and exit_code kTimeoutExitCode.
    Result<ExecutionResult> run(const ExecutionRequest& request);

    // NotFound for unknown or already collected handles
    Result<BackgroundProcess> poll(const std::string& handle);

    // StillRunning while the process is alive; the entry is removed on success
    Result<ExecutionResult> collect(const std::string& handle);

    std::vector<BackgroundProcess> list();

    // Kill every running background process group and wait for the monitors
    void shutdown();

    // Number of processes ever spawned (foreground and background)
    size_t spawn_count() const { return spawn_count_.load(); }

    const ProcessOptions& options() const { return options_; }

private:
    struct Entry;

    typedef std::function<void(int stream, const char* data, size_t len)> OutputSink;

    struct Spawned {
        pid_t pid;
        int out_fd;
        int err_fd;
    };

    struct Outcome {
        int status;
        bool timed_out;
    };

    // Working directory of a request, checked against the allowed roots
    Result<std::string> resolve_directory(const ExecutionRequest& request) const;

    bool spawn(const std::string& command, const std::string& directory, Spawned& out, std::string& error);

    // Drain both pipes until the child exits (or `deadline_ms` on the
    // monotonic clock passes, when > 0), then reap and kill the group.
    static Outcome pump(const Spawned& proc, int64_t deadline_ms, const OutputSink& sink);

    static int exit_code_of(int status);

    void monitor(std::shared_ptr<Entry> entry, Spawned proc);

    // Drop finished entries past the retention window. Caller holds mutex_;
    // threads of the dropped entries are moved into `to_join`.
    void evict_expired_locked(std::vector<std::thread>& to_join);

    Result<ExecutionResult> launch_background(const ExecutionRequest& request, const Spawned& proc,
                                              ExecutionResult result, int64_t started_ms);

    static BackgroundProcess snapshot(const Entry& entry);

    ProcessOptions options_;
    CommandPolicy policy_;
    PathGuard guard_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry> > background_;
    std::atomic<size_t> spawn_count_;
    std::atomic<bool> stopping_;
};

} // namespace toolgate

#endif // toolgate_CORE_PROCESS_RUNNER_HPP
