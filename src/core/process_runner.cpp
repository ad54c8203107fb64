/*
 * toolgate C++17 - Process Runner Implementation
 */
#include <toolgate/core/process_runner.hpp>
#include <toolgate/core/config.hpp>
#include <toolgate/core/logger.hpp>
#include <toolgate/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <limits>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolgate {

namespace {

// How long to keep reading after the shell exits while a descendant
// still holds the pipes open
const int64_t kDrainGraceMs = 250;

const int kPollIntervalMs = 50;

int clamp_to_int(int64_t value) {
    if (value > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (value < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(value);
}

void join_threads(std::vector<std::thread>& threads) {
    for (size_t i = 0; i < threads.size(); ++i) {
        if (threads[i].joinable()) {
            threads[i].join();
        }
    }
}

} // namespace

// ============================================================================
// OutputBuffer
// ============================================================================

OutputBuffer::OutputBuffer(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1)
    , total_(0) {}

void OutputBuffer::append(const char* data, size_t len) {
    total_ += len;
    data_.append(data, len);
    // Trim in batches so a chatty process does not cost a memmove per read
    if (data_.size() > capacity_ * 2) {
        data_.erase(0, data_.size() - capacity_);
    }
}

std::string OutputBuffer::text() const {
    if (data_.size() <= capacity_ && !truncated()) {
        return data_;
    }
    std::string tail = data_.size() > capacity_ ? data_.substr(data_.size() - capacity_) : data_;
    return "[... " + std::to_string(total_ - tail.size()) + " bytes truncated ...]\n" + tail;
}

// ============================================================================
// Options
// ============================================================================

const char* process_state_name(ProcessState state) {
    switch (state) {
        case ProcessState::Running: return "running";
        case ProcessState::Completed: return "completed";
        case ProcessState::Failed: return "failed";
        case ProcessState::Killed: return "killed";
    }
    return "unknown";
}

ProcessOptions ProcessOptions::from_config(const Config& cfg, const std::string& default_directory) {
    ProcessOptions opts;
    opts.max_timeout = clamp_to_int(cfg.get_int("shell.max_timeout", 300));
    if (opts.max_timeout <= 0) {
        LOG_WARN("[Shell] shell.max_timeout must be positive, using 300");
        opts.max_timeout = 300;
    }
    opts.default_timeout = clamp_to_int(cfg.get_int("shell.default_timeout", 60));
    if (opts.default_timeout <= 0) {
        LOG_WARN("[Shell] shell.default_timeout must be positive, using 60");
        opts.default_timeout = 60;
    }
    if (opts.default_timeout > opts.max_timeout) {
        opts.default_timeout = opts.max_timeout;
    }

    int64_t max_output = cfg.get_int("shell.max_output_bytes", 30000);
    opts.max_output_bytes = max_output > 0 ? static_cast<size_t>(max_output) : 30000;

    opts.retention_seconds = clamp_to_int(cfg.get_int("shell.retention_seconds", 600));
    if (opts.retention_seconds < 0) {
        opts.retention_seconds = 600;
    }

    opts.working_directory = cfg.get_string("shell.working_directory", "");
    if (opts.working_directory.empty()) {
        opts.working_directory = default_directory;
    }
    return opts;
}

// ============================================================================
// ProcessRunner
// ============================================================================

struct ProcessRunner::Entry {
    std::string handle;
    pid_t pid;
    std::string command;
    std::string working_directory;
    int64_t started_at_ms;
    int64_t started_mono_ms;
    int64_t finished_mono_ms;
    ProcessState state;
    OutputBuffer out;
    OutputBuffer err;
    int exit_code;
    bool has_exit_code;
    std::thread thread;

    explicit Entry(size_t capacity)
        : pid(0), started_at_ms(0), started_mono_ms(0), finished_mono_ms(0)
        , state(ProcessState::Running), out(capacity), err(capacity)
        , exit_code(0), has_exit_code(false) {}
};

ProcessRunner::ProcessRunner(const ProcessOptions& options, const CommandPolicy& policy, const PathGuard& guard)
    : options_(options)
    , policy_(policy)
    , guard_(guard)
    , spawn_count_(0)
    , stopping_(false) {}

ProcessRunner::~ProcessRunner() {
    shutdown();
}

Result<std::string> ProcessRunner::resolve_directory(const ExecutionRequest& request) const {
    std::string dir = request.working_directory.empty() ? options_.working_directory
                                                        : request.working_directory;
    if (dir.empty()) {
        return Result<std::string>::failure(ErrorKind::InvalidArgument,
            "No working directory given and no default configured");
    }
    return guard_.resolve(dir, PathTarget::Directory);
}

bool ProcessRunner::spawn(const std::string& command, const std::string& directory,
                          Spawned& out, std::string& error) {
    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe failed: ") + strerror(errno);
        return false;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe failed: ") + strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return false;
    }

    // Nothing but async-signal-safe calls after fork
    const char* cmd = command.c_str();
    const char* cwd = directory.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return false;
    }

    if (pid == 0) {
        setsid();
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        if (chdir(cwd) != 0) {
            _exit(127);
        }
        execl("/bin/sh", "sh", "-c", cmd, static_cast<char*>(NULL));
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    ++spawn_count_;
    out.pid = pid;
    out.out_fd = out_pipe[0];
    out.err_fd = err_pipe[0];
    return true;
}

ProcessRunner::Outcome ProcessRunner::pump(const Spawned& proc, int64_t deadline_ms, const OutputSink& sink) {
    Outcome outcome;
    outcome.status = 0;
    outcome.timed_out = false;

    const int fds[2] = { proc.out_fd, proc.err_fd };
    bool open_fd[2] = { true, true };
    bool exited = false;
    int64_t exited_at = 0;
    char buf[4096];

    for (;;) {
        if (!exited) {
            pid_t w = waitpid(proc.pid, &outcome.status, WNOHANG);
            if (w == proc.pid || (w < 0 && errno == ECHILD)) {
                exited = true;
                exited_at = monotonic_ms();
            }
        }

        int64_t now = monotonic_ms();
        if (!exited && deadline_ms > 0 && now >= deadline_ms) {
            kill(-proc.pid, SIGKILL);
            kill(proc.pid, SIGKILL);
            waitpid(proc.pid, &outcome.status, 0);
            outcome.timed_out = true;
            exited = true;
            exited_at = now;
        }

        if (exited && !open_fd[0] && !open_fd[1]) break;
        if (exited && now - exited_at >= kDrainGraceMs) break;

        int64_t wait_ms = kPollIntervalMs;
        if (!exited && deadline_ms > 0 && deadline_ms - now < wait_ms) {
            wait_ms = deadline_ms - now;
        }
        if (exited && kDrainGraceMs - (now - exited_at) < wait_ms) {
            wait_ms = kDrainGraceMs - (now - exited_at);
        }
        if (wait_ms < 1) wait_ms = 1;

        struct pollfd pfds[2];
        int streams[2];
        nfds_t count = 0;
        for (int i = 0; i < 2; ++i) {
            if (open_fd[i]) {
                pfds[count].fd = fds[i];
                pfds[count].events = POLLIN;
                pfds[count].revents = 0;
                streams[count] = i;
                ++count;
            }
        }

        int rc = ::poll(count > 0 ? pfds : NULL, count, static_cast<int>(wait_ms));
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[Shell] poll failed for pid %d: %s", static_cast<int>(proc.pid), strerror(errno));
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int stream = streams[i];
            ssize_t n = read(fds[stream], buf, sizeof(buf));
            if (n > 0) {
                sink(stream + 1, buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                open_fd[stream] = false;
            }
        }
    }

    // Whatever is already sitting in the pipes
    for (int i = 0; i < 2; ++i) {
        while (open_fd[i]) {
            ssize_t n = read(fds[i], buf, sizeof(buf));
            if (n <= 0) break;
            sink(i + 1, buf, static_cast<size_t>(n));
        }
    }

    if (!exited) {
        kill(-proc.pid, SIGKILL);
        kill(proc.pid, SIGKILL);
        waitpid(proc.pid, &outcome.status, 0);
    }

    // Descendants left in the group once the shell is gone
    kill(-proc.pid, SIGKILL);

    close(proc.out_fd);
    close(proc.err_fd);
    return outcome;
}

int ProcessRunner::exit_code_of(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

Result<ExecutionResult> ProcessRunner::run(const ExecutionRequest& request) {
    if (trim(request.command).empty()) {
        return Result<ExecutionResult>::failure(ErrorKind::InvalidArgument,
            "command must not be empty");
    }
    if (request.command.size() > kMaxCommandBytes) {
        return Result<ExecutionResult>::failure(ErrorKind::InvalidArgument,
            "command is " + std::to_string(request.command.size()) + " bytes, limit is " +
            std::to_string(kMaxCommandBytes) + "; write long input to a file first");
    }
    if (request.timeout_seconds < 0) {
        return Result<ExecutionResult>::failure(ErrorKind::InvalidArgument,
            "timeout_seconds must be positive");
    }

    Classification verdict = policy_.classify(request.command);
    if (verdict.blocked()) {
        LOG_WARN("[Shell] Blocked command: %s (%s)", request.command.c_str(), verdict.reason.c_str());
        return Result<ExecutionResult>::failure(ErrorKind::Blocked,
            "Command blocked: " + verdict.reason);
    }

    Result<std::string> dir = resolve_directory(request);
    if (!dir) {
        return Result<ExecutionResult>::failure(dir.error());
    }

    ExecutionResult result;
    result.working_directory = dir.value();

    std::vector<std::string> warnings;
    if (verdict.warned()) {
        LOG_WARN("[Shell] Running flagged command: %s (%s)", request.command.c_str(), verdict.reason.c_str());
        warnings.push_back(verdict.reason);
    }

    int timeout = request.timeout_seconds > 0 ? request.timeout_seconds : options_.default_timeout;
    if (!request.background && timeout > options_.max_timeout) {
        warnings.push_back("timeout_seconds " + std::to_string(timeout) +
                           " exceeds the maximum, clamped to " + std::to_string(options_.max_timeout));
        timeout = options_.max_timeout;
    }
    result.warning = join(warnings, "; ");

    if (stopping_.load()) {
        return Result<ExecutionResult>::failure(ErrorKind::SpawnFailed,
            "Process runner is shutting down");
    }

    LOG_DEBUG("[Shell] Executing in %s: %s", result.working_directory.c_str(), request.command.c_str());

    const int64_t started = monotonic_ms();
    Spawned proc;
    std::string error;
    if (!spawn(request.command, result.working_directory, proc, error)) {
        LOG_ERROR("[Shell] Failed to spawn command: %s", error.c_str());
        return Result<ExecutionResult>::failure(ErrorKind::SpawnFailed, error);
    }

    if (request.background) {
        return launch_background(request, proc, result, started);
    }

    OutputBuffer out(options_.max_output_bytes);
    OutputBuffer err(options_.max_output_bytes);
    OutputSink sink = [&out, &err](int stream, const char* data, size_t len) {
        (stream == 1 ? out : err).append(data, len);
    };

    Outcome outcome = pump(proc, started + static_cast<int64_t>(timeout) * 1000, sink);

    result.elapsed_ms = monotonic_ms() - started;
    result.stdout_text = out.text();
    result.stderr_text = err.text();
    result.stdout_truncated = out.truncated();
    result.stderr_truncated = err.truncated();
    result.has_exit_code = true;
    result.timed_out = outcome.timed_out;

    if (outcome.timed_out) {
        result.exit_code = kTimeoutExitCode;
        if (!result.stderr_text.empty() && result.stderr_text[result.stderr_text.size() - 1] != '\n') {
            result.stderr_text += "\n";
        }
        result.stderr_text += "Command timed out after " + std::to_string(timeout) + " seconds";
        LOG_WARN("[Shell] Command timed out after %ds: %s", timeout, request.command.c_str());
    } else {
        result.exit_code = exit_code_of(outcome.status);
    }
    result.success = !result.timed_out && result.exit_code == 0;

    LOG_DEBUG("[Shell] Exit code %d after %lldms", result.exit_code,
              static_cast<long long>(result.elapsed_ms));
    return Result<ExecutionResult>::success(result);
}

Result<ExecutionResult> ProcessRunner::launch_background(const ExecutionRequest& request, const Spawned& proc,
                                                         ExecutionResult result, int64_t started_ms) {
    std::shared_ptr<Entry> entry = std::make_shared<Entry>(options_.max_output_bytes);
    entry->handle = "bg-" + generate_uuid();
    entry->pid = proc.pid;
    entry->command = request.command;
    entry->working_directory = result.working_directory;
    entry->started_at_ms = current_timestamp_ms();
    entry->started_mono_ms = started_ms;

    std::vector<std::thread> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        evict_expired_locked(expired);
        background_[entry->handle] = entry;
        try {
            entry->thread = std::thread(&ProcessRunner::monitor, this, entry, proc);
        } catch (const std::system_error& e) {
            background_.erase(entry->handle);
            kill(-proc.pid, SIGKILL);
            kill(proc.pid, SIGKILL);
            waitpid(proc.pid, NULL, 0);
            close(proc.out_fd);
            close(proc.err_fd);
            LOG_ERROR("[Shell] Cannot start monitor thread: %s", e.what());
            return Result<ExecutionResult>::failure(ErrorKind::SpawnFailed,
                std::string("Cannot monitor background process: ") + e.what());
        }
    }
    join_threads(expired);

    LOG_INFO("[Shell] Background process %s started (pid %d): %s",
             entry->handle.c_str(), static_cast<int>(proc.pid), request.command.c_str());

    result.handle = entry->handle;
    result.elapsed_ms = monotonic_ms() - started_ms;
    return Result<ExecutionResult>::success(result);
}

void ProcessRunner::monitor(std::shared_ptr<Entry> entry, Spawned proc) {
    OutputSink sink = [this, &entry](int stream, const char* data, size_t len) {
        std::lock_guard<std::mutex> lock(mutex_);
        (stream == 1 ? entry->out : entry->err).append(data, len);
    };

    Outcome outcome = pump(proc, 0, sink);

    std::lock_guard<std::mutex> lock(mutex_);
    entry->exit_code = exit_code_of(outcome.status);
    entry->has_exit_code = true;
    entry->finished_mono_ms = monotonic_ms();
    if (WIFSIGNALED(outcome.status)) {
        entry->state = ProcessState::Killed;
    } else if (entry->exit_code == 0) {
        entry->state = ProcessState::Completed;
    } else {
        entry->state = ProcessState::Failed;
    }
    LOG_INFO("[Shell] Background process %s %s (exit code %d)",
             entry->handle.c_str(), process_state_name(entry->state), entry->exit_code);
}

void ProcessRunner::evict_expired_locked(std::vector<std::thread>& to_join) {
    const int64_t now = monotonic_ms();
    const int64_t window = static_cast<int64_t>(options_.retention_seconds) * 1000;

    std::map<std::string, std::shared_ptr<Entry> >::iterator it = background_.begin();
    while (it != background_.end()) {
        Entry& e = *it->second;
        if (e.state != ProcessState::Running && now - e.finished_mono_ms >= window) {
            LOG_DEBUG("[Shell] Evicting uncollected background process %s", e.handle.c_str());
            to_join.push_back(std::move(e.thread));
            it = background_.erase(it);
        } else {
            ++it;
        }
    }
}

BackgroundProcess ProcessRunner::snapshot(const Entry& entry) {
    BackgroundProcess p;
    p.handle = entry.handle;
    p.pid = entry.pid;
    p.command = entry.command;
    p.working_directory = entry.working_directory;
    p.started_at_ms = entry.started_at_ms;
    p.elapsed_ms = (entry.state == ProcessState::Running ? monotonic_ms() : entry.finished_mono_ms)
                   - entry.started_mono_ms;
    p.state = entry.state;
    p.stdout_text = entry.out.text();
    p.stderr_text = entry.err.text();
    p.stdout_truncated = entry.out.truncated();
    p.stderr_truncated = entry.err.truncated();
    p.exit_code = entry.exit_code;
    p.has_exit_code = entry.has_exit_code;
    return p;
}

Result<BackgroundProcess> ProcessRunner::poll(const std::string& handle) {
    std::vector<std::thread> expired;
    BackgroundProcess snap;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        evict_expired_locked(expired);
        std::map<std::string, std::shared_ptr<Entry> >::const_iterator it = background_.find(handle);
        if (it != background_.end()) {
            snap = snapshot(*it->second);
            found = true;
        }
    }
    join_threads(expired);

    if (!found) {
        return Result<BackgroundProcess>::failure(ErrorKind::NotFound,
            "No background process with handle '" + handle + "' (unknown, collected or expired)");
    }
    return Result<BackgroundProcess>::success(snap);
}

Result<ExecutionResult> ProcessRunner::collect(const std::string& handle) {
    std::vector<std::thread> finished;
    ExecutionResult result;
    ErrorKind failure = ErrorKind::None;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        evict_expired_locked(finished);
        std::map<std::string, std::shared_ptr<Entry> >::iterator it = background_.find(handle);
        if (it == background_.end()) {
            failure = ErrorKind::NotFound;
        } else if (it->second->state == ProcessState::Running) {
            failure = ErrorKind::StillRunning;
        } else {
            Entry& e = *it->second;
            result.stdout_text = e.out.text();
            result.stderr_text = e.err.text();
            result.stdout_truncated = e.out.truncated();
            result.stderr_truncated = e.err.truncated();
            result.exit_code = e.exit_code;
            result.has_exit_code = true;
            result.success = e.state == ProcessState::Completed;
            result.handle = e.handle;
            result.working_directory = e.working_directory;
            result.elapsed_ms = e.finished_mono_ms - e.started_mono_ms;
            finished.push_back(std::move(e.thread));
            background_.erase(it);
        }
    }
    join_threads(finished);

    if (failure == ErrorKind::NotFound) {
        return Result<ExecutionResult>::failure(ErrorKind::NotFound,
            "No background process with handle '" + handle + "' (unknown, collected or expired)");
    }
    if (failure == ErrorKind::StillRunning) {
        return Result<ExecutionResult>::failure(ErrorKind::StillRunning,
            "Background process " + handle + " is still running; poll it or collect later");
    }
    return Result<ExecutionResult>::success(result);
}

std::vector<BackgroundProcess> ProcessRunner::list() {
    std::vector<std::thread> expired;
    std::vector<BackgroundProcess> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        evict_expired_locked(expired);
        std::map<std::string, std::shared_ptr<Entry> >::const_iterator it;
        for (it = background_.begin(); it != background_.end(); ++it) {
            out.push_back(snapshot(*it->second));
        }
    }
    join_threads(expired);
    return out;
}

void ProcessRunner::shutdown() {
    stopping_.store(true);

    std::vector<std::thread> monitors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, std::shared_ptr<Entry> >::iterator it;
        for (it = background_.begin(); it != background_.end(); ++it) {
            Entry& e = *it->second;
            if (e.state == ProcessState::Running) {
                LOG_INFO("[Shell] Killing background process %s (pid %d)",
                         e.handle.c_str(), static_cast<int>(e.pid));
                kill(-e.pid, SIGKILL);
                kill(e.pid, SIGKILL);
            }
            if (e.thread.joinable()) {
                monitors.push_back(std::move(e.thread));
            }
        }
    }
    join_threads(monitors);
}

} // namespace toolgate
