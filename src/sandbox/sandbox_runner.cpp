#include "sandbox/sandbox_runner.hpp"
#include "sandbox/scratch_directory.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <optional>
#include <poll.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace codeauditor {

namespace {

constexpr size_t kReadChunk = 8192;
constexpr int kMaxReadsPerDrain = 16;
constexpr auto kExitPollInterval = std::chrono::milliseconds(10);

// ============================================================================
// UniqueFd - owning file descriptor
// ============================================================================

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.fd_);
            other.fd_ = -1;
        }
        return *this;
    }

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

// Keep descriptors clear of 0-2 so the child's dup2 onto stdio never aliases
// them (dup2(fd, fd) would leave FD_CLOEXEC set).
bool lift_above_stdio(UniqueFd& fd) {
    if (fd.get() > STDERR_FILENO) return true;
    const int moved = ::fcntl(fd.get(), F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
    if (moved < 0) return false;
    fd.reset(moved);
    return true;
}

bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return lift_above_stdio(read_end) && lift_above_stdio(write_end);
}

// ============================================================================
// Child process setup
// ============================================================================

enum class ChildStage : int {
    SETPGID = 1,
    PARENT_DEATH_SIGNAL,
    NO_NEW_PRIVS,
    NETWORK_NAMESPACE,
    NETWORK_NAMESPACE_SKIPPED,      // Non-fatal: best-effort isolation unavailable
    CHDIR,
    STDIO,
    RLIMIT,
    EXEC
};

const char* child_stage_to_string(ChildStage stage) {
    switch (stage) {
        case ChildStage::SETPGID:                   return "setpgid";
        case ChildStage::PARENT_DEATH_SIGNAL:       return "prctl(PR_SET_PDEATHSIG)";
        case ChildStage::NO_NEW_PRIVS:              return "prctl(PR_SET_NO_NEW_PRIVS)";
        case ChildStage::NETWORK_NAMESPACE:         return "unshare(CLONE_NEWNET)";
        case ChildStage::NETWORK_NAMESPACE_SKIPPED: return "unshare(CLONE_NEWNET)";
        case ChildStage::CHDIR:                     return "chdir";
        case ChildStage::STDIO:                     return "dup2";
        case ChildStage::RLIMIT:                    return "setrlimit";
        case ChildStage::EXEC:                      return "execve";
    }
    return "unknown";
}

struct ChildReport {
    int stage;
    int err;
    int fatal;
};

using ResourceT = decltype(RLIMIT_AS);

struct LimitSpec {
    ResourceT resource;
    rlim_t value;
    bool enabled;
};

/**
 * Everything the child needs, prepared before fork(). The child may only
 * call async-signal-safe functions, so no allocation happens after fork.
 */
struct ChildSpec {
    const char* executable = nullptr;
    char* const* argv = nullptr;
    char* const* envp = nullptr;
    const char* workdir = nullptr;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    int report_fd = -1;
    int max_fd = 1024;
    pid_t parent_pid = 0;
    NetworkIsolation isolation = NetworkIsolation::BEST_EFFORT;
    std::array<LimitSpec, 5> limits{};
};

void report(int fd, ChildStage stage, int err, bool fatal) {
    const ChildReport r{static_cast<int>(stage), err, fatal ? 1 : 0};
    // Single write below PIPE_BUF is atomic; nothing useful to do on failure
    const ssize_t n = ::write(fd, &r, sizeof(r));
    (void)n;
}

[[noreturn]] void fail(const ChildSpec& spec, ChildStage stage) {
    report(spec.report_fd, stage, errno, true);
    ::_exit(127);
}

bool set_limit(ResourceT resource, rlim_t value) {
    struct rlimit current{};
    if (::getrlimit(resource, &current) != 0) return false;
    if (current.rlim_max != RLIM_INFINITY && value > current.rlim_max) {
        value = current.rlim_max;
    }
    struct rlimit rl{value, value};
    return ::setrlimit(resource, &rl) == 0;
}

void close_inherited_fds(int keep_fd, int max_fd) {
    // Close everything above stderr except the report pipe
    if (keep_fd > STDERR_FILENO + 1) {
        if (::close_range(STDERR_FILENO + 1, static_cast<unsigned>(keep_fd - 1), 0) != 0) {
            for (int fd = STDERR_FILENO + 1; fd < keep_fd; ++fd) ::close(fd);
        }
    }
    if (::close_range(static_cast<unsigned>(keep_fd + 1), ~0U, 0) != 0) {
        for (int fd = keep_fd + 1; fd < max_fd; ++fd) ::close(fd);
    }
}

[[noreturn]] void exec_child(const ChildSpec& spec) {
    // The service blocks SIGINT/SIGTERM for its signal-watcher thread; the
    // compiler starts with a clean mask and default SIGPIPE
    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    if (::setpgid(0, 0) != 0) fail(spec, ChildStage::SETPGID);

    if (::prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) fail(spec, ChildStage::PARENT_DEATH_SIGNAL);
    if (::getppid() != spec.parent_pid) ::_exit(127);

    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) fail(spec, ChildStage::NO_NEW_PRIVS);

    if (spec.isolation != NetworkIsolation::OFF) {
        if (::unshare(CLONE_NEWNET) != 0 &&
            ::unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
            if (spec.isolation == NetworkIsolation::REQUIRED) {
                fail(spec, ChildStage::NETWORK_NAMESPACE);
            }
            report(spec.report_fd, ChildStage::NETWORK_NAMESPACE_SKIPPED, errno, false);
        }
    }

    if (::chdir(spec.workdir) != 0) fail(spec, ChildStage::CHDIR);

    if (::dup2(spec.stdin_fd, STDIN_FILENO) < 0 ||
        ::dup2(spec.stdout_fd, STDOUT_FILENO) < 0 ||
        ::dup2(spec.stderr_fd, STDERR_FILENO) < 0) {
        fail(spec, ChildStage::STDIO);
    }
    close_inherited_fds(spec.report_fd, spec.max_fd);

    for (const auto& limit : spec.limits) {
        if (limit.enabled && !set_limit(limit.resource, limit.value)) {
            fail(spec, ChildStage::RLIMIT);
        }
    }

    ::execve(spec.executable, spec.argv, spec.envp);
    fail(spec, ChildStage::EXEC);
}

// ============================================================================
// Parent-side helpers
// ============================================================================

std::string substitute_placeholders(std::string arg,
                                    const std::string& source_path,
                                    const std::string& workdir) {
    auto replace_all = [&arg](std::string_view token, const std::string& value) {
        size_t pos = 0;
        while ((pos = arg.find(token, pos)) != std::string::npos) {
            arg.replace(pos, token.size(), value);
            pos += value.size();
        }
    };
    replace_all("{source}", source_path);
    replace_all("{workdir}", workdir);
    return arg;
}

bool is_executable_file(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

/// Resolve argv[0] against the sandbox PATH (not the service's own PATH).
std::optional<std::string> resolve_executable(const std::string& name, const std::string& path_list) {
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t end = path_list.find(':', start);
        if (end == std::string::npos) end = path_list.size();
        std::string dir = path_list.substr(start, end - start);
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) return candidate;
        start = end + 1;
    }
    return std::nullopt;
}

std::vector<std::string> build_environment(const SandboxConfig& config, const std::string& workdir) {
    std::vector<std::string> env{
        "PATH=" + config.path,
        "HOME=" + workdir,
        "TMPDIR=" + workdir,
        "LC_ALL=C",
    };
    for (const auto& name : config.env_passthrough) {
        if (name.empty() || name == "PATH" || name == "HOME" || name == "TMPDIR" || name == "LC_ALL") {
            continue;
        }
        if (const char* value = std::getenv(name.c_str())) {
            env.push_back(name + "=" + value);
        }
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

int max_inherited_fd() {
    struct rlimit rl{};
    if (::getrlimit(RLIMIT_NOFILE, &rl) != 0 || rl.rlim_cur == RLIM_INFINITY) return 65536;
    return static_cast<int>(std::min<rlim_t>(rl.rlim_cur, 65536));
}

void warn_network_isolation_unavailable(int err) {
    static std::atomic<bool> warned{false};
    if (!warned.exchange(true)) {
        utils::log::warn(std::format(
            "Network namespace unavailable ({}); compilers run without network isolation",
            std::strerror(err)));
    }
}

/// Kills and reaps the child's process group unless the outcome was collected.
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}
    ~ChildGuard() {
        if (pid_ <= 0) return;
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    /// Kill the group and reap the leader; returns the raw wait status.
    int kill_and_reap() {
        if (::kill(-pid_, SIGKILL) != 0 && errno != ESRCH) {
            utils::log::warn(std::format("kill(-{}) failed: {}", pid_, std::strerror(errno)));
        }
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) break;
        }
        pid_ = -1;
        return status;
    }

private:
    pid_t pid_;
};

struct Stream {
    UniqueFd fd;
    std::string data;
    bool open = true;
};

/// Read what is available, at most kMaxReadsPerDrain chunks so a writer that
/// never stops cannot starve the deadline check. Returns false on EOF or hard error.
bool drain_available(Stream& s, size_t cap) {
    char buf[kReadChunk];
    for (int reads = 0; reads < kMaxReadsPerDrain; ++reads) {
        const ssize_t n = ::read(s.fd.get(), buf, sizeof(buf));
        if (n > 0) {
            const size_t room = cap > s.data.size() ? cap - s.data.size() : 0;
            s.data.append(buf, std::min(room, static_cast<size_t>(n)));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
    return true;
}

bool set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

/**
 * @brief Fork, set up and exec one compiler process; capture its output
 *
 * The caller owns the scratch directory and guarantees it outlives this call.
 */
SandboxOutcome execute(const SandboxConfig& config,
                       const std::vector<std::string>& command,
                       const std::string& source_path,
                       const std::string& workdir) {
    if (command.empty()) {
        return SandboxOutcome::infrastructure_error("empty compiler command");
    }

    const auto executable = resolve_executable(command.front(), config.path);
    if (!executable) {
        return SandboxOutcome::infrastructure_error(std::format(
            "compiler '{}' not found or not executable in PATH '{}'", command.front(), config.path));
    }

    std::vector<std::string> args;
    args.reserve(command.size());
    for (const auto& arg : command) {
        args.push_back(substitute_placeholders(arg, source_path, workdir));
    }
    std::vector<std::string> env = build_environment(config, workdir);
    std::vector<char*> argv = to_c_array(args);
    std::vector<char*> envp = to_c_array(env);

    UniqueFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.valid() || !lift_above_stdio(dev_null)) {
        return SandboxOutcome::infrastructure_error(
            std::format("open(/dev/null) failed: {}", std::strerror(errno)));
    }

    Stream out, err;
    UniqueFd out_w, err_w, report_r, report_w;
    if (!make_pipe(out.fd, out_w) || !make_pipe(err.fd, err_w) || !make_pipe(report_r, report_w)) {
        return SandboxOutcome::infrastructure_error(
            std::format("pipe() failed: {}", std::strerror(errno)));
    }

    const auto timeout_seconds = static_cast<uint64_t>(
        std::chrono::ceil<std::chrono::seconds>(config.timeout).count());
    const uint64_t cpu_seconds = config.cpu_limit_seconds > 0 ? config.cpu_limit_seconds
                                                              : timeout_seconds + 1;
    constexpr rlim_t kMiB = 1024 * 1024;

    ChildSpec spec;
    spec.executable = executable->c_str();
    spec.argv = argv.data();
    spec.envp = envp.data();
    spec.workdir = workdir.c_str();
    spec.stdin_fd = dev_null.get();
    spec.stdout_fd = out_w.get();
    spec.stderr_fd = err_w.get();
    spec.report_fd = report_w.get();
    spec.max_fd = max_inherited_fd();
    spec.parent_pid = ::getpid();
    spec.isolation = config.network_isolation;
    spec.limits = {{
        {RLIMIT_CORE, 0, true},
        {RLIMIT_CPU, static_cast<rlim_t>(cpu_seconds), true},
        {RLIMIT_AS, static_cast<rlim_t>(config.memory_limit_mb) * kMiB, config.memory_limit_mb > 0},
        {RLIMIT_FSIZE, static_cast<rlim_t>(config.max_file_size_mb) * kMiB, config.max_file_size_mb > 0},
        {RLIMIT_NOFILE, static_cast<rlim_t>(config.max_open_files), config.max_open_files > 0},
    }};

    const auto deadline = std::chrono::steady_clock::now() + config.timeout;

    const pid_t pid = ::fork();
    if (pid < 0) {
        return SandboxOutcome::infrastructure_error(
            std::format("fork() failed: {}", std::strerror(errno)));
    }
    if (pid == 0) {
        exec_child(spec);
    }

    ChildGuard guard(pid);
    // Both sides call setpgid so the group exists before any kill(-pid)
    if (::setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        utils::log::debug(std::format("setpgid({}) failed: {}", pid, std::strerror(errno)));
    }

    out_w.reset();
    err_w.reset();
    report_w.reset();
    dev_null.reset();

    // The report pipe reaches EOF once execve succeeds (O_CLOEXEC) or the child exits
    std::optional<ChildReport> fatal;
    {
        ChildReport r{};
        size_t got = 0;
        while (true) {
            const ssize_t n = ::read(report_r.get(), reinterpret_cast<char*>(&r) + got, sizeof(r) - got);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            got += static_cast<size_t>(n);
            if (got < sizeof(r)) continue;
            got = 0;
            if (r.fatal) {
                fatal = r;
            } else if (static_cast<ChildStage>(r.stage) == ChildStage::NETWORK_NAMESPACE_SKIPPED) {
                warn_network_isolation_unavailable(r.err);
            }
        }
    }
    if (fatal) {
        guard.kill_and_reap();
        return SandboxOutcome::infrastructure_error(std::format(
            "sandbox setup failed at {}: {}",
            child_stage_to_string(static_cast<ChildStage>(fatal->stage)),
            std::strerror(fatal->err)));
    }

    if (!set_nonblocking(out.fd.get()) || !set_nonblocking(err.fd.get())) {
        return SandboxOutcome::infrastructure_error(
            std::format("fcntl(O_NONBLOCK) failed: {}", std::strerror(errno)));
    }

    // The leader is never reaped before the group kill, so its pid (and the
    // process group id) cannot be recycled while we still signal it.
    bool timed_out = false;
    while (true) {
        siginfo_t info{};
        info.si_pid = 0;
        if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
            if (errno == EINTR) continue;
            return SandboxOutcome::infrastructure_error(
                std::format("waitid() failed: {}", std::strerror(errno)));
        }
        if (info.si_pid != 0) {
            // Leader exited: collect what is buffered. Descendants that still
            // hold the pipes do not extend the run.
            for (Stream* s : {&out, &err}) {
                if (s->open) drain_available(*s, config.max_output_bytes);
            }
            break;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }
        const auto wait = std::min(remaining, kExitPollInterval);

        if (!out.open && !err.open) {
            std::this_thread::sleep_for(wait);
            continue;
        }

        std::array<pollfd, 2> fds{};
        std::array<Stream*, 2> streams{};
        nfds_t n = 0;
        for (Stream* s : {&out, &err}) {
            if (!s->open) continue;
            fds[n] = pollfd{s->fd.get(), POLLIN, 0};
            streams[n] = s;
            ++n;
        }

        const int rc = ::poll(fds.data(), n, static_cast<int>(wait.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return SandboxOutcome::infrastructure_error(
                std::format("poll() failed: {}", std::strerror(errno)));
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (fds[i].revents == 0) continue;
            if (!drain_available(*streams[i], config.max_output_bytes)) {
                streams[i]->open = false;
                streams[i]->fd.reset();
            }
        }
    }

    const int status = guard.kill_and_reap();

    SandboxOutcome outcome;
    outcome.output = err.data.empty() ? std::move(out.data) : std::move(err.data);
    if (timed_out) {
        outcome.status = SandboxStatus::TIMED_OUT;
        return outcome;
    }
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
        outcome.status = *outcome.exit_code == 0 ? SandboxStatus::COMPILED
                                                 : SandboxStatus::COMPILE_FAILED;
    } else if (WIFSIGNALED(status)) {
        outcome.signal = WTERMSIG(status);
        outcome.status = SandboxStatus::COMPILE_FAILED;
    } else {
        outcome.status = SandboxStatus::COMPILE_FAILED;
    }
    return outcome;
}

/// One isolated invocation: scratch directory, optional source file, execute.
SandboxOutcome run_in_scratch(const SandboxConfig& config,
                              const std::vector<std::string>& command,
                              const std::string* source,
                              std::string_view run_id) {
    utils::Timer timer;

    std::optional<ScratchDirectory> scratch;
    std::string source_path;
    try {
        scratch.emplace(config.scratch_root, run_id);
        if (source) {
            source_path = scratch->write_file(config.source_file, *source).string();
        } else {
            source_path = (scratch->path() / config.source_file).string();
        }
    } catch (const std::exception& e) {
        auto outcome = SandboxOutcome::infrastructure_error(e.what());
        outcome.wall_time = timer.elapsed_ms();
        return outcome;
    }

    auto outcome = execute(config, command, source_path, scratch->path().string());
    outcome.workdir = scratch->path().string();
    outcome.wall_time = timer.elapsed_ms();
    return outcome;
}

} // anonymous namespace

// ============================================================================
// ProcessSandboxRunner
// ============================================================================

ProcessSandboxRunner::ProcessSandboxRunner(SandboxConfig config)
    : config_(std::move(config)) {}

SandboxOutcome ProcessSandboxRunner::run(std::string_view source, std::string_view run_id) {
    if (auto failure = blocking_failure()) {
        return SandboxOutcome::infrastructure_error(
            std::format("compiler toolchain unavailable: {}", *failure));
    }
    const std::string text(source);
    return run_in_scratch(config_, config_.command, &text, run_id);
}

Result<std::string> ProcessSandboxRunner::probe_compiler() {
    auto result = check_toolchain();
    std::lock_guard lock(toolchain_mutex_);
    record_toolchain_check(result);
    return result;
}

std::optional<std::string> ProcessSandboxRunner::toolchain_failure() const {
    std::lock_guard lock(toolchain_mutex_);
    return toolchain_failure_;
}

std::optional<std::string> ProcessSandboxRunner::blocking_failure() {
    std::lock_guard lock(toolchain_mutex_);
    if (!toolchain_failure_) return std::nullopt;
    if (std::chrono::steady_clock::now() - checked_at_ < config_.toolchain_recheck_interval) {
        return toolchain_failure_;
    }

    // Runs queue behind the recheck
    const auto result = check_toolchain();
    record_toolchain_check(result);
    if (result.is_ok()) {
        utils::log::info(std::format("Compiler available again: {}", result.value()));
    }
    return toolchain_failure_;
}

void ProcessSandboxRunner::record_toolchain_check(const Result<std::string>& result) {
    checked_at_ = std::chrono::steady_clock::now();
    if (result.is_ok()) {
        toolchain_failure_.reset();
    } else {
        toolchain_failure_ = result.error_message();
    }
}

Result<std::string> ProcessSandboxRunner::check_toolchain() const {
    const auto outcome = run_in_scratch(config_, config_.version_command, nullptr,
                                        "version-" + utils::generate_uuid());
    switch (outcome.status) {
        case SandboxStatus::COMPILED: {
            const auto line_end = outcome.output.find('\n');
            return Result<std::string>::ok(utils::trim(outcome.output.substr(0, line_end)));
        }
        case SandboxStatus::INFRASTRUCTURE_ERROR:
            return Result<std::string>::error(ErrorCategory::INFRASTRUCTURE_ERROR,
                                              outcome.error_message);
        case SandboxStatus::TIMED_OUT:
            return Result<std::string>::error(ErrorCategory::INFRASTRUCTURE_ERROR,
                                              "version command timed out");
        case SandboxStatus::COMPILE_FAILED:
            break;
    }
    return Result<std::string>::error(ErrorCategory::INFRASTRUCTURE_ERROR, std::format(
        "version command failed ({}): {}",
        outcome.exit_code ? std::format("exit {}", *outcome.exit_code)
                          : std::format("signal {}", outcome.signal.value_or(0)),
        utils::trim(outcome.output)));
}

} // namespace codeauditor
