#include "swhid_conformance/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <new>
#include <sstream>
#include <string_view>
#include <utility>

namespace swhid::conformance {

namespace {

constexpr int kReportedExit = 120;
constexpr int kBadAllocExit = 121;
constexpr int kLaunchFailedExit = 127;
constexpr int kPollSliceMs = 20;
constexpr std::size_t kStderrLimit = 64 * 1024;

constexpr std::array<std::string_view, 7> kMemoryPatterns{
    "std::bad_alloc", "out of memory", "Out of memory", "Cannot allocate memory",
    "MemoryError", "memory allocation", "failed to allocate",
};

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_{fd} {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_{std::exchange(other.fd_, -1)} {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }
    ~UniqueFd() { reset(); }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct PipePair {
    UniqueFd read_end;
    UniqueFd write_end;
};

bool make_pipe(PipePair& pair, std::string& diag) {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        diag += std::string{"sandbox: pipe2 failed: "} + std::strerror(errno) + "\n";
        return false;
    }
    pair.read_end.reset(fds[0]);
    pair.write_end.reset(fds[1]);
    return true;
}

void set_nonblocking(int fd) noexcept {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Async-signal-safe helpers used between fork() and exec().
void write_all(int fd, const char* data, std::size_t size) noexcept {
    while (size > 0) {
        const ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
}

[[noreturn]] void child_fail(int control_fd, int err) noexcept {
    if (control_fd >= 0) {
        write_all(control_fd, reinterpret_cast<const char*>(&err), sizeof(err));
    }
    ::_exit(kLaunchFailedExit);
}

std::uint64_t current_vm_bytes() noexcept {
    std::uint64_t pages = 0;
    const int fd = ::open("/proc/self/statm", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return 0;
    char buf[128];
    const ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
    ::close(fd);
    if (n <= 0) return 0;
    for (ssize_t i = 0; i < n && buf[i] >= '0' && buf[i] <= '9'; ++i) {
        pages = pages * 10 + static_cast<std::uint64_t>(buf[i] - '0');
    }
    return pages * static_cast<std::uint64_t>(::sysconf(_SC_PAGESIZE));
}

void apply_limits(const SandboxLimits& limits, std::uint64_t address_space_base) noexcept {
    struct rlimit core {};
    core.rlim_cur = 0;
    core.rlim_max = 0;
    ::setrlimit(RLIMIT_CORE, &core);

    if (limits.cpu_seconds > 0) {
        struct rlimit rl {};
        rl.rlim_cur = static_cast<rlim_t>(limits.cpu_seconds);
        rl.rlim_max = rl.rlim_cur + 1;
        ::setrlimit(RLIMIT_CPU, &rl);
    }
    if (limits.memory_bytes > 0 && limits.enforce_address_space) {
        struct rlimit rl {};
        rl.rlim_cur = static_cast<rlim_t>(address_space_base + limits.memory_bytes);
        rl.rlim_max = rl.rlim_cur;
        ::setrlimit(RLIMIT_AS, &rl);
    }
}

std::int64_t rss_kb_of(pid_t pid) {
    const std::string path = "/proc/" + std::to_string(pid) + "/statm";
    UniqueFd fd{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd.valid()) return 0;
    char buf[128];
    const ssize_t n = ::read(fd.get(), buf, sizeof(buf) - 1);
    if (n <= 0) return 0;
    buf[n] = '\0';
    std::istringstream iss(buf);
    std::int64_t size_pages = 0;
    std::int64_t resident_pages = 0;
    iss >> size_pages >> resident_pages;
    return resident_pages * (::sysconf(_SC_PAGESIZE) / 1024);
}

bool looks_like_memory_failure(const std::string& stderr_text) {
    return std::any_of(kMemoryPatterns.begin(), kMemoryPatterns.end(),
                       [&](std::string_view p) { return stderr_text.find(p) != std::string::npos; });
}

std::string excerpt(const std::string& text, std::size_t limit = 2000) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "...(truncated)";
}

struct Child {
    pid_t pid{-1};
    UniqueFd out;
    UniqueFd err;
    UniqueFd in;       ///< write end feeding stdin_data, if any
    UniqueFd control;  ///< exec-failure channel, exec mode only
    std::string stdin_data;
    bool function_mode{false};
};

// Reads whatever is available; returns false on EOF or hard error.
bool pump(int fd, std::string& sink, std::size_t limit, bool& overflow) {
    char buf[4096];
    while (true) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            const std::size_t room = sink.size() < limit ? limit - sink.size() : 0;
            const std::size_t take = std::min<std::size_t>(room, static_cast<std::size_t>(n));
            sink.append(buf, take);
            if (take < static_cast<std::size_t>(n)) {
                overflow = true;
            }
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void kill_group(pid_t pid) noexcept {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

RawOutcome supervise(Child& child, const SandboxLimits& limits, std::string& diag) {
    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    const auto deadline = start + limits.wall_clock;

    int launch_errno = 0;
    if (child.control.valid()) {
        int err = 0;
        ssize_t n = 0;
        do {
            n = ::read(child.control.get(), &err, sizeof(err));
        } while (n < 0 && errno == EINTR);
        if (n == static_cast<ssize_t>(sizeof(err))) {
            launch_errno = err;
        }
        child.control.reset();
    }

    set_nonblocking(child.out.get());
    set_nonblocking(child.err.get());
    if (child.in.valid()) {
        set_nonblocking(child.in.get());
    }

    std::string out_text;
    std::string err_text;
    bool out_overflow = false;
    bool err_overflow = false;
    std::size_t stdin_offset = 0;

    bool killed_timeout = false;
    bool killed_rss = false;
    bool killed_output = false;
    std::int64_t peak_rss_kb = 0;

    int status = 0;
    struct rusage ru {};
    bool reaped = false;

    while (!reaped) {
        std::array<pollfd, 3> pfds{};
        nfds_t count = 0;
        if (child.out.valid()) pfds[count++] = pollfd{child.out.get(), POLLIN, 0};
        if (child.err.valid()) pfds[count++] = pollfd{child.err.get(), POLLIN, 0};
        if (child.in.valid()) pfds[count++] = pollfd{child.in.get(), POLLOUT, 0};

        const int rc = ::poll(pfds.data(), count, kPollSliceMs);
        if (rc < 0 && errno != EINTR) {
            diag += std::string{"sandbox: poll failed: "} + std::strerror(errno) + "\n";
        }

        if (child.out.valid() && !pump(child.out.get(), out_text, limits.max_output_bytes, out_overflow)) {
            child.out.reset();
        }
        if (child.err.valid() && !pump(child.err.get(), err_text, kStderrLimit, err_overflow)) {
            child.err.reset();
        }
        if (child.in.valid()) {
            while (stdin_offset < child.stdin_data.size()) {
                const ssize_t n = ::write(child.in.get(), child.stdin_data.data() + stdin_offset,
                                          child.stdin_data.size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<std::size_t>(n);
                    continue;
                }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                // EPIPE: the child stopped reading; the rest is dropped.
                stdin_offset = child.stdin_data.size();
            }
            if (stdin_offset >= child.stdin_data.size()) {
                child.in.reset();
            }
        }

        if (out_overflow && !killed_output) {
            kill_group(child.pid);
            killed_output = true;
        }

        const pid_t w = ::wait4(child.pid, &status, WNOHANG, &ru);
        if (w == child.pid) {
            reaped = true;
            break;
        }

        if (limits.memory_bytes > 0) {
            const auto rss = rss_kb_of(child.pid);
            peak_rss_kb = std::max(peak_rss_kb, rss);
            if (static_cast<std::uint64_t>(rss) * 1024 > limits.memory_bytes && !killed_rss) {
                kill_group(child.pid);
                killed_rss = true;
            }
        }
        if (!killed_timeout && !killed_rss && !killed_output && clock::now() >= deadline) {
            kill_group(child.pid);
            killed_timeout = true;
        }

        if (killed_timeout || killed_rss || killed_output) {
            pid_t r = 0;
            do {
                r = ::wait4(child.pid, &status, 0, &ru);
            } while (r < 0 && errno == EINTR);
            reaped = true;
        }
    }

    // Drain what the child left in the pipes without waiting for EOF.
    if (child.out.valid()) pump(child.out.get(), out_text, limits.max_output_bytes, out_overflow);
    if (child.err.valid()) pump(child.err.get(), err_text, kStderrLimit, err_overflow);
    child.out.reset();
    child.err.reset();
    child.in.reset();

    Usage usage;
    usage.wall_ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start).count();
    usage.cpu_ms = static_cast<std::int64_t>(ru.ru_utime.tv_sec + ru.ru_stime.tv_sec) * 1000 +
                   static_cast<std::int64_t>(ru.ru_utime.tv_usec + ru.ru_stime.tv_usec) / 1000;
    usage.max_rss_kb = std::max<std::int64_t>(ru.ru_maxrss, peak_rss_kb);

    std::ostringstream summary;
    summary << "sandbox: pid=" << child.pid << " wall_ms=" << usage.wall_ms
            << " cpu_ms=" << usage.cpu_ms << " max_rss_kb=" << usage.max_rss_kb;
    if (WIFEXITED(status)) {
        summary << " exit=" << WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        summary << " signal=" << WTERMSIG(status);
    }
    diag += summary.str() + "\n";
    if (!err_text.empty()) {
        diag += "stderr: " + excerpt(err_text) + "\n";
    }

    if (launch_errno != 0) {
        outcome::CrashedOrProtocolViolation crash;
        crash.reason = CrashReason::LaunchFailed;
        crash.exit_code = kLaunchFailedExit;
        crash.subtype = "launch_failed";
        crash.detail = std::string{"launch failed: "} + std::strerror(launch_errno);
        crash.usage = usage;
        return crash;
    }
    if (killed_timeout) {
        diag += "sandbox: wall-clock limit of " + std::to_string(limits.wall_clock.count()) +
                " ms exceeded\n";
        return outcome::TimedOut{std::move(err_text), usage};
    }
    if (killed_rss) {
        return outcome::ResourceExceeded{ResourceKind::Memory,
                                         "resident set exceeded " +
                                             std::to_string(limits.memory_bytes) + " bytes",
                                         usage};
    }
    if (killed_output) {
        return outcome::ResourceExceeded{ResourceKind::Output,
                                         "stdout exceeded " + std::to_string(limits.max_output_bytes) +
                                             " bytes",
                                         usage};
    }

    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        const bool cpu_capped = limits.cpu_seconds > 0 &&
                                usage.cpu_ms >= static_cast<std::int64_t>(limits.cpu_seconds) * 1000;
        if (sig == SIGXCPU || (sig == SIGKILL && cpu_capped)) {
            return outcome::ResourceExceeded{ResourceKind::Cpu,
                                             "cpu limit of " + std::to_string(limits.cpu_seconds) +
                                                 " s exceeded",
                                             usage};
        }
        outcome::CrashedOrProtocolViolation crash;
        crash.reason = CrashReason::Signaled;
        crash.signal = sig;
        crash.subtype = "signal";
        crash.detail = std::string{"terminated by signal "} + std::to_string(sig) + " (" +
                       ::strsignal(sig) + ")";
        if (!err_text.empty()) {
            crash.detail += ": " + excerpt(err_text);
        }
        crash.usage = usage;
        return crash;
    }

    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (code == 0) {
        return outcome::Success{std::move(out_text), std::move(err_text), usage};
    }
    if (child.function_mode && code == kReportedExit) {
        outcome::CrashedOrProtocolViolation crash;
        crash.reason = CrashReason::Reported;
        crash.exit_code = code;
        crash.subtype = "reported";
        const auto space = err_text.find(' ');
        crash.reported_kind = error_kind_from_string(std::string_view{err_text}.substr(0, space));
        crash.detail = space == std::string::npos ? err_text : err_text.substr(space + 1);
        crash.usage = usage;
        return crash;
    }
    if (child.function_mode && code == kBadAllocExit) {
        return outcome::ResourceExceeded{ResourceKind::Memory, "allocation failed under memory cap", usage};
    }
    if (limits.memory_bytes > 0 && limits.enforce_address_space && looks_like_memory_failure(err_text)) {
        return outcome::ResourceExceeded{ResourceKind::Memory, excerpt(err_text), usage};
    }

    outcome::CrashedOrProtocolViolation crash;
    crash.reason = CrashReason::NonZeroExit;
    crash.exit_code = code;
    crash.subtype = "exit_" + std::to_string(code);
    crash.detail = excerpt(err_text);
    crash.stdout_text = std::move(out_text);
    crash.usage = usage;
    return crash;
}

// Writes to a stdin pipe whose reader has exited must fail with EPIPE, not kill the engine.
void ignore_sigpipe() noexcept {
    static const bool once = [] {
        ::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)once;
}

outcome::CrashedOrProtocolViolation setup_failure(const std::string& what) {
    outcome::CrashedOrProtocolViolation crash;
    crash.reason = CrashReason::LaunchFailed;
    crash.subtype = "launch_failed";
    crash.detail = what;
    return crash;
}

}  // namespace

std::string_view to_string(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::Memory: return "memory";
        case ResourceKind::Cpu: return "cpu";
        case ResourceKind::Output: return "output";
    }
    return "memory";
}

std::string_view to_string(CrashReason reason) noexcept {
    switch (reason) {
        case CrashReason::LaunchFailed: return "launch_failed";
        case CrashReason::Signaled: return "signaled";
        case CrashReason::NonZeroExit: return "non_zero_exit";
        case CrashReason::Reported: return "reported";
        case CrashReason::MalformedOutput: return "malformed_output";
    }
    return "non_zero_exit";
}

const Usage& usage_of(const RawOutcome& raw) noexcept {
    return std::visit([](const auto& o) -> const Usage& { return o.usage; }, raw);
}

std::optional<std::filesystem::path> resolve_executable(const std::string& command,
                                                        const std::string& search_path) {
    if (command.empty()) return std::nullopt;
    if (command.find('/') != std::string::npos) {
        if (::access(command.c_str(), X_OK) == 0) return std::filesystem::path{command};
        return std::nullopt;
    }
    std::size_t begin = 0;
    while (begin <= search_path.size()) {
        auto end = search_path.find(':', begin);
        if (end == std::string::npos) end = search_path.size();
        const auto dir = search_path.substr(begin, end - begin);
        const std::filesystem::path candidate = std::filesystem::path{dir.empty() ? "." : dir} / command;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        begin = end + 1;
    }
    return std::nullopt;
}

RawOutcome run_process(const ProcessSpec& spec, const SandboxLimits& limits, std::string& diag) {
    std::string search_path;
    if (auto it = spec.env.find("PATH"); it != spec.env.end()) {
        search_path = it->second;
    } else if (const char* env_path = std::getenv("PATH")) {
        search_path = env_path;
    }
    const auto resolved = resolve_executable(spec.command, search_path);

    diag += "exec: " + spec.command;
    for (const auto& a : spec.argv) {
        diag += " '" + a + "'";
    }
    diag += "\n";

    if (!resolved) {
        diag += "sandbox: executable not found: " + spec.command + "\n";
        return setup_failure("executable not found: " + spec.command);
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> all_args{spec.command};
    all_args.insert(all_args.end(), spec.argv.begin(), spec.argv.end());
    std::vector<char*> argv;
    argv.reserve(all_args.size() + 1);
    for (auto& s : all_args) argv.push_back(s.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_entries;
    env_entries.reserve(spec.env.size());
    for (const auto& [k, v] : spec.env) env_entries.push_back(k + "=" + v);
    std::vector<char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (auto& e : env_entries) envp.push_back(e.data());
    envp.push_back(nullptr);

    const std::string exe = resolved->string();
    const std::string cwd = spec.cwd.string();
    const std::string stdin_path = spec.stdin_file ? spec.stdin_file->string() : std::string{};

    PipePair out;
    PipePair err;
    PipePair control;
    PipePair in;
    if (!make_pipe(out, diag) || !make_pipe(err, diag) || !make_pipe(control, diag)) {
        return setup_failure("pipe creation failed");
    }
    if (spec.stdin_data) {
        ignore_sigpipe();
        if (!make_pipe(in, diag)) {
            return setup_failure("pipe creation failed");
        }
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        diag += std::string{"sandbox: fork failed: "} + std::strerror(errno) + "\n";
        return setup_failure("fork failed");
    }

    if (pid == 0) {
        ::setsid();
        const int ctl = control.write_end.get();
        int stdin_fd = -1;
        if (spec.stdin_file) {
            stdin_fd = ::open(stdin_path.c_str(), O_RDONLY);
        } else if (spec.stdin_data) {
            stdin_fd = in.read_end.get();
        } else {
            stdin_fd = ::open("/dev/null", O_RDONLY);
        }
        if (stdin_fd < 0 || ::dup2(stdin_fd, STDIN_FILENO) < 0) child_fail(ctl, errno);
        if (::dup2(out.write_end.get(), STDOUT_FILENO) < 0) child_fail(ctl, errno);
        if (::dup2(err.write_end.get(), STDERR_FILENO) < 0) child_fail(ctl, errno);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) child_fail(ctl, errno);
        ::signal(SIGPIPE, SIG_DFL);
        apply_limits(limits, 0);
        ::execve(exe.c_str(), argv.data(), envp.data());
        child_fail(ctl, errno);
    }

    out.write_end.reset();
    err.write_end.reset();
    control.write_end.reset();
    in.read_end.reset();

    Child child;
    child.pid = pid;
    child.out = std::move(out.read_end);
    child.err = std::move(err.read_end);
    child.control = std::move(control.read_end);
    if (spec.stdin_data) {
        child.in = std::move(in.write_end);
        child.stdin_data = *spec.stdin_data;
    }
    return supervise(child, limits, diag);
}

RawOutcome run_function(const std::function<std::string()>& fn, const SandboxLimits& limits,
                        std::string& diag) {
    PipePair out;
    PipePair err;
    if (!make_pipe(out, diag) || !make_pipe(err, diag)) {
        return setup_failure("pipe creation failed");
    }

    diag += "fork: in-process implementation\n";
    const pid_t pid = ::fork();
    if (pid < 0) {
        diag += std::string{"sandbox: fork failed: "} + std::strerror(errno) + "\n";
        return setup_failure("fork failed");
    }

    if (pid == 0) {
        ::setsid();
        const int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) ::dup2(null_fd, STDIN_FILENO);
        ::dup2(out.write_end.get(), STDOUT_FILENO);
        ::dup2(err.write_end.get(), STDERR_FILENO);
        // Drop descriptors inherited from sibling invocations so their pipes can reach EOF.
        const long max_fd = std::min<long>(::sysconf(_SC_OPEN_MAX), 4096);
        for (int fd = 3; fd < max_fd; ++fd) {
            ::close(fd);
        }
        apply_limits(limits, current_vm_bytes());
        try {
            const std::string text = fn();
            write_all(STDOUT_FILENO, text.data(), text.size());
            ::_exit(0);
        } catch (const ComputeFailure& failure) {
            // `CODE message` on stderr, decoded by supervise().
            const std::string line = std::string{to_string(failure.kind())} + " " + failure.what();
            write_all(STDERR_FILENO, line.data(), line.size());
            ::_exit(kReportedExit);
        } catch (const std::bad_alloc&) {
            ::_exit(kBadAllocExit);
        } catch (const std::exception& ex) {
            const std::string_view what = ex.what();
            write_all(STDERR_FILENO, what.data(), what.size());
            ::_exit(1);
        }
    }

    out.write_end.reset();
    err.write_end.reset();

    Child child;
    child.pid = pid;
    child.out = std::move(out.read_end);
    child.err = std::move(err.read_end);
    child.function_mode = true;
    return supervise(child, limits, diag);
}

}  // namespace swhid::conformance
