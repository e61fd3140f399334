#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "error_kind.hpp"

namespace swhid::conformance {

/**
 * \brief Ceilings applied to one invocation.
 *
 * CPU and address-space limits are installed with setrlimit() in the child; resident memory
 * and wall-clock time are watched by the parent, which kills the whole process group on
 * expiry.
 */
struct SandboxLimits {
    std::chrono::milliseconds wall_clock{30000};
    int cpu_seconds{60};                            ///< 0 = no CPU cap
    std::uint64_t memory_bytes{500ull * 1024 * 1024};  ///< 0 = no memory cap
    bool enforce_address_space{true};               ///< also cap RLIMIT_AS at memory_bytes
    std::size_t max_output_bytes{1024 * 1024};      ///< stdout capture ceiling
};

struct Usage {
    std::int64_t wall_ms{0};
    std::int64_t cpu_ms{0};
    std::int64_t max_rss_kb{0};
};

enum class ResourceKind {
    Memory,
    Cpu,
    Output,
};

[[nodiscard]] std::string_view to_string(ResourceKind kind) noexcept;

enum class CrashReason {
    LaunchFailed,     ///< exec failed or the binary is missing
    Signaled,         ///< terminated by a signal other than a limit trip
    NonZeroExit,      ///< regular exit with a non-zero status
    Reported,         ///< implementation reported a typed error through its protocol
    MalformedOutput,  ///< exit 0 but the output breaks the framing contract
};

[[nodiscard]] std::string_view to_string(CrashReason reason) noexcept;

namespace outcome {

struct Success {
    std::string stdout_text;
    std::string stderr_text;
    Usage usage;
};

struct TimedOut {
    std::string stderr_text;
    Usage usage;
};

struct ResourceExceeded {
    ResourceKind kind{ResourceKind::Memory};
    std::string detail;
    Usage usage;
};

struct CrashedOrProtocolViolation {
    CrashReason reason{CrashReason::NonZeroExit};
    int exit_code{-1};
    int signal{0};
    std::optional<ErrorKind> reported_kind;  ///< set when reason == Reported
    std::string subtype;
    std::string detail;  ///< stderr excerpt or framing diagnostics
    std::string stdout_text;  ///< captured stdout, kept for NonZeroExit
    Usage usage;
};

}  // namespace outcome

using RawOutcome = std::variant<outcome::Success, outcome::TimedOut, outcome::ResourceExceeded,
                                outcome::CrashedOrProtocolViolation>;

[[nodiscard]] const Usage& usage_of(const RawOutcome& raw) noexcept;

/**
 * \brief External command to run under the sandbox.
 *
 * `command` is looked up on the PATH of `env` (or used as-is when it contains a slash). When
 * neither `stdin_file` nor `stdin_data` is set the child reads from /dev/null.
 */
struct ProcessSpec {
    std::string command;
    std::vector<std::string> argv;  ///< arguments after argv[0]
    std::map<std::string, std::string> env;
    std::filesystem::path cwd;
    std::optional<std::filesystem::path> stdin_file;
    std::optional<std::string> stdin_data;
};

/**
 * \brief Runs one external command under the given limits.
 *
 * Never throws for failures of the child; every failure mode is returned as a typed
 * RawOutcome. Diagnostics (command line, exit status, usage) are appended to diag.
 */
[[nodiscard]] RawOutcome run_process(const ProcessSpec& spec, const SandboxLimits& limits,
                                     std::string& diag);

/**
 * \brief Runs a callable in a forked child under the same enforcement as run_process().
 *
 * The string returned by fn becomes the child's stdout. A ComputeFailure thrown by fn becomes
 * a Reported crash carrying its kind; std::bad_alloc maps to ResourceExceeded{Memory}; other
 * std::exception types become a non-zero exit whose stderr is the exception message. The
 * address-space cap is applied on top of the forked image size.
 */
[[nodiscard]] RawOutcome run_function(const std::function<std::string()>& fn,
                                      const SandboxLimits& limits, std::string& diag);

/// Resolves `command` against a colon-separated search path; nullopt when not executable.
[[nodiscard]] std::optional<std::filesystem::path> resolve_executable(const std::string& command,
                                                                      const std::string& search_path);

}  // namespace swhid::conformance
