#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sandbox.hpp"
#include "test_case.hpp"

namespace swhid::conformance {

/**
 * \brief Turns a case's payload reference into the path handed to implementations.
 *
 * Relative paths are resolved against the directory of the case file. Archives (`.tar`,
 * `.tar.gz`, `.tgz`, `.tar.xz`) are extracted once with `tar` under the sandbox into a
 * private temporary directory; when the archive holds a single top-level directory, that
 * directory is the payload. Temporary directories are removed when the resolver is destroyed.
 *
 * Not thread-safe: payloads are prepared before invocations are scheduled.
 */
class PayloadResolver {
public:
    struct Config {
        std::filesystem::path work_dir;  ///< parent of temporary directories (default: system temp)
        std::string tar_exe{"tar"};
        SandboxLimits limits{std::chrono::milliseconds{60000}, 60, 0, false, 64 * 1024};
    };

    explicit PayloadResolver(Config config);
    ~PayloadResolver();

    PayloadResolver(const PayloadResolver&) = delete;
    PayloadResolver& operator=(const PayloadResolver&) = delete;

    [[nodiscard]] std::optional<std::filesystem::path> resolve(const TestCase& test_case, std::string& diag);

    [[nodiscard]] static bool is_archive(const std::filesystem::path& path);

private:
    [[nodiscard]] std::optional<std::filesystem::path> extract(const std::filesystem::path& archive,
                                                               std::string& diag);

    Config config_;
    std::map<std::filesystem::path, std::filesystem::path> extracted_;
    std::vector<std::filesystem::path> temp_dirs_;
};

/// Size of a regular file; nullopt for directories or unreadable paths.
[[nodiscard]] std::optional<std::uint64_t> payload_size(const std::filesystem::path& path);

}  // namespace swhid::conformance
