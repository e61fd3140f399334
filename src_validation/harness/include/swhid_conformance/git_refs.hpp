#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sandbox.hpp"

namespace swhid::conformance {

/// 40 lower-case hex characters.
[[nodiscard]] bool is_full_object_id(std::string_view text) noexcept;

/**
 * \brief Resolves symbolic references inside a repository payload with the git CLI.
 *
 * Every git invocation runs through the sandbox with a clean environment, so a hanging or
 * broken repository cannot stall the engine. Failures return nullopt / empty lists and leave
 * the reason in diag.
 */
class GitResolver {
public:
    struct Config {
        std::string git_exe{"git"};
        SandboxLimits limits{std::chrono::milliseconds{10000}, 10, 0, false, 4 * 1024 * 1024};
        std::map<std::string, std::string> env;  ///< empty = PATH/HOME/locale of the engine
    };

    struct Ref {
        std::string name;       ///< short name (`main`, `v1.0`)
        std::string object_id;  ///< commit id for branches, tag object id for annotated tags
    };

    explicit GitResolver(Config config);

    [[nodiscard]] bool is_repository(const std::filesystem::path& repo, std::string& diag) const;

    /// Branch, tag, short hash or `HEAD` to the full commit id. Full ids are returned as-is.
    [[nodiscard]] std::optional<std::string> resolve_commit(const std::filesystem::path& repo,
                                                            const std::string& ref,
                                                            std::string& diag) const;

    /// Annotated tag name to the id of its tag object; lightweight tags are rejected.
    [[nodiscard]] std::optional<std::string> resolve_tag(const std::filesystem::path& repo,
                                                         const std::string& tag,
                                                         std::string& diag) const;

    [[nodiscard]] std::vector<Ref> branches(const std::filesystem::path& repo, std::string& diag) const;

    [[nodiscard]] std::vector<Ref> annotated_tags(const std::filesystem::path& repo, std::string& diag) const;

private:
    [[nodiscard]] std::optional<std::string> git(const std::filesystem::path& repo,
                                                 std::vector<std::string> args,
                                                 std::string& diag) const;

    Config config_;
};

}  // namespace swhid::conformance
