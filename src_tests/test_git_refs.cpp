/**
 * @file test_git_refs.cpp
 * @brief Tests for resolving branches, commits and annotated tags through git
 * 
 * @author SWHID conformance contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 SWHID conformance contributors

#include <catch2/catch_test_macros.hpp>

#include "swhid_conformance/git_refs.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <variant>

#include <unistd.h>

using namespace swhid::conformance;

namespace {

constexpr const char* kSearchPath = "/usr/local/bin:/usr/bin:/bin";

// Two commits on main, a side branch, one annotated and one lightweight tag.
bool make_repository(const std::filesystem::path& repo) {
    std::filesystem::remove_all(repo);
    std::filesystem::create_directories(repo);

    ProcessSpec spec;
    spec.command = "/bin/sh";
    spec.argv = {"-c",
                 "set -e\n"
                 "git init -q .\n"
                 "git symbolic-ref HEAD refs/heads/main\n"
                 "echo one > file.txt && git add file.txt && git commit -q -m one\n"
                 "git branch side\n"
                 "echo two >> file.txt && git commit -q -a -m two\n"
                 "git tag -a v1.0 -m 'release 1.0'\n"
                 "git tag light\n"};
    spec.env = {{"PATH", kSearchPath},
                {"HOME", repo.string()},
                {"GIT_CONFIG_NOSYSTEM", "1"},
                {"GIT_CONFIG_GLOBAL", "/dev/null"},
                {"GIT_AUTHOR_NAME", "Test"},
                {"GIT_AUTHOR_EMAIL", "test@example.org"},
                {"GIT_AUTHOR_DATE", "2020-01-01T00:00:00Z"},
                {"GIT_COMMITTER_NAME", "Test"},
                {"GIT_COMMITTER_EMAIL", "test@example.org"},
                {"GIT_COMMITTER_DATE", "2020-01-01T00:00:00Z"}};
    spec.cwd = repo;
    std::string diag;
    return std::holds_alternative<outcome::Success>(run_process(spec, SandboxLimits{}, diag));
}

}  // namespace

TEST_CASE("Full object ids", "[git]") {
    REQUIRE(is_full_object_id("0123456789abcdef0123456789abcdef01234567"));
    REQUIRE_FALSE(is_full_object_id("0123456789ABCDEF0123456789abcdef01234567"));
    REQUIRE_FALSE(is_full_object_id("0123456"));
    REQUIRE_FALSE(is_full_object_id("main"));
}

TEST_CASE("References resolve in a scratch repository", "[git]") {
    if (!resolve_executable("git", kSearchPath)) {
        SKIP("git is not installed");
    }
    const auto repo = std::filesystem::temp_directory_path() / ("swhid_git_" + std::to_string(::getpid()));
    REQUIRE(make_repository(repo));

    GitResolver::Config cfg;
    cfg.env = {{"PATH", kSearchPath}, {"GIT_CONFIG_NOSYSTEM", "1"}, {"GIT_CONFIG_GLOBAL", "/dev/null"}};
    const GitResolver git(cfg);
    std::string diag;

    SECTION("Repository detection") {
        REQUIRE(git.is_repository(repo, diag));
        REQUIRE_FALSE(git.is_repository(repo / "file.txt", diag));
    }

    SECTION("Branches and HEAD") {
        const auto head = git.resolve_commit(repo, "", diag);
        const auto main = git.resolve_commit(repo, "main", diag);
        const auto side = git.resolve_commit(repo, "side", diag);
        REQUIRE(head.has_value());
        REQUIRE(is_full_object_id(*head));
        REQUIRE(head == main);
        REQUIRE(side.has_value());
        REQUIRE(side != main);
        REQUIRE(git.resolve_commit(repo, *side, diag) == side);
        REQUIRE_FALSE(git.resolve_commit(repo, "no-such-branch", diag).has_value());

        const auto refs = git.branches(repo, diag);
        REQUIRE(refs.size() == 2);
        REQUIRE(refs[0].name == "main");
        REQUIRE(refs[0].object_id == *main);
        REQUIRE(refs[1].name == "side");
    }

    SECTION("Only annotated tags count") {
        const auto tag = git.resolve_tag(repo, "v1.0", diag);
        REQUIRE(tag.has_value());
        REQUIRE(is_full_object_id(*tag));
        REQUIRE(tag != git.resolve_commit(repo, "main", diag));
        REQUIRE_FALSE(git.resolve_tag(repo, "light", diag).has_value());
        REQUIRE(diag.find("is not annotated") != std::string::npos);

        const auto tags = git.annotated_tags(repo, diag);
        REQUIRE(tags.size() == 1);
        REQUIRE(tags.front().name == "v1.0");
        REQUIRE(tags.front().object_id == *tag);
    }

    std::filesystem::remove_all(repo);
}
