/**
 * @file test_sandbox.cpp
 * @brief Tests for isolated execution of external processes and in-process callables
 * 
 * @author SWHID conformance contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 SWHID conformance contributors

#include <catch2/catch_test_macros.hpp>

#include "swhid_conformance/sandbox.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace swhid::conformance;

namespace {

ProcessSpec shell(const std::string& script) {
    ProcessSpec spec;
    spec.command = "/bin/sh";
    spec.argv = {"-c", script};
    spec.env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    spec.cwd = std::filesystem::temp_directory_path();
    return spec;
}

SandboxLimits quick_limits() {
    SandboxLimits limits;
    limits.wall_clock = std::chrono::milliseconds{10000};
    limits.cpu_seconds = 10;
    return limits;
}

}  // namespace

TEST_CASE("Process runs to completion", "[sandbox]") {
    std::string diag;

    SECTION("Stdout is captured") {
        const auto raw = run_process(shell("echo swh:1:cnt:abc"), quick_limits(), diag);
        const auto* ok = std::get_if<outcome::Success>(&raw);
        REQUIRE(ok != nullptr);
        REQUIRE(ok->stdout_text == "swh:1:cnt:abc\n");
        REQUIRE(ok->usage.wall_ms >= 0);
        REQUIRE(diag.find("exec: /bin/sh") != std::string::npos);
    }

    SECTION("Environment is exactly the one given") {
        auto spec = shell("printf '%s|%s' \"$FOO\" \"${HOME:-unset}\"");
        spec.env["FOO"] = "bar";
        const auto raw = run_process(spec, quick_limits(), diag);
        REQUIRE(std::get<outcome::Success>(raw).stdout_text == "bar|unset");
    }

    SECTION("Stdin from memory") {
        auto spec = shell("cat");
        spec.stdin_data = std::string{"payload bytes"};
        const auto raw = run_process(spec, quick_limits(), diag);
        REQUIRE(std::get<outcome::Success>(raw).stdout_text == "payload bytes");
    }

    SECTION("Stdin from a file") {
        const auto file = std::filesystem::temp_directory_path() / "swhid_sandbox_stdin.txt";
        {
            std::ofstream out(file, std::ios::binary);
            out << "from file\n";
        }
        auto spec = shell("wc -c");
        spec.stdin_file = file;
        const auto raw = run_process(spec, quick_limits(), diag);
        REQUIRE(std::get<outcome::Success>(raw).stdout_text.find("10") != std::string::npos);
        std::filesystem::remove(file);
    }
}

TEST_CASE("Process failures are typed", "[sandbox]") {
    std::string diag;

    SECTION("Non-zero exit keeps stderr") {
        const auto raw = run_process(shell("echo oops >&2; exit 3"), quick_limits(), diag);
        const auto& crash = std::get<outcome::CrashedOrProtocolViolation>(raw);
        REQUIRE(crash.reason == CrashReason::NonZeroExit);
        REQUIRE(crash.exit_code == 3);
        REQUIRE(crash.subtype == "exit_3");
        REQUIRE(crash.detail.find("oops") != std::string::npos);
    }

    SECTION("Missing executable is a launch failure") {
        ProcessSpec spec;
        spec.command = "/nonexistent/swhid-implementation";
        const auto raw = run_process(spec, quick_limits(), diag);
        const auto& crash = std::get<outcome::CrashedOrProtocolViolation>(raw);
        REQUIRE(crash.reason == CrashReason::LaunchFailed);
        REQUIRE(crash.subtype == "launch_failed");
    }

    SECTION("Killed by a signal") {
        const auto raw = run_process(shell("kill -KILL $$"), quick_limits(), diag);
        const auto& crash = std::get<outcome::CrashedOrProtocolViolation>(raw);
        REQUIRE(crash.reason == CrashReason::Signaled);
        REQUIRE(crash.signal == SIGKILL);
    }
}

TEST_CASE("Process limits are enforced", "[sandbox][limits]") {
    std::string diag;

    SECTION("Wall clock") {
        auto limits = quick_limits();
        limits.wall_clock = std::chrono::milliseconds{300};
        const auto started = std::chrono::steady_clock::now();
        const auto raw = run_process(shell("sleep 5"), limits, diag);
        const auto elapsed = std::chrono::steady_clock::now() - started;
        REQUIRE(std::holds_alternative<outcome::TimedOut>(raw));
        REQUIRE(elapsed < std::chrono::seconds{4});
    }

    SECTION("CPU time") {
        auto limits = quick_limits();
        limits.cpu_seconds = 1;
        const auto raw = run_process(shell("while :; do :; done"), limits, diag);
        const auto& exceeded = std::get<outcome::ResourceExceeded>(raw);
        REQUIRE(exceeded.kind == ResourceKind::Cpu);
        REQUIRE(to_string(exceeded.kind) == "cpu");
    }

    SECTION("Output ceiling") {
        auto limits = quick_limits();
        limits.max_output_bytes = 4096;
        const auto raw = run_process(shell("yes swh"), limits, diag);
        const auto& exceeded = std::get<outcome::ResourceExceeded>(raw);
        REQUIRE(exceeded.kind == ResourceKind::Output);
    }
}

TEST_CASE("In-process callables run in a forked child", "[sandbox][inprocess]") {
    std::string diag;

    SECTION("Returned text is the child's stdout") {
        const auto raw = run_function([] { return std::string{"swh:1:cnt:abc\n"}; }, quick_limits(), diag);
        REQUIRE(std::get<outcome::Success>(raw).stdout_text == "swh:1:cnt:abc\n");
    }

    SECTION("ComputeFailure travels back with its kind") {
        const auto raw = run_function(
            []() -> std::string { throw ComputeFailure("cannot read payload", ErrorKind::IoError); },
            quick_limits(), diag);
        const auto& crash = std::get<outcome::CrashedOrProtocolViolation>(raw);
        REQUIRE(crash.reason == CrashReason::Reported);
        REQUIRE(crash.reported_kind == ErrorKind::IoError);
        REQUIRE(crash.detail == "cannot read payload");
    }

    SECTION("Other exceptions are a non-zero exit with the message") {
        const auto raw = run_function([]() -> std::string { throw std::runtime_error("unexpected state"); },
                                      quick_limits(), diag);
        const auto& crash = std::get<outcome::CrashedOrProtocolViolation>(raw);
        REQUIRE(crash.reason == CrashReason::NonZeroExit);
        REQUIRE(crash.exit_code == 1);
        REQUIRE(crash.detail == "unexpected state");
    }

    SECTION("Allocation beyond the memory cap") {
        auto limits = quick_limits();
        limits.memory_bytes = 32ull * 1024 * 1024;
        const auto raw = run_function(
            [] {
                std::vector<char> block(512ull * 1024 * 1024, 'x');
                return std::string(1, block.back());
            },
            limits, diag);
        const auto& exceeded = std::get<outcome::ResourceExceeded>(raw);
        REQUIRE(exceeded.kind == ResourceKind::Memory);
    }

    SECTION("Runaway loop hits the wall clock") {
        auto limits = quick_limits();
        limits.wall_clock = std::chrono::milliseconds{300};
        const auto raw = run_function(
            [] {
                for (;;) {
                    std::this_thread::sleep_for(std::chrono::milliseconds{10});
                }
                return std::string{};
            },
            limits, diag);
        REQUIRE(std::holds_alternative<outcome::TimedOut>(raw));
    }

    SECTION("Crash in the callable does not reach the caller") {
        const auto raw = run_function(
            []() -> std::string {
                std::raise(SIGKILL);
                return {};
            },
            quick_limits(), diag);
        const auto& crash = std::get<outcome::CrashedOrProtocolViolation>(raw);
        REQUIRE(crash.reason == CrashReason::Signaled);
        REQUIRE(crash.signal == SIGKILL);
    }
}

TEST_CASE("Executable lookup on a search path", "[sandbox]") {
    REQUIRE(resolve_executable("sh", "/usr/bin:/bin").has_value());
    REQUIRE(resolve_executable("/bin/sh", "").has_value());
    REQUIRE_FALSE(resolve_executable("swhid-no-such-tool", "/usr/bin:/bin").has_value());
    REQUIRE_FALSE(resolve_executable("", "/usr/bin").has_value());
}
