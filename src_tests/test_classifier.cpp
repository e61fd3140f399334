/**
 * @file test_classifier.cpp
 * @brief Unit tests for turning raw invocation outcomes into typed results
 * 
 * @author SWHID conformance contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 SWHID conformance contributors

#include <catch2/catch_test_macros.hpp>

#include "swhid_conformance/classifier.hpp"

#include <string>
#include <utility>

using namespace swhid::conformance;

namespace {

const std::string kHelloV1 = "swh:1:cnt:3b18e512dba79e4c8300dd08aeb37f8e728b8dad";

ComputeRequest content_request(Variant variant = kV1Sha1Hex) {
    ComputeRequest request;
    request.payload = "/tmp/hello.txt";
    request.type = ObjectType::Content;
    request.variant = variant;
    return request;
}

RawOutcome printed(const std::string& text) {
    outcome::Success success;
    success.stdout_text = text;
    success.usage.wall_ms = 12;
    return success;
}

RawOutcome crashed(CrashReason reason, int exit_code, std::string detail) {
    outcome::CrashedOrProtocolViolation crash;
    crash.reason = reason;
    crash.exit_code = exit_code;
    crash.subtype = "exit_" + std::to_string(exit_code);
    crash.detail = std::move(detail);
    return crash;
}

}  // namespace

TEST_CASE("Canonical output passes", "[classifier]") {
    const auto result = classify("git", printed(kHelloV1), content_request());
    REQUIRE(result.status == ResultStatus::Pass);
    REQUIRE(result.implementation == "git");
    REQUIRE(result.swhid == kHelloV1);
    REQUIRE(result.identifier.has_value());
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(result.usage.wall_ms == 12);
}

TEST_CASE("Output problems fail with the most severe kind", "[classifier]") {
    SECTION("Unparseable output") {
        const auto result = classify("impl", printed("not an identifier"), content_request());
        REQUIRE(result.status == ResultStatus::Fail);
        REQUIRE(result.error->kind == ErrorKind::ParseError);
        REQUIRE(result.swhid == std::string{"not an identifier"});
    }

    SECTION("Non-canonical output") {
        const auto result =
            classify("impl", printed("swh:1:cnt:3B18E512DBA79E4C8300DD08AEB37F8E728B8DAD"), content_request());
        REQUIRE(result.status == ResultStatus::Fail);
        REQUIRE(result.error->kind == ErrorKind::NormalizeError);
        REQUIRE(result.error->subtype == "hash_not_canonical");
        REQUIRE_FALSE(result.identifier.has_value());
    }

    SECTION("Semantically invalid output") {
        const auto result = classify("impl", printed(kHelloV1 + ";lines=9-2"), content_request());
        REQUIRE(result.error->kind == ErrorKind::ValidationError);
        REQUIRE(result.error->subtype == "bad_range");
    }

    SECTION("Wrong variant") {
        const auto result = classify("impl", printed(kHelloV1), content_request(kV2Sha256Hex));
        REQUIRE(result.error->kind == ErrorKind::ValidationError);
        REQUIRE(result.error->subtype == "variant_mismatch");
    }

    SECTION("Wrong object type") {
        auto request = content_request();
        request.type = ObjectType::Directory;
        const auto result = classify("impl", printed(kHelloV1), request);
        REQUIRE(result.error->kind == ErrorKind::ValidationError);
        REQUIRE(result.error->subtype == "type_mismatch");
    }
}

TEST_CASE("Crashes map onto the error taxonomy", "[classifier]") {
    const auto request = content_request();

    SECTION("Launch failure makes the implementation unavailable") {
        const auto result = classify("impl", crashed(CrashReason::LaunchFailed, 127, "launch failed: ENOENT"), request);
        REQUIRE(result.status == ResultStatus::Error);
        REQUIRE(result.error->kind == ErrorKind::IoError);
        REQUIRE(result.error->subtype == "unavailable");
    }

    SECTION("Diagnostic on stderr is a compute error") {
        const auto result = classify("impl", crashed(CrashReason::NonZeroExit, 1, "fatal: not a git repository"), request);
        REQUIRE(result.status == ResultStatus::Fail);
        REQUIRE(result.error->kind == ErrorKind::ComputeError);
        REQUIRE(result.error->message == "fatal: not a git repository");
    }

    SECTION("Silent non-zero exit is an I/O error") {
        const auto result = classify("impl", crashed(CrashReason::NonZeroExit, 2, "  \n"), request);
        REQUIRE(result.error->kind == ErrorKind::IoError);
        REQUIRE(result.error->message == "exit status 2 without diagnostic");
    }

    SECTION("Command not executable") {
        const auto result = classify("impl", crashed(CrashReason::NonZeroExit, 127, "sh: git: not found"), request);
        REQUIRE(result.error->kind == ErrorKind::IoError);
    }

    SECTION("Signal and framing violations are I/O errors") {
        REQUIRE(classify("impl", crashed(CrashReason::Signaled, -1, "signal 11"), request).error->kind ==
                ErrorKind::IoError);
        REQUIRE(classify("impl", crashed(CrashReason::MalformedOutput, 0, "two lines"), request).error->kind ==
                ErrorKind::IoError);
    }

    SECTION("Reported kinds are honoured within the implementation's own range") {
        outcome::CrashedOrProtocolViolation crash;
        crash.reason = CrashReason::Reported;
        crash.reported_kind = ErrorKind::ParseError;
        crash.subtype = "bad_escape";
        crash.detail = "bad escape";
        auto result = classify("impl", crash, request);
        REQUIRE(result.error->kind == ErrorKind::ParseError);
        REQUIRE(result.error->subtype == "bad_escape");

        crash.reported_kind = ErrorKind::MismatchError;
        result = classify("impl", crash, request);
        REQUIRE(result.error->kind == ErrorKind::ComputeError);

        crash.reported_kind.reset();
        result = classify("impl", crash, request);
        REQUIRE(result.error->kind == ErrorKind::ComputeError);
    }
}

TEST_CASE("Limit trips are typed", "[classifier]") {
    const auto request = content_request();

    outcome::TimedOut timed_out;
    timed_out.usage.wall_ms = 1500;
    const auto timeout = classify("impl", timed_out, request);
    REQUIRE(timeout.status == ResultStatus::Fail);
    REQUIRE(timeout.error->kind == ErrorKind::Timeout);
    REQUIRE(timeout.error->subtype == "wall_clock");
    REQUIRE(timeout.usage.wall_ms == 1500);

    const auto memory = classify("impl", outcome::ResourceExceeded{ResourceKind::Memory, "rss", {}}, request);
    REQUIRE(memory.error->kind == ErrorKind::ResourceLimit);
    REQUIRE(memory.error->subtype == "memory");

    const auto cpu = classify("impl", outcome::ResourceExceeded{ResourceKind::Cpu, "cpu", {}}, request);
    REQUIRE(cpu.error->subtype == "cpu");
}

TEST_CASE("Skip and unavailable results", "[classifier]") {
    const auto skip = make_skip("impl", "variant v2/sha256/base85 not supported");
    REQUIRE(skip.status == ResultStatus::Skip);
    REQUIRE(skip.skip_reason == "variant v2/sha256/base85 not supported");
    REQUIRE_FALSE(skip.error.has_value());

    const auto unavailable = make_unavailable("impl", "unavailable", "command not found: swh");
    REQUIRE(unavailable.status == ResultStatus::Error);
    REQUIRE(unavailable.error->kind == ErrorKind::IoError);

    REQUIRE(to_string(ResultStatus::Pass) == "PASS");
    REQUIRE(to_string(ResultStatus::Skip) == "SKIPPED");
}
