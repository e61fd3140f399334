/**
 * @file test_inprocess_bridge.cpp
 * @brief Tests for in-process implementations isolated in a forked child
 * 
 * @author SWHID conformance contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 SWHID conformance contributors

#include <catch2/catch_test_macros.hpp>

#include "swhid_conformance/classifier.hpp"
#include "swhid_conformance/inprocess_bridge.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <variant>

using namespace swhid::conformance;
using swhid::conformance::inprocess_bridge::ComputeFn;
using swhid::conformance::inprocess_bridge::Session;

namespace {

Session make_session(const std::string& name, ComputeFn fn) {
    Session::Config cfg;
    cfg.info.name = name;
    cfg.capabilities.types = {ObjectType::Content};
    cfg.capabilities.variants = {kV1Sha1Hex, kV2Sha256Hex};
    cfg.compute = std::move(fn);
    return Session(std::move(cfg));
}

ComputeRequest request_for(Variant variant) {
    ComputeRequest request;
    request.payload = "/tmp/hello.txt";
    request.variant = variant;
    return request;
}

}  // namespace

TEST_CASE("In-process implementation metadata", "[inprocess]") {
    const auto session = make_session("fixed", [](const ComputeRequest&) { return std::string{}; });
    REQUIRE(session.info().kind == "inprocess");
    REQUIRE(session.info().language == "c++");
    REQUIRE(session.capabilities().supports(kV2Sha256Hex));

    std::string diag;
    REQUIRE(session.available(diag));

    const auto empty = make_session("empty", nullptr);
    REQUIRE_FALSE(empty.available(diag));
    REQUIRE(diag.find("empty: no compute function registered") != std::string::npos);
}

TEST_CASE("The callable sees the request", "[inprocess]") {
    const auto session = make_session("by-variant", [](const ComputeRequest& r) {
        return r.variant == kV1Sha1Hex
                   ? std::string{"swh:1:cnt:3b18e512dba79e4c8300dd08aeb37f8e728b8dad"}
                   : std::string{"swh:2:cnt:0bd69098bd9b9cc5934a610ab65da429b525361147faa7b5b922919e9a23143d"};
    });
    std::string diag;

    for (const auto variant : {kV1Sha1Hex, kV2Sha256Hex}) {
        const auto request = request_for(variant);
        const auto result = classify("by-variant", session.compute(request, SandboxLimits{}, diag), request);
        REQUIRE(result.status == ResultStatus::Pass);
        REQUIRE(result.identifier->variant == variant);
    }
    REQUIRE(diag.find("by-variant: in-process variant=v2/sha256/hex") != std::string::npos);
}

TEST_CASE("Failures inside the callable are contained", "[inprocess]") {
    std::string diag;
    const auto request = request_for(kV1Sha1Hex);

    SECTION("Typed failure") {
        const auto session = make_session("typed", [](const ComputeRequest&) -> std::string {
            throw ComputeFailure("path is not a regular file", ErrorKind::ComputeError);
        });
        const auto result = classify("typed", session.compute(request, SandboxLimits{}, diag), request);
        REQUIRE(result.status == ResultStatus::Fail);
        REQUIRE(result.error->kind == ErrorKind::ComputeError);
        REQUIRE(result.error->message == "path is not a regular file");
    }

    SECTION("Bytes that are not an identifier") {
        const auto session = make_session("garbage", [](const ComputeRequest&) {
            return std::string{"\xFF\xFE not utf-8"};
        });
        const auto result = classify("garbage", session.compute(request, SandboxLimits{}, diag), request);
        REQUIRE(result.status == ResultStatus::Fail);
        REQUIRE(result.error->kind == ErrorKind::ParseError);
    }

    SECTION("Per-implementation limits apply") {
        Session::Config cfg;
        cfg.info.name = "sleepy";
        cfg.compute = [](const ComputeRequest&) {
            std::this_thread::sleep_for(std::chrono::seconds{30});
            return std::string{};
        };
        cfg.limits.wall_clock = std::chrono::milliseconds{300};
        const Session session(std::move(cfg));
        const auto raw = session.compute(request, SandboxLimits{}, diag);
        REQUIRE(std::holds_alternative<outcome::TimedOut>(raw));
    }

    SECTION("Lock held at fork time blocks only the child") {
        static std::mutex shared_state;
        Session::Config cfg;
        cfg.info.name = "locking";
        cfg.compute = [](const ComputeRequest&) {
            const std::lock_guard<std::mutex> guard{shared_state};
            return std::string{"swh:1:cnt:0000000000000000000000000000000000000000"};
        };
        cfg.limits.wall_clock = std::chrono::milliseconds{300};
        const Session session(std::move(cfg));

        RawOutcome raw;
        {
            const std::lock_guard<std::mutex> held{shared_state};
            raw = session.compute(request, SandboxLimits{}, diag);
        }
        REQUIRE(std::holds_alternative<outcome::TimedOut>(raw));
        REQUIRE(classify("locking", raw, request).error->kind == ErrorKind::Timeout);

        // Once released in the engine, the same callable runs normally.
        const auto ok = session.compute(request, SandboxLimits{}, diag);
        REQUIRE(std::holds_alternative<outcome::Success>(ok));
    }
}
