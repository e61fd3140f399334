/**
 * @file test_protocol.cpp
 * @brief Unit tests for plain framing and the JSON request/response protocol
 * 
 * @author SWHID conformance contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 SWHID conformance contributors

#include <catch2/catch_test_macros.hpp>

#include "swhid_conformance/protocol.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

using namespace swhid::conformance;

namespace {

RawOutcome stdout_of(const std::string& text, const std::string& err = {}) {
    outcome::Success success;
    success.stdout_text = text;
    success.stderr_text = err;
    success.usage.wall_ms = 7;
    return success;
}

outcome::CrashedOrProtocolViolation violation(const RawOutcome& raw) {
    const auto* crash = std::get_if<outcome::CrashedOrProtocolViolation>(&raw);
    REQUIRE(crash != nullptr);
    return *crash;
}

RawOutcome exited(int code, const std::string& out, const std::string& err) {
    outcome::CrashedOrProtocolViolation crash;
    crash.reason = CrashReason::NonZeroExit;
    crash.exit_code = code;
    crash.subtype = "exit_" + std::to_string(code);
    crash.detail = err;
    crash.stdout_text = out;
    return crash;
}

}  // namespace

TEST_CASE("Plain framing takes exactly one line", "[protocol][plain]") {
    SECTION("Trailing newline is stripped") {
        const auto raw = protocol::frame_plain(stdout_of("swh:1:cnt:abc\n"));
        REQUIRE(std::get<outcome::Success>(raw).stdout_text == "swh:1:cnt:abc");
    }

    SECTION("Trailing CRLF is stripped") {
        const auto raw = protocol::frame_plain(stdout_of("swh:1:cnt:abc\r\n"));
        REQUIRE(std::get<outcome::Success>(raw).stdout_text == "swh:1:cnt:abc");
    }

    SECTION("Missing newline is tolerated") {
        const auto raw = protocol::frame_plain(stdout_of("swh:1:cnt:abc"));
        REQUIRE(std::get<outcome::Success>(raw).stdout_text == "swh:1:cnt:abc");
    }

    SECTION("Surrounding spaces are kept for the parser to reject") {
        const auto raw = protocol::frame_plain(stdout_of(" swh:1:cnt:abc\n"));
        REQUIRE(std::get<outcome::Success>(raw).stdout_text == " swh:1:cnt:abc");
    }

    SECTION("Empty output") {
        const auto& crash = violation(protocol::frame_plain(stdout_of("\n")));
        REQUIRE(crash.reason == CrashReason::MalformedOutput);
        REQUIRE(crash.subtype == "empty_output");
        REQUIRE(crash.usage.wall_ms == 7);
    }

    SECTION("More than one line") {
        const auto& crash = violation(protocol::frame_plain(stdout_of("swh:1:cnt:abc\nswh:1:cnt:def\n")));
        REQUIRE(crash.subtype == "multiple_lines");
    }

    SECTION("Non-success outcomes pass through") {
        const RawOutcome timed_out = outcome::TimedOut{};
        REQUIRE(std::holds_alternative<outcome::TimedOut>(protocol::frame_plain(timed_out)));
    }
}

TEST_CASE("JSON responses", "[protocol][json]") {
    SECTION("Success carries the identifier") {
        const auto raw = protocol::decode_json_response(
            stdout_of(R"({"ok": true, "swhid": "swh:1:cnt:abc"})" "\n"));
        REQUIRE(std::get<outcome::Success>(raw).stdout_text == "swh:1:cnt:abc");
    }

    SECTION("Reported error keeps code, subtype and message") {
        const auto raw = protocol::decode_json_response(stdout_of(
            R"({"ok": false, "error": {"code": "PARSE_ERROR", "subtype": "bad_escape", "message": "bad %zz"}})"));
        const auto& crash = violation(raw);
        REQUIRE(crash.reason == CrashReason::Reported);
        REQUIRE(crash.reported_kind == ErrorKind::ParseError);
        REQUIRE(crash.subtype == "bad_escape");
        REQUIRE(crash.detail == "bad %zz");
    }

    SECTION("Reported error without details falls back to stderr") {
        const auto raw = protocol::decode_json_response(
            stdout_of(R"({"ok": false, "error": {"code": 17}})", "Traceback: boom"));
        const auto& crash = violation(raw);
        REQUIRE(crash.reason == CrashReason::Reported);
        REQUIRE_FALSE(crash.reported_kind.has_value());
        REQUIRE(crash.subtype == "reported");
        REQUIRE(crash.detail == "Traceback: boom");
    }

    SECTION("Error body alongside a non-zero exit is reported") {
        const auto raw = protocol::decode_json_response(exited(
            1, R"({"ok": false, "error": {"code": "VALIDATION_ERROR", "message": "bad input"}})" "\n", ""));
        const auto& crash = violation(raw);
        REQUIRE(crash.reason == CrashReason::Reported);
        REQUIRE(crash.exit_code == 1);
        REQUIRE(crash.reported_kind == ErrorKind::ValidationError);
        REQUIRE(crash.subtype == "reported");
        REQUIRE(crash.detail == "bad input");
    }

    SECTION("Non-zero exit without an error body is left alone") {
        const auto garbage = violation(protocol::decode_json_response(exited(2, "partial output", "boom")));
        REQUIRE(garbage.reason == CrashReason::NonZeroExit);
        REQUIRE(garbage.subtype == "exit_2");
        REQUIRE(garbage.detail == "boom");

        const auto claims_success = violation(protocol::decode_json_response(
            exited(1, R"({"ok": true, "swhid": "swh:1:cnt:abc"})", "")));
        REQUIRE(claims_success.reason == CrashReason::NonZeroExit);
    }

    SECTION("Malformed responses") {
        REQUIRE(violation(protocol::decode_json_response(stdout_of("swh:1:cnt:abc"))).subtype == "bad_json");
        REQUIRE(violation(protocol::decode_json_response(stdout_of("[1, 2]"))).subtype == "bad_json");
        REQUIRE(violation(protocol::decode_json_response(stdout_of(R"({"swhid": "x"})"))).subtype == "bad_json");
        REQUIRE(violation(protocol::decode_json_response(stdout_of(R"({"ok": true})"))).subtype == "bad_json");
    }
}

TEST_CASE("JSON request describes the computation", "[protocol][json]") {
    ComputeRequest request;
    request.payload = "/data/payload.txt";
    request.type = ObjectType::Content;
    request.variant = kV2Sha256Base64;

    const auto text = protocol::encode_json_request(request);
    REQUIRE(text.back() == '\n');
    const auto body = nlohmann::json::parse(text);
    REQUIRE(body.at("op") == "compute");
    REQUIRE(body.at("payload_path") == "/data/payload.txt");
    REQUIRE(body.at("obj_type") == "content");
    REQUIRE(body.at("variant") == "v2/sha256/base64");
    REQUIRE(body.at("version") == 2);
    REQUIRE(body.at("hash_algo") == "sha256");
    REQUIRE(body.at("encoding") == "base64");
    REQUIRE_FALSE(body.contains("commit"));

    request.type = ObjectType::Release;
    request.tag = "v1.0";
    request.tag_id = "0123456789abcdef0123456789abcdef01234567";
    const auto rel = nlohmann::json::parse(protocol::encode_json_request(request));
    REQUIRE(rel.at("obj_type") == "release");
    REQUIRE(rel.at("tag") == "v1.0");
    REQUIRE(rel.at("tag_id") == "0123456789abcdef0123456789abcdef01234567");
}
