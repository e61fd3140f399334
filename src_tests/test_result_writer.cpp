/**
 * @file test_result_writer.cpp
 * @brief Tests for the versioned JSON result record and its aggregates
 * 
 * @author SWHID conformance contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 SWHID conformance contributors

#include <catch2/catch_test_macros.hpp>

#include "swhid_conformance/result_writer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

using namespace swhid::conformance;
using nlohmann::json;

namespace {

const std::string kA = "swh:1:cnt:3b18e512dba79e4c8300dd08aeb37f8e728b8dad";
const std::string kB = "swh:1:cnt:e69de29bb2d1d6434b8b29ae775ad8c2e48c5391";

Result pass(const std::string& name, const std::string& swhid) {
    Result r;
    r.implementation = name;
    r.status = ResultStatus::Pass;
    r.swhid = swhid;
    r.identifier = *parse(swhid).identifier;
    r.usage.wall_ms = 5;
    return r;
}

ImplementationRecord impl(const std::string& name, std::uint64_t max_bytes, bool available) {
    ImplementationRecord rec;
    rec.info.name = name;
    rec.info.version = "1";
    rec.info.language = "c++";
    rec.info.kind = "inprocess";
    rec.capabilities.types = {ObjectType::Content, ObjectType::Directory};
    rec.capabilities.variants = {kV1Sha1Hex};
    rec.capabilities.max_payload_bytes = max_bytes;
    rec.available = available;
    return rec;
}

// Three implementations, two cases: one disagreement blaming "c", one all-skipped-or-unavailable.
RunRecord sample_record() {
    RunRecord record;
    record.run_id = "run-20260101T000000Z";
    record.created_at = "2026-01-01T00:00:00Z";
    record.implementations = {impl("a", 0, true), impl("b", 64ull * 1024 * 1024, true), impl("c", 0, false)};

    CaseOutcome first;
    first.test_case.id = "hello";
    first.test_case.suite = "content";
    first.test_case.attributes["note"] = "plain text";
    first.payload_ref = "../payloads/content/hello.txt";
    first.results = {pass("a", kA), pass("b", kA), pass("c", kB)};
    first.outcome = compare(first.results, {});
    record.outcomes.push_back(first);

    CaseOutcome second;
    second.test_case.id = "tree";
    second.test_case.suite = "directory";
    second.test_case.type = ObjectType::Directory;
    second.test_case.expected[kV1Sha1Hex] = "swh:1:dir:9f6b7c9311e251e1dc797616228db0abab46c9fc";
    second.results = {make_skip("a", "object type 'dir' not supported"), make_skip("b", "variant"),
                      make_unavailable("c", "unavailable", "command not found")};
    second.outcome = compare(second.results, {});
    record.outcomes.push_back(second);
    return record;
}

}  // namespace

TEST_CASE("Aggregates count every implementation", "[result_writer]") {
    const auto totals = tally(sample_record());
    REQUIRE(totals.cases == 2);
    REQUIRE(totals.failures == 2);
    REQUIRE(totals.by_status.at("DISAGREEMENT") == 1);
    REQUIRE(totals.by_status.at("ERROR") == 1);
    REQUIRE(totals.by_implementation.at("a").passed == 1);
    REQUIRE(totals.by_implementation.at("a").skipped == 1);
    REQUIRE(totals.by_implementation.at("c").failed == 1);
    REQUIRE(totals.by_implementation.at("c").unavailable == 1);

    RunRecord empty;
    empty.implementations = {impl("idle", 0, true)};
    const auto idle = tally(empty);
    REQUIRE(idle.cases == 0);
    REQUIRE(idle.by_implementation.count("idle") == 1);
}

TEST_CASE("Rendered record follows the schema", "[result_writer]") {
    const ResultWriter writer;
    const auto doc = json::parse(writer.render(sample_record()));

    REQUIRE(doc.at("schema_version") == "1.0.0");
    REQUIRE(doc.at("run").at("id") == "run-20260101T000000Z");
    REQUIRE(doc.at("run").at("created_at") == "2026-01-01T00:00:00Z");

    SECTION("Implementations and capabilities") {
        const auto& impls = doc.at("implementations");
        REQUIRE(impls.size() == 3);
        REQUIRE(impls[0].at("id") == "a");
        REQUIRE(impls[0].at("kind") == "inprocess");
        REQUIRE(impls[0].at("available") == true);
        REQUIRE(impls[2].at("available") == false);
        const auto& caps = impls[0].at("capabilities");
        REQUIRE(caps.at("supported_types") == json::array({"cnt", "dir"}));
        REQUIRE(caps.at("supported_variants") == json::array({"v1/sha1/hex"}));
        REQUIRE(caps.at("max_payload_size_mb").is_null());
        REQUIRE(impls[1].at("capabilities").at("max_payload_size_mb") == 64.0);
        REQUIRE(caps.at("api_version") == "1.0");
    }

    SECTION("Per-test results and outcome") {
        const auto& tests = doc.at("tests");
        REQUIRE(tests.size() == 2);
        const auto& hello = tests[0];
        REQUIRE(hello.at("id") == "hello");
        REQUIRE(hello.at("category") == "content");
        REQUIRE(hello.at("object_type") == "cnt");
        REQUIRE(hello.at("variant") == "v1/sha1/hex");
        REQUIRE(hello.at("expected").at("swhid").is_null());
        REQUIRE(hello.at("attributes").at("note") == "plain text");
        REQUIRE(hello.at("results").size() == 3);
        REQUIRE(hello.at("results")[0].at("status") == "PASS");
        REQUIRE(hello.at("results")[0].at("error").is_null());
        REQUIRE(hello.at("results")[0].at("metrics").at("wall_ms") == 5);

        const auto& outcome = hello.at("outcome");
        REQUIRE(outcome.at("status") == "DISAGREEMENT");
        REQUIRE(outcome.at("consensus") == kA);
        REQUIRE(outcome.at("groups").size() == 2);
        REQUIRE(outcome.at("blame").size() == 1);
        REQUIRE(outcome.at("blame")[0].at("implementation") == "c");
        REQUIRE(outcome.at("blame")[0].at("code") == "MISMATCH_ERROR");

        const auto& tree = tests[1];
        REQUIRE(tree.at("expected").at("swhid") == "swh:1:dir:9f6b7c9311e251e1dc797616228db0abab46c9fc");
        REQUIRE(tree.at("results")[0].at("skip_reason") == "object type 'dir' not supported");
        REQUIRE(tree.at("results")[2].at("error").at("subtype") == "unavailable");
        REQUIRE(tree.at("outcome").at("unavailable") == json::array({"c"}));
    }

    SECTION("Aggregates") {
        const auto& aggregates = doc.at("aggregates");
        REQUIRE(aggregates.at("total") == 2);
        REQUIRE(aggregates.at("failures") == 2);
        REQUIRE(aggregates.at("by_implementation").at("b").at("passed") == 1);
    }
}

TEST_CASE("Arbitrary bytes from an implementation still render", "[result_writer][unicode]") {
    auto record = sample_record();
    record.outcomes[0].results[2].swhid = std::string{"swh:1:cnt:\xFF\xFE"};
    const auto text = ResultWriter{}.render(record);
    const auto doc = json::parse(text);
    REQUIRE(doc.at("tests")[0].at("results")[2].at("swhid") == "swh:1:cnt:\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("Summary file is written", "[result_writer]") {
    const auto dir = std::filesystem::temp_directory_path() / ("swhid_writer_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    const auto path = dir / "nested" / "results.json";

    const ResultWriter writer;
    writer.write_summary(path, sample_record());
    std::ifstream in(path);
    const auto doc = json::parse(in);
    REQUIRE(doc.at("tests").size() == 2);

    REQUIRE_THROWS_AS(writer.write_summary(dir, sample_record()), std::runtime_error);
    std::filesystem::remove_all(dir);
}
