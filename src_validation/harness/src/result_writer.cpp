#include "swhid_conformance/result_writer.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using namespace swhid::conformance;

json optional_text(const std::optional<std::string>& text) {
    return text ? json(*text) : json(nullptr);
}

json capabilities_to_json(const CapabilityDescriptor& caps) {
    json types = json::array();
    for (auto type : caps.types) {
        types.push_back(std::string{type_code(type)});
    }
    json variants = json::array();
    for (const auto& variant : caps.variants) {
        variants.push_back(to_string(variant));
    }
    json max_payload = nullptr;
    if (caps.max_payload_bytes != 0) {
        max_payload = static_cast<double>(caps.max_payload_bytes) / (1024.0 * 1024.0);
    }
    return json{
        {"supported_types", std::move(types)},
        {"supported_variants", std::move(variants)},
        {"supported_qualifiers", caps.qualifiers},
        {"api_version", caps.api_version},
        {"max_payload_size_mb", std::move(max_payload)},
        {"supports_unicode", caps.supports_unicode},
        {"supports_percent_encoding", caps.supports_percent_encoding},
    };
}

json error_to_json(const std::optional<ErrorInfo>& error) {
    if (!error) return nullptr;
    return json{
        {"code", std::string{to_string(error->kind)}},
        {"subtype", error->subtype},
        {"message", error->message},
    };
}

json result_to_json(const Result& result) {
    return json{
        {"implementation", result.implementation},
        {"status", std::string{to_string(result.status)}},
        {"swhid", optional_text(result.swhid)},
        {"error", error_to_json(result.error)},
        {"metrics",
         {
             {"wall_ms", result.usage.wall_ms},
             {"cpu_ms", result.usage.cpu_ms},
             {"max_rss_kb", result.usage.max_rss_kb},
         }},
        {"skip_reason", result.skip_reason.empty() ? json(nullptr) : json(result.skip_reason)},
    };
}

json outcome_to_json(const Outcome& outcome) {
    json groups = json::array();
    for (const auto& group : outcome.groups) {
        groups.push_back(json{{"swhid", group.swhid}, {"members", group.members}});
    }
    json blame = json::array();
    for (const auto& b : outcome.blame) {
        blame.push_back(json{
            {"implementation", b.implementation},
            {"code", std::string{to_string(b.kind)}},
            {"subtype", b.subtype},
            {"message", b.message},
        });
    }
    return json{
        {"status", std::string{to_string(outcome.status)}},
        {"consensus", optional_text(outcome.consensus)},
        {"expected_matched", outcome.expected_matched ? json(*outcome.expected_matched) : json(nullptr)},
        {"groups", std::move(groups)},
        {"blame", std::move(blame)},
        {"skipped", outcome.skipped},
        {"unavailable", outcome.unavailable},
        {"message", outcome.message},
    };
}

json case_to_json(const CaseOutcome& co) {
    const auto& tc = co.test_case;

    json expected_swhid = nullptr;
    if (auto it = tc.expected.find(co.variant); it != tc.expected.end()) {
        expected_swhid = it->second;
    }
    json expected_error = nullptr;
    if (tc.expected_error) {
        expected_error = std::string{to_string(*tc.expected_error)};
    }

    json attributes = json::object();
    for (const auto& [key, value] : tc.attributes) {
        attributes[key] = value;
    }

    json results = json::array();
    for (const auto& result : co.results) {
        results.push_back(result_to_json(result));
    }

    return json{
        {"id", tc.id},
        {"category", tc.suite},
        {"payload_ref", co.payload_ref},
        {"object_type", std::string{type_code(tc.type)}},
        {"variant", to_string(co.variant)},
        {"expected", {{"swhid", std::move(expected_swhid)}, {"error", std::move(expected_error)}}},
        {"attributes", std::move(attributes)},
        {"results", std::move(results)},
        {"outcome", outcome_to_json(co.outcome)},
    };
}

json build_record(const RunRecord& record) {
    json implementations = json::array();
    for (const auto& impl : record.implementations) {
        implementations.push_back(json{
            {"id", impl.info.name},
            {"version", impl.info.version},
            {"language", impl.info.language},
            {"kind", impl.info.kind},
            {"available", impl.available},
            {"capabilities", capabilities_to_json(impl.capabilities)},
        });
    }

    json tests = json::array();
    for (const auto& co : record.outcomes) {
        tests.push_back(case_to_json(co));
    }

    const auto totals = tally(record);
    json by_implementation = json::object();
    for (const auto& [name, t] : totals.by_implementation) {
        by_implementation[name] = json{
            {"passed", t.passed},
            {"failed", t.failed},
            {"skipped", t.skipped},
            {"unavailable", t.unavailable},
        };
    }

    return json{
        {"schema_version", kSchemaVersion},
        {"run", {{"id", record.run_id}, {"created_at", record.created_at}}},
        {"implementations", std::move(implementations)},
        {"tests", std::move(tests)},
        {"aggregates",
         {
             {"total", totals.cases},
             {"failures", totals.failures},
             {"by_status", totals.by_status},
             {"by_implementation", std::move(by_implementation)},
         }},
    };
}

bool blamed(const Outcome& outcome, const std::string& implementation) {
    return std::any_of(outcome.blame.begin(), outcome.blame.end(),
                       [&](const Blame& b) { return b.implementation == implementation; });
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace swhid::conformance {

RunTotals tally(const RunRecord& record) {
    RunTotals totals;
    for (const auto& impl : record.implementations) {
        totals.by_implementation[impl.info.name];
    }
    for (const auto& co : record.outcomes) {
        ++totals.cases;
        ++totals.by_status[std::string{to_string(co.outcome.status)}];
        if (is_failure(co.outcome.status)) {
            ++totals.failures;
        }
        for (const auto& result : co.results) {
            auto& t = totals.by_implementation[result.implementation];
            if (result.status == ResultStatus::Skip) {
                ++t.skipped;
            } else if (result.status == ResultStatus::Error) {
                ++t.unavailable;
            } else if (blamed(co.outcome, result.implementation)) {
                ++t.failed;
            } else {
                // An expected failure on a negative case counts as a pass.
                ++t.passed;
            }
        }
    }
    return totals;
}

std::string ResultWriter::render(const RunRecord& record) const {
    return build_record(record).dump(2, ' ', false, json::error_handler_t::replace);
}

void ResultWriter::write_summary(const std::filesystem::path& destination, const RunRecord& record) const {
    write_file(destination, render(record) + "\n");
}

}  // namespace swhid::conformance
