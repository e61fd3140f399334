#include "swhid_conformance/engine.hpp"
#include "swhid_conformance/git_refs.hpp"
#include "swhid_conformance/payload_resolver.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace swhid::conformance {

namespace {

constexpr std::size_t kMaxParallel = 32;

bool write_text(const fs::path& path, const std::string& text, std::string& diag) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) { diag += "open failed: " + path.string() + "\n"; return false; }
    ofs << text;
    if (!ofs) { diag += "write failed: " + path.string() + "\n"; return false; }
    return true;
}

// Case ids and implementation names become path components.
std::string sanitize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        const bool keep = std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.';
        out.push_back(keep ? static_cast<char>(c) : '_');
    }
    if (out.empty() || out == "." || out == "..") {
        out.insert(out.begin(), '_');
    }
    return out;
}

std::string variant_dir(const Variant& variant) {
    auto text = to_string(variant);
    std::replace(text.begin(), text.end(), '/', '_');
    return text;
}

std::pair<std::string, std::string> utc_stamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream id;
    std::ostringstream iso;
    id << "run-" << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    iso << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return {id.str(), iso.str()};
}

struct PreparedCase {
    TestCase test_case;
    std::optional<fs::path> payload;
    std::optional<std::uint64_t> payload_bytes;
    std::string tag_id;
    std::string error;  ///< non-empty when no implementation can be attempted
    std::string diag;
};

bool references_repository(const TestCase& test_case) {
    return !test_case.commit.empty() || !test_case.tag.empty() || test_case.discover_branches ||
           test_case.discover_tags;
}

PreparedCase derive(const PreparedCase& parent, const std::string& marker, const std::string& name,
                    ObjectType type) {
    PreparedCase sub;
    sub.test_case = parent.test_case;
    auto& tc = sub.test_case;
    tc.id = parent.test_case.id + marker + name;
    tc.type = type;
    tc.expected.clear();
    tc.expected_error.reset();
    tc.commit.clear();
    tc.tag.clear();
    tc.discover_branches = false;
    tc.discover_tags = false;
    tc.expected_branches.clear();
    tc.expected_tags.clear();
    sub.payload = parent.payload;
    sub.payload_bytes = parent.payload_bytes;
    return sub;
}

// Expands one discovery kind; documented references that were not found become error cases.
void discover(const PreparedCase& parent, const std::vector<GitResolver::Ref>& refs,
              const std::map<std::string, std::string>& golden, bool tags,
              std::vector<PreparedCase>& out) {
    const std::string marker = tags ? "@tag:" : "@branch:";
    const ObjectType type = tags ? ObjectType::Release : ObjectType::Revision;
    std::set<std::string> seen;
    for (const auto& ref : refs) {
        auto sub = derive(parent, marker, ref.name, type);
        if (tags) {
            sub.test_case.tag = ref.name;
            sub.tag_id = ref.object_id;
        } else {
            sub.test_case.commit = ref.object_id;
        }
        if (auto it = golden.find(ref.name); it != golden.end()) {
            sub.test_case.expected[kV1Sha1Hex] = it->second;
        }
        sub.diag = "discovered " + ref.name + " -> " + ref.object_id + "\n";
        seen.insert(ref.name);
        out.push_back(std::move(sub));
    }
    for (const auto& [name, swhid] : golden) {
        if (seen.count(name) != 0) continue;
        auto sub = derive(parent, marker, name, type);
        sub.test_case.expected[kV1Sha1Hex] = swhid;
        sub.error = std::string{tags ? "annotated tag" : "branch"} + " not found: " + name;
        sub.diag = sub.error + "\n";
        out.push_back(std::move(sub));
    }
}

std::vector<PreparedCase> prepare(const std::vector<CasePack>& packs, PayloadResolver& payloads,
                                  const GitResolver& git) {
    std::vector<PreparedCase> prepared;
    for (const auto& pack : packs) {
        for (const auto& test_case : pack.cases) {
            PreparedCase pc;
            pc.test_case = test_case;
            pc.payload = payloads.resolve(test_case, pc.diag);
            if (!pc.payload) {
                pc.error = "payload not found: " + test_case.payload.string();
                prepared.push_back(std::move(pc));
                continue;
            }
            pc.payload_bytes = payload_size(*pc.payload);
            auto& tc = pc.test_case;

            if (!tc.commit.empty()) {
                if (auto id = git.resolve_commit(*pc.payload, tc.commit, pc.diag)) {
                    tc.commit = *id;
                } else {
                    pc.error = "cannot resolve commit '" + tc.commit + "'";
                }
            } else if (tc.type == ObjectType::Revision && git.is_repository(*pc.payload, pc.diag)) {
                // Pin HEAD so that every implementation sees the same revision.
                if (auto id = git.resolve_commit(*pc.payload, "", pc.diag)) {
                    tc.commit = *id;
                }
            }
            if (pc.error.empty() && !tc.tag.empty()) {
                if (auto id = git.resolve_tag(*pc.payload, tc.tag, pc.diag)) {
                    pc.tag_id = *id;
                } else {
                    pc.error = "cannot resolve annotated tag '" + tc.tag + "'";
                }
            }

            std::vector<PreparedCase> discovered;
            if (pc.error.empty() && references_repository(tc)) {
                if (tc.discover_branches) {
                    discover(pc, git.branches(*pc.payload, pc.diag), tc.expected_branches, false, discovered);
                }
                if (tc.discover_tags) {
                    discover(pc, git.annotated_tags(*pc.payload, pc.diag), tc.expected_tags, true, discovered);
                }
            }
            prepared.push_back(std::move(pc));
            for (auto& sub : discovered) {
                prepared.push_back(std::move(sub));
            }
        }
    }
    return prepared;
}

struct Slot {
    std::size_t case_index{0};
    Variant variant{kV1Sha1Hex};
    std::optional<NormalizedIdentifier> golden;
    std::vector<Result> results;
    std::vector<std::string> diags;
    std::string engine_diag;
};

struct Task {
    std::size_t slot{0};
    std::size_t implementation{0};
    ComputeRequest request;
};

std::vector<std::string> qualifier_keys(const std::optional<NormalizedIdentifier>& golden) {
    std::vector<std::string> keys;
    if (golden) {
        for (const auto& qualifier : golden->qualifiers) {
            keys.push_back(qualifier.key);
        }
    }
    return keys;
}

std::string describe(const Result& result) {
    std::string line = result.implementation + ": " + std::string{to_string(result.status)};
    if (result.swhid) line += " " + *result.swhid;
    if (result.error) {
        line += " " + std::string{to_string(result.error->kind)} + "/" + result.error->subtype;
        if (!result.error->message.empty()) line += " (" + result.error->message + ")";
    }
    if (!result.skip_reason.empty()) line += " (" + result.skip_reason + ")";
    return line + "\n";
}

}  // namespace

Engine::Engine(Config config) : config_{std::move(config)} {
    if (config_.variants.empty()) {
        config_.variants.push_back(kV1Sha1Hex);
    }
    config_.max_parallel = std::clamp<std::size_t>(config_.max_parallel, 1, kMaxParallel);
}

RunRecord Engine::run(const std::vector<CasePack>& packs, const Registry& registry) const {
    RunRecord record;
    std::tie(record.run_id, record.created_at) = utc_stamp();

    PayloadResolver::Config payload_cfg;
    payload_cfg.work_dir = config_.work_dir;
    payload_cfg.tar_exe = config_.tar_exe;
    PayloadResolver payloads(payload_cfg);

    GitResolver::Config git_cfg;
    git_cfg.git_exe = config_.git_exe;
    const GitResolver git(git_cfg);

    const auto prepared = prepare(packs, payloads, git);

    // Availability is probed once per implementation and run.
    const auto& impls = registry.implementations();
    std::vector<char> available(impls.size(), 0);
    std::vector<std::string> availability_diag(impls.size());
    for (std::size_t i = 0; i < impls.size(); ++i) {
        try {
            available[i] = impls[i]->available(availability_diag[i]) ? 1 : 0;
        } catch (const std::exception& ex) {
            availability_diag[i] += std::string{"availability check threw: "} + ex.what() + "\n";
        }
        record.implementations.push_back(
            ImplementationRecord{impls[i]->info(), impls[i]->capabilities(), available[i] != 0});
    }

    std::vector<Slot> slots;
    std::vector<Task> tasks;
    for (std::size_t c = 0; c < prepared.size(); ++c) {
        const auto& pc = prepared[c];
        for (const auto& variant : config_.variants) {
            Slot slot;
            slot.case_index = c;
            slot.variant = variant;
            slot.results.resize(impls.size());
            slot.diags.resize(impls.size());
            slot.engine_diag = pc.diag;

            if (auto it = pc.test_case.expected.find(variant); it != pc.test_case.expected.end()) {
                auto parsed = parse(it->second);
                if (parsed.ok()) {
                    slot.golden = std::move(parsed.identifier);
                } else {
                    slot.engine_diag += "golden value does not parse: " + it->second + "\n";
                }
            }

            const std::size_t slot_index = slots.size();
            for (std::size_t i = 0; i < impls.size(); ++i) {
                const auto& name = impls[i]->info().name;
                if (!pc.error.empty()) {
                    slot.results[i] = make_unavailable(name, "payload_unresolved", pc.error);
                    continue;
                }
                if (available[i] == 0) {
                    slot.results[i] = make_unavailable(name, "unavailable", "implementation is not available");
                    slot.diags[i] = availability_diag[i];
                    continue;
                }
                CapabilityQuery query;
                query.type = pc.test_case.type;
                query.variant = variant;
                query.qualifiers = qualifier_keys(slot.golden);
                query.payload_bytes = pc.payload_bytes;
                if (auto reason = skip_reason(impls[i]->capabilities(), query)) {
                    slot.results[i] = make_skip(name, std::move(*reason));
                    continue;
                }

                Task task;
                task.slot = slot_index;
                task.implementation = i;
                task.request.payload = *pc.payload;
                task.request.type = pc.test_case.type;
                task.request.variant = variant;
                task.request.commit = pc.test_case.commit;
                task.request.tag = pc.test_case.tag;
                task.request.tag_id = pc.tag_id;
                tasks.push_back(std::move(task));
            }
            slots.push_back(std::move(slot));
        }
    }

    std::atomic<std::size_t> cursor{0};
    std::mutex mutex;
    auto worker = [&] {
        for (;;) {
            const std::size_t index = cursor.fetch_add(1);
            if (index >= tasks.size()) return;
            const auto& task = tasks[index];
            const auto& impl = *impls[task.implementation];

            std::string diag;
            Result result;
            try {
                const auto raw = impl.compute(task.request, config_.limits, diag);
                result = classify(impl.info().name, raw, task.request);
            } catch (const std::exception& ex) {
                diag += std::string{"adapter threw: "} + ex.what() + "\n";
                result = make_unavailable(impl.info().name, "adapter_exception", ex.what());
            }

            std::lock_guard<std::mutex> lock(mutex);
            slots[task.slot].results[task.implementation] = std::move(result);
            slots[task.slot].diags[task.implementation] += diag;
        }
    };

    const std::size_t worker_count = std::min(config_.max_parallel, tasks.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    try {
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(worker);
        }
    } catch (...) {
        for (auto& t : workers) t.join();
        throw;
    }
    for (auto& t : workers) {
        t.join();
    }

    record.outcomes.reserve(slots.size());
    for (auto& slot : slots) {
        const auto& pc = prepared[slot.case_index];

        Expectation expectation;
        expectation.golden = slot.golden;
        expectation.expected_error = pc.test_case.expected_error;

        CaseOutcome co;
        co.test_case = pc.test_case;
        co.variant = slot.variant;
        co.payload_ref = pc.test_case.payload.string();
        co.results = std::move(slot.results);
        co.outcome = compare(co.results, expectation);

        if (!config_.artifact_root.empty()) {
            const fs::path art_dir = config_.artifact_root / sanitize(pc.test_case.suite) /
                                     sanitize(pc.test_case.id) / variant_dir(slot.variant);
            std::string diag = slot.engine_diag;
            for (std::size_t i = 0; i < co.results.size(); ++i) {
                if (!slot.diags[i].empty()) {
                    (void)write_text(art_dir / (sanitize(co.results[i].implementation) + ".diag.txt"),
                                     slot.diags[i], diag);
                }
                diag += describe(co.results[i]);
            }
            diag += "outcome: " + std::string{to_string(co.outcome.status)};
            if (!co.outcome.message.empty()) diag += " " + co.outcome.message;
            diag += "\n";
            (void)write_text(art_dir / "engine_diag.txt", diag, diag);
        }

        record.outcomes.push_back(std::move(co));
    }

    return record;
}

}  // namespace swhid::conformance
