#include <algorithm>
#include <cctype>
#include <cstdint>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "swhid_conformance/case_loader.hpp"
#include "swhid_conformance/engine.hpp"
#include "swhid_conformance/process_bridge.hpp"
#include "swhid_conformance/registry.hpp"
#include "swhid_conformance/result_writer.hpp"

using swhid::conformance::CaseLoader;
using swhid::conformance::CasePack;
using swhid::conformance::Engine;
using swhid::conformance::ImplementationLoader;
using swhid::conformance::Registry;
using swhid::conformance::ResultWriter;
using swhid::conformance::RunRecord;
using swhid::conformance::Variant;

namespace {

struct Args {
    std::vector<std::filesystem::path> case_paths;
    std::vector<std::filesystem::path> impl_paths;
    std::filesystem::path golden_path{};
    std::set<std::string> impl_filter;
    std::vector<Variant> variants;
    std::size_t parallel{4};
    std::optional<std::uint64_t> timeout_ms;
    std::optional<std::uint64_t> cpu_seconds;
    std::optional<std::uint64_t> memory_mb;
    std::filesystem::path artifact_root{"build/conformance"};
    std::filesystem::path summary_path{};
    bool write_transcripts{true};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "SWHID Differential Conformance CLI\n"
        << "Usage:\n"
        << "  " << argv0 << " --cases <file-or-dir> [--cases ...] --impls <file-or-dir> [--impls ...]\n"
        << "                 [--golden <json>] [--impl <name> ...] [--variant <tag> ...]\n"
        << "                 [--parallel N] [--timeout-ms N] [--cpu-seconds N] [--memory-mb N]\n"
        << "                 [--artifact-dir <dir>] [--summary <path>] [--ci]\n"
        << "\n"
        << "Options:\n"
        << "  --cases        Case files or directories (line-oriented *.scn).\n"
        << "  --impls        Implementation manifests or directories (*.impl).\n"
        << "  --golden       JSON file with golden identifiers, overlaid onto the cases.\n"
        << "  --impl         Only run the named implementation (repeatable).\n"
        << "  --variant      Variant to exercise, e.g. v1/sha1/hex (repeatable, default v1/sha1/hex).\n"
        << "  --parallel     Concurrent invocations (default 4, clamped to 1..32).\n"
        << "  --timeout-ms   Wall-clock limit per invocation (default 30000).\n"
        << "  --cpu-seconds  CPU limit per invocation (default 60, 0 = none).\n"
        << "  --memory-mb    Memory limit per invocation (default 500, 0 = none).\n"
        << "  --artifact-dir Root directory for outputs (default: build/conformance).\n"
        << "  --summary      Write the JSON result record here (default: <artifact-dir>/results.json).\n"
        << "  --ci           CI mode: JSON record only, no per-invocation transcripts.\n"
        << "  -h, --help     Show this help message.\n"
        << "\n"
        << "Defaults: cases from src_validation/resources/suites, implementations from\n"
        << "src_validation/resources/impls.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

std::uint64_t parse_count(std::string_view flag, const std::string& raw) {
    if (raw.empty() || !std::all_of(raw.begin(), raw.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::runtime_error(std::string{flag} + " expects a non-negative integer, got '" + raw + "'");
    }
    try {
        return std::stoull(raw);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(std::string{flag} + " value out of range: " + raw);
    }
}

std::filesystem::path default_root(const char* relative, const char* what) {
    const std::filesystem::path root{relative};
    if (!std::filesystem::is_directory(root)) {
        throw std::runtime_error(std::string{"No "} + what + " specified and " + relative + " does not exist");
    }
    return root;
}

Args parse_args(int argc, char** argv) {
    Args args;
    auto value = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(std::string{flag} + " expects a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--cases")) {
            args.case_paths.emplace_back(value(i, tok));
        } else if (arg_eq(tok, "--impls")) {
            args.impl_paths.emplace_back(value(i, tok));
        } else if (arg_eq(tok, "--golden")) {
            args.golden_path = value(i, tok);
        } else if (arg_eq(tok, "--impl")) {
            args.impl_filter.insert(value(i, tok));
        } else if (arg_eq(tok, "--variant")) {
            const auto tag = value(i, tok);
            const auto variant = swhid::conformance::parse_variant_tag(tag);
            if (!variant) {
                throw std::runtime_error("Unknown variant '" + tag + "'");
            }
            if (std::find(args.variants.begin(), args.variants.end(), *variant) == args.variants.end()) {
                args.variants.push_back(*variant);
            }
        } else if (arg_eq(tok, "--parallel")) {
            args.parallel = static_cast<std::size_t>(parse_count(tok, value(i, tok)));
        } else if (arg_eq(tok, "--timeout-ms")) {
            args.timeout_ms = parse_count(tok, value(i, tok));
        } else if (arg_eq(tok, "--cpu-seconds")) {
            args.cpu_seconds = parse_count(tok, value(i, tok));
        } else if (arg_eq(tok, "--memory-mb")) {
            args.memory_mb = parse_count(tok, value(i, tok));
        } else if (arg_eq(tok, "--artifact-dir")) {
            args.artifact_root = std::filesystem::path(value(i, tok));
        } else if (arg_eq(tok, "--summary")) {
            args.summary_path = std::filesystem::path(value(i, tok));
        } else if (arg_eq(tok, "--ci")) {
            args.write_transcripts = false;
        } else {
            // Treat as case path for convenience
            args.case_paths.emplace_back(std::string(tok));
        }
    }
    if (args.help) {
        return args;
    }

    if (args.case_paths.empty()) {
        args.case_paths.push_back(default_root("src_validation/resources/suites", "cases"));
    }
    if (args.impl_paths.empty()) {
        args.impl_paths.push_back(default_root("src_validation/resources/impls", "implementations"));
    }
    if (args.variants.empty()) {
        args.variants.push_back(swhid::conformance::kV1Sha1Hex);
    }
    if (args.summary_path.empty()) {
        args.summary_path = args.artifact_root / "results.json";
    }
    return args;
}

Engine::Config engine_config(const Args& args) {
    Engine::Config cfg;
    cfg.variants = args.variants;
    cfg.max_parallel = args.parallel;
    if (args.timeout_ms) cfg.limits.wall_clock = std::chrono::milliseconds(static_cast<std::int64_t>(*args.timeout_ms));
    if (args.cpu_seconds) cfg.limits.cpu_seconds = static_cast<int>(*args.cpu_seconds);
    if (args.memory_mb) cfg.limits.memory_bytes = *args.memory_mb * 1024 * 1024;
    if (args.write_transcripts) {
        cfg.artifact_root = args.artifact_root;
    }
    return cfg;
}

void print_summary(const RunRecord& record, const Args& args) {
    const auto totals = swhid::conformance::tally(record);

    std::cout << "SWHID Conformance (" << record.run_id << ")\n"
              << "  Cases: " << totals.cases << "\n ";
    for (const auto& [status, count] : totals.by_status) {
        std::cout << " " << status << ": " << count;
    }
    std::cout << "\nImplementations:\n";
    for (const auto& impl : record.implementations) {
        const auto it = totals.by_implementation.find(impl.info.name);
        if (it == totals.by_implementation.end()) continue;
        const auto& t = it->second;
        std::cout << "  " << impl.info.name << (impl.available ? "" : " (unavailable)")
                  << "  passed: " << t.passed << "  failed: " << t.failed
                  << "  skipped: " << t.skipped << "  unavailable: " << t.unavailable << "\n";
    }

    bool header = false;
    for (const auto& co : record.outcomes) {
        if (!swhid::conformance::is_failure(co.outcome.status)) continue;
        if (!header) {
            std::cout << "Failures:\n";
            header = true;
        }
        std::cout << "  " << co.test_case.id << " [" << swhid::conformance::to_string(co.variant) << "] "
                  << swhid::conformance::to_string(co.outcome.status) << ": " << co.outcome.message << "\n";
    }

    std::cout << "Artifacts:\n"
              << "  JSON: " << args.summary_path << "\n";
    if (args.write_transcripts) {
        std::cout << "  Transcripts: " << args.artifact_root << "\n";
    }
}

int aggregate_exit_code(const RunRecord& record) {
    for (const auto& co : record.outcomes) {
        if (swhid::conformance::is_failure(co.outcome.status)) return 1;
    }
    return 0; // conformant, agreeing, passing or skipped only
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        // Load cases (each file yields a pack)
        CaseLoader case_loader;
        std::vector<CasePack> packs;
        for (const auto& path : args.case_paths) {
            auto loaded = case_loader.load_directory(path);
            packs.insert(packs.end(),
                         std::make_move_iterator(loaded.begin()),
                         std::make_move_iterator(loaded.end()));
        }

        if (!args.golden_path.empty()) {
            const auto golden = swhid::conformance::load_golden_values(args.golden_path);
            for (const auto& id : golden.apply(packs)) {
                std::cerr << "WARNING: golden values for unknown case '" << id << "'\n";
            }
        }

        // Explicit registry, built once from the manifests
        ImplementationLoader impl_loader;
        Registry registry;
        for (const auto& path : args.impl_paths) {
            for (auto& manifest : impl_loader.load_directory(path)) {
                swhid::conformance::process_bridge::Session::Config cfg;
                cfg.manifest = std::move(manifest);
                registry.add(std::make_unique<swhid::conformance::process_bridge::Session>(std::move(cfg)));
            }
        }
        if (!args.impl_filter.empty()) {
            registry.retain(args.impl_filter);
        }
        if (registry.empty()) {
            throw std::runtime_error("No implementations registered");
        }

        const auto cfg = engine_config(args);
        if (!cfg.artifact_root.empty()) {
            std::filesystem::create_directories(cfg.artifact_root);
        }
        Engine engine(cfg);
        const auto record = engine.run(packs, registry);

        ResultWriter writer;
        writer.write_summary(args.summary_path, record);

        print_summary(record, args);
        return aggregate_exit_code(record);
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2; // configuration/environment issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}
