#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "classifier.hpp"
#include "consensus.hpp"
#include "registry.hpp"
#include "sandbox.hpp"
#include "test_case.hpp"

namespace swhid::conformance {

struct CaseOutcome {
    TestCase test_case;
    Variant variant{kV1Sha1Hex};
    std::string payload_ref;      ///< payload as written in the case file
    std::vector<Result> results;  ///< one per registered implementation, registry order
    Outcome outcome;
};

struct ImplementationRecord {
    ImplementationInfo info;
    CapabilityDescriptor capabilities;
    bool available{false};
};

struct RunRecord {
    std::string run_id;
    std::string created_at;  ///< ISO 8601, UTC
    std::vector<ImplementationRecord> implementations;
    std::vector<CaseOutcome> outcomes;
};

/**
 * \brief Schedules every (case, variant, implementation) invocation and aggregates verdicts.
 *
 * A run happens in three phases:
 *  1. Preparation (sequential): payloads are resolved and archives extracted, repository
 *     references are pinned to full object ids, branch/tag discovery expands cases, and every
 *     implementation is probed for availability once.
 *  2. Execution: capability mismatches and unavailable implementations are settled without
 *     running anything; the remaining invocations are pulled by at most `max_parallel` worker
 *     threads from a shared cursor. A timeout or crash only affects its own invocation.
 *  3. Comparison: after all workers have joined, each (case, variant) gets one Outcome.
 *
 * When `artifact_root` is set, per-invocation transcripts are written to
 * `<root>/<suite>/<case>/<variant>/<implementation>.diag.txt` plus one `engine_diag.txt` per
 * case and variant.
 */
class Engine {
public:
    struct Config {
        std::filesystem::path artifact_root{};
        std::vector<Variant> variants{kV1Sha1Hex};
        std::size_t max_parallel{4};  ///< clamped to [1, 32]
        SandboxLimits limits{};
        std::filesystem::path work_dir{};  ///< parent of extracted archives (default: system temp)
        std::string git_exe{"git"};
        std::string tar_exe{"tar"};
    };

    explicit Engine(Config config);

    [[nodiscard]] RunRecord run(const std::vector<CasePack>& packs, const Registry& registry) const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    Config config_;
};

}  // namespace swhid::conformance
