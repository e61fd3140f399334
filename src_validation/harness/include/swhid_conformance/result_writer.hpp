#pragma once

#include "engine.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace swhid::conformance {

inline constexpr const char* kSchemaVersion = "1.0.0";

struct ImplementationTally {
    std::size_t passed{0};  ///< attempted and not blamed
    std::size_t failed{0};
    std::size_t skipped{0};
    std::size_t unavailable{0};
};

struct RunTotals {
    std::size_t cases{0};
    std::size_t failures{0};  ///< outcomes for which is_failure() holds
    std::map<std::string, std::size_t> by_status;
    std::map<std::string, ImplementationTally> by_implementation;
};

/// Aggregate counts over a run; every registered implementation appears, even with zero counts.
[[nodiscard]] RunTotals tally(const RunRecord& record);

/**
 * \brief Emits the canonical, versioned result record of a run.
 *
 * The document carries `schema_version`, the run id and timestamp, every implementation with
 * its capability metadata and availability, one entry per (case, variant) with every
 * implementation's result and the consensus outcome, and aggregate counts. Text that is not
 * valid UTF-8 (an implementation printing arbitrary bytes) is written with U+FFFD
 * replacement characters.
 */
class ResultWriter {
public:
    ResultWriter() = default;

    [[nodiscard]] std::string render(const RunRecord& record) const;

    /// Throws std::runtime_error when the destination cannot be written.
    void write_summary(const std::filesystem::path& destination, const RunRecord& record) const;
};

}  // namespace swhid::conformance
