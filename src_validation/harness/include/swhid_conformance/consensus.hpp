#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "classifier.hpp"
#include "error_kind.hpp"
#include "identifier.hpp"

namespace swhid::conformance {

enum class CaseStatus {
    Conformant,    ///< golden value present and every attempted implementation produced it
    Fail,          ///< golden value present and someone diverged, or a negative case failed
    Agreement,     ///< no golden value, every attempted implementation in one group
    Disagreement,  ///< no golden value, more than one group or failures
    Pass,          ///< negative case: everyone failed with the documented kind
    Skipped,       ///< nothing attempted, every implementation skipped
    Error,         ///< nothing attempted and at least one implementation was unavailable
};

[[nodiscard]] std::string_view to_string(CaseStatus status) noexcept;

/// True for the statuses that count as a regression in aggregate statistics.
[[nodiscard]] bool is_failure(CaseStatus status) noexcept;

/**
 * \brief What a case is documented to produce for one variant.
 *
 * `golden` and `expected_error` are mutually exclusive; both empty means "compare the
 * implementations with each other only".
 */
struct Expectation {
    std::optional<NormalizedIdentifier> golden;
    std::optional<ErrorKind> expected_error;
};

struct AgreementGroup {
    std::string swhid;  ///< canonical text of the shared identifier
    NormalizedIdentifier identifier;
    std::vector<std::string> members;
};

struct Blame {
    std::string implementation;
    ErrorKind kind{ErrorKind::MismatchError};
    std::string subtype;
    std::string message;
};

struct Outcome {
    CaseStatus status{CaseStatus::Skipped};
    std::optional<std::string> consensus;
    std::vector<AgreementGroup> groups;
    std::optional<std::string> expected;
    std::optional<bool> expected_matched;
    std::vector<Blame> blame;
    std::vector<std::string> skipped;
    std::vector<std::string> unavailable;
    std::string message;
};

/**
 * \brief Turns every Result of one (case, variant) into a single verdict.
 *
 * Only Pass and Fail results take part ("attempted"). Pass results are partitioned into
 * agreement groups by structural identifier equality, in first-seen order. The majority is
 * the unique largest group; a tie has no winner and blames every attempted implementation.
 */
[[nodiscard]] Outcome compare(const std::vector<Result>& results, const Expectation& expectation);

}  // namespace swhid::conformance
