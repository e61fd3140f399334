#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "error_kind.hpp"
#include "identifier.hpp"
#include "implementation.hpp"
#include "sandbox.hpp"

namespace swhid::conformance {

enum class ResultStatus {
    Pass,   ///< a canonical, valid identifier was produced
    Fail,   ///< the implementation ran and failed
    Skip,   ///< capability mismatch; not attempted
    Error,  ///< the implementation could not be attempted (unavailable, unresolvable payload)
};

[[nodiscard]] std::string_view to_string(ResultStatus status) noexcept;

/**
 * \brief One implementation's verdict for one (case, variant).
 */
struct Result {
    std::string implementation;
    ResultStatus status{ResultStatus::Error};
    std::optional<std::string> swhid;  ///< text as returned, when any
    std::optional<NormalizedIdentifier> identifier;
    std::optional<ErrorInfo> error;
    Usage usage;
    std::string skip_reason;
};

/**
 * \brief Maps a raw sandbox outcome to a Result, first matching rule wins.
 *
 * Success output is parsed: grammar failure -> PARSE_ERROR, canonical-form violation ->
 * NORMALIZE_ERROR, semantic issue or a variant/type other than the requested one ->
 * VALIDATION_ERROR. Implementation-reported failures keep their reported kind (defaulting to
 * COMPUTE_ERROR); a regular non-zero exit with diagnostics is COMPUTE_ERROR. Timeouts and
 * limit trips map to TIMEOUT and RESOURCE_LIMIT. Launch failures, signals, silent non-zero
 * exits (including 126/127) and broken framing are IO_ERROR; a launch failure additionally
 * yields status Error.
 */
[[nodiscard]] Result classify(const std::string& implementation, const RawOutcome& raw,
                              const ComputeRequest& request);

[[nodiscard]] Result make_skip(const std::string& implementation, std::string reason);

[[nodiscard]] Result make_unavailable(const std::string& implementation, std::string subtype,
                                      std::string message);

}  // namespace swhid::conformance
