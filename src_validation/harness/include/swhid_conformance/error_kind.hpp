#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace swhid::conformance {

/**
 * \brief Closed set of failure kinds used uniformly across the engine.
 *
 * The declaration order is the classification precedence: when several rules could apply,
 * the earliest kind wins. MismatchError is only ever assigned by the consensus engine.
 */
enum class ErrorKind {
    ParseError,
    NormalizeError,
    ValidationError,
    ComputeError,
    Timeout,
    ResourceLimit,
    IoError,
    MismatchError,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Accepts the canonical upper-case code (e.g. `COMPUTE_ERROR`); returns nullopt otherwise.
[[nodiscard]] std::optional<ErrorKind> error_kind_from_string(std::string_view code);

struct ErrorInfo {
    ErrorKind kind{ErrorKind::IoError};
    std::string subtype;  ///< Short machine tag, e.g. `launch_failed`, `bad_escape`
    std::string message;  ///< Human readable diagnostics
};

/**
 * \brief Raised by in-process implementations to report a typed failure.
 *
 * Only the kinds an implementation may legitimately claim are accepted by the classifier
 * (parse, normalize, validation and compute); anything else is degraded to COMPUTE_ERROR.
 */
class ComputeFailure : public std::runtime_error {
public:
    explicit ComputeFailure(const std::string& message, ErrorKind kind = ErrorKind::ComputeError)
        : std::runtime_error(message), kind_{kind} {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace swhid::conformance
