#include "swhid_conformance/error_kind.hpp"

#include <array>
#include <utility>

namespace swhid::conformance {

namespace {

constexpr std::array<std::pair<ErrorKind, std::string_view>, 8> kCodes{{
    {ErrorKind::ParseError, "PARSE_ERROR"},
    {ErrorKind::NormalizeError, "NORMALIZE_ERROR"},
    {ErrorKind::ValidationError, "VALIDATION_ERROR"},
    {ErrorKind::ComputeError, "COMPUTE_ERROR"},
    {ErrorKind::Timeout, "TIMEOUT"},
    {ErrorKind::ResourceLimit, "RESOURCE_LIMIT"},
    {ErrorKind::IoError, "IO_ERROR"},
    {ErrorKind::MismatchError, "MISMATCH_ERROR"},
}};

}  // namespace

std::string_view to_string(ErrorKind kind) noexcept {
    for (const auto& [k, code] : kCodes) {
        if (k == kind) {
            return code;
        }
    }
    return "IO_ERROR";
}

std::optional<ErrorKind> error_kind_from_string(std::string_view code) {
    for (const auto& [k, name] : kCodes) {
        if (name == code) {
            return k;
        }
    }
    return std::nullopt;
}

}  // namespace swhid::conformance
