#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "identifier.hpp"

namespace swhid::conformance {

/**
 * \brief Declarative description of what an implementation supports.
 *
 * Declared once at discovery and consulted before every invocation. A mismatch yields a Skip
 * result carrying the reason returned by skip_reason(), never a failure.
 */
struct CapabilityDescriptor {
    std::set<ObjectType> types;
    std::set<Variant> variants;
    std::set<std::string> qualifiers;     ///< Qualifier kinds the implementation can emit
    std::uint64_t max_payload_bytes{0};   ///< 0 = unlimited
    std::string api_version{"1.0"};
    bool supports_unicode{true};
    bool supports_percent_encoding{true};

    [[nodiscard]] bool supports(ObjectType type) const noexcept { return types.count(type) != 0; }
    [[nodiscard]] bool supports(const Variant& variant) const noexcept { return variants.count(variant) != 0; }
};

/// What the engine is about to ask; `payload_bytes` is unknown for unresolved payloads.
struct CapabilityQuery {
    ObjectType type{ObjectType::Content};
    Variant variant{kV1Sha1Hex};
    std::vector<std::string> qualifiers;
    std::optional<std::uint64_t> payload_bytes;
};

/// Returns the reason the invocation must be skipped, or nullopt when it may run.
[[nodiscard]] std::optional<std::string> skip_reason(const CapabilityDescriptor& caps,
                                                     const CapabilityQuery& query);

}  // namespace swhid::conformance
