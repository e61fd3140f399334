#include "swhid_conformance/capability.hpp"

namespace swhid::conformance {

std::optional<std::string> skip_reason(const CapabilityDescriptor& caps, const CapabilityQuery& query) {
    if (!caps.supports(query.type)) {
        return "object type '" + std::string{type_code(query.type)} + "' not supported";
    }
    if (!caps.supports(query.variant)) {
        return "variant " + to_string(query.variant) + " not supported";
    }
    for (const auto& kind : query.qualifiers) {
        if (caps.qualifiers.count(kind) == 0) {
            return "qualifier '" + kind + "' not supported";
        }
    }
    if (caps.max_payload_bytes != 0 && query.payload_bytes &&
        *query.payload_bytes > caps.max_payload_bytes) {
        return "payload of " + std::to_string(*query.payload_bytes) + " bytes exceeds limit of " +
               std::to_string(caps.max_payload_bytes);
    }
    return std::nullopt;
}

}  // namespace swhid::conformance
