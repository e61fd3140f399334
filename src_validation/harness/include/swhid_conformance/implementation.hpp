#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "capability.hpp"
#include "identifier.hpp"
#include "sandbox.hpp"

namespace swhid::conformance {

struct ImplementationInfo {
    std::string name;
    std::string version;
    std::string language;
    std::string kind;  ///< `process` or `inprocess`
    std::string description;
};

/**
 * \brief One invocation's input, identical for every implementation of a case.
 *
 * Symbolic references have already been resolved: `commit` is a full object id and
 * `tag_id` is the id of the annotated tag object named by `tag`.
 */
struct ComputeRequest {
    std::filesystem::path payload;
    ObjectType type{ObjectType::Content};
    Variant variant{kV1Sha1Hex};
    std::string commit;
    std::string tag;
    std::string tag_id;
};

/// Per-implementation adjustments layered on top of the run-wide limits.
struct LimitOverrides {
    std::optional<std::chrono::milliseconds> wall_clock;
    std::optional<int> cpu_seconds;
    std::optional<std::uint64_t> memory_bytes;
    std::optional<bool> enforce_address_space;

    [[nodiscard]] SandboxLimits apply(SandboxLimits base) const {
        if (wall_clock) base.wall_clock = *wall_clock;
        if (cpu_seconds) base.cpu_seconds = *cpu_seconds;
        if (memory_bytes) base.memory_bytes = *memory_bytes;
        if (enforce_address_space) base.enforce_address_space = *enforce_address_space;
        return base;
    }
};

/**
 * \brief Closed plugin interface shared by in-process and external-process implementations.
 *
 * compute() must not throw for failures of the implementation itself; they are returned as
 * a RawOutcome and classified by the engine.
 */
class Implementation {
public:
    virtual ~Implementation() = default;

    [[nodiscard]] virtual const ImplementationInfo& info() const noexcept = 0;
    [[nodiscard]] virtual const CapabilityDescriptor& capabilities() const noexcept = 0;

    /// True when the implementation can be launched at all. Diagnostics appended to diag.
    [[nodiscard]] virtual bool available(std::string& diag) const = 0;

    [[nodiscard]] virtual RawOutcome compute(const ComputeRequest& request,
                                             const SandboxLimits& limits,
                                             std::string& diag) const = 0;
};

enum class WireProtocol {
    Plain,  ///< one identifier line on stdout
    Json,   ///< JSON request on stdin, JSON response on stdout
};

enum class PayloadInput {
    Path,   ///< payload path substituted into the argument template
    Stdin,  ///< payload bytes streamed on stdin
};

/**
 * \brief Declarative description of an external implementation, as read from a `.impl` file.
 */
struct ImplementationManifest {
    ImplementationInfo info;
    CapabilityDescriptor capabilities;
    std::string command;
    std::vector<std::string> args;   ///< template with `{payload}`, `{type}`, ... placeholders
    std::vector<std::string> probe;  ///< optional availability probe arguments
    WireProtocol protocol{WireProtocol::Plain};
    PayloadInput input{PayloadInput::Path};
    std::map<std::string, std::string> env;
    LimitOverrides limits;
    std::filesystem::path source_file;
};

}  // namespace swhid::conformance
