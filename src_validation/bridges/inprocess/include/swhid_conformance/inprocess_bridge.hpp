#pragma once

#include <functional>
#include <string>

#include "swhid_conformance/implementation.hpp"

namespace swhid::conformance::inprocess_bridge
{

/// Computes the identifier text for a request, or throws ComputeFailure.
using ComputeFn = std::function<std::string(const ComputeRequest&)>;

/**
 * In-process implementation.
 *
 * The callable runs in a forked child under the same sandbox as external processes, so a
 * runaway or crashing implementation cannot take the engine down. The identifier text is
 * framed exactly like the plain process protocol; a ComputeFailure travels back as a typed
 * error with its kind and message.
 *
 * The engine forks from its worker threads while sibling invocations are running. The child
 * inherits only the forking thread, so any lock another thread held at fork time (a mutex of
 * the implementation itself, iostream or locale state) stays locked forever in the child.
 * Callables must not take locks shared with other threads, and should avoid std::cout and
 * std::locale; the global allocator is safe. A child blocked on such a lock is reported as
 * TIMEOUT once the wall-clock limit expires. Register the implementation with a short
 * wall_clock override, or run with --parallel 1, when that cannot be ruled out.
 */
class Session : public Implementation
{
public:
    struct Config
    {
        ImplementationInfo info;
        CapabilityDescriptor capabilities;
        ComputeFn compute;
        LimitOverrides limits;
    };

    explicit Session(Config cfg);

    [[nodiscard]] const ImplementationInfo& info() const noexcept override { return cfg_.info; }
    [[nodiscard]] const CapabilityDescriptor& capabilities() const noexcept override { return cfg_.capabilities; }

    [[nodiscard]] bool available(std::string& diag_out) const override;

    [[nodiscard]] RawOutcome compute(const ComputeRequest& request,
                                     const SandboxLimits& limits,
                                     std::string& diag_out) const override;

private:
    Config cfg_;
};

} // namespace swhid::conformance::inprocess_bridge
