#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "swhid_conformance/implementation.hpp"

namespace swhid::conformance::process_bridge
{

/**
 * External-process implementation.
 *
 * Wraps any executable that honours one of the two wire protocols:
 *  - plain: arguments from the manifest template, payload as a path argument or raw bytes on
 *    stdin, exactly one identifier line on stdout, exit 0. Failures exit non-zero with a
 *    diagnostic on stderr.
 *  - json: the request is a single JSON object on stdin; the response is a JSON object on
 *    stdout carrying either the identifier or a typed error code.
 *
 * The child runs with a clean environment: PATH, HOME and the locale variables of the engine,
 * plus the manifest's `env.*` entries. Payload bytes are never transcoded.
 *
 * Argument placeholders:
 *  - {payload}  resolved payload path
 *  - {type}     long object type name (content, directory, ...)
 *  - {object}   wire object tag (cnt, dir, ...)
 *  - {version}  identifier version (1, 2)
 *  - {hash}     hash algorithm (sha1, sha256)
 *  - {encoding} hash text encoding (hex, base64, base85, base32)
 *  - {variant}  full variant tag (v1/sha1/hex)
 *  - {commit}, {tag}, {tag_id}  resolved repository references
 *  - {impl_dir} directory holding the manifest, for helper scripts shipped beside it
 */
class Session : public Implementation
{
public:
    struct Config
    {
        ImplementationManifest manifest;

        // Working directory of the child (empty = the payload's parent directory).
        std::filesystem::path work_dir;
    };

    explicit Session(Config cfg);

    [[nodiscard]] const ImplementationInfo& info() const noexcept override { return cfg_.manifest.info; }
    [[nodiscard]] const CapabilityDescriptor& capabilities() const noexcept override
    {
        return cfg_.manifest.capabilities;
    }

    /**
     * The command must resolve on the child's PATH; when the manifest declares probe
     * arguments, running the command with them must exit zero within ten seconds.
     */
    [[nodiscard]] bool available(std::string& diag_out) const override;

    [[nodiscard]] RawOutcome compute(const ComputeRequest& request,
                                     const SandboxLimits& limits,
                                     std::string& diag_out) const override;

    /// Argument vector for a request, placeholders substituted.
    [[nodiscard]] std::vector<std::string> render_args(const ComputeRequest& request) const;

    /// Environment handed to the child.
    [[nodiscard]] const std::map<std::string, std::string>& environment() const noexcept { return env_; }

private:
    Config cfg_;
    std::map<std::string, std::string> env_;
    std::filesystem::path impl_dir_;
};

} // namespace swhid::conformance::process_bridge
