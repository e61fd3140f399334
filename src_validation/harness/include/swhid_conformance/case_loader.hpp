#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "implementation.hpp"
#include "test_case.hpp"

namespace swhid::conformance {

/**
 * \brief Loads declarative test cases from disk.
 *
 * The loader understands a lightweight line-oriented syntax that is easy to author by hand
 * and friendly to version control. Each file is composed of one or more case blocks
 * separated by a line containing three dashes (`---`). Within a block, key/value pairs take
 * the form `key=value` with leading/trailing whitespace ignored.
 *
 * Recognised keys:
 *   - `suite`: Optional logical grouping name. Falls back to the file stem.
 *   - `id`: Optional case identifier. Falls back to `<file-stem>#<index>`.
 *   - `path`: Payload file, directory, archive or repository (relative to the case file).
 *   - `type`: Object type, either the wire tag (`cnt`) or the long name (`content`).
 *   - `expected.<variant>`: Golden identifier for a variant, e.g. `expected.v1/sha1/hex`.
 *   - `expected_swhid` / `expected_swhid_sha256`: Aliases for v1/sha1/hex and v2/sha256/hex.
 *   - `expected_error`: Error kind every implementation must fail with (negative case).
 *   - `commit`, `tag`: Symbolic references resolved inside a repository payload.
 *   - `discover_branches`, `discover_tags`: Expand the case into one sub-case per branch or
 *     annotated tag, with golden values from `expected.branch.<name>` / `expected.tag.<name>`.
 *   - `attr.<name>`: Arbitrary attribute carried into the result record.
 *
 * Example:
 * \code{.txt}
 * suite=content
 * id=hello
 * path=payloads/content/hello.txt
 * type=cnt
 * expected.v1/sha1/hex=swh:1:cnt:3b18e512dba79e4c8300dd08aeb37f8e728b8dad
 * ---
 * id=missing_file
 * path=payloads/content/does_not_exist
 * expected_error=COMPUTE_ERROR
 * \endcode
 *
 * Lines starting with `#` or empty lines are ignored. Unknown keys are preserved as generic
 * attributes. Golden values must be canonical identifiers of the variant they are filed
 * under; violations are reported with `file:line` context.
 */
class CaseLoader {
public:
    CaseLoader() = default;

    [[nodiscard]] CasePack load(const std::filesystem::path& file) const;

    /// Loads every `*.scn` file below root (sorted), or root itself when it is a file.
    [[nodiscard]] std::vector<CasePack> load_directory(const std::filesystem::path& root) const;
};

/**
 * \brief Loads external implementation manifests (`*.impl`).
 *
 * Same block syntax as CaseLoader. Keys: `name`, `version`, `language`, `description`,
 * `command`, `arg` (repeatable, in order), `probe` (repeatable), `protocol` (`plain|json`),
 * `input` (`path|stdin`), `env.<NAME>`, `types`, `variants`, `qualifiers` (comma lists),
 * `max_payload_size_mb`, `api_version`, `supports_unicode`, `supports_percent_encoding`,
 * `timeout_ms`, `cpu_seconds`, `memory_mb`, `enforce_address_space`.
 */
class ImplementationLoader {
public:
    ImplementationLoader() = default;

    [[nodiscard]] std::vector<ImplementationManifest> load(const std::filesystem::path& file) const;

    [[nodiscard]] std::vector<ImplementationManifest> load_directory(const std::filesystem::path& root) const;
};

/**
 * \brief Golden values kept outside the case files.
 *
 * JSON layout:
 * \code{.json}
 * {"cases": {"<case id>": {"v1/sha1/hex": "swh:1:..."}},
 *  "references": {"<case id>": {"branches": {"main": "swh:1:rev:..."},
 *                               "tags": {"v1.0": "swh:1:rel:..."}}}}
 * \endcode
 */
struct GoldenValues {
    std::map<std::string, std::map<Variant, std::string>> cases;
    std::map<std::string, std::map<std::string, std::string>> branches;
    std::map<std::string, std::map<std::string, std::string>> tags;

    /// Overlays the values onto matching cases; returns the ids that matched no case.
    std::vector<std::string> apply(std::vector<CasePack>& packs) const;
};

[[nodiscard]] GoldenValues load_golden_values(const std::filesystem::path& file);

}  // namespace swhid::conformance
