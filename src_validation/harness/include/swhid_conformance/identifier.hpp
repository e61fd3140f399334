#pragma once

#include <array>
#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error_kind.hpp"
#include "hash_codec.hpp"

namespace swhid::conformance {

enum class ObjectType {
    Content,
    Directory,
    Revision,
    Release,
    Snapshot,
};

inline constexpr std::array<ObjectType, 5> kAllObjectTypes{
    ObjectType::Content, ObjectType::Directory, ObjectType::Revision,
    ObjectType::Release, ObjectType::Snapshot,
};

/// Three-letter wire tag (`cnt`, `dir`, `rev`, `rel`, `snp`).
[[nodiscard]] std::string_view type_code(ObjectType type) noexcept;
/// Long name (`content`, `directory`, ...), used by external command lines.
[[nodiscard]] std::string_view type_name(ObjectType type) noexcept;
/// Accepts either the wire tag or the long name, lower-case only.
[[nodiscard]] std::optional<ObjectType> object_type_from_string(std::string_view text);

enum class HashAlgorithm {
    Sha1,
    Sha256,
};

[[nodiscard]] std::string_view to_string(HashAlgorithm algorithm) noexcept;
[[nodiscard]] std::string_view to_string(HashEncoding encoding) noexcept;

/// Digest size in bytes of the algorithm.
[[nodiscard]] std::size_t digest_size(HashAlgorithm algorithm) noexcept;

/**
 * \brief {version, hash algorithm, text encoding} triple an identifier belongs to.
 *
 * Version 0 denotes the explicit unknown variant returned by detect_variant() when the hash
 * text does not match any row of the detection table.
 */
struct Variant {
    int version{0};
    HashAlgorithm algorithm{HashAlgorithm::Sha1};
    HashEncoding encoding{HashEncoding::Hex};

    [[nodiscard]] static constexpr Variant unknown() noexcept { return Variant{}; }
    [[nodiscard]] constexpr bool known() const noexcept { return version != 0; }

    auto operator<=>(const Variant&) const = default;
};

inline constexpr Variant kV1Sha1Hex{1, HashAlgorithm::Sha1, HashEncoding::Hex};
inline constexpr Variant kV2Sha256Hex{2, HashAlgorithm::Sha256, HashEncoding::Hex};
inline constexpr Variant kV2Sha256Base64{2, HashAlgorithm::Sha256, HashEncoding::Base64};
inline constexpr Variant kV2Sha256Base85{2, HashAlgorithm::Sha256, HashEncoding::Base85};
inline constexpr Variant kV2Sha256Base32{2, HashAlgorithm::Sha256, HashEncoding::Base32};

inline constexpr std::array<Variant, 5> kKnownVariants{
    kV1Sha1Hex, kV2Sha256Hex, kV2Sha256Base64, kV2Sha256Base85, kV2Sha256Base32,
};

/// Tag form `v1/sha1/hex`; the unknown variant renders as `unknown`.
[[nodiscard]] std::string to_string(const Variant& variant);
/// Parses a tag produced by to_string(); only the known variants are accepted.
[[nodiscard]] std::optional<Variant> parse_variant_tag(std::string_view tag);

/**
 * \brief Infers the variant from the textual hash field.
 *
 * Text length and alphabet are checked against the fixed table:
 *   - 40 hex characters          -> v1/sha1/hex (wins over base85 when both alphabets match)
 *   - 64 hex characters          -> v2/sha256/hex
 *   - 44 base64 with padding     -> v2/sha256/base64
 *   - 40 Z85 characters          -> v2/sha256/base85
 *   - 52 base32 characters       -> v2/sha256/base32
 * Anything else yields Variant::unknown().
 */
[[nodiscard]] Variant detect_variant(std::string_view hash_text);

struct Qualifier {
    std::string key;
    std::string value;  ///< Raw bytes after a single percent-decoding pass

    bool operator==(const Qualifier&) const = default;
};

/// Canonical qualifier order; keys outside this list are unknown.
inline constexpr std::array<std::string_view, 6> kQualifierOrder{
    "origin", "visit", "anchor", "path", "lines", "bytes",
};

/**
 * \brief Structural form of an identifier.
 *
 * Qualifier values are byte strings and are never case-folded or Unicode-normalised, so
 * NFC and NFD spellings of the same path compare unequal.
 */
struct NormalizedIdentifier {
    std::string scheme{"swh"};
    int version{1};
    ObjectType type{ObjectType::Content};
    HashBytes hash;
    Variant variant{};
    std::vector<Qualifier> qualifiers;

    [[nodiscard]] const std::string* qualifier(std::string_view key) const noexcept;

    /// Identity over scheme, version, type, hash bytes and the qualifier sequence.
    [[nodiscard]] bool operator==(const NormalizedIdentifier& other) const noexcept;
};

struct ParseIssue {
    ErrorKind kind{ErrorKind::ParseError};
    std::string subtype;
    std::string message;
};

/**
 * \brief Result of parse(): the structure (when recoverable) plus every canonical-form issue.
 *
 * A grammar failure leaves `identifier` empty and records a PARSE_ERROR issue. Canonical-form
 * violations are recorded as NORMALIZE_ERROR issues; the identifier is still populated when
 * the type and variant could be resolved.
 */
struct ParseResult {
    std::optional<NormalizedIdentifier> identifier;
    std::vector<ParseIssue> issues;

    [[nodiscard]] bool ok() const noexcept { return identifier.has_value() && issues.empty(); }
};

/// Grammar and canonical-form check. Never throws on malformed input.
[[nodiscard]] ParseResult parse(std::string_view text);

/// Semantic checks (qualifier consistency); every issue is a VALIDATION_ERROR.
[[nodiscard]] std::vector<ParseIssue> validate(const NormalizedIdentifier& id);

/// Canonical text form; serialize(parse(s).identifier) == s for every canonical s.
[[nodiscard]] std::string serialize(const NormalizedIdentifier& id);

/// Escapes `%`, `;`, control bytes, space and DEL with upper-case hex digits.
[[nodiscard]] std::string percent_encode(std::string_view raw);

/// Single decoding pass; nullopt when a `%` is not followed by two hex digits.
[[nodiscard]] std::optional<std::string> percent_decode(std::string_view text);

}  // namespace swhid::conformance
