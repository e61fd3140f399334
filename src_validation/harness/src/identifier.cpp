#include "swhid_conformance/identifier.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <initializer_list>
#include <set>
#include <utility>

namespace swhid::conformance {

namespace {

constexpr std::string_view kUpperHex = "0123456789ABCDEF";

bool is_alpha(unsigned char ch) noexcept { return std::isalpha(ch) != 0; }
bool is_digit(unsigned char ch) noexcept { return ch >= '0' && ch <= '9'; }

bool needs_escape(unsigned char ch) noexcept {
    return ch == '%' || ch == ';' || ch <= 0x20 || ch == 0x7F;
}

bool valid_scheme(std::string_view s) noexcept {
    if (s.empty() || !is_alpha(static_cast<unsigned char>(s.front()))) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        const auto ch = static_cast<unsigned char>(c);
        return std::isalnum(ch) != 0 || ch == '+' || ch == '-' || ch == '.';
    });
}

bool valid_key(std::string_view s) noexcept {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        const auto ch = static_cast<unsigned char>(c);
        return std::isalnum(ch) != 0 || ch == '_' || ch == '-';
    });
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::optional<std::size_t> qualifier_rank(std::string_view key) noexcept {
    for (std::size_t i = 0; i < kQualifierOrder.size(); ++i) {
        if (kQualifierOrder[i] == key) return i;
    }
    return std::nullopt;
}

void add_issue(std::vector<ParseIssue>& issues, ErrorKind kind, std::string subtype,
               std::string message) {
    issues.push_back(ParseIssue{kind, std::move(subtype), std::move(message)});
}

ParseResult grammar_failure(std::string subtype, std::string message) {
    ParseResult result;
    add_issue(result.issues, ErrorKind::ParseError, std::move(subtype), std::move(message));
    return result;
}

bool parse_number(std::string_view text, std::uint64_t& out) noexcept {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](char c) { return is_digit(static_cast<unsigned char>(c)); })) {
        return false;
    }
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// `N` or `N-M` with N <= M.
bool valid_range(std::string_view text, std::uint64_t minimum) noexcept {
    const auto dash = text.find('-');
    std::uint64_t lo = 0;
    std::uint64_t hi = 0;
    if (dash == std::string_view::npos) {
        return parse_number(text, lo) && lo >= minimum;
    }
    return parse_number(text.substr(0, dash), lo) && parse_number(text.substr(dash + 1), hi) &&
           lo >= minimum && lo <= hi;
}

// A qualifier that must itself hold a bare core identifier of one of the allowed types.
bool core_identifier_of(const std::string& value, std::initializer_list<ObjectType> allowed) {
    const auto inner = parse(value);
    if (!inner.ok() || !inner.identifier->qualifiers.empty()) return false;
    return std::find(allowed.begin(), allowed.end(), inner.identifier->type) != allowed.end();
}

}  // namespace

std::string_view type_code(ObjectType type) noexcept {
    switch (type) {
        case ObjectType::Content: return "cnt";
        case ObjectType::Directory: return "dir";
        case ObjectType::Revision: return "rev";
        case ObjectType::Release: return "rel";
        case ObjectType::Snapshot: return "snp";
    }
    return "cnt";
}

std::string_view type_name(ObjectType type) noexcept {
    switch (type) {
        case ObjectType::Content: return "content";
        case ObjectType::Directory: return "directory";
        case ObjectType::Revision: return "revision";
        case ObjectType::Release: return "release";
        case ObjectType::Snapshot: return "snapshot";
    }
    return "content";
}

std::optional<ObjectType> object_type_from_string(std::string_view text) {
    for (auto type : kAllObjectTypes) {
        if (text == type_code(type) || text == type_name(type)) return type;
    }
    return std::nullopt;
}

std::string_view to_string(HashAlgorithm algorithm) noexcept {
    return algorithm == HashAlgorithm::Sha1 ? "sha1" : "sha256";
}

std::string_view to_string(HashEncoding encoding) noexcept {
    switch (encoding) {
        case HashEncoding::Hex: return "hex";
        case HashEncoding::Base64: return "base64";
        case HashEncoding::Base85: return "base85";
        case HashEncoding::Base32: return "base32";
    }
    return "hex";
}

std::size_t digest_size(HashAlgorithm algorithm) noexcept {
    return algorithm == HashAlgorithm::Sha1 ? 20 : 32;
}

std::string to_string(const Variant& variant) {
    if (!variant.known()) return "unknown";
    std::string tag = "v" + std::to_string(variant.version);
    tag += '/';
    tag += to_string(variant.algorithm);
    tag += '/';
    tag += to_string(variant.encoding);
    return tag;
}

std::optional<Variant> parse_variant_tag(std::string_view tag) {
    for (const auto& variant : kKnownVariants) {
        if (tag == to_string(variant)) return variant;
    }
    return std::nullopt;
}

Variant detect_variant(std::string_view hash_text) {
    const auto n = hash_text.size();
    if (n == 40 && is_hex_alphabet(hash_text)) return kV1Sha1Hex;
    if (n == 64 && is_hex_alphabet(hash_text)) return kV2Sha256Hex;
    if (n == 44 && hash_text.back() == '=' && is_base64_alphabet(hash_text)) return kV2Sha256Base64;
    if (n == 40 && is_z85_alphabet(hash_text)) return kV2Sha256Base85;
    if (n == 52 && is_base32_alphabet(hash_text)) return kV2Sha256Base32;
    return Variant::unknown();
}

const std::string* NormalizedIdentifier::qualifier(std::string_view key) const noexcept {
    for (const auto& q : qualifiers) {
        if (q.key == key) return &q.value;
    }
    return nullptr;
}

bool NormalizedIdentifier::operator==(const NormalizedIdentifier& other) const noexcept {
    return scheme == other.scheme && version == other.version && type == other.type &&
           hash == other.hash && qualifiers == other.qualifiers;
}

std::string percent_encode(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        const auto ch = static_cast<unsigned char>(c);
        if (needs_escape(ch)) {
            out.push_back('%');
            out.push_back(kUpperHex[ch >> 4]);
            out.push_back(kUpperHex[ch & 0x0F]);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size()) {
            return std::nullopt;
        }
        const auto pair = text.substr(i + 1, 2);
        if (!is_hex_alphabet(pair)) return std::nullopt;
        const auto bytes = decode_hash(HashEncoding::Hex, pair);
        if (!bytes) return std::nullopt;
        out.push_back(static_cast<char>((*bytes)[0]));
        i += 2;
    }
    return out;
}

ParseResult parse(std::string_view text) {
    const auto c1 = text.find(':');
    if (c1 == std::string_view::npos) {
        return grammar_failure("missing_field", "expected 'scheme:version:type:hash'");
    }
    const auto c2 = text.find(':', c1 + 1);
    if (c2 == std::string_view::npos) {
        return grammar_failure("missing_field", "expected 'scheme:version:type:hash'");
    }
    const auto c3 = text.find(':', c2 + 1);
    if (c3 == std::string_view::npos) {
        return grammar_failure("missing_field", "expected 'scheme:version:type:hash'");
    }

    const auto scheme = text.substr(0, c1);
    const auto version_text = text.substr(c1 + 1, c2 - c1 - 1);
    const auto type_text = text.substr(c2 + 1, c3 - c2 - 1);
    const auto rest = text.substr(c3 + 1);
    const auto semi = rest.find(';');
    const auto hash_text = rest.substr(0, semi);

    if (!valid_scheme(scheme)) {
        return grammar_failure("bad_scheme", "malformed scheme '" + std::string{scheme} + "'");
    }
    if (version_text.empty() ||
        !std::all_of(version_text.begin(), version_text.end(),
                     [](char c) { return is_digit(static_cast<unsigned char>(c)); })) {
        return grammar_failure("bad_version", "version is not numeric: '" + std::string{version_text} + "'");
    }
    if (type_text.empty() ||
        !std::all_of(type_text.begin(), type_text.end(),
                     [](char c) { return is_alpha(static_cast<unsigned char>(c)); })) {
        return grammar_failure("bad_type", "malformed object type '" + std::string{type_text} + "'");
    }
    if (hash_text.empty()) {
        return grammar_failure("empty_hash", "hash field is empty");
    }
    for (unsigned char ch : hash_text) {
        if (ch <= 0x20 || ch == 0x7F) {
            return grammar_failure("bad_hash", "control or whitespace byte in hash field");
        }
    }

    // Qualifiers: each segment is key=value, values decoded exactly once.
    std::vector<Qualifier> qualifiers;
    std::vector<bool> escaped_canonically;
    if (semi != std::string_view::npos) {
        auto tail = rest.substr(semi + 1);
        while (true) {
            const auto next = tail.find(';');
            const auto segment = tail.substr(0, next);
            const auto eq = segment.find('=');
            if (eq == std::string_view::npos) {
                return grammar_failure("bad_qualifier",
                                       "qualifier without '=': '" + std::string{segment} + "'");
            }
            const auto key = segment.substr(0, eq);
            const auto raw_value = segment.substr(eq + 1);
            if (!valid_key(key)) {
                return grammar_failure("bad_qualifier",
                                       "malformed qualifier key '" + std::string{key} + "'");
            }
            auto decoded = percent_decode(raw_value);
            if (!decoded) {
                return grammar_failure("bad_escape", "malformed percent escape in qualifier '" +
                                                         std::string{key} + "'");
            }
            escaped_canonically.push_back(percent_encode(*decoded) == raw_value);
            qualifiers.push_back(Qualifier{std::string{key}, std::move(*decoded)});
            if (next == std::string_view::npos) break;
            tail = tail.substr(next + 1);
        }
    }

    ParseResult result;
    auto& issues = result.issues;

    if (scheme != "swh") {
        if (to_lower_copy(scheme) == "swh") {
            add_issue(issues, ErrorKind::NormalizeError, "scheme_case", "scheme must be lower-case 'swh'");
        } else {
            add_issue(issues, ErrorKind::NormalizeError, "unknown_scheme",
                      "unknown scheme '" + std::string{scheme} + "'");
        }
    }

    int version = 0;
    if (version_text.size() > 1 && version_text.front() == '0') {
        add_issue(issues, ErrorKind::NormalizeError, "version_format",
                  "version has leading zeros: '" + std::string{version_text} + "'");
    }
    if (version_text.size() <= 3) {
        version = std::stoi(std::string{version_text});
    }
    if (version != 1 && version != 2) {
        add_issue(issues, ErrorKind::NormalizeError, "unknown_version",
                  "unsupported version '" + std::string{version_text} + "'");
    }

    auto type = object_type_from_string(type_text);
    if (type && type_text != type_code(*type)) {
        // Long names are accepted on command lines only, never on the wire.
        type.reset();
    }
    if (!type) {
        if (const auto lowered = object_type_from_string(to_lower_copy(type_text));
            lowered && to_lower_copy(type_text) == type_code(*lowered)) {
            add_issue(issues, ErrorKind::NormalizeError, "type_case", "object type must be lower-case");
            type = lowered;
        } else {
            add_issue(issues, ErrorKind::NormalizeError, "unknown_type",
                      "unknown object type '" + std::string{type_text} + "'");
        }
    }

    const auto variant = detect_variant(hash_text);
    std::optional<HashBytes> hash;
    if (!variant.known()) {
        add_issue(issues, ErrorKind::NormalizeError, "unknown_variant",
                  "hash of " + std::to_string(hash_text.size()) +
                      " characters matches no known variant");
    } else {
        if (variant.version != version) {
            add_issue(issues, ErrorKind::NormalizeError, "variant_version",
                      "hash encodes " + to_string(variant) + " but version is " +
                          std::string{version_text});
        }
        hash = decode_hash(variant.encoding, hash_text);
        if (!hash || hash->size() != digest_size(variant.algorithm)) {
            add_issue(issues, ErrorKind::NormalizeError, "hash_length",
                      "hash does not decode to a " + std::string{to_string(variant.algorithm)} +
                          " digest");
            hash.reset();
        } else if (encode_hash(variant.encoding, *hash) != hash_text) {
            add_issue(issues, ErrorKind::NormalizeError, "hash_not_canonical",
                      "hash text is not in canonical " + std::string{to_string(variant.encoding)} +
                          " form");
        }
    }

    for (std::size_t i = 0; i < qualifiers.size(); ++i) {
        if (!escaped_canonically[i]) {
            add_issue(issues, ErrorKind::NormalizeError, "qualifier_escaping",
                      "qualifier '" + qualifiers[i].key + "' is not canonically percent-encoded");
        }
    }

    std::optional<std::size_t> last_rank;
    for (const auto& q : qualifiers) {
        const auto rank = qualifier_rank(q.key);
        if (!rank) continue;
        if (last_rank && *rank < *last_rank) {
            add_issue(issues, ErrorKind::NormalizeError, "qualifier_order",
                      "qualifier '" + q.key + "' is out of canonical order");
            break;
        }
        last_rank = rank;
    }

    if (type && hash) {
        NormalizedIdentifier id;
        id.scheme = std::string{scheme};
        id.version = version;
        id.type = *type;
        id.hash = std::move(*hash);
        id.variant = variant;
        id.qualifiers = std::move(qualifiers);
        result.identifier = std::move(id);
    }
    return result;
}

std::vector<ParseIssue> validate(const NormalizedIdentifier& id) {
    std::vector<ParseIssue> issues;

    std::set<std::string> seen;
    for (const auto& q : id.qualifiers) {
        if (!seen.insert(q.key).second) {
            add_issue(issues, ErrorKind::ValidationError, "duplicate_qualifier",
                      "qualifier '" + q.key + "' appears more than once");
        }
        if (!qualifier_rank(q.key)) {
            add_issue(issues, ErrorKind::ValidationError, "unknown_qualifier",
                      "unknown qualifier '" + q.key + "'");
        }
    }

    if (const auto* origin = id.qualifier("origin"); origin && origin->empty()) {
        add_issue(issues, ErrorKind::ValidationError, "empty_origin", "origin qualifier is empty");
    }
    if (const auto* visit = id.qualifier("visit");
        visit && !core_identifier_of(*visit, {ObjectType::Snapshot})) {
        add_issue(issues, ErrorKind::ValidationError, "visit_type",
                  "visit qualifier must be a snapshot identifier");
    }
    if (const auto* anchor = id.qualifier("anchor");
        anchor && !core_identifier_of(*anchor, {ObjectType::Directory, ObjectType::Revision,
                                                ObjectType::Release, ObjectType::Snapshot})) {
        add_issue(issues, ErrorKind::ValidationError, "anchor_type",
                  "anchor qualifier must be a dir, rev, rel or snp identifier");
    }
    if (const auto* lines = id.qualifier("lines")) {
        if (!valid_range(*lines, 1)) {
            add_issue(issues, ErrorKind::ValidationError, "bad_range",
                      "lines qualifier is not 'N' or 'N-M' with 1 <= N <= M");
        }
        if (id.type != ObjectType::Content) {
            add_issue(issues, ErrorKind::ValidationError, "lines_on_non_content",
                      "lines qualifier only applies to content identifiers");
        }
    }
    if (const auto* bytes = id.qualifier("bytes"); bytes && !valid_range(*bytes, 0)) {
        add_issue(issues, ErrorKind::ValidationError, "bad_range",
                  "bytes qualifier is not 'N' or 'N-M' with N <= M");
    }
    return issues;
}

std::string serialize(const NormalizedIdentifier& id) {
    std::string out = id.scheme;
    out += ':';
    out += std::to_string(id.version);
    out += ':';
    out += type_code(id.type);
    out += ':';
    out += encode_hash(id.variant.encoding, id.hash);
    for (const auto& q : id.qualifiers) {
        out += ';';
        out += q.key;
        out += '=';
        out += percent_encode(q.value);
    }
    return out;
}

}  // namespace swhid::conformance
