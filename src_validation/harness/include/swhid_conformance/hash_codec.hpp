#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace swhid::conformance {

enum class HashEncoding {
    Hex,
    Base64,
    Base85,
    Base32,
};

using HashBytes = std::vector<std::uint8_t>;

/**
 * \brief Text codecs for identifier hash fields.
 *
 * - Hex: lower-case on output, either case accepted on input.
 * - Base64: RFC 4648 standard alphabet with `=` padding.
 * - Base85: ZeroMQ Z85 alphabet (contains no `;`, so it never collides with qualifiers).
 * - Base32: RFC 4648 upper-case alphabet, unpadded.
 *
 * decode_hash() is deliberately lenient about canonical form (letter case, non-zero trailing
 * bits); callers detect non-canonical text by comparing encode_hash(decode_hash(s)) with s.
 */
[[nodiscard]] std::string encode_hash(HashEncoding encoding, const HashBytes& bytes);

[[nodiscard]] std::optional<HashBytes> decode_hash(HashEncoding encoding, std::string_view text);

[[nodiscard]] bool is_hex_alphabet(std::string_view text) noexcept;
[[nodiscard]] bool is_base64_alphabet(std::string_view text) noexcept;  ///< including trailing `=`
[[nodiscard]] bool is_z85_alphabet(std::string_view text) noexcept;
[[nodiscard]] bool is_base32_alphabet(std::string_view text) noexcept;

}  // namespace swhid::conformance
