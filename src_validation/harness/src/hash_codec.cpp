#include "swhid_conformance/hash_codec.hpp"

#include <array>

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";
constexpr std::string_view kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::string_view kBase32Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr std::string_view kZ85Alphabet =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ.-:+=^!/*?&<>()[]{}@%$#";

int hex_value(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

int index_in(std::string_view alphabet, char ch) noexcept {
    const auto pos = alphabet.find(ch);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

std::string encode_hex(const swhid::conformance::HashBytes& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

std::optional<swhid::conformance::HashBytes> decode_hex(std::string_view text) {
    if (text.empty() || text.size() % 2 != 0) return std::nullopt;
    swhid::conformance::HashBytes out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        const int hi = hex_value(text[i]);
        const int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string encode_base64(const swhid::conformance::HashBytes& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t v = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out.push_back(kBase64Alphabet[(v >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(v >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(v >> 6) & 0x3F]);
        out.push_back(kBase64Alphabet[v & 0x3F]);
    }
    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t v = bytes[i] << 16;
        out.push_back(kBase64Alphabet[(v >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(v >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t v = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out.push_back(kBase64Alphabet[(v >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(v >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::optional<swhid::conformance::HashBytes> decode_base64(std::string_view text) {
    if (text.empty() || text.size() % 4 != 0) return std::nullopt;
    std::size_t padding = 0;
    while (padding < 2 && !text.empty() && text[text.size() - 1 - padding] == '=') {
        ++padding;
    }
    swhid::conformance::HashBytes out;
    std::uint32_t acc = 0;
    int bits = 0;
    for (std::size_t i = 0; i < text.size() - padding; ++i) {
        const int v = index_in(kBase64Alphabet, text[i]);
        if (v < 0) return std::nullopt;
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

std::string encode_base32(const swhid::conformance::HashBytes& bytes) {
    std::string out;
    std::uint32_t acc = 0;
    int bits = 0;
    for (auto b : bytes) {
        acc = (acc << 8) | b;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kBase32Alphabet[(acc >> bits) & 0x1F]);
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(acc << (5 - bits)) & 0x1F]);
    }
    return out;
}

std::optional<swhid::conformance::HashBytes> decode_base32(std::string_view text) {
    if (text.empty()) return std::nullopt;
    swhid::conformance::HashBytes out;
    std::uint32_t acc = 0;
    int bits = 0;
    for (char ch : text) {
        const int v = index_in(kBase32Alphabet, ch);
        if (v < 0) return std::nullopt;
        acc = (acc << 5) | static_cast<std::uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

// Z85 works on 4-byte frames; identifier hashes are always a multiple of four bytes.
std::string encode_z85(const swhid::conformance::HashBytes& bytes) {
    std::string out;
    if (bytes.size() % 4 != 0) return out;
    out.reserve(bytes.size() / 4 * 5);
    for (std::size_t i = 0; i < bytes.size(); i += 4) {
        std::uint32_t v = (static_cast<std::uint32_t>(bytes[i]) << 24) |
                          (static_cast<std::uint32_t>(bytes[i + 1]) << 16) |
                          (static_cast<std::uint32_t>(bytes[i + 2]) << 8) |
                          static_cast<std::uint32_t>(bytes[i + 3]);
        std::array<char, 5> chunk{};
        for (int k = 4; k >= 0; --k) {
            chunk[static_cast<std::size_t>(k)] = kZ85Alphabet[v % 85];
            v /= 85;
        }
        out.append(chunk.data(), chunk.size());
    }
    return out;
}

std::optional<swhid::conformance::HashBytes> decode_z85(std::string_view text) {
    if (text.empty() || text.size() % 5 != 0) return std::nullopt;
    swhid::conformance::HashBytes out;
    out.reserve(text.size() / 5 * 4);
    for (std::size_t i = 0; i < text.size(); i += 5) {
        std::uint64_t v = 0;
        for (std::size_t k = 0; k < 5; ++k) {
            const int d = index_in(kZ85Alphabet, text[i + k]);
            if (d < 0) return std::nullopt;
            v = v * 85 + static_cast<std::uint64_t>(d);
        }
        if (v > 0xFFFFFFFFull) return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
        out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
        out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
        out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    }
    return out;
}

}  // namespace

namespace swhid::conformance {

std::string encode_hash(HashEncoding encoding, const HashBytes& bytes) {
    switch (encoding) {
        case HashEncoding::Hex: return encode_hex(bytes);
        case HashEncoding::Base64: return encode_base64(bytes);
        case HashEncoding::Base85: return encode_z85(bytes);
        case HashEncoding::Base32: return encode_base32(bytes);
    }
    return {};
}

std::optional<HashBytes> decode_hash(HashEncoding encoding, std::string_view text) {
    switch (encoding) {
        case HashEncoding::Hex: return decode_hex(text);
        case HashEncoding::Base64: return decode_base64(text);
        case HashEncoding::Base85: return decode_z85(text);
        case HashEncoding::Base32: return decode_base32(text);
    }
    return std::nullopt;
}

bool is_hex_alphabet(std::string_view text) noexcept {
    for (char ch : text) {
        if (hex_value(ch) < 0) return false;
    }
    return !text.empty();
}

bool is_base64_alphabet(std::string_view text) noexcept {
    std::size_t end = text.size();
    while (end > 0 && text[end - 1] == '=') --end;
    if (text.size() - end > 2) return false;
    for (std::size_t i = 0; i < end; ++i) {
        if (index_in(kBase64Alphabet, text[i]) < 0) return false;
    }
    return end > 0;
}

bool is_z85_alphabet(std::string_view text) noexcept {
    for (char ch : text) {
        if (index_in(kZ85Alphabet, ch) < 0) return false;
    }
    return !text.empty();
}

bool is_base32_alphabet(std::string_view text) noexcept {
    for (char ch : text) {
        if (index_in(kBase32Alphabet, ch) < 0) return false;
    }
    return !text.empty();
}

}  // namespace swhid::conformance
