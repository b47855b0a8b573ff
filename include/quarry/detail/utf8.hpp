#pragma once

/// @file utf8.hpp
/// @brief UTF-8 bit-pattern helpers shared by the decoder, lexer and scanner.
///
///   - Classifying a lead byte by its high-bit pattern
///   - Extracting lead/continuation payload bits
///   - Encoding a code point back to UTF-8 (1-4 bytes)
///   - Surrogate pair arithmetic for \uXXXX escapes

#include <cstdint>
#include <string>

namespace quarry::detail::utf8 {

// ─── Lead byte classification ─────────────────────────────────────────

/// @brief Determines the UTF-8 sequence length from the leading byte.
/// @return 1-4 for a valid lead byte, 0 for a continuation or invalid byte.
constexpr unsigned sequence_length(uint8_t lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

constexpr bool is_continuation(uint8_t byte) noexcept {
    return (byte & 0xC0) == 0x80;
}

/// @brief Payload bits carried by a lead byte of a sequence of length len.
constexpr uint32_t lead_payload(uint8_t lead, unsigned len) noexcept {
    switch (len) {
        case 1: return lead;
        case 2: return lead & 0x1Fu;
        case 3: return lead & 0x0Fu;
        case 4: return lead & 0x07u;
        default: return 0;
    }
}

/// @brief Append six continuation payload bits to a partial code point.
constexpr uint32_t append_continuation(uint32_t cp, uint8_t byte) noexcept {
    return (cp << 6) | (byte & 0x3Fu);
}

/// @brief Smallest code point that needs a sequence of length len.
constexpr uint32_t min_for_length(unsigned len) noexcept {
    switch (len) {
        case 2: return 0x80;
        case 3: return 0x800;
        case 4: return 0x10000;
        default: return 0;
    }
}

constexpr bool is_surrogate(uint32_t cp) noexcept {
    return cp >= 0xD800 && cp <= 0xDFFF;
}

constexpr bool is_high_surrogate(uint32_t cp) noexcept {
    return cp >= 0xD800 && cp <= 0xDBFF;
}

constexpr bool is_low_surrogate(uint32_t cp) noexcept {
    return cp >= 0xDC00 && cp <= 0xDFFF;
}

constexpr uint32_t combine_surrogates(uint32_t high, uint32_t low) noexcept {
    return 0x10000u + ((high - 0xD800u) << 10) + (low - 0xDC00u);
}

// ─── Code point encoding → UTF-8 ─────────────────────────────────────

/// @brief Encode a code point into a fixed buffer.
/// @return Number of bytes written (1-4), or 0 for an invalid code point.
inline unsigned encode(uint32_t cp, char* buf) noexcept {
    if (cp < 0x80) {
        buf[0] = static_cast<char>(cp);
        return 1;
    } else if (cp < 0x800) {
        buf[0] = static_cast<char>(0xC0 | (cp >> 6));
        buf[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    } else if (cp < 0x10000) {
        buf[0] = static_cast<char>(0xE0 | (cp >> 12));
        buf[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buf[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    } else if (cp <= 0x10FFFF) {
        buf[0] = static_cast<char>(0xF0 | (cp >> 18));
        buf[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buf[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buf[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

/// @brief Encodes a code point as UTF-8 and appends it to the string.
inline void encode(uint32_t cp, std::string& out) {
    char buf[4];
    out.append(buf, encode(cp, buf));
}

/// @brief Encode a sequence of code points.
template <typename Iter>
std::string encode_all(Iter first, Iter last) {
    std::string out;
    for (; first != last; ++first) encode(static_cast<uint32_t>(*first), out);
    return out;
}

} // namespace quarry::detail::utf8
