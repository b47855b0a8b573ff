#pragma once

/// @file token.hpp
/// @brief Positioned lexical tokens produced by the lexer.

#include "error.hpp"
#include "number.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace quarry {

/// @brief Token classes of the JSON grammar.
enum class TokenKind : uint8_t {
    ObjectOpen,
    ObjectClose,
    ArrayOpen,
    ArrayClose,
    Colon,
    Comma,
    String,
    Number,
    True,
    False,
    Null,
    EndOfInput
};

inline const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::ObjectOpen:  return "'{'";
        case TokenKind::ObjectClose: return "'}'";
        case TokenKind::ArrayOpen:   return "'['";
        case TokenKind::ArrayClose:  return "']'";
        case TokenKind::Colon:       return "':'";
        case TokenKind::Comma:       return "','";
        case TokenKind::String:      return "string";
        case TokenKind::Number:      return "number";
        case TokenKind::True:        return "true";
        case TokenKind::False:       return "false";
        case TokenKind::Null:        return "null";
        case TokenKind::EndOfInput:  return "end of input";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, TokenKind k) {
    return os << token_kind_name(k);
}

/// @brief A token: kind, decoded payload and the coordinate of its first
/// character. Strings carry the unescaped value and numbers the converted
/// (or lazily convertible) Number, so nothing downstream re-scans text.
struct Token {
    using Payload = std::variant<std::monostate, std::string, quarry::Number>;

    TokenKind kind = TokenKind::EndOfInput;
    Payload payload;
    Coordinate coordinate;

    Token() = default;
    Token(TokenKind k, Coordinate c) : kind(k), coordinate(c) {}
    Token(std::string text, Coordinate c)
        : kind(TokenKind::String), payload(std::move(text)), coordinate(c) {}
    Token(quarry::Number n, Coordinate c)
        : kind(TokenKind::Number), payload(std::move(n)), coordinate(c) {}

    /// @brief Unescaped string payload. Precondition: kind == String.
    [[nodiscard]] const std::string& text() const { return std::get<std::string>(payload); }
    [[nodiscard]] std::string& text() { return std::get<std::string>(payload); }

    /// @brief Numeric payload. Precondition: kind == Number.
    [[nodiscard]] const quarry::Number& number() const { return std::get<quarry::Number>(payload); }
    [[nodiscard]] quarry::Number& number() { return std::get<quarry::Number>(payload); }

    /// @brief True for tokens that can start a value.
    [[nodiscard]] bool starts_value() const noexcept {
        switch (kind) {
            case TokenKind::ObjectOpen:
            case TokenKind::ArrayOpen:
            case TokenKind::String:
            case TokenKind::Number:
            case TokenKind::True:
            case TokenKind::False:
            case TokenKind::Null:
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]] bool is_end() const noexcept { return kind == TokenKind::EndOfInput; }
};

} // namespace quarry
