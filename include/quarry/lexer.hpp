#pragma once

/// @file lexer.hpp
/// @brief JSON lexer driven by scanner primitives.
///
/// Produces a lazy, finite sequence of positioned tokens ending with an
/// explicit EndOfInput token. One token of lookahead is available through
/// peek(). Once a fault has been raised, every later call rethrows it.

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "number.hpp"
#include "parse_options.hpp"
#include "scanner.hpp"
#include "token.hpp"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace quarry {

class Lexer {
public:
    explicit Lexer(Scanner& scanner, NumericMode numerics = NumericMode::Eager) noexcept
        : scanner_(scanner), numerics_(numerics) {}

    Lexer(const Lexer&) = delete;
    Lexer& operator=(const Lexer&) = delete;

    /// @brief Produce the next token.
    /// @throws DecodeError, ScanError, LexError.
    Token next() {
        if (peeked_) {
            Token t = std::move(*peeked_);
            peeked_.reset();
            return t;
        }
        return produce();
    }

    /// @brief Look at the next token without consuming it.
    const Token& peek() {
        if (!peeked_) peeked_ = produce();
        return *peeked_;
    }

    [[nodiscard]] NumericMode numerics() const noexcept { return numerics_; }

private:
    static constexpr char32_t kEnd = 0xFFFFFFFFu;

    Token produce() {
        if (QUARRY_UNLIKELY(fault_)) std::rethrow_exception(fault_);
        try {
            return lex();
        } catch (const Fault&) {
            fault_ = std::current_exception();
            throw;
        }
    }

    static bool is_whitespace(char32_t c) noexcept {
        return c == U' ' || c == U'\n' || c == U'\r' || c == U'\t';
    }

    static bool is_digit(char32_t c) noexcept {
        return c >= U'0' && c <= U'9';
    }

    static std::string describe(char32_t c) {
        if (c < 0x20 || c == 0x7F) {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(c));
            return buf;
        }
        std::string s = "'";
        detail::utf8::encode(static_cast<uint32_t>(c), s);
        s += '\'';
        return s;
    }

    // ─── Dispatch ────────────────────────────────────────────────────────

    Token lex() {
        skip_whitespace();
        const CharUnit* la = scanner_.lookahead();
        if (!la) return Token(TokenKind::EndOfInput, scanner_.next_coordinate());

        const Coordinate at = la->coordinate;
        switch (la->ch) {
            case U'{': return punctuation(TokenKind::ObjectOpen, at);
            case U'}': return punctuation(TokenKind::ObjectClose, at);
            case U'[': return punctuation(TokenKind::ArrayOpen, at);
            case U']': return punctuation(TokenKind::ArrayClose, at);
            case U':': return punctuation(TokenKind::Colon, at);
            case U',': return punctuation(TokenKind::Comma, at);
            case U'"': return lex_string(at);
            case U't': return lex_keyword("true", TokenKind::True, at);
            case U'f': return lex_keyword("false", TokenKind::False, at);
            case U'n': return lex_keyword("null", TokenKind::Null, at);
            case U'-':
            case U'0': case U'1': case U'2': case U'3': case U'4':
            case U'5': case U'6': case U'7': case U'8': case U'9':
                return lex_number(at);
            default:
                throw LexError("unexpected character " + describe(la->ch), at,
                               errc::unexpected_character);
        }
    }

    void skip_whitespace() {
        const CharUnit* la = scanner_.lookahead();
        while (la && is_whitespace(la->ch)) {
            scanner_.advance();
            la = scanner_.lookahead();
        }
        scanner_.clear();
    }

    Token punctuation(TokenKind kind, Coordinate at) {
        scanner_.advance();
        scanner_.take();
        return Token(kind, at);
    }

    // ─── Keywords ────────────────────────────────────────────────────────

    template <size_t N>
    Token lex_keyword(const char (&word)[N], TokenKind kind, Coordinate at) {
        for (size_t i = 0; i + 1 < N; ++i) {
            if (QUARRY_UNLIKELY(!scanner_.lookahead())) {
                scanner_.fail_ahead(std::string("unexpected end of input in literal '") + word + "'",
                                    errc::invalid_literal);
            }
            scanner_.advance();
            const CharUnit& got = scanner_.last();
            if (QUARRY_UNLIKELY(got.ch != static_cast<char32_t>(word[i]))) {
                throw LexError("unexpected character " + describe(got.ch) +
                               " in literal '" + word + "'",
                               got.coordinate, errc::invalid_literal);
            }
        }
        scanner_.take();
        return Token(kind, at);
    }

    // ─── Strings ─────────────────────────────────────────────────────────

    /// Advance over the next string character; end of input means the
    /// string starting at `open` is unterminated.
    char32_t string_step(Coordinate open) {
        if (QUARRY_UNLIKELY(!scanner_.lookahead())) {
            throw LexError("unterminated string", open, errc::unterminated_string);
        }
        scanner_.advance();
        return scanner_.last().ch;
    }

    Token lex_string(Coordinate open) {
        scanner_.advance();  // opening quote
        std::string value;
        for (;;) {
            const char32_t c = string_step(open);
            if (c == U'"') break;
            if (c == U'\\') {
                lex_escape(open, value);
                continue;
            }
            if (QUARRY_UNLIKELY(c < 0x20)) {
                scanner_.fail("unescaped control character " + describe(c) + " in string",
                              errc::control_character);
            }
            detail::utf8::encode(static_cast<uint32_t>(c), value);
        }
        scanner_.take();
        return Token(std::move(value), open);
    }

    void lex_escape(Coordinate open, std::string& out) {
        const Coordinate backslash = scanner_.current_coordinate();
        const char32_t c = string_step(open);
        switch (c) {
            case U'"':  out.push_back('"');  return;
            case U'\\': out.push_back('\\'); return;
            case U'/':  out.push_back('/');  return;
            case U'b':  out.push_back('\b'); return;
            case U'f':  out.push_back('\f'); return;
            case U'n':  out.push_back('\n'); return;
            case U'r':  out.push_back('\r'); return;
            case U't':  out.push_back('\t'); return;
            case U'u':  lex_unicode_escape(open, backslash, out); return;
            default:
                throw LexError("invalid escape sequence: backslash followed by " + describe(c),
                               backslash, errc::invalid_escape);
        }
    }

    uint32_t lex_hex4(Coordinate open) {
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            const char32_t h = string_step(open);
            uint32_t nib;
            if (h >= U'0' && h <= U'9')      nib = static_cast<uint32_t>(h - U'0');
            else if (h >= U'a' && h <= U'f') nib = static_cast<uint32_t>(h - U'a' + 10);
            else if (h >= U'A' && h <= U'F') nib = static_cast<uint32_t>(h - U'A' + 10);
            else {
                scanner_.fail("invalid hex digit " + describe(h) + " in unicode escape",
                              errc::invalid_unicode_escape);
            }
            val = (val << 4) | nib;
        }
        return val;
    }

    void lex_unicode_escape(Coordinate open, Coordinate backslash, std::string& out) {
        uint32_t cp = lex_hex4(open);

        if (detail::utf8::is_high_surrogate(cp)) {
            if (string_step(open) != U'\\' || string_step(open) != U'u') {
                throw LexError("missing low surrogate after high surrogate escape",
                               backslash, errc::invalid_unicode_escape);
            }
            const uint32_t low = lex_hex4(open);
            if (QUARRY_UNLIKELY(!detail::utf8::is_low_surrogate(low))) {
                throw LexError("invalid low surrogate value", backslash,
                               errc::invalid_unicode_escape);
            }
            cp = detail::utf8::combine_surrogates(cp, low);
        } else if (QUARRY_UNLIKELY(detail::utf8::is_low_surrogate(cp))) {
            throw LexError("unexpected low surrogate", backslash,
                           errc::invalid_unicode_escape);
        }
        detail::utf8::encode(cp, out);
    }

    // ─── Numbers ─────────────────────────────────────────────────────────

    /// Advance over the next character, or return kEnd at end of input.
    char32_t number_step() {
        if (!scanner_.lookahead()) return kEnd;
        scanner_.advance();
        return scanner_.last().ch;
    }

    [[noreturn]] QUARRY_NOINLINE void number_fault(const char* what, char32_t c) {
        std::string text;
        for (const auto& unit : scanner_.buffer()) {
            detail::utf8::encode(static_cast<uint32_t>(unit.ch), text);
        }
        const std::string message = std::string(what) + " in number '" + text + "'";
        if (c == kEnd) scanner_.fail_ahead(message, errc::invalid_number);
        scanner_.fail(message, errc::invalid_number);
    }

    /// Scan the maximal run matching
    ///   -? (0 | [1-9][0-9]*) (. [0-9]+)? ([eE] [+-]? [0-9]+)?
    /// then retract the first character that is not part of it.
    Token lex_number(Coordinate at) {
        char32_t c = number_step();
        if (c == U'-') {
            c = number_step();
            if (!is_digit(c)) number_fault("expected digit after '-'", c);
        }
        if (c == U'0') {
            c = number_step();
        } else {
            while (is_digit(c)) c = number_step();
        }
        if (c == U'.') {
            c = number_step();
            if (!is_digit(c)) number_fault("expected digit after decimal point", c);
            while (is_digit(c)) c = number_step();
        }
        if (c == U'e' || c == U'E') {
            c = number_step();
            if (c == U'+' || c == U'-') c = number_step();
            if (!is_digit(c)) number_fault("expected digit in exponent", c);
            while (is_digit(c)) c = number_step();
        }
        if (c != kEnd) scanner_.pushback();

        TextSpan span = scanner_.take();
        if (numerics_ == NumericMode::Lazy) {
            return Token(Number::lazy(std::move(span.text), at), at);
        }
        return Token(detail::convert_number(span.text, at), at);
    }

    Scanner& scanner_;
    NumericMode numerics_;
    std::optional<Token> peeked_;
    std::exception_ptr fault_;
};

} // namespace quarry
