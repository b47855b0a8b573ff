/// @file test_lexer.cpp
/// @brief Unit tests for the Lexer: token kinds, payloads, positions, faults.

#include <quarry/quarry.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace quarry;

namespace {

std::vector<TokenKind> kinds(std::string_view text) {
    std::vector<TokenKind> out;
    for (const auto& t : tokenize(text)) out.push_back(t.kind);
    return out;
}

Token single(std::string_view text, const ParseOptions& opts = {}) {
    auto tokens = tokenize(text, opts);
    EXPECT_EQ(tokens.size(), 2u) << "input: " << text;
    return tokens.front();
}

LexError lex_fault(std::string_view text) {
    try {
        (void)tokenize(text);
    } catch (const LexError& e) {
        return e;
    }
    ADD_FAILURE() << "no lexical fault for: " << text;
    return LexError("none", Coordinate{});
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Structure and whitespace
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Lexer, EmptyInputIsEndOfInput) {
    auto tokens = tokenize("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TokenKind::EndOfInput);
    EXPECT_EQ(tokens[0].coordinate, (Coordinate{1, 1, 0}));
}

TEST(Lexer, WhitespaceOnly) {
    auto tokens = tokenize(" \t\r\n ");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].coordinate, (Coordinate{2, 2, 5}));
}

TEST(Lexer, Punctuation) {
    const std::vector<TokenKind> expected = {
        TokenKind::ObjectOpen, TokenKind::ObjectClose, TokenKind::ArrayOpen,
        TokenKind::ArrayClose, TokenKind::Colon, TokenKind::Comma, TokenKind::EndOfInput};
    EXPECT_EQ(kinds("{ } [ ] : ,"), expected);
}

TEST(Lexer, Keywords) {
    const std::vector<TokenKind> expected = {
        TokenKind::True, TokenKind::False, TokenKind::Null, TokenKind::EndOfInput};
    EXPECT_EQ(kinds("true false\nnull"), expected);
}

TEST(Lexer, DocumentTokenSequence) {
    const std::vector<TokenKind> expected = {
        TokenKind::ObjectOpen, TokenKind::String, TokenKind::Colon, TokenKind::Number,
        TokenKind::Comma, TokenKind::String, TokenKind::Colon, TokenKind::ArrayOpen,
        TokenKind::True, TokenKind::Comma, TokenKind::Null, TokenKind::ArrayClose,
        TokenKind::ObjectClose, TokenKind::EndOfInput};
    EXPECT_EQ(kinds(R"({"a":1,"b":[true,null]})"), expected);
}

TEST(Lexer, TokenCoordinates) {
    auto tokens = tokenize("{\n  \"key\": 12\n}");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].coordinate, (Coordinate{1, 1, 0}));
    EXPECT_EQ(tokens[1].coordinate, (Coordinate{2, 3, 4}));
    EXPECT_EQ(tokens[2].coordinate, (Coordinate{2, 8, 9}));
    EXPECT_EQ(tokens[3].coordinate, (Coordinate{2, 10, 11}));
    EXPECT_EQ(tokens[4].coordinate, (Coordinate{3, 1, 14}));
    EXPECT_EQ(tokens[5].coordinate, (Coordinate{3, 2, 15}));
}

TEST(Lexer, PeekDoesNotConsume) {
    Pipeline p("[1]");
    EXPECT_EQ(p.lexer().peek().kind, TokenKind::ArrayOpen);
    EXPECT_EQ(p.lexer().peek().kind, TokenKind::ArrayOpen);
    EXPECT_EQ(p.lexer().next().kind, TokenKind::ArrayOpen);
    EXPECT_EQ(p.lexer().next().kind, TokenKind::Number);
    EXPECT_EQ(p.lexer().next().kind, TokenKind::ArrayClose);
    EXPECT_TRUE(p.lexer().next().is_end());
    EXPECT_TRUE(p.lexer().next().is_end());
}

TEST(Lexer, UnexpectedCharacter) {
    auto e = lex_fault("[1, @]");
    EXPECT_EQ(e.error(), errc::unexpected_character);
    EXPECT_EQ(e.coordinate(), (Coordinate{1, 5, 4}));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Strings
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LexerString, PayloadIsUnescaped) {
    auto t = single(R"("a\"b\\c\/d\b\f\n\r\t")");
    ASSERT_EQ(t.kind, TokenKind::String);
    EXPECT_EQ(t.text(), "a\"b\\c/d\b\f\n\r\t");
}

TEST(LexerString, UnicodeEscapes) {
    EXPECT_EQ(single(R"("\u0041")").text(), "A");
    EXPECT_EQ(single(R"("\u041F\u0440")").text(), "\xD0\x9F\xD1\x80");
    EXPECT_EQ(single(R"("\u20ac")").text(), "\xE2\x82\xAC");
    EXPECT_EQ(single(R"("\u0000")").text(), std::string(1, '\0'));
}

TEST(LexerString, SurrogatePair) {
    EXPECT_EQ(single(R"("\uD83D\uDE00")").text(), "\xF0\x9F\x98\x80");
}

TEST(LexerString, RawUtf8Passthrough) {
    EXPECT_EQ(single("\"日本語\"").text(), "日本語");
}

TEST(LexerString, EmptyString) {
    auto t = single(R"("")");
    EXPECT_EQ(t.kind, TokenKind::String);
    EXPECT_TRUE(t.text().empty());
}

TEST(LexerString, UnterminatedAtOpeningQuote) {
    auto e = lex_fault(R"("abc)");
    EXPECT_EQ(e.kind(), FaultKind::Lexical);
    EXPECT_EQ(e.error(), errc::unterminated_string);
    EXPECT_EQ(e.coordinate(), (Coordinate{1, 1, 0}));
}

TEST(LexerString, UnterminatedInsideDocument) {
    auto e = lex_fault("{\n  \"key\": \"val");
    EXPECT_EQ(e.error(), errc::unterminated_string);
    EXPECT_EQ(e.coordinate(), (Coordinate{2, 10, 11}));
}

TEST(LexerString, InvalidEscape) {
    auto e = lex_fault(R"("ab\x")");
    EXPECT_EQ(e.error(), errc::invalid_escape);
    EXPECT_EQ(e.coordinate(), (Coordinate{1, 4, 3}));
}

TEST(LexerString, BadHexDigit) {
    EXPECT_EQ(lex_fault(R"("\u12G4")").error(), errc::invalid_unicode_escape);
}

TEST(LexerString, LoneLowSurrogate) {
    EXPECT_EQ(lex_fault(R"("\uDE00")").error(), errc::invalid_unicode_escape);
}

TEST(LexerString, HighSurrogateWithoutLow) {
    EXPECT_EQ(lex_fault(R"("\uD83Dx")").error(), errc::invalid_unicode_escape);
    EXPECT_EQ(lex_fault(R"("\uD83DA")").error(), errc::invalid_unicode_escape);
}

TEST(LexerString, ControlCharacter) {
    auto e = lex_fault("\"a\tb\"");
    EXPECT_EQ(e.error(), errc::control_character);
    EXPECT_EQ(e.coordinate(), (Coordinate{1, 3, 2}));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Numbers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LexerNumber, Integers) {
    EXPECT_EQ(single("0").number().as_integer(), 0);
    EXPECT_EQ(single("42").number().as_integer(), 42);
    EXPECT_EQ(single("-17").number().as_integer(), -17);
    EXPECT_EQ(single("9223372036854775807").number().as_integer(),
              std::numeric_limits<int64_t>::max());
    EXPECT_EQ(single("-9223372036854775808").number().as_integer(),
              std::numeric_limits<int64_t>::min());
}

TEST(LexerNumber, LargeIntegerFallsBackToFloat) {
    auto t = single("18446744073709551616");
    EXPECT_TRUE(t.number().is_float());
    EXPECT_DOUBLE_EQ(t.number().as_float(), 18446744073709551616.0);
}

TEST(LexerNumber, Floats) {
    EXPECT_DOUBLE_EQ(single("3.25").number().as_float(), 3.25);
    EXPECT_DOUBLE_EQ(single("-0.5").number().as_float(), -0.5);
    EXPECT_DOUBLE_EQ(single("1e3").number().as_float(), 1000.0);
    EXPECT_DOUBLE_EQ(single("2.5E-2").number().as_float(), 0.025);
    EXPECT_DOUBLE_EQ(single("1e+2").number().as_float(), 100.0);
    EXPECT_TRUE(single("1.0").number().is_float());
}

TEST(LexerNumber, TerminatorIsNotConsumed) {
    const std::vector<TokenKind> expected = {
        TokenKind::ArrayOpen, TokenKind::Number, TokenKind::Comma, TokenKind::Number,
        TokenKind::ArrayClose, TokenKind::EndOfInput};
    EXPECT_EQ(kinds("[1,-2.5e3]"), expected);

    auto tokens = tokenize("[12]");
    EXPECT_EQ(tokens[2].coordinate, (Coordinate{1, 4, 3}));
}

TEST(LexerNumber, LeadingZeroSplitsToken) {
    auto tokens = tokenize("01");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].number().as_integer(), 0);
    EXPECT_EQ(tokens[1].number().as_integer(), 1);
    EXPECT_EQ(tokens[1].coordinate.offset, 1u);
}

TEST(LexerNumber, Malformed) {
    EXPECT_EQ(lex_fault("-").error(), errc::invalid_number);
    EXPECT_EQ(lex_fault("-a").error(), errc::invalid_number);
    EXPECT_EQ(lex_fault("1.").error(), errc::invalid_number);
    EXPECT_EQ(lex_fault("1.e5").error(), errc::invalid_number);
    EXPECT_EQ(lex_fault("1e").error(), errc::invalid_number);
    EXPECT_EQ(lex_fault("1e+").error(), errc::invalid_number);
}

TEST(LexerNumber, LeadingPlusIsUnexpected) {
    EXPECT_EQ(lex_fault("+1").error(), errc::unexpected_character);
}

TEST(LexerNumber, OutOfRange) {
    auto e = lex_fault("[1e400]");
    EXPECT_EQ(e.kind(), FaultKind::Lexical);
    EXPECT_EQ(e.error(), errc::number_out_of_range);
    EXPECT_EQ(e.coordinate(), (Coordinate{1, 2, 1}));
}

TEST(LexerNumber, UnderflowIsZero) {
    auto t = single("1e-400");
    EXPECT_EQ(t.number().as_float(), 0.0);
    EXPECT_TRUE(std::signbit(single("-1e-400").number().as_float()));
}

TEST(LexerNumber, RangeFollowsEffectiveExponent) {
    // A long mantissa with a small negative exponent still overflows.
    const std::string huge = "1" + std::string(400, '0') + "e-1";
    auto e = lex_fault("[" + huge + "]");
    EXPECT_EQ(e.error(), errc::number_out_of_range);
    EXPECT_EQ(e.coordinate(), (Coordinate{1, 2, 1}));

    // Leading fractional zeros with no exponent underflow to zero.
    const std::string tiny = "0." + std::string(400, '0') + "1";
    EXPECT_EQ(single(tiny).number().as_float(), 0.0);
    EXPECT_TRUE(std::signbit(single("-" + tiny).number().as_float()));

    // A huge mantissa scaled down far enough is representable.
    const std::string scaled = "1" + std::string(400, '0') + "e-400";
    EXPECT_DOUBLE_EQ(single(scaled).number().as_float(), 1.0);
}

TEST(LexerNumber, DecimalMagnitude) {
    EXPECT_EQ(detail::decimal_magnitude("1e400"), 400);
    EXPECT_EQ(detail::decimal_magnitude("-12.5e-3"), -2);
    EXPECT_EQ(detail::decimal_magnitude("0.001"), -3);
    EXPECT_EQ(detail::decimal_magnitude("0.0e5"), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(detail::decimal_magnitude("1" + std::string(400, '0') + "e-1"), 399);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lazy numerics
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LexerLazy, KeepsRawText) {
    auto t = single("-12.50e1", ParseOptions::lazy());
    EXPECT_TRUE(t.number().is_lazy());
    EXPECT_EQ(t.number().raw(), "-12.50e1");
    EXPECT_DOUBLE_EQ(t.number().as_float(), -125.0);
    EXPECT_FALSE(t.number().is_lazy());
}

TEST(LexerLazy, OutOfRangeDeferredUntilRead) {
    auto t = single("  1e400", ParseOptions::lazy());
    ASSERT_EQ(t.kind, TokenKind::Number);
    try {
        (void)t.number().as_float();
        FAIL() << "expected LexError";
    } catch (const LexError& e) {
        EXPECT_EQ(e.error(), errc::number_out_of_range);
        EXPECT_EQ(e.coordinate(), (Coordinate{1, 3, 2}));
    }
}

TEST(LexerLazy, LongMantissaOverflowDeferredUntilRead) {
    auto t = single("1" + std::string(400, '0') + "e-1", ParseOptions::lazy());
    ASSERT_EQ(t.kind, TokenKind::Number);
    EXPECT_TRUE(t.number().is_lazy());
    try {
        (void)t.number().as_float();
        FAIL() << "expected LexError";
    } catch (const LexError& e) {
        EXPECT_EQ(e.error(), errc::number_out_of_range);
        EXPECT_EQ(e.coordinate(), (Coordinate{1, 1, 0}));
    }
}

TEST(LexerLazy, GrammarStillCheckedEagerly) {
    ParseOptions opts = ParseOptions::lazy();
    EXPECT_THROW((void)tokenize("1.", opts), LexError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Keywords
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LexerKeyword, MismatchNamesCharacter) {
    auto e = lex_fault("trve");
    EXPECT_EQ(e.error(), errc::invalid_literal);
    EXPECT_EQ(e.coordinate(), (Coordinate{1, 3, 2}));
    EXPECT_NE(std::string(e.what()).find("'v'"), std::string::npos);
}

TEST(LexerKeyword, TruncatedLiteral) {
    auto e = lex_fault("nul");
    EXPECT_EQ(e.error(), errc::invalid_literal);
    EXPECT_EQ(e.coordinate(), (Coordinate{1, 4, 3}));
}

TEST(LexerKeyword, FaultIsLatched) {
    Pipeline p("[fals]");
    EXPECT_EQ(p.lexer().next().kind, TokenKind::ArrayOpen);
    EXPECT_THROW(p.lexer().next(), LexError);
    EXPECT_THROW(p.lexer().next(), LexError);
    EXPECT_THROW(p.lexer().peek(), LexError);
}
