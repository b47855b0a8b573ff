/// @file test_parser.cpp
/// @brief Unit tests for the tree front-end: parse(), try_parse(), options.

#include <quarry/quarry.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace quarry;

// ═══════════════════════════════════════════════════════════════════════════════
// Basic documents
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Parser, ObjectWithArray) {
    auto v = parse(R"({"a":1,"b":[true,null]})");
    ASSERT_TRUE(v.is_object());
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v["a"].as_integer(), 1);
    ASSERT_TRUE(v["b"].is_array());
    ASSERT_EQ(v["b"].size(), 2u);
    EXPECT_TRUE(v["b"][0].as_bool());
    EXPECT_TRUE(v["b"][1].is_null());
}

TEST(Parser, ScalarRoots) {
    EXPECT_TRUE(parse("null").is_null());
    EXPECT_TRUE(parse("true").as_bool());
    EXPECT_FALSE(parse("false").as_bool());
    EXPECT_EQ(parse("-42").as_integer(), -42);
    EXPECT_DOUBLE_EQ(parse("3.14").as_float(), 3.14);
    EXPECT_EQ(parse(R"("hi")").as_string(), "hi");
}

TEST(Parser, EmptyContainers) {
    EXPECT_TRUE(parse("{}").is_object());
    EXPECT_TRUE(parse("{}").empty());
    EXPECT_TRUE(parse("[]").is_array());
    EXPECT_TRUE(parse("[ ]").empty());
}

TEST(Parser, NestedStructure) {
    auto v = parse(R"({
        "users": [
            {"name": "Ann", "tags": ["a", "b"]},
            {"name": "Bo", "tags": []}
        ],
        "meta": {"count": 2, "ratio": 0.5}
    })");
    EXPECT_EQ(v["users"][0]["name"].as_string(), "Ann");
    EXPECT_EQ(v["users"][0]["tags"][1].as_string(), "b");
    EXPECT_TRUE(v["users"][1]["tags"].empty());
    EXPECT_EQ(v["meta"]["count"].as_integer(), 2);
    EXPECT_DOUBLE_EQ(v["meta"]["ratio"].as_float(), 0.5);
}

TEST(Parser, KeyOrderPreserved) {
    auto v = parse(R"({"z":1,"a":2,"m":3})");
    const auto& o = v.as_object();
    EXPECT_EQ(o.entries[0].first, "z");
    EXPECT_EQ(o.entries[1].first, "a");
    EXPECT_EQ(o.entries[2].first, "m");
}

TEST(Parser, WhitespaceEverywhere) {
    auto v = parse(" \n\t{ \"a\" :\r\n [ 1 , 2 ] } \n");
    EXPECT_EQ(v["a"][1].as_integer(), 2);
}

TEST(Parser, DeepNestingWithinLimit) {
    std::string text(500, '[');
    text += std::string(500, ']');
    auto v = parse(text);
    const Value* cur = &v;
    int depth = 0;
    while (cur->is_array() && !cur->empty()) {
        cur = &(*cur)[0];
        ++depth;
    }
    EXPECT_EQ(depth, 499);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Duplicate keys
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Parser, DuplicateKeyLastWriteWins) {
    auto v = parse(R"({"a":1,"b":2,"a":3})");
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v["a"].as_integer(), 3);
    EXPECT_EQ(v.as_object().entries[0].first, "a");
}

TEST(Parser, DuplicateKeyRejectedWhenDisallowed) {
    ParseOptions opts;
    opts.allow_duplicate_keys = false;
    try {
        (void)parse(R"({"a":1,"a":2})", opts);
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.error(), errc::duplicate_key);
        EXPECT_EQ(e.coordinate(), (Coordinate{1, 8, 7}));
    }
}

TEST(Parser, DuplicateKeysScopedPerObject) {
    ParseOptions opts;
    opts.allow_duplicate_keys = false;
    auto v = parse(R"({"a":{"a":1},"b":{"a":2}})", opts);
    EXPECT_EQ(v["b"]["a"].as_integer(), 2);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Options
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Parser, RequireContainerRoot) {
    ParseOptions opts;
    opts.require_container_root = true;
    EXPECT_NO_THROW((void)parse("[1]", opts));
    try {
        (void)parse("  42", opts);
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.error(), errc::invalid_root);
        EXPECT_EQ(e.coordinate().offset, 2u);
    }
}

TEST(Parser, MaxDepth) {
    ParseOptions opts;
    opts.max_depth = 3;
    EXPECT_NO_THROW((void)parse("[[[1]]]", opts));
    try {
        (void)parse("[[[[1]]]]", opts);
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.error(), errc::max_depth_exceeded);
        EXPECT_EQ(e.coordinate().offset, 3u);
    }
}

TEST(Parser, DefaultDepthLimit) {
    std::string text(QUARRY_MAX_DEPTH + 1, '[');
    text += std::string(QUARRY_MAX_DEPTH + 1, ']');
    auto r = try_parse(text);
    EXPECT_EQ(r.ec, errc::max_depth_exceeded);
}

TEST(Parser, LazyNumbers) {
    auto v = parse(R"({"n":12.5,"i":7})", ParseOptions::lazy());
    EXPECT_TRUE(v["n"].as_number().is_lazy());
    EXPECT_EQ(v["n"].as_number().raw(), "12.5");
    EXPECT_DOUBLE_EQ(v["n"].as_float(), 12.5);
    EXPECT_EQ(v["i"].as_integer(), 7);
}

TEST(Parser, LazyNumbersEqualEager) {
    const char* text = R"([1, -2.5, 3e2, {"x": 0}])";
    EXPECT_EQ(parse(text, ParseOptions::lazy()), parse(text));
}

TEST(Parser, AsciiEncoding) {
    EXPECT_EQ(parse("[\"ok\"]", ParseOptions::ascii())[0].as_string(), "ok");
    EXPECT_THROW((void)parse("[\"\xC3\xA9\"]", ParseOptions::ascii()), DecodeError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Other inputs
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Parser, FromStream) {
    std::istringstream is(R"({"k": [1, 2, 3]})");
    auto v = parse(is);
    EXPECT_EQ(v["k"][2].as_integer(), 3);
}

TEST(Parser, FromByteSource) {
    MemorySource src("[\"a\", \"b\"]");
    auto v = parse(src);
    EXPECT_EQ(v[1].as_string(), "b");
    EXPECT_EQ(src.consumed(), 10u);
}

TEST(Parser, FromCallerDrivenLexer) {
    Pipeline p("{\"a\": [1]}");
    auto v = parse(p.lexer());
    EXPECT_EQ(v["a"][0].as_integer(), 1);
}

// ═══════════════════════════════════════════════════════════════════════════════
// try_parse
// ═══════════════════════════════════════════════════════════════════════════════

TEST(TryParse, Success) {
    auto r = try_parse("[1,2]");
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.ec);
    EXPECT_EQ(r.value.size(), 2u);
}

TEST(TryParse, SyntaxFault) {
    auto [value, ec, where] = try_parse(R"({"a":})");
    EXPECT_EQ(ec, errc::unexpected_token);
    EXPECT_EQ(where, (Coordinate{1, 6, 5}));
    EXPECT_TRUE(value.is_null());
}

TEST(TryParse, DecodeFault) {
    auto r = try_parse("\x80");
    EXPECT_FALSE(r);
    EXPECT_EQ(r.ec, errc::invalid_continuation);
    EXPECT_EQ(r.coordinate.offset, 0u);
}

TEST(TryParse, Stream) {
    std::istringstream is("[1,");
    auto r = try_parse(is);
    EXPECT_EQ(r.ec, errc::unexpected_end_of_input);
}

TEST(TryParse, MessageFromCategory) {
    auto r = try_parse("[1 2]");
    EXPECT_EQ(r.ec.message(), "unexpected token");
}
