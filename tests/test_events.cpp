/// @file test_events.cpp
/// @brief Unit tests for the event front-end and its consistency with the
///        tree front-end.

#include <quarry/quarry.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace quarry;

namespace {

std::vector<EventKind> event_kinds(std::string_view text) {
    std::vector<EventKind> out;
    for (const auto& e : read_events(text)) out.push_back(e.kind);
    return out;
}

std::vector<std::string> event_paths(std::string_view text) {
    std::vector<std::string> out;
    for (const auto& e : read_events(text)) out.push_back(e.path.to_string());
    return out;
}

Value rebuild(std::string_view text, const ParseOptions& opts = {}) {
    TreeBuilder builder;
    parse_events(text, [&](const Event& e) { builder.apply(e); }, opts);
    EXPECT_TRUE(builder.complete());
    return builder.release();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Event sequences
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Events, ScenarioSequence) {
    using K = EventKind;
    const std::vector<EventKind> expected = {
        K::StartDocument, K::ObjectBegin,
        K::Key, K::Scalar,
        K::Key, K::ArrayBegin, K::Scalar, K::Scalar, K::ArrayEnd,
        K::ObjectEnd, K::EndDocument};
    EXPECT_EQ(event_kinds(R"({"a":1,"b":[true,null]})"), expected);
}

TEST(Events, Payloads) {
    auto events = read_events(R"({"a":1,"b":[true,null]})");
    ASSERT_EQ(events.size(), 11u);
    EXPECT_EQ(events[2].key, "a");
    EXPECT_EQ(events[3].value.as_integer(), 1);
    EXPECT_EQ(events[4].key, "b");
    EXPECT_TRUE(events[6].value.as_bool());
    EXPECT_TRUE(events[7].value.is_null());
}

TEST(Events, Paths) {
    const std::vector<std::string> expected = {
        "", "", "/a", "/a", "/b", "/b", "/b/0", "/b/1", "/b", "", ""};
    EXPECT_EQ(event_paths(R"({"a":1,"b":[true,null]})"), expected);
}

TEST(Events, PathsOfNestedArraysAndEscapedKeys) {
    const std::vector<std::string> expected = {
        "", "", "/0", "/0/0", "/0", "/1", "/1/a~1b", "/1/a~1b", "/1", "", ""};
    EXPECT_EQ(event_paths(R"([[7],{"a/b":0}])"), expected);
}

TEST(Events, Coordinates) {
    auto events = read_events("{\n \"k\": [1]\n}");
    ASSERT_EQ(events.size(), 8u);
    EXPECT_EQ(events[0].coordinate, (Coordinate{1, 1, 0}));   // start
    EXPECT_EQ(events[1].coordinate, (Coordinate{1, 1, 0}));   // {
    EXPECT_EQ(events[2].coordinate, (Coordinate{2, 2, 3}));   // "k"
    EXPECT_EQ(events[3].coordinate, (Coordinate{2, 7, 8}));   // [
    EXPECT_EQ(events[4].coordinate, (Coordinate{2, 8, 9}));   // 1
    EXPECT_EQ(events[5].coordinate, (Coordinate{2, 9, 10}));  // ]
    EXPECT_EQ(events[6].coordinate, (Coordinate{3, 1, 12}));  // }
    EXPECT_EQ(events[7].coordinate, (Coordinate{3, 2, 13}));  // end
}

TEST(Events, ScalarRoot) {
    using K = EventKind;
    const std::vector<EventKind> expected = {K::StartDocument, K::Scalar, K::EndDocument};
    EXPECT_EQ(event_kinds("\"only\""), expected);
}

TEST(Events, ReaderPullsOneEventAtATime) {
    EventReader reader("[1,2]");
    ASSERT_EQ(reader.next()->kind, EventKind::StartDocument);
    ASSERT_EQ(reader.next()->kind, EventKind::ArrayBegin);
    EXPECT_EQ(reader.depth(), 1u);
    const Event* e = reader.next();
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->value.as_integer(), 1);
    EXPECT_EQ(reader.next()->value.as_integer(), 2);
    EXPECT_EQ(reader.next()->kind, EventKind::ArrayEnd);
    EXPECT_EQ(reader.next()->kind, EventKind::EndDocument);
    EXPECT_EQ(reader.next(), nullptr);
    EXPECT_EQ(reader.next(), nullptr);
}

TEST(Events, StopEarly) {
    EventReader reader("[1, 2, @]");
    // Caller-driven cancellation: the fault behind is never reached.
    for (int i = 0; i < 3; ++i) ASSERT_NE(reader.next(), nullptr);
}

TEST(Events, ReaderOverStream) {
    std::istringstream is("{\"x\": false}");
    EventReader reader(is);
    std::vector<EventKind> kinds;
    while (const Event* e = reader.next()) kinds.push_back(e->kind);
    EXPECT_EQ(kinds.size(), 6u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Faults
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Events, EventsBeforeFaultAreDelivered) {
    EventReader reader(R"({"a":})");
    EXPECT_EQ(reader.next()->kind, EventKind::StartDocument);
    EXPECT_EQ(reader.next()->kind, EventKind::ObjectBegin);
    EXPECT_EQ(reader.next()->kind, EventKind::Key);
    try {
        reader.next();
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.expected(), Expectation::Value);
        EXPECT_EQ(e.coordinate().offset, 5u);
    }
}

TEST(Events, FaultIsTerminal) {
    EventReader reader("[1 2]");
    reader.next();
    reader.next();
    reader.next();
    EXPECT_THROW(reader.next(), SyntaxError);
    EXPECT_THROW(reader.next(), SyntaxError);
}

TEST(Events, EmptyInputIsSyntaxFault) {
    EventReader reader("");
    EXPECT_EQ(reader.next()->kind, EventKind::StartDocument);
    try {
        reader.next();
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.error(), errc::unexpected_end_of_input);
        EXPECT_EQ(e.expected(), Expectation::Value);
    }
}

TEST(Events, DuplicateKeyRejectedLikeTree) {
    ParseOptions opts;
    opts.allow_duplicate_keys = false;
    const char* text = R"({"k":1,"k":2})";
    EXPECT_THROW(parse_events(text, [](const Event&) {}, opts), SyntaxError);
    EXPECT_THROW((void)parse(text, opts), SyntaxError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Consistency with the tree front-end
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Events, ReplayBuildsSameTree) {
    const std::vector<std::string> documents = {
        R"({"a":1,"b":[true,null]})",
        "[]",
        "{}",
        "42",
        R"("text")",
        R"([[[]],[{}],{"x":[1,{"y":[]}]}])",
        R"({"dup":1,"other":2,"dup":3})",
        R"({"users":[{"name":"Ann","age":31.5},{"name":"é😀"}]})",
        "[1e-5, -0, 12345678901234567890, false]",
    };
    for (const auto& doc : documents) {
        EXPECT_EQ(rebuild(doc), parse(doc)) << doc;
    }
}

TEST(Events, ReplayWithLazyNumbers) {
    const char* text = R"({"a":[1.5,2,3e1]})";
    EXPECT_EQ(rebuild(text, ParseOptions::lazy()), parse(text));
}

TEST(Events, SameFaultAsTree) {
    const std::vector<std::string> broken = {
        R"({"a":})", "[1,]", "[1 2]", "{,}", "[", "{\"a\" 1}", "[1]]", "01", "",
    };
    for (const auto& doc : broken) {
        auto tree = try_parse(doc);
        ASSERT_FALSE(tree) << doc;
        try {
            parse_events(doc, [](const Event&) {});
            ADD_FAILURE() << "event front-end accepted: " << doc;
        } catch (const Fault& e) {
            EXPECT_EQ(make_error_code(e.error()), tree.ec) << doc;
            EXPECT_EQ(e.coordinate(), tree.coordinate) << doc;
        }
    }
}

TEST(Events, KindNames) {
    EXPECT_STREQ(event_kind_name(EventKind::ObjectBegin), "object-begin");
    std::ostringstream os;
    os << EventKind::Scalar;
    EXPECT_EQ(os.str(), "scalar");
}
