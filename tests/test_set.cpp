/// @file test_set.cpp
/// @brief Unit tests for get(), has(), set() and the edit primitives.

#include <aywson/aywson.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace aywson;

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

const std::string kDoc =
    "{\n"
    "  // server block\n"
    "  \"server\": { \"port\": 8080, \"tags\": [\"a\", \"b\"] },\n"
    "  \"debug\": false, // toggled by ops\n"
    "}";

TEST(Set, GetValues) {
    EXPECT_EQ(get(kDoc, "server.port"), Value(8080));
    EXPECT_EQ(get(kDoc, "server.tags[1]"), Value("b"));
    EXPECT_EQ(get(kDoc, "debug"), Value(false));
    EXPECT_EQ(get(kDoc, "server"),
              Value(Object{{"port", 8080}, {"tags", Array{"a", "b"}}}));
}

TEST(Set, GetMissing) {
    EXPECT_EQ(get(kDoc, "server.host"), std::nullopt);
    EXPECT_EQ(get(kDoc, "server.tags[2]"), std::nullopt);
    EXPECT_EQ(get(kDoc, "debug.x"), std::nullopt);
}

TEST(Set, GetNeverThrows) {
    EXPECT_EQ(get("{ \"a\": ", "a"), std::nullopt);
    EXPECT_EQ(get("", ""), std::nullopt);
    EXPECT_EQ(get("42", ""), Value(42));
}

TEST(Set, Has) {
    EXPECT_TRUE(has(kDoc, "server.tags[0]"));
    EXPECT_TRUE(has(kDoc, ""));
    EXPECT_FALSE(has(kDoc, "missing"));
    EXPECT_FALSE(has("not json", ""));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Writing values
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Set, ReplacesValueInPlace) {
    const std::string out = set(kDoc, "server.port", 9090);
    EXPECT_EQ(out,
              "{\n"
              "  // server block\n"
              "  \"server\": { \"port\": 9090, \"tags\": [\"a\", \"b\"] },\n"
              "  \"debug\": false, // toggled by ops\n"
              "}");
}

TEST(Set, AddsPropertyAfterLast) {
    EXPECT_EQ(set(R"({ "foo": "bar" })", "baz", 123), R"({ "foo": "bar","baz": 123 })");
}

TEST(Set, AddsPropertyToEmptyObject) {
    EXPECT_EQ(set("{}", "a", 1), R"({"a": 1})");
}

TEST(Set, CreatesMissingParents) {
    EXPECT_EQ(set(R"({ "foo": "bar" })", "config.enabled", true),
              R"({ "foo": "bar","config": {"enabled":true} })");
    EXPECT_EQ(set("{}", "list[0].name", "x"), R"({"list": [{"name":"x"}]})");
}

TEST(Set, ObjectValuesAreCompact) {
    EXPECT_EQ(set("{}", "limits", Value(Object{{"max", 10}, {"min", Array{1, 2}}})),
              R"({"limits": {"max":10,"min":[1,2]}})");
}

TEST(Set, EscapesControlCharacters) {
    EXPECT_EQ(set("{}", "s", std::string("a\x0b" "b", 3)), R"({"s": "a\u000bb"})");
    EXPECT_EQ(set("{}", "s", std::string("\x00\x01\x1f", 3)), R"({"s": "\u0000\u0001\u001f"})");
    EXPECT_EQ(set("{}", "s", "\b\t\n"), R"({"s": "\b\t\n"})");
}

TEST(Set, EmptyDocumentBecomesValue) {
    EXPECT_EQ(set("", "a", 1), R"({"a":1})");
    EXPECT_EQ(set("", "", Value(Array{1})), "[1]");
}

TEST(Set, RootReplacement) {
    EXPECT_EQ(set("// keep\n{ \"a\": 1 }\n", "", 5), "// keep\n5\n");
}

TEST(Set, Arrays) {
    EXPECT_EQ(set("[1, 2]", Path{0}, 9), "[9, 2]");
    EXPECT_EQ(set("[1, 2]", Path{2}, 3), "[1, 2,3]");
    EXPECT_EQ(set("[1, 2]", Path{7}, 3), "[1, 2,3]");
    EXPECT_EQ(set("[]", Path{0}, "x"), R"(["x"])");
}

TEST(Set, PreservesCommentsElsewhere) {
    const std::string text =
        "{\n"
        "  // port\n"
        "  \"port\": 8080, // default\n"
        "  /* host */\n"
        "  \"host\": \"localhost\"\n"
        "}";
    EXPECT_EQ(set(text, "host", "0.0.0.0"),
              "{\n"
              "  // port\n"
              "  \"port\": 8080, // default\n"
              "  /* host */\n"
              "  \"host\": \"0.0.0.0\"\n"
              "}");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Refused edits
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Set, ScalarParentThrows) {
    EXPECT_THROW((void)set(R"({"a": 1})", "a.b", 2), EditError);
    try {
        (void)set(R"({"a": "x"})", "a[0]", 2);
        FAIL() << "expected EditError";
    } catch (const EditError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::cannot_edit));
        EXPECT_NE(std::string(e.what()).find("index"), std::string::npos);
    }
}

TEST(Set, KindMismatchThrows) {
    EXPECT_THROW((void)set("[1]", "x", 1), EditError);
    EXPECT_THROW((void)set(R"({"a": 1})", Path{0}, 1), EditError);
}

TEST(Set, InvalidDocumentThrows) {
    EXPECT_THROW((void)set("{\"a\": }", "a", 1), ParseError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Write with comment
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Set, WithCommentOnNewProperty) {
    const std::string text = "{\n  \"a\": 1\n}";
    EXPECT_EQ(set(text, "b", 2, "second"), "{\n  \"a\": 1,\n  // second\n  \"b\": 2\n}");
}

TEST(Set, WithCommentReplacesExisting) {
    const std::string text = "{\n  // old\n  \"a\": 1\n}";
    EXPECT_EQ(set(text, "a", 5, "new"), "{\n  // new\n  \"a\": 5\n}");
}

TEST(Set, WithCommentSkippedOnOpeningLine) {
    EXPECT_EQ(set("{}", "a", 1, "ignored"), R"({"a": 1})");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Edit primitives
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Set, SetEditsProducesOneEdit) {
    const std::string text = R"({"a": 1})";
    const auto edits = set_edits(text, "a", 2);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(edits[0].offset, 6u);
    EXPECT_EQ(edits[0].length, 1u);
    EXPECT_EQ(edits[0].content, "2");
}

TEST(Set, ApplyEditsInAnyOrder) {
    std::vector<Edit> edits{{5, 1, "X"}, {0, 1, "["}, {6, 0, "!"}};
    EXPECT_EQ(apply_edits("{abcdef}", edits), "[abcdX!f}");
}

TEST(Set, ApplyEditsRejectsOverlap) {
    std::vector<Edit> edits{{0, 3, "x"}, {2, 1, "y"}};
    EXPECT_THROW((void)apply_edits("abcdef", edits), EditError);
    EXPECT_THROW((void)apply_edits("abc", {{2, 5, ""}}), EditError);
}
