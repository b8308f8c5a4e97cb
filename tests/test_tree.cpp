/// @file test_tree.cpp
/// @brief Unit tests for the syntax tree: parse_tree(), parse(), find_node().

#include <aywson/aywson.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using namespace aywson;

// ═══════════════════════════════════════════════════════════════════════════════
// Decoding with parse()
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Tree, ParsePrimitives) {
    EXPECT_TRUE(parse("null").is_null());
    EXPECT_EQ(parse("true").as_bool(), true);
    EXPECT_EQ(parse("-100").as_integer(), -100);
    EXPECT_DOUBLE_EQ(parse("1.5e10").as_float(), 1.5e10);
    EXPECT_EQ(parse(R"("text")").as_string(), "text");
}

TEST(Tree, ParseIntegerLimits) {
    EXPECT_EQ(parse("9223372036854775807").as_integer(), std::numeric_limits<int64_t>::max());
    const auto big = parse("18446744073709551615");
    EXPECT_TRUE(big.is_uinteger());
    EXPECT_EQ(big.as_uinteger(), std::numeric_limits<uint64_t>::max());
    EXPECT_TRUE(parse("18446744073709551616").is_float());
}

TEST(Tree, ParseStringEscapes) {
    EXPECT_EQ(parse(R"("a\nb\t\"\\\/")").as_string(), "a\nb\t\"\\/");
    EXPECT_EQ(parse(R"("\u00e9")").as_string(), "\xC3\xA9");
    EXPECT_EQ(parse(R"("\ud83d\ude00")").as_string(), "\xF0\x9F\x98\x80");
}

TEST(Tree, ParseAcceptsCommentsAndTrailingCommas) {
    const auto v = parse(R"(
        // leading
        {
            "a": 1, /* inline */
            "b": [1, 2,],
        }
        // trailing
    )");
    EXPECT_EQ(v, Value(Object{{"a", 1}, {"b", Array{1, 2}}}));
}

TEST(Tree, DuplicateKeysLastWins) {
    EXPECT_EQ(parse(R"({"a": 1, "a": 2})")["a"].as_integer(), 2);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Tree, ErrorReportsLocation) {
    try {
        (void)parse("{\n  \"a\" 1\n}");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.location().line, 2u);
        EXPECT_EQ(e.location().column, 7u);
        EXPECT_EQ(e.location().offset, 8u);
    }
}

TEST(Tree, ErrorCodes) {
    auto code_of = [](const char* text) { return try_parse(text).ec; };
    EXPECT_EQ(code_of("{"), make_error_code(errc::unexpected_end_of_input));
    EXPECT_EQ(code_of(R"("abc)"), make_error_code(errc::unterminated_string));
    EXPECT_EQ(code_of("/* x"), make_error_code(errc::unterminated_comment));
    EXPECT_EQ(code_of("1 2"), make_error_code(errc::trailing_content));
    EXPECT_EQ(code_of("01"), make_error_code(errc::trailing_content));
    EXPECT_EQ(code_of("1."), make_error_code(errc::invalid_number));
    EXPECT_EQ(code_of(R"("\q")"), make_error_code(errc::invalid_escape));
    EXPECT_EQ(code_of(R"("\u12")"), make_error_code(errc::invalid_unicode_escape));
    EXPECT_EQ(code_of("[1 2]"), make_error_code(errc::unexpected_character));
    EXPECT_EQ(code_of("{1: 2}"), make_error_code(errc::unexpected_character));
    EXPECT_EQ(code_of("[,]"), make_error_code(errc::unexpected_character));
    EXPECT_EQ(code_of("tru"), make_error_code(errc::invalid_literal));
    EXPECT_EQ(code_of("{\"a\": undefined}"), make_error_code(errc::invalid_literal));
}

TEST(Tree, InvalidLiteralMessage) {
    try {
        (void)parse("[nul]");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::invalid_literal));
        EXPECT_EQ(e.location().offset, 1u);
        EXPECT_NE(std::string(e.what()).find("nul"), std::string::npos);
    }
}

TEST(Tree, EmptyDocumentHasNoValue) {
    EXPECT_EQ(parse_tree(""), nullptr);
    EXPECT_EQ(parse_tree("  // only a comment\n"), nullptr);
    EXPECT_THROW((void)parse(""), ParseError);
}

TEST(Tree, TryParseTreeNeverThrows) {
    auto bad = try_parse_tree("{\"a\": }");
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.value, nullptr);

    auto good = try_parse_tree("[]");
    ASSERT_TRUE(good);
    EXPECT_EQ(good.value->type, NodeType::Array);
}

TEST(Tree, DepthLimit) {
    std::string deep(20, '[');
    deep += std::string(20, ']');
    EXPECT_NO_THROW((void)parse(deep));

    auto r = try_parse(deep, ParseOptions::limited(0, 10));
    EXPECT_EQ(r.ec, make_error_code(errc::max_depth_exceeded));
}

TEST(Tree, SizeLimit) {
    auto r = try_parse("[1, 2, 3]", ParseOptions::limited(4, 0));
    EXPECT_EQ(r.ec, make_error_code(errc::input_too_large));
    EXPECT_TRUE(try_parse("[1]", ParseOptions::limited(4, 0)));
    EXPECT_EQ(ParseOptions::defaults().effective_depth(), std::size_t{AYWSON_MAX_DEPTH});
}

// ═══════════════════════════════════════════════════════════════════════════════
// Node structure
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Tree, NodeOffsets) {
    const std::string text = R"({ "key": [10, "x"] })";
    const auto root = parse_tree(text);
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->type, NodeType::Object);
    EXPECT_EQ(root->offset, 0u);
    EXPECT_EQ(root->length, text.size());

    ASSERT_EQ(root->children.size(), 1u);
    const Node& prop = *root->children[0];
    EXPECT_EQ(prop.type, NodeType::Property);
    EXPECT_EQ(prop.key(), "key");
    EXPECT_EQ(text.substr(prop.offset, prop.length), R"("key": [10, "x"])");
    EXPECT_EQ(prop.parent, root.get());

    const Node* arr = prop.value_node();
    ASSERT_NE(arr, nullptr);
    EXPECT_EQ(arr->type, NodeType::Array);
    EXPECT_EQ(arr->parent, &prop);
    ASSERT_EQ(arr->children.size(), 2u);
    EXPECT_EQ(text.substr(arr->children[1]->offset, arr->children[1]->length), R"("x")");
    EXPECT_EQ(arr->children[1]->value.as_string(), "x");
}

TEST(Tree, FindNode) {
    const std::string text = R"({"a": {"b": [1, {"c": true}]}, "a": 5})";
    const auto root = parse_tree(text);

    const Node* c = find_node(root.get(), "a.b[1].c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->type, NodeType::Boolean);

    // First occurrence of a duplicate key is the one edited.
    const Node* a = find_node(root.get(), "a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->type, NodeType::Object);

    EXPECT_EQ(find_node(root.get(), ""), root.get());
    EXPECT_EQ(find_node(root.get(), "a.b[2]"), nullptr);
    EXPECT_EQ(find_node(root.get(), "a.b.x"), nullptr);
    EXPECT_EQ(find_node(root.get(), "a.0"), nullptr);
    EXPECT_EQ(find_node(nullptr, "a"), nullptr);
}

TEST(Tree, ObjectKeysInDocumentOrder) {
    const auto root = parse_tree(R"({"z": 1, "a": 2, "m": 3})");
    EXPECT_EQ(object_keys(root.get()), (std::vector<std::string>{"z", "a", "m"}));
    EXPECT_TRUE(object_keys(find_node(root.get(), "z")).empty());
}

TEST(Tree, NodeValue) {
    const auto root = parse_tree(R"({"list": [1, 2.5, null], "flag": false})");
    EXPECT_EQ(node_value(*root->children[0]), Value(Array{1, 2.5, nullptr}));
    EXPECT_EQ(node_value(*find_node(root.get(), "flag")), Value(false));
}
