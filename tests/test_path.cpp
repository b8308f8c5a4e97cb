/// @file test_path.cpp
/// @brief Unit tests for Segment, Path and parse_path().

#include <aywson/aywson.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace aywson;

// ═══════════════════════════════════════════════════════════════════════════════
// Segments
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Path, SegmentKinds) {
    Segment key("name");
    Segment index(3);
    EXPECT_TRUE(key.is_key());
    EXPECT_EQ(key.key(), "name");
    EXPECT_TRUE(index.is_index());
    EXPECT_EQ(index.index(), 3u);
}

TEST(Path, SegmentEqualityIsTypeSensitive) {
    EXPECT_EQ(Segment("a"), Segment(std::string("a")));
    EXPECT_NE(Segment("0"), Segment(0));
    EXPECT_EQ(Segment(std::size_t{2}), Segment(2));
}

TEST(Path, NegativeIndexThrows) {
    EXPECT_THROW(Segment(-1), OutOfRangeError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Notation
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Path, EmptyNotationIsRoot) {
    EXPECT_TRUE(parse_path("").empty());
    EXPECT_TRUE(parse_path(".").empty());
    EXPECT_TRUE(Path().empty());
}

TEST(Path, DotAndBracketAreEquivalent) {
    const Path dotted = parse_path("a.b.2");
    const Path bracketed = parse_path("a.b[2]");
    EXPECT_EQ(dotted, bracketed);
    ASSERT_EQ(dotted.size(), 3u);
    EXPECT_TRUE(dotted[2].is_index());
    EXPECT_EQ(dotted[2].index(), 2u);
}

TEST(Path, DigitsOnlyTokensAreIndices) {
    const Path p = parse_path("items[0].tags.-1");
    ASSERT_EQ(p.size(), 4u);
    EXPECT_TRUE(p[0].is_key());
    EXPECT_TRUE(p[1].is_index());
    EXPECT_TRUE(p[2].is_key());
    EXPECT_TRUE(p[3].is_key());
    EXPECT_EQ(p[3].key(), "-1");
}

TEST(Path, EmptyTokensAreSkipped) {
    EXPECT_EQ(parse_path("a..b"), (Path{"a", "b"}));
    EXPECT_EQ(parse_path("[0][1]"), (Path{0, 1}));
}

TEST(Path, OversizedIndexThrows) {
    EXPECT_THROW(parse_path("a.99999999999999999999999"), OutOfRangeError);
}

TEST(Path, ImplicitConstructionFromStrings) {
    const std::string s = "server.port";
    const Path from_string = s;
    const Path from_literal = "server.port";
    EXPECT_EQ(from_string, from_literal);
    EXPECT_EQ(from_literal, (Path{"server", "port"}));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Manipulation
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Path, ParentAppendWithLast) {
    const Path p{"a", "b", 0};
    EXPECT_EQ(p.parent(), (Path{"a", "b"}));
    EXPECT_EQ(Path().parent(), Path());
    EXPECT_EQ(p.parent().append("c"), (Path{"a", "b", "c"}));
    EXPECT_EQ((Path{"a", "b"}.with_last("z")), (Path{"a", "z"}));
    EXPECT_EQ(p.back(), Segment(0));
}

TEST(Path, ToString) {
    EXPECT_EQ((Path{"config", "items", 0, "name"}).to_string(), "config.items[0].name");
    EXPECT_EQ((Path{0, 1}).to_string(), "[0][1]");
    EXPECT_EQ(Path().to_string(), "");
}

TEST(Path, ExplicitSegmentVector) {
    std::vector<Segment> segments{"a", 1};
    const Path p(segments);
    EXPECT_EQ(p, (Path{"a", 1}));
}
