/// @file test_scanner.cpp
/// @brief Unit tests for the JSONC Scanner (tokens, offsets, trivia).

#include <aywson/aywson.hpp>

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

using namespace aywson;

namespace {

/// Next token that is not whitespace or a line break.
Token scan_past_blanks(Scanner& scanner) {
    Token t = scanner.scan();
    while (t == Token::Whitespace || t == Token::LineBreak) t = scanner.scan();
    return t;
}

std::vector<Token> kinds(std::string_view text) {
    std::vector<Token> out;
    Scanner scanner(text);
    for (Token t = scanner.scan(); t != Token::Eof; t = scanner.scan()) out.push_back(t);
    return out;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Token kinds
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Scanner, StructuralTokens) {
    const std::vector<Token> expected = {
        Token::OpenBrace, Token::String, Token::Colon, Token::OpenBracket,
        Token::Number, Token::Comma, Token::True, Token::Comma, Token::False,
        Token::Comma, Token::Null, Token::CloseBracket, Token::CloseBrace};
    EXPECT_EQ(kinds(R"({"a":[1,true,false,null]})"), expected);
}

TEST(Scanner, TriviaIsReported) {
    const std::vector<Token> expected = {
        Token::OpenBrace, Token::Whitespace, Token::LineComment, Token::LineBreak,
        Token::BlockComment, Token::LineBreak, Token::CloseBrace};
    EXPECT_EQ(kinds("{ // note\n/* block */\r\n}"), expected);
}

TEST(Scanner, CrLfIsOneLineBreak) {
    Scanner scanner("\r\n");
    EXPECT_EQ(scanner.scan(), Token::LineBreak);
    EXPECT_EQ(scanner.length(), 2u);
    EXPECT_EQ(scanner.scan(), Token::Eof);
}

TEST(Scanner, CommentsAreSeparateTokens) {
    Scanner scanner("  // c\n  /* d */ 42");
    EXPECT_EQ(scan_past_blanks(scanner), Token::LineComment);
    EXPECT_EQ(scanner.text(), "// c");
    EXPECT_EQ(scan_past_blanks(scanner), Token::BlockComment);
    EXPECT_EQ(scanner.text(), "/* d */");
    EXPECT_EQ(scan_past_blanks(scanner), Token::Number);
    EXPECT_EQ(scanner.text(), "42");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Offsets
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Scanner, OffsetsAndLengths) {
    Scanner scanner(R"(  "key" : -1.5e3)");
    EXPECT_EQ(scan_past_blanks(scanner), Token::String);
    EXPECT_EQ(scanner.offset(), 2u);
    EXPECT_EQ(scanner.length(), 5u);
    EXPECT_EQ(scan_past_blanks(scanner), Token::Colon);
    EXPECT_EQ(scanner.offset(), 8u);
    EXPECT_EQ(scan_past_blanks(scanner), Token::Number);
    EXPECT_EQ(scanner.text(), "-1.5e3");
    EXPECT_EQ(scanner.end(), 16u);
}

TEST(Scanner, StartOffset) {
    std::string_view text = "[1, 2]";
    Scanner scanner(text, 4);
    EXPECT_EQ(scanner.scan(), Token::Number);
    EXPECT_EQ(scanner.text(), "2");
    EXPECT_EQ(scanner.offset(), 4u);
    EXPECT_EQ(scanner.scan(), Token::CloseBracket);
    EXPECT_EQ(scanner.scan(), Token::Eof);
}

TEST(Scanner, EscapedQuoteStaysInsideString) {
    Scanner scanner(R"("a\"b" x)");
    EXPECT_EQ(scanner.scan(), Token::String);
    EXPECT_EQ(scanner.text(), R"("a\"b")");
    EXPECT_EQ(scanner.error(), ScanError::None);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Malformed input
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Scanner, UnterminatedString) {
    Scanner scanner("\"abc\n");
    EXPECT_EQ(scanner.scan(), Token::String);
    EXPECT_EQ(scanner.error(), ScanError::UnterminatedString);
}

TEST(Scanner, UnterminatedComment) {
    Scanner scanner("/* open");
    EXPECT_EQ(scanner.scan(), Token::BlockComment);
    EXPECT_EQ(scanner.error(), ScanError::UnterminatedComment);
    EXPECT_EQ(scanner.end(), 7u);
}

TEST(Scanner, InvalidNumber) {
    for (std::string_view bad : {"-", "1.", "1e", "-x"}) {
        Scanner scanner(bad);
        EXPECT_EQ(scanner.scan(), Token::Number) << bad;
        EXPECT_EQ(scanner.error(), ScanError::InvalidNumber) << bad;
    }
}

TEST(Scanner, UnknownWordsAndCharacters) {
    Scanner scanner("nil @");
    EXPECT_EQ(scanner.scan(), Token::Unknown);
    EXPECT_EQ(scanner.text(), "nil");
    EXPECT_EQ(scanner.error(), ScanError::InvalidLiteral);
    EXPECT_EQ(scanner.scan(), Token::Whitespace);
    EXPECT_EQ(scanner.scan(), Token::Unknown);
    EXPECT_EQ(scanner.error(), ScanError::InvalidCharacter);
}

TEST(Scanner, TriviaPredicates) {
    EXPECT_TRUE(is_trivia(Token::LineBreak));
    EXPECT_TRUE(is_trivia(Token::BlockComment));
    EXPECT_FALSE(is_trivia(Token::Comma));
    EXPECT_TRUE(is_comment(Token::LineComment));
    EXPECT_FALSE(is_comment(Token::Whitespace));
}
