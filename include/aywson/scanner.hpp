#pragma once

/// @file scanner.hpp
/// @brief JSONC tokenizer with byte offsets.
///
/// Produces every token of the document, trivia included (whitespace,
/// line breaks, comments), so callers can reason about the exact bytes
/// between two structural tokens. Malformed input never throws here; it
/// yields Token::Unknown or a token flagged with a ScanError and the tree
/// builder decides what to do with it.

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace aywson {

enum class Token : uint8_t {
    OpenBrace,
    CloseBrace,
    OpenBracket,
    CloseBracket,
    Comma,
    Colon,
    String,
    Number,
    True,
    False,
    Null,
    LineComment,
    BlockComment,
    LineBreak,
    Whitespace,
    Unknown,
    Eof
};

enum class ScanError : uint8_t {
    None,
    UnterminatedString,
    UnterminatedComment,
    InvalidNumber,
    InvalidLiteral,
    InvalidCharacter
};

inline bool is_trivia(Token t) noexcept {
    return t == Token::Whitespace || t == Token::LineBreak ||
           t == Token::LineComment || t == Token::BlockComment;
}

inline bool is_comment(Token t) noexcept {
    return t == Token::LineComment || t == Token::BlockComment;
}

/// @brief Single-pass JSONC scanner over a borrowed text buffer.
class Scanner {
public:
    explicit Scanner(std::string_view text, size_t start = 0) noexcept
        : text_(text), pos_(start) {}

    /// Advance to the next token (trivia included) and return its kind.
    Token scan() noexcept {
        offset_ = pos_;
        error_ = ScanError::None;
        if (pos_ >= text_.size()) {
            length_ = 0;
            return token_ = Token::Eof;
        }
        const char c = text_[pos_];
        switch (c) {
            case ' ': case '\t': case '\v': case '\f':
                while (pos_ < text_.size() && is_blank(text_[pos_])) ++pos_;
                return finish(Token::Whitespace);
            case '\n':
                ++pos_;
                return finish(Token::LineBreak);
            case '\r':
                ++pos_;
                if (pos_ < text_.size() && text_[pos_] == '\n') ++pos_;
                return finish(Token::LineBreak);
            case '{': ++pos_; return finish(Token::OpenBrace);
            case '}': ++pos_; return finish(Token::CloseBrace);
            case '[': ++pos_; return finish(Token::OpenBracket);
            case ']': ++pos_; return finish(Token::CloseBracket);
            case ',': ++pos_; return finish(Token::Comma);
            case ':': ++pos_; return finish(Token::Colon);
            case '"':
                scan_string();
                return finish(Token::String);
            case '/':
                return scan_comment();
            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                scan_number();
                return finish(Token::Number);
            default:
                break;
        }
        if (is_word_char(c)) {
            const size_t start = pos_;
            while (pos_ < text_.size() && is_word_char(text_[pos_])) ++pos_;
            const auto word = text_.substr(start, pos_ - start);
            if (word == "true")  return finish(Token::True);
            if (word == "false") return finish(Token::False);
            if (word == "null")  return finish(Token::Null);
            error_ = ScanError::InvalidLiteral;
            return finish(Token::Unknown);
        }
        ++pos_;
        error_ = ScanError::InvalidCharacter;
        return finish(Token::Unknown);
    }

    [[nodiscard]] Token token() const noexcept { return token_; }
    [[nodiscard]] size_t offset() const noexcept { return offset_; }
    [[nodiscard]] size_t length() const noexcept { return length_; }
    [[nodiscard]] size_t end() const noexcept { return offset_ + length_; }
    [[nodiscard]] ScanError error() const noexcept { return error_; }
    [[nodiscard]] std::string_view text() const noexcept {
        return text_.substr(offset_, length_);
    }

private:
    std::string_view text_;
    size_t pos_;
    size_t offset_ = 0;
    size_t length_ = 0;
    Token token_ = Token::Eof;
    ScanError error_ = ScanError::None;

    static bool is_blank(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\v' || c == '\f';
    }

    static bool is_digit(char c) noexcept {
        return static_cast<unsigned>(c - '0') <= 9u;
    }

    static bool is_word_char(char c) noexcept {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               is_digit(c) || c == '_' || c == '$';
    }

    Token finish(Token t) noexcept {
        length_ = pos_ - offset_;
        return token_ = t;
    }

    void scan_string() noexcept {
        ++pos_;  // opening quote
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '"') { ++pos_; return; }
            if (c == '\\') {
                pos_ += 2;
                continue;
            }
            if (c == '\n' || c == '\r') break;
            ++pos_;
        }
        if (pos_ > text_.size()) pos_ = text_.size();
        error_ = ScanError::UnterminatedString;
    }

    void scan_number() noexcept {
        if (text_[pos_] == '-') ++pos_;
        const size_t int_start = pos_;
        if (pos_ < text_.size() && text_[pos_] == '0') {
            ++pos_;
        } else {
            while (pos_ < text_.size() && is_digit(text_[pos_])) ++pos_;
        }
        if (pos_ == int_start) {
            error_ = ScanError::InvalidNumber;
            return;
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            const size_t frac_start = pos_;
            while (pos_ < text_.size() && is_digit(text_[pos_])) ++pos_;
            if (pos_ == frac_start) {
                error_ = ScanError::InvalidNumber;
                return;
            }
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            const size_t exp_start = pos_;
            while (pos_ < text_.size() && is_digit(text_[pos_])) ++pos_;
            if (pos_ == exp_start) error_ = ScanError::InvalidNumber;
        }
    }

    Token scan_comment() noexcept {
        if (pos_ + 1 < text_.size() && text_[pos_ + 1] == '/') {
            pos_ += 2;
            while (pos_ < text_.size() && text_[pos_] != '\n' && text_[pos_] != '\r') ++pos_;
            return finish(Token::LineComment);
        }
        if (pos_ + 1 < text_.size() && text_[pos_ + 1] == '*') {
            pos_ += 2;
            while (pos_ + 1 < text_.size()) {
                if (text_[pos_] == '*' && text_[pos_ + 1] == '/') {
                    pos_ += 2;
                    return finish(Token::BlockComment);
                }
                ++pos_;
            }
            pos_ = text_.size();
            error_ = ScanError::UnterminatedComment;
            return finish(Token::BlockComment);
        }
        ++pos_;
        error_ = ScanError::InvalidCharacter;
        return finish(Token::Unknown);
    }
};

} // namespace aywson
