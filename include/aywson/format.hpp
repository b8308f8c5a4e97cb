#pragma once

/// @file format.hpp
/// @brief Whitespace re-rendering that keeps every comment.
///
/// Layout rules:
///   - one entry per line, indented by nesting depth
///   - one space after ':'
///   - empty containers stay on one line ({} and [])
///   - a comment that shared a line with the token before it stays on that
///     line; any other comment gets a line of its own
///
/// Token text (strings, numbers, comments) is copied verbatim, so the
/// decoded value never changes.

#include "comments.hpp"
#include "options.hpp"
#include "scanner.hpp"
#include "tree.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace aywson {

namespace detail {

struct FormatToken {
    Token kind;
    std::string_view text;
    bool line_break_before = false;  ///< Source had a line break since the previous token
};

inline std::vector<FormatToken> format_tokens(std::string_view text) {
    std::vector<FormatToken> tokens;
    Scanner scanner(text);
    bool line_break = false;
    for (Token t = scanner.scan(); t != Token::Eof; t = scanner.scan()) {
        if (t == Token::Whitespace) continue;
        if (t == Token::LineBreak) {
            line_break = true;
            continue;
        }
        auto tok = scanner.text();
        if (t == Token::LineComment) tok = trim_right(tok);
        tokens.push_back({t, tok, line_break});
        // A block comment spanning lines counts as a break for what follows.
        line_break = t == Token::BlockComment && tok.find('\n') != std::string_view::npos;
    }
    return tokens;
}

class Formatter {
public:
    Formatter(std::string& out, const FormatOptions& opts)
        : out_(out), opts_(opts), unit_(opts.indent_unit()) {}

    void write(const std::vector<FormatToken>& tokens) {
        const FormatToken* prev = nullptr;
        for (const auto& tok : tokens) {
            const bool closer = tok.kind == Token::CloseBrace || tok.kind == Token::CloseBracket;
            if (closer && depth_ > 0) --depth_;
            if (prev) separate(*prev, tok);
            out_.append(tok.text);
            if (tok.kind == Token::OpenBrace || tok.kind == Token::OpenBracket) ++depth_;
            prev = &tok;
        }
        if (opts_.insert_final_newline && !tokens.empty()) out_ += opts_.eol;
    }

private:
    std::string& out_;
    const FormatOptions& opts_;
    std::string unit_;
    size_t depth_ = 0;

    void newline() {
        out_ += opts_.eol;
        for (size_t i = 0; i < depth_; ++i) out_ += unit_;
    }

    static bool is_opener(Token t) noexcept {
        return t == Token::OpenBrace || t == Token::OpenBracket;
    }

    void separate(const FormatToken& prev, const FormatToken& tok) {
        const Token p = prev.kind;
        const Token t = tok.kind;

        if (t == Token::CloseBrace || t == Token::CloseBracket) {
            if (!is_opener(p)) newline();
            return;
        }
        if (is_comment(t)) {
            if (tok.line_break_before || p == Token::LineComment) newline();
            else out_.push_back(' ');
            return;
        }
        if (p == Token::LineComment) {
            newline();
            return;
        }
        if (t == Token::Comma || t == Token::Colon) return;
        switch (p) {
            case Token::OpenBrace:
            case Token::OpenBracket:
            case Token::Comma:
                newline();
                return;
            case Token::BlockComment:
                if (tok.line_break_before) newline();
                else out_.push_back(' ');
                return;
            default:
                break;
        }
        out_.push_back(' ');
    }
};

} // namespace detail

/// @brief Re-render the document's whitespace.
/// @throws ParseError if the document is not valid JSONC
[[nodiscard]] inline std::string format(std::string_view text, const FormatOptions& opts = {}) {
    (void)parse_tree(text);  // validate structure; tokens below assume it
    std::string out;
    out.reserve(text.size() + text.size() / 4);
    detail::Formatter(out, opts).write(detail::format_tokens(text));
    return out;
}

} // namespace aywson
