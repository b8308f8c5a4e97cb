#pragma once

/// @file tree.hpp
/// @brief Offset-carrying syntax tree for JSONC documents.
///
/// Features:
///   - Every node records its byte offset and length in the source text
///   - Owned children, non-owning parent pointers; one tree per call
///   - Comments and trailing commas accepted
///   - Exception-free entry point via try_parse_tree() with error_code
///   - Recursion depth limiting to protect against stack overflow
///
/// The tree is rebuilt from scratch for every document operation and is
/// never mutated after construction.

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "options.hpp"
#include "path.hpp"
#include "scanner.hpp"
#include "value.hpp"

#include <charconv>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace aywson {

enum class NodeType : uint8_t {
    Object,
    Array,
    Property,
    String,
    Number,
    Boolean,
    Null
};

/// @brief One element of the syntax tree.
///
/// A Property node spans from the first byte of its key to the last byte
/// of its value; children[0] is the key (a String node), children[1] the
/// value. Container nodes span their braces/brackets inclusively.
struct Node {
    NodeType type = NodeType::Null;
    size_t offset = 0;
    size_t length = 0;
    Node* parent = nullptr;
    std::vector<std::unique_ptr<Node>> children;
    Value value;  ///< Decoded scalar (String/Number/Boolean/Null nodes only)

    [[nodiscard]] size_t end() const noexcept { return offset + length; }

    [[nodiscard]] bool is_container() const noexcept {
        return type == NodeType::Object || type == NodeType::Array;
    }

    /// Key node of a property.
    [[nodiscard]] const Node* key_node() const noexcept {
        return type == NodeType::Property && !children.empty() ? children[0].get() : nullptr;
    }

    /// Value node of a property.
    [[nodiscard]] const Node* value_node() const noexcept {
        return type == NodeType::Property && children.size() == 2 ? children[1].get() : nullptr;
    }

    /// Decoded key of a property (empty for other nodes).
    [[nodiscard]] std::string_view key() const noexcept {
        const Node* k = key_node();
        return k && k->value.is_string() ? k->value.as_string_view() : std::string_view{};
    }
};

namespace detail {

/// @brief Recursive-descent builder over the scanner's token stream.
class TreeBuilder {
public:
    TreeBuilder(std::string_view text, size_t max_depth) noexcept
        : text_(text), scanner_(text), max_depth_(max_depth) {}

    std::unique_ptr<Node> build() {
        next();
        if (token_ == Token::Eof) return nullptr;  // empty or comment-only document
        auto root = parse_value(nullptr);
        next();
        if (token_ != Token::Eof)
            error("unexpected trailing content", errc::trailing_content);
        return root;
    }

private:
    std::string_view text_;
    Scanner scanner_;
    Token token_ = Token::Eof;
    size_t depth_ = 0;
    size_t max_depth_;

    // ─── Error reporting ──────────────────────────────────────────────────

    [[nodiscard]] SourceLocation location(size_t offset) const noexcept {
        SourceLocation loc;
        loc.offset = offset;
        for (size_t i = 0; i < offset && i < text_.size(); ++i) {
            if (text_[i] == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

    [[noreturn]] AYWSON_NOINLINE void error(const std::string& msg,
                                            errc code = errc::unexpected_character) {
        throw ParseError(msg, location(scanner_.offset()), code);
    }

    [[noreturn]] AYWSON_NOINLINE void error_unexpected() {
        if (token_ == Token::Eof)
            error("unexpected end of input", errc::unexpected_end_of_input);
        error("unexpected '" + std::string(scanner_.text()) + "'");
    }

    /// Next structural token; scan errors (in comments too) become parse
    /// errors here.
    void next() {
        do {
            token_ = scanner_.scan();
            check_scan();
        } while (is_trivia(token_));
    }

    void check_scan() {
        switch (scanner_.error()) {
            case ScanError::None: break;
            case ScanError::UnterminatedString:
                error("unterminated string", errc::unterminated_string);
            case ScanError::UnterminatedComment:
                error("unterminated block comment", errc::unterminated_comment);
            case ScanError::InvalidNumber:
                error("invalid number '" + std::string(scanner_.text()) + "'", errc::invalid_number);
            case ScanError::InvalidLiteral:
                error("invalid literal '" + std::string(scanner_.text()) + "'", errc::invalid_literal);
            case ScanError::InvalidCharacter:
                error("unexpected '" + std::string(scanner_.text()) + "'");
        }
    }

    std::unique_ptr<Node> make(NodeType type, Node* parent) const {
        auto node = std::make_unique<Node>();
        node->type = type;
        node->parent = parent;
        node->offset = scanner_.offset();
        node->length = scanner_.length();
        return node;
    }

    // ─── Value parsing ───────────────────────────────────────────────────

    std::unique_ptr<Node> parse_value(Node* parent) {
        switch (token_) {
            case Token::OpenBrace:   return parse_object(parent);
            case Token::OpenBracket: return parse_array(parent);
            case Token::String: {
                auto node = make(NodeType::String, parent);
                node->value = decode_string(scanner_.text());
                return node;
            }
            case Token::Number: {
                auto node = make(NodeType::Number, parent);
                node->value = decode_number(scanner_.text());
                return node;
            }
            case Token::True:
            case Token::False: {
                auto node = make(NodeType::Boolean, parent);
                node->value = token_ == Token::True;
                return node;
            }
            case Token::Null:
                return make(NodeType::Null, parent);
            default:
                error_unexpected();
        }
    }

    std::unique_ptr<Node> parse_object(Node* parent) {
        auto obj = make(NodeType::Object, parent);
        push_depth();
        next();
        while (token_ != Token::CloseBrace) {
            if (token_ != Token::String) error_unexpected();
            auto prop = make(NodeType::Property, obj.get());
            auto key = make(NodeType::String, prop.get());
            key->value = decode_string(scanner_.text());
            prop->children.push_back(std::move(key));

            next();
            if (token_ != Token::Colon) error("expected ':'", errc::unexpected_character);
            next();
            prop->children.push_back(parse_value(prop.get()));
            prop->length = prop->children[1]->end() - prop->offset;
            obj->children.push_back(std::move(prop));

            next();
            if (token_ == Token::Comma) {
                next();  // a trailing comma before '}' is allowed
            } else if (token_ != Token::CloseBrace) {
                error_unexpected();
            }
        }
        obj->length = scanner_.end() - obj->offset;
        --depth_;
        return obj;
    }

    std::unique_ptr<Node> parse_array(Node* parent) {
        auto arr = make(NodeType::Array, parent);
        push_depth();
        next();
        while (token_ != Token::CloseBracket) {
            arr->children.push_back(parse_value(arr.get()));
            next();
            if (token_ == Token::Comma) {
                next();
            } else if (token_ != Token::CloseBracket) {
                error_unexpected();
            }
        }
        arr->length = scanner_.end() - arr->offset;
        --depth_;
        return arr;
    }

    void push_depth() {
        if (AYWSON_UNLIKELY(++depth_ > max_depth_))
            error("maximum nesting depth exceeded", errc::max_depth_exceeded);
    }

    // ─── Scalar decoding ─────────────────────────────────────────────────

    uint32_t read_hex4(std::string_view s, size_t& i) {
        if (i + 4 > s.size())
            error("incomplete unicode escape", errc::invalid_unicode_escape);
        uint32_t cp = 0;
        for (size_t k = 0; k < 4; ++k) {
            const int nib = utf8::hex_value(s[i + k]);
            if (nib < 0) error("invalid hex digit in unicode escape", errc::invalid_unicode_escape);
            cp = (cp << 4) | static_cast<uint32_t>(nib);
        }
        i += 4;
        return cp;
    }

    /// Decode a quoted string token (quotes included).
    std::string decode_string(std::string_view tok) {
        std::string out;
        const auto body = tok.substr(1, tok.size() - 2);
        out.reserve(body.size());
        for (size_t i = 0; i < body.size(); ++i) {
            const char c = body[i];
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (++i >= body.size()) error("unterminated escape sequence", errc::invalid_escape);
            switch (body[i]) {
                case '"':  out.push_back('"');  break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/');  break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u': {
                    ++i;
                    uint32_t cp = read_hex4(body, i);
                    if (utf8::is_high_surrogate(cp) && i + 1 < body.size() &&
                        body[i] == '\\' && body[i + 1] == 'u') {
                        size_t j = i + 2;
                        const uint32_t low = read_hex4(body, j);
                        if (utf8::is_low_surrogate(low)) {
                            cp = utf8::combine_surrogates(cp, low);
                            i = j;
                        }
                    }
                    utf8::encode(cp, out);
                    --i;  // loop increment
                    break;
                }
                default:
                    error(std::string("invalid escape '\\") + body[i] + "'", errc::invalid_escape);
            }
        }
        return out;
    }

    Value decode_number(std::string_view tok) {
        const char* first = tok.data();
        const char* last = tok.data() + tok.size();
        if (tok.find_first_of(".eE") == std::string_view::npos) {
            int64_t i = 0;
            auto [p, ec] = std::from_chars(first, last, i);
            if (ec == std::errc{} && p == last) return Value(i);
            if (tok[0] != '-') {
                uint64_t u = 0;
                auto [pu, ecu] = std::from_chars(first, last, u);
                if (ecu == std::errc{} && pu == last) return Value(u);
            }
        }
        double d = 0.0;
        auto [p, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || p != last)
            error("invalid number '" + std::string(tok) + "'", errc::invalid_number);
        return Value(d);
    }
};

} // namespace detail

// ─── Tree construction ──────────────────────────────────────────────────

/// @brief Build the syntax tree (throws ParseError).
/// Returns nullptr for a document holding no value (empty or comments only).
[[nodiscard]] inline std::unique_ptr<Node> parse_tree(std::string_view text,
                                                      const ParseOptions& opts = {}) {
    return detail::TreeBuilder(text, opts.effective_depth()).build();
}

/// @brief Build the syntax tree (no exceptions, error_code).
[[nodiscard]] inline result<std::unique_ptr<Node>> try_parse_tree(
        std::string_view text, const ParseOptions& opts = {}) noexcept {
    try {
        return {parse_tree(text, opts), {}};
    } catch (const ParseError& e) {
        return {nullptr, e.code()};
    } catch (const std::bad_alloc&) {
        return {nullptr, std::make_error_code(std::errc::not_enough_memory)};
    }
}

// ─── Navigation ─────────────────────────────────────────────────────────

/// @brief Locate the value node at path, or nullptr.
///
/// Key segments match the first property with that key; index segments
/// must be in range. A key never matches an array and an index never
/// matches an object.
[[nodiscard]] inline const Node* find_node(const Node* root, const Path& path) noexcept {
    const Node* node = root;
    for (const auto& seg : path) {
        if (!node) return nullptr;
        if (seg.is_key()) {
            if (node->type != NodeType::Object) return nullptr;
            const Node* found = nullptr;
            for (const auto& prop : node->children) {
                if (prop->value_node() && prop->key() == seg.key()) {
                    found = prop->value_node();
                    break;
                }
            }
            node = found;
        } else {
            if (node->type != NodeType::Array || seg.index() >= node->children.size())
                return nullptr;
            node = node->children[seg.index()].get();
        }
    }
    return node;
}

/// @brief Keys of an object node in document order (empty for non-objects).
[[nodiscard]] inline std::vector<std::string> object_keys(const Node* node) {
    std::vector<std::string> keys;
    if (!node || node->type != NodeType::Object) return keys;
    keys.reserve(node->children.size());
    for (const auto& prop : node->children) keys.emplace_back(prop->key());
    return keys;
}

/// @brief Decode a node into a Value. Duplicate keys: last value wins.
[[nodiscard]] inline Value node_value(const Node& node) {
    switch (node.type) {
        case NodeType::Object: {
            Object obj;
            for (const auto& prop : node.children) {
                if (const Node* v = prop->value_node())
                    obj.insert(std::string(prop->key()), node_value(*v));
            }
            return Value(std::move(obj));
        }
        case NodeType::Array: {
            Array arr;
            arr.reserve(node.children.size());
            for (const auto& child : node.children) arr.push_back(node_value(*child));
            return Value(std::move(arr));
        }
        case NodeType::Property:
            return node.value_node() ? node_value(*node.value_node()) : Value{};
        default:
            return node.value;
    }
}

// ─── Value parsing ──────────────────────────────────────────────────────

/// @brief Decode a JSONC document into a Value (throws ParseError).
[[nodiscard]] inline Value parse(std::string_view text, const ParseOptions& opts = {}) {
    if (opts.max_size > 0 && text.size() > opts.max_size) {
        throw ParseError("input of " + std::to_string(text.size()) +
                         " bytes exceeds the limit of " + std::to_string(opts.max_size),
                         SourceLocation{}, errc::input_too_large);
    }
    auto root = parse_tree(text, opts);
    if (!root) {
        SourceLocation loc;
        loc.offset = text.size();
        throw ParseError("document holds no value", loc, errc::unexpected_end_of_input);
    }
    return node_value(*root);
}

/// @brief Decode a JSONC document (no exceptions, error_code).
[[nodiscard]] inline result<Value> try_parse(std::string_view text,
                                             const ParseOptions& opts = {}) noexcept {
    try {
        return {parse(text, opts), {}};
    } catch (const ParseError& e) {
        return {Value{}, e.code()};
    } catch (const std::bad_alloc&) {
        return {Value{}, std::make_error_code(std::errc::not_enough_memory)};
    }
}

} // namespace aywson
