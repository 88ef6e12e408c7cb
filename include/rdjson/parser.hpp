#pragma once

/// @file parser.hpp
/// @brief Recursive-descent JSON parser over rdjson::Lexer tokens.
///
/// Features:
///   - One token of lookahead, pulled from the lexer on demand
///   - Scalars: text that converts to a finite double is a Number,
///     everything else is a String (see ParseOptions::infer_quoted_numbers)
///   - Exception-free parsing via try_parse() with error_code
///   - Optional recursion depth limit
///   - Optional trailing commas

#include "config.hpp"
#include "error.hpp"
#include "lexer.hpp"
#include "parse_options.hpp"
#include "token.hpp"
#include "value.hpp"

#include <charconv>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace rdjson {

/// @brief Recursive-descent parser. Each instance reads exactly one input.
class Parser {
public:
    explicit Parser(std::string_view input, const ParseOptions& opts = {}) noexcept
        : lexer_(input), opts_(opts)
        , max_depth_(opts.max_depth > 0 ? opts.max_depth : RDJSON_MAX_DEPTH) {}

    /// @brief Parse a complete document (with exceptions).
    [[nodiscard]] static Value parse(std::string_view input,
                                     const ParseOptions& opts = {}) {
        Parser p(input, opts);
        return p.parse_document();
    }

    /// @brief Parse a complete document (no exceptions, error_code).
    [[nodiscard]] static result<Value> try_parse(
            std::string_view input, const ParseOptions& opts = {}) noexcept {
        try {
            return {parse(input, opts), {}, {}};
        } catch (const ParseError& e) {
            return {Value{}, e.code(), e.location()};
        } catch (const std::bad_alloc&) {
            return {Value{}, std::make_error_code(std::errc::not_enough_memory), {}};
        }
    }

    /// @brief Parse one value, then require that only whitespace remains.
    Value parse_document() {
        Value result = parse_value();
        if (RDJSON_UNLIKELY(!lexer_.at_end())) {
            error_at(lexer_.position(), "unexpected trailing content", errc::trailing_content);
        }
        return result;
    }

    /// @brief Fetch the next token and parse the value that starts with it.
    Value parse_value() {
        advance();
        return parse_current();
    }

    /// @brief The lexer this parser reads from.
    const Lexer& lexer() const noexcept { return lexer_; }

private:
    Lexer lexer_;
    std::optional<Token> current_;
    ParseOptions opts_;
    size_t depth_ = 0;
    size_t max_depth_;

    // ─── Error reporting ──────────────────────────────────────────────────

    [[noreturn]] RDJSON_NOINLINE void error_at(size_t offset, const std::string& msg,
                                               errc code) const {
        throw ParseError(msg, lexer_.location_of(offset), code);
    }

    [[noreturn]] RDJSON_NOINLINE void error_unexpected(const Token& tok,
                                                       const char* expected) const {
        error_at(tok.offset,
                 std::string("expected ") + expected + ", got " + token_kind_name(tok.kind),
                 errc::unexpected_token);
    }

    [[noreturn]] RDJSON_NOINLINE void error_end_of_input(const char* msg, errc code) const {
        error_at(lexer_.input().size(), msg, code);
    }

    // ─── Depth tracking ──────────────────────────────────────────────────

    void push_depth(size_t offset) {
        if (RDJSON_UNLIKELY(++depth_ > max_depth_ && max_depth_ != 0)) {
            error_at(offset, "maximum nesting depth exceeded", errc::max_depth_exceeded);
        }
    }

    void pop_depth() noexcept { --depth_; }

    // ─── Token stream ─────────────────────────────────────────────────────

    void advance() { current_ = lexer_.next_token(); }

    bool current_is(TokenKind kind) const noexcept {
        return current_ && current_->kind == kind;
    }

    // ─── Value parsing ───────────────────────────────────────────────────────

    Value parse_current() {
        if (RDJSON_UNLIKELY(!current_)) {
            error_end_of_input("unexpected end of input", errc::unexpected_end_of_input);
        }
        const Token tok = *current_;
        switch (tok.kind) {
            case TokenKind::Null:        return Value(nullptr);
            case TokenKind::True:        return Value(true);
            case TokenKind::False:       return Value(false);
            case TokenKind::BeginObject: return parse_object();
            case TokenKind::BeginArray:  return parse_array();
            case TokenKind::String:
            case TokenKind::Number:      return parse_scalar(tok);
            case TokenKind::EndObject:
            case TokenKind::EndArray:
            case TokenKind::NameSeparator:
            case TokenKind::ValueSeparator:
                break;
        }
        error_unexpected(tok, "value");
    }

    /// The lexer does not tell the parser whether a span was quoted, so the
    /// numeric conversion alone decides between Number and String.
    Value parse_scalar(const Token& tok) {
        if (tok.is(TokenKind::String) && !opts_.infer_quoted_numbers) {
            return Value(tok.text);
        }
        if (auto number = to_number(tok.text)) {
            return Value(*number);
        }
        if (RDJSON_UNLIKELY(tok.is(TokenKind::Number) && !opts_.infer_quoted_numbers)) {
            error_at(tok.offset, "invalid number '" + std::string(tok.text) + "'",
                     errc::invalid_number);
        }
        return Value(tok.text);
    }

    /// @brief Convert the whole of @p text to a finite double.
    ///
    /// Accepts what the lexer would scan as a number, with an optional
    /// leading '+'. Words such as "inf" or "nan", hex and surrounding
    /// blanks are rejected, as are values outside the double range.
    static std::optional<double> to_number(std::string_view text) noexcept {
        for (char c : text) {
            if (!detail::is_number_byte(c)) return std::nullopt;
        }
        const char* first = text.data();
        const char* last = first + text.size();
        if (first != last && *first == '+') {
            ++first;
            if (first != last && *first == '-') return std::nullopt;
        }
        if (first == last) return std::nullopt;

#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
        double val = 0.0;
        auto [p, ec] = std::from_chars(first, last, val);
        if (ec != std::errc{} || p != last || !std::isfinite(val)) return std::nullopt;
        return val;
#else
        std::string buf(first, last);
        char* end_ptr = nullptr;
        errno = 0;
        double val = std::strtod(buf.c_str(), &end_ptr);
        if (end_ptr != buf.c_str() + buf.size() || errno == ERANGE || !std::isfinite(val))
            return std::nullopt;
        return val;
#endif
    }

    // ─── Object parsing ──────────────────────────────────────────────────

    /// Positioned on '{'.
    Value parse_object() {
        push_depth(current_->offset);
        Object obj;

        advance();
        if (current_is(TokenKind::EndObject)) {
            pop_depth();
            return Value(std::move(obj));
        }

        for (;;) {
            if (RDJSON_UNLIKELY(!current_)) {
                error_end_of_input("unterminated object", errc::unterminated_object);
            }
            if (RDJSON_UNLIKELY(!current_->is(TokenKind::String))) {
                error_at(current_->offset,
                         std::string("expected string key in object, got ") +
                             token_kind_name(current_->kind),
                         errc::expected_string_key);
            }
            std::string key(current_->text);

            advance();
            if (RDJSON_UNLIKELY(!current_)) {
                error_end_of_input("unterminated object", errc::unterminated_object);
            }
            if (RDJSON_UNLIKELY(!current_->is(TokenKind::NameSeparator))) {
                error_at(current_->offset,
                         std::string("expected ':' after object key, got ") +
                             token_kind_name(current_->kind),
                         errc::expected_separator);
            }

            Value value = parse_value();
            obj.insert(std::move(key), std::move(value));

            advance();
            if (RDJSON_UNLIKELY(!current_)) {
                error_end_of_input("unterminated object", errc::unterminated_object);
            }
            if (current_->is(TokenKind::ValueSeparator)) {
                advance();
                if (opts_.allow_trailing_commas && current_is(TokenKind::EndObject)) break;
                continue;
            }
            if (RDJSON_LIKELY(current_->is(TokenKind::EndObject))) break;
            error_unexpected(*current_, "',' or '}' in object");
        }

        pop_depth();
        return Value(std::move(obj));
    }

    // ─── Array parsing ────────────────────────────────────────────────────

    /// Positioned on '['.
    Value parse_array() {
        push_depth(current_->offset);
        Array arr;

        advance();
        if (current_is(TokenKind::EndArray)) {
            pop_depth();
            return Value(std::move(arr));
        }

        for (;;) {
            if (RDJSON_UNLIKELY(!current_)) {
                error_end_of_input("unterminated array", errc::unterminated_array);
            }
            arr.push_back(parse_current());

            advance();
            if (RDJSON_UNLIKELY(!current_)) {
                error_end_of_input("unterminated array", errc::unterminated_array);
            }
            if (current_->is(TokenKind::ValueSeparator)) {
                advance();
                if (opts_.allow_trailing_commas && current_is(TokenKind::EndArray)) break;
                continue;
            }
            if (RDJSON_LIKELY(current_->is(TokenKind::EndArray))) break;
            error_unexpected(*current_, "',' or ']' in array");
        }

        pop_depth();
        return Value(std::move(arr));
    }
};

// ─── Public parsing API ─────────────────────────────────────────────────────

/// @brief Parse JSON from a string (with exceptions).
[[nodiscard]] inline Value parse(std::string_view input,
                                 const ParseOptions& opts = {}) {
    return Parser::parse(input, opts);
}

/// @brief Parse JSON (no exceptions, returns result with error_code).
[[nodiscard]] inline result<Value> try_parse(std::string_view input,
                                             const ParseOptions& opts = {}) noexcept {
    return Parser::try_parse(input, opts);
}

} // namespace rdjson
