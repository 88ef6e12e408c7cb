#pragma once

/// @file lexer.hpp
/// @brief Tokenizer: turns a byte buffer into rdjson::Token values, one per call.
///
/// The lexer never looks further back than one byte: after a numeric run it
/// pushes the terminating byte back so the next call starts on it.
/// Strings are returned raw. A backslash protects the following byte from
/// ending the string, but no escape sequence is decoded.

#include "config.hpp"
#include "error.hpp"
#include "token.hpp"

#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace rdjson {
namespace detail {

/// Bytes that may appear in an unquoted numeric run.
inline bool is_number_byte(char c) noexcept {
    return (c >= '0' && c <= '9') || c == '+' || c == '-' ||
           c == '.' || c == 'e' || c == 'E';
}

} // namespace detail

class Lexer {
public:
    explicit Lexer(std::string_view input) noexcept
        : begin_(input.data())
        , ptr_(input.data())
        , end_(input.data() + input.size()) {}

    /// @brief Read the next token.
    /// @return std::nullopt once only whitespace remains.
    /// @throws ParseError on a malformed literal, an unterminated string
    ///         or a byte that cannot start any token.
    std::optional<Token> next_token() {
        skip_whitespace();
        if (ptr_ >= end_) return std::nullopt;

        const char* start = ptr_;
        const char c = read_byte();
        switch (c) {
            case '{': return make(TokenKind::BeginObject, start);
            case '}': return make(TokenKind::EndObject, start);
            case '[': return make(TokenKind::BeginArray, start);
            case ']': return make(TokenKind::EndArray, start);
            case ':': return make(TokenKind::NameSeparator, start);
            case ',': return make(TokenKind::ValueSeparator, start);
            case 'n':
                expect_rest(start, "null");
                return make(TokenKind::Null, start);
            case 't':
                expect_rest(start, "true");
                return make(TokenKind::True, start);
            case 'f':
                expect_rest(start, "false");
                return make(TokenKind::False, start);
            case '"':
                return scan_string(start);
            default:
                unread_byte();
                return scan_number(start);
        }
    }

    /// @brief Skip whitespace and report whether the input is exhausted.
    bool at_end() noexcept {
        skip_whitespace();
        return ptr_ >= end_;
    }

    /// @brief Current byte offset of the cursor.
    size_t position() const noexcept { return static_cast<size_t>(ptr_ - begin_); }

    std::string_view input() const noexcept {
        return {begin_, static_cast<size_t>(end_ - begin_)};
    }

    /// @brief Line/column of a byte offset in the input.
    SourceLocation location_of(size_t offset) const noexcept {
        SourceLocation loc;
        const char* target = begin_ + (offset < static_cast<size_t>(end_ - begin_)
                                           ? offset
                                           : static_cast<size_t>(end_ - begin_));
        loc.offset = static_cast<size_t>(target - begin_);
        for (const char* p = begin_; p < target; ++p) {
            if (*p == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

private:
    const char* begin_;
    const char* ptr_;
    const char* end_;

    static bool is_whitespace(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    void skip_whitespace() noexcept {
        while (ptr_ < end_ && is_whitespace(*ptr_)) ++ptr_;
    }

    char read_byte() noexcept { return *ptr_++; }

    void unread_byte() noexcept { --ptr_; }

    Token make(TokenKind kind, const char* start) const noexcept {
        return Token{kind, std::string_view(start, static_cast<size_t>(ptr_ - start)),
                     static_cast<size_t>(start - begin_)};
    }

    [[noreturn]] RDJSON_NOINLINE void error(const std::string& msg, errc code,
                                            const char* at) const {
        throw ParseError(msg, location_of(static_cast<size_t>(at - begin_)), code);
    }

    /// The first byte of @p literal has already been consumed.
    template <size_t N>
    void expect_rest(const char* start, const char (&literal)[N]) {
        constexpr size_t rest = N - 2;  // minus terminator and first byte
        if (RDJSON_UNLIKELY(static_cast<size_t>(end_ - ptr_) < rest) ||
            RDJSON_UNLIKELY(std::memcmp(ptr_, literal + 1, rest) != 0)) {
            error(std::string("malformed literal, expected '") + literal + "'",
                  errc::malformed_literal, start);
        }
        ptr_ += rest;
    }

    Token scan_string(const char* start) {
        const char* content = ptr_;
        while (ptr_ < end_) {
            const char c = read_byte();
            if (c == '"') {
                return Token{TokenKind::String,
                             std::string_view(content, static_cast<size_t>(ptr_ - 1 - content)),
                             static_cast<size_t>(start - begin_)};
            }
            if (c == '\\') {
                if (RDJSON_UNLIKELY(ptr_ >= end_)) break;
                ++ptr_;
            }
        }
        error("unterminated string", errc::unterminated_string, start);
    }

    Token scan_number(const char* start) {
        while (ptr_ < end_) {
            if (!detail::is_number_byte(read_byte())) {
                unread_byte();
                break;
            }
        }
        if (RDJSON_UNLIKELY(ptr_ == start)) {
            error(std::string("unexpected character '") + *start + "'",
                  errc::unexpected_character, start);
        }
        return make(TokenKind::Number, start);
    }
};

} // namespace rdjson
