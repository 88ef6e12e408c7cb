#pragma once

/// @file token.hpp
/// @brief Lexical tokens produced by rdjson::Lexer.

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rdjson {

/// Token kinds. String and Number both carry raw text; the parser decides
/// whether that text is a number, not the lexer.
enum class TokenKind : uint8_t {
    BeginObject,     ///< {
    EndObject,       ///< }
    BeginArray,      ///< [
    EndArray,        ///< ]
    NameSeparator,   ///< :
    ValueSeparator,  ///< ,
    Null,            ///< null
    True,            ///< true
    False,           ///< false
    String,          ///< bytes between double quotes, escapes left as-is
    Number           ///< run of 0-9 + - . e E, not validated
};

/// @brief Returns a printable name for a token kind.
inline const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::BeginObject:    return "'{'";
        case TokenKind::EndObject:      return "'}'";
        case TokenKind::BeginArray:     return "'['";
        case TokenKind::EndArray:       return "']'";
        case TokenKind::NameSeparator:  return "':'";
        case TokenKind::ValueSeparator: return "','";
        case TokenKind::Null:           return "null";
        case TokenKind::True:           return "true";
        case TokenKind::False:          return "false";
        case TokenKind::String:         return "string";
        case TokenKind::Number:         return "number";
    }
    return "unknown";
}

/// @brief One lexical unit. @c text views the lexer's input buffer.
struct Token {
    TokenKind kind = TokenKind::Null;
    std::string_view text;
    size_t offset = 0;  ///< Byte offset of the first byte of the token

    bool is(TokenKind k) const noexcept { return kind == k; }
};

} // namespace rdjson
