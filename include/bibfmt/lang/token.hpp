#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace bibfmt {

// Source position for error reporting (1-indexed)
struct Position {
    std::uint32_t line = 1;
    std::uint32_t column = 1;

    bool operator==(const Position& o) const {
        return line == o.line && column == o.column;
    }
    bool operator!=(const Position& o) const { return !(*this == o); }
};

enum class TokenType {
    // Specials, one character each
    At,          // @
    BraceLeft,   // {
    BraceRight,  // }
    Comma,       // ,
    Equals,      // =
    Pound,       // #
    Quote,       // "

    // Run of non-special, non-whitespace characters
    Value,

    // Whitespace, one token per character (\r\n counts as one newline)
    NewLine,
    Space,
    Tab
};

struct Token {
    TokenType type;
    std::string text;  // literal source text

    static Token special(TokenType t);
    static Token value(std::string text);
    static Token newline() { return {TokenType::NewLine, "\n"}; }
    static Token space() { return {TokenType::Space, " "}; }
    static Token tab() { return {TokenType::Tab, "\t"}; }

    bool is_special() const;
    bool is_whitespace() const;
    bool is_value() const { return type == TokenType::Value; }

    // Describes the token for diagnostics, e.g. `'='` or `value "misc"`
    std::string describe() const;

    bool operator==(const Token& o) const {
        return type == o.type && text == o.text;
    }
    bool operator!=(const Token& o) const { return !(*this == o); }
};

struct TokenInfo {
    Token value;
    Position pos;

    bool is_whitespace() const { return value.is_whitespace(); }

    bool operator==(const TokenInfo& o) const {
        return value == o.value && pos == o.pos;
    }
    bool operator!=(const TokenInfo& o) const { return !(*this == o); }
};

const char* token_type_name(TokenType t);

// Single-character text of a special token ("" for non-specials)
const char* special_text(TokenType t);

bool is_special_char(char c);

// Concatenate the literal text of each token
std::string stringify(const std::vector<Token>& tokens);
std::string stringify(const std::vector<TokenInfo>& tokens);

} // namespace bibfmt
