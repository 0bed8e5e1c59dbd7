#include <bibfmt/lang/token.hpp>

namespace bibfmt {

const char* token_type_name(TokenType t) {
    switch (t) {
    case TokenType::At:         return "At";
    case TokenType::BraceLeft:  return "BraceLeft";
    case TokenType::BraceRight: return "BraceRight";
    case TokenType::Comma:      return "Comma";
    case TokenType::Equals:     return "Equals";
    case TokenType::Pound:      return "Pound";
    case TokenType::Quote:      return "Quote";
    case TokenType::Value:      return "Value";
    case TokenType::NewLine:    return "NewLine";
    case TokenType::Space:      return "Space";
    case TokenType::Tab:        return "Tab";
    }
    return "Unknown";
}

const char* special_text(TokenType t) {
    switch (t) {
    case TokenType::At:         return "@";
    case TokenType::BraceLeft:  return "{";
    case TokenType::BraceRight: return "}";
    case TokenType::Comma:      return ",";
    case TokenType::Equals:     return "=";
    case TokenType::Pound:      return "#";
    case TokenType::Quote:      return "\"";
    default:                    return "";
    }
}

bool is_special_char(char c) {
    switch (c) {
    case '@': case '{': case '}': case ',': case '=': case '#': case '"':
        return true;
    default:
        return false;
    }
}

Token Token::special(TokenType t) {
    return {t, special_text(t)};
}

Token Token::value(std::string text) {
    return {TokenType::Value, std::move(text)};
}

bool Token::is_special() const {
    switch (type) {
    case TokenType::At:
    case TokenType::BraceLeft:
    case TokenType::BraceRight:
    case TokenType::Comma:
    case TokenType::Equals:
    case TokenType::Pound:
    case TokenType::Quote:
        return true;
    default:
        return false;
    }
}

bool Token::is_whitespace() const {
    return type == TokenType::NewLine || type == TokenType::Space ||
           type == TokenType::Tab;
}

std::string Token::describe() const {
    if (is_special()) {
        return std::string("'") + special_text(type) + "'";
    }
    switch (type) {
    case TokenType::Value:   return "value \"" + text + "\"";
    case TokenType::NewLine: return "newline";
    case TokenType::Space:   return "space";
    case TokenType::Tab:     return "tab";
    default:                 return token_type_name(type);
    }
}

std::string stringify(const std::vector<Token>& tokens) {
    size_t capacity = 0;
    for (const auto& t : tokens) capacity += t.text.size();

    std::string out;
    out.reserve(capacity);
    for (const auto& t : tokens) out += t.text;
    return out;
}

std::string stringify(const std::vector<TokenInfo>& tokens) {
    size_t capacity = 0;
    for (const auto& t : tokens) capacity += t.value.text.size();

    std::string out;
    out.reserve(capacity);
    for (const auto& t : tokens) out += t.value.text;
    return out;
}

} // namespace bibfmt
