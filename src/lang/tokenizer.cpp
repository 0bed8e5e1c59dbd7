#include <bibfmt/lang/tokenizer.hpp>
#include <bibfmt/log.hpp>

namespace bibfmt {

namespace {

bool is_space_char(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\v' || c == '\f';
}

// Byte length of the UTF-8 encoded Unicode whitespace character starting at
// pos (U+0085, U+00A0, U+1680, U+2000-U+200A, U+2028, U+2029, U+202F,
// U+205F, U+3000), or 0 if there is none
size_t unicode_space_length(const std::string& s, size_t pos) {
    auto byte = [&](size_t i) -> unsigned char {
        return pos + i < s.size() ? static_cast<unsigned char>(s[pos + i]) : 0;
    };
    unsigned char b0 = byte(0);
    if (b0 == 0xC2) {
        return (byte(1) == 0x85 || byte(1) == 0xA0) ? 2 : 0;
    }
    if (b0 == 0xE1) {
        return (byte(1) == 0x9A && byte(2) == 0x80) ? 3 : 0;
    }
    if (b0 == 0xE2) {
        unsigned char b1 = byte(1), b2 = byte(2);
        if (b1 == 0x80 && ((b2 >= 0x80 && b2 <= 0x8A) ||
                           b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) {
            return 3;
        }
        return (b1 == 0x81 && b2 == 0x9F) ? 3 : 0;
    }
    if (b0 == 0xE3) {
        return (byte(1) == 0x80 && byte(2) == 0x80) ? 3 : 0;
    }
    return 0;
}

// UTF-8 continuation bytes do not start a new column
bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

TokenType special_type(char c) {
    switch (c) {
    case '@': return TokenType::At;
    case '{': return TokenType::BraceLeft;
    case '}': return TokenType::BraceRight;
    case ',': return TokenType::Comma;
    case '=': return TokenType::Equals;
    case '#': return TokenType::Pound;
    default:  return TokenType::Quote;
    }
}

} // anonymous namespace

Tokenizer::Tokenizer(const std::string& source)
    : source_(source) {}

char Tokenizer::next() {
    char c = source_[pos_++];
    if (c == '\n') {
        ++position_.line;
        position_.column = 1;
    } else if (c == '\r') {
        // \r\n is one line break; the \n does the advancing
        if (at_end() || peek() != '\n') {
            ++position_.line;
            position_.column = 1;
        }
    } else if (!is_continuation_byte(c)) {
        ++position_.column;
    }
    return c;
}

void Tokenizer::read_value(std::string& out) {
    while (!at_end()) {
        char c = peek();
        if (is_special_char(c) || is_space_char(c)) break;
        if (unicode_space_length(source_, pos_) > 0) break;
        out += next();
    }
}

std::vector<TokenInfo> Tokenizer::tokenize() {
    std::vector<TokenInfo> tokens;

    while (!at_end()) {
        Position p = position_;

        // Multi-byte whitespace is one Space token holding all of its bytes
        if (size_t n = unicode_space_length(source_, pos_)) {
            std::string text;
            for (size_t i = 0; i < n; ++i) text += next();
            tokens.push_back({{TokenType::Space, std::move(text)}, p});
            continue;
        }

        char c = next();

        if (c == '\n') {
            tokens.push_back({Token::newline(), p});
        } else if (c == '\r') {
            std::string text = "\r";
            if (!at_end() && peek() == '\n') text += next();
            tokens.push_back({{TokenType::NewLine, text}, p});
        } else if (c == '\t') {
            tokens.push_back({Token::tab(), p});
        } else if (is_space_char(c)) {
            tokens.push_back({{TokenType::Space, std::string(1, c)}, p});
        } else if (is_special_char(c)) {
            tokens.push_back({Token::special(special_type(c)), p});
        } else {
            std::string text(1, c);
            read_value(text);
            tokens.push_back({Token::value(std::move(text)), p});
        }
    }

    log::trace("tokenized %zu bytes into %zu tokens",
               source_.size(), tokens.size());
    return tokens;
}

std::vector<TokenInfo> tokenize(const std::string& source) {
    Tokenizer tokenizer(source);
    return tokenizer.tokenize();
}

} // namespace bibfmt
