#pragma once

#include <bibfmt/lang/token.hpp>
#include <string>
#include <vector>

namespace bibfmt {

// Character cursor over BibTeX source. Tokenizing cannot fail: every input
// yields a token sequence whose stringify() is the input itself. Whitespace
// is ASCII whitespace plus the Unicode White_Space characters.
class Tokenizer {
public:
    // The source is borrowed and must outlive the tokenizer
    explicit Tokenizer(const std::string& source);
    Tokenizer(std::string&&) = delete;

    bool at_end() const { return pos_ >= source_.size(); }
    char peek() const { return source_[pos_]; }
    char next();

    Position position() const { return position_; }

    std::vector<TokenInfo> tokenize();

private:
    void read_value(std::string& out);

    const std::string& source_;
    size_t pos_ = 0;
    Position position_;
};

std::vector<TokenInfo> tokenize(const std::string& source);

} // namespace bibfmt
