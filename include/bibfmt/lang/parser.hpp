#pragma once

#include <bibfmt/config.hpp>
#include <bibfmt/lang/entry.hpp>
#include <bibfmt/lang/token.hpp>
#include <bibfmt/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bibfmt {

// Recursive-descent BibTeX parser with one token of lookahead. Stops at the
// first error; every error carries the position of the offending token.
struct Parser {
    std::vector<TokenInfo> tokens;
    ParseOptions options;
    std::string filename;
    size_t pos = 0;
    Position last;  // position of the most recently consumed token

    explicit Parser(std::vector<TokenInfo> toks,
                    ParseOptions opts = {},
                    std::string fname = "");

    Result<Entries> parse();

    // -- Grammar ------------------------------------------------------------
    Result<Entry> parse_entry();
    Result<CommentEntry> parse_comment_entry();
    Result<PreambleEntry> parse_preamble_entry();
    Result<StringEntry> parse_string_entry();
    Result<RefEntry> parse_ref_entry(const std::string& kind);
    Result<Tag> parse_tag();
    Result<Value> parse_tag_value();
    Result<Sequence> parse_tag_value_sequence();
    Result<Part> parse_tag_value_part();
    Result<std::string> parse_delimited_string(TokenType start, TokenType end);

    // -- Navigation ---------------------------------------------------------
    bool at_end() const { return pos >= tokens.size(); }
    std::optional<TokenInfo> next();
    std::optional<TokenInfo> next_non_whitespace();
    const TokenInfo* peek_non_whitespace();
    void skip_whitespace();
    Status expect(TokenType type);

    BibError end_of_stream() const;
};

// Parse an already tokenized file.
Result<Entries> parse(std::vector<TokenInfo> tokens,
                      const ParseOptions& options = {},
                      const std::string& filename = "");

// Tokenize and parse BibTeX source in one call.
Result<Entries> parse_source(const std::string& source,
                             const ParseOptions& options = {},
                             const std::string& filename = "");

} // namespace bibfmt
