#include <bibfmt/lang/parser.hpp>
#include <bibfmt/lang/tokenizer.hpp>
#include <bibfmt/log.hpp>
#include <bibfmt/text.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace bibfmt {

using TT = TokenType;

namespace {

// Bare words made only of digits that fit in 64 bits become integers
std::optional<std::uint64_t> parse_unsigned(const std::string& s) {
    if (s.empty()) return std::nullopt;
    bool digits = std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (!digits) return std::nullopt;
    try {
        return static_cast<std::uint64_t>(std::stoull(s));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

template<typename T>
Result<Entry> as_entry(Result<T> r) {
    if (r.is_err()) return std::move(r).error();
    return Result<Entry>::ok(Entry(std::move(r).value()));
}

} // anonymous namespace

Parser::Parser(std::vector<TokenInfo> toks, ParseOptions opts,
               std::string fname)
    : tokens(std::move(toks)),
      options(opts),
      filename(std::move(fname)) {}

// ---------------------------------------------------------------------------
// Navigation
// ---------------------------------------------------------------------------

std::optional<TokenInfo> Parser::next() {
    if (at_end()) return std::nullopt;
    const auto& tok = tokens[pos++];
    last = tok.pos;
    return tok;
}

// Skipped whitespace counts as consumed for end-of-stream positions
void Parser::skip_whitespace() {
    while (!at_end() && tokens[pos].is_whitespace()) {
        last = tokens[pos].pos;
        ++pos;
    }
}

std::optional<TokenInfo> Parser::next_non_whitespace() {
    skip_whitespace();
    return next();
}

const TokenInfo* Parser::peek_non_whitespace() {
    skip_whitespace();
    return at_end() ? nullptr : &tokens[pos];
}

Status Parser::expect(TokenType type) {
    auto tok = next_non_whitespace();
    if (!tok) return end_of_stream();
    if (tok->value.type != type) {
        return BibError::unexpected_token(Token::special(type), std::move(*tok));
    }
    return ok_status();
}

BibError Parser::end_of_stream() const {
    return BibError::end_of_token_stream(last);
}

// ---------------------------------------------------------------------------
// Top level
// ---------------------------------------------------------------------------

Result<Entries> Parser::parse() {
    Entries entries;

    while (const TokenInfo* tok = peek_non_whitespace()) {
        Result<Entry> entry = tok->value.type == TT::At
            ? parse_entry()
            : Result<Entry>(BibError::unexpected_token(
                  Token::special(TT::At), *next()));

        if (entry.is_err()) {
            auto& e = entry.error();
            if (e.file.empty()) e.file = filename;
            log::debug("parse failed: %s", e.message.c_str());
            return std::move(entry).error();
        }
        entries.push_back(std::move(entry).value());
    }

    log::debug("parsed %zu entries from %zu tokens",
               entries.size(), tokens.size());
    return Result<Entries>::ok(std::move(entries));
}

Result<Entry> Parser::parse_entry() {
    BIBFMT_TRY(expect(TT::At));

    auto tok = next_non_whitespace();
    if (!tok) return end_of_stream();
    if (!tok->value.is_value()) {
        return BibError::missing(BibError::MissingEntryType, std::move(*tok));
    }

    const std::string kind = tok->value.text;
    const std::string lowered = to_lower(kind);
    log::trace("entry @%s at %u:%u", lowered.c_str(),
               tok->pos.line, tok->pos.column);

    if (lowered == "comment")  return as_entry(parse_comment_entry());
    if (lowered == "preamble") return as_entry(parse_preamble_entry());
    if (lowered == "string")   return as_entry(parse_string_entry());
    return as_entry(parse_ref_entry(kind));
}

// ---------------------------------------------------------------------------
// Entry bodies
// ---------------------------------------------------------------------------

Result<CommentEntry> Parser::parse_comment_entry() {
    BIBFMT_TRY(expect(TT::BraceLeft));

    // Raw tokens up to the first closing brace, no nesting
    std::vector<Token> body;
    while (true) {
        auto tok = next();
        if (!tok) return end_of_stream();
        if (tok->value.type == TT::BraceRight) break;
        body.push_back(std::move(tok->value));
    }

    return Result<CommentEntry>::ok(CommentEntry(stringify(body)));
}

Result<PreambleEntry> Parser::parse_preamble_entry() {
    BIBFMT_TRY(expect(TT::BraceLeft));

    auto seq = parse_tag_value_sequence();
    if (seq.is_err()) return std::move(seq).error();

    BIBFMT_TRY(expect(TT::BraceRight));
    return Result<PreambleEntry>::ok(PreambleEntry(std::move(seq).value()));
}

Result<StringEntry> Parser::parse_string_entry() {
    BIBFMT_TRY(expect(TT::BraceLeft));

    auto tag = parse_tag();
    if (tag.is_err()) return std::move(tag).error();

    // Optional trailing comma before the closing brace
    auto tok = next_non_whitespace();
    if (!tok) return end_of_stream();
    if (tok->value.type == TT::Comma) {
        BIBFMT_TRY(expect(TT::BraceRight));
    } else if (tok->value.type != TT::BraceRight) {
        return BibError::unexpected_token(Token::special(TT::BraceRight),
                                          std::move(*tok));
    }

    return Result<StringEntry>::ok(StringEntry(std::move(tag).value()));
}

Result<RefEntry> Parser::parse_ref_entry(const std::string& kind) {
    BIBFMT_TRY(expect(TT::BraceLeft));

    auto key = next_non_whitespace();
    if (!key) return end_of_stream();
    if (!key->value.is_value()) {
        return BibError::missing(BibError::MissingCiteKey, std::move(*key));
    }

    std::vector<Tag> tags;
    bool need_separator = true;  // the key and every tag must be followed by , or }
    while (true) {
        const TokenInfo* tok = peek_non_whitespace();
        if (!tok) return end_of_stream();

        if (tok->value.type == TT::BraceRight) {
            next();
            break;
        }
        if (tok->value.type == TT::Comma) {
            next();
            need_separator = false;
            continue;
        }
        if (need_separator) {
            return BibError::unexpected_token(Token::special(TT::Comma), *tok);
        }

        auto tag = parse_tag();
        if (tag.is_err()) return std::move(tag).error();
        tags.push_back(std::move(tag).value());
        need_separator = true;
    }

    RefEntry entry(kind, key->value.text, std::move(tags));
    if (options.remove_empty_tags) {
        size_t removed = entry.remove_empty_tags();
        if (removed > 0) {
            log::debug("removed %zu empty tag(s) from '%s'",
                       removed, entry.key.c_str());
        }
    }
    return Result<RefEntry>::ok(std::move(entry));
}

// ---------------------------------------------------------------------------
// Tags and values
// ---------------------------------------------------------------------------

Result<Tag> Parser::parse_tag() {
    auto tok = next_non_whitespace();
    if (!tok) return end_of_stream();
    if (!tok->value.is_value()) {
        return BibError::missing(BibError::MissingTagName, std::move(*tok));
    }
    std::string name = std::move(tok->value.text);

    BIBFMT_TRY(expect(TT::Equals));

    auto value = parse_tag_value();
    if (value.is_err()) return std::move(value).error();

    return Result<Tag>::ok(Tag(std::move(name), std::move(value).value()));
}

Result<Value> Parser::parse_tag_value() {
    const TokenInfo* tok = peek_non_whitespace();
    if (!tok) return end_of_stream();

    switch (tok->value.type) {
    // {single string}
    case TT::BraceLeft: {
        auto s = parse_delimited_string(TT::BraceLeft, TT::BraceRight);
        if (s.is_err()) return std::move(s).error();
        return Result<Value>::ok(Value::single(trim(s.value())));
    }

    // "quoted" or bare word, possibly joined with #. A lone part collapses:
    // quoted text is a single string, a bare number is an integer, and any
    // other bare word stays a one-part sequence (a @string reference).
    case TT::Quote:
    case TT::Value: {
        auto seq = parse_tag_value_sequence();
        if (seq.is_err()) return std::move(seq).error();
        Sequence parts = std::move(seq).value();

        if (parts.size() != 1) {
            return Result<Value>::ok(Value::sequence(std::move(parts)));
        }
        const Part& only = parts.parts.front();
        if (only.is_quoted()) {
            return Result<Value>::ok(Value::single(trim(only.text)));
        }
        if (auto n = parse_unsigned(only.text)) {
            return Result<Value>::ok(Value::integer(*n));
        }
        return Result<Value>::ok(Value::sequence(std::move(parts)));
    }

    default:
        return BibError::missing(BibError::MissingContentOpenToken, *tok);
    }
}

Result<Sequence> Parser::parse_tag_value_sequence() {
    std::vector<Part> parts;

    auto first = parse_tag_value_part();
    if (first.is_err()) return std::move(first).error();
    parts.push_back(std::move(first).value());

    while (true) {
        const TokenInfo* tok = peek_non_whitespace();
        if (!tok) return end_of_stream();

        if (tok->value.type == TT::BraceRight || tok->value.type == TT::Comma) {
            break;
        }
        if (tok->value.type != TT::Pound) {
            return BibError::unexpected_token(Token::special(TT::Comma), *tok);
        }
        next();

        auto part = parse_tag_value_part();
        if (part.is_err()) return std::move(part).error();
        parts.push_back(std::move(part).value());
    }

    return Result<Sequence>::ok(Sequence(std::move(parts)));
}

Result<Part> Parser::parse_tag_value_part() {
    const TokenInfo* tok = peek_non_whitespace();
    if (!tok) return end_of_stream();

    switch (tok->value.type) {
    case TT::Quote: {
        auto s = parse_delimited_string(TT::Quote, TT::Quote);
        if (s.is_err()) return std::move(s).error();
        return Result<Part>::ok(Part::quoted(std::move(s).value()));
    }
    case TT::Value: {
        auto word = next();
        if (!word) return BibError::internal("peeked value token vanished");
        return Result<Part>::ok(Part::value(std::move(word->value.text)));
    }
    default:
        return BibError::missing(BibError::MissingContentOpenToken, *tok);
    }
}

Result<std::string> Parser::parse_delimited_string(TokenType start, TokenType end) {
    auto open = next_non_whitespace();
    if (!open) return end_of_stream();
    if (open->value.type != start) {
        return BibError::unexpected_token(Token::special(start), std::move(*open));
    }

    // Braces nest; quotes close on the next quote but the braces between
    // them must balance. Whitespace runs of any kind collapse to one space.
    const bool quoted = start == end;
    int nested = 0;
    std::vector<Token> content;
    while (true) {
        auto tok = next();
        if (!tok) return end_of_stream();

        TokenType type = tok->value.type;
        if (quoted) {
            if (type == end) {
                if (nested > 0) {
                    return BibError::unexpected_token(
                        Token::special(TT::BraceRight), std::move(*tok));
                }
                break;
            }
            if (type == TT::BraceLeft) {
                ++nested;
            } else if (type == TT::BraceRight) {
                if (nested == 0) {
                    return BibError::unexpected_token(Token::special(end),
                                                      std::move(*tok));
                }
                --nested;
            }
        } else if (type == start) {
            ++nested;
        } else if (type == end) {
            if (nested == 0) break;
            --nested;
        }

        if (tok->value.is_whitespace()) {
            if (content.empty() || !content.back().is_whitespace()) {
                content.push_back(Token::space());
            }
        } else {
            content.push_back(std::move(tok->value));
        }
    }

    return Result<std::string>::ok(stringify(content));
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<Entries> parse(std::vector<TokenInfo> tokens,
                      const ParseOptions& options,
                      const std::string& filename) {
    Parser parser(std::move(tokens), options, filename);
    return parser.parse();
}

Result<Entries> parse_source(const std::string& source,
                             const ParseOptions& options,
                             const std::string& filename) {
    return parse(tokenize(source), options, filename);
}

} // namespace bibfmt
