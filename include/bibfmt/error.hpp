#pragma once

#include <bibfmt/lang/token.hpp>
#include <optional>
#include <string>

namespace bibfmt {

struct BibError {
    enum Code {
        IO,
        EndOfTokenStream,
        UnexpectedToken,
        MissingEntryType,
        MissingCiteKey,
        MissingTagName,
        MissingContentOpenToken,
        InternalAssertion,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    Position pos{0, 0};  // line 0 means no location

    // Grammar errors: the token the parser wanted and the one it got
    std::optional<Token> expected;
    std::optional<TokenInfo> found;

    BibError() = default;
    BibError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    BibError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    static BibError end_of_token_stream(Position last);
    static BibError unexpected_token(Token expected, TokenInfo found);
    static BibError missing(Code c, TokenInfo found);
    static BibError internal(std::string msg);

    // True for errors raised by the tokenizer/parser grammar
    bool is_parse_error() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace bibfmt
