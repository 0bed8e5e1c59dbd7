#include <bibfmt/error.hpp>

namespace bibfmt {

const char* BibError::code_name(Code c) {
    switch (c) {
        case IO:                      return "IO";
        case EndOfTokenStream:        return "EndOfTokenStream";
        case UnexpectedToken:         return "UnexpectedToken";
        case MissingEntryType:        return "MissingEntryType";
        case MissingCiteKey:          return "MissingCiteKey";
        case MissingTagName:          return "MissingTagName";
        case MissingContentOpenToken: return "MissingContentOpenToken";
        case InternalAssertion:       return "InternalAssertion";
        case Config:                  return "Config";
        case InvalidArg:              return "InvalidArg";
    }
    return "Unknown";
}

BibError BibError::end_of_token_stream(Position last) {
    BibError e{EndOfTokenStream, "unexpected end of token stream",
               "check for an unclosed brace or quote"};
    e.pos = last;
    return e;
}

BibError BibError::unexpected_token(Token expected, TokenInfo found) {
    BibError e{UnexpectedToken,
               "expected " + expected.describe() + " but found " +
                   found.value.describe()};
    e.pos = found.pos;
    e.expected = std::move(expected);
    e.found = std::move(found);
    return e;
}

BibError BibError::missing(Code c, TokenInfo found) {
    std::string what;
    std::string hint;
    switch (c) {
        case MissingEntryType:
            what = "missing entry type after '@'";
            hint = "entries start like @article{...}";
            break;
        case MissingCiteKey:
            what = "missing cite key";
            hint = "reference entries start like @misc{citekey, ...}";
            break;
        case MissingTagName:
            what = "missing tag name";
            hint = "tags take the form name = {value}";
            break;
        case MissingContentOpenToken:
            what = "missing opening delimiter for tag content";
            hint = "tag content must start with '{', '\"' or a bare word";
            break;
        default:
            what = code_name(c);
            break;
    }
    BibError e{c, what + ", found " + found.value.describe(), hint};
    e.pos = found.pos;
    e.found = std::move(found);
    return e;
}

BibError BibError::internal(std::string msg) {
    return BibError{InternalAssertion, "internal error: " + msg};
}

bool BibError::is_parse_error() const {
    switch (code) {
        case EndOfTokenStream:
        case UnexpectedToken:
        case MissingEntryType:
        case MissingCiteKey:
        case MissingTagName:
        case MissingContentOpenToken:
        case InternalAssertion:
            return true;
        default:
            return false;
    }
}

std::string BibError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty() || pos.line > 0) {
        result += "\n  --> ";
        result += file.empty() ? "<input>" : file;
        if (pos.line > 0) {
            result += ":";
            result += std::to_string(pos.line);
            result += ":";
            result += std::to_string(pos.column);
        }
    }

    return result;
}

} // namespace bibfmt
