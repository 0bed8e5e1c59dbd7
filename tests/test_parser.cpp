#include <catch2/catch.hpp>
#include <bibfmt/lang/parser.hpp>
#include <bibfmt/lang/tokenizer.hpp>

using namespace bibfmt;

using TT = TokenType;

// Hand-built token streams: token i sits on line i + 1
static std::vector<TokenInfo> as_infos(const std::vector<Token>& tokens) {
    std::vector<TokenInfo> out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        out.push_back({tokens[i], Position{static_cast<std::uint32_t>(i + 1), 1}});
    }
    return out;
}

static Token sp(TT t) { return Token::special(t); }
static Token val(const std::string& s) { return Token::value(s); }

// Helper: tokenize + parse in one call
static Entries parse_ok(const std::string& src, ParseOptions opts = {}) {
    auto r = parse_source(src, opts);
    if (r.is_err()) FAIL(r.error().format());
    return std::move(r).value();
}

static BibError parse_err(const std::string& src) {
    auto r = parse_source(src);
    REQUIRE(r.is_err());
    return std::move(r).error();
}

// ===== Entry kinds =====

TEST_CASE("parse comment entry", "[parser]") {
    Parser p(as_infos({
        sp(TT::At), val("comment"), sp(TT::BraceLeft),
        Token::space(), val("value"), Token::space(),
        sp(TT::BraceRight)}));

    auto r = p.parse_entry();
    REQUIRE(r.is_ok());
    CHECK(r.value() == Entry(CommentEntry(" value ")));
}

TEST_CASE("comment body ends at the first closing brace", "[parser]") {
    auto r = parse_source("@comment{ a {b } c}");
    REQUIRE(r.is_err());
    CHECK(r.error().code == BibError::UnexpectedToken);

    auto ok = parse_ok("@comment{ a {b }");
    REQUIRE(ok.size() == 1);
    CHECK(std::get<CommentEntry>(ok[0]).body == " a {b ");
}

TEST_CASE("parse preamble entry", "[parser]") {
    Parser p(as_infos({
        sp(TT::At), val("preamble"), sp(TT::BraceLeft),
        sp(TT::Quote), val("test"), Token::space(), val("string"), sp(TT::Quote),
        sp(TT::Pound), val("value"),
        sp(TT::BraceRight)}));

    auto r = p.parse_entry();
    REQUIRE(r.is_ok());
    Sequence seq({Part::quoted("test string"), Part::value("value")});
    CHECK(r.value() == Entry(PreambleEntry(seq)));
}

TEST_CASE("parse string entries", "[parser]") {
    Parser p(as_infos({
        sp(TT::At), val("string"), sp(TT::BraceLeft),
        val("acm"), sp(TT::Equals),
        sp(TT::Quote), val("Association"), Token::space(), val("for"),
        Token::space(), val("Computing"), Token::space(), val("Machinery"),
        sp(TT::Quote), sp(TT::BraceRight),
        Token::newline(),
        sp(TT::At), val("STRING"), sp(TT::BraceLeft),
        val("IEEE"), sp(TT::Equals),
        sp(TT::Quote), val("Institute"), sp(TT::Quote),
        sp(TT::BraceRight)}));

    auto r = p.parse();
    REQUIRE(r.is_ok());
    Entries expected({
        StringEntry(Tag("acm", Value::single("Association for Computing Machinery"))),
        StringEntry(Tag("ieee", Value::single("Institute"))),
    });
    CHECK(r.value() == expected);
}

TEST_CASE("string entry accepts a trailing comma", "[parser]") {
    auto e = parse_ok("@string{acm = \"ACM\",}");
    REQUIRE(e.size() == 1);
    CHECK(std::get<StringEntry>(e[0]).tag == Tag("acm", Value::single("ACM")));
}

TEST_CASE("string entry rejects extra content", "[parser]") {
    auto e = parse_err("@string{acm = {ACM} extra}");
    CHECK(e.code == BibError::UnexpectedToken);
    REQUIRE(e.expected.has_value());
    CHECK(e.expected->type == TT::BraceRight);
    CHECK(e.found->value == Token::value("extra"));
}

TEST_CASE("parse ref entry", "[parser]") {
    Parser p(as_infos({
        sp(TT::At), val("misc"), sp(TT::BraceLeft),
        val("citekey"), sp(TT::Comma),
        val("author"), sp(TT::Equals),
        sp(TT::Quote), val("foo"), sp(TT::Quote), sp(TT::Comma),
        val("title"), sp(TT::Equals),
        sp(TT::BraceLeft), val("the"), sp(TT::Comma), val("bar"), sp(TT::BraceRight),
        sp(TT::BraceRight)}));

    auto r = p.parse_entry();
    REQUIRE(r.is_ok());
    RefEntry expected("misc", "citekey", {
        Tag("author", Value::single("foo")),
        Tag("title", Value::single("the,bar")),
    });
    CHECK(r.value() == Entry(expected));
}

TEST_CASE("parse ref entry from source", "[parser]") {
    auto e = parse_ok("@misc{citekey, author=\"foo\", title = { bar }}");
    REQUIRE(e.size() == 1);
    const auto& ref = std::get<RefEntry>(e[0]);
    CHECK(ref.kind == "misc");
    CHECK(ref.key == "citekey");
    REQUIRE(ref.tags.size() == 2);
    CHECK(ref.tags[0] == Tag("author", Value::single("foo")));
    CHECK(ref.tags[1] == Tag("title", Value::single("bar")));
}

TEST_CASE("ref entry kind, key and tag names are lowercased", "[parser]") {
    auto e = parse_ok("@ARTICLE{SmithKey2020, TITLE = {X}, Author = {Y}}");
    const auto& ref = std::get<RefEntry>(e[0]);
    CHECK(ref.kind == "article");
    CHECK(ref.key == "smithkey2020");
    CHECK(ref.tags[0].name == "title");
    CHECK(ref.tags[1].name == "author");
}

TEST_CASE("parse ref entry without tags", "[parser]") {
    auto e = parse_ok("@misc{citekey}");
    REQUIRE(e.size() == 1);
    CHECK(e[0] == Entry(RefEntry("misc", "citekey", {})));
}

TEST_CASE("tags keep source order", "[parser]") {
    auto e = parse_ok("@misc{k, year = 2020, author = {A}, title = {T}}");
    const auto& tags = std::get<RefEntry>(e[0]).tags;
    REQUIRE(tags.size() == 3);
    CHECK(tags[0].name == "year");
    CHECK(tags[1].name == "author");
    CHECK(tags[2].name == "title");
}

TEST_CASE("retain empty tags by default", "[parser]") {
    auto e = parse_ok("@misc{citekey, author = \"\"}");
    const auto& ref = std::get<RefEntry>(e[0]);
    REQUIRE(ref.tags.size() == 1);
    CHECK(ref.tags[0] == Tag("author", Value::single("")));
}

TEST_CASE("remove empty tags while parsing", "[parser]") {
    ParseOptions opts;
    opts.remove_empty_tags = true;
    auto e = parse_ok("@misc{citekey, author = \"\", note = {  }, title = {T}}", opts);
    const auto& ref = std::get<RefEntry>(e[0]);
    REQUIRE(ref.tags.size() == 1);
    CHECK(ref.tags[0].name == "title");
}

TEST_CASE("whitespace between every token is ignored", "[parser]") {
    auto e = parse_ok("\n  @ misc \t{ key ,\n  title\n=\n{T} ,\n }\n\n");
    REQUIRE(e.size() == 1);
    const auto& ref = std::get<RefEntry>(e[0]);
    CHECK(ref.key == "key");
    CHECK(ref.tags[0] == Tag("title", Value::single("T")));
}

TEST_CASE("parse multiple entries in source order", "[parser]") {
    auto e = parse_ok(
        "@misc{b}\n"
        "@string{x = \"y\"}\n"
        "@preamble{\"p\"}\n"
        "@comment{c}\n"
        "@misc{a}\n");
    REQUIRE(e.size() == 5);
    CHECK(entry_kind(e[0]) == EntryKind::Ref);
    CHECK(entry_kind(e[1]) == EntryKind::String);
    CHECK(entry_kind(e[2]) == EntryKind::Preamble);
    CHECK(entry_kind(e[3]) == EntryKind::Comment);
    CHECK(std::get<RefEntry>(e[4]).key == "a");
}

// ===== Tags and values =====

TEST_CASE("parse tag", "[parser]") {
    Parser p(as_infos({
        val("name"), sp(TT::Equals),
        sp(TT::BraceLeft), val("test"), Token::space(), val("string"),
        sp(TT::BraceRight)}));

    auto r = p.parse_tag();
    REQUIRE(r.is_ok());
    CHECK(r.value() == Tag("name", Value::single("test string")));
}

TEST_CASE("parse tag value in braces", "[parser]") {
    Parser p(as_infos({
        sp(TT::BraceLeft), val("test"), Token::space(), val("string"),
        sp(TT::BraceRight)}));

    auto r = p.parse_tag_value();
    REQUIRE(r.is_ok());
    CHECK(r.value() == Value::single("test string"));
}

TEST_CASE("parse tag value in quotes", "[parser]") {
    Parser p(as_infos({
        sp(TT::Quote), val("test"), Token::space(), val("string"), sp(TT::Quote),
        sp(TT::Comma)}));

    auto r = p.parse_tag_value();
    REQUIRE(r.is_ok());
    CHECK(r.value() == Value::single("test string"));
}

TEST_CASE("single values are trimmed", "[parser]") {
    auto e = parse_ok("@misc{k, a = {  x  }, b = \"  y \"}");
    const auto& tags = std::get<RefEntry>(e[0]).tags;
    CHECK(tags[0].value == Value::single("x"));
    CHECK(tags[1].value == Value::single("y"));
}

TEST_CASE("parse integer tag value", "[parser]") {
    Parser p(as_infos({val("42"), sp(TT::Comma)}));

    auto r = p.parse_tag_value();
    REQUIRE(r.is_ok());
    CHECK(r.value() == Value::integer(42));
}

TEST_CASE("bare word tag value stays a one-part sequence", "[parser]") {
    Parser p(as_infos({val("ACM"), sp(TT::BraceRight)}));

    auto r = p.parse_tag_value();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_sequence());
    CHECK(r.value().as_sequence() == Sequence({Part::value("ACM")}));
}

TEST_CASE("integer too large for 64 bits stays a bare word", "[parser]") {
    auto e = parse_ok("@misc{k, n = 99999999999999999999999}");
    const auto& v = std::get<RefEntry>(e[0]).tags[0].value;
    REQUIRE(v.is_sequence());
    CHECK(v.as_sequence().parts[0].text == "99999999999999999999999");
}

TEST_CASE("parse tag value sequence", "[parser]") {
    Parser p(as_infos({
        sp(TT::Quote), val("test"), Token::space(), val("string"), sp(TT::Quote),
        sp(TT::Pound), val("value"),
        sp(TT::Comma)}));

    auto r = p.parse_tag_value();
    REQUIRE(r.is_ok());
    CHECK(r.value() == Value::sequence(Sequence({
        Part::quoted("test string"), Part::value("value")})));
}

TEST_CASE("sequence parts keep inner whitespace", "[parser]") {
    Parser p(as_infos({
        sp(TT::Quote), Token::space(), val("a"), sp(TT::Quote),
        Token::space(), sp(TT::Pound), Token::space(), val("b"),
        sp(TT::Comma)}));

    auto r = p.parse_tag_value_sequence();
    REQUIRE(r.is_ok());
    CHECK(r.value() == Sequence({Part::quoted(" a"), Part::value("b")}));
}

TEST_CASE("parse tag value parts one at a time", "[parser]") {
    Parser p(as_infos({
        sp(TT::Quote), val("test"), Token::space(), val("string"), sp(TT::Quote),
        val("value")}));

    auto first = p.parse_tag_value_part();
    REQUIRE(first.is_ok());
    CHECK(first.value() == Part::quoted("test string"));

    auto second = p.parse_tag_value_part();
    REQUIRE(second.is_ok());
    CHECK(second.value() == Part::value("value"));
}

// ===== Delimited strings =====

TEST_CASE("parse delimited string", "[parser]") {
    Parser p(as_infos({
        sp(TT::BraceLeft), val("test"), Token::space(), val("string"),
        sp(TT::BraceRight)}));

    auto r = p.parse_delimited_string(TT::BraceLeft, TT::BraceRight);
    REQUIRE(r.is_ok());
    CHECK(r.value() == "test string");
}

TEST_CASE("nested braces keep inner delimiters", "[parser]") {
    Parser p(as_infos({
        sp(TT::BraceLeft), sp(TT::BraceLeft), val("value"),
        sp(TT::BraceRight), sp(TT::BraceRight)}));

    auto r = p.parse_delimited_string(TT::BraceLeft, TT::BraceRight);
    REQUIRE(r.is_ok());
    CHECK(r.value() == "{value}");
}

TEST_CASE("deep nesting inside a tag value", "[parser]") {
    auto e = parse_ok("@misc{k, title = {a {b {c} d} e}}");
    CHECK(std::get<RefEntry>(e[0]).tags[0].value == Value::single("a {b {c} d} e"));
}

TEST_CASE("quotes close on the next quote", "[parser]") {
    auto r = Parser(tokenize("\"a {b} c\" d\"")).parse_delimited_string(TT::Quote, TT::Quote);
    REQUIRE(r.is_ok());
    CHECK(r.value() == "a {b} c");
}

TEST_CASE("braces inside quotes must balance", "[parser][errors]") {
    SECTION("open brace left unclosed") {
        auto e = parse_err("@misc{k, note = \"a { b\"}");
        CHECK(e.code == BibError::UnexpectedToken);
        CHECK(e.expected->type == TT::BraceRight);
        CHECK(e.found->value.type == TT::Quote);
        CHECK(e.pos == Position{1, 23});
    }
    SECTION("stray closing brace") {
        auto e = parse_err("@misc{k, note = \"a } b\"}");
        CHECK(e.code == BibError::UnexpectedToken);
        CHECK(e.expected->type == TT::Quote);
        CHECK(e.found->value.type == TT::BraceRight);
        CHECK(e.pos == Position{1, 20});
    }
    SECTION("inside a concatenation") {
        auto e = parse_err("@misc{k, note = acm # \"{x\"}");
        CHECK(e.code == BibError::UnexpectedToken);
        CHECK(e.expected->type == TT::BraceRight);
    }
}

TEST_CASE("whitespace runs inside content collapse to one space", "[parser]") {
    auto e = parse_ok("@misc{k, title = {A\n\t  multiline\r\n   title}}");
    CHECK(std::get<RefEntry>(e[0]).tags[0].value == Value::single("A multiline title"));
}

TEST_CASE("specials inside content are kept verbatim", "[parser]") {
    auto e = parse_ok("@misc{k, note = {a, b = c # d @ e}}");
    CHECK(std::get<RefEntry>(e[0]).tags[0].value == Value::single("a, b = c # d @ e"));
}

// ===== Errors =====

TEST_CASE("missing entry type", "[parser][errors]") {
    Parser p(as_infos({sp(TT::At), sp(TT::BraceLeft), sp(TT::BraceRight)}));
    auto r = p.parse();
    REQUIRE(r.is_err());
    CHECK(r.error().code == BibError::MissingEntryType);
    CHECK(r.error().found->value.type == TT::BraceLeft);
}

TEST_CASE("missing cite key", "[parser][errors]") {
    Parser p(as_infos({
        sp(TT::At), val("misc"), sp(TT::BraceLeft), sp(TT::BraceRight)}));
    auto r = p.parse();
    REQUIRE(r.is_err());
    CHECK(r.error().code == BibError::MissingCiteKey);
    CHECK(r.error().pos == Position{4, 1});
}

TEST_CASE("missing equals after tag name", "[parser][errors]") {
    Parser p(as_infos({
        sp(TT::At), val("misc"), sp(TT::BraceLeft),
        val("citekey"), sp(TT::Comma),
        val("author"), sp(TT::BraceRight)}));

    auto r = p.parse();
    REQUIRE(r.is_err());
    const auto& e = r.error();
    CHECK(e.code == BibError::UnexpectedToken);
    REQUIRE(e.expected.has_value());
    CHECK(e.expected->type == TT::Equals);
    REQUIRE(e.found.has_value());
    CHECK(*e.found == TokenInfo{sp(TT::BraceRight), Position{7, 1}});
}

TEST_CASE("missing equals is located right after the tag name", "[parser][errors]") {
    auto e = parse_err("@misc{citekey, author}");
    CHECK(e.code == BibError::UnexpectedToken);
    CHECK(e.expected->type == TT::Equals);
    CHECK(e.found->value.type == TT::BraceRight);
    CHECK(e.pos == Position{1, 22});
}

TEST_CASE("missing tag name", "[parser][errors]") {
    auto e = parse_err("@misc{key, = {x}}");
    CHECK(e.code == BibError::MissingTagName);
    CHECK(e.found->value.type == TT::Equals);
    CHECK(e.pos == Position{1, 12});
}

TEST_CASE("missing content open token", "[parser][errors]") {
    auto e = parse_err("@misc{key,\n  author = ,\n}");
    CHECK(e.code == BibError::MissingContentOpenToken);
    CHECK(e.found->value.type == TT::Comma);
    CHECK(e.pos == Position{2, 12});
}

TEST_CASE("tags must be separated by commas", "[parser][errors]") {
    auto e = parse_err("@misc{key title = {x}}");
    CHECK(e.code == BibError::UnexpectedToken);
    CHECK(e.expected->type == TT::Comma);
    CHECK(e.found->value == Token::value("title"));
}

TEST_CASE("text outside entries is rejected", "[parser][errors]") {
    auto e = parse_err("stray @misc{k}");
    CHECK(e.code == BibError::UnexpectedToken);
    CHECK(e.expected->type == TT::At);
    CHECK(e.pos == Position{1, 1});
}

TEST_CASE("unterminated brace reaches end of stream", "[parser][errors]") {
    auto e = parse_err("@misc{key, title = {abc");
    CHECK(e.code == BibError::EndOfTokenStream);
    CHECK(e.pos == Position{1, 21});
}

TEST_CASE("unterminated quote reaches end of stream", "[parser][errors]") {
    auto e = parse_err("@misc{key, title = \"abc");
    CHECK(e.code == BibError::EndOfTokenStream);
    CHECK(e.pos == Position{1, 21});
}

TEST_CASE("end of stream is located after skipped whitespace", "[parser][errors]") {
    // Both lookahead helpers skip trailing whitespace the same way
    auto after_key = parse_err("@misc{key  \n  ");
    CHECK(after_key.code == BibError::EndOfTokenStream);
    CHECK(after_key.pos == Position{2, 2});

    auto after_brace = parse_err("@misc{  ");
    CHECK(after_brace.code == BibError::EndOfTokenStream);
    CHECK(after_brace.pos == Position{1, 8});
}

TEST_CASE("end of stream after @", "[parser][errors]") {
    auto e = parse_err("@   ");
    CHECK(e.code == BibError::EndOfTokenStream);
}

TEST_CASE("entry without closing brace", "[parser][errors]") {
    auto e = parse_err("@misc{key, a = {b}");
    CHECK(e.code == BibError::EndOfTokenStream);
}

TEST_CASE("bad token after sequence part", "[parser][errors]") {
    auto e = parse_err("@misc{key, a = \"b\" \"c\"}");
    CHECK(e.code == BibError::UnexpectedToken);
    CHECK(e.expected->type == TT::Comma);
    CHECK(e.found->value.type == TT::Quote);
}

TEST_CASE("parse errors carry the file name", "[parser][errors]") {
    auto r = parse_source("@misc{", ParseOptions{}, "refs.bib");
    REQUIRE(r.is_err());
    CHECK(r.error().file == "refs.bib");
    CHECK(r.error().format().find("refs.bib:1:6") != std::string::npos);
}

TEST_CASE("malformed inputs never raise internal assertions", "[parser][errors]") {
    const char* inputs[] = {
        "@", "@@", "@{", "@misc", "@misc{", "@misc{,", "@misc{k,,,}",
        "@misc{k, a}", "@misc{k, a =}", "@misc{k, a = #}", "@misc{k, a = b #}",
        "@misc{k, a = \"b\" # }", "@string{}", "@string{a}", "@string{a = }",
        "@preamble{}", "@preamble{\"a\" #}", "@comment", "@comment{",
        "}", "\"", "#", "=", ",", "@misc{k, a = {{{}}",
    };
    for (const char* in : inputs) {
        INFO("input: " << in);
        auto r = parse_source(in);
        if (r.is_err()) {
            CHECK(r.error().code != BibError::InternalAssertion);
        }
    }
}
