#include <bibfmt/cli.hpp>
#include <bibfmt/lang/formatter.hpp>
#include <bibfmt/lang/parser.hpp>
#include <bibfmt/lang/tokenizer.hpp>
#include <iostream>
#include <string>

using namespace bibfmt;

static const char* value_kind_str(Value::Kind k) {
    switch (k) {
    case Value::Kind::Single:   return "single";
    case Value::Kind::Integer:  return "integer";
    case Value::Kind::Sequence: return "sequence";
    }
    return "?";
}

// Whitespace tokens are shown escaped so the dump stays one token per line
static std::string printable(const std::string& text) {
    std::string out;
    for (char c : text) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:   out += c; break;
        }
    }
    return out;
}

static void dump_tags(const std::vector<Tag>& tags) {
    for (const auto& tag : tags) {
        std::cout << "      " << tag.name << " (" << value_kind_str(tag.value.kind())
                  << ")" << (tag.value.empty() ? " [empty]" : "") << "\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: bibfmt-dump <file.bib> [--tokens]\n";
        return ExitUsage;
    }

    std::string path = argv[1];
    bool show_tokens = (argc > 2 && std::string(argv[2]) == "--tokens");

    auto src = read_file(path);
    if (src.is_err()) {
        std::cerr << src.error().format() << "\n";
        return ExitInputRead;
    }

    // Tokenize
    auto tokens = tokenize(src.value());
    std::cout << "--- " << path << " ---\n";
    std::cout << "Tokens: " << tokens.size() << "\n";

    if (show_tokens) {
        std::cout << "\n-- Tokens --\n";
        for (auto& t : tokens) {
            std::cout << "  " << t.pos.line << ":" << t.pos.column
                      << "  " << token_type_name(t.value.type)
                      << "  \"" << printable(t.value.text) << "\"\n";
        }
    }

    // Parse
    auto pr = parse(std::move(tokens), ParseOptions{}, path);
    if (pr.is_err()) {
        std::cerr << pr.error().format() << "\n";
        return ExitParse;
    }

    const auto& entries = pr.value();
    std::cout << "\n-- Entries (" << entries.size() << ") --\n";
    for (const auto& entry : entries) {
        EntryKind kind = entry_kind(entry);
        std::cout << "  " << entry_kind_name(kind);
        if (const auto* ref = std::get_if<RefEntry>(&entry)) {
            std::cout << "  @" << ref->kind << "{" << ref->key << "}  "
                      << ref->tags.size() << " tag(s)\n";
            dump_tags(ref->tags);
        } else if (const auto* str = std::get_if<StringEntry>(&entry)) {
            std::cout << "  " << str->tag.name << " ("
                      << value_kind_str(str->tag.value.kind()) << ")\n";
        } else if (const auto* pre = std::get_if<PreambleEntry>(&entry)) {
            std::cout << "  " << pre->body.size() << " part(s)\n";
        } else {
            std::cout << "\n";
        }
    }

    std::cout << "\n-- Formatted --\n"
              << format_entries(entries, FormatOptions{}) << "\n";
    return ExitSuccess;
}
