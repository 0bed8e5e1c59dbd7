#include <bibfmt/lang/formatter.hpp>
#include <bibfmt/log.hpp>
#include <bibfmt/text.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace bibfmt {

// ---------------------------------------------------------------------------
// Titles
// ---------------------------------------------------------------------------

std::string remove_braces(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != '{' && c != '}') out += c;
    }
    return out;
}

std::string wrap_word_with_braces(const std::string& word) {
    if (!word.empty() && word.back() == ':') {
        return "{" + word.substr(0, word.size() - 1) + "}:";
    }
    return "{" + word + "}";
}

static bool is_initial_capital(const std::string& word) {
    return !word.empty() &&
           std::isupper(static_cast<unsigned char>(word[0])) &&
           !has_upper(word.substr(1));
}

std::string format_title(const std::string& text, bool first_part) {
    auto words = split_whitespace(remove_braces(text));
    for (size_t i = 0; i < words.size(); ++i) {
        auto& word = words[i];
        if (!has_upper(word)) continue;
        // BibTeX keeps the first letter of a title as written
        if (first_part && i == 0 && is_initial_capital(word)) continue;
        word = wrap_word_with_braces(word);
    }
    return join(words, " ");
}

std::string format_title_part(const std::string& text, bool first_part) {
    static const char* const spaces = " \t\n\r\v\f";
    size_t begin = text.find_first_not_of(spaces);
    if (begin == std::string::npos) return text;
    size_t end = text.find_last_not_of(spaces) + 1;
    return text.substr(0, begin) +
           format_title(text.substr(begin, end - begin), first_part) +
           text.substr(end);
}

// ---------------------------------------------------------------------------
// Values
// ---------------------------------------------------------------------------

std::string format_sequence(const Sequence& seq, const FormatOptions& options,
                            bool is_title) {
    const bool title = is_title && options.format_title;
    std::string out;
    for (size_t i = 0; i < seq.parts.size(); ++i) {
        const auto& part = seq.parts[i];
        if (i > 0) out += " # ";
        if (part.is_quoted()) {
            // Separators between parts are part of the title text
            out += "\"";
            out += title ? format_title_part(part.text, i == 0) : part.text;
            out += "\"";
        } else {
            out += to_lower(part.text);
        }
    }
    return out;
}

std::string format_value(const Value& value, const FormatOptions& options,
                         bool is_title) {
    switch (value.kind()) {
    case Value::Kind::Single: {
        const auto& text = value.as_single();
        return "{" + (is_title && options.format_title ? format_title(text) : text) + "}";
    }
    case Value::Kind::Integer:
        return std::to_string(value.as_integer());
    case Value::Kind::Sequence:
        return format_sequence(value.as_sequence(), options, is_title);
    }
    return "";
}

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

namespace {

struct EntryFormatter {
    const FormatOptions& options;

    std::string operator()(const PreambleEntry& e) const {
        return "@PREAMBLE{" + format_sequence(e.body, options) + "}";
    }

    std::string operator()(const StringEntry& e) const {
        return "@STRING{" + e.tag.name + " = " +
               format_value(e.tag.value, options) + "}";
    }

    std::string operator()(const CommentEntry& e) const {
        return "@COMMENT{" + e.body + "}";
    }

    std::string operator()(const RefEntry& e) const {
        std::vector<const Tag*> tags;
        for (const auto& tag : e.tags) {
            if (options.skip_empty_tags && tag.value.empty()) continue;
            tags.push_back(&tag);
        }
        if (options.sort_tags) {
            std::stable_sort(tags.begin(), tags.end(),
                             [](const Tag* a, const Tag* b) { return *a < *b; });
        }

        if (tags.empty()) {
            return "@" + e.kind + "{" + e.key + "}";
        }

        std::string out = "@" + e.kind + "{" + e.key + ",\n";
        for (const Tag* tag : tags) {
            out += "    " + tag->name + " = " +
                   format_value(tag->value, options, tag->name == "title") +
                   ",\n";
        }
        out += "}";
        return out;
    }
};

} // anonymous namespace

std::string format_entry(const Entry& entry, const FormatOptions& options) {
    return std::visit(EntryFormatter{options}, entry);
}

std::string format_entries(const Entries& entries, const FormatOptions& options) {
    std::vector<const Entry*> order;
    order.reserve(entries.size());
    for (const auto& e : entries) order.push_back(&e);

    if (options.sort_entries) {
        std::stable_sort(order.begin(), order.end(),
                         [](const Entry* a, const Entry* b) {
                             return entry_less(*a, *b);
                         });
    }

    std::string out;
    for (size_t i = 0; i < order.size(); ++i) {
        out += format_entry(*order[i], options);
        if (i + 1 == order.size()) break;

        out += "\n";
        EntryKind cur = entry_kind(*order[i]);
        EntryKind next = entry_kind(*order[i + 1]);
        if (cur != next || next == EntryKind::Ref) out += "\n";
    }
    return out;
}

void print_entries(const Entries& entries, const FormatOptions& options) {
    std::cout << format_entries(entries, options) << "\n";
}

Status write_entries(const Entries& entries, const std::string& path,
                     const FormatOptions& options) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return BibError{BibError::IO,
            "cannot open output file: " + path,
            "check that the directory exists and is writable"};
    }

    std::string text = format_entries(entries, options);
    out << text;
    if (!text.empty()) out << "\n";
    out.flush();
    if (!out) {
        return BibError{BibError::IO, "failed writing output file: " + path};
    }

    log::debug("wrote %zu entries to %s", entries.size(), path.c_str());
    return ok_status();
}

} // namespace bibfmt
