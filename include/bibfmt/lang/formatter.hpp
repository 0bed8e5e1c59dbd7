#pragma once

#include <bibfmt/config.hpp>
#include <bibfmt/lang/entry.hpp>
#include <bibfmt/result.hpp>
#include <string>

namespace bibfmt {

// Remove every brace character
std::string remove_braces(const std::string& text);

// Wrap a word in braces, leaving a trailing colon outside: "Foo:" -> "{Foo}:"
std::string wrap_word_with_braces(const std::string& word);

// Protect capitalized title words from BibTeX downcasing. Existing braces are
// dropped, whitespace is normalized, and each word with an uppercase letter is
// braced, except a leading word capitalized only on its first letter. Only
// the first part of a concatenated title has a leading word.
std::string format_title(const std::string& text, bool first_part = true);

// format_title for one quoted part of a sequence; surrounding whitespace is
// kept so the concatenated text is unchanged
std::string format_title_part(const std::string& text, bool first_part);

// Tag value as it appears after `name = `
std::string format_value(const Value& value, const FormatOptions& options,
                         bool is_title = false);

// Parts joined by " # "; quoted parts in quotes, bare parts lowercase
std::string format_sequence(const Sequence& seq, const FormatOptions& options,
                            bool is_title = false);

std::string format_entry(const Entry& entry, const FormatOptions& options);

// Whole file without a trailing newline. Kinds are grouped and separated by a
// blank line; reference entries are always separated by a blank line.
std::string format_entries(const Entries& entries, const FormatOptions& options);

// Print to stdout with a trailing newline
void print_entries(const Entries& entries, const FormatOptions& options);

Status write_entries(const Entries& entries, const std::string& path,
                     const FormatOptions& options);

} // namespace bibfmt
