#pragma once

#include <bibfmt/lang/tag.hpp>
#include <string>
#include <variant>
#include <vector>

namespace bibfmt {

// ---------------------------------------------------------------------------
// Entry variants
// ---------------------------------------------------------------------------

// @article{key, name = value, ...}
struct RefEntry {
    std::string kind;  // lowercase entry type, e.g. "article"
    std::string key;   // lowercase cite key
    std::vector<Tag> tags;

    RefEntry(std::string k, std::string cite_key, std::vector<Tag> t);

    // Drops tags whose value is empty; returns how many were removed
    size_t remove_empty_tags();

    bool operator==(const RefEntry& o) const {
        return kind == o.kind && key == o.key && tags == o.tags;
    }
    bool operator!=(const RefEntry& o) const { return !(*this == o); }
};

// @string{name = value}
struct StringEntry {
    Tag tag;

    explicit StringEntry(Tag t) : tag(std::move(t)) {}

    bool operator==(const StringEntry& o) const { return tag == o.tag; }
    bool operator!=(const StringEntry& o) const { return !(*this == o); }
};

// @comment{...}, body kept verbatim
struct CommentEntry {
    std::string body;

    explicit CommentEntry(std::string b) : body(std::move(b)) {}

    bool operator==(const CommentEntry& o) const { return body == o.body; }
    bool operator!=(const CommentEntry& o) const { return !(*this == o); }
};

// @preamble{"..." # macro}
struct PreambleEntry {
    Sequence body;

    explicit PreambleEntry(Sequence s) : body(std::move(s)) {}

    bool operator==(const PreambleEntry& o) const { return body == o.body; }
    bool operator!=(const PreambleEntry& o) const { return !(*this == o); }
};

// Alternative order is the output group order
using Entry = std::variant<PreambleEntry, StringEntry, CommentEntry, RefEntry>;

enum class EntryKind { Preamble, String, Comment, Ref };

EntryKind entry_kind(const Entry& e);
const char* entry_kind_name(EntryKind k);

// Group order first, then the per-variant order: preambles are all equal,
// strings by name, comments by body, references by cite key
bool entry_less(const Entry& a, const Entry& b);

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

class Entries {
public:
    using const_iterator = std::vector<Entry>::const_iterator;

    Entries() = default;
    explicit Entries(std::vector<Entry> entries) : entries_(std::move(entries)) {}

    void push_back(Entry e) { entries_.push_back(std::move(e)); }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const Entry& operator[](size_t i) const { return entries_[i]; }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    const std::vector<Entry>& items() const { return entries_; }

    // Stable: equal entries keep their input order
    void sort();

    bool operator==(const Entries& o) const { return entries_ == o.entries_; }
    bool operator!=(const Entries& o) const { return !(*this == o); }

private:
    std::vector<Entry> entries_;
};

} // namespace bibfmt
