#include <bibfmt/lang/entry.hpp>
#include <bibfmt/text.hpp>
#include <algorithm>

namespace bibfmt {

RefEntry::RefEntry(std::string k, std::string cite_key, std::vector<Tag> t)
    : kind(to_lower(std::move(k))),
      key(to_lower(std::move(cite_key))),
      tags(std::move(t)) {}

size_t RefEntry::remove_empty_tags() {
    auto before = tags.size();
    tags.erase(std::remove_if(tags.begin(), tags.end(),
                              [](const Tag& tag) { return tag.value.empty(); }),
               tags.end());
    return before - tags.size();
}

EntryKind entry_kind(const Entry& e) {
    return static_cast<EntryKind>(e.index());
}

const char* entry_kind_name(EntryKind k) {
    switch (k) {
    case EntryKind::Preamble: return "preamble";
    case EntryKind::String:   return "string";
    case EntryKind::Comment:  return "comment";
    case EntryKind::Ref:      return "reference";
    }
    return "?";
}

namespace {

struct SameKindLess {
    bool operator()(const PreambleEntry&, const PreambleEntry&) const {
        return false;
    }
    bool operator()(const StringEntry& a, const StringEntry& b) const {
        return a.tag.name < b.tag.name;
    }
    bool operator()(const CommentEntry& a, const CommentEntry& b) const {
        return a.body < b.body;
    }
    bool operator()(const RefEntry& a, const RefEntry& b) const {
        return a.key < b.key;
    }
    template<typename A, typename B>
    bool operator()(const A&, const B&) const {
        return false;  // unreachable, kinds compared first
    }
};

} // anonymous namespace

bool entry_less(const Entry& a, const Entry& b) {
    if (a.index() != b.index()) return a.index() < b.index();
    return std::visit(SameKindLess{}, a, b);
}

void Entries::sort() {
    std::stable_sort(entries_.begin(), entries_.end(), entry_less);
}

} // namespace bibfmt
