#include <bibfmt/lang/tag.hpp>
#include <bibfmt/text.hpp>
#include <algorithm>

namespace bibfmt {

bool Sequence::empty() const {
    return std::all_of(parts.begin(), parts.end(),
                       [](const Part& p) { return p.empty(); });
}

Value Value::single(std::string s) {
    Value v;
    v.data_ = std::move(s);
    return v;
}

Value Value::integer(std::uint64_t n) {
    Value v;
    v.data_ = n;
    return v;
}

Value Value::sequence(Sequence s) {
    if (s.parts.empty()) return single("");
    Value v;
    v.data_ = std::move(s);
    return v;
}

bool Value::empty() const {
    switch (kind()) {
    case Kind::Single:   return trim(as_single()).empty();
    case Kind::Integer:  return false;
    case Kind::Sequence: return as_sequence().empty();
    }
    return false;
}

Tag::Tag(std::string n, Value v)
    : name(to_lower(std::move(n))), value(std::move(v)) {}

static int name_rank(const std::string& name) {
    if (name == "title") return 0;
    if (name == "author") return 1;
    return 2;
}

int Tag::compare_names(const std::string& a, const std::string& b) {
    if (a == b) return 0;
    int ra = name_rank(a);
    int rb = name_rank(b);
    if (ra != rb) return ra < rb ? -1 : 1;
    return a.compare(b) < 0 ? -1 : 1;
}

} // namespace bibfmt
