#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace bibfmt {

// ---------------------------------------------------------------------------
// Tag values
// ---------------------------------------------------------------------------

// One operand of a `#` concatenation
struct Part {
    enum class Kind {
        Quoted,  // "text between quotes"
        Value    // bare word, usually a @string macro name
    };

    Kind kind = Kind::Value;
    std::string text;

    static Part quoted(std::string s) { return {Kind::Quoted, std::move(s)}; }
    static Part value(std::string s) { return {Kind::Value, std::move(s)}; }

    bool is_quoted() const { return kind == Kind::Quoted; }
    bool empty() const { return text.empty(); }

    bool operator==(const Part& o) const {
        return kind == o.kind && text == o.text;
    }
    bool operator!=(const Part& o) const { return !(*this == o); }
};

struct Sequence {
    std::vector<Part> parts;

    Sequence() = default;
    explicit Sequence(std::vector<Part> p) : parts(std::move(p)) {}

    // True when every part is empty
    bool empty() const;
    size_t size() const { return parts.size(); }

    bool operator==(const Sequence& o) const { return parts == o.parts; }
    bool operator!=(const Sequence& o) const { return !(*this == o); }
};

class Value {
public:
    enum class Kind { Single, Integer, Sequence };

    Value() : data_(std::string()) {}

    static Value single(std::string s);
    static Value integer(std::uint64_t v);
    // A sequence without parts becomes Single("")
    static Value sequence(Sequence s);

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    bool is_single() const { return kind() == Kind::Single; }
    bool is_integer() const { return kind() == Kind::Integer; }
    bool is_sequence() const { return kind() == Kind::Sequence; }

    const std::string& as_single() const { return std::get<std::string>(data_); }
    std::uint64_t as_integer() const { return std::get<std::uint64_t>(data_); }
    const Sequence& as_sequence() const { return std::get<Sequence>(data_); }

    // Whitespace-only singles and all-empty sequences are empty; integers never
    bool empty() const;

    bool operator==(const Value& o) const { return data_ == o.data_; }
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    // Alternative order matches Kind
    std::variant<std::string, std::uint64_t, Sequence> data_;
};

// ---------------------------------------------------------------------------
// Tag
// ---------------------------------------------------------------------------

struct Tag {
    std::string name;  // always lowercase
    Value value;

    Tag(std::string n, Value v);

    // title < author < everything else (alphabetical)
    static int compare_names(const std::string& a, const std::string& b);

    bool operator<(const Tag& o) const {
        return compare_names(name, o.name) < 0;
    }

    bool operator==(const Tag& o) const {
        return name == o.name && value == o.value;
    }
    bool operator!=(const Tag& o) const { return !(*this == o); }
};

} // namespace bibfmt
