#include <bibfmt/text.hpp>
#include <algorithm>
#include <cctype>

namespace bibfmt {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](char c) -> char {
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;
    return s.substr(start, end - start);
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) ++i;
        size_t start = i;
        while (i < s.size() && !is_space(s[i])) ++i;
        if (i > start) words.push_back(s.substr(start, i - start));
    }
    return words;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool has_upper(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        return std::isupper(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace bibfmt
