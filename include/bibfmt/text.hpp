#pragma once

#include <string>
#include <vector>

namespace bibfmt {

// ASCII lowercase; bytes >= 0x80 (UTF-8 sequences) pass through unchanged
std::string to_lower(std::string s);

// Strip leading/trailing ASCII whitespace
std::string trim(const std::string& s);

// Split on runs of ASCII whitespace, dropping empty pieces
std::vector<std::string> split_whitespace(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool has_upper(const std::string& s);

} // namespace bibfmt
