#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace xpathq::util {

std::string to_lower(const std::string& s);

/// Trims XML whitespace (space, tab, CR, LF) from both ends.
/// MUST leave interior whitespace untouched.
/// Inputs are strings; outputs are trimmed copies with no side effects.
std::string trim_ws(const std::string& s);

/// Tests whether a character is XML whitespace.
bool is_xml_space(char c);

/// Splits UTF-8 text into code points, each kept as its byte sequence.
/// MUST treat invalid lead bytes as single-byte units instead of failing.
/// Inputs are UTF-8 strings; outputs are per-code-point substrings.
std::vector<std::string> utf8_split(const std::string& s);
/// Counts code points in UTF-8 text.
/// MUST agree with utf8_split on malformed input.
/// Inputs are UTF-8 strings; outputs are counts with no side effects.
size_t utf8_length(const std::string& s);

}  // namespace xpathq::util
