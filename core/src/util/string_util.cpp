#include "string_util.h"

#include <cctype>

namespace xpathq::util {

namespace {

size_t utf8_sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

}  // namespace

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

bool is_xml_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && is_xml_space(s[start])) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && is_xml_space(s[end - 1])) {
    --end;
  }
  return s.substr(start, end - start);
}

std::vector<std::string> utf8_split(const std::string& s) {
  std::vector<std::string> out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    size_t len = utf8_sequence_length(static_cast<unsigned char>(s[i]));
    if (i + len > s.size()) {
      len = 1;
    }
    for (size_t k = 1; k < len; ++k) {
      // WHY: a truncated sequence falls back to byte units so no input is dropped.
      if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
        len = 1;
        break;
      }
    }
    out.push_back(s.substr(i, len));
    i += len;
  }
  return out;
}

size_t utf8_length(const std::string& s) {
  return utf8_split(s).size();
}

}  // namespace xpathq::util
