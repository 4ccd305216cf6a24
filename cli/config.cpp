#include "config.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace xpathq::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

std::string trim_copy(const std::string& value) {
  size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(start, end - start);
}

std::string lower_copy(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (unsigned char c : value) {
    lower.push_back(static_cast<char>(std::tolower(c)));
  }
  return lower;
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = lower_copy(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

bool parse_size(const std::string& raw, size_t& out) {
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(raw, &pos);
    if (pos != raw.size()) return false;
    if (value == 0) return false;
    out = static_cast<size_t>(value);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

std::string parse_string_value(const std::string& raw, bool& ok) {
  std::string trimmed = trim_copy(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if ((trimmed.front() == '"' && trimmed.back() == '"') ||
      (trimmed.front() == '\'' && trimmed.back() == '\'')) {
    if (trimmed.size() < 2) {
      ok = false;
      return {};
    }
    ok = true;
    return trimmed.substr(1, trimmed.size() - 2);
  }
  ok = true;
  return trimmed;
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("XPATHQ_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "xpathq" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "xpathq" / "config.toml").string();
  }
  return "xpathq.config.toml";
}

bool load_config(const std::string& path, CliSettings& out, std::string& error) {
  out = CliSettings{};
  if (path.empty()) return false;
  if (!std::filesystem::exists(path)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = trim_copy(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = trim_copy(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim_copy(trimmed.substr(0, eq));
    std::string value = trim_copy(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    std::string at_line = " at line " + std::to_string(line_no);
    if (full_key == "engine.parse_cache_capacity" || full_key == "engine.compile_cache_capacity") {
      size_t parsed = 0;
      if (!parse_size(value, parsed)) {
        error = "Invalid " + full_key + at_line;
        return false;
      }
      if (full_key == "engine.parse_cache_capacity") {
        out.parse_cache_capacity = parsed;
      } else {
        out.compile_cache_capacity = parsed;
      }
    } else if (full_key == "output.mode") {
      bool ok = false;
      std::string parsed = lower_copy(parse_string_value(value, ok));
      if (!ok || (parsed != "plain" && parsed != "json")) {
        error = "Invalid output.mode" + at_line;
        return false;
      }
      out.output_mode = parsed;
    } else if (full_key == "output.color") {
      bool parsed = true;
      if (!parse_bool(value, parsed)) {
        error = "Invalid output.color" + at_line;
        return false;
      }
      out.color = parsed;
    }
  }
  return true;
}

}  // namespace xpathq::cli
