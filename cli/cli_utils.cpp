#include "cli_utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "ui/color.h"

#ifdef XPATHQ_USE_NLOHMANN_JSON
#include <nlohmann/json.hpp>
#endif
#ifdef XPATHQ_USE_CURL
#include <curl/curl.h>
#endif

namespace xpathq::cli {

namespace {

#ifndef XPATHQ_USE_NLOHMANN_JSON
/// Escapes JSON string content so output remains valid JSON.
/// MUST preserve Unicode bytes and MUST escape control characters.
/// Inputs are raw strings; outputs are escaped strings with no side effects.
std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 4);
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          out += buf;
        } else {
          out += c;
        }
        break;
    }
  }
  return out;
}

std::string quoted(const std::string& s) {
  return "\"" + json_escape(s) + "\"";
}
#endif

const char* result_type_name(const QueryValue& value) {
  if (std::holds_alternative<NodeSet>(value)) return "node-set";
  if (std::holds_alternative<std::string>(value)) return "string";
  if (std::holds_alternative<double>(value)) return "number";
  return "boolean";
}

#ifdef XPATHQ_USE_CURL
/// Appends curl response chunks into the caller-owned buffer.
/// MUST return the full byte count or curl will treat it as an error.
/// Inputs are raw buffer pointers; side effects include buffer writes.
size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

std::string normalize_content_type(const char* raw) {
  if (!raw) return "";
  std::string value(raw);
  size_t end = value.find(';');
  if (end != std::string::npos) {
    value = value.substr(0, end);
  }
  std::string out;
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

void validate_content_type(CURL* curl) {
  const char* raw = nullptr;
  CURLcode info = curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &raw);
  if (info != CURLE_OK) {
    throw std::runtime_error("Failed to read Content-Type for URL");
  }
  std::string content_type = normalize_content_type(raw);
  if (content_type.empty()) {
    throw std::runtime_error("Missing Content-Type for URL");
  }
  if (content_type == "application/xml" || content_type == "text/xml" ||
      content_type == "application/xhtml+xml" || content_type == "application/atom+xml" ||
      content_type == "application/rss+xml" ||
      (content_type.size() > 4 && content_type.compare(content_type.size() - 4, 4, "+xml") == 0)) {
    return;
  }
  throw std::runtime_error("Unsupported Content-Type for XML fetch: " + content_type);
}
#endif

}  // namespace

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string read_stdin() {
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

std::string trim_query(const std::string& value) {
  size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) ++start;
  size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
  return value.substr(start, end - start);
}

bool is_url(const std::string& value) {
  return value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0;
}

std::string load_xml_input(const std::string& input, int timeout_ms) {
  if (is_url(input)) {
#ifdef XPATHQ_USE_CURL
    CURL* curl = curl_easy_init();
    if (!curl) {
      throw std::runtime_error("Failed to initialize curl");
    }
    std::string buffer;
    curl_easy_setopt(curl, CURLOPT_URL, input.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "xpathq/0.1");
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
      curl_easy_cleanup(curl);
      throw std::runtime_error(std::string("Failed to fetch URL: ") + curl_easy_strerror(res));
    }
    try {
      validate_content_type(curl);
    } catch (const std::exception&) {
      curl_easy_cleanup(curl);
      throw;
    }
    curl_easy_cleanup(curl);
    return buffer;
#else
    (void)timeout_ms;
    throw std::runtime_error("URL fetching is disabled (libcurl not available)");
#endif
  }
  return read_file(input);
}

std::string node_label(const XmlNode& node) {
  switch (node.kind) {
    case NodeKind::Document: return "/";
    case NodeKind::Element: return node.name;
    case NodeKind::Attribute: return "@" + node.name;
    case NodeKind::Text: return "text()";
    case NodeKind::CData: return "cdata()";
    case NodeKind::Comment: return "comment()";
    case NodeKind::ProcessingInstruction: return "processing-instruction(" + node.local_name + ")";
    case NodeKind::Namespace: return "namespace::" + node.local_name;
  }
  return node_kind_name(node.kind);
}

std::string format_plain(const QueryValue& value) {
  const NodeSet* set = std::get_if<NodeSet>(&value);
  if (!set) {
    return to_string(value) + "\n";
  }
  std::string out;
  for (size_t i = 0; i < set->size(); ++i) {
    const XmlNode& node = set->at(i);
    out += node_label(node);
    out += '\t';
    out += string_value(*set->document, node.id);
    out += '\n';
  }
  return out;
}

#ifdef XPATHQ_USE_NLOHMANN_JSON
std::string build_json(const QueryValue& value) {
  nlohmann::json out;
  if (const NodeSet* set = std::get_if<NodeSet>(&value)) {
    out = nlohmann::json::array();
    for (size_t i = 0; i < set->size(); ++i) {
      const XmlNode& node = set->at(i);
      nlohmann::json item;
      item["kind"] = node_kind_name(node.kind);
      item["name"] = node.name;
      item["value"] = string_value(*set->document, node.id);
      out.push_back(item);
    }
    return out.dump(2);
  }
  out["type"] = result_type_name(value);
  if (const double* d = std::get_if<double>(&value)) {
    if (std::isfinite(*d)) {
      out["value"] = *d;
    } else {
      out["value"] = to_string(value);
    }
  } else if (const bool* b = std::get_if<bool>(&value)) {
    out["value"] = *b;
  } else {
    out["value"] = std::get<std::string>(value);
  }
  return out.dump(2);
}
#else
std::string build_json(const QueryValue& value) {
  std::string out;
  if (const NodeSet* set = std::get_if<NodeSet>(&value)) {
    out = "[";
    for (size_t i = 0; i < set->size(); ++i) {
      const XmlNode& node = set->at(i);
      out += i == 0 ? "\n" : ",\n";
      out += "  {\"kind\": " + quoted(node_kind_name(node.kind));
      out += ", \"name\": " + quoted(node.name);
      out += ", \"value\": " + quoted(string_value(*set->document, node.id)) + "}";
    }
    out += set->empty() ? "]" : "\n]";
    return out;
  }
  out = "{\"type\": ";
  out += quoted(result_type_name(value));
  out += ", \"value\": ";
  if (const double* d = std::get_if<double>(&value)) {
    out += std::isfinite(*d) ? to_string(value) : quoted(to_string(value));
  } else if (std::holds_alternative<bool>(value)) {
    out += to_string(value);
  } else {
    out += quoted(std::get<std::string>(value));
  }
  out += "}";
  return out;
}
#endif

std::string colorize_json(const std::string& input, bool enable) {
  if (!enable) return input;
  std::string out;
  out.reserve(input.size() * 2);
  bool in_string = false;
  bool escape = false;
  for (size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
        out += '"';
        out += kColor.reset;
        continue;
      }
      out += c;
      continue;
    }
    if (c == '"') {
      in_string = true;
      out += kColor.green;
      out += '"';
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
      out += kColor.cyan;
      while (i < input.size() &&
             (std::isdigit(static_cast<unsigned char>(input[i])) || input[i] == '.' || input[i] == '-' ||
              input[i] == 'e' || input[i] == 'E' || input[i] == '+')) {
        out += input[i++];
      }
      --i;
      out += kColor.reset;
      continue;
    }
    if (input.compare(i, 4, "true") == 0 || input.compare(i, 5, "false") == 0) {
      size_t len = input.compare(i, 4, "true") == 0 ? 4 : 5;
      out += kColor.yellow;
      out.append(input, i, len);
      out += kColor.reset;
      i += len - 1;
      continue;
    }
    if (c == '{' || c == '}' || c == '[' || c == ']' || c == ':' || c == ',') {
      out += kColor.dim;
      out += c;
      out += kColor.reset;
      continue;
    }
    out += c;
  }
  return out;
}

std::string caret_line(const std::string& expression, size_t position) {
  std::string out = "  " + expression + "\n  ";
  out.append(std::min(position, expression.size()), ' ');
  out += "^";
  return out;
}

}  // namespace xpathq::cli
