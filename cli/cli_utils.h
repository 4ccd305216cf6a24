#pragma once

#include <string>

#include "xpathq/xpathq.h"

namespace xpathq::cli {

/// Reads a file into memory for CLI queries that need filesystem input.
/// MUST throw on missing/unreadable files and MUST not perform network IO.
/// Inputs are a path; outputs are contents; side effects are file reads/errors.
std::string read_file(const std::string& path);
/// Reads all stdin content until EOF.
std::string read_stdin();
/// Removes surrounding whitespace from an expression read from a file.
std::string trim_query(const std::string& value);
/// Checks whether a string should be treated as a URL.
/// MUST only match http and https schemes.
/// Inputs are a string; outputs are a boolean with no side effects.
bool is_url(const std::string& value);
/// Loads XML from a path or URL using CLI-side IO behavior.
/// MUST honor timeouts and MUST fail when network support is disabled.
/// Inputs are path/url and timeout; outputs are XML text with IO side effects.
std::string load_xml_input(const std::string& input, int timeout_ms);

/// Renders a short label for a node: qualified name, @name, text(), comment() and so on.
std::string node_label(const XmlNode& node);
/// Renders a result as plain text: one line per node, or the scalar string form.
/// MUST print nodes in result order as "label<TAB>string-value".
/// Inputs are results; outputs are text with no side effects.
std::string format_plain(const QueryValue& value);
/// Serializes a result as JSON: an array of node objects or a typed scalar object.
/// MUST escape content correctly and MUST encode non-finite numbers as strings.
/// Inputs are results; outputs are JSON text with no side effects.
std::string build_json(const QueryValue& value);
/// Applies ANSI coloring to JSON for readability when enabled.
/// MUST NOT alter JSON semantics and MUST be disabled for non-TTY output.
/// Inputs are JSON text and a flag; outputs are colored text with no side effects.
std::string colorize_json(const std::string& input, bool enable);
/// Renders the expression with a caret under a byte offset for syntax errors.
std::string caret_line(const std::string& expression, size_t position);

}  // namespace xpathq::cli
