#include "cli_args.h"

#include <stdexcept>
#include <string>

namespace xpathq::cli {

namespace {

/// Splits a name=value flag argument.
/// MUST reject an empty name or a missing '='.
/// Inputs are raw text; outputs are the pair or false.
bool split_pair(const std::string& raw, std::pair<std::string, std::string>& out) {
  size_t eq = raw.find('=');
  if (eq == std::string::npos || eq == 0) return false;
  out.first = raw.substr(0, eq);
  out.second = raw.substr(eq + 1);
  return true;
}

bool takes_value(const std::string& arg) {
  return arg == "--query" || arg == "-q" || arg == "--query-file" || arg == "--input" ||
         arg == "--context" || arg == "--ns" || arg == "--var" || arg == "--mode" ||
         arg == "--timeout-ms";
}

bool parse_int(const std::string& raw, int& out) {
  try {
    size_t pos = 0;
    int value = std::stoi(raw, &pos);
    if (pos != raw.size() || value < 0) return false;
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

void print_startup_help(std::ostream& os) {
  os << "xpathq - XPath 1.0 query tool for XML documents\n\n";
  os << "Usage:\n";
  os << "  xpathq --query <xpath> [--input <path|url>]\n";
  os << "  xpathq --query-file <file> [--input <path|url>]\n";
  os << "  xpathq --mode plain|json\n";
  os << "  xpathq --explain --query <xpath>\n\n";
  os << "Notes:\n";
  os << "  - If --input is omitted, XML is read from stdin.\n";
  os << "  - URLs are supported when libcurl is available.\n\n";
  os << "Examples:\n";
  os << "  xpathq --query \"//book[@id][1]/title\" --input ./data/catalog.xml\n";
  os << "  xpathq --ns a=urn:atom --query \"count(//a:entry)\" --input feed.xml\n";
  os << "  xpathq --var min=10 --query \"//item[@price > $min]\" --input items.xml\n";
}

void print_help(std::ostream& os) {
  os << "Usage: xpathq --query <xpath> [--input <path|url>]\n";
  os << "       xpathq --query-file <file> [--input <path|url>]\n";
  os << "Options:\n";
  os << "  -q, --query <xpath>     expression to evaluate\n";
  os << "  --query-file <file>     read the expression from a file\n";
  os << "  --input <path|url>      XML document (default: stdin)\n";
  os << "  --ns <prefix=uri>       bind a namespace prefix (repeatable)\n";
  os << "  --var <name=value>      bind $name to a string value (repeatable)\n";
  os << "  --context <xpath>       evaluate relative to the first node it selects\n";
  os << "  --mode plain|json       output format\n";
  os << "  --explain               print the generated code instead of running\n";
  os << "  --color=disabled        disable ANSI colors\n";
  os << "  --timeout-ms <n>        URL fetch timeout\n";
  os << "  --verbose               print cache statistics to stderr\n";
  os << "Config is read from $XPATHQ_CONFIG or ~/.config/xpathq/config.toml.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if ((arg == "--query" || arg == "-q") && has_value) {
      parsed.query = argv[++i];
    } else if (arg == "--query-file" && has_value) {
      parsed.query_file = argv[++i];
    } else if (arg == "--input" && has_value) {
      parsed.input = argv[++i];
    } else if (arg == "--context" && has_value) {
      parsed.context = argv[++i];
    } else if (arg == "--ns" && has_value) {
      std::pair<std::string, std::string> binding;
      if (!split_pair(argv[++i], binding)) {
        error = "Invalid --ns value (use prefix=uri)";
        return false;
      }
      parsed.namespaces.push_back(binding);
    } else if (arg == "--var" && has_value) {
      std::pair<std::string, std::string> binding;
      if (!split_pair(argv[++i], binding)) {
        error = "Invalid --var value (use name=value)";
        return false;
      }
      parsed.variables.push_back(binding);
    } else if (arg == "--mode" && has_value) {
      std::string value = argv[++i];
      if (value != "plain" && value != "json") {
        // WHY: invalid modes must fail fast instead of silently picking a format.
        error = "Invalid --mode value (use plain|json)";
        return false;
      }
      parsed.output_mode = value;
      parsed.mode_from_flag = true;
    } else if (arg == "--explain") {
      parsed.explain = true;
    } else if (arg == "--verbose") {
      parsed.verbose = true;
    } else if (arg == "--color=disabled") {
      parsed.color = false;
      parsed.color_from_flag = true;
    } else if (arg == "--timeout-ms" && has_value) {
      if (!parse_int(argv[++i], parsed.timeout_ms)) {
        error = "Invalid --timeout-ms value";
        return false;
      }
    } else if (arg == "--help" || arg == "-h") {
      parsed.show_help = true;
    } else {
      error = takes_value(arg) ? "Missing value for " + arg : "Unknown argument: " + arg;
      return false;
    }
  }
  options = parsed;
  return true;
}

}  // namespace xpathq::cli
