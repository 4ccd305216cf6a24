#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace xpathq::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// MUST keep defaults consistent with CLI behavior and MUST validate after parsing.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string query;
  std::string query_file;
  std::string input;
  std::string context;
  std::vector<std::pair<std::string, std::string>> namespaces;
  std::vector<std::pair<std::string, std::string>> variables;
  bool color = true;
  std::string output_mode = "plain";
  bool explain = false;
  bool verbose = false;
  int timeout_ms = 5000;
  bool show_help = false;

  // Set when the flag was given explicitly so config values do not override it.
  bool mode_from_flag = false;
  bool color_from_flag = false;
};

/// Prints the brief startup help shown when no arguments are provided.
/// MUST remain user-facing and MUST not throw on stream failures.
/// Inputs are the output stream; side effects are writing help text.
void print_startup_help(std::ostream& os);
/// Prints the full help text for explicit --help.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on invalid flags, missing values and malformed pairs.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace xpathq::cli
