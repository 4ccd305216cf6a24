#pragma once

#include <optional>
#include <string>

namespace xpathq::cli {

/// Values read from the CLI config file; unset keys keep CLI defaults.
struct CliSettings {
  std::optional<size_t> parse_cache_capacity;
  std::optional<size_t> compile_cache_capacity;
  std::optional<std::string> output_mode;
  std::optional<bool> color;
};

/// Resolves the config path from XPATHQ_CONFIG, XDG_CONFIG_HOME or HOME.
/// MUST prefer the explicit override and MUST fall back to a relative name.
/// Inputs are environment variables; outputs are a path string.
std::string resolve_config_path();
/// Loads [engine] and [output] keys from a TOML-like file.
/// MUST return false without an error when the file is absent and MUST report
/// the line number of an invalid value.
/// Inputs are a path; outputs are settings/error with file read side effects.
bool load_config(const std::string& path, CliSettings& out, std::string& error);

}  // namespace xpathq::cli
