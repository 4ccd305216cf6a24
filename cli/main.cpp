#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "ui/color.h"
#include "xpathq/xpathq.h"

using namespace xpathq::cli;

namespace {

void print_error(const std::string& message, bool color) {
  if (color) std::cerr << kColor.red;
  std::cerr << "Error: " << message << std::endl;
  if (color) std::cerr << kColor.reset;
}

/// Resolves the --context expression to the first node it selects.
/// MUST fail when the expression does not select at least one node.
/// Inputs are engine/doc/options; outputs are a context node id.
int64_t resolve_context(xpathq::Engine& engine,
                        const xpathq::XmlDocument& doc,
                        const std::string& expression,
                        const xpathq::EvaluateOptions& options) {
  xpathq::QueryValue value = engine.evaluate(expression, doc, 0, options);
  const xpathq::NodeSet* set = std::get_if<xpathq::NodeSet>(&value);
  if (!set || set->empty()) {
    throw std::runtime_error("--context selected no nodes: " + expression);
  }
  return set->ids.front();
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  bool stderr_color = isatty(fileno(stderr));
  CliSettings settings;
  std::string config_error;
  load_config(resolve_config_path(), settings, config_error);
  if (!config_error.empty()) {
    print_error(config_error, stderr_color);
    return 1;
  }

  std::string error;
  if (!parse_cli_args(argc, argv, options, error)) {
    print_error(error, stderr_color);
    return 1;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (!options.mode_from_flag && settings.output_mode.has_value()) {
    options.output_mode = *settings.output_mode;
  }
  if (!options.color_from_flag && settings.color.has_value()) {
    options.color = *settings.color;
  }
  bool color = options.color && isatty(fileno(stdout));
  stderr_color = options.color && stderr_color;

  std::string query;
  try {
    query = options.query_file.empty() ? options.query : trim_query(read_file(options.query_file));
    if (query.empty()) {
      print_error("Missing --query or --query-file", stderr_color);
      return 1;
    }

    xpathq::EngineOptions engine_options;
    if (settings.parse_cache_capacity) engine_options.parse_cache_capacity = *settings.parse_cache_capacity;
    if (settings.compile_cache_capacity) engine_options.compile_cache_capacity = *settings.compile_cache_capacity;
    xpathq::Engine engine(engine_options);

    xpathq::EvaluateOptions eval_options;
    for (const auto& ns : options.namespaces) {
      eval_options.namespaces[ns.first] = ns.second;
    }
    for (const auto& var : options.variables) {
      eval_options.variables[var.first] = var.second;
    }

    if (options.explain) {
      std::cout << engine.explain(query, eval_options.namespaces);
      return 0;
    }

    std::string xml = options.input.empty() ? read_stdin() : load_xml_input(options.input, options.timeout_ms);
    xpathq::XmlDocument doc = xpathq::parse_xml(xml);

    int64_t context_id = 0;
    if (!options.context.empty()) {
      context_id = resolve_context(engine, doc, options.context, eval_options);
    }
    xpathq::QueryValue result = engine.evaluate(query, doc, context_id, eval_options);

    if (options.output_mode == "json") {
      std::cout << colorize_json(build_json(result), color) << std::endl;
    } else {
      std::cout << format_plain(result);
    }
    if (options.verbose) {
      std::cerr << "parse cache: " << engine.parse_cache_size() << " entries, compile cache: "
                << engine.compile_cache_size() << " entries" << std::endl;
    }
    return 0;
  } catch (const xpathq::SyntaxError& ex) {
    print_error(ex.what(), stderr_color);
    std::cerr << caret_line(ex.expression(), ex.position()) << std::endl;
    return 1;
  } catch (const xpathq::EvaluationError& ex) {
    std::string message = ex.what();
    if (!ex.step().empty()) message += " (at " + ex.step() + ")";
    print_error(message, stderr_color);
    return 1;
  } catch (const std::exception& ex) {
    print_error(ex.what(), stderr_color);
    return 1;
  }
}
