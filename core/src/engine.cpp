#include "xpathq/xpathq.h"

#include "cache/lru_cache.h"
#include "compiler/compiler.h"
#include "conversion.h"
#include "generator/generator.h"
#include "query_parser.h"
#include "runtime/evaluation_context.h"

namespace xpathq {

namespace {

// Canonical text for a namespace map; std::map already orders prefixes.
std::string namespace_key(const NamespaceMap& namespaces) {
  std::string out;
  for (const auto& entry : namespaces) {
    out += entry.first;
    out += '=';
    out += entry.second;
    out += '\n';
  }
  return out;
}

const XmlDocument& document_of(const QueryValue& value) {
  static const XmlDocument kEmpty = make_document();
  if (const NodeSet* set = std::get_if<NodeSet>(&value)) {
    if (set->document) return *set->document;
  }
  return kEmpty;
}

}  // namespace

std::string to_string(const QueryValue& value) {
  return conversion::to_string(runtime::from_query_value(value), document_of(value));
}

double to_number(const QueryValue& value) {
  return conversion::to_number(runtime::from_query_value(value), document_of(value));
}

bool to_boolean(const QueryValue& value) {
  return conversion::to_boolean(runtime::from_query_value(value), document_of(value));
}

CompiledQuery::CompiledQuery(std::string expression,
                             std::string source,
                             std::shared_ptr<const LoadedQuery> loaded)
    : expression_(std::move(expression)), source_(std::move(source)), loaded_(std::move(loaded)) {}

QueryValue CompiledQuery::evaluate(const XmlDocument& doc,
                                   int64_t context_id,
                                   const VariableBindings& variables) const {
  if (context_id < 0 || static_cast<size_t>(context_id) >= doc.nodes.size()) {
    throw EvaluationError("Context node " + std::to_string(context_id) + " is not in the document",
                          expression_);
  }
  try {
    runtime::Invocation inv{doc, variables};
    return runtime::to_query_value(runtime::run(*loaded_, inv, context_id), doc);
  } catch (Error& err) {
    if (err.expression().empty()) err.set_expression(expression_);
    throw;
  }
}

struct Engine::Caches {
  explicit Caches(const EngineOptions& options)
      : parsed(options.parse_cache_capacity), compiled(options.compile_cache_capacity) {}

  LruCache<std::string, AstPtr> parsed;
  LruCache<std::string, std::shared_ptr<const CompiledQuery>> compiled;
};

Engine::Engine(EngineOptions options) : caches_(std::make_unique<Caches>(options)) {}

Engine::~Engine() = default;

/// Parses through the parse cache, keyed by the exact expression text.
/// MUST NOT cache failures so a corrected expression is parsed afresh.
/// Inputs are expression text; outputs are shared trees or SyntaxError.
AstPtr Engine::parse(const std::string& expression) {
  return caches_->parsed.get_or_set(expression, [&]() {
    ParseResult result = parse_expression(expression);
    if (result.error.has_value()) {
      const ParseError& err = *result.error;
      throw SyntaxError(err.message, expression, err.position, err.token);
    }
    return result.ast;
  });
}

/// Compiles through the compile cache keyed by tree structure plus namespaces.
/// MUST return the same instance for repeated keys while the entry is cached.
/// Inputs are expression/namespaces; outputs are shared compiled queries.
std::shared_ptr<const CompiledQuery> Engine::compile(const std::string& expression,
                                                     const NamespaceMap& namespaces) {
  AstPtr ast = parse(expression);
  // WHY: equal trees from differently spaced text share one compiled query.
  std::string key = ast_to_sexpr(*ast) + "\n" + namespace_key(namespaces);
  try {
    return caches_->compiled.get_or_set(key, [&]() {
      Compiler compiler(namespaces);
      CodePtr code = compiler.compile(*ast);
      runtime::EvaluationContext context;
      std::shared_ptr<const LoadedQuery> loaded = context.load(*code);
      return std::make_shared<const CompiledQuery>(expression, render_source(*code), loaded);
    });
  } catch (Error& err) {
    if (err.expression().empty()) err.set_expression(expression);
    throw;
  }
}

QueryValue Engine::evaluate(const std::string& expression,
                            const XmlDocument& doc,
                            int64_t context_id,
                            const EvaluateOptions& options) {
  return compile(expression, options.namespaces)->evaluate(doc, context_id, options.variables);
}

std::string Engine::explain(const std::string& expression, const NamespaceMap& namespaces) {
  return compile(expression, namespaces)->source();
}

bool Engine::valid(const std::string& expression) {
  if (caches_->parsed.contains(expression)) return true;
  return !parse_expression(expression).error.has_value();
}

void Engine::clear_caches() {
  caches_->parsed.clear();
  caches_->compiled.clear();
}

size_t Engine::parse_cache_size() const {
  return caches_->parsed.size();
}

size_t Engine::compile_cache_size() const {
  return caches_->compiled.size();
}

}  // namespace xpathq
