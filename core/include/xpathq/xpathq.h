#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "xpathq/document.h"

namespace xpathq {

/// Base class for every failure raised while parsing, compiling or evaluating.
/// MUST carry the offending expression when one is known.
/// Inputs are message/expression; outputs are exception objects.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message, std::string expression = "")
      : std::runtime_error(message), expression_(std::move(expression)) {}

  const std::string& expression() const { return expression_; }
  void set_expression(const std::string& expression) { expression_ = expression; }

 private:
  std::string expression_;
};

/// Reports a lexing or parsing failure at a byte offset of the expression.
/// MUST keep position relative to the original expression text.
/// Inputs are message/expression/position/token; outputs are exception objects.
class SyntaxError : public Error {
 public:
  SyntaxError(const std::string& message,
              std::string expression,
              size_t position,
              std::string token)
      : Error(message, std::move(expression)), position_(position), token_(std::move(token)) {}

  size_t position() const { return position_; }
  const std::string& token() const { return token_; }

 private:
  size_t position_ = 0;
  std::string token_;
};

/// Reports a construct that parsed but could not be compiled or evaluated.
/// MUST name the offending sub-step when one is available.
/// Inputs are message/expression/step; outputs are exception objects.
class EvaluationError : public Error {
 public:
  explicit EvaluationError(const std::string& message,
                           std::string expression = "",
                           std::string step = "")
      : Error(message, std::move(expression)), step_(std::move(step)) {}

  const std::string& step() const { return step_; }

 private:
  std::string step_;
};

/// Reports an unknown function or a call with the wrong number of arguments.
class FunctionError : public EvaluationError {
 public:
  FunctionError(const std::string& message, std::string function_name, size_t argument_count)
      : EvaluationError(message, "", function_name + "()"),
        function_name_(std::move(function_name)),
        argument_count_(argument_count) {}

  const std::string& function_name() const { return function_name_; }
  size_t argument_count() const { return argument_count_; }

 private:
  std::string function_name_;
  size_t argument_count_ = 0;
};

/// Reports an operation applied to a value of the wrong node or value type.
class NodeTypeError : public EvaluationError {
 public:
  NodeTypeError(const std::string& message, std::string node_type, std::string operation)
      : EvaluationError(message, "", operation),
        node_type_(std::move(node_type)),
        operation_(std::move(operation)) {}

  const std::string& node_type() const { return node_type_; }
  const std::string& operation() const { return operation_; }

 private:
  std::string node_type_;
  std::string operation_;
};

/// Holds an ordered, identity-deduplicated selection of document nodes.
/// MUST keep ids in document order and MUST NOT outlive the document.
/// Inputs are evaluation results; outputs are borrowed node references.
struct NodeSet {
  const XmlDocument* document = nullptr;
  std::vector<int64_t> ids;

  size_t size() const { return ids.size(); }
  bool empty() const { return ids.empty(); }
  const XmlNode& at(size_t index) const { return document->nodes.at(static_cast<size_t>(ids.at(index))); }
};

/// One of the four XPath 1.0 result types.
using QueryValue = std::variant<NodeSet, std::string, double, bool>;

/// Maps namespace prefixes used in expressions to namespace URIs.
using NamespaceMap = std::map<std::string, std::string>;
/// Binds $name variables to values for one evaluation.
using VariableBindings = std::map<std::string, QueryValue>;

struct EvaluateOptions {
  NamespaceMap namespaces;
  VariableBindings variables;
};

/// Tunes the two memoization layers of the engine.
/// MUST keep capacities above zero; zero is treated as one.
/// Inputs are capacities; outputs are engine configuration.
struct EngineOptions {
  size_t parse_cache_capacity = 100;
  size_t compile_cache_capacity = 1000;
};

/// Converts a result to its XPath string form (first node text for node-sets).
std::string to_string(const QueryValue& value);
/// Converts a result to an XPath number; non-numeric text yields NaN.
double to_number(const QueryValue& value);
/// Converts a result to an XPath boolean.
bool to_boolean(const QueryValue& value);

struct AstNode;
using AstPtr = std::shared_ptr<const AstNode>;

struct LoadedQuery;

/// An expression compiled against one namespace map, ready to run many times.
/// MUST be immutable after construction and MUST be safe to invoke concurrently.
/// Inputs are documents/context/variables; outputs are QueryValue results.
class CompiledQuery {
 public:
  CompiledQuery(std::string expression,
                std::string source,
                std::shared_ptr<const LoadedQuery> loaded);

  /// Runs the query with context_id as the context node.
  /// MUST leave the document untouched and MUST return node-sets in document order.
  /// Inputs are doc/context id/variables; outputs are results or EvaluationError.
  QueryValue evaluate(const XmlDocument& doc,
                      int64_t context_id = 0,
                      const VariableBindings& variables = {}) const;

  const std::string& expression() const { return expression_; }
  /// Returns the generated source text the query was built from.
  const std::string& source() const { return source_; }

 private:
  std::string expression_;
  std::string source_;
  std::shared_ptr<const LoadedQuery> loaded_;
};

/// Public entry point: parses, compiles, caches and evaluates expressions.
/// MUST guard both caches for concurrent callers and MUST surface typed errors.
/// Inputs are expressions/documents/options; outputs are QueryValue results.
class Engine {
 public:
  explicit Engine(EngineOptions options = {});
  ~Engine();
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  /// Evaluates an expression with context_id as the context node.
  /// MUST raise SyntaxError for malformed text and EvaluationError subclasses otherwise.
  /// Inputs are expression/doc/context/options; outputs are QueryValue results.
  QueryValue evaluate(const std::string& expression,
                      const XmlDocument& doc,
                      int64_t context_id = 0,
                      const EvaluateOptions& options = {});

  /// Compiles an expression, returning the cached instance for a repeated key.
  /// MUST key the cache by parsed structure plus namespace map.
  /// Inputs are expression/namespaces; outputs are shared compiled queries.
  std::shared_ptr<const CompiledQuery> compile(const std::string& expression,
                                               const NamespaceMap& namespaces = {});

  /// Parses an expression, returning the cached tree for repeated text.
  AstPtr parse(const std::string& expression);

  /// Renders the generated source for an expression without running it.
  std::string explain(const std::string& expression, const NamespaceMap& namespaces = {});

  /// Checks whether an expression parses; never throws.
  bool valid(const std::string& expression);

  void clear_caches();
  size_t parse_cache_size() const;
  size_t compile_cache_size() const;

 private:
  struct Caches;
  std::unique_ptr<Caches> caches_;
};

}  // namespace xpathq
