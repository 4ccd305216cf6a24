#pragma once

#include <string>
#include <vector>

#include "../ast.h"
#include "code_ast.h"

namespace xpathq {

/// Lowers a parsed expression into generated code for one namespace map.
/// MUST have exactly one rule per AstType; an unhandled type raises std::logic_error.
/// Inputs are trees and namespace bindings; outputs are code trees whose root
/// is a Block binding the context node.
class Compiler {
 public:
  static constexpr const char* kContextVar = "context";

  explicit Compiler(NamespaceMap namespaces = {});

  /// Lowers a tree into a Block taking the context node.
  /// MUST sort node-set results into document order before returning them.
  /// Inputs are trees; outputs are code trees or EvaluationError subclasses.
  CodePtr compile(const AstNode& ast);

  /// Reports whether a node type yields a node-set the caller must collect.
  static bool returns_node_set(AstType type);

 private:
  /// Focus of evaluation: the context node plus proximity position and size.
  struct Focus {
    CodePtr node;
    CodePtr position;
    CodePtr size;
  };

  CodePtr process(const AstNode& ast, const Focus& focus);
  CodePtr process_nodes(const AstNode& ast, const Focus& focus, const std::string& sink);

  CodePtr on_absolute_path(const AstNode& ast, const Focus& focus, const std::string& sink);
  CodePtr on_relative_path(const AstNode& ast, const Focus& focus, const std::string& sink);
  CodePtr on_path(const AstNode& ast, const Focus& focus, const std::string& sink);
  CodePtr on_filter(const AstNode& ast, const Focus& focus, const std::string& sink);
  CodePtr on_union(const AstNode& ast, const Focus& focus, const std::string& sink);
  CodePtr on_steps(const std::vector<AstPtr>& steps, size_t index, CodePtr context,
                   const std::string& sink);
  CodePtr on_axis(const AstNode& step, CodePtr context, const std::string& sink);
  CodePtr on_predicate(const AstNode& predicate, const std::string& candidates);

  CodePtr on_axis_child(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_descendant(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_descendant_or_self(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_self(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_parent(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_ancestor(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_ancestor_or_self(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_attribute(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_following_sibling(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_preceding_sibling(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_following(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr on_axis_preceding(const AstNode& test, CodePtr context, const std::string& sink);
  CodePtr walk(const char* intrinsic, const AstNode& test, CodePtr context,
               const std::string& sink, const char* principal);

  CodePtr on_node_test(const AstNode& test, CodePtr candidate, const char* principal);
  CodePtr on_name_test(const AstNode& test, CodePtr candidate, const char* principal);
  CodePtr on_node_type(const AstNode& test, CodePtr candidate);

  CodePtr on_function(const AstNode& ast, const Focus& focus);
  CodePtr on_binary(const char* intrinsic, const AstNode& ast, const Focus& focus);

  CodePtr collect(const AstNode& ast, const Focus& focus);
  CodePtr push_to(const std::string& sink, CodePtr node);
  std::string unique_name(const std::string& base);

  NamespaceMap namespaces_;
  int next_id_ = 0;
};

}  // namespace xpathq
