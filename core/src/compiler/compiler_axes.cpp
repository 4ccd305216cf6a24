#include "compiler.h"

#include <stdexcept>

namespace xpathq {

using namespace code;

/// Lowers one location step: the axis walk, its node test and its predicates.
/// MUST keep axis order (reverse axes nearest-first) while predicates run.
/// Inputs are Axis trees/context/sink; outputs are statement code.
CodePtr Compiler::on_axis(const AstNode& step, CodePtr context, const std::string& sink) {
  auto axis = axis_from_name(step.text);
  if (!axis.has_value()) {
    throw EvaluationError("Unknown axis: " + step.text, "", step.text + "::");
  }
  const AstNode& test = *step.children.at(0);
  if (*axis == Axis::Namespace) {
    throw EvaluationError("Unsupported axis: namespace", "", "namespace::" + (test.text.empty() ? std::string("*") : test.text));
  }

  bool has_predicates = step.children.size() > 1;
  std::string target = has_predicates ? unique_name("cand") : sink;
  CodePtr walk_code;
  switch (*axis) {
    case Axis::Child: walk_code = on_axis_child(test, context, target); break;
    case Axis::Descendant: walk_code = on_axis_descendant(test, context, target); break;
    case Axis::DescendantOrSelf: walk_code = on_axis_descendant_or_self(test, context, target); break;
    case Axis::Self: walk_code = on_axis_self(test, context, target); break;
    case Axis::Parent: walk_code = on_axis_parent(test, context, target); break;
    case Axis::Ancestor: walk_code = on_axis_ancestor(test, context, target); break;
    case Axis::AncestorOrSelf: walk_code = on_axis_ancestor_or_self(test, context, target); break;
    case Axis::Attribute: walk_code = on_axis_attribute(test, context, target); break;
    case Axis::FollowingSibling: walk_code = on_axis_following_sibling(test, context, target); break;
    case Axis::PrecedingSibling: walk_code = on_axis_preceding_sibling(test, context, target); break;
    case Axis::Following: walk_code = on_axis_following(test, context, target); break;
    case Axis::Preceding: walk_code = on_axis_preceding(test, context, target); break;
    case Axis::Namespace: break;
  }
  if (!has_predicates) {
    return walk_code;
  }

  std::vector<CodePtr> out;
  out.push_back(assign(target, array()));
  out.push_back(walk_code);
  for (size_t i = 1; i < step.children.size(); ++i) {
    out.push_back(on_predicate(*step.children[i], target));
  }
  std::string n = unique_name("node");
  out.push_back(loop(var(target), {n}, push_to(sink, var(n))));
  return sequence(std::move(out));
}

CodePtr Compiler::on_axis_child(const AstNode& test, CodePtr context, const std::string& sink) {
  return walk("children", test, context, sink, "Element");
}

CodePtr Compiler::on_axis_descendant(const AstNode& test, CodePtr context, const std::string& sink) {
  return walk("descendants", test, context, sink, "Element");
}

CodePtr Compiler::on_axis_descendant_or_self(const AstNode& test, CodePtr context,
                                             const std::string& sink) {
  return walk("descendants_or_self", test, context, sink, "Element");
}

// The context may be an attribute, so name tests and wildcards accept both kinds.
CodePtr Compiler::on_axis_self(const AstNode& test, CodePtr context, const std::string& sink) {
  CodePtr cond = on_node_test(test, context, "Element");
  if (test.type != AstType::NodeType) {
    cond = or_(cond, on_node_test(test, context, "Attribute"));
  }
  return if_then(cond, push_to(sink, context));
}

// The document node has no parent; present() guards the test.
CodePtr Compiler::on_axis_parent(const AstNode& test, CodePtr context, const std::string& sink) {
  std::string p = unique_name("parent");
  return sequence({
      assign(p, call("parent", {context})),
      if_then(and_(call("present", {var(p)}), on_node_test(test, var(p), "Element")),
              push_to(sink, var(p))),
  });
}

CodePtr Compiler::on_axis_ancestor(const AstNode& test, CodePtr context, const std::string& sink) {
  return walk("ancestors", test, context, sink, "Element");
}

CodePtr Compiler::on_axis_ancestor_or_self(const AstNode& test, CodePtr context,
                                           const std::string& sink) {
  return walk("ancestors_or_self", test, context, sink, "Element");
}

CodePtr Compiler::on_axis_attribute(const AstNode& test, CodePtr context, const std::string& sink) {
  return walk("attributes", test, context, sink, "Attribute");
}

CodePtr Compiler::on_axis_following_sibling(const AstNode& test, CodePtr context,
                                            const std::string& sink) {
  return walk("following_siblings", test, context, sink, "Element");
}

CodePtr Compiler::on_axis_preceding_sibling(const AstNode& test, CodePtr context,
                                            const std::string& sink) {
  return walk("preceding_siblings", test, context, sink, "Element");
}

CodePtr Compiler::on_axis_following(const AstNode& test, CodePtr context, const std::string& sink) {
  return walk("following", test, context, sink, "Element");
}

CodePtr Compiler::on_axis_preceding(const AstNode& test, CodePtr context, const std::string& sink) {
  return walk("preceding", test, context, sink, "Element");
}

CodePtr Compiler::walk(const char* intrinsic, const AstNode& test, CodePtr context,
                       const std::string& sink, const char* principal) {
  std::string n = unique_name("node");
  return loop(call(intrinsic, {context}), {n},
              if_then(on_node_test(test, var(n), principal), push_to(sink, var(n))));
}

/// Lowers a node test into a boolean condition on candidate.
/// MUST match only the axis principal node kind for name tests and wildcards.
/// Inputs are Test/Wildcard/NodeType trees; outputs are condition code.
CodePtr Compiler::on_node_test(const AstNode& test, CodePtr candidate, const char* principal) {
  switch (test.type) {
    case AstType::Wildcard:
      return call("is_a", {candidate, constant(principal)});
    case AstType::Test:
      return on_name_test(test, candidate, principal);
    case AstType::NodeType:
      return on_node_type(test, candidate);
    default:
      break;
  }
  throw std::logic_error(std::string("No lowering rule for '") + ast_type_name(test.type) +
                         "' as a node test");
}

CodePtr Compiler::on_name_test(const AstNode& test, CodePtr candidate, const char* principal) {
  CodePtr cond = call("is_a", {candidate, constant(principal)});
  if (test.text != "*") {
    cond = and_(cond, call("name_equals_ci", {call("local_name", {candidate}), string(test.text)}));
  }
  if (test.prefix.empty()) {
    return cond;
  }
  // WHY: a prefix the caller did not bind still matches nodes written with it.
  auto it = namespaces_.find(test.prefix);
  if (it != namespaces_.end()) {
    return and_(cond, call("compare_eq", {call("namespace_uri", {candidate}), string(it->second)}));
  }
  return and_(cond, call("compare_eq", {call("namespace_prefix", {candidate}), string(test.prefix)}));
}

CodePtr Compiler::on_node_type(const AstNode& test, CodePtr candidate) {
  if (test.text == "node") {
    return boolean(true);
  }
  if (test.text == "text") {
    return or_(call("is_a", {candidate, constant("Text")}), call("is_a", {candidate, constant("CData")}));
  }
  if (test.text == "comment") {
    return call("is_a", {candidate, constant("Comment")});
  }
  if (test.text == "processing-instruction") {
    CodePtr cond = call("is_a", {candidate, constant("ProcessingInstruction")});
    if (!test.children.empty()) {
      cond = and_(cond, call("compare_eq", {call("local_name", {candidate}), string(test.children[0]->text)}));
    }
    return cond;
  }
  throw EvaluationError("Unknown node type: " + test.text + "()", "", test.text + "()");
}

}  // namespace xpathq
