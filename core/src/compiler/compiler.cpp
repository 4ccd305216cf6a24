#include "compiler.h"

#include <stdexcept>

namespace xpathq {

using namespace code;

Compiler::Compiler(NamespaceMap namespaces) : namespaces_(std::move(namespaces)) {}

bool Compiler::returns_node_set(AstType type) {
  switch (type) {
    case AstType::AbsolutePath:
    case AstType::RelativePath:
    case AstType::Path:
    case AstType::Axis:
    case AstType::Predicate:
    case AstType::FilterExpr:
    case AstType::Union:
      return true;
    default:
      return false;
  }
}

CodePtr Compiler::compile(const AstNode& ast) {
  Focus focus{var(kContextVar), number(1), number(1)};
  CodePtr body;
  if (returns_node_set(ast.type)) {
    std::string matched = unique_name("matched");
    body = sequence({
        assign(matched, array()),
        process_nodes(ast, focus, matched),
        call("sort_unique", {var(matched)}),
    });
  } else {
    body = process(ast, focus);
  }
  return block({kContextVar}, body);
}

/// Lowers an expression to code producing its value.
/// MUST collect node-producing types into a sorted temporary set.
/// Inputs are tree/focus; outputs are value-producing code.
CodePtr Compiler::process(const AstNode& ast, const Focus& focus) {
  switch (ast.type) {
    case AstType::AbsolutePath:
    case AstType::RelativePath:
    case AstType::Path:
    case AstType::Axis:
    case AstType::FilterExpr:
    case AstType::Union:
      return collect(ast, focus);
    case AstType::String:
      return string(ast.text);
    case AstType::Number:
      return number(ast.number);
    case AstType::Variable:
      return call("variable", {string(ast.text)});
    case AstType::Function:
      return on_function(ast, focus);
    case AstType::Or:
      return or_(process(*ast.children.at(0), focus), process(*ast.children.at(1), focus));
    case AstType::And:
      return and_(process(*ast.children.at(0), focus), process(*ast.children.at(1), focus));
    case AstType::Eq: return on_binary("compare_eq", ast, focus);
    case AstType::Neq: return on_binary("compare_neq", ast, focus);
    case AstType::Lt: return on_binary("compare_lt", ast, focus);
    case AstType::Gt: return on_binary("compare_gt", ast, focus);
    case AstType::Lte: return on_binary("compare_lte", ast, focus);
    case AstType::Gte: return on_binary("compare_gte", ast, focus);
    case AstType::Plus: return on_binary("add", ast, focus);
    case AstType::Minus: return on_binary("subtract", ast, focus);
    case AstType::Multiply: return on_binary("multiply", ast, focus);
    case AstType::Div: return on_binary("divide", ast, focus);
    case AstType::Mod: return on_binary("modulo", ast, focus);
    case AstType::Negate:
      return call("negate", {process(*ast.children.at(0), focus)});
    case AstType::Test:
    case AstType::Wildcard:
    case AstType::NodeType:
    case AstType::Predicate:
      break;
  }
  throw std::logic_error(std::string("No lowering rule for '") + ast_type_name(ast.type) +
                         "' in expression position");
}

/// Lowers a node-producing expression into statements pushing into sink.
/// MUST push nodes in axis order; callers sort before exposing results.
/// Inputs are tree/focus/sink name; outputs are statement code.
CodePtr Compiler::process_nodes(const AstNode& ast, const Focus& focus, const std::string& sink) {
  switch (ast.type) {
    case AstType::AbsolutePath: return on_absolute_path(ast, focus, sink);
    case AstType::RelativePath: return on_relative_path(ast, focus, sink);
    case AstType::Path: return on_path(ast, focus, sink);
    case AstType::Axis: return on_axis(ast, focus.node, sink);
    case AstType::FilterExpr: return on_filter(ast, focus, sink);
    case AstType::Union: return on_union(ast, focus, sink);
    default: {
      std::string n = unique_name("node");
      return loop(call("node_set", {process(ast, focus)}), {n}, push_to(sink, var(n)));
    }
  }
}

CodePtr Compiler::on_absolute_path(const AstNode& ast, const Focus& focus, const std::string& sink) {
  std::string root = unique_name("root");
  CodePtr rest = ast.children.empty() ? push_to(sink, var(root))
                                      : on_steps(ast.children, 0, var(root), sink);
  return sequence({assign(root, call("root", {focus.node})), rest});
}

CodePtr Compiler::on_relative_path(const AstNode& ast, const Focus& focus, const std::string& sink) {
  return on_steps(ast.children, 0, focus.node, sink);
}

/// Lowers a filter or primary expression followed by a location path.
/// MUST require the leading expression to be a node-set.
/// Inputs are Path trees; outputs are statement code.
CodePtr Compiler::on_path(const AstNode& ast, const Focus& focus, const std::string& sink) {
  std::string base = unique_name("base");
  std::string n = unique_name("node");
  const AstNode& steps = *ast.children.at(1);
  return sequence({
      assign(base, call("sort_unique", {call("node_set", {process(*ast.children.at(0), focus)})})),
      loop(var(base), {n}, on_steps(steps.children, 0, var(n), sink)),
  });
}

// Positions inside filter predicates follow document order.
CodePtr Compiler::on_filter(const AstNode& ast, const Focus& focus, const std::string& sink) {
  std::string candidates = unique_name("filtered");
  std::vector<CodePtr> out;
  out.push_back(assign(candidates, call("sort_unique", {call("node_set", {process(*ast.children.at(0), focus)})})));
  for (size_t i = 1; i < ast.children.size(); ++i) {
    out.push_back(on_predicate(*ast.children[i], candidates));
  }
  std::string n = unique_name("node");
  out.push_back(loop(var(candidates), {n}, push_to(sink, var(n))));
  return sequence(std::move(out));
}

CodePtr Compiler::on_union(const AstNode& ast, const Focus& focus, const std::string& sink) {
  std::vector<CodePtr> out;
  for (const auto& operand : ast.children) {
    out.push_back(process_nodes(*operand, focus, sink));
  }
  return sequence(std::move(out));
}

/// Lowers steps[index..] relative to context.
/// MUST evaluate the first step into a deduplicated set, then run the rest per node.
/// Inputs are step list/index/context/sink; outputs are statement code.
CodePtr Compiler::on_steps(const std::vector<AstPtr>& steps, size_t index, CodePtr context,
                           const std::string& sink) {
  const AstNode& step = *steps.at(index);
  if (index + 1 == steps.size()) {
    return on_axis(step, context, sink);
  }
  std::string current = unique_name("step");
  std::string n = unique_name("node");
  return sequence({
      assign(current, array()),
      on_axis(step, context, current),
      assign(current, call("sort_unique", {var(current)})),
      loop(var(current), {n}, on_steps(steps, index + 1, var(n), sink)),
  });
}

/// Filters candidates by one predicate using proximity positions.
/// MUST bind position and size for the predicate body.
/// Inputs are Predicate trees and the candidate variable; outputs are statements.
CodePtr Compiler::on_predicate(const AstNode& predicate, const std::string& candidates) {
  std::string size = unique_name("size");
  std::string kept = unique_name("kept");
  std::string n = unique_name("node");
  std::string pos = unique_name("pos");
  Focus inner{var(n), var(pos), var(size)};
  CodePtr test = call("predicate_match", {process(*predicate.children.at(0), inner), var(pos)});
  return sequence({
      assign(size, call("count", {var(candidates)})),
      assign(kept, array()),
      loop(var(candidates), {n, pos}, if_then(test, push_to(kept, var(n)))),
      assign(candidates, var(kept)),
  });
}

CodePtr Compiler::on_binary(const char* intrinsic, const AstNode& ast, const Focus& focus) {
  return call(intrinsic, {process(*ast.children.at(0), focus), process(*ast.children.at(1), focus)});
}

CodePtr Compiler::collect(const AstNode& ast, const Focus& focus) {
  std::string set = unique_name("set");
  return sequence({
      assign(set, array()),
      process_nodes(ast, focus, set),
      call("sort_unique", {var(set)}),
  });
}

CodePtr Compiler::push_to(const std::string& sink, CodePtr node) {
  return send(var(sink), "push", {std::move(node)});
}

std::string Compiler::unique_name(const std::string& base) {
  return base + std::to_string(++next_id_);
}

}  // namespace xpathq
