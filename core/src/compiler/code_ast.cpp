#include "code_ast.h"

namespace xpathq {

namespace {

std::shared_ptr<CodeNode> node(CodeType type) {
  auto out = std::make_shared<CodeNode>();
  out->type = type;
  return out;
}

}  // namespace

namespace code {

CodePtr assign(const std::string& name, CodePtr value) {
  auto out = node(CodeType::Assign);
  out->name = name;
  out->children.push_back(std::move(value));
  return out;
}

CodePtr sequence(std::vector<CodePtr> statements) {
  auto out = node(CodeType::Sequence);
  out->children = std::move(statements);
  return out;
}

CodePtr if_then(CodePtr condition, CodePtr then_branch, CodePtr else_branch) {
  auto out = node(CodeType::If);
  out->children.push_back(std::move(condition));
  out->children.push_back(std::move(then_branch));
  if (else_branch) {
    out->children.push_back(std::move(else_branch));
  }
  return out;
}

CodePtr loop(CodePtr collection, std::vector<std::string> params, CodePtr body) {
  auto out = node(CodeType::Loop);
  out->children.push_back(std::move(collection));
  out->children.push_back(block(std::move(params), std::move(body)));
  return out;
}

CodePtr block(std::vector<std::string> params, CodePtr body) {
  auto out = node(CodeType::Block);
  out->params = std::move(params);
  out->children.push_back(std::move(body));
  return out;
}

CodePtr call(const std::string& name, std::vector<CodePtr> args) {
  auto out = node(CodeType::Call);
  out->name = name;
  out->children = std::move(args);
  return out;
}

CodePtr send(CodePtr receiver, const std::string& name, std::vector<CodePtr> args) {
  auto out = node(CodeType::Call);
  out->name = name;
  out->has_receiver = true;
  out->children.reserve(args.size() + 1);
  out->children.push_back(std::move(receiver));
  for (auto& arg : args) out->children.push_back(std::move(arg));
  return out;
}

CodePtr nil() {
  return node(CodeType::Literal);
}

CodePtr boolean(bool value) {
  auto out = node(CodeType::Literal);
  out->literal = value;
  return out;
}

CodePtr number(double value) {
  auto out = node(CodeType::Literal);
  out->literal = value;
  return out;
}

CodePtr string(const std::string& value) {
  auto out = node(CodeType::Literal);
  out->literal = value;
  return out;
}

CodePtr constant(const std::string& name) {
  auto out = node(CodeType::Const);
  out->name = name;
  return out;
}

CodePtr array(std::vector<CodePtr> elements) {
  auto out = node(CodeType::Array);
  out->children = std::move(elements);
  return out;
}

CodePtr var(const std::string& name) {
  auto out = node(CodeType::Var);
  out->name = name;
  return out;
}

CodePtr and_(CodePtr left, CodePtr right) {
  auto out = node(CodeType::And);
  out->children.push_back(std::move(left));
  out->children.push_back(std::move(right));
  return out;
}

CodePtr or_(CodePtr left, CodePtr right) {
  auto out = node(CodeType::Or);
  out->children.push_back(std::move(left));
  out->children.push_back(std::move(right));
  return out;
}

CodePtr not_(CodePtr operand) {
  auto out = node(CodeType::Not);
  out->children.push_back(std::move(operand));
  return out;
}

}  // namespace code

const char* code_type_name(CodeType type) {
  switch (type) {
    case CodeType::Assign: return "assign";
    case CodeType::Sequence: return "sequence";
    case CodeType::If: return "if";
    case CodeType::Loop: return "loop";
    case CodeType::Block: return "block";
    case CodeType::Call: return "call";
    case CodeType::Literal: return "literal";
    case CodeType::Const: return "const";
    case CodeType::Array: return "array";
    case CodeType::Var: return "var";
    case CodeType::And: return "and";
    case CodeType::Or: return "or";
    case CodeType::Not: return "not";
  }
  return "unknown";
}

}  // namespace xpathq
