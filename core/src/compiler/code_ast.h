#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace xpathq {

/// Enumerates the imperative constructs emitted by lowering.
/// MUST have one rendering rule in the generator and one loading rule in the
/// evaluation context per kind.
/// Inputs are compiler decisions; outputs are tree tags.
enum class CodeType {
  Assign,
  Sequence,
  If,
  Loop,
  Block,
  Call,
  Literal,
  Const,
  Array,
  Var,
  And,
  Or,
  Not
};

struct CodeNode;
using CodePtr = std::shared_ptr<const CodeNode>;

/// Literal payload: nil, boolean, number or string.
using CodeLiteral = std::variant<std::monostate, bool, double, std::string>;

/// One node of the generated-code tree.
/// MUST be immutable once built; lives only between lowering and loading.
/// Inputs are DSL helpers below; outputs are read by generator and loader.
///
/// Field use per type:
///   Assign    name = variable; children = value
///   Sequence  children = statements, value of the last is the result
///   If        children = condition, then, optional else
///   Loop      children = collection, Block
///   Block     params = bound names (item, optional 1-based index); children = body
///   Call      name = intrinsic; children = [receiver,] args; has_receiver marks the receiver
///   Const     name = constant name
///   Array     children = elements
///   Var       name = variable
///   And/Or    children = operands; Not children = operand
struct CodeNode {
  CodeType type;
  std::string name;
  CodeLiteral literal;
  bool has_receiver = false;
  std::vector<std::string> params;
  std::vector<CodePtr> children;
};

namespace code {

CodePtr assign(const std::string& name, CodePtr value);
CodePtr sequence(std::vector<CodePtr> statements);
CodePtr if_then(CodePtr condition, CodePtr then_branch, CodePtr else_branch = nullptr);
CodePtr loop(CodePtr collection, std::vector<std::string> params, CodePtr body);
CodePtr block(std::vector<std::string> params, CodePtr body);
CodePtr call(const std::string& name, std::vector<CodePtr> args = {});
/// Builds receiver.name(args); only Var receivers are mutable at load time.
CodePtr send(CodePtr receiver, const std::string& name, std::vector<CodePtr> args = {});
CodePtr nil();
CodePtr boolean(bool value);
CodePtr number(double value);
CodePtr string(const std::string& value);
CodePtr constant(const std::string& name);
CodePtr array(std::vector<CodePtr> elements = {});
CodePtr var(const std::string& name);
CodePtr and_(CodePtr left, CodePtr right);
CodePtr or_(CodePtr left, CodePtr right);
CodePtr not_(CodePtr operand);

}  // namespace code

const char* code_type_name(CodeType type);

}  // namespace xpathq
