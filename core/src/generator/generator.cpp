#include "generator.h"

#include <sstream>
#include <stdexcept>

#include "../conversion.h"

namespace xpathq {

namespace {

std::string quote(const std::string& text) {
  std::string out = "\"";
  for (char c : text) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default: out += c; break;
    }
  }
  out += "\"";
  return out;
}

std::string join_params(const std::vector<std::string>& params) {
  std::string out;
  for (size_t i = 0; i < params.size(); ++i) {
    if (i > 0) out += ", ";
    out += params[i];
  }
  return out;
}

class Renderer {
 public:
  std::string run(const CodeNode& root) {
    if (root.type != CodeType::Block) {
      throw std::logic_error("Generated code must be rooted at a block");
    }
    out_ << "[](" << join_params(root.params) << ") {\n";
    ++depth_;
    body(*root.children.at(0), true);
    --depth_;
    out_ << "}\n";
    return out_.str();
  }

 private:
  void indent() {
    for (int i = 0; i < depth_; ++i) out_ << "  ";
  }

  /// Emits a node in statement position.
  /// MUST prefix the final statement of a value-returning body with return.
  /// Inputs are code nodes; outputs are appended lines.
  void body(const CodeNode& node, bool returns) {
    if (node.type == CodeType::Sequence) {
      for (size_t i = 0; i < node.children.size(); ++i) {
        body(*node.children[i], returns && i + 1 == node.children.size());
      }
      return;
    }
    if (node.type == CodeType::If) {
      indent();
      out_ << "if (" << expr(*node.children.at(0)) << ") {\n";
      ++depth_;
      body(*node.children.at(1), returns);
      --depth_;
      if (node.children.size() > 2 && node.children[2]) {
        indent();
        out_ << "} else {\n";
        ++depth_;
        body(*node.children[2], returns);
        --depth_;
      }
      indent();
      out_ << "}\n";
      return;
    }
    if (node.type == CodeType::Loop) {
      const CodeNode& block = *node.children.at(1);
      indent();
      out_ << "each(" << expr(*node.children.at(0)) << ", [&](" << join_params(block.params) << ") {\n";
      ++depth_;
      body(*block.children.at(0), false);
      --depth_;
      indent();
      out_ << "});\n";
      return;
    }
    indent();
    if (node.type == CodeType::Assign) {
      out_ << node.name << " = " << expr(*node.children.at(0)) << ";\n";
      return;
    }
    if (returns) out_ << "return ";
    out_ << expr(node) << ";\n";
  }

  std::string args(const CodeNode& node, size_t first) {
    std::string out;
    for (size_t i = first; i < node.children.size(); ++i) {
      if (i > first) out += ", ";
      out += expr(*node.children[i]);
    }
    return out;
  }

  /// Renders a node in expression position.
  std::string expr(const CodeNode& node) {
    switch (node.type) {
      case CodeType::Literal:
        return literal(node.literal);
      case CodeType::Const:
        return "NodeKind::" + node.name;
      case CodeType::Var:
        return node.name;
      case CodeType::Array:
        return "[" + args(node, 0) + "]";
      case CodeType::Call:
        if (node.has_receiver) {
          return expr(*node.children.at(0)) + "." + node.name + "(" + args(node, 1) + ")";
        }
        return node.name + "(" + args(node, 0) + ")";
      case CodeType::And:
        return "(" + expr(*node.children.at(0)) + " && " + expr(*node.children.at(1)) + ")";
      case CodeType::Or:
        return "(" + expr(*node.children.at(0)) + " || " + expr(*node.children.at(1)) + ")";
      case CodeType::Not:
        return "!" + expr(*node.children.at(0));
      case CodeType::Assign:
        return "(" + node.name + " = " + expr(*node.children.at(0)) + ")";
      case CodeType::If: {
        std::string otherwise = node.children.size() > 2 && node.children[2] ? expr(*node.children[2]) : "nil";
        return "(" + expr(*node.children.at(0)) + " ? " + expr(*node.children.at(1)) + " : " + otherwise + ")";
      }
      case CodeType::Sequence:
      case CodeType::Loop:
        return nested(node);
      case CodeType::Block:
        break;
    }
    throw std::logic_error(std::string("No rendering rule for ") + code_type_name(node.type));
  }

  // Statement-shaped code inside an expression renders as a statement expression.
  std::string nested(const CodeNode& node) {
    Renderer inner;
    inner.depth_ = depth_ + 1;
    inner.body(node, false);
    std::string text = "({\n" + inner.out_.str();
    for (int i = 0; i < depth_; ++i) text += "  ";
    return text + "})";
  }

  static std::string literal(const CodeLiteral& value) {
    if (std::holds_alternative<std::monostate>(value)) return "nil";
    if (const bool* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    if (const double* d = std::get_if<double>(&value)) return conversion::format_number(*d);
    return quote(std::get<std::string>(value));
  }

  std::ostringstream out_;
  int depth_ = 0;
};

}  // namespace

std::string render_source(const CodeNode& root) {
  Renderer renderer;
  return renderer.run(root);
}

}  // namespace xpathq
