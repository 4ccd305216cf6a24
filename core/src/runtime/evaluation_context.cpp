#include "evaluation_context.h"

#include "../conversion.h"

namespace xpathq::runtime {

namespace {

void run_all(const std::vector<Thunk>& thunks, Frame& frame, const Invocation& inv, Args& out) {
  out.clear();
  out.reserve(thunks.size());
  for (const auto& thunk : thunks) {
    out.push_back(thunk(frame, inv));
  }
}

}  // namespace

std::shared_ptr<const LoadedQuery> EvaluationContext::load(const CodeNode& root) {
  if (root.type != CodeType::Block || root.params.size() != 1 || root.children.size() != 1) {
    throw EvaluationError("Generated code must be a block taking the context node");
  }
  slots_.clear();
  auto loaded = std::make_shared<LoadedQuery>();
  loaded->context_slot = slot_for(root.params[0]);
  loaded->entry = load_node(*root.children[0]);
  loaded->slot_count = slots_.size();
  return loaded;
}

size_t EvaluationContext::slot_for(const std::string& name) {
  auto it = slots_.find(name);
  if (it != slots_.end()) return it->second;
  size_t index = slots_.size();
  slots_.emplace(name, index);
  return index;
}

std::vector<Thunk> EvaluationContext::load_children(const CodeNode& node, size_t first) {
  std::vector<Thunk> out;
  for (size_t i = first; i < node.children.size(); ++i) {
    out.push_back(load_node(*node.children[i]));
  }
  return out;
}

/// Turns one code node into a closure.
/// MUST give every construct kind exactly one loading rule.
/// Inputs are code nodes; outputs are thunks or EvaluationError.
Thunk EvaluationContext::load_node(const CodeNode& node) {
  switch (node.type) {
    case CodeType::Literal: {
      Value value;
      if (const bool* b = std::get_if<bool>(&node.literal)) value = *b;
      else if (const double* d = std::get_if<double>(&node.literal)) value = *d;
      else if (const std::string* s = std::get_if<std::string>(&node.literal)) value = *s;
      return [value](Frame&, const Invocation&) { return value; };
    }
    case CodeType::Const: {
      auto value = resolve_constant(node.name);
      if (!value.has_value()) {
        throw EvaluationError("Unknown constant: " + node.name);
      }
      Value resolved = *value;
      return [resolved](Frame&, const Invocation&) { return resolved; };
    }
    case CodeType::Var: {
      size_t slot = slot_for(node.name);
      return [slot](Frame& frame, const Invocation&) { return frame.slots[slot]; };
    }
    case CodeType::Assign: {
      size_t slot = slot_for(node.name);
      Thunk value = load_node(*node.children.at(0));
      return [slot, value](Frame& frame, const Invocation& inv) -> Value {
        frame.slots[slot] = value(frame, inv);
        return std::monostate{};
      };
    }
    case CodeType::Sequence: {
      std::vector<Thunk> statements = load_children(node, 0);
      return [statements](Frame& frame, const Invocation& inv) -> Value {
        Value last;
        for (const auto& statement : statements) {
          last = statement(frame, inv);
        }
        return last;
      };
    }
    case CodeType::If: {
      Thunk condition = load_node(*node.children.at(0));
      Thunk then_branch = load_node(*node.children.at(1));
      Thunk else_branch;
      if (node.children.size() > 2 && node.children[2]) {
        else_branch = load_node(*node.children[2]);
      }
      return [condition, then_branch, else_branch](Frame& frame, const Invocation& inv) -> Value {
        if (conversion::to_boolean(condition(frame, inv), inv.doc)) {
          return then_branch(frame, inv);
        }
        if (else_branch) return else_branch(frame, inv);
        return std::monostate{};
      };
    }
    case CodeType::Loop:
      return load_loop(node);
    case CodeType::Call:
      return load_call(node);
    case CodeType::Array: {
      std::vector<Thunk> elements = load_children(node, 0);
      return [elements](Frame& frame, const Invocation& inv) -> Value {
        NodeList out;
        for (const auto& element : elements) {
          NodeList items = expect_node_set(element(frame, inv), "array");
          out.insert(out.end(), items.begin(), items.end());
        }
        return out;
      };
    }
    case CodeType::And: {
      Thunk left = load_node(*node.children.at(0));
      Thunk right = load_node(*node.children.at(1));
      return [left, right](Frame& frame, const Invocation& inv) -> Value {
        return conversion::to_boolean(left(frame, inv), inv.doc) &&
               conversion::to_boolean(right(frame, inv), inv.doc);
      };
    }
    case CodeType::Or: {
      Thunk left = load_node(*node.children.at(0));
      Thunk right = load_node(*node.children.at(1));
      return [left, right](Frame& frame, const Invocation& inv) -> Value {
        return conversion::to_boolean(left(frame, inv), inv.doc) ||
               conversion::to_boolean(right(frame, inv), inv.doc);
      };
    }
    case CodeType::Not: {
      Thunk operand = load_node(*node.children.at(0));
      return [operand](Frame& frame, const Invocation& inv) -> Value {
        return !conversion::to_boolean(operand(frame, inv), inv.doc);
      };
    }
    case CodeType::Block:
      break;
  }
  throw EvaluationError(std::string("Cannot load '") + code_type_name(node.type) + "' here");
}

Thunk EvaluationContext::load_call(const CodeNode& node) {
  if (node.has_receiver) {
    const CodeNode& receiver = *node.children.at(0);
    if (receiver.type != CodeType::Var) {
      throw EvaluationError("Receiver of " + node.name + " must be a variable");
    }
    ReceiverIntrinsic fn = find_receiver_builtin(node.name);
    if (!fn) {
      throw EvaluationError("Unknown intrinsic: " + node.name);
    }
    size_t slot = slot_for(receiver.name);
    std::vector<Thunk> args = load_children(node, 1);
    return [fn, slot, args](Frame& frame, const Invocation& inv) -> Value {
      Args values;
      run_all(args, frame, inv, values);
      fn(inv, frame.slots[slot], values);
      return std::monostate{};
    };
  }
  bool is_function = node.name.compare(0, 3, "fn:") == 0;
  Intrinsic fn = is_function ? find_function(node.name) : find_builtin(node.name);
  if (!fn) {
    throw EvaluationError("Unknown intrinsic: " + node.name);
  }
  std::vector<Thunk> args = load_children(node, 0);
  return [fn, args](Frame& frame, const Invocation& inv) -> Value {
    Args values;
    run_all(args, frame, inv, values);
    return fn(inv, values);
  };
}

// Binds the item as a node and the optional second parameter as a 1-based position.
Thunk EvaluationContext::load_loop(const CodeNode& node) {
  const CodeNode& block = *node.children.at(1);
  if (block.type != CodeType::Block || block.params.empty() || block.children.size() != 1) {
    throw EvaluationError("Loop body must be a block binding the item");
  }
  Thunk collection = load_node(*node.children.at(0));
  size_t item_slot = slot_for(block.params[0]);
  bool has_index = block.params.size() > 1;
  size_t index_slot = has_index ? slot_for(block.params[1]) : 0;
  Thunk body = load_node(*block.children[0]);
  return [collection, item_slot, has_index, index_slot, body](Frame& frame, const Invocation& inv) -> Value {
    NodeList items = expect_node_set(collection(frame, inv), "loop");
    for (size_t i = 0; i < items.size(); ++i) {
      frame.slots[item_slot] = NodeRef{items[i]};
      if (has_index) frame.slots[index_slot] = static_cast<double>(i + 1);
      body(frame, inv);
    }
    return std::monostate{};
  };
}

Value run(const LoadedQuery& loaded, const Invocation& inv, int64_t context_id) {
  Frame frame;
  frame.slots.resize(loaded.slot_count);
  frame.slots[loaded.context_slot] = NodeRef{context_id};
  return loaded.entry(frame, inv);
}

}  // namespace xpathq::runtime
