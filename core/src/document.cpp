#include "xpathq/document.h"

#include <stdexcept>

namespace xpathq {

namespace {

void split_qname(const std::string& qname, std::string& prefix, std::string& local) {
  size_t colon = qname.find(':');
  if (colon == std::string::npos) {
    prefix.clear();
    local = qname;
    return;
  }
  prefix = qname.substr(0, colon);
  local = qname.substr(colon + 1);
}

XmlNode& checked_node(XmlDocument& doc, int64_t id) {
  if (id < 0 || static_cast<size_t>(id) >= doc.nodes.size()) {
    throw std::out_of_range("Unknown node id: " + std::to_string(id));
  }
  return doc.nodes[static_cast<size_t>(id)];
}

/// Appends a node and links it as the last child of parent.
/// MUST only accept document or element parents.
/// Inputs are doc/parent/node template; outputs are new node ids.
int64_t append_child(XmlDocument& doc, int64_t parent_id, XmlNode node) {
  NodeKind parent_kind = checked_node(doc, parent_id).kind;
  if (parent_kind != NodeKind::Document && parent_kind != NodeKind::Element) {
    throw std::invalid_argument(std::string("Cannot append children to a ") +
                                node_kind_name(parent_kind) + " node");
  }
  node.id = static_cast<int64_t>(doc.nodes.size());
  node.parent_id = parent_id;
  doc.nodes.push_back(std::move(node));
  int64_t id = doc.nodes.back().id;
  doc.nodes[static_cast<size_t>(parent_id)].children.push_back(id);
  return id;
}

void collect_text(const XmlDocument& doc, int64_t id, std::string& out) {
  for (int64_t child : doc.nodes[static_cast<size_t>(id)].children) {
    const XmlNode& node = doc.nodes[static_cast<size_t>(child)];
    if (node.kind == NodeKind::Text || node.kind == NodeKind::CData) {
      out += node.value;
    } else if (node.kind == NodeKind::Element) {
      collect_text(doc, child, out);
    }
  }
}

}  // namespace

XmlDocument make_document() {
  XmlDocument doc;
  XmlNode root;
  root.id = 0;
  root.kind = NodeKind::Document;
  doc.nodes.push_back(root);
  return doc;
}

int64_t append_element(XmlDocument& doc,
                       int64_t parent_id,
                       const std::string& qname,
                       const std::string& namespace_uri) {
  XmlNode node;
  node.kind = NodeKind::Element;
  node.name = qname;
  split_qname(qname, node.prefix, node.local_name);
  node.namespace_uri = namespace_uri;
  return append_child(doc, parent_id, std::move(node));
}

int64_t append_attribute(XmlDocument& doc,
                         int64_t element_id,
                         const std::string& qname,
                         const std::string& value,
                         const std::string& namespace_uri) {
  if (checked_node(doc, element_id).kind != NodeKind::Element) {
    throw std::invalid_argument("Attributes can only be attached to elements");
  }
  XmlNode node;
  node.kind = NodeKind::Attribute;
  node.name = qname;
  split_qname(qname, node.prefix, node.local_name);
  node.namespace_uri = namespace_uri;
  node.value = value;
  node.id = static_cast<int64_t>(doc.nodes.size());
  node.parent_id = element_id;
  doc.nodes.push_back(std::move(node));
  int64_t id = doc.nodes.back().id;
  doc.nodes[static_cast<size_t>(element_id)].attributes.push_back(id);
  return id;
}

int64_t append_text(XmlDocument& doc, int64_t parent_id, const std::string& text) {
  XmlNode node;
  node.kind = NodeKind::Text;
  node.value = text;
  return append_child(doc, parent_id, std::move(node));
}

int64_t append_cdata(XmlDocument& doc, int64_t parent_id, const std::string& text) {
  XmlNode node;
  node.kind = NodeKind::CData;
  node.value = text;
  return append_child(doc, parent_id, std::move(node));
}

int64_t append_comment(XmlDocument& doc, int64_t parent_id, const std::string& text) {
  XmlNode node;
  node.kind = NodeKind::Comment;
  node.value = text;
  return append_child(doc, parent_id, std::move(node));
}

int64_t append_processing_instruction(XmlDocument& doc,
                                      int64_t parent_id,
                                      const std::string& target,
                                      const std::string& data) {
  XmlNode node;
  node.kind = NodeKind::ProcessingInstruction;
  node.name = target;
  node.local_name = target;
  node.value = data;
  return append_child(doc, parent_id, std::move(node));
}

void compute_document_metadata(XmlDocument& doc) {
  std::vector<int64_t> roots;
  for (const auto& node : doc.nodes) {
    if (!node.parent_id.has_value()) {
      roots.push_back(node.id);
    }
  }
  int64_t order = 0;
  std::vector<int64_t> stack;
  for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
    stack.push_back(*it);
  }
  while (!stack.empty()) {
    int64_t id = stack.back();
    stack.pop_back();
    XmlNode& node = doc.nodes.at(static_cast<size_t>(id));
    node.doc_order = order++;
    // WHY: attributes sort after their owner and before its first child.
    for (int64_t attr : node.attributes) {
      doc.nodes.at(static_cast<size_t>(attr)).doc_order = order++;
    }
    for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
      stack.push_back(*it);
    }
  }
}

const XmlNode& node_at(const XmlDocument& doc, int64_t id) {
  if (id < 0 || static_cast<size_t>(id) >= doc.nodes.size()) {
    throw std::out_of_range("Unknown node id: " + std::to_string(id));
  }
  return doc.nodes[static_cast<size_t>(id)];
}

std::optional<int64_t> parent_of(const XmlDocument& doc, int64_t id) {
  return node_at(doc, id).parent_id;
}

const std::vector<int64_t>& children_of(const XmlDocument& doc, int64_t id) {
  return node_at(doc, id).children;
}

std::string string_value(const XmlDocument& doc, int64_t id) {
  const XmlNode& node = node_at(doc, id);
  if (node.kind == NodeKind::Document || node.kind == NodeKind::Element) {
    std::string out;
    collect_text(doc, id, out);
    return out;
  }
  return node.value;
}

std::optional<std::string> attribute_value(const XmlDocument& doc,
                                           int64_t element_id,
                                           const std::string& name) {
  for (int64_t attr : node_at(doc, element_id).attributes) {
    const XmlNode& node = doc.nodes[static_cast<size_t>(attr)];
    if (node.name == name) {
      return node.value;
    }
  }
  return std::nullopt;
}

const char* node_kind_name(NodeKind kind) {
  switch (kind) {
    case NodeKind::Document: return "document";
    case NodeKind::Element: return "element";
    case NodeKind::Text: return "text";
    case NodeKind::CData: return "cdata";
    case NodeKind::Comment: return "comment";
    case NodeKind::ProcessingInstruction: return "processing-instruction";
    case NodeKind::Attribute: return "attribute";
    case NodeKind::Namespace: return "namespace";
  }
  return "unknown";
}

}  // namespace xpathq
