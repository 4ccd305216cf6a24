#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xpathq {

/// Enumerates the node variants a query can visit.
/// MUST stay aligned with node-type tests and the lowering of axes.
/// Inputs are loader/builder decisions; outputs are node classifications.
enum class NodeKind {
  Document,
  Element,
  Text,
  CData,
  Comment,
  ProcessingInstruction,
  Attribute,
  Namespace
};

/// Represents a single node in the flat document arena.
/// MUST keep ids stable and MUST reference parent/children by id only.
/// Inputs are builder or libxml2 data; outputs are read by the query runtime.
struct XmlNode {
  int64_t id = 0;
  NodeKind kind = NodeKind::Element;
  std::string name;
  std::string local_name;
  std::string prefix;
  std::string namespace_uri;
  // Character data for text/cdata/comment/pi/attribute nodes.
  std::string value;
  std::optional<int64_t> parent_id;
  std::vector<int64_t> children;
  std::vector<int64_t> attributes;
  int64_t doc_order = 0;
};

/// Owns every node of one document; node 0 is the document node.
/// MUST be finalized with compute_document_metadata before querying.
/// Inputs are builder calls or parse_xml; outputs are borrowed by queries.
struct XmlDocument {
  std::vector<XmlNode> nodes;
};

/// Creates an empty document holding only the document node.
/// MUST return a document whose node 0 has kind Document.
/// Inputs are none; outputs are a fresh document.
XmlDocument make_document();

/// Appends an element under parent and returns its id.
/// MUST split qualified names into prefix and local parts.
/// Inputs are doc/parent/qname/namespace uri; outputs are new node ids.
int64_t append_element(XmlDocument& doc,
                       int64_t parent_id,
                       const std::string& qname,
                       const std::string& namespace_uri = "");
/// Appends an attribute to an element and returns its id.
/// MUST reject non-element owners with std::invalid_argument.
/// Inputs are doc/element/qname/value/uri; outputs are new node ids.
int64_t append_attribute(XmlDocument& doc,
                         int64_t element_id,
                         const std::string& qname,
                         const std::string& value,
                         const std::string& namespace_uri = "");
int64_t append_text(XmlDocument& doc, int64_t parent_id, const std::string& text);
int64_t append_cdata(XmlDocument& doc, int64_t parent_id, const std::string& text);
int64_t append_comment(XmlDocument& doc, int64_t parent_id, const std::string& text);
int64_t append_processing_instruction(XmlDocument& doc,
                                      int64_t parent_id,
                                      const std::string& target,
                                      const std::string& data);

/// Assigns document order to every node.
/// MUST visit a node, then its attributes, then its children, depth first.
/// Inputs are a built document; outputs are updated doc_order fields.
void compute_document_metadata(XmlDocument& doc);

/// Parses XML text with libxml2 into the flat document model.
/// MUST throw std::runtime_error on malformed input and MUST not fetch entities.
/// Inputs are XML strings; outputs are finalized documents.
XmlDocument parse_xml(const std::string& xml);

const XmlNode& node_at(const XmlDocument& doc, int64_t id);
std::optional<int64_t> parent_of(const XmlDocument& doc, int64_t id);
const std::vector<int64_t>& children_of(const XmlDocument& doc, int64_t id);

/// Computes the XPath string-value of a node.
/// MUST concatenate descendant text for document/element nodes.
/// Inputs are doc/node id; outputs are strings with no side effects.
std::string string_value(const XmlDocument& doc, int64_t id);
/// Looks up an attribute value on an element by qualified name.
/// MUST return nullopt when the attribute is absent.
/// Inputs are doc/element id/name; outputs are optional values.
std::optional<std::string> attribute_value(const XmlDocument& doc,
                                           int64_t element_id,
                                           const std::string& name);

/// Returns a short lowercase label for a node kind, used in diagnostics.
const char* node_kind_name(NodeKind kind);

}  // namespace xpathq
