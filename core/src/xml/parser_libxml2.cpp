#include "xpathq/document.h"

#include <memory>
#include <stdexcept>
#include <string>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

namespace xpathq {

namespace {

std::string to_std(const xmlChar* text) {
  return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

std::string qualified(const xmlChar* name, const xmlNs* ns) {
  if (ns && ns->prefix) {
    return to_std(ns->prefix) + ":" + to_std(name);
  }
  return to_std(name);
}

/// Copies element attributes, resolving their namespace bindings.
/// MUST preserve libxml2 attribute order and MUST skip xmlns declarations.
/// Inputs are doc/element id/libxml2 node; outputs are appended attribute nodes.
void copy_attributes(XmlDocument& doc, int64_t element_id, xmlNode* cur) {
  for (xmlAttr* attr = cur->properties; attr != nullptr; attr = attr->next) {
    xmlChar* value = xmlNodeListGetString(cur->doc, attr->children, 1);
    std::string text = to_std(value);
    if (value) {
      xmlFree(value);
    }
    std::string uri = attr->ns ? to_std(attr->ns->href) : std::string();
    append_attribute(doc, element_id, qualified(attr->name, attr->ns), text, uri);
  }
}

/// Walks libxml2 siblings and mirrors them into the flat arena.
/// MUST keep traversal deterministic and MUST preserve parent relationships.
/// Inputs are doc/parent id/first sibling; outputs are appended nodes.
void walk_node(XmlDocument& doc, int64_t parent_id, xmlNode* node) {
  for (xmlNode* cur = node; cur != nullptr; cur = cur->next) {
    switch (cur->type) {
      case XML_ELEMENT_NODE: {
        std::string uri = cur->ns ? to_std(cur->ns->href) : std::string();
        int64_t id = append_element(doc, parent_id, qualified(cur->name, cur->ns), uri);
        copy_attributes(doc, id, cur);
        if (cur->children) {
          walk_node(doc, id, cur->children);
        }
        break;
      }
      case XML_TEXT_NODE:
        append_text(doc, parent_id, to_std(cur->content));
        break;
      case XML_CDATA_SECTION_NODE:
        append_cdata(doc, parent_id, to_std(cur->content));
        break;
      case XML_COMMENT_NODE:
        append_comment(doc, parent_id, to_std(cur->content));
        break;
      case XML_PI_NODE:
        append_processing_instruction(doc, parent_id, to_std(cur->name), to_std(cur->content));
        break;
      case XML_ENTITY_REF_NODE:
        // WHY: unexpanded entity references contribute their replacement children.
        if (cur->children) {
          walk_node(doc, parent_id, cur->children);
        }
        break;
      default:
        break;
    }
  }
}

}  // namespace

XmlDocument parse_xml(const std::string& xml) {
  xmlResetLastError();
  xmlDocPtr xml_doc = xmlReadMemory(xml.data(),
                                    static_cast<int>(xml.size()),
                                    nullptr,
                                    nullptr,
                                    XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
  if (!xml_doc) {
    std::string message = "Failed to parse XML";
    const xmlError* err = xmlGetLastError();
    if (err && err->message) {
      std::string detail = err->message;
      while (!detail.empty() && (detail.back() == '\n' || detail.back() == ' ')) {
        detail.pop_back();
      }
      message += " (line " + std::to_string(err->line) + "): " + detail;
    }
    throw std::runtime_error(message);
  }

  std::unique_ptr<xmlDoc, void (*)(xmlDocPtr)> holder(xml_doc, xmlFreeDoc);
  XmlDocument doc = make_document();
  walk_node(doc, 0, holder->children);
  compute_document_metadata(doc);
  return doc;
}

}  // namespace xpathq
