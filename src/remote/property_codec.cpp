// =============================================================================
// qzbulk - Property Set XML Codec Implementation
// =============================================================================

#include "qzb/remote/property_codec.h"

#include <memory>
#include <mutex>
#include <string>

#include <libxml/parser.h>
#include <libxml/tree.h>

#include "qzb/common/error.h"

namespace qzb::remote {

namespace {

constexpr const char* kPropertiesElement = "properties";
constexpr const char* kPropertyElement = "property";

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlBufferDeleter {
    void operator()(xmlBuffer* buffer) const noexcept { xmlBufferFree(buffer); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* text) const noexcept { xmlFree(text); }
};
using XmlString = std::unique_ptr<xmlChar, XmlCharDeleter>;

const xmlChar* xml(const char* text) {
    return reinterpret_cast<const xmlChar*>(text);
}

const xmlChar* xml(const std::string& text) {
    return reinterpret_cast<const xmlChar*>(text.c_str());
}

/// libxml2 must be initialized once before it is used from several threads.
void ensureParserInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

bool isNodeType(const std::string& type) {
    return type == "node()" || type == "element()";
}

bool isElement(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE && xmlStrEqual(node->name, xml(name)) != 0;
}

std::string attribute(xmlNode* node, const char* name) {
    XmlString value(xmlGetProp(node, xml(name)));
    return value ? std::string(reinterpret_cast<const char*>(value.get())) : std::string();
}

XmlDocPtr parse(std::span<const std::uint8_t> data) {
    ensureParserInitialized();
    XmlDocPtr doc(xmlReadMemory(reinterpret_cast<const char*>(data.data()),
                                static_cast<int>(data.size()), nullptr, nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc || xmlDocGetRootElement(doc.get()) == nullptr) {
        throw FormatError("Malformed property XML");
    }
    return doc;
}

std::string propertyValue(xmlNode* node) {
    bool hasElement = false;
    for (xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            hasElement = true;
            break;
        }
    }

    if (!hasElement) {
        XmlString content(xmlNodeGetContent(node));
        return content ? std::string(reinterpret_cast<const char*>(content.get())) : std::string();
    }

    // node() value: serialize the element children
    std::unique_ptr<xmlBuffer, XmlBufferDeleter> buffer(xmlBufferCreate());
    for (xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            xmlNodeDump(buffer.get(), node->doc, child, 0, 0);
        }
    }
    return std::string(reinterpret_cast<const char*>(xmlBufferContent(buffer.get())),
                       static_cast<std::size_t>(xmlBufferLength(buffer.get())));
}

PropertySet decodeSet(xmlNode* node) {
    PropertySet set;
    set.path = attribute(node, "path");

    for (xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (!isElement(child, kPropertyElement)) {
            continue;
        }
        Property property;
        property.name = attribute(child, "name");
        if (property.name.empty()) {
            throw FormatError("Property without a name", ErrorContext{}.withPath(set.path));
        }
        std::string type = attribute(child, "type");
        if (!type.empty()) {
            property.type = std::move(type);
        }
        property.value = propertyValue(child);
        set.properties.push_back(std::move(property));
    }
    return set;
}

}  // namespace

Payload encodeProperties(const PropertySet& properties) {
    ensureParserInitialized();

    XmlDocPtr doc(xmlNewDoc(xml("1.0")));
    xmlNode* root = xmlNewNode(nullptr, xml(kPropertiesElement));
    xmlDocSetRootElement(doc.get(), root);
    xmlNewProp(root, xml("path"), xml(properties.path));

    for (const Property& property : properties.properties) {
        xmlNode* node = nullptr;
        if (isNodeType(property.type)) {
            XmlDocPtr fragment(xmlReadMemory(property.value.data(),
                                             static_cast<int>(property.value.size()), nullptr,
                                             "UTF-8",
                                             XML_PARSE_NONET | XML_PARSE_NOERROR |
                                                 XML_PARSE_NOWARNING));
            if (fragment && xmlDocGetRootElement(fragment.get()) != nullptr) {
                node = xmlNewChild(root, nullptr, xml(kPropertyElement), nullptr);
                xmlAddChild(node, xmlDocCopyNode(xmlDocGetRootElement(fragment.get()), doc.get(), 1));
            }
        }
        if (node == nullptr) {
            node = xmlNewTextChild(root, nullptr, xml(kPropertyElement), xml(property.value));
        }
        xmlNewProp(node, xml("name"), xml(property.name));
        xmlNewProp(node, xml("type"), xml(property.type));
    }

    xmlChar* memory = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc.get(), &memory, &size, "UTF-8", 0);
    XmlString owned(memory);
    if (!owned || size < 0) {
        throw FormatError("Failed to serialize properties", ErrorContext{}.withPath(properties.path));
    }
    return Payload(memory, memory + size);
}

PropertySet decodeProperties(std::span<const std::uint8_t> data) {
    XmlDocPtr doc = parse(data);
    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!isElement(root, kPropertiesElement)) {
        throw FormatError("Expected a <properties> root element");
    }
    return decodeSet(root);
}

std::vector<PropertySet> decodePropertiesList(std::span<const std::uint8_t> data) {
    XmlDocPtr doc = parse(data);
    xmlNode* root = xmlDocGetRootElement(doc.get());

    std::vector<PropertySet> sets;
    for (xmlNode* child = root->children; child != nullptr; child = child->next) {
        if (isElement(child, kPropertiesElement)) {
            sets.push_back(decodeSet(child));
        }
    }
    if (sets.empty() && isElement(root, kPropertiesElement)) {
        sets.push_back(decodeSet(root));
    }
    return sets;
}

}  // namespace qzb::remote
