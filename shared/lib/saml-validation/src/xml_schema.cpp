/**
 * @file xml_schema.cpp
 * @brief libxml2 helpers behind the declarative schema binding
 */

#include "saml/validation/xml_schema.h"
#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <cstring>
#include <limits>
#include <mutex>

namespace saml::validation::xml {

void initializeParser() {
    static std::once_flag flag;
    std::call_once(flag, []() { xmlInitParser(); });
}

XmlDocPtr parseDocument(const std::vector<uint8_t>& bytes, std::string& error) {
    initializeParser();

    if (bytes.empty()) {
        error = "empty document";
        return nullptr;
    }
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        error = "document too large";
        return nullptr;
    }

    xmlResetLastError();
    XmlDocPtr doc(xmlReadMemory(reinterpret_cast<const char*>(bytes.data()),
                                static_cast<int>(bytes.size()),
                                nullptr, nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        const xmlError* err = xmlGetLastError();
        error = "malformed XML";
        if (err && err->message) {
            std::string detail(err->message);
            while (!detail.empty() && (detail.back() == '\n' || detail.back() == ' ')) {
                detail.pop_back();
            }
            error += " (line " + std::to_string(err->line) + "): " + detail;
        }
        return nullptr;
    }

    if (doc->intSubset || doc->extSubset) {
        error = "DOCTYPE declarations are not accepted";
        return nullptr;
    }

    return doc;
}

bool matches(const xmlNode* node, const char* ns, const char* name) {
    if (!node || node->type != XML_ELEMENT_NODE) {
        return false;
    }
    if (std::strcmp(reinterpret_cast<const char*>(node->name), name) != 0) {
        return false;
    }
    if (!node->ns || !node->ns->href) {
        return ns == nullptr || *ns == '\0';
    }
    return ns && std::strcmp(reinterpret_cast<const char*>(node->ns->href), ns) == 0;
}

std::string directText(const xmlNode* node) {
    std::string text;
    for (const xmlNode* child = node->children; child; child = child->next) {
        if ((child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) &&
            child->content) {
            text += reinterpret_cast<const char*>(child->content);
        }
    }
    return text;
}

std::optional<std::string> attributeValue(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetNoNsProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) {
        return std::nullopt;
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

std::string qualifiedName(const char* ns, const char* name) {
    return std::string("{") + (ns ? ns : "") + "}" + name;
}

} // namespace saml::validation::xml
