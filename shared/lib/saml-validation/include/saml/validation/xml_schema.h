/**
 * @file xml_schema.h
 * @brief Declarative namespace-qualified XML binding over libxml2
 *
 * Each model type is described by a table of rules mapping an exact
 * (namespace URI, local name) pair to a field binder. decode() walks a
 * libxml2 element against such a table:
 *   - child elements are matched by namespace URI and local name only
 *     (prefixes are irrelevant), unknown children are ignored;
 *   - a missing REQUIRED / ONE_OR_MORE item, or more than one occurrence
 *     of a REQUIRED / OPTIONAL element, raises SchemaViolation;
 *   - TEXT binds the concatenated direct text and CDATA children.
 *
 * Attributes are matched without namespace, as SAML defines them.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <libxml/tree.h>

namespace saml::validation::xml {

/// @brief RAII owner of a libxml2 document
struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

/// @brief Document does not match the expected schema
class SchemaViolation : public std::runtime_error {
public:
    explicit SchemaViolation(const std::string& message)
        : std::runtime_error(message) {}
};

enum class RuleKind { ELEMENT, ATTRIBUTE, TEXT };

enum class Occurs {
    REQUIRED,     ///< exactly one
    OPTIONAL,     ///< zero or one
    REPEATED,     ///< zero or more
    ONE_OR_MORE   ///< at least one
};

template <typename T>
struct Rule {
    RuleKind kind;
    const char* ns;         ///< Element namespace URI (unused for attributes/text)
    const char* name;       ///< Local name
    Occurs occurs;
    std::function<void(T&, xmlNode*)> bindElement;
    std::function<void(T&, const std::string&)> bindValue;
};

template <typename T>
using Schema = std::vector<Rule<T>>;

template <typename T>
Rule<T> element(const char* ns, const char* name, Occurs occurs,
                std::function<void(T&, xmlNode*)> bind) {
    return Rule<T>{RuleKind::ELEMENT, ns, name, occurs, std::move(bind), nullptr};
}

template <typename T>
Rule<T> attribute(const char* name, Occurs occurs,
                  std::function<void(T&, const std::string&)> bind) {
    return Rule<T>{RuleKind::ATTRIBUTE, nullptr, name, occurs, nullptr, std::move(bind)};
}

template <typename T>
Rule<T> text(std::function<void(T&, const std::string&)> bind) {
    return Rule<T>{RuleKind::TEXT, nullptr, nullptr, Occurs::OPTIONAL, nullptr, std::move(bind)};
}

/**
 * @brief One-time libxml2 initialisation (safe to call repeatedly)
 */
void initializeParser();

/**
 * @brief Parse bytes into a libxml2 document
 *
 * Network access and entity substitution are disabled and documents
 * carrying a DOCTYPE are rejected.
 *
 * @param bytes Raw XML
 * @param error Receives a diagnostic on failure
 * @return Document, or nullptr on failure
 */
XmlDocPtr parseDocument(const std::vector<uint8_t>& bytes, std::string& error);

/**
 * @brief True if node is an element with the given namespace URI and local name
 */
bool matches(const xmlNode* node, const char* ns, const char* name);

/**
 * @brief Concatenated direct text / CDATA children of an element
 */
std::string directText(const xmlNode* node);

/**
 * @brief Value of an un-namespaced attribute, or std::nullopt if absent
 */
std::optional<std::string> attributeValue(const xmlNode* node, const char* name);

/**
 * @brief "{ns}name" form used in diagnostics
 */
std::string qualifiedName(const char* ns, const char* name);

/**
 * @brief Apply a schema table to an element
 * @throws SchemaViolation on a cardinality violation or a binder rejection
 */
template <typename T>
void decode(xmlNode* node, const Schema<T>& schema, T& out) {
    for (const auto& rule : schema) {
        switch (rule.kind) {
            case RuleKind::ELEMENT: {
                size_t count = 0;
                for (xmlNode* child = node->children; child; child = child->next) {
                    if (!matches(child, rule.ns, rule.name)) {
                        continue;
                    }
                    ++count;
                    if (count > 1 && (rule.occurs == Occurs::REQUIRED ||
                                      rule.occurs == Occurs::OPTIONAL)) {
                        throw SchemaViolation("duplicate element " +
                                              qualifiedName(rule.ns, rule.name));
                    }
                    rule.bindElement(out, child);
                }
                if (count == 0 && (rule.occurs == Occurs::REQUIRED ||
                                   rule.occurs == Occurs::ONE_OR_MORE)) {
                    throw SchemaViolation("missing element " +
                                          qualifiedName(rule.ns, rule.name));
                }
                break;
            }
            case RuleKind::ATTRIBUTE: {
                auto value = attributeValue(node, rule.name);
                if (!value) {
                    if (rule.occurs == Occurs::REQUIRED) {
                        throw SchemaViolation(std::string("missing attribute ") + rule.name +
                                              " on " + reinterpret_cast<const char*>(node->name));
                    }
                    break;
                }
                rule.bindValue(out, *value);
                break;
            }
            case RuleKind::TEXT:
                rule.bindValue(out, directText(node));
                break;
        }
    }
}

/**
 * @brief Check the document root and decode it
 * @throws SchemaViolation if the root is not the expected element
 */
template <typename T>
void decodeRoot(xmlDoc* doc, const char* ns, const char* name, const Schema<T>& schema, T& out) {
    xmlNode* root = xmlDocGetRootElement(doc);
    if (!root || !matches(root, ns, name)) {
        throw SchemaViolation("root element is not " + qualifiedName(ns, name));
    }
    decode(root, schema, out);
}

} // namespace saml::validation::xml
