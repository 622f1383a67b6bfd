/**
 * @file document_parser.h
 * @brief Parse SAML Response and metadata XML into the document model
 *
 * Parsing is purely structural: no signature, issuer or time checks.
 * Values returned here are untrusted until ResponseVerifier has
 * authenticated them.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "document_model.h"
#include "types.h"

namespace saml::validation {

/// @brief Result of parsing a protocol Response document
struct ResponseParseResult {
    SamlError error = SamlError::NONE;      ///< NONE or PARSE_ERROR
    std::string message;
    std::optional<Response> response;

    bool ok() const { return error == SamlError::NONE; }
};

/// @brief Result of parsing a metadata EntityDescriptor document
struct EntityDescriptorParseResult {
    SamlError error = SamlError::NONE;      ///< NONE or PARSE_ERROR
    std::string message;
    std::optional<EntityDescriptor> entityDescriptor;

    bool ok() const { return error == SamlError::NONE; }
};

/**
 * @brief Parse a samlp:Response document
 *
 * The root must be samlp:Response holding exactly one saml:Assertion.
 * A missing ds:Signature yields an empty signature value, not an error.
 *
 * @param xml Raw (already base64-decoded) document bytes
 */
ResponseParseResult parseResponse(const std::vector<uint8_t>& xml);

/**
 * @brief Parse an md:EntityDescriptor document
 *
 * The root must be md:EntityDescriptor with an entityID and exactly one
 * IDPSSODescriptor carrying at least one signing-capable KeyDescriptor.
 *
 * @param xml Metadata XML text
 */
EntityDescriptorParseResult parseEntityDescriptor(const std::string& xml);

} // namespace saml::validation
