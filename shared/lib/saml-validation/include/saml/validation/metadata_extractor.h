/**
 * @file metadata_extractor.h
 * @brief Trust anchor extraction from IdP metadata
 *
 * Algorithm:
 *   1. base64-decode the signing KeyDescriptor certificate -> DECODE_ERROR
 *   2. parse it as DER X.509 (structure only)             -> CERTIFICATE_PARSE_ERROR
 *   3. first SingleSignOnService with the HTTP-Redirect
 *      binding, in document order                          -> NO_REDIRECT_BINDING
 *   4. parse its Location as a URL                         -> PARSE_ERROR
 *
 * Expiry and chain of the certificate are not examined.
 */

#pragma once

#include <string>
#include "document_model.h"
#include "trust_anchor.h"

namespace saml::validation {

/**
 * @brief Extract issuer, certificate and redirect URL from parsed metadata
 *
 * @param metadata Parsed EntityDescriptor
 * @return TrustAnchorResult with the anchor or the failure kind
 */
TrustAnchorResult extractTrustAnchor(const EntityDescriptor& metadata);

/**
 * @brief Parse metadata XML, then extractTrustAnchor()
 *
 * @param xml EntityDescriptor document
 * @return PARSE_ERROR for malformed metadata, otherwise as extractTrustAnchor()
 */
TrustAnchorResult extractTrustAnchorFromXml(const std::string& xml);

} // namespace saml::validation
