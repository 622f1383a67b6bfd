/**
 * @file providers.h
 * @brief Collaborator interfaces for infrastructure abstraction
 *
 * The validation library never performs XML signature cryptography
 * itself. Callers inject an implementation:
 *   - XmlSecSignatureVerifier (libxml2 + xmlsec1) in production
 *   - recording doubles in tests
 */

#pragma once

#include <cstdint>
#include <vector>
#include <openssl/x509.h>
#include "types.h"

namespace saml::validation {

/**
 * @brief Enveloped XML signature verification interface
 *
 * Implementations must be safe to call concurrently and must not retain
 * the certificate or the document beyond the call.
 */
class ISignatureVerifier {
public:
    virtual ~ISignatureVerifier() = default;

    /**
     * @brief Verify the enveloped signature of a document
     *
     * @param trustedCert Certificate whose public key must have produced the
     *        signature (non-owning, never nullptr)
     * @param document Document bytes exactly as received
     * @return SignatureCheckResult with valid == true only if the signature
     *         covers the whole document and verifies with trustedCert
     */
    virtual SignatureCheckResult verifySignature(
        X509* trustedCert,
        const std::vector<uint8_t>& document) const = 0;
};

} // namespace saml::validation
