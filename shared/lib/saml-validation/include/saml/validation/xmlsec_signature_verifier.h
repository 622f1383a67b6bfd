/**
 * @file xmlsec_signature_verifier.h
 * @brief ISignatureVerifier backed by libxml2 + xmlsec1 (OpenSSL)
 *
 * Accepts a document only if:
 *   - exactly one ds:Signature is a direct child of the root element;
 *   - no two elements share an ID attribute value;
 *   - SignedInfo holds exactly one Reference, with URI "" or "#<root ID>";
 *   - the signature verifies with the public key of the supplied
 *     certificate (ds:KeyInfo in the document is ignored).
 * Only empty and same-document reference URIs are dereferenced.
 */

#pragma once

#include "providers.h"

namespace saml::validation {

/**
 * @brief Initialise libxml2 and xmlsec1 once per process
 *
 * Called by the XmlSecSignatureVerifier constructor; exposed for
 * programs that want to fail fast at startup.
 *
 * @throws std::runtime_error if xmlsec1 or its crypto backend cannot be initialised
 */
void initializeXmlSecurity();

class XmlSecSignatureVerifier : public ISignatureVerifier {
public:
    /**
     * @throws std::runtime_error if xmlsec1 cannot be initialised
     */
    XmlSecSignatureVerifier();

    SignatureCheckResult verifySignature(
        X509* trustedCert,
        const std::vector<uint8_t>& document) const override;
};

} // namespace saml::validation
