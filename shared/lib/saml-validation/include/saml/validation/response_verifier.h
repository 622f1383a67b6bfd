/**
 * @file response_verifier.h
 * @brief SAML Response verification
 *
 * Turns the untrusted SAMLResponse form value into a trusted Response.
 * Check order:
 *   1. base64 decode                    -> DECODE_ERROR
 *   2. structural parse                 -> PARSE_ERROR
 *   3. signature value present          -> RESPONSE_NOT_SIGNED
 *   4. signature over the decoded bytes -> SIGNATURE_INVALID
 *   5. issuer                           -> INVALID_ISSUER
 *   6. recipient                        -> INVALID_RECIPIENT
 *   7. validity windows                 -> ASSERTION_EXPIRED
 *
 * No field value is compared before step 4 succeeds. Only a signature on
 * the whole Response is accepted; an assertion-only signature counts as
 * unsigned.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <openssl/x509.h>
#include "document_model.h"
#include "providers.h"
#include "types.h"

namespace saml::validation {

/// @brief Outcome of ResponseVerifier::verify
struct ResponseVerificationResult {
    SamlError error = SamlError::NONE;
    std::string message;                ///< Diagnostic for operator logs
    std::optional<Response> response;   ///< Set only when error == NONE

    bool ok() const { return error == SamlError::NONE; }
};

/**
 * @brief Verifies SAML Responses against a trust anchor
 *
 * Stateless apart from the injected collaborator; one instance may be
 * shared between threads.
 *
 * Usage:
 * @code
 *   XmlSecSignatureVerifier xmlsec;
 *   ResponseVerifier verifier(&xmlsec);
 *   auto result = verifier.verify(form["SAMLResponse"], anchor.issuer,
 *                                 anchor.certificate.get(), acsUrl, now);
 * @endcode
 */
class ResponseVerifier {
public:
    /**
     * @brief Constructor
     * @param signatureVerifier Signature collaborator (non-owning)
     * @throws std::invalid_argument if signatureVerifier is nullptr
     */
    explicit ResponseVerifier(const ISignatureVerifier* signatureVerifier);

    /**
     * @brief Verify a base64-encoded SAML Response
     *
     * @param rawResponse Base64 text of the SAMLResponse form field
     * @param expectedIssuer Trusted IdP entity ID (exact match)
     * @param trustedCert IdP signing certificate (non-owning); nullptr
     *        rejects the response as SIGNATURE_INVALID
     * @param expectedRecipient This service's assertion consumer URL (exact match)
     * @param now Current time supplied by the caller
     * @return Result carrying the trusted Response or the failure kind
     */
    ResponseVerificationResult verify(
        const std::string& rawResponse,
        const std::string& expectedIssuer,
        X509* trustedCert,
        const std::string& expectedRecipient,
        std::chrono::system_clock::time_point now) const;

private:
    const ISignatureVerifier* signatureVerifier_;
};

} // namespace saml::validation
