/**
 * @file types.h
 * @brief Common types for the SAML validation library
 *
 * Closed error taxonomy and result structs shared by the response
 * verifier, the metadata extractor and the signature collaborator.
 */

#pragma once

#include <string>

namespace saml::validation {

/// @brief Failure kinds reported by verification and extraction
enum class SamlError {
    NONE,                     ///< Success
    DECODE_ERROR,             ///< Base64 payload malformed
    PARSE_ERROR,              ///< XML malformed, required element missing, or URL malformed
    RESPONSE_NOT_SIGNED,      ///< Signature value empty or absent
    SIGNATURE_INVALID,        ///< Cryptographic verification failed
    INVALID_ISSUER,           ///< Assertion issuer differs from the expected issuer
    INVALID_RECIPIENT,        ///< SubjectConfirmationData recipient differs from the expected recipient
    ASSERTION_EXPIRED,        ///< A validity window check failed
    CERTIFICATE_PARSE_ERROR,  ///< Embedded certificate bytes are not an X.509 certificate
    NO_REDIRECT_BINDING       ///< Metadata has no HTTP-Redirect SingleSignOnService
};

/// @brief Outcome of one cryptographic signature check
struct SignatureCheckResult {
    bool valid = false;
    std::string message;    ///< Failure detail for operator logs
};

/// @brief Convert SamlError to a stable log name
inline std::string samlErrorToString(SamlError e) {
    switch (e) {
        case SamlError::NONE:                    return "NONE";
        case SamlError::DECODE_ERROR:            return "DECODE_ERROR";
        case SamlError::PARSE_ERROR:             return "PARSE_ERROR";
        case SamlError::RESPONSE_NOT_SIGNED:     return "RESPONSE_NOT_SIGNED";
        case SamlError::SIGNATURE_INVALID:       return "SIGNATURE_INVALID";
        case SamlError::INVALID_ISSUER:          return "INVALID_ISSUER";
        case SamlError::INVALID_RECIPIENT:       return "INVALID_RECIPIENT";
        case SamlError::ASSERTION_EXPIRED:       return "ASSERTION_EXPIRED";
        case SamlError::CERTIFICATE_PARSE_ERROR: return "CERTIFICATE_PARSE_ERROR";
        case SamlError::NO_REDIRECT_BINDING:     return "NO_REDIRECT_BINDING";
    }
    return "UNKNOWN";
}

} // namespace saml::validation
