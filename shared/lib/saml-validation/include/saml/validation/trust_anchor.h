/**
 * @file trust_anchor.h
 * @brief Trust anchor: what a relying party keeps about one identity provider
 *
 * Produced once from IdP metadata, persisted by the caller, and supplied
 * to ResponseVerifier on every login.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "saml/x509/certificate_parser.h"
#include "saml/utils/url.h"
#include "types.h"

namespace saml::validation {

struct TrustAnchorResult;

/**
 * @brief Issuer identity, signing certificate and redirect endpoint of an IdP
 */
struct TrustAnchor {
    std::string issuer;                 ///< IdP entity ID
    x509::CertificatePtr certificate;   ///< Signing certificate (owned)
    std::string redirectUrl;            ///< HTTP-Redirect SSO location, verbatim
    utils::Url redirect;                ///< Parsed redirectUrl

    /// @brief DER encoding of the certificate (empty if none)
    std::vector<uint8_t> certificateDer() const;

    /// @brief Base64 DER of the certificate, suitable for persistence
    std::string certificateBase64() const;

    /// @brief SHA-256 fingerprint (lowercase hex) of the certificate
    std::string fingerprint() const;

    /**
     * @brief Rebuild an anchor from persisted values
     *
     * @param issuer IdP entity ID
     * @param certificateBase64 Base64 DER certificate as produced by certificateBase64()
     * @param redirectUrl Redirect endpoint URL
     * @return DECODE_ERROR, CERTIFICATE_PARSE_ERROR or PARSE_ERROR on bad input
     */
    static TrustAnchorResult restore(
        const std::string& issuer,
        const std::string& certificateBase64,
        const std::string& redirectUrl);
};

/// @brief Outcome of trust anchor extraction or restoration
struct TrustAnchorResult {
    SamlError error = SamlError::NONE;
    std::string message;
    std::optional<TrustAnchor> anchor;  ///< Set only when error == NONE

    bool ok() const { return error == SamlError::NONE; }
};

/**
 * @brief Decode a base64 DER certificate
 *
 * @param base64 Certificate text (whitespace tolerated)
 * @param error Set to DECODE_ERROR or CERTIFICATE_PARSE_ERROR on failure
 * @param message Set to a diagnostic on failure
 * @return Certificate, or empty pointer on failure
 */
x509::CertificatePtr decodeCertificate(
    const std::string& base64,
    SamlError& error,
    std::string& message);

/**
 * @brief Assemble an anchor from an already-parsed certificate
 *
 * @return PARSE_ERROR if redirectUrl is not a valid absolute URL
 */
TrustAnchorResult makeTrustAnchor(
    const std::string& issuer,
    x509::CertificatePtr certificate,
    const std::string& redirectUrl);

} // namespace saml::validation
