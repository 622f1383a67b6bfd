/**
 * @file trust_anchor.cpp
 * @brief Trust anchor serialisation and restoration
 */

#include "saml/validation/trust_anchor.h"
#include "saml/utils/string_utils.h"

namespace saml::validation {

std::vector<uint8_t> TrustAnchor::certificateDer() const {
    return x509::certificateToDer(certificate.get());
}

std::string TrustAnchor::certificateBase64() const {
    return utils::toBase64(certificateDer());
}

std::string TrustAnchor::fingerprint() const {
    return x509::computeFingerprint(certificate.get()).value_or("");
}

TrustAnchorResult TrustAnchor::restore(
    const std::string& issuer,
    const std::string& certificateBase64,
    const std::string& redirectUrl)
{
    TrustAnchorResult result;
    x509::CertificatePtr cert = decodeCertificate(certificateBase64, result.error, result.message);
    if (!cert) {
        return result;
    }
    return makeTrustAnchor(issuer, std::move(cert), redirectUrl);
}

x509::CertificatePtr decodeCertificate(
    const std::string& base64,
    SamlError& error,
    std::string& message)
{
    auto der = utils::fromBase64(base64);
    if (!der) {
        error = SamlError::DECODE_ERROR;
        message = "Certificate is not valid base64";
        return x509::CertificatePtr();
    }

    x509::CertificatePtr cert(x509::parseCertificateFromDer(*der));
    if (!cert) {
        error = SamlError::CERTIFICATE_PARSE_ERROR;
        message = "Certificate bytes are not a DER X.509 certificate";
    }
    return cert;
}

TrustAnchorResult makeTrustAnchor(
    const std::string& issuer,
    x509::CertificatePtr certificate,
    const std::string& redirectUrl)
{
    TrustAnchorResult result;

    auto url = utils::parseUrl(redirectUrl);
    if (!url) {
        result.error = SamlError::PARSE_ERROR;
        result.message = "Invalid redirect URL: " + redirectUrl;
        return result;
    }

    TrustAnchor anchor;
    anchor.issuer = issuer;
    anchor.certificate = std::move(certificate);
    anchor.redirectUrl = redirectUrl;
    anchor.redirect = std::move(*url);
    result.anchor = std::move(anchor);
    return result;
}

} // namespace saml::validation
