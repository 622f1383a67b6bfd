/**
 * @file metadata_extractor.cpp
 * @brief Trust anchor extraction implementation
 */

#include "saml/validation/metadata_extractor.h"
#include "saml/validation/constants.h"
#include "saml/validation/document_parser.h"

namespace saml::validation {

TrustAnchorResult extractTrustAnchor(const EntityDescriptor& metadata) {
    TrustAnchorResult result;

    const IdpSsoDescriptor& idp = metadata.idpSsoDescriptor;
    const KeyDescriptor* keyDescriptor = idp.signingKeyDescriptor();
    if (!keyDescriptor) {
        result.error = SamlError::PARSE_ERROR;
        result.message = "No KeyDescriptor usable for signing";
        return result;
    }

    // Steps 1-2: certificate
    x509::CertificatePtr cert = decodeCertificate(
        keyDescriptor->x509Certificate, result.error, result.message);
    if (!cert) {
        return result;
    }

    // Step 3: binding selection
    for (const auto& sso : idp.singleSignOnServices) {
        if (sso.binding == kBindingHttpRedirect) {
            // Step 4: location
            return makeTrustAnchor(metadata.entityId, std::move(cert), sso.location);
        }
    }

    result.error = SamlError::NO_REDIRECT_BINDING;
    result.message = "No SingleSignOnService with binding " + std::string(kBindingHttpRedirect);
    return result;
}

TrustAnchorResult extractTrustAnchorFromXml(const std::string& xml) {
    EntityDescriptorParseResult parsed = parseEntityDescriptor(xml);
    if (!parsed.ok()) {
        TrustAnchorResult result;
        result.error = SamlError::PARSE_ERROR;
        result.message = parsed.message;
        return result;
    }
    return extractTrustAnchor(*parsed.entityDescriptor);
}

} // namespace saml::validation
