/**
 * @file response_verifier.cpp
 * @brief Response verification implementation
 */

#include "saml/validation/response_verifier.h"
#include "saml/validation/document_parser.h"
#include "saml/utils/string_utils.h"
#include "saml/utils/time_utils.h"

#include <stdexcept>

namespace saml::validation {

namespace {

ResponseVerificationResult failure(SamlError error, const std::string& message) {
    ResponseVerificationResult result;
    result.error = error;
    result.message = message;
    return result;
}

} // anonymous namespace

ResponseVerifier::ResponseVerifier(const ISignatureVerifier* signatureVerifier)
    : signatureVerifier_(signatureVerifier)
{
    if (!signatureVerifier_) {
        throw std::invalid_argument("ResponseVerifier: signatureVerifier cannot be nullptr");
    }
}

ResponseVerificationResult ResponseVerifier::verify(
    const std::string& rawResponse,
    const std::string& expectedIssuer,
    X509* trustedCert,
    const std::string& expectedRecipient,
    std::chrono::system_clock::time_point now) const
{
    // Step 1: base64
    auto decoded = utils::fromBase64(rawResponse);
    if (!decoded) {
        return failure(SamlError::DECODE_ERROR, "SAMLResponse is not valid base64");
    }

    // Step 2: structure
    ResponseParseResult parsed = parseResponse(*decoded);
    if (!parsed.ok()) {
        return failure(SamlError::PARSE_ERROR, parsed.message);
    }
    Response& response = *parsed.response;

    // Step 3: only fully signed responses are supported
    if (response.signature.signatureValue.empty()) {
        return failure(SamlError::RESPONSE_NOT_SIGNED, "Response carries no signature value");
    }

    // Step 4: cryptographic check over the bytes as received
    if (!trustedCert) {
        return failure(SamlError::SIGNATURE_INVALID, "No trusted certificate supplied");
    }
    SignatureCheckResult signature = signatureVerifier_->verifySignature(trustedCert, *decoded);
    if (!signature.valid) {
        return failure(SamlError::SIGNATURE_INVALID,
                       signature.message.empty() ? "Signature verification failed"
                                                 : signature.message);
    }

    // Fields below are trusted from here on
    const Assertion& assertion = response.assertion;

    // Step 5: issuer
    if (assertion.issuer != expectedIssuer) {
        return failure(SamlError::INVALID_ISSUER,
                       "Issuer '" + assertion.issuer + "' does not match '" + expectedIssuer + "'");
    }

    // Step 6: recipient
    const auto& confirmation = assertion.subject.subjectConfirmation.subjectConfirmationData;
    if (confirmation.recipient != expectedRecipient) {
        return failure(SamlError::INVALID_RECIPIENT,
                       "Recipient '" + confirmation.recipient + "' does not match '" +
                       expectedRecipient + "'");
    }

    // Step 7: validity windows (NotOnOrAfter is exclusive)
    if (now < assertion.conditions.notBefore) {
        return failure(SamlError::ASSERTION_EXPIRED,
                       "Assertion not valid before " +
                       utils::formatIso8601(assertion.conditions.notBefore));
    }
    if (now >= assertion.conditions.notOnOrAfter) {
        return failure(SamlError::ASSERTION_EXPIRED,
                       "Assertion conditions expired at " +
                       utils::formatIso8601(assertion.conditions.notOnOrAfter));
    }
    if (now >= confirmation.notOnOrAfter) {
        return failure(SamlError::ASSERTION_EXPIRED,
                       "Subject confirmation expired at " +
                       utils::formatIso8601(confirmation.notOnOrAfter));
    }

    ResponseVerificationResult result;
    result.response = std::move(response);
    return result;
}

} // namespace saml::validation
