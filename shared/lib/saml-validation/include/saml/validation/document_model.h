/**
 * @file document_model.h
 * @brief Typed model of the SAML Response and metadata EntityDescriptor
 *
 * Plain value types filled by document_parser. Only the elements and
 * attributes consumed by verification and trust-anchor extraction are
 * represented; everything else in the XML is ignored.
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace saml::validation {

using TimePoint = std::chrono::system_clock::time_point;

// --- Protocol response (urn:oasis:names:tc:SAML:2.0:protocol / assertion) ---

/// @brief saml:Attribute
struct Attribute {
    std::string name;
    std::string nameFormat;
    std::string value;                  ///< First AttributeValue (empty if none)
    std::vector<std::string> values;    ///< All AttributeValues in document order
};

/// @brief saml:NameID
struct NameId {
    std::string format;
    std::string value;
};

/// @brief saml:SubjectConfirmationData
struct SubjectConfirmationData {
    TimePoint notOnOrAfter;
    std::string recipient;
};

/// @brief saml:SubjectConfirmation
struct SubjectConfirmation {
    SubjectConfirmationData subjectConfirmationData;
};

/// @brief saml:Subject
struct Subject {
    NameId nameId;
    SubjectConfirmation subjectConfirmation;
};

/// @brief saml:Conditions (overall assertion validity window)
struct Conditions {
    TimePoint notBefore;
    TimePoint notOnOrAfter;
};

/// @brief saml:AttributeStatement
struct AttributeStatement {
    std::vector<Attribute> attributes;  ///< Document order, duplicates kept
};

/// @brief saml:Assertion
struct Assertion {
    std::string issuer;
    Subject subject;
    Conditions conditions;
    AttributeStatement attributeStatement;
};

/// @brief ds:Signature (only the value is modelled; verification is delegated)
struct Signature {
    std::string signatureValue;
};

/// @brief samlp:Response
struct Response {
    Signature signature;
    Assertion assertion;
};

// --- Metadata (urn:oasis:names:tc:SAML:2.0:metadata) ---

/// @brief md:SingleSignOnService
struct SingleSignOnService {
    std::string binding;
    std::string location;
};

/// @brief md:KeyDescriptor with its ds:X509Certificate text
struct KeyDescriptor {
    std::string use;                ///< "signing", "encryption" or empty
    std::string x509Certificate;    ///< Base64 DER with XML whitespace removed
};

/// @brief md:IDPSSODescriptor
struct IdpSsoDescriptor {
    std::vector<KeyDescriptor> keyDescriptors;
    std::vector<SingleSignOnService> singleSignOnServices;  ///< Document order

    /**
     * @brief First KeyDescriptor usable for signature verification
     *
     * A descriptor qualifies when its use is "signing" or unspecified.
     *
     * @return Pointer into keyDescriptors, or nullptr if none qualifies
     */
    const KeyDescriptor* signingKeyDescriptor() const {
        for (const auto& kd : keyDescriptors) {
            if (kd.use.empty() || kd.use == "signing") {
                return &kd;
            }
        }
        return nullptr;
    }
};

/// @brief md:EntityDescriptor
struct EntityDescriptor {
    std::string entityId;
    IdpSsoDescriptor idpSsoDescriptor;
};

} // namespace saml::validation
