/**
 * @file test_helpers.h
 * @brief Shared test helpers for saml::validation unit tests
 *
 * Generates RSA keys and self-signed certificates with OpenSSL and builds
 * SAML Response / metadata fixtures, signing them with xmlsec1 so that
 * verification runs against real cryptography.
 */

#pragma once

#include <chrono>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/valid.h>
#include <xmlsec/xmlsec.h>
#include <xmlsec/xmldsig.h>
#include <xmlsec/templates.h>
#include <xmlsec/crypto.h>
#include <xmlsec/openssl/evp.h>

#include <saml/utils/string_utils.h>
#include <saml/utils/time_utils.h>
#include <saml/validation/constants.h>
#include <saml/validation/providers.h>
#include <saml/validation/xmlsec_signature_verifier.h>
#include <saml/x509/certificate_parser.h>

namespace test_helpers {

/// RAII wrapper for EVP_PKEY
struct PKeyDeleter { void operator()(EVP_PKEY* p) { EVP_PKEY_free(p); } };
using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

/// RAII wrapper for X509
struct X509Deleter { void operator()(X509* p) { X509_free(p); } };
using UniqueCert = std::unique_ptr<X509, X509Deleter>;

using TimePoint = std::chrono::system_clock::time_point;

/// 2026-10-19T12:00:00Z
inline TimePoint t0() {
    return saml::utils::fromUnixTimestamp(1792411200);
}

inline std::string iso(TimePoint tp) {
    return saml::utils::formatIso8601(tp);
}

// --- Key / Certificate Generation ---

inline UniqueKey generateRsaKey(int bits = 2048) {
    EVP_PKEY* pkey = EVP_PKEY_new();
    RSA* rsa = RSA_new();
    BIGNUM* e = BN_new();
    BN_set_word(e, RSA_F4);
    RSA_generate_key_ex(rsa, bits, e, nullptr);
    EVP_PKEY_assign_RSA(pkey, rsa);
    BN_free(e);
    return UniqueKey(pkey);
}

/**
 * @brief Create a self-signed IdP signing certificate
 */
inline UniqueCert createSigningCert(EVP_PKEY* key, const std::string& cn = "idp.example") {
    X509* cert = X509_new();
    X509_set_version(cert, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);

    X509_NAME* name = X509_NAME_new();
    X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>("Test IdP"), -1, -1, 0);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0);
    X509_set_subject_name(cert, name);
    X509_set_issuer_name(cert, name);
    X509_NAME_free(name);

    ASN1_TIME_set(X509_getm_notBefore(cert), time(nullptr) - 86400);
    ASN1_TIME_set(X509_getm_notAfter(cert), time(nullptr) + 3650 * 86400L);

    X509_set_pubkey(cert, key);
    X509_sign(cert, key, EVP_sha256());
    return UniqueCert(cert);
}

inline std::string certificateBase64(X509* cert) {
    return saml::utils::toBase64(saml::x509::certificateToDer(cert));
}

// --- Response Fixture ---

struct SamlAttribute {
    std::string name;
    std::vector<std::string> values;
};

/**
 * @brief Round-trip scenario defaults: idp-a, https://sp.example/acs, [T0, T0+5m]
 */
struct ResponseFixture {
    std::string responseId = "_resp-7f3a";
    std::string issuer = "idp-a";
    std::string nameId = "user-4711";
    std::string nameIdFormat = "urn:oasis:names:tc:SAML:2.0:nameid-format:persistent";
    std::string recipient = "https://sp.example/acs";
    std::string notBefore = iso(t0());
    std::string notOnOrAfter = iso(t0() + std::chrono::minutes(5));
    std::string confirmationNotOnOrAfter = iso(t0() + std::chrono::minutes(5));
    std::vector<SamlAttribute> attributes = {
        {"email", {"user@example.org"}},
        {"groups", {"staff", "admins"}},
    };
};

inline std::string buildAssertionXml(const ResponseFixture& f) {
    std::string xml;
    xml += "<saml:Assertion xmlns:saml=\"urn:oasis:names:tc:SAML:2.0:assertion\""
           " ID=\"_assert-" + f.responseId + "\" Version=\"2.0\" IssueInstant=\"" + f.notBefore + "\">\n";
    xml += "    <saml:Issuer>" + f.issuer + "</saml:Issuer>\n";
    xml += "    <saml:Subject>\n";
    xml += "      <saml:NameID Format=\"" + f.nameIdFormat + "\">" + f.nameId + "</saml:NameID>\n";
    xml += "      <saml:SubjectConfirmation Method=\"urn:oasis:names:tc:SAML:2.0:cm:bearer\">\n";
    xml += "        <saml:SubjectConfirmationData NotOnOrAfter=\"" + f.confirmationNotOnOrAfter +
           "\" Recipient=\"" + f.recipient + "\"/>\n";
    xml += "      </saml:SubjectConfirmation>\n";
    xml += "    </saml:Subject>\n";
    xml += "    <saml:Conditions NotBefore=\"" + f.notBefore + "\" NotOnOrAfter=\"" + f.notOnOrAfter + "\">\n";
    xml += "      <saml:AudienceRestriction><saml:Audience>https://sp.example</saml:Audience></saml:AudienceRestriction>\n";
    xml += "    </saml:Conditions>\n";
    xml += "    <saml:AttributeStatement>\n";
    for (const auto& attr : f.attributes) {
        xml += "      <saml:Attribute Name=\"" + attr.name +
               "\" NameFormat=\"urn:oasis:names:tc:SAML:2.0:attrname-format:basic\">\n";
        for (const auto& value : attr.values) {
            xml += "        <saml:AttributeValue>" + value + "</saml:AttributeValue>\n";
        }
        xml += "      </saml:Attribute>\n";
    }
    xml += "    </saml:AttributeStatement>\n";
    xml += "  </saml:Assertion>";
    return xml;
}

inline std::string buildResponseXml(const ResponseFixture& f) {
    return "<samlp:Response xmlns:samlp=\"urn:oasis:names:tc:SAML:2.0:protocol\""
           " ID=\"" + f.responseId + "\" Version=\"2.0\" IssueInstant=\"" + f.notBefore + "\""
           " Destination=\"" + f.recipient + "\">\n"
           "  " + buildAssertionXml(f) + "\n"
           "</samlp:Response>\n";
}

// --- xmlsec Signing ---

/// Register ID attributes so "#id" references resolve while signing
inline void registerIds(xmlDocPtr doc, xmlNodePtr node) {
    for (xmlNodePtr cur = node; cur; cur = cur->next) {
        if (cur->type != XML_ELEMENT_NODE) {
            continue;
        }
        xmlAttrPtr attr = xmlHasNsProp(cur, BAD_CAST "ID", nullptr);
        if (attr) {
            xmlChar* value = xmlNodeListGetString(doc, attr->children, 1);
            xmlAddID(nullptr, doc, value, attr);
            xmlFree(value);
        }
        registerIds(doc, cur->children);
    }
}

/**
 * @brief Sign the root element with an enveloped RSA-SHA256 / exc-c14n signature
 *
 * The ds:Signature is inserted as the first child of the root. No KeyInfo
 * is emitted.
 *
 * @param xml Document to sign
 * @param key RSA private key
 * @param referenceUri "#" for "#<root ID>", "" for the whole document,
 *        or any other same-document reference
 * @return Serialized signed document
 */
inline std::string signDocument(const std::string& xml, EVP_PKEY* key,
                                const std::string& referenceUri = "#") {
    saml::validation::initializeXmlSecurity();

    xmlDocPtr doc = xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr, 0);
    if (!doc) {
        throw std::runtime_error("signDocument: fixture is not well-formed");
    }
    xmlNodePtr root = xmlDocGetRootElement(doc);

    xmlChar* idValue = xmlGetNoNsProp(root, BAD_CAST "ID");
    std::string id = idValue ? reinterpret_cast<const char*>(idValue) : "";
    xmlFree(idValue);

    std::string uri = referenceUri == "#" ? "#" + id : referenceUri;

    xmlNodePtr signature = xmlSecTmplSignatureCreateNsPref(
        doc, xmlSecTransformExclC14NId, xmlSecTransformRsaSha256Id, nullptr, BAD_CAST "ds");
    if (root->children) {
        xmlAddPrevSibling(root->children, signature);
    } else {
        xmlAddChild(root, signature);
    }

    xmlNodePtr reference = xmlSecTmplSignatureAddReference(
        signature, xmlSecTransformSha256Id, nullptr, BAD_CAST uri.c_str(), nullptr);
    xmlSecTmplReferenceAddTransform(reference, xmlSecTransformEnvelopedId);
    xmlSecTmplReferenceAddTransform(reference, xmlSecTransformExclC14NId);

    registerIds(doc, root);

    xmlSecDSigCtxPtr ctx = xmlSecDSigCtxCreate(nullptr);
    EVP_PKEY_up_ref(key);
    xmlSecKeyDataPtr keyData = xmlSecOpenSSLEvpKeyAdopt(key);
    xmlSecKeyPtr signKey = xmlSecKeyCreate();
    xmlSecKeySetValue(signKey, keyData);
    ctx->signKey = signKey;

    int rc = xmlSecDSigCtxSign(ctx, signature);
    xmlSecDSigCtxDestroy(ctx);
    if (rc < 0) {
        xmlFreeDoc(doc);
        throw std::runtime_error("signDocument: xmlSecDSigCtxSign failed");
    }

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpMemory(doc, &buffer, &size);
    std::string signedXml(reinterpret_cast<const char*>(buffer), static_cast<size_t>(size));
    xmlFree(buffer);
    xmlFreeDoc(doc);
    return signedXml;
}

inline std::string toBase64(const std::string& text) {
    return saml::utils::toBase64(std::vector<uint8_t>(text.begin(), text.end()));
}

inline std::vector<uint8_t> toBytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

/**
 * @brief Cut the first ds:Signature element out of a serialized document
 * @return {document without signature, signature element text}
 */
inline std::pair<std::string, std::string> extractSignature(const std::string& signedXml) {
    size_t begin = signedXml.find("<ds:Signature");
    const std::string endTag = "</ds:Signature>";
    size_t end = signedXml.find(endTag, begin);
    if (begin == std::string::npos || end == std::string::npos) {
        throw std::runtime_error("extractSignature: no ds:Signature");
    }
    end += endTag.size();
    std::string signature = signedXml.substr(begin, end - begin);
    std::string rest = signedXml.substr(0, begin) + signedXml.substr(end);
    return {rest, signature};
}

inline std::string stripXmlDeclaration(const std::string& xml) {
    if (xml.compare(0, 5, "<?xml") == 0) {
        size_t end = xml.find("?>");
        size_t start = end + 2;
        while (start < xml.size() && (xml[start] == '\n' || xml[start] == '\r')) {
            ++start;
        }
        return xml.substr(start);
    }
    return xml;
}

/**
 * @brief Signature wrapping: forged root carrying the genuine signature
 *
 * The genuinely signed Response is moved (minus its signature) into
 * samlp:Extensions of a new root whose Assertion says what the attacker
 * wants. The copied signature still verifies over the moved original.
 */
inline std::string buildWrappedResponse(const std::string& signedXml, const ResponseFixture& forged) {
    auto parts = extractSignature(stripXmlDeclaration(signedXml));
    return "<samlp:Response xmlns:samlp=\"urn:oasis:names:tc:SAML:2.0:protocol\""
           " ID=\"_evil\" Version=\"2.0\" IssueInstant=\"" + forged.notBefore + "\">" +
           parts.second +
           buildAssertionXml(forged) +
           "<samlp:Extensions>" + parts.first + "</samlp:Extensions>"
           "</samlp:Response>";
}

// --- Metadata Fixture ---

inline std::string ssoServiceXml(const std::string& binding, const std::string& location) {
    return "    <md:SingleSignOnService Binding=\"" + binding + "\" Location=\"" + location + "\"/>\n";
}

inline std::string buildMetadataXml(const std::string& entityId,
                                    const std::string& certificateBase64,
                                    const std::string& ssoServices,
                                    const std::string& keyUse = "signing") {
    std::string useAttr = keyUse.empty() ? "" : " use=\"" + keyUse + "\"";
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<md:EntityDescriptor xmlns:md=\"urn:oasis:names:tc:SAML:2.0:metadata\""
           " xmlns:ds=\"http://www.w3.org/2000/09/xmldsig#\" entityID=\"" + entityId + "\">\n"
           "  <md:IDPSSODescriptor protocolSupportEnumeration=\"urn:oasis:names:tc:SAML:2.0:protocol\">\n"
           "    <md:KeyDescriptor" + useAttr + ">\n"
           "      <ds:KeyInfo><ds:X509Data><ds:X509Certificate>\n" + certificateBase64 +
           "\n      </ds:X509Certificate></ds:X509Data></ds:KeyInfo>\n"
           "    </md:KeyDescriptor>\n"
           "    <md:NameIDFormat>urn:oasis:names:tc:SAML:2.0:nameid-format:persistent</md:NameIDFormat>\n" +
           ssoServices +
           "  </md:IDPSSODescriptor>\n"
           "</md:EntityDescriptor>\n";
}

// --- Collaborator Doubles ---

/**
 * @brief ISignatureVerifier double recording every call
 */
class RecordingSignatureVerifier : public saml::validation::ISignatureVerifier {
public:
    explicit RecordingSignatureVerifier(bool verdict = true) : verdict_(verdict) {}

    saml::validation::SignatureCheckResult verifySignature(
        X509* trustedCert,
        const std::vector<uint8_t>& document) const override {
        ++calls;
        lastCert = trustedCert;
        lastDocument = document;
        saml::validation::SignatureCheckResult result;
        result.valid = verdict_;
        if (!verdict_) {
            result.message = "rejected by test double";
        }
        return result;
    }

    mutable int calls = 0;
    mutable X509* lastCert = nullptr;
    mutable std::vector<uint8_t> lastDocument;

private:
    bool verdict_;
};

} // namespace test_helpers
