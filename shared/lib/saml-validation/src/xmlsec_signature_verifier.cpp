/**
 * @file xmlsec_signature_verifier.cpp
 * @brief Enveloped signature verification with xmlsec1
 */

#include "saml/validation/xmlsec_signature_verifier.h"
#include "saml/validation/constants.h"
#include "saml/validation/xml_schema.h"
#include "saml/x509/certificate_parser.h"

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <libxml/tree.h>
#include <libxml/valid.h>
#include <openssl/bio.h>
#include <xmlsec/xmlsec.h>
#include <xmlsec/errors.h>
#include <xmlsec/keys.h>
#include <xmlsec/transforms.h>
#include <xmlsec/xmldsig.h>
#include <xmlsec/crypto.h>
#include <xmlsec/openssl/app.h>
#include <spdlog/spdlog.h>

namespace saml::validation {

namespace {

struct KeyDeleter {
    void operator()(xmlSecKey* key) const { xmlSecKeyDestroy(key); }
};
using XmlSecKeyPtr = std::unique_ptr<xmlSecKey, KeyDeleter>;

struct DSigCtxDeleter {
    void operator()(xmlSecDSigCtx* ctx) const { xmlSecDSigCtxDestroy(ctx); }
};
using XmlSecDSigCtxPtr = std::unique_ptr<xmlSecDSigCtx, DSigCtxDeleter>;

const char* orEmpty(const char* s) {
    return s ? s : "";
}

void logXmlSecError(const char* file, int line, const char* func,
                    const char* errorObject, const char* errorSubject,
                    int reason, const char* msg) {
    spdlog::debug("xmlsec: {}:{} {} obj={} subj={} reason={} {}",
                  orEmpty(file), line, orEmpty(func), orEmpty(errorObject),
                  orEmpty(errorSubject), reason, orEmpty(msg));
}

// Algorithms accepted anywhere in SignedInfo. Everything else, notably
// XPath and XSLT transforms, is refused before xmlsec runs.
const char* const kCanonicalizationAlgorithms[] = {
    "http://www.w3.org/2001/10/xml-exc-c14n#",
    "http://www.w3.org/2001/10/xml-exc-c14n#WithComments",
    "http://www.w3.org/TR/2001/REC-xml-c14n-20010315",
    "http://www.w3.org/TR/2001/REC-xml-c14n-20010315#WithComments",
};

const char* const kSignatureAlgorithms[] = {
    "http://www.w3.org/2000/09/xmldsig#rsa-sha1",
    "http://www.w3.org/2001/04/xmldsig-more#rsa-sha256",
    "http://www.w3.org/2001/04/xmldsig-more#rsa-sha384",
    "http://www.w3.org/2001/04/xmldsig-more#rsa-sha512",
    "http://www.w3.org/2001/04/xmldsig-more#ecdsa-sha256",
    "http://www.w3.org/2001/04/xmldsig-more#ecdsa-sha384",
    "http://www.w3.org/2001/04/xmldsig-more#ecdsa-sha512",
};

const char* const kDigestAlgorithms[] = {
    "http://www.w3.org/2000/09/xmldsig#sha1",
    "http://www.w3.org/2001/04/xmlenc#sha256",
    "http://www.w3.org/2001/04/xmldsig-more#sha384",
    "http://www.w3.org/2001/04/xmlenc#sha512",
};

const char* const kEnvelopedSignatureAlgorithm = "http://www.w3.org/2000/09/xmldsig#enveloped-signature";

template <size_t N>
bool isOneOf(const std::optional<std::string>& value, const char* const (&allowed)[N]) {
    if (!value) {
        return false;
    }
    for (const char* candidate : allowed) {
        if (*value == candidate) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Check every Algorithm attribute under SignedInfo against the allow-lists
 * @return Empty string when acceptable, otherwise the rejection reason
 */
std::string checkAlgorithms(xmlNode* signedInfo, xmlNode* reference) {
    for (xmlNode* child = signedInfo->children; child; child = child->next) {
        if (xml::matches(child, kNsXmlDsig, "CanonicalizationMethod")) {
            auto algorithm = xml::attributeValue(child, "Algorithm");
            if (!isOneOf(algorithm, kCanonicalizationAlgorithms)) {
                return "Unsupported CanonicalizationMethod: " + algorithm.value_or("");
            }
        } else if (xml::matches(child, kNsXmlDsig, "SignatureMethod")) {
            auto algorithm = xml::attributeValue(child, "Algorithm");
            if (!isOneOf(algorithm, kSignatureAlgorithms)) {
                return "Unsupported SignatureMethod: " + algorithm.value_or("");
            }
        }
    }

    for (xmlNode* child = reference->children; child; child = child->next) {
        if (xml::matches(child, kNsXmlDsig, "DigestMethod")) {
            auto algorithm = xml::attributeValue(child, "Algorithm");
            if (!isOneOf(algorithm, kDigestAlgorithms)) {
                return "Unsupported DigestMethod: " + algorithm.value_or("");
            }
        } else if (xml::matches(child, kNsXmlDsig, "Transforms")) {
            for (xmlNode* t = child->children; t; t = t->next) {
                if (t->type != XML_ELEMENT_NODE) {
                    continue;
                }
                auto algorithm = xml::attributeValue(t, "Algorithm");
                bool allowed = xml::matches(t, kNsXmlDsig, "Transform") &&
                    (isOneOf(algorithm, kCanonicalizationAlgorithms) ||
                     (algorithm && *algorithm == kEnvelopedSignatureAlgorithm));
                if (!allowed) {
                    return "Unsupported Transform: " + algorithm.value_or("");
                }
            }
        }
    }
    return std::string();
}

/**
 * @brief Restrict xmlsec to the same transforms checkAlgorithms() accepts
 */
bool enableAllowedTransforms(xmlSecDSigCtx* ctx) {
    const xmlSecTransformId referenceTransforms[] = {
        xmlSecTransformEnvelopedId,
        xmlSecTransformExclC14NId,
        xmlSecTransformExclC14NWithCommentsId,
        xmlSecTransformInclC14NId,
        xmlSecTransformInclC14NWithCommentsId,
#ifndef XMLSEC_NO_SHA1
        xmlSecTransformSha1Id,
#endif
        xmlSecTransformSha256Id,
        xmlSecTransformSha384Id,
        xmlSecTransformSha512Id,
    };
    const xmlSecTransformId signatureTransforms[] = {
        xmlSecTransformExclC14NId,
        xmlSecTransformExclC14NWithCommentsId,
        xmlSecTransformInclC14NId,
        xmlSecTransformInclC14NWithCommentsId,
#ifndef XMLSEC_NO_SHA1
        xmlSecTransformRsaSha1Id,
#endif
        xmlSecTransformRsaSha256Id,
        xmlSecTransformRsaSha384Id,
        xmlSecTransformRsaSha512Id,
#ifndef XMLSEC_NO_ECDSA
        xmlSecTransformEcdsaSha256Id,
        xmlSecTransformEcdsaSha384Id,
        xmlSecTransformEcdsaSha512Id,
#endif
    };

    for (xmlSecTransformId id : referenceTransforms) {
        if (xmlSecDSigCtxEnableReferenceTransform(ctx, id) < 0) {
            return false;
        }
    }
    for (xmlSecTransformId id : signatureTransforms) {
        if (xmlSecDSigCtxEnableSignatureTransform(ctx, id) < 0) {
            return false;
        }
    }
    return true;
}

SignatureCheckResult reject(const std::string& message) {
    SignatureCheckResult result;
    result.valid = false;
    result.message = message;
    return result;
}

/**
 * @brief Register every un-namespaced ID attribute; false on a duplicate value
 */
bool registerIds(xmlDoc* doc, xmlNode* node, std::string& duplicate) {
    for (xmlNode* cur = node; cur; cur = cur->next) {
        if (cur->type != XML_ELEMENT_NODE) {
            continue;
        }
        xmlAttr* attr = xmlHasNsProp(cur, reinterpret_cast<const xmlChar*>("ID"), nullptr);
        if (attr) {
            xmlChar* value = xmlNodeListGetString(doc, attr->children, 1);
            if (value) {
                bool added = xmlAddID(nullptr, doc, value, attr) != nullptr;
                if (!added) {
                    duplicate = reinterpret_cast<const char*>(value);
                }
                xmlFree(value);
                if (!added) {
                    return false;
                }
            }
        }
        if (!registerIds(doc, cur->children, duplicate)) {
            return false;
        }
    }
    return true;
}

XmlSecKeyPtr loadVerificationKey(X509* cert) {
    std::vector<uint8_t> der = x509::certificateToDer(cert);
    if (der.empty()) {
        return nullptr;
    }

    BIO* bio = BIO_new_mem_buf(der.data(), static_cast<int>(der.size()));
    if (!bio) {
        return nullptr;
    }
    XmlSecKeyPtr key(xmlSecOpenSSLAppKeyFromCertLoadBIO(bio, xmlSecKeyDataFormatCertDer));
    BIO_free(bio);
    return key;
}

} // anonymous namespace

void initializeXmlSecurity() {
    static std::once_flag flag;
    static std::string initError;

    std::call_once(flag, []() {
        xml::initializeParser();

        if (xmlSecInit() < 0) {
            initError = "xmlsec initialization failed";
            return;
        }
        if (xmlSecCheckVersion() != 1) {
            initError = "loaded xmlsec library version is not compatible";
            return;
        }
        if (xmlSecCryptoAppInit(nullptr) < 0) {
            initError = "xmlsec crypto app initialization failed";
            return;
        }
        if (xmlSecCryptoInit() < 0) {
            initError = "xmlsec crypto initialization failed";
            return;
        }
        xmlSecErrorsSetCallback(logXmlSecError);
        spdlog::debug("xmlsec initialized ({})", XMLSEC_VERSION);
    });

    if (!initError.empty()) {
        throw std::runtime_error(initError);
    }
}

XmlSecSignatureVerifier::XmlSecSignatureVerifier() {
    initializeXmlSecurity();
}

SignatureCheckResult XmlSecSignatureVerifier::verifySignature(
    X509* trustedCert,
    const std::vector<uint8_t>& document) const
{
    if (!trustedCert) {
        return reject("No trusted certificate");
    }

    std::string error;
    xml::XmlDocPtr doc = xml::parseDocument(document, error);
    if (!doc) {
        return reject(error);
    }
    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        return reject("Document has no root element");
    }

    // --- Signature placement ---
    xmlNode* signatureNode = nullptr;
    for (xmlNode* child = root->children; child; child = child->next) {
        if (xml::matches(child, kNsXmlDsig, "Signature")) {
            if (signatureNode) {
                return reject("More than one Signature under the root element");
            }
            signatureNode = child;
        }
    }
    if (!signatureNode) {
        return reject("No Signature under the root element");
    }

    // --- ID registration ---
    std::string duplicate;
    if (!registerIds(doc.get(), root, duplicate)) {
        return reject("Duplicate ID attribute value: " + duplicate);
    }

    // --- Reference must cover the root ---
    xmlNode* signedInfo = nullptr;
    for (xmlNode* child = signatureNode->children; child; child = child->next) {
        if (xml::matches(child, kNsXmlDsig, "SignedInfo")) {
            signedInfo = child;
            break;
        }
    }
    if (!signedInfo) {
        return reject("Signature has no SignedInfo");
    }

    xmlNode* reference = nullptr;
    std::optional<std::string> referenceUri;
    size_t referenceCount = 0;
    for (xmlNode* child = signedInfo->children; child; child = child->next) {
        if (xml::matches(child, kNsXmlDsig, "Reference")) {
            ++referenceCount;
            reference = child;
            referenceUri = xml::attributeValue(child, "URI");
        }
    }
    if (referenceCount != 1) {
        return reject("Expected exactly one Reference, found " + std::to_string(referenceCount));
    }

    auto rootId = xml::attributeValue(root, "ID");
    bool coversRoot = referenceUri &&
        (referenceUri->empty() || (rootId && !rootId->empty() && *referenceUri == "#" + *rootId));
    if (!coversRoot) {
        return reject("Reference does not cover the root element");
    }

    // --- Algorithm allow-list ---
    std::string unsupported = checkAlgorithms(signedInfo, reference);
    if (!unsupported.empty()) {
        spdlog::warn("xmlsec: {}", unsupported);
        return reject(unsupported);
    }

    // --- Cryptographic verification ---
    XmlSecKeyPtr key = loadVerificationKey(trustedCert);
    if (!key) {
        spdlog::warn("xmlsec: failed to load key from trusted certificate {}",
                     x509::getSubjectDn(trustedCert));
        return reject("Cannot load public key from trusted certificate");
    }

    XmlSecDSigCtxPtr ctx(xmlSecDSigCtxCreate(nullptr));
    if (!ctx) {
        spdlog::error("xmlsec: failed to create signature context");
        return reject("Cannot create signature context");
    }
    ctx->signKey = key.release();
    ctx->enabledReferenceUris = xmlSecTransformUriTypeEmpty | xmlSecTransformUriTypeSameDocument;
    if (!enableAllowedTransforms(ctx.get())) {
        spdlog::error("xmlsec: failed to configure transform allow-list");
        return reject("Cannot create signature context");
    }

    if (xmlSecDSigCtxVerify(ctx.get(), signatureNode) < 0) {
        spdlog::warn("xmlsec: signature processing failed");
        return reject("Signature processing failed");
    }

    if (ctx->status != xmlSecDSigStatusSucceeded) {
        spdlog::debug("xmlsec: signature does not verify");
        return reject("Signature does not verify with the trusted certificate");
    }

    spdlog::debug("xmlsec: signature verified");
    SignatureCheckResult result;
    result.valid = true;
    return result;
}

} // namespace saml::validation
