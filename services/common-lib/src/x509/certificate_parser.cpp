/**
 * @file certificate_parser.cpp
 * @brief X.509 certificate parsing and serialization implementation
 *
 * Uses OpenSSL d2i/i2d and PEM BIO routines.
 */

#include "saml/x509/certificate_parser.h"
#include "saml/utils/string_utils.h"
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/evp.h>
#include <openssl/err.h>

namespace saml {
namespace x509 {

X509* parseCertificateFromDer(const std::vector<uint8_t>& der) {
    if (der.empty()) {
        return nullptr;
    }

    // d2i_X509 expects pointer to pointer that it will advance
    const unsigned char* p = der.data();
    X509* cert = d2i_X509(nullptr, &p, static_cast<long>(der.size()));
    if (!cert) {
        ERR_clear_error();
        return nullptr;
    }

    // Reject trailing garbage after the certificate SEQUENCE
    if (p != der.data() + der.size()) {
        X509_free(cert);
        return nullptr;
    }

    return cert;
}

X509* parseCertificateFromPem(const std::string& pem) {
    if (pem.empty()) {
        return nullptr;
    }

    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return nullptr;
    }

    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    if (!cert) {
        ERR_clear_error();
    }

    BIO_free(bio);
    return cert;
}

std::vector<uint8_t> certificateToDer(X509* cert) {
    std::vector<uint8_t> der;

    if (!cert) {
        return der;
    }

    // Get required buffer size
    int der_len = i2d_X509(cert, nullptr);
    if (der_len <= 0) {
        return der;
    }

    der.resize(der_len);

    unsigned char* p = der.data();
    int encoded_len = i2d_X509(cert, &p);
    if (encoded_len <= 0) {
        der.clear();
        return der;
    }

    der.resize(encoded_len);
    return der;
}

std::optional<std::string> certificateToPem(X509* cert) {
    if (!cert) {
        return std::nullopt;
    }

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        return std::nullopt;
    }

    if (PEM_write_bio_X509(bio, cert) != 1) {
        BIO_free(bio);
        return std::nullopt;
    }

    char* pem_data = nullptr;
    long pem_len = BIO_get_mem_data(bio, &pem_data);
    if (pem_len <= 0 || !pem_data) {
        BIO_free(bio);
        return std::nullopt;
    }

    std::string pem_str(pem_data, pem_len);
    BIO_free(bio);

    return pem_str;
}

std::optional<std::string> computeFingerprint(X509* cert) {
    if (!cert) {
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (X509_digest(cert, EVP_sha256(), digest, &digest_len) != 1) {
        return std::nullopt;
    }

    return utils::bytesToHex(digest, digest_len);
}

std::string getSubjectDn(X509* cert) {
    if (!cert) return "";

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) return "";

    X509_NAME_print_ex(bio, X509_get_subject_name(cert), 0, XN_FLAG_RFC2253);

    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string result = (len > 0 && data) ? std::string(data, len) : "";
    BIO_free(bio);
    return result;
}

} // namespace x509
} // namespace saml
