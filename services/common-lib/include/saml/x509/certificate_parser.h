/**
 * @file certificate_parser.h
 * @brief X.509 certificate parsing and serialization
 *
 * Structural parsing only: no expiry, chain or revocation checks.
 * Identity provider signing certificates arrive as base64 DER inside
 * metadata (ds:X509Certificate) or as PEM from operator configuration.
 *
 * @version 1.0.0
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <openssl/x509.h>

namespace saml {
namespace x509 {

/**
 * @brief Parse certificate from DER data
 *
 * Trailing bytes after the certificate structure are rejected.
 *
 * @param der DER-encoded certificate
 * @return X509 certificate (caller must free with X509_free), or nullptr on error
 */
X509* parseCertificateFromDer(const std::vector<uint8_t>& der);

/**
 * @brief Parse certificate from PEM string
 *
 * @param pem PEM-encoded certificate
 * @return X509 certificate, or nullptr on error
 */
X509* parseCertificateFromPem(const std::string& pem);

/**
 * @brief Serialize certificate to DER format
 *
 * @param cert X509 certificate
 * @return DER bytes, or empty vector on error
 */
std::vector<uint8_t> certificateToDer(X509* cert);

/**
 * @brief Serialize certificate to PEM format
 *
 * @param cert X509 certificate
 * @return PEM string, or std::nullopt on error
 */
std::optional<std::string> certificateToPem(X509* cert);

/**
 * @brief Compute SHA-256 fingerprint of certificate
 *
 * @param cert X509 certificate
 * @return Hex-encoded SHA-256 fingerprint (64 chars lowercase),
 *         or std::nullopt on error
 */
std::optional<std::string> computeFingerprint(X509* cert);

/**
 * @brief Subject DN in RFC 2253 form (e.g. "CN=idp.example,O=Example")
 */
std::string getSubjectDn(X509* cert);

/**
 * @brief RAII wrapper for X509 certificate
 *
 * Automatically frees X509 structure when going out of scope.
 */
class CertificatePtr {
public:
    explicit CertificatePtr(X509* cert = nullptr) : cert_(cert) {}

    ~CertificatePtr() {
        if (cert_) {
            X509_free(cert_);
        }
    }

    // Move semantics
    CertificatePtr(CertificatePtr&& other) noexcept : cert_(other.cert_) {
        other.cert_ = nullptr;
    }

    CertificatePtr& operator=(CertificatePtr&& other) noexcept {
        if (this != &other) {
            if (cert_) {
                X509_free(cert_);
            }
            cert_ = other.cert_;
            other.cert_ = nullptr;
        }
        return *this;
    }

    // Delete copy semantics
    CertificatePtr(const CertificatePtr&) = delete;
    CertificatePtr& operator=(const CertificatePtr&) = delete;

    /**
     * @brief Take an additional reference on an X509 owned elsewhere
     */
    static CertificatePtr share(X509* cert) {
        if (cert) {
            X509_up_ref(cert);
        }
        return CertificatePtr(cert);
    }

    // Access
    X509* get() const { return cert_; }
    X509* release() {
        X509* tmp = cert_;
        cert_ = nullptr;
        return tmp;
    }

    explicit operator bool() const { return cert_ != nullptr; }
    X509* operator->() const { return cert_; }

private:
    X509* cert_;
};

} // namespace x509
} // namespace saml
