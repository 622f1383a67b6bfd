/**
 * @file test_certificate_parser.cpp
 * @brief Unit tests for certificate parser
 */

#include <gtest/gtest.h>
#include <saml/x509/certificate_parser.h>
#include <openssl/x509.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/bn.h>
#include <ctime>

using namespace saml::x509;

class CertificateParserTest : public ::testing::Test {
protected:
    EVP_PKEY* key_ = nullptr;
    X509* cert_ = nullptr;

    void SetUp() override {
        key_ = EVP_PKEY_new();
        RSA* rsa = RSA_new();
        BIGNUM* e = BN_new();
        BN_set_word(e, RSA_F4);
        RSA_generate_key_ex(rsa, 2048, e, nullptr);
        EVP_PKEY_assign_RSA(key_, rsa);
        BN_free(e);

        cert_ = X509_new();
        X509_set_version(cert_, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert_), 7);
        X509_NAME* name = X509_NAME_new();
        X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>("Example IdP"), -1, -1, 0);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>("idp.example"), -1, -1, 0);
        X509_set_subject_name(cert_, name);
        X509_set_issuer_name(cert_, name);
        X509_NAME_free(name);
        ASN1_TIME_set(X509_getm_notBefore(cert_), time(nullptr) - 86400);
        ASN1_TIME_set(X509_getm_notAfter(cert_), time(nullptr) + 365 * 86400L);
        X509_set_pubkey(cert_, key_);
        X509_sign(cert_, key_, EVP_sha256());
    }

    void TearDown() override {
        X509_free(cert_);
        EVP_PKEY_free(key_);
    }
};

// ============================================================================
// DER
// ============================================================================

TEST_F(CertificateParserTest, ParseCertificateFromDer_Valid) {
    auto der = certificateToDer(cert_);
    ASSERT_FALSE(der.empty());

    CertificatePtr parsed(parseCertificateFromDer(der));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(X509_cmp(parsed.get(), cert_), 0);
}

TEST_F(CertificateParserTest, ParseCertificateFromDer_Empty) {
    EXPECT_EQ(parseCertificateFromDer({}), nullptr);
}

TEST_F(CertificateParserTest, ParseCertificateFromDer_Garbage) {
    std::vector<uint8_t> garbage = {0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_EQ(parseCertificateFromDer(garbage), nullptr);
}

TEST_F(CertificateParserTest, ParseCertificateFromDer_TrailingBytesRejected) {
    auto der = certificateToDer(cert_);
    der.push_back(0x00);
    EXPECT_EQ(parseCertificateFromDer(der), nullptr);
}

TEST_F(CertificateParserTest, ParseCertificateFromDer_Truncated) {
    auto der = certificateToDer(cert_);
    der.resize(der.size() / 2);
    EXPECT_EQ(parseCertificateFromDer(der), nullptr);
}

TEST_F(CertificateParserTest, CertificateToDer_Null) {
    EXPECT_TRUE(certificateToDer(nullptr).empty());
}

// ============================================================================
// PEM
// ============================================================================

TEST_F(CertificateParserTest, CertificateToPem_RoundTrip) {
    auto pem = certificateToPem(cert_);
    ASSERT_TRUE(pem.has_value());
    EXPECT_NE(pem->find("-----BEGIN CERTIFICATE-----"), std::string::npos);

    CertificatePtr parsed(parseCertificateFromPem(*pem));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(X509_cmp(parsed.get(), cert_), 0);
}

TEST_F(CertificateParserTest, ParseCertificateFromPem_Invalid) {
    EXPECT_EQ(parseCertificateFromPem(""), nullptr);
    EXPECT_EQ(parseCertificateFromPem("not a certificate"), nullptr);
}

TEST_F(CertificateParserTest, CertificateToPem_Null) {
    EXPECT_FALSE(certificateToPem(nullptr).has_value());
}

// ============================================================================
// Fingerprint / subject
// ============================================================================

TEST_F(CertificateParserTest, ComputeFingerprint_Valid) {
    auto fp = computeFingerprint(cert_);
    ASSERT_TRUE(fp.has_value());
    EXPECT_EQ(fp->size(), 64u);
    for (char c : *fp) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }

    // Deterministic
    EXPECT_EQ(*fp, *computeFingerprint(cert_));
}

TEST_F(CertificateParserTest, ComputeFingerprint_Null) {
    EXPECT_FALSE(computeFingerprint(nullptr).has_value());
}

TEST_F(CertificateParserTest, GetSubjectDn_Rfc2253) {
    EXPECT_EQ(getSubjectDn(cert_), "CN=idp.example,O=Example IdP");
    EXPECT_EQ(getSubjectDn(nullptr), "");
}

// ============================================================================
// CertificatePtr
// ============================================================================

TEST_F(CertificateParserTest, CertificatePtr_Move) {
    CertificatePtr a = CertificatePtr::share(cert_);
    ASSERT_TRUE(a);

    CertificatePtr b(std::move(a));
    EXPECT_FALSE(a);
    EXPECT_EQ(b.get(), cert_);
}

TEST_F(CertificateParserTest, CertificatePtr_ShareKeepsOriginalAlive) {
    {
        CertificatePtr shared = CertificatePtr::share(cert_);
        EXPECT_EQ(shared.get(), cert_);
    }
    // Original reference still valid after the shared wrapper is gone
    EXPECT_TRUE(computeFingerprint(cert_).has_value());
}

TEST_F(CertificateParserTest, CertificatePtr_Release) {
    CertificatePtr ptr = CertificatePtr::share(cert_);
    X509* raw = ptr.release();
    EXPECT_FALSE(ptr);
    EXPECT_EQ(raw, cert_);
    X509_free(raw);
}
