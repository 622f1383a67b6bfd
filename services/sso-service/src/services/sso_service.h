/**
 * @file sso_service.h
 * @brief Relying-party login flow over a single IdP connection
 *
 * Holds the trust anchor of one identity provider in memory and runs the
 * three steps of an SP-side login: setup from metadata, login initiation
 * and the assertion consumer. Free of HTTP types so it can be exercised
 * without a server.
 *
 * @date 2026-10-19
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <json/json.h>
#include <saml/validation/providers.h>
#include <saml/validation/response_verifier.h>
#include <saml/validation/trust_anchor.h>

namespace services {

/**
 * @brief SAML service provider login orchestration
 *
 * The anchor may be replaced at runtime by setup(); concurrent acs() calls
 * keep using the anchor they started with.
 */
class SsoService {
public:
    /**
     * @brief Constructor
     * @param signatureVerifier Signature collaborator (non-owning pointer)
     * @param acsUrl Expected Recipient of every assertion
     * @throws std::invalid_argument if signatureVerifier is nullptr
     */
    SsoService(const saml::validation::ISignatureVerifier* signatureVerifier,
               std::string acsUrl);

    /**
     * @brief Configure the IdP connection from metadata XML
     *
     * Response (success):
     * {
     *   "success": true,
     *   "issuer": "https://idp.example/metadata",
     *   "redirectUrl": "https://idp.example/sso",
     *   "certificateFingerprint": "3f1c..."
     * }
     * On failure "success" is false and "error" holds the failure kind name.
     * The previous connection, if any, is kept.
     */
    Json::Value setup(const std::string& metadataXml);

    /**
     * @brief URL to send the browser to for login
     * @return std::nullopt if no connection is configured
     */
    std::optional<std::string> initiate(const std::string& relayState) const;

    /**
     * @brief Assertion consumer
     *
     * Response (success):
     * {
     *   "success": true,
     *   "assertion": {"issuer", "nameId", "nameIdFormat", "attributes": [{"name", "values"}]},
     *   "relay_state": "..."
     * }
     * Any failure yields {"success": false, "error": "login failed"}; the
     * precise failure kind is logged only.
     */
    Json::Value acs(const std::string& samlResponse,
                    const std::string& relayState,
                    std::chrono::system_clock::time_point now) const;

    /// @brief Whether setup() has succeeded at least once
    bool isConfigured() const;

    /// @brief Issuer of the current connection (empty if none)
    std::string currentIssuer() const;

private:
    std::shared_ptr<const saml::validation::TrustAnchor> currentAnchor() const;

    saml::validation::ResponseVerifier verifier_;
    std::string acsUrl_;

    mutable std::shared_mutex anchorMutex_;
    std::shared_ptr<const saml::validation::TrustAnchor> anchor_;
};

} // namespace services
