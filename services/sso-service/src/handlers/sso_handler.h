#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>

namespace services {
    class SsoService;
}

namespace handlers {

/**
 * @brief SAML login endpoints handler
 *
 * Provides the relying-party endpoints:
 * - POST /setup - Configure the IdP connection from metadata XML
 * - GET /initiate - Redirect the browser to the IdP
 * - POST /acs - Assertion consumer service
 *
 * Request handling is delegated to services::SsoService.
 */
class SsoHandler {
public:
    /**
     * @brief Construct SsoHandler
     *
     * @param ssoService Login flow service (non-owning pointer)
     * @throws std::invalid_argument if ssoService is nullptr
     */
    explicit SsoHandler(services::SsoService* ssoService);

    /**
     * @brief Register SSO routes
     *
     * @param app Drogon application instance
     */
    void registerRoutes(drogon::HttpAppFramework& app);

private:
    services::SsoService* ssoService_;

    /**
     * @brief POST /setup
     *
     * Request body: IdP metadata (md:EntityDescriptor XML)
     *
     * Response: 200 with issuer, redirectUrl and certificateFingerprint;
     * 400 with the failure kind.
     */
    void handleSetup(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief GET /initiate?relay_state=...
     *
     * 302 to the IdP; 409 if no connection is configured.
     */
    void handleInitiate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief POST /acs
     *
     * Form fields: SAMLResponse, RelayState
     *
     * Response: 200 with the assertion and relay_state;
     * 400 {"success": false, "error": "login failed"}.
     */
    void handleAcs(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};

} // namespace handlers
