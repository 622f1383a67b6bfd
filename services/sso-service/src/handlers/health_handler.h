#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>

namespace services {
    class SsoService;
}

namespace handlers {

/**
 * @brief Health check endpoint handler
 *
 * - GET /api/health - Service status and IdP connection state
 */
class HealthHandler {
public:
    /**
     * @brief Construct HealthHandler
     *
     * @param ssoService Login flow service (non-owning pointer)
     * @param getCurrentTimestamp Function that returns current timestamp string
     */
    HealthHandler(
        const services::SsoService* ssoService,
        std::function<std::string()> getCurrentTimestamp);

    /**
     * @brief Register health check routes
     *
     * @param app Drogon application instance
     */
    void registerRoutes(drogon::HttpAppFramework& app);

private:
    const services::SsoService* ssoService_;
    std::function<std::string()> getCurrentTimestamp_;

    /**
     * @brief GET /api/health
     *
     * Response:
     * {
     *   "service": "sso-service",
     *   "status": "UP",
     *   "version": "1.0.0",
     *   "idpConfigured": true,
     *   "issuer": "https://idp.example/metadata",
     *   "timestamp": "2026-10-19T10:00:00Z"
     * }
     */
    void handleHealth(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};

} // namespace handlers
