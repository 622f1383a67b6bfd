/** @file health_handler.cpp
 *  @brief HealthHandler implementation
 */

#include "health_handler.h"
#include "../services/sso_service.h"
#include <spdlog/spdlog.h>

namespace handlers {

HealthHandler::HealthHandler(
    const services::SsoService* ssoService,
    std::function<std::string()> getCurrentTimestamp)
    : ssoService_(ssoService),
      getCurrentTimestamp_(std::move(getCurrentTimestamp)) {

    if (!ssoService_ || !getCurrentTimestamp_) {
        throw std::invalid_argument("HealthHandler: dependencies cannot be nullptr");
    }

    spdlog::info("[HealthHandler] Initialized");
}

void HealthHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /api/health
    app.registerHandler(
        "/api/health",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[HealthHandler] Routes registered");
}

void HealthHandler::handleHealth(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value result;
    result["service"] = "sso-service";
    result["status"] = "UP";
    result["version"] = "1.0.0";
    result["idpConfigured"] = ssoService_->isConfigured();
    result["issuer"] = ssoService_->currentIssuer();
    result["timestamp"] = getCurrentTimestamp_();

    auto resp = drogon::HttpResponse::newHttpJsonResponse(result);
    callback(resp);
}

} // namespace handlers
