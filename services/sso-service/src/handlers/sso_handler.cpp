/** @file sso_handler.cpp
 *  @brief SsoHandler implementation
 */

#include "sso_handler.h"
#include "../services/sso_service.h"
#include "exceptions.h"
#include <saml/validation/constants.h>
#include <spdlog/spdlog.h>
#include <chrono>

namespace handlers {

namespace {

void sendJson(std::function<void(const drogon::HttpResponsePtr&)>& callback,
              const Json::Value& body, drogon::HttpStatusCode status) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(status);
    callback(resp);
}

Json::Value errorBody(const std::string& error, const std::string& message) {
    Json::Value body;
    body["success"] = false;
    body["error"] = error;
    body["message"] = message;
    return body;
}

} // anonymous namespace

SsoHandler::SsoHandler(services::SsoService* ssoService)
    : ssoService_(ssoService) {
    if (!ssoService_) {
        throw std::invalid_argument("SsoHandler: ssoService cannot be nullptr");
    }
    spdlog::info("[SsoHandler] Initialized");
}

void SsoHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // POST /setup
    app.registerHandler(
        "/setup",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleSetup(req, std::move(callback));
        },
        {drogon::Post}
    );

    // GET /initiate
    app.registerHandler(
        "/initiate",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleInitiate(req, std::move(callback));
        },
        {drogon::Get}
    );

    // POST /acs
    app.registerHandler(
        "/acs",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleAcs(req, std::move(callback));
        },
        {drogon::Post}
    );

    spdlog::info("[SsoHandler] Routes registered");
}

void SsoHandler::handleSetup(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    spdlog::info("POST /setup");
    try {
        std::string body(req->getBody());
        if (body.empty()) {
            throw common::ValidationException("metadata body is empty");
        }

        Json::Value result = ssoService_->setup(body);
        sendJson(callback, result,
                 result["success"].asBool() ? drogon::k200OK : drogon::k400BadRequest);

    } catch (const common::ValidationException& e) {
        sendJson(callback, errorBody("PARSE_ERROR", e.what()), drogon::k400BadRequest);
    } catch (const std::exception& e) {
        spdlog::error("POST /setup error: {}", e.what());
        sendJson(callback, errorBody("INTERNAL_ERROR", "Internal server error"),
                 drogon::k500InternalServerError);
    }
}

void SsoHandler::handleInitiate(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    auto url = ssoService_->initiate(req->getParameter("relay_state"));
    if (!url) {
        sendJson(callback, errorBody("NOT_CONFIGURED", "No identity provider configured"),
                 drogon::k409Conflict);
        return;
    }

    spdlog::debug("GET /initiate -> {}", *url);
    callback(drogon::HttpResponse::newRedirectionResponse(*url, drogon::k302Found));
}

void SsoHandler::handleAcs(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    spdlog::info("POST /acs");
    try {
        std::string samlResponse = req->getParameter(saml::validation::kParamSamlResponse);
        std::string relayState = req->getParameter(saml::validation::kParamRelayState);

        Json::Value result = ssoService_->acs(samlResponse, relayState,
                                              std::chrono::system_clock::now());
        if (!result["success"].asBool()) {
            sendJson(callback, result, drogon::k400BadRequest);
            return;
        }

        result.removeMember("success");
        sendJson(callback, result, drogon::k200OK);

    } catch (const std::exception& e) {
        spdlog::error("POST /acs error: {}", e.what());
        sendJson(callback, errorBody("INTERNAL_ERROR", "Internal server error"),
                 drogon::k500InternalServerError);
    }
}

} // namespace handlers
