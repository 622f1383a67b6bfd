/**
 * @file main.cpp
 * @brief SSO Service - SAML 2.0 service provider demonstration
 *
 * Drogon REST service wiring the SAML validation library: IdP metadata
 * setup, login initiation over the HTTP-Redirect binding and the
 * assertion consumer service.
 *
 * @date 2026-10-19
 * @version 1.0.0
 */

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <memory>

#include "infrastructure/app_config.h"
#include "services/sso_service.h"
#include "handlers/sso_handler.h"
#include "handlers/health_handler.h"
#include "logger.h"
#include "exceptions.h"

#include <saml/utils/time_utils.h>
#include <saml/validation/xmlsec_signature_verifier.h>

namespace {

/**
 * @brief Print application banner
 */
void printBanner() {
    std::cout << R"(
  ____ ____   ___    ____                  _
 / ___/ ___| / _ \  / ___|  ___ _ ____   _(_) ___ ___
 \___ \___ \| | | | \___ \ / _ \ '__\ \ / / |/ __/ _ \
  ___) |__) | |_| |  ___) |  __/ |   \ V /| | (_|  __/
 |____/____/ \___/  |____/ \___|_|    \_/ |_|\___\___|

)" << std::endl;
    std::cout << "  SSO Service - SAML 2.0 Service Provider" << std::endl;
    std::cout << "  Version: 1.0.0" << std::endl;
    std::cout << std::endl;
}

std::string getCurrentTimestamp() {
    return saml::utils::formatIso8601(std::chrono::system_clock::now());
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main(int /* argc */, char* /* argv */[]) {
    printBanner();

    AppConfig appConfig;
    try {
        appConfig = AppConfig::fromEnvironment();
        common::LogSettings logSettings;
        logSettings.level = appConfig.logLevel;
        logSettings.file = appConfig.logFile;
        common::Logger::initialize(logSettings);
        appConfig.validate();
    } catch (const common::ConfigException& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    spdlog::info("Starting SSO Service...");
    spdlog::info("Assertion consumer URL: {}", appConfig.acsUrl);

    try {
        try {
            saml::validation::initializeXmlSecurity();
        } catch (const std::runtime_error& e) {
            throw common::CryptoInitException(e.what());
        }

        saml::validation::XmlSecSignatureVerifier signatureVerifier;
        services::SsoService ssoService(&signatureVerifier, appConfig.acsUrl);

        handlers::SsoHandler ssoHandler(&ssoService);
        handlers::HealthHandler healthHandler(&ssoService, getCurrentTimestamp);

        auto& app = drogon::app();

        // Server settings
        app.setLogLevel(trantor::Logger::kWarn)
           .addListener("0.0.0.0", static_cast<uint16_t>(appConfig.serverPort))
           .setThreadNum(static_cast<size_t>(appConfig.threadNum))
           .setClientMaxBodySize(1024 * 1024);  // metadata and SAMLResponse are small

        ssoHandler.registerRoutes(app);
        healthHandler.registerRoutes(app);

        spdlog::info("Server starting on http://0.0.0.0:{}", appConfig.serverPort);
        spdlog::info("Press Ctrl+C to stop the server");

        app.run();

    } catch (const common::SamlException& e) {
        spdlog::critical("{}", e.what());
        common::Logger::flush();
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        common::Logger::flush();
        return 1;
    }

    spdlog::info("Server stopped");
    common::Logger::flush();
    return 0;
}
