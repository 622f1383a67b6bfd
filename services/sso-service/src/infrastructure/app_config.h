#pragma once

/**
 * @file app_config.h
 * @brief SSO Service application configuration
 *
 * Loaded from environment variables at startup through common::ConfigManager.
 */

#include <string>
#include <spdlog/spdlog.h>
#include <saml/utils/url.h>
#include "config_manager.h"
#include "exceptions.h"

struct AppConfig {
    int serverPort = 8080;
    int threadNum = 4;
    std::string acsUrl = "http://localhost:8080/acs";  // expected Recipient
    std::string logLevel = "info";
    std::string logFile;

    static AppConfig fromEnvironment() {
        auto& cfg = common::ConfigManager::getInstance();
        cfg.loadFromEnvironment();

        AppConfig config;
        config.serverPort = cfg.getInt(common::ConfigManager::SERVER_PORT, config.serverPort);
        config.threadNum = cfg.getInt(common::ConfigManager::THREAD_NUM, config.threadNum);
        config.acsUrl = cfg.getString(common::ConfigManager::SSO_ACS_URL, config.acsUrl);
        config.logLevel = cfg.getString(common::ConfigManager::LOG_LEVEL, config.logLevel);
        config.logFile = cfg.getString(common::ConfigManager::LOG_FILE, config.logFile);
        return config;
    }

    /**
     * @throws common::ConfigException on an unusable value
     */
    void validate() const {
        if (serverPort <= 0 || serverPort > 65535) {
            throw common::ConfigException("SERVER_PORT out of range: " + std::to_string(serverPort));
        }
        if (threadNum <= 0) {
            throw common::ConfigException("THREAD_NUM must be positive");
        }
        if (!saml::utils::parseUrl(acsUrl)) {
            throw common::ConfigException("SSO_ACS_URL is not an absolute URL: " + acsUrl);
        }
        spdlog::info("Configuration validated (port={}, threads={}, acs={})",
                     serverPort, threadNum, acsUrl);
    }
};
