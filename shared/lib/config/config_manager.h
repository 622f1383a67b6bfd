/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 *
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * A value that is not an integer is logged and the default returned.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value (true/false, 1/0, yes/no, on/off)
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value (overrides the environment)
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Load the predefined keys from the environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys

    static constexpr const char* SERVER_PORT = "SERVER_PORT";
    static constexpr const char* THREAD_NUM = "THREAD_NUM";
    static constexpr const char* SSO_ACS_URL = "SSO_ACS_URL";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace common
