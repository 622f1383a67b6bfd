/**
 * @file exceptions.h
 * @brief Service Exception Hierarchy
 *
 * Exception types for service and infrastructure failures. The SAML
 * validation core never throws these; it reports failures through its
 * result types.
 *
 * @date 2026-10-19
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Base exception for all SAML service provider exceptions
 */
class SamlException : public std::runtime_error {
public:
    explicit SamlException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Request or document validation failed
 */
class ValidationException : public SamlException {
public:
    explicit ValidationException(const std::string& message)
        : SamlException("Validation error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public SamlException {
public:
    explicit ConfigException(const std::string& message)
        : SamlException("Configuration error: " + message) {}
};

/**
 * @brief XML security library could not be initialized
 */
class CryptoInitException : public SamlException {
public:
    explicit CryptoInitException(const std::string& message)
        : SamlException("Crypto initialization error: " + message) {}
};

} // namespace common
