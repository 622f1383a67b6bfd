/**
 * @file url.h
 * @brief Absolute URL parsing and query manipulation
 *
 * Component split follows the regular expression of RFC 3986 Appendix B.
 * Only absolute URLs (with a scheme) are accepted since every URL handled
 * here is an endpoint the browser is sent to.
 *
 * @version 1.0.0
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <optional>

namespace saml {
namespace utils {

/**
 * @brief Parsed URL components
 *
 * Components are kept in their original (still percent-encoded) form so
 * that toString() reproduces the input exactly.
 */
struct Url {
    std::string scheme;
    std::string userinfo;
    std::string host;
    std::string port;       ///< Digits only, empty when absent
    std::string path;
    std::string query;      ///< Without the leading '?'
    std::string fragment;   ///< Without the leading '#'

    bool hasAuthority = false;
    bool hasUserinfo = false;
    bool hasQuery = false;
    bool hasFragment = false;

    /**
     * @brief Reassemble the URL from its components
     */
    std::string toString() const;
};

/**
 * @brief Parse an absolute URL
 *
 * Rejected: empty input, missing scheme, invalid scheme characters,
 * ASCII control characters or spaces, malformed percent escapes,
 * non-numeric or out-of-range port.
 *
 * @param text URL text
 * @return Parsed URL, or std::nullopt if malformed
 */
std::optional<Url> parseUrl(const std::string& text);

/**
 * @brief Set a query parameter, replacing any existing occurrences
 *
 * Other parameters keep their position and encoding; the new parameter
 * is appended with its value percent-encoded.
 *
 * @param url URL to modify
 * @param name Parameter name (unreserved characters expected)
 * @param value Raw parameter value
 */
void setQueryParameter(Url& url, const std::string& name, const std::string& value);

} // namespace utils
} // namespace saml
