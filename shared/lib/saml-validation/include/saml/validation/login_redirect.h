/**
 * @file login_redirect.h
 * @brief Login initiation URL for the HTTP-Redirect binding
 */

#pragma once

#include <optional>
#include <string>
#include "trust_anchor.h"

namespace saml::validation {

/**
 * @brief Add RelayState to an IdP redirect URL
 *
 * The relay state is opaque: it is percent-encoded and placed in the
 * RelayState query parameter, replacing any existing one. Other query
 * parameters are preserved. An empty relay state returns the URL unchanged.
 *
 * @param redirectUrl IdP HTTP-Redirect location
 * @param relayState Opaque value to round-trip through the IdP
 * @return URL to send the browser to, or std::nullopt if redirectUrl is invalid
 */
std::optional<std::string> buildRedirectUrl(
    const std::string& redirectUrl,
    const std::string& relayState);

/**
 * @brief Same as above using the anchor's already-parsed redirect URL
 */
std::string buildRedirectUrl(const TrustAnchor& anchor, const std::string& relayState);

} // namespace saml::validation
