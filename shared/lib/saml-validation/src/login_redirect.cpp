/**
 * @file login_redirect.cpp
 * @brief Login initiation URL implementation
 */

#include "saml/validation/login_redirect.h"
#include "saml/validation/constants.h"
#include "saml/utils/url.h"

namespace saml::validation {

std::optional<std::string> buildRedirectUrl(
    const std::string& redirectUrl,
    const std::string& relayState)
{
    auto url = utils::parseUrl(redirectUrl);
    if (!url) {
        return std::nullopt;
    }
    if (relayState.empty()) {
        return redirectUrl;
    }
    utils::setQueryParameter(*url, kParamRelayState, relayState);
    return url->toString();
}

std::string buildRedirectUrl(const TrustAnchor& anchor, const std::string& relayState) {
    if (relayState.empty()) {
        return anchor.redirectUrl;
    }
    utils::Url url = anchor.redirect;
    utils::setQueryParameter(url, kParamRelayState, relayState);
    return url.toString();
}

} // namespace saml::validation
