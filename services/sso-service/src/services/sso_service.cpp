/**
 * @file sso_service.cpp
 * @brief SsoService implementation
 */

#include "sso_service.h"
#include <mutex>
#include <spdlog/spdlog.h>
#include <saml/validation/login_redirect.h>
#include <saml/validation/metadata_extractor.h>

namespace services {

using saml::validation::TrustAnchor;
using saml::validation::samlErrorToString;

SsoService::SsoService(const saml::validation::ISignatureVerifier* signatureVerifier,
                       std::string acsUrl)
    : verifier_(signatureVerifier),
      acsUrl_(std::move(acsUrl))
{
    spdlog::debug("[SsoService] Initialized (acs={})", acsUrl_);
}

// --- Setup ---

Json::Value SsoService::setup(const std::string& metadataXml) {
    Json::Value response;

    auto result = saml::validation::extractTrustAnchorFromXml(metadataXml);
    if (!result.ok()) {
        spdlog::warn("[SsoService] Metadata rejected: {} ({})",
                     samlErrorToString(result.error), result.message);
        response["success"] = false;
        response["error"] = samlErrorToString(result.error);
        response["message"] = result.message;
        return response;
    }

    auto anchor = std::make_shared<const TrustAnchor>(std::move(*result.anchor));

    response["success"] = true;
    response["issuer"] = anchor->issuer;
    response["redirectUrl"] = anchor->redirectUrl;
    response["certificateFingerprint"] = anchor->fingerprint();

    spdlog::info("[SsoService] Connection configured: issuer={}, redirect={}, cert={}",
                 anchor->issuer, anchor->redirectUrl, anchor->fingerprint());

    {
        std::unique_lock<std::shared_mutex> lock(anchorMutex_);
        anchor_ = std::move(anchor);
    }
    return response;
}

// --- Login initiation ---

std::optional<std::string> SsoService::initiate(const std::string& relayState) const {
    auto anchor = currentAnchor();
    if (!anchor) {
        spdlog::warn("[SsoService] Login initiated before setup");
        return std::nullopt;
    }
    return saml::validation::buildRedirectUrl(*anchor, relayState);
}

// --- Assertion consumer ---

Json::Value SsoService::acs(const std::string& samlResponse,
                            const std::string& relayState,
                            std::chrono::system_clock::time_point now) const {
    Json::Value response;
    response["success"] = false;
    response["error"] = "login failed";

    auto anchor = currentAnchor();
    if (!anchor) {
        spdlog::warn("[SsoService] Login rejected: no connection configured");
        return response;
    }

    auto result = verifier_.verify(samlResponse, anchor->issuer,
                                   anchor->certificate.get(), acsUrl_, now);
    if (!result.ok()) {
        spdlog::warn("[SsoService] Login rejected: {} ({})",
                     samlErrorToString(result.error), result.message);
        return response;
    }

    const auto& assertion = result.response->assertion;

    Json::Value assertionJson;
    assertionJson["issuer"] = assertion.issuer;
    assertionJson["nameId"] = assertion.subject.nameId.value;
    assertionJson["nameIdFormat"] = assertion.subject.nameId.format;

    Json::Value attributes(Json::arrayValue);
    for (const auto& attr : assertion.attributeStatement.attributes) {
        Json::Value a;
        a["name"] = attr.name;
        Json::Value values(Json::arrayValue);
        for (const auto& v : attr.values) {
            values.append(v);
        }
        a["values"] = values;
        attributes.append(a);
    }
    assertionJson["attributes"] = attributes;

    spdlog::info("[SsoService] Login accepted: issuer={}, nameId={}",
                 assertion.issuer, assertion.subject.nameId.value);

    Json::Value ok;
    ok["success"] = true;
    ok["assertion"] = assertionJson;
    ok["relay_state"] = relayState;
    return ok;
}

bool SsoService::isConfigured() const {
    return currentAnchor() != nullptr;
}

std::string SsoService::currentIssuer() const {
    auto anchor = currentAnchor();
    return anchor ? anchor->issuer : "";
}

std::shared_ptr<const TrustAnchor> SsoService::currentAnchor() const {
    std::shared_lock<std::shared_mutex> lock(anchorMutex_);
    return anchor_;
}

} // namespace services
