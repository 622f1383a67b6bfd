/**
 * @file constants.h
 * @brief SAML 2.0 protocol constants
 */

#pragma once

namespace saml::validation {

/// @name HTTP parameter names
constexpr const char* kParamSamlResponse = "SAMLResponse";
constexpr const char* kParamRelayState = "RelayState";

/// @name Binding URIs
constexpr const char* kBindingHttpRedirect = "urn:oasis:names:tc:SAML:2.0:bindings:HTTP-Redirect";
constexpr const char* kBindingHttpPost = "urn:oasis:names:tc:SAML:2.0:bindings:HTTP-POST";

/// @name XML namespaces
constexpr const char* kNsProtocol = "urn:oasis:names:tc:SAML:2.0:protocol";
constexpr const char* kNsAssertion = "urn:oasis:names:tc:SAML:2.0:assertion";
constexpr const char* kNsMetadata = "urn:oasis:names:tc:SAML:2.0:metadata";
constexpr const char* kNsXmlDsig = "http://www.w3.org/2000/09/xmldsig#";

/// @name KeyDescriptor use values
constexpr const char* kKeyUseSigning = "signing";

} // namespace saml::validation
