/**
 * @file document_parser.cpp
 * @brief Schema tables for the SAML Response and metadata documents
 */

#include "saml/validation/document_parser.h"
#include "saml/validation/constants.h"
#include "saml/validation/xml_schema.h"
#include "saml/utils/string_utils.h"
#include "saml/utils/time_utils.h"

namespace saml::validation {

using xml::Occurs;
using xml::Schema;
using xml::SchemaViolation;

namespace {

TimePoint parseTime(const std::string& value, const char* attributeName) {
    auto tp = utils::parseIso8601(utils::trim(value));
    if (!tp) {
        throw SchemaViolation(std::string("invalid ") + attributeName + " timestamp: " + value);
    }
    return *tp;
}

// xs:base64Binary content may be wrapped and indented by the producer
std::string collapseBase64(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            out.push_back(c);
        }
    }
    return out;
}

// --- Response ---

const Schema<Signature>& signatureSchema() {
    static const Schema<Signature> schema = {
        xml::element<Signature>(kNsXmlDsig, "SignatureValue", Occurs::OPTIONAL,
            [](Signature& s, xmlNode* n) { s.signatureValue = utils::trim(xml::directText(n)); }),
    };
    return schema;
}

const Schema<NameId>& nameIdSchema() {
    static const Schema<NameId> schema = {
        xml::attribute<NameId>("Format", Occurs::OPTIONAL,
            [](NameId& id, const std::string& v) { id.format = v; }),
        xml::text<NameId>(
            [](NameId& id, const std::string& v) { id.value = v; }),
    };
    return schema;
}

const Schema<SubjectConfirmationData>& subjectConfirmationDataSchema() {
    static const Schema<SubjectConfirmationData> schema = {
        xml::attribute<SubjectConfirmationData>("Recipient", Occurs::REQUIRED,
            [](SubjectConfirmationData& d, const std::string& v) { d.recipient = v; }),
        xml::attribute<SubjectConfirmationData>("NotOnOrAfter", Occurs::REQUIRED,
            [](SubjectConfirmationData& d, const std::string& v) {
                d.notOnOrAfter = parseTime(v, "NotOnOrAfter");
            }),
    };
    return schema;
}

const Schema<SubjectConfirmation>& subjectConfirmationSchema() {
    static const Schema<SubjectConfirmation> schema = {
        xml::element<SubjectConfirmation>(kNsAssertion, "SubjectConfirmationData", Occurs::REQUIRED,
            [](SubjectConfirmation& sc, xmlNode* n) {
                xml::decode(n, subjectConfirmationDataSchema(), sc.subjectConfirmationData);
            }),
    };
    return schema;
}

const Schema<Subject>& subjectSchema() {
    static const Schema<Subject> schema = {
        xml::element<Subject>(kNsAssertion, "NameID", Occurs::OPTIONAL,
            [](Subject& s, xmlNode* n) { xml::decode(n, nameIdSchema(), s.nameId); }),
        xml::element<Subject>(kNsAssertion, "SubjectConfirmation", Occurs::REQUIRED,
            [](Subject& s, xmlNode* n) {
                xml::decode(n, subjectConfirmationSchema(), s.subjectConfirmation);
            }),
    };
    return schema;
}

const Schema<Conditions>& conditionsSchema() {
    static const Schema<Conditions> schema = {
        xml::attribute<Conditions>("NotBefore", Occurs::REQUIRED,
            [](Conditions& c, const std::string& v) { c.notBefore = parseTime(v, "NotBefore"); }),
        xml::attribute<Conditions>("NotOnOrAfter", Occurs::REQUIRED,
            [](Conditions& c, const std::string& v) { c.notOnOrAfter = parseTime(v, "NotOnOrAfter"); }),
    };
    return schema;
}

const Schema<Attribute>& attributeSchema() {
    static const Schema<Attribute> schema = {
        xml::attribute<Attribute>("Name", Occurs::REQUIRED,
            [](Attribute& a, const std::string& v) { a.name = v; }),
        xml::attribute<Attribute>("NameFormat", Occurs::OPTIONAL,
            [](Attribute& a, const std::string& v) { a.nameFormat = v; }),
        xml::element<Attribute>(kNsAssertion, "AttributeValue", Occurs::REPEATED,
            [](Attribute& a, xmlNode* n) {
                a.values.push_back(xml::directText(n));
                if (a.values.size() == 1) {
                    a.value = a.values.front();
                }
            }),
    };
    return schema;
}

const Schema<AttributeStatement>& attributeStatementSchema() {
    static const Schema<AttributeStatement> schema = {
        xml::element<AttributeStatement>(kNsAssertion, "Attribute", Occurs::REPEATED,
            [](AttributeStatement& st, xmlNode* n) {
                Attribute attr;
                xml::decode(n, attributeSchema(), attr);
                st.attributes.push_back(std::move(attr));
            }),
    };
    return schema;
}

const Schema<Assertion>& assertionSchema() {
    static const Schema<Assertion> schema = {
        xml::element<Assertion>(kNsAssertion, "Issuer", Occurs::REQUIRED,
            [](Assertion& a, xmlNode* n) { a.issuer = xml::directText(n); }),
        xml::element<Assertion>(kNsAssertion, "Subject", Occurs::REQUIRED,
            [](Assertion& a, xmlNode* n) { xml::decode(n, subjectSchema(), a.subject); }),
        xml::element<Assertion>(kNsAssertion, "Conditions", Occurs::REQUIRED,
            [](Assertion& a, xmlNode* n) { xml::decode(n, conditionsSchema(), a.conditions); }),
        xml::element<Assertion>(kNsAssertion, "AttributeStatement", Occurs::OPTIONAL,
            [](Assertion& a, xmlNode* n) {
                xml::decode(n, attributeStatementSchema(), a.attributeStatement);
            }),
    };
    return schema;
}

const Schema<Response>& responseSchema() {
    static const Schema<Response> schema = {
        xml::element<Response>(kNsXmlDsig, "Signature", Occurs::OPTIONAL,
            [](Response& r, xmlNode* n) { xml::decode(n, signatureSchema(), r.signature); }),
        xml::element<Response>(kNsAssertion, "Assertion", Occurs::REQUIRED,
            [](Response& r, xmlNode* n) { xml::decode(n, assertionSchema(), r.assertion); }),
    };
    return schema;
}

// --- Metadata ---

const Schema<KeyDescriptor>& x509DataSchema() {
    static const Schema<KeyDescriptor> schema = {
        xml::element<KeyDescriptor>(kNsXmlDsig, "X509Certificate", Occurs::REQUIRED,
            [](KeyDescriptor& kd, xmlNode* n) { kd.x509Certificate = collapseBase64(xml::directText(n)); }),
    };
    return schema;
}

const Schema<KeyDescriptor>& keyInfoSchema() {
    static const Schema<KeyDescriptor> schema = {
        xml::element<KeyDescriptor>(kNsXmlDsig, "X509Data", Occurs::REQUIRED,
            [](KeyDescriptor& kd, xmlNode* n) { xml::decode(n, x509DataSchema(), kd); }),
    };
    return schema;
}

const Schema<KeyDescriptor>& keyDescriptorSchema() {
    static const Schema<KeyDescriptor> schema = {
        xml::attribute<KeyDescriptor>("use", Occurs::OPTIONAL,
            [](KeyDescriptor& kd, const std::string& v) { kd.use = v; }),
        xml::element<KeyDescriptor>(kNsXmlDsig, "KeyInfo", Occurs::REQUIRED,
            [](KeyDescriptor& kd, xmlNode* n) { xml::decode(n, keyInfoSchema(), kd); }),
    };
    return schema;
}

const Schema<SingleSignOnService>& singleSignOnServiceSchema() {
    static const Schema<SingleSignOnService> schema = {
        xml::attribute<SingleSignOnService>("Binding", Occurs::REQUIRED,
            [](SingleSignOnService& s, const std::string& v) { s.binding = v; }),
        xml::attribute<SingleSignOnService>("Location", Occurs::REQUIRED,
            [](SingleSignOnService& s, const std::string& v) { s.location = v; }),
    };
    return schema;
}

const Schema<IdpSsoDescriptor>& idpSsoDescriptorSchema() {
    static const Schema<IdpSsoDescriptor> schema = {
        xml::element<IdpSsoDescriptor>(kNsMetadata, "KeyDescriptor", Occurs::ONE_OR_MORE,
            [](IdpSsoDescriptor& d, xmlNode* n) {
                KeyDescriptor kd;
                xml::decode(n, keyDescriptorSchema(), kd);
                d.keyDescriptors.push_back(std::move(kd));
            }),
        xml::element<IdpSsoDescriptor>(kNsMetadata, "SingleSignOnService", Occurs::REPEATED,
            [](IdpSsoDescriptor& d, xmlNode* n) {
                SingleSignOnService sso;
                xml::decode(n, singleSignOnServiceSchema(), sso);
                d.singleSignOnServices.push_back(std::move(sso));
            }),
    };
    return schema;
}

const Schema<EntityDescriptor>& entityDescriptorSchema() {
    static const Schema<EntityDescriptor> schema = {
        xml::attribute<EntityDescriptor>("entityID", Occurs::REQUIRED,
            [](EntityDescriptor& e, const std::string& v) { e.entityId = v; }),
        xml::element<EntityDescriptor>(kNsMetadata, "IDPSSODescriptor", Occurs::REQUIRED,
            [](EntityDescriptor& e, xmlNode* n) {
                xml::decode(n, idpSsoDescriptorSchema(), e.idpSsoDescriptor);
            }),
    };
    return schema;
}

} // anonymous namespace

ResponseParseResult parseResponse(const std::vector<uint8_t>& xml) {
    ResponseParseResult result;

    std::string error;
    xml::XmlDocPtr doc = xml::parseDocument(xml, error);
    if (!doc) {
        result.error = SamlError::PARSE_ERROR;
        result.message = error;
        return result;
    }

    try {
        Response response;
        xml::decodeRoot(doc.get(), kNsProtocol, "Response", responseSchema(), response);
        result.response = std::move(response);
    } catch (const SchemaViolation& e) {
        result.error = SamlError::PARSE_ERROR;
        result.message = e.what();
    }

    return result;
}

EntityDescriptorParseResult parseEntityDescriptor(const std::string& xml) {
    EntityDescriptorParseResult result;

    std::string error;
    xml::XmlDocPtr doc = xml::parseDocument(std::vector<uint8_t>(xml.begin(), xml.end()), error);
    if (!doc) {
        result.error = SamlError::PARSE_ERROR;
        result.message = error;
        return result;
    }

    try {
        EntityDescriptor descriptor;
        xml::decodeRoot(doc.get(), kNsMetadata, "EntityDescriptor",
                        entityDescriptorSchema(), descriptor);
        if (!descriptor.idpSsoDescriptor.signingKeyDescriptor()) {
            throw SchemaViolation("no KeyDescriptor usable for signing");
        }
        result.entityDescriptor = std::move(descriptor);
    } catch (const SchemaViolation& e) {
        result.error = SamlError::PARSE_ERROR;
        result.message = e.what();
    }

    return result;
}

} // namespace saml::validation
