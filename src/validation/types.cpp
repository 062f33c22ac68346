/**
 * @file types.cpp
 * @brief JSON serialization of certificate validation results
 */

#include "pdftrust/validation/types.h"
#include "pdftrust/util/time_utils.h"

namespace pdftrust::validation {

std::string ChainFailure::describe() const {
    return "Certificate '" + certificateSubject + "' failed " + chainRuleToString(rule) + ": " + detail;
}

Json::Value certificateToJson(const X509Certificate& cert) {
    Json::Value json;
    json["subject"] = cert.subject;
    json["issuer"] = cert.issuer;
    json["commonName"] = cert.commonName;
    json["serialNumber"] = cert.serialNumber;
    json["notBefore"] = util::formatIso8601(cert.notBefore);
    json["notAfter"] = util::formatIso8601(cert.notAfter);
    json["fingerprint"] = cert.fingerprint;
    json["signatureAlgorithm"] = cert.signatureAlgorithm;
    return json;
}

Json::Value CertificateValidationResult::toJson() const {
    Json::Value json;

    json["isValid"] = isValid;
    json["chainValid"] = chainValid;
    json["notExpired"] = notExpired;
    json["notRevoked"] = notRevoked;
    json["trustedRoot"] = trustedRoot;
    json["revocationChecked"] = revocationChecked;

    json["subject"] = subject;
    json["commonName"] = commonName;
    json["fingerprint"] = fingerprint;
    json["chainPath"] = chainPath;
    json["depth"] = depth;

    Json::Value chainJson(Json::arrayValue);
    for (const auto& cert : chain) {
        chainJson.append(certificateToJson(cert));
    }
    json["chain"] = chainJson;

    Json::Value failuresJson(Json::arrayValue);
    for (const auto& f : failures) {
        Json::Value fj;
        fj["certificate"] = f.certificateSubject;
        fj["fingerprint"] = f.fingerprint;
        fj["rule"] = chainRuleToString(f.rule);
        fj["detail"] = f.detail;
        failuresJson.append(fj);
    }
    json["failures"] = failuresJson;

    json["errors"] = toJsonArray(errors);
    json["warnings"] = toJsonArray(warnings);
    return json;
}

Json::Value CertificateInfo::toJson() const {
    Json::Value json;
    json["subject"] = subject;
    json["issuer"] = issuer;
    json["commonName"] = commonName;
    json["organization"] = organization;
    json["country"] = country;
    json["serialNumber"] = serialNumber;
    json["notBefore"] = notBefore;
    json["notAfter"] = notAfter;
    json["fingerprint"] = fingerprint;
    json["signatureAlgorithm"] = signatureAlgorithm;
    json["publicKeyAlgorithm"] = publicKeyAlgorithm;
    json["publicKeyBits"] = publicKeyBits;
    json["keyUsage"] = toJsonArray(keyUsage);
    json["extendedKeyUsage"] = toJsonArray(extendedKeyUsage);
    json["isCa"] = isCa;
    json["isSelfSigned"] = isSelfSigned;
    json["isExpired"] = isExpired;
    json["isNotYetValid"] = isNotYetValid;
    return json;
}

} // namespace pdftrust::validation
