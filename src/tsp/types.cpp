/**
 * @file types.cpp
 * @brief JSON serialization of timestamp values
 */

#include "pdftrust/tsp/types.h"
#include "pdftrust/validation/types.h"
#include "pdftrust/util/encoding_util.h"
#include "pdftrust/util/time_utils.h"

namespace pdftrust::tsp {

namespace {

Json::Value accuracyToJson(const Accuracy& a) {
    Json::Value json;
    json["seconds"] = a.seconds;
    json["millis"] = a.millis;
    json["micros"] = a.micros;
    return json;
}

} // namespace

std::string TsaStatus::describe() const {
    std::string text = pkiStatusToString(status);
    if (!failInfo.empty()) {
        text += " (";
        for (size_t i = 0; i < failInfo.size(); i++) {
            if (i > 0) text += ", ";
            text += pkiFailureInfoToString(failInfo[i]);
        }
        text += ")";
    }
    for (const auto& s : statusStrings) {
        text += ": " + s;
    }
    return text;
}

Json::Value Timestamp::toJson() const {
    Json::Value json;
    json["genTime"] = util::formatIso8601(genTime, true);
    json["tsaUrl"] = tsaUrl;
    json["serialNumber"] = serialNumber;
    json["policy"] = policy;
    json["hashAlgorithm"] = messageImprint.hashAlgorithm;
    json["hashedMessage"] = util::toHex(messageImprint.hashedMessage);
    if (accuracy) json["accuracy"] = accuracyToJson(*accuracy);
    if (certificate) json["certificate"] = validation::certificateToJson(*certificate);
    json["token"] = util::base64Encode(raw);
    return json;
}

Json::Value TimestampVerificationResult::toJson() const {
    Json::Value json;
    json["isValid"] = isValid;
    json["imprintMatches"] = imprintMatches;
    json["signatureVerified"] = signatureVerified;
    json["errors"] = validation::toJsonArray(errors);
    json["warnings"] = validation::toJsonArray(warnings);
    if (genTime) json["genTime"] = util::formatIso8601(*genTime, true);
    if (accuracy) json["accuracy"] = accuracyToJson(*accuracy);
    json["policy"] = policy;
    json["serialNumber"] = serialNumber;
    json["hashAlgorithm"] = hashAlgorithm;
    if (!tsaUrl.empty()) json["tsaUrl"] = tsaUrl;
    if (tsaCertificate) json["tsaCertificate"] = validation::certificateToJson(*tsaCertificate);
    return json;
}

Json::Value TimestampAuditEntry::toJson() const {
    Json::Value json;
    json["id"] = id;
    json["operation"] = timestampOperationToString(operation);
    json["tsaUrl"] = tsaUrl;
    json["result"] = result;
    json["success"] = success;
    if (!error.empty()) json["error"] = error;
    json["durationMs"] = static_cast<Json::Int64>(durationMs);
    json["createdAt"] = util::formatIso8601(createdAt, true);
    return json;
}

} // namespace pdftrust::tsp
