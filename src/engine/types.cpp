/**
 * @file types.cpp
 * @brief JSON serialization of aggregated validation results
 */

#include "pdftrust/engine/types.h"

namespace pdftrust::engine {

using validation::toJsonArray;

Json::Value SignatureValidationSummary::toJson() const {
    Json::Value json;
    json["hasSignatures"] = hasSignatures;
    json["allSignaturesValid"] = allSignaturesValid;
    Json::Value list(Json::arrayValue);
    for (const auto& entry : signatures) {
        Json::Value item;
        item["fieldName"] = entry.fieldName;
        item["validationResult"] = entry.validationResult.toJson();
        item["extractedSignature"] = entry.extractedSignature.toJson();
        list.append(item);
    }
    json["signatures"] = list;
    json["errors"] = toJsonArray(errors);
    json["warnings"] = toJsonArray(warnings);
    return json;
}

Json::Value CertificateValidationSummary::toJson() const {
    Json::Value json;
    json["allCertificatesValid"] = allCertificatesValid;
    Json::Value list(Json::arrayValue);
    for (const auto& entry : certificates) {
        Json::Value item;
        item["certificate"] = validation::certificateToJson(entry.certificate);
        item["validationResult"] = entry.validationResult.toJson();
        list.append(item);
    }
    json["certificates"] = list;
    json["errors"] = toJsonArray(errors);
    json["warnings"] = toJsonArray(warnings);
    return json;
}

Json::Value TimestampValidationSummary::toJson() const {
    Json::Value json;
    json["hasTimestamps"] = hasTimestamps;
    json["allTimestampsValid"] = allTimestampsValid;
    Json::Value list(Json::arrayValue);
    for (const auto& entry : timestamps) {
        Json::Value item;
        item["signatureFieldName"] = entry.signatureFieldName;
        item["timestamp"] = entry.timestamp.toJson();
        item["validationResult"] = entry.validationResult.toJson();
        list.append(item);
    }
    json["timestamps"] = list;
    json["errors"] = toJsonArray(errors);
    json["warnings"] = toJsonArray(warnings);
    return json;
}

Json::Value PdfValidationResult::toJson() const {
    Json::Value json;
    json["isValid"] = isValid;
    json["errors"] = toJsonArray(errors);
    json["warnings"] = toJsonArray(warnings);
    json["pageCount"] = pageCount;
    json["hasFormFields"] = hasFormFields;
    json["hasSignatures"] = hasSignatures;
    json["isEncrypted"] = isEncrypted;
    json["version"] = version;
    json["fileSize"] = static_cast<Json::UInt64>(fileSize);
    json["structureValidation"] = structureValidation.toJson();
    json["signatureValidation"] = signatureValidation.toJson();
    json["certificateValidation"] = certificateValidation.toJson();
    json["timestampValidation"] = timestampValidation.toJson();
    json["processingTimeMs"] = static_cast<Json::Int64>(processingTimeMs);
    return json;
}

} // namespace pdftrust::engine
