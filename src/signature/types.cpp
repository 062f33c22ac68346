/**
 * @file types.cpp
 * @brief JSON serialization of signature results
 */

#include "pdftrust/signature/types.h"
#include "pdftrust/validation/types.h"
#include "pdftrust/util/time_utils.h"

namespace pdftrust::signature {

Json::Value ExtractedSignature::toJson() const {
    Json::Value json;
    json["fieldName"] = fieldName;
    json["subFilter"] = subFilter;
    Json::Value ranges(Json::arrayValue);
    for (const auto& seg : byteRange) {
        ranges.append(static_cast<Json::UInt64>(seg.offset));
        ranges.append(static_cast<Json::UInt64>(seg.length));
    }
    json["byteRange"] = ranges;
    json["coversWholeDocument"] = coversWholeDocument;
    if (!signerName.empty()) json["name"] = signerName;
    if (!reason.empty()) json["reason"] = reason;
    if (!location.empty()) json["location"] = location;
    if (!contactInfo.empty()) json["contactInfo"] = contactInfo;
    if (signingTimeM) json["signingTime"] = util::formatIso8601(*signingTimeM);
    if (signature) {
        Json::Value certs(Json::arrayValue);
        for (const auto& cert : signature->certificates) {
            certs.append(validation::certificateToJson(cert));
        }
        json["certificates"] = certs;
        json["hasTimestamp"] = signature->timestamp.has_value();
    }
    if (!extractionError.empty()) json["extractionError"] = extractionError;
    if (!byteRangeError.empty()) json["byteRangeError"] = byteRangeError;
    json["warnings"] = validation::toJsonArray(warnings);
    return json;
}

Json::Value SignatureValidationResult::toJson() const {
    Json::Value json;
    json["isValid"] = isValid;
    json["documentIntegrityValid"] = documentIntegrityValid;
    json["signatureValid"] = signatureValid;
    json["certificateChainValid"] = certificateChainValid;
    json["timestampValid"] = timestampValid;
    json["hasTimestamp"] = hasTimestamp;
    json["coversWholeDocument"] = coversWholeDocument;
    if (signerCertificate) json["signerCertificate"] = validation::certificateToJson(*signerCertificate);
    if (signingTime) json["signingTime"] = util::formatIso8601(*signingTime);
    json["digestAlgorithm"] = digestAlgorithm;
    json["subFilter"] = subFilter;
    if (timestampVerification) json["timestamp"] = timestampVerification->toJson();
    json["errors"] = validation::toJsonArray(errors);
    json["warnings"] = validation::toJsonArray(warnings);
    return json;
}

} // namespace pdftrust::signature
