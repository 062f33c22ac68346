/**
 * @file types.h
 * @brief Extracted PDF signatures and their validation results
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include "pdftrust/cms/cms_signature.h"
#include "pdftrust/tsp/types.h"
#include "pdftrust/validation/x509_certificate.h"

namespace pdftrust::signature {

using TimePoint = std::chrono::system_clock::time_point;

/// One covered span of the file: [offset, offset + length)
struct ByteRangeSegment {
    size_t offset = 0;
    size_t length = 0;

    size_t end() const { return offset + length; }
};

/**
 * @brief A signature field's CMS object and the bytes it covers
 *
 * signature is empty when the /Contents could not be decoded; extractionError
 * then says why.
 */
struct ExtractedSignature {
    std::string fieldName;
    std::optional<cms::CMSSignature> signature;
    std::vector<ByteRangeSegment> byteRange;
    std::string subFilter;
    std::string signerName;                  ///< /Name
    std::string reason;                      ///< /Reason
    std::string location;                    ///< /Location
    std::string contactInfo;                 ///< /ContactInfo
    std::optional<TimePoint> signingTimeM;   ///< /M
    size_t contentsOffset = 0;               ///< '<' of the /Contents hex string
    size_t contentsEnd = 0;                  ///< One past its '>'
    bool coversWholeDocument = false;        ///< Whole file except exactly the /Contents string

    std::string extractionError;
    std::string byteRangeError;              ///< Empty when the byte range is well formed
    std::vector<std::string> warnings;       ///< Byte range observations

    Json::Value toJson() const;
};

struct SignatureValidationResult {
    bool isValid = false;
    bool documentIntegrityValid = false;
    bool signatureValid = false;
    bool certificateChainValid = false;
    bool timestampValid = false;
    bool hasTimestamp = false;
    bool coversWholeDocument = false;

    std::optional<validation::X509Certificate> signerCertificate;
    std::optional<TimePoint> signingTime;    ///< Timestamp genTime, else signingTime attribute, else /M
    std::string digestAlgorithm;             ///< Dotted OID
    std::string subFilter;
    std::optional<tsp::TimestampVerificationResult> timestampVerification;

    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    Json::Value toJson() const;
};

} // namespace pdftrust::signature
