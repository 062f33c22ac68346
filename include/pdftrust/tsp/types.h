/**
 * @file types.h
 * @brief RFC 3161 Time-Stamp Protocol data model
 *
 * Request, response and token values plus TSA configuration and audit
 * records. Everything here is a plain value created per request.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include "pdftrust/validation/message_imprint.h"
#include "pdftrust/validation/x509_certificate.h"

namespace pdftrust::tsp {

using TimePoint = std::chrono::system_clock::time_point;

/// id-aa-timeStampToken, the unsigned attribute carrying a signature timestamp
inline constexpr const char* TIMESTAMP_TOKEN_ATTRIBUTE_OID = "1.2.840.113549.1.9.16.2.14";
/// id-ct-TSTInfo; some producers also label the attribute with it
inline constexpr const char* TSTINFO_CONTENT_TYPE_OID = "1.2.840.113549.1.9.16.1.4";
inline constexpr const char* LEGACY_TIMESTAMP_ATTRIBUTE_OID = "1.2.840.113549.1.9.16.1.14";

/// @brief PKIStatus (RFC 3161 Section 2.4.2)
enum class PkiStatus {
    GRANTED = 0,
    GRANTED_WITH_MODS = 1,
    REJECTION = 2,
    WAITING = 3,
    REVOCATION_WARNING = 4,
    REVOCATION_NOTIFICATION = 5
};

/// @brief PKIFailureInfo bit positions
enum class PkiFailureInfo {
    BAD_ALG = 0,
    BAD_REQUEST = 2,
    BAD_DATA_FORMAT = 5,
    TIME_NOT_AVAILABLE = 14,
    UNACCEPTED_POLICY = 15,
    UNACCEPTED_EXTENSION = 16,
    ADD_INFO_NOT_AVAILABLE = 17,
    SYSTEM_FAILURE = 25
};

struct TsaStatus {
    PkiStatus status = PkiStatus::REJECTION;
    std::vector<std::string> statusStrings;
    std::vector<PkiFailureInfo> failInfo;

    bool isGranted() const {
        return status == PkiStatus::GRANTED || status == PkiStatus::GRANTED_WITH_MODS;
    }

    /// "REJECTION (badAlg): text"
    std::string describe() const;
};

struct Accuracy {
    int seconds = 0;
    int millis = 0;
    int micros = 0;
};

/// @brief Signed payload of a TimeStampToken (RFC 3161 Section 2.4.2)
struct TSTInfo {
    long version = 1;
    std::string policy;                          ///< Dotted OID
    validation::MessageImprint messageImprint;
    std::string serialNumber;                    ///< Lowercase hex
    TimePoint genTime;
    std::optional<Accuracy> accuracy;
    bool ordering = false;
    std::optional<std::vector<uint8_t>> nonce;
    std::string tsaName;                         ///< GeneralName rendered as text, may be empty
};

/// @brief CMS SignedData wrapping a TSTInfo
struct TimeStampToken {
    std::vector<uint8_t> der;                              ///< ContentInfo DER
    TSTInfo tstInfo;
    std::vector<validation::X509Certificate> certificates; ///< TSA signer first when embedded
};

struct TimestampRequestOptions {
    std::string hashAlgorithm = "SHA-256";
    bool includeNonce = true;
    bool requestCertificate = true;
    std::string policy;                          ///< Empty: TSA default policy
    size_t nonceLength = 16;
};

struct TimestampRequest {
    validation::MessageImprint messageImprint;
    std::string reqPolicy;                       ///< Empty: absent
    std::optional<std::vector<uint8_t>> nonce;   ///< Big-endian positive integer bytes
    bool certReq = true;
};

struct TimestampResponse {
    TsaStatus status;
    std::optional<TimeStampToken> token;
    std::vector<uint8_t> der;                    ///< TimeStampResp as received
    std::string tsaUrl;                          ///< TSA that produced it, when known
};

/// @brief Materialized timestamp attached to a signature
struct Timestamp {
    TimePoint genTime;
    std::string tsaUrl;
    std::string serialNumber;
    std::optional<validation::X509Certificate> certificate;
    std::string policy;
    std::optional<Accuracy> accuracy;
    validation::MessageImprint messageImprint;
    std::vector<uint8_t> raw;                    ///< TimeStampToken DER, kept for audit

    Json::Value toJson() const;
};

struct TSAConfig {
    std::string url;
    std::string username;                        ///< Empty: no basic auth
    std::string password;
    int timeoutMs = 30000;
    int retryAttempts = 3;
    std::string hashAlgorithm = "SHA-256";
    std::string requestPolicy;
};

struct TSAFailoverConfig {
    TSAConfig primary;
    std::vector<TSAConfig> fallbacks;
    std::optional<int> maxFailoverAttempts;      ///< Default: 1 + fallbacks

    int effectiveMaxAttempts() const {
        return maxFailoverAttempts ? *maxFailoverAttempts : static_cast<int>(fallbacks.size()) + 1;
    }
};

struct TimestampVerificationResult {
    bool isValid = false;
    bool imprintMatches = false;
    bool signatureVerified = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    std::optional<TimePoint> genTime;
    std::optional<Accuracy> accuracy;
    std::string policy;
    std::string serialNumber;
    std::string hashAlgorithm;
    std::string tsaUrl;
    std::optional<validation::X509Certificate> tsaCertificate;

    Json::Value toJson() const;
};

enum class TimestampOperation {
    REQUEST,
    VERIFY,
    EXTRACT,
    ADD_TO_SIGNATURE
};

/// @brief Append-only record of one timestamp operation
struct TimestampAuditEntry {
    std::string id;                              ///< UUID v4
    TimestampOperation operation = TimestampOperation::REQUEST;
    std::string tsaUrl;
    Json::Value result;
    bool success = false;
    std::string error;
    long long durationMs = 0;
    TimePoint createdAt;

    Json::Value toJson() const;
};

/// @brief Convert PkiStatus to string
inline std::string pkiStatusToString(PkiStatus s) {
    switch (s) {
        case PkiStatus::GRANTED:                 return "GRANTED";
        case PkiStatus::GRANTED_WITH_MODS:       return "GRANTED_WITH_MODS";
        case PkiStatus::REJECTION:               return "REJECTION";
        case PkiStatus::WAITING:                 return "WAITING";
        case PkiStatus::REVOCATION_WARNING:      return "REVOCATION_WARNING";
        case PkiStatus::REVOCATION_NOTIFICATION: return "REVOCATION_NOTIFICATION";
    }
    return "UNKNOWN";
}

/// @brief Convert PkiFailureInfo to its RFC 3161 name
inline std::string pkiFailureInfoToString(PkiFailureInfo f) {
    switch (f) {
        case PkiFailureInfo::BAD_ALG:                return "badAlg";
        case PkiFailureInfo::BAD_REQUEST:            return "badRequest";
        case PkiFailureInfo::BAD_DATA_FORMAT:        return "badDataFormat";
        case PkiFailureInfo::TIME_NOT_AVAILABLE:     return "timeNotAvailable";
        case PkiFailureInfo::UNACCEPTED_POLICY:      return "unacceptedPolicy";
        case PkiFailureInfo::UNACCEPTED_EXTENSION:   return "unacceptedExtension";
        case PkiFailureInfo::ADD_INFO_NOT_AVAILABLE: return "addInfoNotAvailable";
        case PkiFailureInfo::SYSTEM_FAILURE:         return "systemFailure";
    }
    return "unknown";
}

/// @brief Convert TimestampOperation to string
inline std::string timestampOperationToString(TimestampOperation op) {
    switch (op) {
        case TimestampOperation::REQUEST:          return "REQUEST";
        case TimestampOperation::VERIFY:           return "VERIFY";
        case TimestampOperation::EXTRACT:          return "EXTRACT";
        case TimestampOperation::ADD_TO_SIGNATURE: return "ADD_TO_SIGNATURE";
    }
    return "UNKNOWN";
}

} // namespace pdftrust::tsp
