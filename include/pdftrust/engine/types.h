/**
 * @file types.h
 * @brief Aggregated result of one PDF validation pass
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <json/json.h>

#include "pdftrust/pdf/structure_validator.h"
#include "pdftrust/signature/types.h"
#include "pdftrust/tsp/audit_log.h"
#include "pdftrust/tsp/types.h"
#include "pdftrust/validation/providers.h"
#include "pdftrust/validation/types.h"
#include "pdftrust/validation/x509_certificate.h"

namespace pdftrust::engine {

struct EngineOptions {
    std::vector<validation::X509Certificate> trustedRoots;
    validation::IRevocationChecker* revocationChecker = nullptr;   ///< Non-owning, optional
    bool verifyTimestamps = true;
    pdf::ScanLimits limits;
    std::shared_ptr<tsp::ITimestampAuditLog> auditLog;              ///< nullptr: process-wide log
};

struct SignatureValidationEntry {
    std::string fieldName;
    signature::SignatureValidationResult validationResult;
    signature::ExtractedSignature extractedSignature;
};

struct SignatureValidationSummary {
    bool hasSignatures = false;
    bool allSignaturesValid = true;
    std::vector<SignatureValidationEntry> signatures;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    Json::Value toJson() const;
};

struct CertificateValidationEntry {
    validation::X509Certificate certificate;
    validation::CertificateValidationResult validationResult;
};

struct CertificateValidationSummary {
    bool allCertificatesValid = true;
    std::vector<CertificateValidationEntry> certificates;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    Json::Value toJson() const;
};

struct TimestampValidationEntry {
    std::string signatureFieldName;
    tsp::Timestamp timestamp;
    tsp::TimestampVerificationResult validationResult;
};

struct TimestampValidationSummary {
    bool hasTimestamps = false;
    bool allTimestampsValid = true;
    std::vector<TimestampValidationEntry> timestamps;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    Json::Value toJson() const;
};

/**
 * @brief Everything one validation pass found
 *
 * isValid is true iff errors is empty. errors and warnings hold every
 * component finding, prefixed with the field or certificate it concerns.
 */
struct PdfValidationResult {
    bool isValid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    int pageCount = 0;
    bool hasFormFields = false;
    bool hasSignatures = false;
    bool isEncrypted = false;
    std::string version;
    size_t fileSize = 0;

    pdf::StructureValidationResult structureValidation;
    SignatureValidationSummary signatureValidation;
    CertificateValidationSummary certificateValidation;
    TimestampValidationSummary timestampValidation;
    long long processingTimeMs = 0;

    Json::Value toJson() const;
};

} // namespace pdftrust::engine
