/**
 * @file pdf_validation_engine.cpp
 * @brief PdfValidationEngine implementation
 */

#include "pdftrust/engine/pdf_validation_engine.h"
#include "pdftrust/common/exceptions.h"
#include "pdftrust/pdf/pdf_document.h"
#include "pdftrust/signature/digital_signature_engine.h"
#include "pdftrust/tsp/timestamp_server_manager.h"
#include "pdftrust/util/time_utils.h"
#include "pdftrust/validation/certificate_manager.h"

#include <map>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>

namespace pdftrust::engine {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

void appendPrefixed(std::vector<std::string>& out, const std::vector<std::string>& items,
                    const std::string& prefix) {
    for (const auto& item : items) {
        out.push_back(prefix + item);
    }
}

void mergeInto(PdfValidationResult& result, const std::vector<std::string>& errors,
               const std::vector<std::string>& warnings) {
    result.errors.insert(result.errors.end(), errors.begin(), errors.end());
    result.warnings.insert(result.warnings.end(), warnings.begin(), warnings.end());
}

} // namespace

PdfValidationEngine::PdfValidationEngine(EngineOptions options) : options_(std::move(options)) {}

PdfValidationResult PdfValidationEngine::validatePdf(const std::vector<uint8_t>& bytes) const {
    auto start = std::chrono::steady_clock::now();
    PdfValidationResult result;
    result.fileSize = bytes.size();

    auto finish = [&]() -> PdfValidationResult {
        result.isValid = result.errors.empty();
        result.processingTimeMs = util::elapsedMillis(start);
        spdlog::info("[PdfValidationEngine] Validated {} bytes: {} ({} signature(s), {} error(s), {} warning(s), {} ms)",
                     result.fileSize, result.isValid ? "VALID" : "INVALID",
                     result.signatureValidation.signatures.size(),
                     result.errors.size(), result.warnings.size(), result.processingTimeMs);
        return result;
    };

    // 1. Structure
    pdf::PdfStructureValidator structureValidator(options_.limits);
    result.structureValidation = structureValidator.validate(bytes);
    const auto& structure = result.structureValidation;
    mergeInto(result, structure.errors, structure.warnings);
    result.version = structure.pdfVersion;
    result.isEncrypted = structure.isEncrypted;
    result.pageCount = structure.pageCount;

    if (!structure.headerValid) {
        return finish();
    }

    // 2. Document model
    std::optional<pdf::PdfDocument> document;
    try {
        document = pdf::PdfDocument::parse(bytes, options_.limits.maxObjectScan);
    } catch (const common::PdfTrustException& e) {
        result.errors.push_back(std::string("Failed to load PDF for validation: ") + e.what());
        return finish();
    }
    if (int pages = document->pageCount(); pages > 0) {
        result.pageCount = pages;
    }
    result.hasFormFields = document->hasFormFields();
    result.isEncrypted = result.isEncrypted || document->isEncrypted();
    result.warnings.insert(result.warnings.end(), document->warnings().begin(), document->warnings().end());

    // Per-pass components
    validation::CertificateManager certificateManager;
    certificateManager.setRevocationChecker(options_.revocationChecker);
    tsp::TimestampServerManager timestampManager(nullptr, options_.auditLog);
    signature::DigitalSignatureEngine signatureEngine(&certificateManager, &timestampManager);
    signatureEngine.setVerifyTimestamps(options_.verifyTimestamps);

    // 3. Signatures
    SignatureValidationSummary& signatures = result.signatureValidation;
    std::vector<signature::ExtractedSignature> extracted = signatureEngine.extractSignatures(*document);
    signatures.hasSignatures = !extracted.empty();
    result.hasSignatures = signatures.hasSignatures;

    for (auto& ex : extracted) {
        const std::string field = ex.fieldName;
        try {
            SignatureValidationEntry entry;
            entry.fieldName = field;
            entry.validationResult = signatureEngine.validateSignature(ex, options_.trustedRoots);
            entry.extractedSignature = std::move(ex);

            if (!entry.validationResult.isValid) {
                signatures.allSignaturesValid = false;
                signatures.errors.push_back("Signature '" + field + "' is invalid: " +
                                            join(entry.validationResult.errors, ", "));
            }
            appendPrefixed(signatures.warnings, entry.validationResult.warnings, "Signature '" + field + "': ");
            signatures.signatures.push_back(std::move(entry));
        } catch (const common::PdfTrustException& e) {
            signatures.allSignaturesValid = false;
            signatures.errors.push_back("Failed to validate signature '" + field + "': " + e.what());
        }
    }
    mergeInto(result, signatures.errors, signatures.warnings);

    // 4. Certificates, each fingerprint once. Members of a signer's validated
    //    path take their result from that path instead of a new path build.
    CertificateValidationSummary& certificates = result.certificateValidation;
    std::set<std::string> processed;
    std::map<std::string, validation::CertificateValidationResult> pathMembers;
    for (const auto& [leaf, leafResult] : signatureEngine.validatedCertificates()) {
        for (size_t k = 1; k < leafResult.chain.size(); k++) {
            pathMembers.emplace(leafResult.chain[k].fingerprint,
                                validation::CertificateManager::pathMemberResult(leafResult, k));
        }
    }

    for (const auto& entry : signatures.signatures) {
        const auto& sig = entry.extractedSignature.signature;
        if (!sig || sig->certificates.empty()) continue;

        for (size_t i = 0; i < sig->certificates.size(); i++) {
            const validation::X509Certificate& cert = sig->certificates[i];
            if (!processed.insert(cert.fingerprint).second) continue;

            const std::string name = cert.displayName();
            try {
                CertificateValidationEntry certEntry;
                certEntry.certificate = cert;

                const auto& cached = signatureEngine.validatedCertificates();
                auto it = cached.find(cert.fingerprint);
                auto member = pathMembers.find(cert.fingerprint);
                if (it != cached.end()) {
                    certEntry.validationResult = it->second;
                } else if (member != pathMembers.end()) {
                    certEntry.validationResult = member->second;
                } else {
                    // This certificate as leaf, the rest of the signature's set as candidate issuers
                    std::vector<validation::X509Certificate> chain{cert};
                    for (size_t j = 0; j < sig->certificates.size(); j++) {
                        if (j != i) chain.push_back(sig->certificates[j]);
                    }
                    certEntry.validationResult =
                        certificateManager.validateCertificateChain(chain, options_.trustedRoots);
                }

                if (!certEntry.validationResult.isValid) {
                    certificates.allCertificatesValid = false;
                    certificates.errors.push_back("Certificate " + name + " is invalid: " +
                                                  join(certEntry.validationResult.errors, ", "));
                }
                appendPrefixed(certificates.warnings, certEntry.validationResult.warnings,
                               "Certificate " + name + ": ");
                certificates.certificates.push_back(std::move(certEntry));
            } catch (const common::PdfTrustException& e) {
                certificates.allCertificatesValid = false;
                certificates.errors.push_back("Failed to validate certificate " + name + ": " + e.what());
            }
        }
    }
    mergeInto(result, certificates.errors, certificates.warnings);

    // 5. Timestamps, reusing each signature's verification
    TimestampValidationSummary& timestamps = result.timestampValidation;
    for (const auto& entry : signatures.signatures) {
        const auto& sig = entry.extractedSignature.signature;
        if (!sig || !sig->timestamp) continue;
        timestamps.hasTimestamps = true;

        const auto& verification = entry.validationResult.timestampVerification;
        if (!verification) continue;

        TimestampValidationEntry tsEntry;
        tsEntry.signatureFieldName = entry.fieldName;
        tsEntry.timestamp = *sig->timestamp;
        tsEntry.validationResult = *verification;

        if (!verification->isValid) {
            timestamps.allTimestampsValid = false;
            timestamps.errors.push_back("Timestamp for signature '" + entry.fieldName + "' is invalid: " +
                                        join(verification->errors, ", "));
        }
        appendPrefixed(timestamps.warnings, verification->warnings, "Timestamp for '" + entry.fieldName + "': ");
        timestamps.timestamps.push_back(std::move(tsEntry));
    }
    mergeInto(result, timestamps.errors, timestamps.warnings);

    return finish();
}

std::future<PdfValidationResult> PdfValidationEngine::validatePdfAsync(std::vector<uint8_t> bytes) const {
    return std::async(std::launch::async, [this, bytes = std::move(bytes)]() {
        return validatePdf(bytes);
    });
}

PdfValidationResult PdfValidationEngine::validateDocument(const std::string& documentId,
                                                          IDocumentBytesProvider& provider,
                                                          IValidationResultSink* sink) const {
    spdlog::debug("[PdfValidationEngine] Reading document {}", documentId);
    std::vector<uint8_t> bytes = provider.readDocument(documentId);
    PdfValidationResult result = validatePdf(bytes);
    if (sink) {
        sink->storeValidationResult(documentId, result.toJson());
    }
    return result;
}

} // namespace pdftrust::engine
