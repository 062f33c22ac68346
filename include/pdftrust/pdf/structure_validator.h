/**
 * @file structure_validator.h
 * @brief Textual structure checks over raw PDF bytes
 *
 * Header, trailer, cross-reference and object-count checks that run before
 * any signature work. Object scanning is capped to bound the work done on
 * hostile input.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <json/json.h>

namespace pdftrust::pdf {

struct ScanLimits {
    size_t maxScanBytes = 256u * 1024u * 1024u;
    size_t maxObjectScan = 1000000;
};

struct StructureValidationResult {
    bool isValid = false;
    std::string pdfVersion;        ///< "1.7", empty when the header is unreadable
    bool headerValid = false;
    bool trailerValid = false;
    bool crossReferenceValid = false;
    bool objectsValid = false;
    size_t objectCount = 0;
    int pageCount = 0;             ///< Estimated from /Type /Page occurrences
    bool isEncrypted = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    Json::Value toJson() const;
};

class PdfStructureValidator {
public:
    explicit PdfStructureValidator(ScanLimits limits = ScanLimits());

    StructureValidationResult validate(const std::vector<uint8_t>& bytes) const;

private:
    bool validateHeader(const std::vector<uint8_t>& bytes, StructureValidationResult& result) const;
    bool validateTrailer(std::string_view content, StructureValidationResult& result) const;
    bool validateCrossReference(std::string_view content, StructureValidationResult& result) const;
    bool validateObjects(std::string_view content, StructureValidationResult& result) const;

    ScanLimits limits_;
};

} // namespace pdftrust::pdf
