/**
 * @file structure_validator.cpp
 * @brief PDF structure validation implementation
 */

#include "pdftrust/pdf/structure_validator.h"
#include "pdftrust/pdf/pdf_lexer.h"
#include "pdftrust/validation/types.h"

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace pdftrust::pdf {

namespace {

constexpr size_t XREF_SAMPLE_CHARS = 1000;
constexpr size_t XREF_SAMPLE_FIRST_LINE = 2;
constexpr size_t XREF_SAMPLE_END_LINE = 10;

bool isDigitChar(char c) { return c >= '0' && c <= '9'; }

bool isWs(char c) { return PdfParser::isWhitespace(static_cast<uint8_t>(c)); }

bool isBoundaryChar(char c) {
    return PdfParser::isWhitespace(static_cast<uint8_t>(c)) || PdfParser::isDelimiter(static_cast<uint8_t>(c));
}

/// "nnnnnnnnnn ggggg n" (ISO 32000-1 Section 7.5.4)
bool isXrefEntry(std::string_view line) {
    if (line.size() != 18) return false;
    for (size_t i = 0; i < 10; i++) if (!isDigitChar(line[i])) return false;
    if (line[10] != ' ') return false;
    for (size_t i = 11; i < 16; i++) if (!isDigitChar(line[i])) return false;
    if (line[16] != ' ') return false;
    return line[17] == 'n' || line[17] == 'f';
}

std::string_view trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && isWs(s[start])) start++;
    size_t end = s.size();
    while (end > start && isWs(s[end - 1])) end--;
    return s.substr(start, end - start);
}

std::vector<std::string_view> splitLines(std::string_view s) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\r' || s[i] == '\n') {
            lines.push_back(s.substr(start, i - start));
            if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') i++;
            start = i + 1;
        }
    }
    lines.push_back(s.substr(start));
    return lines;
}

/// True when the "obj" at pos is preceded by "N G" with whitespace separators
bool precededByObjectNumbers(std::string_view content, size_t pos) {
    size_t i = pos;
    auto back = [&](bool digits) {
        size_t before = i;
        while (i > 0 && (digits ? isDigitChar(content[i - 1]) : isWs(content[i - 1]))) i--;
        return i != before;
    };
    return back(false) && back(true) && back(false) && back(true);
}

/// "/Encrypt" as a key of its own, not "/EncryptMetadata"
bool hasEncryptKey(std::string_view content) {
    size_t pos = 0;
    while ((pos = content.find("/Encrypt", pos)) != std::string_view::npos) {
        size_t end = pos + 8;
        if (end == content.size() || isBoundaryChar(content[end])) return true;
        pos = end;
    }
    return false;
}

} // namespace

PdfStructureValidator::PdfStructureValidator(ScanLimits limits) : limits_(limits) {
    if (limits_.maxScanBytes == 0 || limits_.maxObjectScan == 0) {
        throw std::invalid_argument("PdfStructureValidator: scan limits must be positive");
    }
}

StructureValidationResult PdfStructureValidator::validate(const std::vector<uint8_t>& bytes) const {
    StructureValidationResult result;

    result.headerValid = validateHeader(bytes, result);
    if (!result.headerValid) {
        spdlog::debug("[PdfStructureValidator] Header rejected: {}", result.errors.front());
        return result;
    }

    std::string_view content(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    result.trailerValid = validateTrailer(content, result);
    result.crossReferenceValid = validateCrossReference(content, result);
    result.objectsValid = validateObjects(content, result);
    result.isEncrypted = hasEncryptKey(content.substr(0, limits_.maxScanBytes));

    result.isValid = result.headerValid && result.trailerValid &&
                     result.crossReferenceValid && result.objectsValid;

    spdlog::debug("[PdfStructureValidator] PDF {} structure {}: {} objects, {} errors, {} warnings",
                  result.pdfVersion, result.isValid ? "valid" : "invalid",
                  result.objectCount, result.errors.size(), result.warnings.size());
    return result;
}

bool PdfStructureValidator::validateHeader(const std::vector<uint8_t>& bytes,
                                           StructureValidationResult& result) const {
    if (bytes.size() < 8) {
        result.errors.push_back("File too small to be a valid PDF");
        return false;
    }
    if (std::memcmp(bytes.data(), "%PDF-", 5) != 0) {
        result.errors.push_back("Invalid PDF header signature");
        return false;
    }

    size_t i = 5;
    size_t majorStart = i;
    while (i < bytes.size() && i < 16 && isDigitChar(static_cast<char>(bytes[i]))) i++;
    size_t majorLen = i - majorStart;
    if (majorLen == 0 || i >= bytes.size() || bytes[i] != '.') {
        result.errors.push_back("Invalid PDF header signature");
        return false;
    }
    i++;
    size_t minorStart = i;
    while (i < bytes.size() && i < 16 && isDigitChar(static_cast<char>(bytes[i]))) i++;
    if (i == minorStart) {
        result.errors.push_back("Invalid PDF header signature");
        return false;
    }

    result.pdfVersion.assign(reinterpret_cast<const char*>(bytes.data() + majorStart), i - majorStart);
    double version = std::strtod(result.pdfVersion.c_str(), nullptr);
    if (version < 1.0 || version > 2.0) {
        result.errors.push_back("Invalid PDF header: unsupported PDF version " + result.pdfVersion);
        return false;
    }
    return true;
}

bool PdfStructureValidator::validateTrailer(std::string_view content, StructureValidationResult& result) const {
    size_t startxref = content.rfind("startxref");
    if (startxref == std::string_view::npos) {
        result.errors.push_back("startxref not found");
        return false;
    }
    if (content.rfind("%%EOF") == std::string_view::npos) {
        result.errors.push_back("EOF marker not found");
        return false;
    }

    size_t trailer = content.rfind("trailer");
    if (trailer == std::string_view::npos) {
        result.warnings.push_back("Traditional trailer not found (may use cross-reference streams)");
    } else if (trailer > startxref) {
        result.warnings.push_back("Trailer appears after startxref");
    }

    return true;
}

bool PdfStructureValidator::validateCrossReference(std::string_view content,
                                                   StructureValidationResult& result) const {
    // "xref" as a keyword of its own, not the tail of "startxref"
    size_t xref = std::string_view::npos;
    size_t pos = 0;
    while ((pos = content.find("xref", pos)) != std::string_view::npos) {
        bool startOk = (pos == 0) || isWs(content[pos - 1]);
        bool endOk = (pos + 4 == content.size()) || isWs(content[pos + 4]);
        if (startOk && endOk) {
            xref = pos;
            break;
        }
        pos += 4;
    }

    if (xref == std::string_view::npos) {
        result.warnings.push_back("Traditional xref table not found (may use cross-reference streams)");
        return true;
    }

    std::vector<std::string_view> lines = splitLines(content.substr(xref, XREF_SAMPLE_CHARS));
    if (lines.size() < 2) {
        result.errors.push_back("Invalid xref table structure");
        return false;
    }

    // Line 0 is "xref", line 1 the first subsection header
    int validEntries = 0;
    for (size_t i = XREF_SAMPLE_FIRST_LINE; i < lines.size() && i < XREF_SAMPLE_END_LINE; i++) {
        std::string_view line = trim(lines[i]);
        if (line == "trailer") break;
        if (isXrefEntry(line)) validEntries++;
    }

    if (validEntries == 0) {
        result.warnings.push_back("No valid xref entries found in sample");
    }
    return true;
}

bool PdfStructureValidator::validateObjects(std::string_view content, StructureValidationResult& result) const {
    bool bytesTruncated = content.size() > limits_.maxScanBytes;
    std::string_view scan = content.substr(0, limits_.maxScanBytes);

    size_t objCount = 0;
    size_t endobjCount = 0;
    bool objectsTruncated = false;

    size_t pos = 0;
    while ((pos = scan.find("obj", pos)) != std::string_view::npos) {
        if (pos >= 3 && scan.compare(pos - 3, 3, "end") == 0) {
            endobjCount++;
        } else if (precededByObjectNumbers(scan, pos)) {
            if (objCount >= limits_.maxObjectScan) {
                objectsTruncated = true;
                break;
            }
            objCount++;
        }
        pos += 3;
    }

    // Page estimate: "/Type /Page" but not "/Type /Pages"
    pos = 0;
    while ((pos = scan.find("/Type", pos)) != std::string_view::npos) {
        size_t i = pos + 5;
        while (i < scan.size() && isWs(scan[i])) i++;
        if (scan.compare(i, 5, "/Page") == 0 && (i + 5 == scan.size() || isBoundaryChar(scan[i + 5]))) {
            result.pageCount++;
        }
        pos = i;
    }

    result.objectCount = objCount;

    if (bytesTruncated) {
        result.warnings.push_back("Object scan limited to the first " + std::to_string(limits_.maxScanBytes) +
                                  " bytes; object counts are incomplete");
    }
    if (objectsTruncated) {
        result.warnings.push_back("Object scan stopped after " + std::to_string(limits_.maxObjectScan) +
                                  " objects; object counts are incomplete");
    }

    if (objCount == 0 || endobjCount == 0) {
        result.errors.push_back("No PDF objects found");
        return false;
    }
    if (!bytesTruncated && !objectsTruncated && objCount != endobjCount) {
        result.errors.push_back("Mismatched object count: " + std::to_string(objCount) + " obj vs " +
                                std::to_string(endobjCount) + " endobj");
        return false;
    }

    if (scan.find("/Catalog") == std::string_view::npos) {
        result.warnings.push_back("Root catalog object not clearly identified (may be compressed)");
    }
    if (scan.find("/Pages") == std::string_view::npos) {
        result.warnings.push_back("Pages object not clearly identified (may be compressed)");
    }
    return true;
}

Json::Value StructureValidationResult::toJson() const {
    Json::Value json;
    json["isValid"] = isValid;
    json["pdfVersion"] = pdfVersion;
    json["headerValid"] = headerValid;
    json["trailerValid"] = trailerValid;
    json["crossReferenceValid"] = crossReferenceValid;
    json["objectsValid"] = objectsValid;
    json["objectCount"] = static_cast<Json::UInt64>(objectCount);
    json["pageCount"] = pageCount;
    json["isEncrypted"] = isEncrypted;
    json["errors"] = validation::toJsonArray(errors);
    json["warnings"] = validation::toJsonArray(warnings);
    return json;
}

} // namespace pdftrust::pdf
