/**
 * @file test_structure_validator.cpp
 * @brief Unit tests for PdfStructureValidator
 */

#include <gtest/gtest.h>
#include <pdftrust/pdf/structure_validator.h>
#include "test_helpers.h"

using namespace pdftrust::pdf;
using namespace test_helpers;

namespace {

bool contains(const std::vector<std::string>& items, const std::string& needle) {
    for (const auto& item : items) {
        if (item.find(needle) != std::string::npos) return true;
    }
    return false;
}

const std::string XREF_STREAM_PDF =
    "%PDF-1.7\n"
    "1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
    "2 0 obj\n<< /Type /Pages /Kids [] /Count 0 >>\nendobj\n"
    "3 0 obj\n<< /Type /XRef /Root 1 0 R /Size 4 /Length 4 >>\nstream\nabcd\nendstream\nendobj\n"
    "startxref\n0\n%%EOF\n";

} // namespace

class StructureValidatorTest : public ::testing::Test {
protected:
    PdfStructureValidator validator_;
};

// ============================================================================
// Well-formed documents
// ============================================================================

TEST_F(StructureValidatorTest, ClassicDocumentIsValid) {
    TestPdf pdf;
    auto result = validator_.validate(pdf.bytes());

    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(result.headerValid);
    EXPECT_TRUE(result.trailerValid);
    EXPECT_TRUE(result.crossReferenceValid);
    EXPECT_TRUE(result.objectsValid);
    EXPECT_EQ(result.pdfVersion, "1.7");
    EXPECT_EQ(result.objectCount, 3u);
    EXPECT_EQ(result.pageCount, 1);
    EXPECT_FALSE(result.isEncrypted);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(StructureValidatorTest, IncrementallySignedDocumentIsValid) {
    TestPdf pdf;
    pdf.addSignature(SignatureFieldSpec(), pkiSigner());
    auto result = validator_.validate(pdf.bytes());

    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(result.objectCount, 6u);
    EXPECT_EQ(result.pageCount, 1);
}

TEST_F(StructureValidatorTest, Pdf20Accepted) {
    TestPdf pdf("2.0");
    auto result = validator_.validate(pdf.bytes());
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(result.pdfVersion, "2.0");
}

TEST_F(StructureValidatorTest, CrossReferenceStreamOnlyWarns) {
    auto result = validator_.validate(toBytes(XREF_STREAM_PDF));
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(contains(result.warnings, "Traditional trailer not found"));
    EXPECT_TRUE(contains(result.warnings, "Traditional xref table not found"));
}

// ============================================================================
// Header
// ============================================================================

TEST_F(StructureValidatorTest, HeaderFailures) {
    auto tiny = validator_.validate(toBytes("%PDF"));
    EXPECT_FALSE(tiny.isValid);
    ASSERT_EQ(tiny.errors.size(), 1u);
    EXPECT_EQ(tiny.errors[0], "File too small to be a valid PDF");

    auto postscript = validator_.validate(toBytes("%!PS-Adobe-3.0\n"));
    EXPECT_FALSE(postscript.headerValid);
    EXPECT_EQ(postscript.errors[0], "Invalid PDF header signature");
    EXPECT_FALSE(postscript.trailerValid);

    auto noDigits = validator_.validate(toBytes("%PDF-x.y\nstartxref\n%%EOF"));
    EXPECT_EQ(noDigits.errors[0], "Invalid PDF header signature");

    auto future = validator_.validate(toBytes("%PDF-3.0\nstartxref\n%%EOF"));
    EXPECT_EQ(future.errors[0], "Invalid PDF header: unsupported PDF version 3.0");
    EXPECT_EQ(future.pdfVersion, "3.0");
}

// ============================================================================
// Trailer and cross-reference
// ============================================================================

TEST_F(StructureValidatorTest, MissingStartxref) {
    auto result = validator_.validate(toBytes("%PDF-1.7\n1 0 obj\n<<>>\nendobj\n%%EOF\n"));
    EXPECT_FALSE(result.isValid);
    EXPECT_FALSE(result.trailerValid);
    EXPECT_TRUE(contains(result.errors, "startxref not found"));
    EXPECT_TRUE(result.objectsValid);
}

TEST_F(StructureValidatorTest, MissingEofMarker) {
    auto result = validator_.validate(toBytes("%PDF-1.7\n1 0 obj\n<<>>\nendobj\nstartxref\n0\n"));
    EXPECT_FALSE(result.trailerValid);
    EXPECT_TRUE(contains(result.errors, "EOF marker not found"));
}

TEST_F(StructureValidatorTest, TrailerAfterStartxrefWarns) {
    auto result = validator_.validate(toBytes(
        "%PDF-1.7\n1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
        "startxref\n0\ntrailer\n<< /Root 1 0 R >>\n%%EOF\n"));
    EXPECT_TRUE(result.trailerValid);
    EXPECT_TRUE(contains(result.warnings, "Trailer appears after startxref"));
}

TEST_F(StructureValidatorTest, XrefWithoutEntriesWarns) {
    auto result = validator_.validate(toBytes(
        "%PDF-1.7\n1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
        "xref\n0 1\ngarbage line\ntrailer\n<< /Root 1 0 R >>\nstartxref\n40\n%%EOF\n"));
    EXPECT_TRUE(result.crossReferenceValid);
    EXPECT_TRUE(contains(result.warnings, "No valid xref entries found in sample"));
}

// ============================================================================
// Objects
// ============================================================================

TEST_F(StructureValidatorTest, MismatchedObjectCount) {
    auto result = validator_.validate(toBytes(
        "%PDF-1.7\n1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
        "2 0 obj\n<< /Type /Pages >>\nstartxref\n0\n%%EOF\n"));
    EXPECT_FALSE(result.isValid);
    EXPECT_FALSE(result.objectsValid);
    EXPECT_TRUE(contains(result.errors, "Mismatched object count: 2 obj vs 1 endobj"));
}

TEST_F(StructureValidatorTest, NoObjects) {
    auto result = validator_.validate(toBytes("%PDF-1.7\nstartxref\n0\n%%EOF\n"));
    EXPECT_FALSE(result.objectsValid);
    EXPECT_TRUE(contains(result.errors, "No PDF objects found"));
}

TEST_F(StructureValidatorTest, MissingCatalogAndPagesWarn) {
    auto result = validator_.validate(toBytes("%PDF-1.7\n1 0 obj\n<< /A 1 >>\nendobj\nstartxref\n0\n%%EOF\n"));
    EXPECT_TRUE(result.objectsValid);
    EXPECT_TRUE(contains(result.warnings, "Root catalog object not clearly identified"));
    EXPECT_TRUE(contains(result.warnings, "Pages object not clearly identified"));
}

TEST_F(StructureValidatorTest, EncryptDetection) {
    auto encrypted = validator_.validate(toBytes(
        "%PDF-1.7\n1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
        "trailer\n<< /Root 1 0 R /Encrypt 5 0 R >>\nstartxref\n0\n%%EOF\n"));
    EXPECT_TRUE(encrypted.isEncrypted);

    auto metadataOnly = validator_.validate(toBytes(
        "%PDF-1.7\n1 0 obj\n<< /Type /Catalog /Pages 2 0 R /EncryptMetadata false >>\nendobj\n"
        "startxref\n0\n%%EOF\n"));
    EXPECT_FALSE(metadataOnly.isEncrypted);
}

// ============================================================================
// Scan limits
// ============================================================================

TEST_F(StructureValidatorTest, ByteLimitTruncatesObjectScan) {
    TestPdf pdf;
    const std::string& text = pdf.text();
    size_t secondEndobj = text.find("endobj", text.find("endobj") + 6) + 6;

    ScanLimits limits;
    limits.maxScanBytes = secondEndobj;
    auto result = PdfStructureValidator(limits).validate(pdf.bytes());

    EXPECT_TRUE(result.objectsValid);
    EXPECT_EQ(result.objectCount, 2u);
    EXPECT_TRUE(contains(result.warnings, "Object scan limited to the first"));
}

TEST_F(StructureValidatorTest, ObjectLimitTruncatesObjectScan) {
    TestPdf pdf;
    ScanLimits limits;
    limits.maxObjectScan = 1;
    auto result = PdfStructureValidator(limits).validate(pdf.bytes());

    EXPECT_TRUE(result.objectsValid);
    EXPECT_EQ(result.objectCount, 1u);
    EXPECT_TRUE(contains(result.warnings, "Object scan stopped after 1 objects"));
}

TEST_F(StructureValidatorTest, ZeroLimitsRejected) {
    ScanLimits limits;
    limits.maxObjectScan = 0;
    EXPECT_THROW(PdfStructureValidator{limits}, std::invalid_argument);
}

TEST_F(StructureValidatorTest, ResultToJson) {
    TestPdf pdf;
    Json::Value json = validator_.validate(pdf.bytes()).toJson();
    EXPECT_TRUE(json["isValid"].asBool());
    EXPECT_EQ(json["pdfVersion"].asString(), "1.7");
    EXPECT_EQ(json["objectCount"].asUInt64(), 3u);
    EXPECT_TRUE(json["errors"].isArray());
}
