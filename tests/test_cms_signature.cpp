/**
 * @file test_cms_signature.cpp
 * @brief Unit tests for CMS SignedData parsing, signer verification and attribute embedding
 */

#include <gtest/gtest.h>
#include <pdftrust/cms/cms_signature.h>
#include <pdftrust/common/exceptions.h>
#include <pdftrust/validation/message_imprint.h>
#include "test_helpers.h"

using namespace pdftrust::cms;
using namespace test_helpers;
using pdftrust::common::ParsingException;
using pdftrust::validation::MessageImprintBuilder;

namespace {

constexpr const char* ID_DATA = "1.2.840.113549.1.7.1";

} // namespace

class CmsSignatureTest : public ::testing::Test {
protected:
    const TestPki& pki_ = TestPki::instance();
    std::vector<uint8_t> content_ = toBytes("%PDF-1.7 covered bytes");

    std::vector<uint8_t> sign(CmsMode mode = CmsMode::DETACHED,
                              std::vector<X509*> extra = {}) const {
        if (extra.empty()) extra.push_back(pki_.intermediate.get());
        return signCms(content_, pki_.signer.get(), pki_.signerKey.get(), extra, mode);
    }
};

// ============================================================================
// parseCmsSignature
// ============================================================================

TEST_F(CmsSignatureTest, ParsesDetachedSignature) {
    auto sig = parseCmsSignature(sign(), content_);

    EXPECT_EQ(sig.signerInfo.digestAlgorithm, pdftrust::validation::oid::SHA256);
    EXPECT_FALSE(sig.signerInfo.signatureAlgorithm.empty());
    EXPECT_FALSE(sig.signerInfo.signature.empty());
    EXPECT_TRUE(sig.signerInfo.hasSignedAttributes());
    ASSERT_TRUE(sig.signerInfo.messageDigest.has_value());
    EXPECT_EQ(*sig.signerInfo.messageDigest, MessageImprintBuilder::digest(content_, "SHA-256"));
    EXPECT_TRUE(sig.signerInfo.signingTime.has_value());
    EXPECT_TRUE(sig.signerInfo.unsignedAttributes.empty());

    EXPECT_TRUE(sig.isDetached());
    EXPECT_EQ(sig.encapsulatedContentType, ID_DATA);
    EXPECT_EQ(sig.content, content_);
    EXPECT_FALSE(sig.timestamp.has_value());

    ASSERT_NE(sig.signerCertificate(), nullptr);
    EXPECT_EQ(sig.signerCertificate()->commonName, "Test Signer");
}

TEST_F(CmsSignatureTest, SignedAttributesIncludeMessageDigest) {
    auto sig = parseCmsSignature(sign(), content_);
    bool found = false;
    for (const auto& attr : sig.signerInfo.signedAttributes) {
        found = found || attr.oid == MESSAGE_DIGEST_OID;
    }
    EXPECT_TRUE(found);
}

TEST_F(CmsSignatureTest, CertificatesOrderedSignerFirst) {
    auto der = sign(CmsMode::DETACHED, {pki_.root.get(), pki_.intermediate.get()});
    auto sig = parseCmsSignature(der, content_);

    ASSERT_EQ(sig.certificates.size(), 3u);
    EXPECT_TRUE(sig.signerCertificateFound);
    EXPECT_EQ(sig.certificates[0].commonName, "Test Signer");
    EXPECT_EQ(sig.certificates[1].commonName, "Test Issuing CA");
    EXPECT_EQ(sig.certificates[2].commonName, "Test Root CA");
}

TEST_F(CmsSignatureTest, TrailingPlaceholderPaddingIgnored) {
    auto der = sign();
    auto padded = der;
    padded.resize(der.size() + 256, 0x00);

    auto sig = parseCmsSignature(padded, content_);
    EXPECT_EQ(sig.raw, der);
}

TEST_F(CmsSignatureTest, EncapsulatedSha1Digest) {
    auto sig = parseCmsSignature(sign(CmsMode::SHA1_ENCAPSULATED), content_);
    EXPECT_FALSE(sig.isDetached());
    ASSERT_TRUE(sig.encapsulatedContent.has_value());
    EXPECT_EQ(*sig.encapsulatedContent, MessageImprintBuilder::digest(content_, "SHA-1"));
    EXPECT_TRUE(verifySignerSignature(sig).verified);
}

TEST_F(CmsSignatureTest, IndefiniteLengthEncodingAccepted) {
    auto ber = sign(CmsMode::DETACHED_STREAMED);
    ASSERT_GE(ber.size(), 2u);
    ASSERT_EQ(ber[1], 0x80);

    auto padded = ber;
    padded.resize(ber.size() + 512, 0x00);
    EXPECT_EQ(cmsEncodedLength(padded), ber.size());

    auto sig = parseCmsSignature(padded, content_);
    EXPECT_EQ(sig.raw, ber);
    ASSERT_TRUE(sig.signerInfo.messageDigest.has_value());
    EXPECT_EQ(*sig.signerInfo.messageDigest, MessageImprintBuilder::digest(content_, "SHA-256"));
    EXPECT_TRUE(verifySignerSignature(sig).verified);
}

TEST_F(CmsSignatureTest, EncodedLengthOfNonCmsIsZero) {
    EXPECT_EQ(cmsEncodedLength({}), 0u);
    EXPECT_EQ(cmsEncodedLength({0x30, 0x80, 0x00, 0x00, 0x00, 0x00}), 0u);
    EXPECT_EQ(cmsEncodedLength(toBytes("not a structure at all")), 0u);

    auto der = sign();
    auto padded = der;
    padded.resize(der.size() + 64, 0x00);
    EXPECT_EQ(cmsEncodedLength(padded), der.size());
}

TEST_F(CmsSignatureTest, MalformedInputRejected) {
    EXPECT_THROW(parseCmsSignature({}), ParsingException);
    EXPECT_THROW(parseCmsSignature(toBytes("definitely not DER")), ParsingException);
    EXPECT_THROW(parseCmsSignature({0x30, 0x03, 0x02, 0x01, 0x01}), ParsingException);
}

TEST_F(CmsSignatureTest, NonSignedDataRejected) {
    BIO* in = BIO_new_mem_buf("payload", 7);
    CMS_ContentInfo* data = CMS_data_create(in, CMS_BINARY);
    BIO_free(in);
    ASSERT_NE(data, nullptr);
    int len = i2d_CMS_ContentInfo(data, nullptr);
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* p = der.data();
    i2d_CMS_ContentInfo(data, &p);
    CMS_ContentInfo_free(data);

    try {
        parseCmsSignature(der);
        FAIL() << "expected ParsingException";
    } catch (const ParsingException& e) {
        EXPECT_NE(std::string(e.what()).find("not SignedData"), std::string::npos);
    }
}

// ============================================================================
// verifySignerSignature
// ============================================================================

TEST_F(CmsSignatureTest, VerifiesSignatureOverSignedAttributes) {
    auto result = verifySignerSignature(parseCmsSignature(sign(), content_));
    EXPECT_TRUE(result.verified) << result.error;
    EXPECT_TRUE(result.error.empty());
}

TEST_F(CmsSignatureTest, SignedAttributeSignatureIndependentOfContent) {
    // The content binding is the messageDigest attribute, checked by the caller
    auto result = verifySignerSignature(parseCmsSignature(sign(), toBytes("other bytes")));
    EXPECT_TRUE(result.verified);
}

TEST_F(CmsSignatureTest, VerifiesSignatureWithoutAttributes) {
    auto der = sign(CmsMode::DETACHED_NO_ATTRIBUTES);
    auto sig = parseCmsSignature(der, content_);
    EXPECT_FALSE(sig.signerInfo.hasSignedAttributes());
    EXPECT_FALSE(sig.signerInfo.messageDigest.has_value());
    EXPECT_TRUE(verifySignerSignature(sig).verified);

    auto tampered = parseCmsSignature(der, toBytes("%PDF-1.7 covered bytez"));
    auto result = verifySignerSignature(tampered);
    EXPECT_FALSE(result.verified);
    EXPECT_EQ(result.error.rfind("signature over content does not verify", 0), 0u);
}

TEST_F(CmsSignatureTest, CorruptRawReportsError) {
    auto sig = parseCmsSignature(sign(), content_);
    sig.raw = toBytes("junk");
    auto result = verifySignerSignature(sig);
    EXPECT_FALSE(result.verified);
    EXPECT_FALSE(result.error.empty());
}

// ============================================================================
// addUnsignedAttribute
// ============================================================================

TEST_F(CmsSignatureTest, AddUnsignedAttributeKeepsSignature) {
    auto der = sign();
    const std::vector<uint8_t> value = {0x30, 0x03, 0x02, 0x01, 0x2a};
    auto updated = addUnsignedAttribute(der, "1.3.6.1.4.1.99999.42", value);

    auto sig = parseCmsSignature(updated, content_);
    ASSERT_EQ(sig.signerInfo.unsignedAttributes.size(), 1u);
    EXPECT_EQ(sig.signerInfo.unsignedAttributes[0].oid, "1.3.6.1.4.1.99999.42");
    EXPECT_EQ(sig.signerInfo.unsignedAttributes[0].value, value);
    EXPECT_EQ(sig.signerInfo.signature, parseCmsSignature(der).signerInfo.signature);
    EXPECT_TRUE(verifySignerSignature(sig).verified);
}

TEST_F(CmsSignatureTest, AddUnsignedAttributeRejectsBadInput) {
    EXPECT_THROW(addUnsignedAttribute(sign(), "not an oid", {0x30, 0x00}), ParsingException);
    EXPECT_THROW(addUnsignedAttribute(toBytes("junk"), "1.2.3", {0x30, 0x00}), ParsingException);
}

// ============================================================================
// derEncodedLength
// ============================================================================

TEST(DerEncodedLengthTest, ShortAndLongForms) {
    const std::vector<uint8_t> shortForm = {0x30, 0x03, 0x01, 0x02, 0x03, 0x00, 0x00};
    EXPECT_EQ(derEncodedLength(shortForm.data(), shortForm.size()), 5u);

    std::vector<uint8_t> longForm(300, 0x00);
    longForm[0] = 0x30;
    longForm[1] = 0x82;
    longForm[2] = 0x01;
    longForm[3] = 0x00;
    EXPECT_EQ(derEncodedLength(longForm.data(), longForm.size()), 260u);
}

TEST(DerEncodedLengthTest, TruncatedOrIndefinite) {
    const std::vector<uint8_t> truncated = {0x30, 0x10, 0x01};
    EXPECT_EQ(derEncodedLength(truncated.data(), truncated.size()), 0u);

    const std::vector<uint8_t> indefinite = {0x30, 0x80, 0x00, 0x00};
    EXPECT_EQ(derEncodedLength(indefinite.data(), indefinite.size()), 0u);

    EXPECT_EQ(derEncodedLength(nullptr, 10), 0u);
}
