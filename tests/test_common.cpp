/**
 * @file test_common.cpp
 * @brief Unit tests for exceptions, encoding, UUID and time helpers
 */

#include <gtest/gtest.h>
#include <pdftrust/common/exceptions.h>
#include <pdftrust/common/logger.h>
#include <pdftrust/util/encoding_util.h>
#include <pdftrust/util/time_utils.h>
#include <pdftrust/util/uuid_util.h>

#include <set>

using namespace pdftrust;

// ============================================================================
// Exception hierarchy
// ============================================================================

TEST(ExceptionsTest, CategoriesDeriveFromBase) {
    EXPECT_THROW(throw common::StructuralException("x"), common::PdfTrustException);
    EXPECT_THROW(throw common::SignatureValidationException("x"), common::PdfTrustException);
    EXPECT_THROW(throw common::CertificateException("x"), common::PdfTrustException);
    EXPECT_THROW(throw common::TimestampValidationException("x"), common::PdfTrustException);
    EXPECT_THROW(throw common::ConfigException("x"), common::PdfTrustException);
    EXPECT_THROW(throw common::ParsingException("x"), common::PdfTrustException);
    EXPECT_THROW(throw common::TsaConnectionException("x", {}, {}), common::PdfTrustException);
    EXPECT_THROW(throw common::TsaResponseException("u", 2, "x"), std::runtime_error);
}

TEST(ExceptionsTest, MessagesCarryCategoryPrefix) {
    EXPECT_STREQ(common::CertificateException("bad").what(), "Certificate error: bad");
    EXPECT_STREQ(common::ParsingException("oops").what(), "Parsing error: oops");
    EXPECT_STREQ(common::ConfigException("LOG_LEVEL").what(), "Configuration error: LOG_LEVEL");
}

TEST(ExceptionsTest, TsaConnectionKeepsAttemptedUrls) {
    common::TsaConnectionException e("all failed", {"http://a", "http://b"}, {"http://a attempt 1: down"});
    ASSERT_EQ(e.attemptedUrls().size(), 2u);
    EXPECT_EQ(e.attemptedUrls()[1], "http://b");
    ASSERT_EQ(e.attemptHistory().size(), 1u);
    EXPECT_NE(std::string(e.what()).find("all failed"), std::string::npos);
}

TEST(ExceptionsTest, TsaResponseKeepsStatus) {
    common::TsaResponseException e("http://tsa", 2, "REJECTION (badAlg)");
    EXPECT_EQ(e.url(), "http://tsa");
    EXPECT_EQ(e.pkiStatus(), 2);
    EXPECT_NE(std::string(e.what()).find("http://tsa"), std::string::npos);
}

// ============================================================================
// Hex / Base64
// ============================================================================

TEST(EncodingTest, HexRoundTripIsLowercase) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(util::toHex(data), "000fabff");
    EXPECT_EQ(util::fromHex("000FABff"), data);
}

TEST(EncodingTest, FromHexSkipsWhitespaceAndPadsOddLength) {
    EXPECT_EQ(util::fromHex("0A 0B\n0C"), (std::vector<uint8_t>{0x0a, 0x0b, 0x0c}));
    // PDF hex strings: a missing final digit is zero
    EXPECT_EQ(util::fromHex("ABC"), (std::vector<uint8_t>{0xab, 0xc0}));
}

TEST(EncodingTest, FromHexRejectsNonHex) {
    EXPECT_THROW(util::fromHex("zz"), std::invalid_argument);
}

TEST(EncodingTest, Base64RoundTrip) {
    std::vector<uint8_t> data = {'p', 'd', 'f', 0x00, 0xff};
    std::string encoded = util::base64Encode(data);
    EXPECT_FALSE(encoded.empty());
    EXPECT_EQ(util::base64Decode(encoded), data);
    EXPECT_EQ(util::base64Encode({}), "");
}

// ============================================================================
// UUID
// ============================================================================

TEST(UuidTest, GeneratesDistinctVersion4Ids) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; i++) {
        std::string id = util::UuidUtil::generate();
        EXPECT_TRUE(util::UuidUtil::isValid(id));
        EXPECT_EQ(id[14], '4');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST(UuidTest, RejectsMalformed) {
    EXPECT_FALSE(util::UuidUtil::isValid(""));
    EXPECT_FALSE(util::UuidUtil::isValid("not-a-uuid"));
    EXPECT_FALSE(util::UuidUtil::isValid("123e4567e89b12d3a456426614174000xxxx"));
}

// ============================================================================
// Time
// ============================================================================

TEST(TimeUtilsTest, ParsePdfDateUtc) {
    auto tp = util::parsePdfDate("D:20240315103000Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(util::formatIso8601(*tp), "2024-03-15T10:30:00Z");
}

TEST(TimeUtilsTest, ParsePdfDateWithOffset) {
    auto tp = util::parsePdfDate("D:20240315103000+02'00'");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(util::formatIso8601(*tp), "2024-03-15T08:30:00Z");
}

TEST(TimeUtilsTest, ParsePdfDateDefaultsMissingFields) {
    auto tp = util::parsePdfDate("D:2024");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(util::formatIso8601(*tp), "2024-01-01T00:00:00Z");
}

TEST(TimeUtilsTest, ParsePdfDateRejectsGarbage) {
    EXPECT_FALSE(util::parsePdfDate("D:20").has_value());
    EXPECT_FALSE(util::parsePdfDate("D:20241399000000Z").has_value());
}

TEST(TimeUtilsTest, FormatWithMilliseconds) {
    auto tp = std::chrono::system_clock::from_time_t(0) + std::chrono::milliseconds(42);
    EXPECT_EQ(util::formatIso8601(tp, true), "1970-01-01T00:00:00.042Z");
}

TEST(TimeUtilsTest, Asn1TimeConversion) {
    ASN1_TIME* t = ASN1_TIME_new();
    ASN1_TIME_set_string(t, "20300101000000Z");
    EXPECT_EQ(util::asn1TimeToIso8601(t), "2030-01-01T00:00:00Z");
    ASN1_TIME_free(t);
    EXPECT_FALSE(util::asn1TimeToTimePoint(nullptr).has_value());
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, ParseLevelMapsNames) {
    EXPECT_EQ(common::Logger::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(common::Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(common::Logger::parseLevel("bogus"), spdlog::level::info);
}

TEST(LoggerTest, InitializeInstallsNamedDefaultLogger) {
    common::Logger::initialize("pdftrust-test", "warn");
    EXPECT_EQ(spdlog::default_logger()->name(), "pdftrust-test");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
}
