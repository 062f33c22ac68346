/**
 * @file test_timestamp_server_manager.cpp
 * @brief Unit tests for TimestampServerManager: retry, failover, verification, CMS embedding, audit
 *
 * All TSA traffic goes through FakeTsaTransport; backoff sleeps are recorded, not slept.
 */

#include <gtest/gtest.h>
#include <pdftrust/tsp/timestamp_server_manager.h>
#include <pdftrust/tsp/rfc3161_codec.h>
#include <pdftrust/tsp/curl_tsa_transport.h>
#include <pdftrust/common/exceptions.h>
#include <pdftrust/util/uuid_util.h>
#include "test_helpers.h"

using namespace pdftrust::tsp;
using namespace test_helpers;
using pdftrust::common::TsaConnectionException;
using pdftrust::common::TsaResponseException;
using pdftrust::common::TimestampValidationException;
using Outcome = FakeTsaTransport::Outcome;

namespace {

const std::string PRIMARY = "http://tsa-primary.test/tsr";
const std::string FALLBACK = "http://tsa-fallback.test/tsr";

TSAConfig tsaConfig(const std::string& url, int retryAttempts = 3) {
    TSAConfig config;
    config.url = url;
    config.retryAttempts = retryAttempts;
    return config;
}

size_t countOperation(const std::vector<TimestampAuditEntry>& entries, TimestampOperation op) {
    size_t n = 0;
    for (const auto& e : entries) {
        if (e.operation == op) n++;
    }
    return n;
}

} // namespace

class TimestampServerManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTsaTransport> transport_ = std::make_shared<FakeTsaTransport>();
    std::shared_ptr<InMemoryTimestampAuditLog> audit_ = std::make_shared<InMemoryTimestampAuditLog>();
    std::unique_ptr<TimestampServerManager> manager_;
    std::vector<std::chrono::milliseconds> sleeps_;
    std::vector<uint8_t> data_ = toBytes("%PDF-1.7 signed byte range");

    void SetUp() override {
        manager_ = std::make_unique<TimestampServerManager>(transport_, audit_);
        manager_->setSleeper([this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
    }

    TimestampRequest request() const {
        return manager_->createTimestampRequest(data_);
    }
};

// ============================================================================
// createTimestampRequest
// ============================================================================

TEST_F(TimestampServerManagerTest, CreateRequest_Defaults) {
    auto req = request();
    EXPECT_EQ(req.messageImprint.hashAlgorithm, pdftrust::validation::oid::SHA256);
    EXPECT_EQ(req.messageImprint.hashedMessage,
              pdftrust::validation::MessageImprintBuilder::digest(data_, "SHA-256"));
    ASSERT_TRUE(req.nonce.has_value());
    EXPECT_EQ(req.nonce->size(), 16u);
    EXPECT_TRUE(req.certReq);
    EXPECT_TRUE(req.reqPolicy.empty());
}

TEST_F(TimestampServerManagerTest, CreateRequest_Options) {
    TimestampRequestOptions options;
    options.hashAlgorithm = "sha384";
    options.includeNonce = false;
    options.requestCertificate = false;
    options.policy = FakeTsa::POLICY_OID;

    auto req = manager_->createTimestampRequest(data_, options);
    EXPECT_EQ(req.messageImprint.hashAlgorithm, pdftrust::validation::oid::SHA384);
    EXPECT_FALSE(req.nonce.has_value());
    EXPECT_FALSE(req.certReq);
    EXPECT_EQ(req.reqPolicy, FakeTsa::POLICY_OID);
}

TEST_F(TimestampServerManagerTest, CreateRequest_UnsupportedAlgorithmThrows) {
    TimestampRequestOptions options;
    options.hashAlgorithm = "MD5";
    EXPECT_THROW(manager_->createTimestampRequest(data_, options), std::invalid_argument);
}

// ============================================================================
// requestTimestamp: retry
// ============================================================================

TEST_F(TimestampServerManagerTest, Request_GrantedFirstAttempt) {
    auto response = manager_->requestTimestamp(request(), tsaConfig(PRIMARY));

    EXPECT_TRUE(response.status.isGranted());
    ASSERT_TRUE(response.token.has_value());
    EXPECT_EQ(response.tsaUrl, PRIMARY);
    EXPECT_EQ(transport_->calls().size(), 1u);
    EXPECT_TRUE(sleeps_.empty());

    auto trail = manager_->getAuditTrail();
    ASSERT_EQ(trail.size(), 1u);
    EXPECT_EQ(trail[0].operation, TimestampOperation::REQUEST);
    EXPECT_TRUE(trail[0].success);
    EXPECT_EQ(trail[0].tsaUrl, PRIMARY);
    EXPECT_EQ(trail[0].result["status"].asString(), "GRANTED");
}

TEST_F(TimestampServerManagerTest, Request_RetriesWithBackoff) {
    transport_->script(PRIMARY, {Outcome::NETWORK_ERROR, Outcome::HTTP_503, Outcome::GRANT});

    auto response = manager_->requestTimestamp(request(), tsaConfig(PRIMARY, 3));
    EXPECT_TRUE(response.token.has_value());
    EXPECT_EQ(transport_->calls().size(), 3u);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(1000));
    EXPECT_EQ(sleeps_[1], std::chrono::milliseconds(2000));
}

TEST_F(TimestampServerManagerTest, Request_ExhaustedThrowsConnectionError) {
    transport_->setDefault(PRIMARY, Outcome::NETWORK_ERROR);

    try {
        manager_->requestTimestamp(request(), tsaConfig(PRIMARY, 3));
        FAIL() << "expected TsaConnectionException";
    } catch (const TsaConnectionException& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("failed after 3 attempt(s)"), std::string::npos) << msg;
        EXPECT_NE(msg.find("Couldn't connect to server"), std::string::npos) << msg;
        ASSERT_EQ(e.attemptedUrls().size(), 1u);
        EXPECT_EQ(e.attemptedUrls()[0], PRIMARY);
        EXPECT_EQ(e.attemptHistory().size(), 3u);
    }
    EXPECT_EQ(transport_->calls().size(), 3u);
    EXPECT_EQ(sleeps_.size(), 2u);

    auto trail = manager_->getAuditTrail();
    ASSERT_EQ(trail.size(), 1u);
    EXPECT_FALSE(trail[0].success);
    EXPECT_FALSE(trail[0].error.empty());
}

TEST_F(TimestampServerManagerTest, Request_BackoffCapsAtTenSeconds) {
    transport_->setDefault(PRIMARY, Outcome::HTTP_503);
    EXPECT_THROW(manager_->requestTimestamp(request(), tsaConfig(PRIMARY, 7)), TsaConnectionException);

    ASSERT_EQ(sleeps_.size(), 6u);
    EXPECT_EQ(sleeps_[3], std::chrono::milliseconds(8000));
    EXPECT_EQ(sleeps_[4], std::chrono::milliseconds(10000));
    EXPECT_EQ(sleeps_[5], std::chrono::milliseconds(10000));
}

TEST_F(TimestampServerManagerTest, Request_RejectionThrowsResponseError) {
    transport_->setDefault(PRIMARY, Outcome::REJECT);

    try {
        manager_->requestTimestamp(request(), tsaConfig(PRIMARY, 2));
        FAIL() << "expected TsaResponseException";
    } catch (const TsaResponseException& e) {
        EXPECT_EQ(e.pkiStatus(), 2);
        EXPECT_EQ(e.url(), PRIMARY);
        EXPECT_NE(std::string(e.what()).find("TSA rejected request: REJECTION (badAlg)"), std::string::npos);
        EXPECT_EQ(e.attemptHistory().size(), 2u);
    }
}

TEST_F(TimestampServerManagerTest, Request_InvalidResponsesAreFailures) {
    struct Case { Outcome outcome; std::string expected; };
    std::vector<Case> cases = {
        {Outcome::NO_TOKEN, "granted response carries no TimeStampToken"},
        {Outcome::WRONG_NONCE, "nonce in TSA response does not match request"},
        {Outcome::WRONG_IMPRINT, "message imprint in TSA response does not match request"},
        {Outcome::GARBAGE, "malformed TimeStampResp"},
        {Outcome::HTTP_503, "HTTP 503"},
    };

    for (const auto& c : cases) {
        transport_->script(PRIMARY, {c.outcome});
        try {
            manager_->requestTimestamp(request(), tsaConfig(PRIMARY, 1));
            ADD_FAILURE() << "expected failure for " << c.expected;
        } catch (const TsaConnectionException& e) {
            EXPECT_NE(std::string(e.what()).find(c.expected), std::string::npos) << e.what();
        }
    }
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(TimestampServerManagerTest, Request_RecoversAfterBadNonce) {
    transport_->script(PRIMARY, {Outcome::WRONG_NONCE, Outcome::GRANT});
    auto response = manager_->requestTimestamp(request(), tsaConfig(PRIMARY, 2));
    EXPECT_TRUE(response.token.has_value());
}

TEST_F(TimestampServerManagerTest, Request_InvalidConfigThrows) {
    EXPECT_THROW(manager_->requestTimestamp(request(), tsaConfig("", 3)), std::invalid_argument);
    EXPECT_THROW(manager_->requestTimestamp(request(), tsaConfig(PRIMARY, 0)), std::invalid_argument);
    EXPECT_TRUE(transport_->calls().empty());
}

TEST_F(TimestampServerManagerTest, Request_Async) {
    auto future = manager_->requestTimestampAsync(request(), tsaConfig(PRIMARY));
    auto response = future.get();
    EXPECT_TRUE(response.token.has_value());
}

// ============================================================================
// requestTimestampWithFailover
// ============================================================================

TEST_F(TimestampServerManagerTest, Failover_FallbackSucceeds) {
    transport_->setDefault(PRIMARY, Outcome::NETWORK_ERROR);

    TSAFailoverConfig failover;
    failover.primary = tsaConfig(PRIMARY, 2);
    failover.fallbacks = {tsaConfig(FALLBACK, 2)};

    auto response = manager_->requestTimestampWithFailover(request(), failover);
    EXPECT_EQ(response.tsaUrl, FALLBACK);

    auto calls = transport_->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0], PRIMARY);
    EXPECT_EQ(calls[1], PRIMARY);
    EXPECT_EQ(calls[2], FALLBACK);

    auto trail = manager_->getAuditTrail();
    ASSERT_EQ(trail.size(), 2u);
    EXPECT_EQ(trail[0].tsaUrl, PRIMARY);
    EXPECT_FALSE(trail[0].success);
    EXPECT_EQ(trail[1].tsaUrl, FALLBACK);
    EXPECT_TRUE(trail[1].success);
}

TEST_F(TimestampServerManagerTest, Failover_RejectionMovesToNextServer) {
    transport_->setDefault(PRIMARY, Outcome::REJECT);

    TSAFailoverConfig failover;
    failover.primary = tsaConfig(PRIMARY, 1);
    failover.fallbacks = {tsaConfig(FALLBACK, 1)};

    auto response = manager_->requestTimestampWithFailover(request(), failover);
    EXPECT_EQ(response.tsaUrl, FALLBACK);
}

TEST_F(TimestampServerManagerTest, Failover_AllServersFail) {
    transport_->setDefault(PRIMARY, Outcome::NETWORK_ERROR);
    transport_->setDefault(FALLBACK, Outcome::HTTP_503);

    TSAFailoverConfig failover;
    failover.primary = tsaConfig(PRIMARY, 2);
    failover.fallbacks = {tsaConfig(FALLBACK, 2)};

    try {
        manager_->requestTimestampWithFailover(request(), failover);
        FAIL() << "expected TsaConnectionException";
    } catch (const TsaConnectionException& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("all 2 TSA server(s) failed"), std::string::npos) << msg;
        EXPECT_NE(msg.find("(tried: " + PRIMARY + ", " + FALLBACK + ")"), std::string::npos) << msg;
        EXPECT_NE(msg.find("HTTP 503"), std::string::npos) << msg;
        ASSERT_EQ(e.attemptedUrls().size(), 2u);
        EXPECT_EQ(e.attemptedUrls()[0], PRIMARY);
        EXPECT_EQ(e.attemptedUrls()[1], FALLBACK);
        EXPECT_EQ(e.attemptHistory().size(), 4u);
    }
    EXPECT_EQ(countOperation(manager_->getAuditTrail(), TimestampOperation::REQUEST), 2u);
}

TEST_F(TimestampServerManagerTest, Failover_MaxAttemptsLimitsServers) {
    transport_->setDefault(PRIMARY, Outcome::NETWORK_ERROR);

    TSAFailoverConfig failover;
    failover.primary = tsaConfig(PRIMARY, 1);
    failover.fallbacks = {tsaConfig(FALLBACK, 1)};
    failover.maxFailoverAttempts = 1;

    EXPECT_THROW(manager_->requestTimestampWithFailover(request(), failover), TsaConnectionException);
    for (const auto& url : transport_->calls()) {
        EXPECT_EQ(url, PRIMARY);
    }
}

TEST_F(TimestampServerManagerTest, Failover_ZeroMaxAttemptsRejected) {
    TSAFailoverConfig failover;
    failover.primary = tsaConfig(PRIMARY);
    failover.maxFailoverAttempts = 0;
    EXPECT_THROW(manager_->requestTimestampWithFailover(request(), failover), std::invalid_argument);
}

TEST_F(TimestampServerManagerTest, Failover_Async) {
    transport_->setDefault(PRIMARY, Outcome::NETWORK_ERROR);
    TSAFailoverConfig failover;
    failover.primary = tsaConfig(PRIMARY, 1);
    failover.fallbacks = {tsaConfig(FALLBACK, 1)};

    auto response = manager_->requestTimestampWithFailoverAsync(request(), failover).get();
    EXPECT_EQ(response.tsaUrl, FALLBACK);
}

// ============================================================================
// Verification
// ============================================================================

TEST_F(TimestampServerManagerTest, Verify_ValidResponse) {
    auto response = manager_->requestTimestamp(request(), tsaConfig(PRIMARY));
    auto result = manager_->verifyTimestampResponse(response, data_);

    EXPECT_TRUE(result.isValid) << (result.errors.empty() ? "" : result.errors.front());
    EXPECT_TRUE(result.imprintMatches);
    EXPECT_TRUE(result.signatureVerified);
    EXPECT_TRUE(result.warnings.empty());
    ASSERT_TRUE(result.tsaCertificate.has_value());
    EXPECT_EQ(result.tsaCertificate->commonName, "Test TSA");
    EXPECT_EQ(result.policy, FakeTsa::POLICY_OID);
    EXPECT_TRUE(result.genTime.has_value());
    EXPECT_EQ(result.tsaUrl, PRIMARY);

    auto trail = manager_->getAuditTrail();
    ASSERT_EQ(trail.size(), 2u);
    EXPECT_EQ(trail[1].operation, TimestampOperation::VERIFY);
    EXPECT_TRUE(trail[1].success);
}

TEST_F(TimestampServerManagerTest, Verify_DifferentDataFails) {
    auto response = manager_->requestTimestamp(request(), tsaConfig(PRIMARY));
    auto result = manager_->verifyTimestampResponse(response, toBytes("tampered"));

    EXPECT_FALSE(result.isValid);
    EXPECT_FALSE(result.imprintMatches);
    EXPECT_TRUE(result.signatureVerified);
    ASSERT_FALSE(result.errors.empty());
    EXPECT_EQ(result.errors[0],
              "Message imprint does not match original data (document does not match timestamp)");
    EXPECT_FALSE(manager_->getAuditTrail().back().success);
}

TEST_F(TimestampServerManagerTest, Verify_NotGranted) {
    TimestampResponse response = decodeTimestampResponse(FakeTsa::statusOnlyResponse(TS_STATUS_REJECTION));
    auto result = manager_->verifyTimestampResponse(response, data_);
    EXPECT_FALSE(result.isValid);
    EXPECT_NE(result.errors[0].find("not granted"), std::string::npos);
}

TEST_F(TimestampServerManagerTest, Verify_WithoutCertificateWarns) {
    TimestampRequestOptions options;
    options.requestCertificate = false;
    auto req = manager_->createTimestampRequest(data_, options);

    auto response = manager_->requestTimestamp(req, tsaConfig(PRIMARY));
    auto result = manager_->verifyTimestampResponse(response, data_);

    EXPECT_TRUE(result.imprintMatches);
    EXPECT_FALSE(result.signatureVerified);
    EXPECT_FALSE(result.tsaCertificate.has_value());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0], "No TSA certificate included in response");
}

TEST_F(TimestampServerManagerTest, VerifyTimestamp_FromMaterializedValue) {
    auto response = manager_->requestTimestamp(request(), tsaConfig(PRIMARY));
    Timestamp ts = TimestampServerManager::toTimestamp(*response.token, PRIMARY);

    EXPECT_EQ(ts.tsaUrl, PRIMARY);
    EXPECT_EQ(ts.serialNumber, response.token->tstInfo.serialNumber);
    ASSERT_TRUE(ts.certificate.has_value());
    EXPECT_FALSE(ts.raw.empty());

    auto result = manager_->verifyTimestamp(ts, data_);
    EXPECT_TRUE(result.isValid);

    Json::Value json = ts.toJson();
    EXPECT_EQ(json["tsaUrl"].asString(), PRIMARY);
    EXPECT_FALSE(json["token"].asString().empty());
}

TEST_F(TimestampServerManagerTest, VerifyTimestamp_UnparsableToken) {
    Timestamp ts;
    ts.raw = toBytes("not a token");
    auto result = manager_->verifyTimestamp(ts, data_);

    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].rfind("Timestamp token cannot be parsed: ", 0), 0u);
    EXPECT_EQ(manager_->getAuditTrail().back().operation, TimestampOperation::VERIFY);
}

// ============================================================================
// CMS integration
// ============================================================================

TEST_F(TimestampServerManagerTest, ExtractTimestamp_FromUnsignedAttribute) {
    const auto& pki = TestPki::instance();
    auto cmsDer = signCms(data_, pki.signer.get(), pki.signerKey.get());
    auto stamped = addSignatureTimestamp(cmsDer, FakeTsa::fromTestPki());

    auto sig = pdftrust::cms::parseCmsSignature(stamped, data_);
    auto ts = manager_->extractTimestamp(sig);
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->messageImprint,
              pdftrust::validation::MessageImprintBuilder::build(sig.signerInfo.signature, "SHA-256"));
    EXPECT_EQ(manager_->getAuditTrail().back().operation, TimestampOperation::EXTRACT);
}

TEST_F(TimestampServerManagerTest, ExtractTimestamp_LegacyAttributeOid) {
    const auto& pki = TestPki::instance();
    auto cmsDer = signCms(data_, pki.signer.get(), pki.signerKey.get());
    auto stamped = addSignatureTimestamp(cmsDer, FakeTsa::fromTestPki(), LEGACY_TIMESTAMP_ATTRIBUTE_OID);

    auto ts = manager_->extractTimestamp(pdftrust::cms::parseCmsSignature(stamped, data_));
    EXPECT_TRUE(ts.has_value());
}

TEST_F(TimestampServerManagerTest, ExtractTimestamp_NoneOrUnparsable) {
    const auto& pki = TestPki::instance();
    auto cmsDer = signCms(data_, pki.signer.get(), pki.signerKey.get());
    EXPECT_FALSE(manager_->extractTimestamp(pdftrust::cms::parseCmsSignature(cmsDer, data_)).has_value());

    const std::vector<uint8_t> bogus = {0x30, 0x03, 0x02, 0x01, 0x05};
    auto withBogus = pdftrust::cms::addUnsignedAttribute(cmsDer, TIMESTAMP_TOKEN_ATTRIBUTE_OID, bogus);
    EXPECT_FALSE(manager_->extractTimestamp(pdftrust::cms::parseCmsSignature(withBogus, data_)).has_value());
}

TEST_F(TimestampServerManagerTest, AddTimestampToSignature) {
    const auto& pki = TestPki::instance();
    auto cmsDer = signCms(data_, pki.signer.get(), pki.signerKey.get(), {pki.intermediate.get()});
    auto sig = pdftrust::cms::parseCmsSignature(cmsDer, data_);

    auto stamped = manager_->addTimestampToSignature(sig, tsaConfig(PRIMARY));

    ASSERT_TRUE(stamped.timestamp.has_value());
    EXPECT_EQ(stamped.timestamp->tsaUrl, PRIMARY);
    EXPECT_EQ(stamped.signerInfo.signature, sig.signerInfo.signature);
    EXPECT_EQ(stamped.content, data_);
    EXPECT_TRUE(pdftrust::cms::verifySignerSignature(stamped).verified);

    bool found = false;
    for (const auto& attr : stamped.signerInfo.unsignedAttributes) {
        found = found || attr.oid == TIMESTAMP_TOKEN_ATTRIBUTE_OID;
    }
    EXPECT_TRUE(found);

    // Round trip through extraction
    auto extracted = manager_->extractTimestamp(pdftrust::cms::parseCmsSignature(stamped.raw, data_));
    ASSERT_TRUE(extracted.has_value());
    EXPECT_EQ(extracted->serialNumber, stamped.timestamp->serialNumber);

    auto trail = manager_->getAuditTrail();
    EXPECT_EQ(countOperation(trail, TimestampOperation::REQUEST), 1u);
    EXPECT_EQ(countOperation(trail, TimestampOperation::VERIFY), 1u);
    EXPECT_EQ(countOperation(trail, TimestampOperation::ADD_TO_SIGNATURE), 1u);
}

TEST_F(TimestampServerManagerTest, AddTimestampToSignature_AlreadyStampedThrows) {
    const auto& pki = TestPki::instance();
    auto cmsDer = signCms(data_, pki.signer.get(), pki.signerKey.get());
    auto stamped = addSignatureTimestamp(cmsDer, FakeTsa::fromTestPki());
    auto sig = pdftrust::cms::parseCmsSignature(stamped, data_);

    EXPECT_THROW(manager_->addTimestampToSignature(sig, tsaConfig(PRIMARY)), TimestampValidationException);
    EXPECT_TRUE(transport_->calls().empty());
}

TEST_F(TimestampServerManagerTest, AddTimestampToSignature_TsaFailurePropagates) {
    transport_->setDefault(PRIMARY, Outcome::NETWORK_ERROR);
    const auto& pki = TestPki::instance();
    auto sig = pdftrust::cms::parseCmsSignature(signCms(data_, pki.signer.get(), pki.signerKey.get()), data_);

    EXPECT_THROW(manager_->addTimestampToSignature(sig, tsaConfig(PRIMARY, 2)), TsaConnectionException);
}

// ============================================================================
// Audit
// ============================================================================

TEST_F(TimestampServerManagerTest, Audit_GenerateEntry) {
    Json::Value result;
    result["note"] = "manual";
    auto entry = manager_->generateTimestampAuditTrail(TimestampOperation::VERIFY, result, PRIMARY,
                                                       false, "bad token", 7);
    EXPECT_TRUE(pdftrust::util::UuidUtil::isValid(entry.id));
    EXPECT_EQ(entry.durationMs, 7);
    EXPECT_EQ(audit_->size(), 1u);

    manager_->clearAuditTrail();
    EXPECT_TRUE(manager_->getAuditTrail().empty());
}

TEST_F(TimestampServerManagerTest, Audit_EntriesHaveDistinctIds) {
    manager_->requestTimestamp(request(), tsaConfig(PRIMARY));
    manager_->requestTimestamp(request(), tsaConfig(PRIMARY));
    auto trail = manager_->getAuditTrail();
    ASSERT_EQ(trail.size(), 2u);
    EXPECT_NE(trail[0].id, trail[1].id);
}

TEST_F(TimestampServerManagerTest, EmptySleeperRejected) {
    EXPECT_THROW(manager_->setSleeper(Sleeper()), std::invalid_argument);
}

TEST_F(TimestampServerManagerTest, CurlTransport_AcceptsAny2xxStatus) {
    EXPECT_TRUE(CurlTsaTransport::isSuccessStatus(200));
    EXPECT_TRUE(CurlTsaTransport::isSuccessStatus(201));
    EXPECT_TRUE(CurlTsaTransport::isSuccessStatus(299));
    EXPECT_FALSE(CurlTsaTransport::isSuccessStatus(199));
    EXPECT_FALSE(CurlTsaTransport::isSuccessStatus(300));
    EXPECT_FALSE(CurlTsaTransport::isSuccessStatus(503));
}
