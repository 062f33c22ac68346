/**
 * @file test_crl_checker.cpp
 * @brief Unit tests for CrlChecker and PemCrlProvider (RFC 5280 CRL checking)
 */

#include <gtest/gtest.h>
#include <pdftrust/validation/crl_checker.h>
#include <pdftrust/validation/cert_ops.h>
#include <pdftrust/common/exceptions.h>
#include "test_helpers.h"

using namespace pdftrust::validation;
using namespace test_helpers;

// ============================================================================
// Mock CRL Provider
// ============================================================================

class MockCrlProvider : public ICrlProvider {
public:
    X509_CRL* crl_ = nullptr;  // Non-owning, test fixture owns it
    std::string lastIssuerDn;

    X509_CRL* findCrlByIssuerDn(const std::string& issuerDn) override {
        lastIssuerDn = issuerDn;
        if (!crl_) return nullptr;
        return X509_CRL_dup(crl_);  // Return a copy (caller frees)
    }
};

// ============================================================================
// Test Fixture
// ============================================================================

class CrlCheckerTest : public ::testing::Test {
protected:
    UniqueKey caKey_;
    UniqueKey signerKey_;
    UniqueCert rootCa_;
    UniqueCert signer_;

    void SetUp() override {
        caKey_ = generateRsaKey(2048);
        signerKey_ = generateRsaKey(2048);
        rootCa_ = createRootCa(caKey_.get(), "CRL Test CA");
        signer_ = createSigner(signerKey_.get(), caKey_.get(), rootCa_.get(), "CRL Test Signer", 100);
    }
};

TEST_F(CrlCheckerTest, Constructor_NullProviderThrows) {
    EXPECT_THROW(CrlChecker(nullptr), std::invalid_argument);
}

// ============================================================================
// Not revoked
// ============================================================================

TEST_F(CrlCheckerTest, Good_EmptyCrl) {
    auto crl = createCrl(caKey_.get(), rootCa_.get(), {});
    MockCrlProvider provider;
    provider.crl_ = crl.get();

    CrlChecker checker(&provider);
    auto result = checker.check(signer_.get(), rootCa_.get());

    EXPECT_EQ(result.status, RevocationStatus::GOOD);
    EXPECT_FALSE(result.thisUpdate.empty());
    EXPECT_FALSE(result.nextUpdate.empty());
    EXPECT_EQ(provider.lastIssuerDn, getSubjectDn(rootCa_.get()));
}

TEST_F(CrlCheckerTest, Good_OtherSerialsRevoked) {
    auto crl = createCrl(caKey_.get(), rootCa_.get(), {7, 8, 9});
    MockCrlProvider provider;
    provider.crl_ = crl.get();

    CrlChecker checker(&provider);
    EXPECT_EQ(checker.check(signer_.get(), rootCa_.get()).status, RevocationStatus::GOOD);
}

// ============================================================================
// Revoked
// ============================================================================

TEST_F(CrlCheckerTest, Revoked_WithoutReason) {
    auto crl = createCrl(caKey_.get(), rootCa_.get(), {100});
    MockCrlProvider provider;
    provider.crl_ = crl.get();

    CrlChecker checker(&provider);
    auto result = checker.check(signer_.get(), rootCa_.get());

    EXPECT_EQ(result.status, RevocationStatus::REVOKED);
    EXPECT_TRUE(result.revocationReason.empty());
}

TEST_F(CrlCheckerTest, Revoked_KeyCompromiseReason) {
    auto crl = createCrl(caKey_.get(), rootCa_.get(), {100}, 30, false, 1);
    MockCrlProvider provider;
    provider.crl_ = crl.get();

    CrlChecker checker(&provider);
    auto result = checker.check(signer_.get(), rootCa_.get());

    EXPECT_EQ(result.status, RevocationStatus::REVOKED);
    EXPECT_EQ(result.revocationReason, "keyCompromise");
}

TEST_F(CrlCheckerTest, Revoked_SupersededReason) {
    auto crl = createCrl(caKey_.get(), rootCa_.get(), {100}, 30, false, 4);
    MockCrlProvider provider;
    provider.crl_ = crl.get();

    CrlChecker checker(&provider);
    EXPECT_EQ(checker.check(signer_.get(), rootCa_.get()).revocationReason, "superseded");
}

// ============================================================================
// CRL problems
// ============================================================================

TEST_F(CrlCheckerTest, Unavailable_NoCrl) {
    MockCrlProvider provider;
    CrlChecker checker(&provider);

    auto result = checker.check(signer_.get(), rootCa_.get());
    EXPECT_EQ(result.status, RevocationStatus::UNAVAILABLE);
    EXPECT_FALSE(result.message.empty());
}

TEST_F(CrlCheckerTest, Expired_NextUpdateInPast) {
    auto crl = createCrl(caKey_.get(), rootCa_.get(), {}, 30, true);
    MockCrlProvider provider;
    provider.crl_ = crl.get();

    CrlChecker checker(&provider);
    EXPECT_EQ(checker.check(signer_.get(), rootCa_.get()).status, RevocationStatus::EXPIRED);
}

TEST_F(CrlCheckerTest, Invalid_SignedByOtherKey) {
    auto otherKey = generateRsaKey(2048);
    auto crl = createCrl(otherKey.get(), rootCa_.get(), {100});
    MockCrlProvider provider;
    provider.crl_ = crl.get();

    CrlChecker checker(&provider);
    auto result = checker.check(signer_.get(), rootCa_.get());
    EXPECT_EQ(result.status, RevocationStatus::INVALID);
}

TEST_F(CrlCheckerTest, NotChecked_NullInput) {
    MockCrlProvider provider;
    CrlChecker checker(&provider);
    EXPECT_EQ(checker.check(nullptr, rootCa_.get()).status, RevocationStatus::NOT_CHECKED);
    EXPECT_EQ(checker.check(signer_.get(), nullptr).status, RevocationStatus::NOT_CHECKED);
}

// ============================================================================
// PemCrlProvider
// ============================================================================

TEST_F(CrlCheckerTest, PemProvider_FindsByIssuerDn) {
    auto crl = createCrl(caKey_.get(), rootCa_.get(), {100}, 30, false, 1);
    PemCrlProvider provider(crlToPem(crl.get()));
    EXPECT_EQ(provider.size(), 1u);

    X509_CRL* found = provider.findCrlByIssuerDn(getSubjectDn(rootCa_.get()));
    ASSERT_NE(found, nullptr);
    X509_CRL_free(found);

    EXPECT_EQ(provider.findCrlByIssuerDn("/C=DE/CN=Nobody"), nullptr);
}

TEST_F(CrlCheckerTest, PemProvider_LastMatchingEntryWins) {
    auto older = createCrl(caKey_.get(), rootCa_.get(), {});
    auto newer = createCrl(caKey_.get(), rootCa_.get(), {100});
    PemCrlProvider provider(crlToPem(older.get()) + crlToPem(newer.get()));
    EXPECT_EQ(provider.size(), 2u);

    CrlChecker checker(&provider);
    EXPECT_EQ(checker.check(signer_.get(), rootCa_.get()).status, RevocationStatus::REVOKED);
}

TEST_F(CrlCheckerTest, PemProvider_NoCrlThrows) {
    EXPECT_THROW(PemCrlProvider("not a crl"), pdftrust::common::CertificateException);
    EXPECT_THROW(PemCrlProvider(""), pdftrust::common::CertificateException);
}
