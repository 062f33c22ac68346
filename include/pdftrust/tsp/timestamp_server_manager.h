/**
 * @file timestamp_server_manager.h
 * @brief RFC 3161 timestamp acquisition, verification and CMS embedding
 *
 * Talks to TSAs through an ITsaTransport with per-server retry and ordered
 * failover, verifies tokens against the data they cover and records every
 * operation in an audit log.
 */

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include "audit_log.h"
#include "retry_policy.h"
#include "tsa_transport.h"
#include "types.h"
#include "pdftrust/cms/cms_signature.h"

namespace pdftrust::tsp {

class TimestampServerManager {
public:
    /**
     * @param transport HTTP transport (nullptr: libcurl)
     * @param auditLog Audit sink (nullptr: process-wide in-memory log)
     */
    explicit TimestampServerManager(std::shared_ptr<ITsaTransport> transport = nullptr,
                                    std::shared_ptr<ITimestampAuditLog> auditLog = nullptr);

    /// Replace the backoff sleeper (tests pass a recorder)
    void setSleeper(Sleeper sleeper);

    // --- Requests ---

    /// @throws std::invalid_argument on an unsupported hash algorithm
    TimestampRequest createTimestampRequest(const std::vector<uint8_t>& data,
                                            const TimestampRequestOptions& options = {}) const;

    /**
     * @brief Request a timestamp from one TSA, retrying up to config.retryAttempts times
     * @throws common::TsaResponseException when the last attempt was a TSA rejection
     * @throws common::TsaConnectionException for any other exhausted failure
     */
    TimestampResponse requestTimestamp(const TimestampRequest& request, const TSAConfig& config);

    std::future<TimestampResponse> requestTimestampAsync(TimestampRequest request, TSAConfig config);

    /**
     * @brief Try primary then fallbacks in order until one succeeds
     * @throws common::TsaConnectionException listing every attempted URL on total failure
     */
    TimestampResponse requestTimestampWithFailover(const TimestampRequest& request,
                                                   const TSAFailoverConfig& failover);

    std::future<TimestampResponse> requestTimestampWithFailoverAsync(TimestampRequest request,
                                                                     TSAFailoverConfig failover);

    // --- Verification ---

    TimestampVerificationResult verifyTimestampResponse(const TimestampResponse& response,
                                                        const std::vector<uint8_t>& originalData);

    /// Re-parse timestamp.raw and verify it against originalData
    TimestampVerificationResult verifyTimestamp(const Timestamp& timestamp,
                                                const std::vector<uint8_t>& originalData);

    // --- CMS integration ---

    /// First parsable timestamp token among the signer's unsigned attributes
    std::optional<Timestamp> extractTimestamp(const cms::CMSSignature& signature);

    /**
     * @brief Timestamp the signer's signature value and embed the token
     * @return Re-encoded signature with timestamp populated
     * @throws common::TimestampValidationException if already timestamped or the token fails verification
     * @throws common::TsaConnectionException, common::TsaResponseException from the request
     */
    cms::CMSSignature addTimestampToSignature(const cms::CMSSignature& signature, const TSAConfig& config);

    // --- Audit ---

    TimestampAuditEntry generateTimestampAuditTrail(TimestampOperation operation,
                                                    const Json::Value& result,
                                                    const std::string& tsaUrl = "",
                                                    bool success = true,
                                                    const std::string& error = "",
                                                    long long durationMs = 0);

    std::vector<TimestampAuditEntry> getAuditTrail() const;
    void clearAuditTrail();

    /// Materialize a token as a Timestamp value
    static Timestamp toTimestamp(const TimeStampToken& token, const std::string& tsaUrl);

private:
    /// Retry loop for one server; throws like requestTimestamp but records nothing
    TimestampResponse performWithRetry(const TimestampRequest& request, const TSAConfig& config);

    std::shared_ptr<ITsaTransport> transport_;
    std::shared_ptr<ITimestampAuditLog> auditLog_;
    Sleeper sleeper_;
};

} // namespace pdftrust::tsp
