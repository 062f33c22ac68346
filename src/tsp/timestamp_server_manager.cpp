/**
 * @file timestamp_server_manager.cpp
 * @brief TimestampServerManager implementation
 */

#include "pdftrust/tsp/timestamp_server_manager.h"
#include "pdftrust/tsp/curl_tsa_transport.h"
#include "pdftrust/tsp/rfc3161_codec.h"
#include "pdftrust/common/exceptions.h"
#include "pdftrust/validation/cert_ops.h"
#include "pdftrust/validation/extension_validator.h"
#include "pdftrust/util/encoding_util.h"
#include "pdftrust/util/time_utils.h"
#include "pdftrust/util/uuid_util.h"

#include <stdexcept>
#include <thread>
#include <openssl/cms.h>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

namespace pdftrust::tsp {

using validation::MessageImprintBuilder;

namespace {

struct CmsDeleter { void operator()(CMS_ContentInfo* p) const { CMS_ContentInfo_free(p); } };

bool isTimestampAttribute(const std::string& oid) {
    return oid == TIMESTAMP_TOKEN_ATTRIBUTE_OID ||
           oid == LEGACY_TIMESTAMP_ATTRIBUTE_OID ||
           oid == TSTINFO_CONTENT_TYPE_OID;
}

/// Verify the token's SignedData with its embedded signer certificate
bool verifyTokenSignature(const std::vector<uint8_t>& der, std::string& error) {
    const unsigned char* p = der.data();
    std::unique_ptr<CMS_ContentInfo, CmsDeleter> cms(
        d2i_CMS_ContentInfo(nullptr, &p, static_cast<long>(der.size())));
    if (!cms) {
        error = "token is not a CMS structure: " + validation::drainOpenSslErrors();
        return false;
    }
    // Trust in the TSA certificate is a separate concern; only the signature is checked here
    int rc = CMS_verify(cms.get(), nullptr, nullptr, nullptr, nullptr,
                        CMS_NO_SIGNER_CERT_VERIFY | CMS_BINARY);
    if (rc != 1) {
        error = validation::drainOpenSslErrors();
        return false;
    }
    return true;
}

Json::Value responseSummary(const TimestampResponse& response) {
    Json::Value json;
    json["status"] = pkiStatusToString(response.status.status);
    if (response.token) {
        json["genTime"] = util::formatIso8601(response.token->tstInfo.genTime, true);
        json["serialNumber"] = response.token->tstInfo.serialNumber;
        json["policy"] = response.token->tstInfo.policy;
    }
    return json;
}

} // namespace

TimestampServerManager::TimestampServerManager(std::shared_ptr<ITsaTransport> transport,
                                               std::shared_ptr<ITimestampAuditLog> auditLog)
    : transport_(transport ? std::move(transport)
                           : std::shared_ptr<ITsaTransport>(std::make_shared<CurlTsaTransport>())),
      auditLog_(auditLog ? std::move(auditLog)
                         : std::shared_ptr<ITimestampAuditLog>(InMemoryTimestampAuditLog::processWide())),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

void TimestampServerManager::setSleeper(Sleeper sleeper) {
    if (!sleeper) {
        throw std::invalid_argument("TimestampServerManager: sleeper cannot be empty");
    }
    sleeper_ = std::move(sleeper);
}

// =============================================================================
// Requests
// =============================================================================

TimestampRequest TimestampServerManager::createTimestampRequest(
    const std::vector<uint8_t>& data, const TimestampRequestOptions& options) const {
    TimestampRequest request;
    request.messageImprint = MessageImprintBuilder::build(data, options.hashAlgorithm);
    request.reqPolicy = options.policy;
    if (options.includeNonce) {
        request.nonce = generateNonce(options.nonceLength);
    }
    request.certReq = options.requestCertificate;
    return request;
}

TimestampResponse TimestampServerManager::performWithRetry(const TimestampRequest& request,
                                                           const TSAConfig& config) {
    if (config.url.empty()) {
        throw std::invalid_argument("TimestampServerManager: TSA url cannot be empty");
    }
    if (config.retryAttempts < 1) {
        throw std::invalid_argument("TimestampServerManager: retryAttempts must be at least 1");
    }

    std::vector<uint8_t> requestDer = encodeTimestampRequest(request);
    RetryStateMachine machine(config.retryAttempts);
    std::vector<std::string> history;
    std::string lastError;
    std::optional<int> lastRejection;

    while (!machine.isTerminal()) {
        if (machine.state() == RetryState::BACKOFF) {
            auto delay = machine.pendingDelay();
            spdlog::debug("[TimestampServerManager] Backing off {} ms before retrying {}",
                          delay.count(), config.url);
            sleeper_(delay);
            machine.backoffComplete();
            continue;
        }

        int attempt = machine.attempt();
        std::string failure;
        std::optional<int> rejection;

        TransportResult transport = transport_->post(config, requestDer);
        if (!transport.success) {
            failure = transport.error.empty()
                ? "HTTP " + std::to_string(transport.httpStatus) : transport.error;
        } else {
            try {
                TimestampResponse response = decodeTimestampResponse(transport.body);
                response.tsaUrl = config.url;
                if (!response.status.isGranted()) {
                    failure = "TSA rejected request: " + response.status.describe();
                    rejection = static_cast<int>(response.status.status);
                } else if (!response.token) {
                    failure = "granted response carries no TimeStampToken";
                } else if (request.nonce && (!response.token->tstInfo.nonce ||
                           !nonceEquals(*request.nonce, *response.token->tstInfo.nonce))) {
                    failure = "nonce in TSA response does not match request";
                } else if (response.token->tstInfo.messageImprint.hashedMessage !=
                           request.messageImprint.hashedMessage) {
                    failure = "message imprint in TSA response does not match request";
                } else {
                    machine.onSuccess();
                    spdlog::info("[TimestampServerManager] Timestamp granted by {} (attempt {}/{}, serial {})",
                                 config.url, attempt, machine.maxAttempts(),
                                 response.token->tstInfo.serialNumber);
                    return response;
                }
            } catch (const common::ParsingException& e) {
                failure = e.what();
            }
        }

        lastRejection = rejection;
        lastError = failure;
        history.push_back(config.url + " attempt " + std::to_string(attempt) + ": " + failure);
        spdlog::warn("[TimestampServerManager] {} attempt {}/{} failed: {}",
                     config.url, attempt, machine.maxAttempts(), failure);
        machine.onFailure();
    }

    if (lastRejection) {
        throw common::TsaResponseException(config.url, *lastRejection, lastError, history);
    }
    throw common::TsaConnectionException(
        config.url + " failed after " + std::to_string(machine.maxAttempts()) + " attempt(s): " + lastError,
        {config.url}, history);
}

TimestampResponse TimestampServerManager::requestTimestamp(const TimestampRequest& request,
                                                           const TSAConfig& config) {
    auto start = std::chrono::steady_clock::now();
    try {
        TimestampResponse response = performWithRetry(request, config);
        generateTimestampAuditTrail(TimestampOperation::REQUEST, responseSummary(response),
                                    config.url, true, "", util::elapsedMillis(start));
        return response;
    } catch (const common::PdfTrustException& e) {
        generateTimestampAuditTrail(TimestampOperation::REQUEST, Json::Value(),
                                    config.url, false, e.what(), util::elapsedMillis(start));
        throw;
    }
}

std::future<TimestampResponse> TimestampServerManager::requestTimestampAsync(TimestampRequest request,
                                                                            TSAConfig config) {
    return std::async(std::launch::async,
        [this, request = std::move(request), config = std::move(config)]() {
            return requestTimestamp(request, config);
        });
}

TimestampResponse TimestampServerManager::requestTimestampWithFailover(const TimestampRequest& request,
                                                                       const TSAFailoverConfig& failover) {
    int maxAttempts = failover.effectiveMaxAttempts();
    if (maxAttempts < 1) {
        throw std::invalid_argument("TimestampServerManager: maxFailoverAttempts must be at least 1");
    }

    std::vector<const TSAConfig*> servers;
    servers.push_back(&failover.primary);
    for (const auto& fb : failover.fallbacks) {
        servers.push_back(&fb);
    }

    std::vector<std::string> attemptedUrls;
    std::vector<std::string> history;
    std::string lastError;

    for (size_t i = 0; i < servers.size() && static_cast<int>(i) < maxAttempts; i++) {
        const TSAConfig& server = *servers[i];
        attemptedUrls.push_back(server.url);
        auto start = std::chrono::steady_clock::now();
        try {
            TimestampResponse response = performWithRetry(request, server);
            generateTimestampAuditTrail(TimestampOperation::REQUEST, responseSummary(response),
                                        server.url, true, "", util::elapsedMillis(start));
            if (i > 0) {
                spdlog::info("[TimestampServerManager] Fallback TSA {} succeeded after {} failed server(s)",
                             server.url, i);
            }
            return response;
        } catch (const common::TsaResponseException& e) {
            lastError = e.what();
            history.insert(history.end(), e.attemptHistory().begin(), e.attemptHistory().end());
        } catch (const common::TsaConnectionException& e) {
            lastError = e.what();
            history.insert(history.end(), e.attemptHistory().begin(), e.attemptHistory().end());
        }
        generateTimestampAuditTrail(TimestampOperation::REQUEST, Json::Value(),
                                    server.url, false, lastError, util::elapsedMillis(start));
        spdlog::warn("[TimestampServerManager] TSA {} failed, {}: {}", server.url,
                     (i + 1 < servers.size() && static_cast<int>(i + 1) < maxAttempts)
                         ? "trying next server" : "no servers left",
                     lastError);
    }

    std::string tried;
    for (const auto& url : attemptedUrls) {
        if (!tried.empty()) tried += ", ";
        tried += url;
    }
    spdlog::error("[TimestampServerManager] All {} TSA server(s) failed: {}", attemptedUrls.size(), tried);
    throw common::TsaConnectionException(
        "all " + std::to_string(attemptedUrls.size()) + " TSA server(s) failed (tried: " + tried +
            "); last error: " + lastError,
        attemptedUrls, history);
}

std::future<TimestampResponse> TimestampServerManager::requestTimestampWithFailoverAsync(
    TimestampRequest request, TSAFailoverConfig failover) {
    return std::async(std::launch::async,
        [this, request = std::move(request), failover = std::move(failover)]() {
            return requestTimestampWithFailover(request, failover);
        });
}

// =============================================================================
// Verification
// =============================================================================

TimestampVerificationResult TimestampServerManager::verifyTimestampResponse(
    const TimestampResponse& response, const std::vector<uint8_t>& originalData) {
    auto start = std::chrono::steady_clock::now();
    TimestampVerificationResult result;
    result.tsaUrl = response.tsaUrl;

    if (!response.status.isGranted()) {
        result.errors.push_back("Timestamp response not granted: " + response.status.describe());
    } else if (!response.token) {
        result.errors.push_back("Timestamp response carries no token");
    } else {
        const TimeStampToken& token = *response.token;
        const TSTInfo& tst = token.tstInfo;
        result.genTime = tst.genTime;
        result.accuracy = tst.accuracy;
        result.policy = tst.policy;
        result.serialNumber = tst.serialNumber;
        result.hashAlgorithm = tst.messageImprint.hashAlgorithm;

        // 1. Message imprint
        if (!MessageImprintBuilder::isSupported(tst.messageImprint.hashAlgorithm)) {
            result.errors.push_back("Unsupported timestamp hash algorithm: " + tst.messageImprint.hashAlgorithm);
        } else {
            auto expected = MessageImprintBuilder::digest(originalData, tst.messageImprint.hashAlgorithm);
            result.imprintMatches = (expected == tst.messageImprint.hashedMessage);
            if (!result.imprintMatches) {
                result.errors.push_back(
                    "Message imprint does not match original data (document does not match timestamp)");
            }
        }

        // 2. Token signature and TSA certificate
        if (token.certificates.empty()) {
            result.warnings.push_back("No TSA certificate included in response");
        } else {
            const validation::X509Certificate& tsaCert = token.certificates.front();
            result.tsaCertificate = tsaCert;

            std::string error;
            result.signatureVerified = verifyTokenSignature(token.der, error);
            if (!result.signatureVerified) {
                result.errors.push_back("Timestamp token signature verification failed: " + error);
            }

            auto now = std::chrono::system_clock::now();
            if (now < tsaCert.notBefore) {
                result.errors.push_back("TSA certificate not yet valid");
            } else if (now > tsaCert.notAfter) {
                result.errors.push_back("TSA certificate has expired");
            }

            auto x509 = tsaCert.toX509();
            auto ext = validation::validateExtensions(x509.get(), validation::CertificateRole::TSA);
            for (const auto& w : ext.warnings) {
                result.warnings.push_back("TSA certificate: " + w);
            }
        }
    }

    result.isValid = result.errors.empty();
    if (!result.isValid) {
        spdlog::warn("[TimestampServerManager] Timestamp verification failed: {}", result.errors.front());
    }
    generateTimestampAuditTrail(TimestampOperation::VERIFY, result.toJson(), response.tsaUrl,
                                result.isValid, result.isValid ? "" : result.errors.front(),
                                util::elapsedMillis(start));
    return result;
}

TimestampVerificationResult TimestampServerManager::verifyTimestamp(const Timestamp& timestamp,
                                                                    const std::vector<uint8_t>& originalData) {
    TimestampResponse response;
    response.status.status = PkiStatus::GRANTED;
    response.tsaUrl = timestamp.tsaUrl;
    try {
        response.token = decodeTimeStampToken(timestamp.raw);
    } catch (const common::ParsingException& e) {
        TimestampVerificationResult result;
        result.tsaUrl = timestamp.tsaUrl;
        result.errors.push_back(std::string("Timestamp token cannot be parsed: ") + e.what());
        generateTimestampAuditTrail(TimestampOperation::VERIFY, result.toJson(), timestamp.tsaUrl,
                                    false, result.errors.front());
        return result;
    }
    return verifyTimestampResponse(response, originalData);
}

// =============================================================================
// CMS integration
// =============================================================================

Timestamp TimestampServerManager::toTimestamp(const TimeStampToken& token, const std::string& tsaUrl) {
    Timestamp ts;
    ts.genTime = token.tstInfo.genTime;
    ts.tsaUrl = tsaUrl;
    ts.serialNumber = token.tstInfo.serialNumber;
    if (!token.certificates.empty()) {
        ts.certificate = token.certificates.front();
    }
    ts.policy = token.tstInfo.policy;
    ts.accuracy = token.tstInfo.accuracy;
    ts.messageImprint = token.tstInfo.messageImprint;
    ts.raw = token.der;
    return ts;
}

std::optional<Timestamp> TimestampServerManager::extractTimestamp(const cms::CMSSignature& signature) {
    for (const auto& attr : signature.signerInfo.unsignedAttributes) {
        if (!isTimestampAttribute(attr.oid)) continue;
        try {
            TimeStampToken token = decodeTimeStampToken(attr.value);
            Timestamp ts = toTimestamp(token, "");
            generateTimestampAuditTrail(TimestampOperation::EXTRACT, ts.toJson());
            return ts;
        } catch (const common::ParsingException& e) {
            spdlog::warn("[TimestampServerManager] Skipping unparsable timestamp attribute {}: {}",
                         attr.oid, e.what());
        }
    }
    return std::nullopt;
}

cms::CMSSignature TimestampServerManager::addTimestampToSignature(const cms::CMSSignature& signature,
                                                                  const TSAConfig& config) {
    bool stamped = signature.timestamp.has_value();
    for (const auto& attr : signature.signerInfo.unsignedAttributes) {
        stamped = stamped || isTimestampAttribute(attr.oid);
    }
    if (stamped) {
        throw common::TimestampValidationException("signature already carries a timestamp");
    }
    if (signature.signerInfo.signature.empty()) {
        throw std::invalid_argument("TimestampServerManager: signature has no signature value");
    }

    auto start = std::chrono::steady_clock::now();

    TimestampRequestOptions options;
    options.hashAlgorithm = config.hashAlgorithm;
    options.policy = config.requestPolicy;
    TimestampRequest request = createTimestampRequest(signature.signerInfo.signature, options);
    TimestampResponse response = requestTimestamp(request, config);

    TimestampVerificationResult verification = verifyTimestampResponse(response, signature.signerInfo.signature);
    if (!verification.isValid) {
        throw common::TimestampValidationException(
            "token from " + config.url + " failed verification: " + verification.errors.front());
    }

    std::vector<uint8_t> der = cms::addUnsignedAttribute(signature.raw, TIMESTAMP_TOKEN_ATTRIBUTE_OID,
                                                         response.token->der);
    cms::CMSSignature stampedSignature = cms::parseCmsSignature(der, signature.content);
    stampedSignature.timestamp = toTimestamp(*response.token, config.url);

    generateTimestampAuditTrail(TimestampOperation::ADD_TO_SIGNATURE, stampedSignature.timestamp->toJson(),
                                config.url, true, "", util::elapsedMillis(start));
    spdlog::info("[TimestampServerManager] Timestamp from {} embedded into signature", config.url);
    return stampedSignature;
}

// =============================================================================
// Audit
// =============================================================================

TimestampAuditEntry TimestampServerManager::generateTimestampAuditTrail(TimestampOperation operation,
                                                                        const Json::Value& result,
                                                                        const std::string& tsaUrl,
                                                                        bool success,
                                                                        const std::string& error,
                                                                        long long durationMs) {
    TimestampAuditEntry entry;
    entry.id = util::UuidUtil::generate();
    entry.operation = operation;
    entry.tsaUrl = tsaUrl;
    entry.result = result;
    entry.success = success;
    entry.error = error;
    entry.durationMs = durationMs;
    entry.createdAt = std::chrono::system_clock::now();
    auditLog_->append(entry);
    return entry;
}

std::vector<TimestampAuditEntry> TimestampServerManager::getAuditTrail() const {
    return auditLog_->entries();
}

void TimestampServerManager::clearAuditTrail() {
    auditLog_->clear();
}

} // namespace pdftrust::tsp
