/**
 * @file exceptions.h
 * @brief Exception hierarchy for pdftrust
 *
 * Expected validation failures (bad signature, expired certificate) are
 * reported as result values. These types cover programmer and configuration
 * errors plus protocol failures that exhaust every retry.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace pdftrust::common {

/**
 * @brief Base exception for all pdftrust exceptions
 */
class PdfTrustException : public std::runtime_error {
public:
    explicit PdfTrustException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Malformed PDF carrier
 */
class StructuralException : public PdfTrustException {
public:
    explicit StructuralException(const std::string& message)
        : PdfTrustException("Structural error: " + message) {}
};

/**
 * @brief CMS signature could not be processed
 */
class SignatureValidationException : public PdfTrustException {
public:
    explicit SignatureValidationException(const std::string& message)
        : PdfTrustException("Signature validation error: " + message) {}
};

/**
 * @brief Certificate could not be loaded or decoded
 */
class CertificateException : public PdfTrustException {
public:
    explicit CertificateException(const std::string& message)
        : PdfTrustException("Certificate error: " + message) {}
};

/**
 * @brief Timestamp token malformed or does not verify
 */
class TimestampValidationException : public PdfTrustException {
public:
    explicit TimestampValidationException(const std::string& message)
        : PdfTrustException("Timestamp validation error: " + message) {}
};

/**
 * @brief Every attempt to reach one or more TSAs failed
 *
 * Carries the URLs that were tried and one line per failed attempt.
 */
class TsaConnectionException : public PdfTrustException {
public:
    TsaConnectionException(const std::string& message,
                           std::vector<std::string> attemptedUrls,
                           std::vector<std::string> attemptHistory)
        : PdfTrustException("TSA connection error: " + message),
          attemptedUrls_(std::move(attemptedUrls)),
          attemptHistory_(std::move(attemptHistory)) {}

    const std::vector<std::string>& attemptedUrls() const { return attemptedUrls_; }
    const std::vector<std::string>& attemptHistory() const { return attemptHistory_; }

private:
    std::vector<std::string> attemptedUrls_;
    std::vector<std::string> attemptHistory_;
};

/**
 * @brief TSA answered but refused to grant a timestamp
 */
class TsaResponseException : public PdfTrustException {
public:
    TsaResponseException(const std::string& url, int pkiStatus,
                         const std::string& message,
                         std::vector<std::string> attemptHistory = {})
        : PdfTrustException("TSA response error from " + url + ": " + message),
          url_(url), pkiStatus_(pkiStatus),
          attemptHistory_(std::move(attemptHistory)) {}

    const std::string& url() const { return url_; }
    int pkiStatus() const { return pkiStatus_; }
    const std::vector<std::string>& attemptHistory() const { return attemptHistory_; }

private:
    std::string url_;
    int pkiStatus_;
    std::vector<std::string> attemptHistory_;
};

/**
 * @brief Configuration error
 */
class ConfigException : public PdfTrustException {
public:
    explicit ConfigException(const std::string& message)
        : PdfTrustException("Configuration error: " + message) {}
};

/**
 * @brief Parsing error (CMS, TSA reply, PDF dictionary)
 */
class ParsingException : public PdfTrustException {
public:
    explicit ParsingException(const std::string& message)
        : PdfTrustException("Parsing error: " + message) {}
};

} // namespace pdftrust::common
