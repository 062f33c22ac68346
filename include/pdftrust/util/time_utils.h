/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * Conversion between OpenSSL ASN1_TIME, PDF date strings and std::chrono,
 * plus ISO 8601 formatting for reports.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <openssl/asn1.h>

namespace pdftrust::util {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Convert ASN1_TIME (UTCTime or GeneralizedTime) to a time_point
 * @return time_point, or std::nullopt on error
 */
std::optional<TimePoint> asn1TimeToTimePoint(const ASN1_TIME* asn1Time);

/**
 * @brief Format time_point as ISO 8601 UTC string
 *
 * @param tp time point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-02-02T12:34:56Z")
 */
std::string formatIso8601(const TimePoint& tp, bool includeMilliseconds = false);

/**
 * @brief Convert ASN1_TIME straight to ISO 8601, or empty on error
 */
std::string asn1TimeToIso8601(const ASN1_TIME* asn1Time);

/**
 * @brief Parse a PDF date string (ISO 32000-1 Section 7.9.4)
 *
 * Accepts "D:YYYYMMDDHHmmSSOHH'mm'" with every field after the year optional.
 *
 * @return UTC time_point, or std::nullopt if the string is not a PDF date
 */
std::optional<TimePoint> parsePdfDate(const std::string& pdfDate);

/**
 * @brief Milliseconds elapsed since start
 */
inline long long elapsedMillis(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace pdftrust::util
