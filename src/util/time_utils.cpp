/**
 * @file time_utils.cpp
 * @brief Time conversion utilities implementation
 */

#include "pdftrust/util/time_utils.h"

#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pdftrust::util {

std::optional<TimePoint> asn1TimeToTimePoint(const ASN1_TIME* asn1Time) {
    if (!asn1Time) {
        return std::nullopt;
    }

    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));
    if (ASN1_TIME_to_tm(asn1Time, &tmTime) != 1) {
        return std::nullopt;
    }

    std::time_t t = timegm(&tmTime);
    if (t == -1) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

std::string formatIso8601(const TimePoint& tp, bool includeMilliseconds) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);

    struct tm tmTime;
    if (!gmtime_r(&t, &tmTime)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec;

    if (includeMilliseconds) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000;
        if (ms < 0) ms += 1000;
        oss << '.' << std::setw(3) << ms;
    }
    oss << 'Z';
    return oss.str();
}

std::string asn1TimeToIso8601(const ASN1_TIME* asn1Time) {
    auto tp = asn1TimeToTimePoint(asn1Time);
    return tp ? formatIso8601(*tp) : "";
}

std::optional<TimePoint> parsePdfDate(const std::string& pdfDate) {
    std::string s = pdfDate;
    if (s.compare(0, 2, "D:") == 0) {
        s = s.substr(2);
    }

    size_t pos = 0;
    auto readField = [&](int width, int defaultValue, int& out) -> bool {
        if (pos >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos]))) {
            out = defaultValue;
            return true;
        }
        if (pos + width > s.size()) return false;
        int value = 0;
        for (int i = 0; i < width; ++i) {
            char c = s[pos + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            value = value * 10 + (c - '0');
        }
        pos += width;
        out = value;
        return true;
    };

    if (s.size() < 4) return std::nullopt;

    int year = 0, month = 1, day = 1, hour = 0, minute = 0, second = 0;
    if (!readField(4, 0, year) || !readField(2, 1, month) || !readField(2, 1, day) ||
        !readField(2, 0, hour) || !readField(2, 0, minute) || !readField(2, 0, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    // Offset: Z, +HH'mm', -HH'mm'
    int offsetSeconds = 0;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        int sign = (s[pos] == '-') ? -1 : 1;
        ++pos;
        int offH = 0, offM = 0;
        if (!readField(2, 0, offH)) return std::nullopt;
        if (pos < s.size() && s[pos] == '\'') ++pos;
        if (!readField(2, 0, offM)) return std::nullopt;
        offsetSeconds = sign * (offH * 3600 + offM * 60);
    }

    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));
    tmTime.tm_year = year - 1900;
    tmTime.tm_mon = month - 1;
    tmTime.tm_mday = day;
    tmTime.tm_hour = hour;
    tmTime.tm_min = minute;
    tmTime.tm_sec = second;

    std::time_t t = timegm(&tmTime);
    if (t == -1) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t - offsetSeconds);
}

} // namespace pdftrust::util
