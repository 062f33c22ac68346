/**
 * @file uuid_util.h
 * @brief RFC 4122 version 4 identifiers for audit entries
 */

#pragma once

#include <string>

namespace pdftrust::util {

/**
 * UUID generation utility.
 */
class UuidUtil {
public:
    /**
     * Generate a UUID v4 from OpenSSL's CSPRNG.
     * @throws std::runtime_error if the random generator fails
     */
    static std::string generate();

    /**
     * Validate canonical 8-4-4-4-12 hex format.
     */
    static bool isValid(const std::string& uuid);
};

} // namespace pdftrust::util
