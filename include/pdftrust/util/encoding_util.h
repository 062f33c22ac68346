/**
 * @file encoding_util.h
 * @brief Hex and Base64 codecs for digests, DER blobs and PDF hex strings
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pdftrust::util {

/// @name Hex
/// @{

/**
 * @brief Lowercase hex encoding
 */
std::string toHex(const std::vector<uint8_t>& data);
std::string toHex(const uint8_t* data, size_t length);

/**
 * @brief Decode a hex string
 *
 * Whitespace is skipped. An odd number of digits is completed with a
 * trailing zero nibble, the way PDF hex strings are defined.
 *
 * @throws std::invalid_argument on a non-hex character
 */
std::vector<uint8_t> fromHex(const std::string& hex);

/// @}

/// @name Base64 (OpenSSL BIO)
/// @{

std::string base64Encode(const std::vector<uint8_t>& data);

/**
 * @throws std::runtime_error if decoding fails
 */
std::vector<uint8_t> base64Decode(const std::string& encoded);

/// @}

} // namespace pdftrust::util
