/**
 * @file rfc3161_codec.h
 * @brief DER encoding of TimeStampReq and decoding of TimeStampResp / tokens
 *
 * Built on OpenSSL's TS_* ASN.1 types so the wire format follows the
 * RFC 3161 grammar exactly.
 */

#pragma once

#include <cstdint>
#include <vector>

#include "types.h"

namespace pdftrust::tsp {

/**
 * @brief Encode a TimeStampReq (RFC 3161 Section 2.4.1)
 * @throws std::invalid_argument if the imprint is inconsistent
 * @throws common::ParsingException on encoder failure
 */
std::vector<uint8_t> encodeTimestampRequest(const TimestampRequest& request);

/**
 * @brief Decode a TimeStampResp (RFC 3161 Section 2.4.2)
 *
 * A granted response must carry a token; a rejected one normally does not.
 *
 * @throws common::ParsingException on malformed DER or a malformed token
 */
TimestampResponse decodeTimestampResponse(const std::vector<uint8_t>& der);

/**
 * @brief Decode a TimeStampToken (ContentInfo wrapping SignedData of TSTInfo)
 * @throws common::ParsingException on malformed input
 */
TimeStampToken decodeTimeStampToken(const std::vector<uint8_t>& der);

/**
 * @brief Random nonce with a non-zero leading byte
 * @throws std::runtime_error if the random generator fails
 */
std::vector<uint8_t> generateNonce(size_t length);

/**
 * @brief Compare two nonces as unsigned big-endian integers
 */
bool nonceEquals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

} // namespace pdftrust::tsp
