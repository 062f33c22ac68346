/**
 * @file curl_tsa_transport.h
 * @brief libcurl implementation of ITsaTransport
 */

#pragma once

#include "tsa_transport.h"

namespace pdftrust::tsp {

/**
 * @brief HTTP(S) POST with application/timestamp-query
 *
 * One easy handle per call, so concurrent requests share nothing.
 * TSAConfig::timeoutMs bounds the whole exchange.
 */
class CurlTsaTransport : public ITsaTransport {
public:
    CurlTsaTransport();

    TransportResult post(const TSAConfig& config, const std::vector<uint8_t>& requestDer) override;

    /// Any 2xx status carries a timestamp reply
    static bool isSuccessStatus(long httpStatus) { return httpStatus >= 200 && httpStatus < 300; }
};

} // namespace pdftrust::tsp
