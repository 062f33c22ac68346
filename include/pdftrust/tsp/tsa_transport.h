/**
 * @file tsa_transport.h
 * @brief HTTP transport seam for RFC 3161 requests
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "types.h"

namespace pdftrust::tsp {

/// Outcome of one HTTP exchange with a TSA
struct TransportResult {
    bool success = false;           ///< HTTP 200 with a body
    long httpStatus = 0;            ///< 0 when no HTTP response was received
    std::vector<uint8_t> body;
    std::string error;              ///< Transport or HTTP error text
};

/**
 * @brief POSTs a DER TimeStampReq to a TSA
 *
 * Implementations must be safe to call from several threads at once.
 */
class ITsaTransport {
public:
    virtual ~ITsaTransport() = default;

    /// Never throws for network failures; they are reported in the result
    virtual TransportResult post(const TSAConfig& config, const std::vector<uint8_t>& requestDer) = 0;
};

} // namespace pdftrust::tsp
