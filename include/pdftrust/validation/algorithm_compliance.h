/**
 * @file algorithm_compliance.h
 * @brief Signature algorithm and key size check
 *
 * Pure function, operates only on X509* certificate, no I/O.
 */

#pragma once

#include <openssl/x509.h>
#include "types.h"

namespace pdftrust::validation {

/**
 * @brief Check signature algorithm and key size
 *
 * Accepted:
 *   - SHA-224/256/384/512 with RSA or ECDSA
 *   - RSA-PSS, Ed25519, Ed448
 *
 * Deprecated (warning):
 *   - SHA-1 with RSA, ECDSA or DSA
 *
 * Anything else, MD5 included, is non-compliant.
 *
 * Key size requirements (warning):
 *   - RSA: minimum 2048 bits
 *   - EC: minimum 256 bits
 *
 * Multiple findings are joined with "; ".
 *
 * @param cert X509 certificate to check (non-owning)
 * @return AlgorithmComplianceResult with compliance details
 */
AlgorithmComplianceResult validateAlgorithmCompliance(X509* cert);

} // namespace pdftrust::validation
