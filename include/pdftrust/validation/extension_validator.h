/**
 * @file extension_validator.h
 * @brief X.509 extension checks per RFC 5280 Section 4.2
 *
 * Pure function, operates only on X509* certificate, no I/O.
 * Findings are warnings: they never invalidate a path on their own.
 */

#pragma once

#include <string>
#include <openssl/x509.h>
#include "types.h"

namespace pdftrust::validation {

/// @brief Position of a certificate in a validated path
enum class CertificateRole {
    SIGNER,  ///< Document signer (leaf)
    CA,      ///< Intermediate or root authority
    TSA      ///< Time-stamp authority signer
};

/**
 * @brief Validate certificate extensions
 *
 * Checks:
 *   - No unknown critical extensions (RFC 5280 Section 4.2)
 *   - SIGNER: digitalSignature or nonRepudiation key usage
 *   - CA: BasicConstraints CA:TRUE and keyCertSign key usage
 *   - TSA: critical extendedKeyUsage with only timeStamping (RFC 3161 Section 2.3)
 *
 * @param cert X509 certificate to validate (non-owning)
 * @param role Certificate role
 * @return ExtensionValidationResult with warnings list
 */
ExtensionValidationResult validateExtensions(X509* cert, CertificateRole role);

} // namespace pdftrust::validation
