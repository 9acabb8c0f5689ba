/**
 * @file envelope_error.hpp
 * @brief Error taxonomy for envelope operations
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every failing operation throws EnvelopeError carrying a machine-checkable
 * ErrorKind and an opaque reason string.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace didenvelope {

/**
 * @brief Machine-checkable failure category
 */
enum class ErrorKind {
    INVALID_PARAMETER,       ///< Malformed call (bad length, empty recipient list)
    UNSUPPORTED_ALGORITHM,   ///< Capability not present for the key type
    INVALID_KEY,             ///< Key material rejected (off-curve point, bad length)
    INTEGRITY_CHECK_FAILED,  ///< AES key unwrap integrity check mismatch
    VERIFICATION_FAILED,     ///< Signature did not verify
    DECRYPTION_FAILED,       ///< Unwrap or AEAD failure, or not a recipient
    SERIALIZATION_ERROR,     ///< Malformed envelope or payload JSON
    INVALID_FORMAT,          ///< Structurally invalid input (oversized, bad encoding)
    KEY_NOT_FOUND,           ///< Key manager or resolver miss
    POLICY_VIOLATION         ///< Unpack option not satisfied
};

/**
 * @brief Exception raised by envelope operations
 */
class EnvelopeError : public std::runtime_error {
public:
    EnvelopeError(ErrorKind kind, const std::string& reason);

    /**
     * @brief Failure category
     */
    ErrorKind kind() const noexcept { return kind_; }

    /**
     * @brief Reason without the kind prefix
     */
    const std::string& reason() const noexcept { return reason_; }

private:
    ErrorKind kind_;
    std::string reason_;
};

/**
 * @brief Convert error kind to its string name
 * @param kind Error kind
 * @return Name such as "DECRYPTION_FAILED"
 */
std::string error_kind_to_string(ErrorKind kind);

} // namespace didenvelope
