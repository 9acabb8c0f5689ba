/**
 * @file envelope_error.cpp
 * @brief Implementation of the envelope error type
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/envelope_error.hpp"

namespace didenvelope {

EnvelopeError::EnvelopeError(ErrorKind kind, const std::string& reason)
    : std::runtime_error(error_kind_to_string(kind) + ": " + reason),
      kind_(kind),
      reason_(reason) {
}

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_PARAMETER: return "INVALID_PARAMETER";
        case ErrorKind::UNSUPPORTED_ALGORITHM: return "UNSUPPORTED_ALGORITHM";
        case ErrorKind::INVALID_KEY: return "INVALID_KEY";
        case ErrorKind::INTEGRITY_CHECK_FAILED: return "INTEGRITY_CHECK_FAILED";
        case ErrorKind::VERIFICATION_FAILED: return "VERIFICATION_FAILED";
        case ErrorKind::DECRYPTION_FAILED: return "DECRYPTION_FAILED";
        case ErrorKind::SERIALIZATION_ERROR: return "SERIALIZATION_ERROR";
        case ErrorKind::INVALID_FORMAT: return "INVALID_FORMAT";
        case ErrorKind::KEY_NOT_FOUND: return "KEY_NOT_FOUND";
        case ErrorKind::POLICY_VIOLATION: return "POLICY_VIOLATION";
        default: return "UNKNOWN";
    }
}

} // namespace didenvelope
