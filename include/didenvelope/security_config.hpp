/**
 * @file security_config.hpp
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

#include "didenvelope/utilities.hpp"

namespace didenvelope {
namespace security {

// ============================================================================
// Input Limits
// ============================================================================

/// Maximum transport string accepted by unpack (10MB) to prevent memory exhaustion
constexpr size_t MAX_ENVELOPE_SIZE = 10 * 1024 * 1024;

/// Maximum recipients in one encrypted envelope
constexpr size_t MAX_RECIPIENTS = 256;

/// Maximum signatures examined in one signed envelope
constexpr size_t MAX_SIGNATURES = 32;

/// Maximum key identifier length (DID URLs can be long)
constexpr size_t MAX_KEY_ID_LENGTH = 512;

// ============================================================================
// Cryptographic Configuration
// ============================================================================

/// Ed25519 signature size
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

/// Ed25519 public key size
constexpr size_t ED25519_PUBKEY_SIZE = 32;

/// Ed25519 seed (private key) size
constexpr size_t ED25519_SEED_SIZE = 32;

/// P-256 / secp256k1 private scalar and coordinate size
constexpr size_t EC_FIELD_SIZE = 32;

/// Uncompressed SEC1 point size (0x04 || X || Y)
constexpr size_t EC_UNCOMPRESSED_POINT_SIZE = 65;

/// Compressed SEC1 point size (0x02/0x03 || X)
constexpr size_t EC_COMPRESSED_POINT_SIZE = 33;

/// Raw ECDSA signature size (r || s)
constexpr size_t ECDSA_SIGNATURE_SIZE = 64;

/// AES-256-GCM content-encryption key size
constexpr size_t CEK_SIZE = 32;

/// AES-256-GCM nonce size
constexpr size_t GCM_IV_SIZE = 12;

/// AES-256-GCM tag size
constexpr size_t GCM_TAG_SIZE = 16;

/// AES-256 key-encryption key size
constexpr size_t KEK_SIZE = 32;

/// AES key wrap integrity check value size
constexpr size_t KEY_WRAP_ICV_SIZE = 8;

// ============================================================================
// Runtime Configuration
// ============================================================================

/**
 * @brief Settings read from the environment
 */
struct EnvelopeConfig {
    utilities::LogLevel log_level = utilities::LogLevel::INFO;  ///< DIDENVELOPE_LOG_LEVEL
    std::string log_file;                                        ///< DIDENVELOPE_LOG_FILE (empty for stdout only)
    size_t max_envelope_size = MAX_ENVELOPE_SIZE;                ///< DIDENVELOPE_MAX_ENVELOPE_SIZE
};

/**
 * @brief Load configuration from DIDENVELOPE_* environment variables
 * @return Configuration; invalid values fall back to defaults
 */
EnvelopeConfig load_config();

/**
 * @brief Parse a log level name (debug, info, warn, error, critical)
 * @param name Level name, case-insensitive
 * @param fallback Level returned for unknown names
 * @return Parsed log level
 */
utilities::LogLevel parse_log_level(const std::string& name, utilities::LogLevel fallback = utilities::LogLevel::INFO);

// ============================================================================
// Input Validation
// ============================================================================

/**
 * @brief Validate a key identifier or DID URL (printable ASCII, no whitespace)
 * @param key_id String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_key_id(const std::string& key_id, size_t max_length = MAX_KEY_ID_LENGTH);

} // namespace security
} // namespace didenvelope
