/**
 * @file ec_crypto.hpp
 * @brief Elliptic-curve operations for P-256 and secp256k1
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * ECDSA with SHA-256 in JOSE raw (r || s) form, ECDH shared secrets and
 * SEC1 point handling, backed by OpenSSL 3.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace didenvelope {

/**
 * @brief Supported short-Weierstrass curves
 */
enum class EcCurve {
    P256,       ///< NIST P-256 (prime256v1)
    SECP256K1   ///< secp256k1
};

/**
 * @brief EcCrypto - Stateless elliptic-curve primitives
 *
 * Public keys are SEC1 points; compressed and uncompressed inputs are
 * accepted, uncompressed (65 bytes) is returned. Private keys are 32-byte
 * big-endian scalars.
 */
class EcCrypto {
public:
    /**
     * @brief JWK "crv" name for a curve
     * @param curve Curve
     * @return "P-256" or "secp256k1"
     */
    static std::string curve_name(EcCurve curve);

    /**
     * @brief Generate a fresh private scalar
     * @param curve Curve
     * @return Private key (32 bytes)
     * @throws EnvelopeError INVALID_KEY if key generation fails
     */
    static std::vector<uint8_t> generate_private_key(EcCurve curve);

    /**
     * @brief Check that a scalar is in [1, n-1]
     * @param curve Curve
     * @param private_key Candidate private key
     * @return true if usable as a private key
     */
    static bool is_valid_private_key(EcCurve curve, const std::vector<uint8_t>& private_key);

    /**
     * @brief Compute the public point for a private scalar
     * @param curve Curve
     * @param private_key Private key (32 bytes)
     * @return Uncompressed public key, or std::nullopt if the scalar is invalid
     */
    static std::optional<std::vector<uint8_t>> public_key_from_private(
        EcCurve curve,
        const std::vector<uint8_t>& private_key
    );

    /**
     * @brief Validate a SEC1 point and return it uncompressed
     * @param curve Curve
     * @param public_key Compressed or uncompressed point
     * @return Uncompressed point, or std::nullopt if not on the curve
     */
    static std::optional<std::vector<uint8_t>> decode_public_key(
        EcCurve curve,
        const std::vector<uint8_t>& public_key
    );

    /**
     * @brief Validate a SEC1 point and return it compressed
     * @param curve Curve
     * @param public_key Compressed or uncompressed point
     * @return Compressed point (33 bytes), or std::nullopt if not on the curve
     */
    static std::optional<std::vector<uint8_t>> compress_public_key(
        EcCurve curve,
        const std::vector<uint8_t>& public_key
    );

    /**
     * @brief Sign with ECDSA over SHA-256
     * @param curve Curve
     * @param private_key Private key (32 bytes)
     * @param message Message to sign (hashed internally)
     * @return Raw signature r || s (64 bytes), or std::nullopt on failure
     */
    static std::optional<std::vector<uint8_t>> sign(
        EcCurve curve,
        const std::vector<uint8_t>& private_key,
        const std::vector<uint8_t>& message
    );

    /**
     * @brief Verify an ECDSA/SHA-256 raw signature
     * @param curve Curve
     * @param public_key Signer public key
     * @param message Original message
     * @param signature Raw signature r || s (64 bytes)
     * @return true if signature is valid, false otherwise (never throws)
     */
    static bool verify(
        EcCurve curve,
        const std::vector<uint8_t>& public_key,
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature
    );

    /**
     * @brief Compute ECDH shared secret
     * @param curve Curve
     * @param private_key Our private key
     * @param peer_public_key Their public key
     * @return X coordinate of the shared point (32 bytes), or std::nullopt on failure
     */
    static std::optional<std::vector<uint8_t>> ecdh(
        EcCurve curve,
        const std::vector<uint8_t>& private_key,
        const std::vector<uint8_t>& peer_public_key
    );
};

} // namespace didenvelope
