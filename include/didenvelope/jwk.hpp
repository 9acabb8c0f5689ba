/**
 * @file jwk.hpp
 * @brief JSON Web Key representation for Ed25519, P-256 and secp256k1
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace didenvelope {

/**
 * @brief Key algorithms an agent key can use
 */
enum class KeyType {
    ED25519,     ///< OKP / Ed25519, signing only
    P256,        ///< EC / P-256, signing and ECDH
    SECP256K1    ///< EC / secp256k1, signing and ECDH
};

/**
 * @brief Convert key type to its display name
 * @param type Key type
 * @return "Ed25519", "P-256" or "secp256k1"
 */
std::string key_type_to_string(KeyType type);

/**
 * @brief JSON Web Key (RFC 7517) restricted to the supported curves
 *
 * Binary members (x, y, d) hold base64url strings exactly as on the wire.
 */
struct Jwk {
    std::string kty;    ///< "OKP" or "EC"
    std::string crv;    ///< "Ed25519", "P-256" or "secp256k1"
    std::string x;      ///< Public key or X coordinate
    std::string y;      ///< Y coordinate (EC only)
    std::string d;      ///< Private key (empty for public JWKs)
    std::string kid;    ///< Key identifier (optional)

    /**
     * @brief Build a public JWK from raw public key bytes
     * @param type Key type
     * @param public_key Ed25519 key (32 bytes) or SEC1 point
     * @param kid Key identifier (may be empty)
     * @return Public JWK
     * @throws EnvelopeError INVALID_KEY if the bytes are not a valid key
     */
    static Jwk from_public_key(KeyType type, const std::vector<uint8_t>& public_key, const std::string& kid = "");

    /**
     * @brief Key type named by kty/crv
     * @return Key type, or std::nullopt for unsupported combinations
     */
    std::optional<KeyType> key_type() const;

    /**
     * @brief Decode and validate the public key
     * @return Ed25519 key (32 bytes) or uncompressed SEC1 point, or std::nullopt if invalid
     */
    std::optional<std::vector<uint8_t>> public_key_bytes() const;

    /**
     * @brief Whether private material is present
     */
    bool has_private() const { return !d.empty(); }

    /**
     * @brief Copy without the private member
     */
    Jwk public_only() const;

    /**
     * @brief Serialize JWK to JSON (members present only when non-empty)
     * @return JSON string
     */
    std::string to_json() const;

    /**
     * @brief Deserialize JWK from JSON
     * @param json JSON string
     * @return Jwk or std::nullopt if invalid
     */
    static std::optional<Jwk> from_json(const std::string& json);

    bool operator==(const Jwk& other) const;
    bool operator!=(const Jwk& other) const { return !(*this == other); }
};

} // namespace didenvelope
