/**
 * @file message_types.hpp
 * @brief Envelope wire structures and serialization for DIDEnvelope
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Envelope structures with JSON serialization/deserialization:
 * - Signed envelopes (general JWS JSON serialization)
 * - Encrypted envelopes (general JWE JSON serialization)
 * - Protected headers of both
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "didenvelope/jwk.hpp"

namespace didenvelope {

/// Media type of a plaintext message
constexpr const char* PLAIN_MESSAGE_TYP = "application/didcomm-plain+json";

/// Media type of a signed envelope
constexpr const char* SIGNED_MESSAGE_TYP = "application/didcomm-signed+json";

/// Media type of an encrypted envelope
constexpr const char* ENCRYPTED_MESSAGE_TYP = "application/didcomm-encrypted+json";

// ============================================================================
// Signed Envelope (JWS)
// ============================================================================

/**
 * @brief JWS protected header
 */
struct JwsProtected {
    std::string typ = SIGNED_MESSAGE_TYP;  ///< Media type
    std::string alg;                        ///< EdDSA, ES256 or ES256K

    std::string to_json() const;
    static std::optional<JwsProtected> from_json(const std::string& json);

    /**
     * @brief Base64url of the serialized header
     */
    std::string encode() const;

    /**
     * @brief Decode a base64url protected header
     * @param encoded Base64url string
     * @return Header or std::nullopt if invalid
     */
    static std::optional<JwsProtected> decode(const std::string& encoded);
};

/**
 * @brief Unprotected per-signature header
 */
struct JwsHeader {
    std::string kid;  ///< Signing key identifier
};

/**
 * @brief One signature of a JWS
 */
struct JwsSignature {
    std::string protected_header;  ///< Base64url protected header ("protected" on the wire)
    std::string signature;         ///< Base64url raw signature
    JwsHeader header;              ///< Unprotected header
};

/**
 * @brief Signed envelope
 */
struct Jws {
    std::string payload;                   ///< Base64url payload
    std::vector<JwsSignature> signatures;  ///< One or more signatures

    std::string to_json() const;
    static std::optional<Jws> from_json(const std::string& json);
};

// ============================================================================
// Encrypted Envelope (JWE)
// ============================================================================

/**
 * @brief JWE protected header
 */
struct JweProtected {
    Jwk epk;                                  ///< Ephemeral public key
    std::string apv;                          ///< Base64url recipient context
    std::string typ = ENCRYPTED_MESSAGE_TYP;  ///< Media type
    std::string enc = "A256GCM";              ///< Content encryption
    std::string alg = "ECDH-ES+A256KW";       ///< Key management
    std::optional<std::string> cty;           ///< Content type of a nested envelope

    std::string to_json() const;
    static std::optional<JweProtected> from_json(const std::string& json);

    std::string encode() const;
    static std::optional<JweProtected> decode(const std::string& encoded);
};

/**
 * @brief Unprotected per-recipient header
 */
struct JweRecipientHeader {
    std::string kid;                        ///< Recipient key identifier
    std::optional<std::string> sender_kid;  ///< Unauthenticated sender hint
};

/**
 * @brief One recipient of a JWE
 */
struct JweRecipient {
    std::string encrypted_key;  ///< Base64url wrapped CEK
    JweRecipientHeader header;  ///< Unprotected header
};

/**
 * @brief Encrypted envelope
 */
struct Jwe {
    std::string ciphertext;                ///< Base64url AES-GCM ciphertext
    std::string protected_header;          ///< Base64url protected header ("protected" on the wire)
    std::vector<JweRecipient> recipients;  ///< One entry per recipient
    std::string tag;                       ///< Base64url authentication tag
    std::string iv;                        ///< Base64url nonce

    std::string to_json() const;
    static std::optional<Jwe> from_json(const std::string& json);

    /**
     * @brief Find the recipient entry for a key id
     * @param kid Recipient key identifier
     * @return Pointer into recipients, or nullptr if absent
     */
    const JweRecipient* find_recipient(const std::string& kid) const;
};

} // namespace didenvelope
