/**
 * @file message_packing.hpp
 * @brief Pack/unpack pipeline over plain, signed and encrypted envelopes
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Unpack infers the mode from the envelope shape and never trusts a
 * caller-declared mode:
 * - "signatures" present: signed (JWS)
 * - "recipients" present: encrypted (JWE), possibly wrapping a JWS
 * - otherwise: plain JSON
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "didenvelope/agent_key.hpp"
#include "didenvelope/key_manager.hpp"
#include "didenvelope/security_config.hpp"

namespace didenvelope {

/**
 * @brief Protection applied by one pack call
 */
struct SecurityMode {
    enum class Kind {
        PLAIN,             ///< No protection (testing and local use only)
        SIGNED,            ///< JWS
        ENCRYPTED,         ///< JWE, anonymous sender
        SIGNED_ENCRYPTED   ///< JWS nested inside a JWE
    };

    Kind kind = Kind::PLAIN;
    std::string signing_key_id;                                        ///< SIGNED / SIGNED_ENCRYPTED
    std::optional<std::string> sender_key_id;                          ///< ENCRYPTED: unauthenticated sender hint
    std::vector<std::shared_ptr<const VerificationKey>> recipients;    ///< ENCRYPTED / SIGNED_ENCRYPTED

    static SecurityMode plain();
    static SecurityMode signed_by(const std::string& signing_key_id);

    /**
     * @brief Encrypt to recipients
     * @param recipients Recipient public keys
     * @param sender_key_id Local encryption key whose id is embedded as a hint
     */
    static SecurityMode encrypted(
        std::vector<std::shared_ptr<const VerificationKey>> recipients,
        std::optional<std::string> sender_key_id = std::nullopt
    );

    /**
     * @brief Sign, then encrypt the signed envelope (authenticated sender)
     */
    static SecurityMode signed_and_encrypted(
        const std::string& signing_key_id,
        std::vector<std::shared_ptr<const VerificationKey>> recipients
    );
};

std::string security_mode_to_string(SecurityMode::Kind kind);

/**
 * @brief Options enforced by unpack
 */
struct UnpackOptions {
    bool require_signature = false;                           ///< Reject unsigned envelopes
    std::optional<std::string> expected_recipient_kid;        ///< Only this local key may decrypt
    size_t max_envelope_size = security::MAX_ENVELOPE_SIZE;   ///< Reject larger inputs
};

/**
 * @brief Who produced and who received an unpacked envelope
 */
struct Provenance {
    SecurityMode::Kind mode = SecurityMode::Kind::PLAIN;  ///< Mode inferred from the wire shape
    std::optional<std::string> signer_kid;                ///< Authenticated signer
    std::optional<std::string> sender_kid;                ///< Unauthenticated hint from the JWE header
    std::optional<std::string> recipient_kid;             ///< Local key that decrypted
};

/**
 * @brief Result of unpack
 */
struct UnpackResult {
    std::string payload;    ///< Canonical JSON payload
    Provenance provenance;
};

/**
 * @brief Protect a JSON payload for transport
 * @param payload_json Message body (any JSON value)
 * @param mode Protection to apply
 * @param key_manager Source of local keys
 * @return Transport string
 * @throws EnvelopeError SERIALIZATION_ERROR for invalid JSON, KEY_NOT_FOUND,
 *         UNSUPPORTED_ALGORITHM, INVALID_PARAMETER or INVALID_KEY
 */
std::string pack(const std::string& payload_json, const SecurityMode& mode, const KeyManager& key_manager);

/**
 * @brief Recover a payload and its provenance
 * @param transport Transport string produced by pack
 * @param key_manager Source of local keys and verification keys
 * @param options Policy to enforce
 * @return Payload and provenance
 * @throws EnvelopeError SERIALIZATION_ERROR, INVALID_FORMAT, VERIFICATION_FAILED,
 *         DECRYPTION_FAILED, KEY_NOT_FOUND or POLICY_VIOLATION
 */
UnpackResult unpack(const std::string& transport, const KeyManager& key_manager,
                    const UnpackOptions& options = UnpackOptions{});

} // namespace didenvelope
