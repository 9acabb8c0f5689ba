/**
 * @file jwe.hpp
 * @brief Multi-recipient JWE construction (ECDH-ES+A256KW, A256GCM)
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * One ephemeral key pair, one CEK and one IV per envelope. Each recipient
 * gets the CEK wrapped under its own KEK:
 *
 *   Z   = ECDH(ephemeral_private, recipient_public)
 *   KEK = ConcatKdf(Z, apu = sender_kid or empty, apv = recipient kid, 256)
 *   encrypted_key = AES-KW(KEK, CEK)
 *
 * The base64url protected header is the AES-GCM AAD.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "didenvelope/agent_key.hpp"
#include "didenvelope/message_types.hpp"

namespace didenvelope {

/**
 * @brief JweCodec - Builds encrypted envelopes from public recipient keys
 *
 * Encryption needs no sender private key; sender_kid is an unauthenticated
 * hint bound into the key derivation.
 */
class JweCodec {
public:
    /**
     * @brief Recipient identity and public key
     */
    struct Recipient {
        std::string kid;  ///< Recipient key identifier
        Jwk public_key;   ///< P-256 or secp256k1 public JWK
    };

    /**
     * @brief Build a recipient from a verification key
     */
    static Recipient recipient_from(const VerificationKey& key);

    /**
     * @brief Encrypt to one or more recipients
     * @param plaintext Data to encrypt
     * @param recipients Recipients, all on the same curve
     * @param sender_kid Sender hint written into every recipient header
     * @param protected_header Header template (only typ and cty are honoured)
     * @return Encrypted envelope
     * @throws EnvelopeError INVALID_PARAMETER, UNSUPPORTED_ALGORITHM or INVALID_KEY
     */
    static Jwe encrypt(
        const std::vector<uint8_t>& plaintext,
        const std::vector<Recipient>& recipients,
        const std::optional<std::string>& sender_kid,
        const std::optional<JweProtected>& protected_header = std::nullopt
    );

    /**
     * @brief Encrypt to a single recipient without building an envelope
     * @param plaintext Data to encrypt
     * @param aad Additional authenticated data
     * @param recipient Recipient
     * @param sender_kid Sender hint bound into the key derivation
     * @return Raw encryption output
     */
    static EncryptedContent encrypt_for(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& aad,
        const Recipient& recipient,
        const std::optional<std::string>& sender_kid
    );

    /**
     * @brief Derive the key-encryption key for one recipient
     * @param shared_secret ECDH output
     * @param sender_kid Sender hint (apu), empty when absent
     * @param recipient_kid Recipient key id (apv)
     * @return 32-byte KEK
     */
    static std::vector<uint8_t> derive_kek(
        const std::vector<uint8_t>& shared_secret,
        const std::optional<std::string>& sender_kid,
        const std::string& recipient_kid
    );

    /**
     * @brief Protected apv value: base64url(SHA-256(kids joined by '.'))
     * @param recipients Recipients in envelope order
     * @return Base64url digest
     */
    static std::string recipients_apv(const std::vector<Recipient>& recipients);
};

} // namespace didenvelope
