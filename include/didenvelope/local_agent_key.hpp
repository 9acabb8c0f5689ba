/**
 * @file local_agent_key.hpp
 * @brief In-process agent keys and public verification keys
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * LocalAgentKey owns private key material for one of the supported
 * key types and dispatches on the type internally:
 * - Ed25519: signing only (libsodium)
 * - P-256 / secp256k1: signing and ECDH-ES encryption (OpenSSL)
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "didenvelope/agent_key.hpp"

namespace didenvelope {

/**
 * @brief LocalAgentKey - Private key held in process memory
 *
 * Immutable after construction. Private material is wiped on destruction
 * and only leaves the object through export_private_jwk().
 */
class LocalAgentKey : public SigningKey,
                      public EncryptionKey,
                      public DecryptionKey,
                      public VerificationKey {
public:
    /**
     * @brief Generate a new key
     * @param type Key type
     * @param key_id Key identifier (default: did:key DID URL)
     * @return New key
     */
    static std::shared_ptr<LocalAgentKey> generate(KeyType type, const std::string& key_id = "");

    /**
     * @brief Import raw private key bytes
     * @param type Key type
     * @param private_key Ed25519 seed or EC scalar (32 bytes)
     * @param key_id Key identifier (default: did:key DID URL)
     * @param did Controlling DID (default: did:key of the public key)
     * @return Imported key
     * @throws EnvelopeError INVALID_KEY for invalid key bytes
     */
    static std::shared_ptr<LocalAgentKey> from_private_key(
        KeyType type,
        const std::vector<uint8_t>& private_key,
        const std::string& key_id = "",
        const std::string& did = ""
    );

    /**
     * @brief Import a private JWK (must carry "d")
     * @param jwk Private JWK; its kid becomes the key id when present
     * @param did Controlling DID (default: did:key of the public key)
     * @return Imported key
     * @throws EnvelopeError INVALID_KEY or UNSUPPORTED_ALGORITHM
     */
    static std::shared_ptr<LocalAgentKey> from_jwk(const Jwk& jwk, const std::string& did = "");

    ~LocalAgentKey() override;

    // Non-copyable, non-movable
    LocalAgentKey(const LocalAgentKey&) = delete;
    LocalAgentKey& operator=(const LocalAgentKey&) = delete;
    LocalAgentKey(LocalAgentKey&&) = delete;
    LocalAgentKey& operator=(LocalAgentKey&&) = delete;

    // ========================================================================
    // AgentKey / VerificationKey
    // ========================================================================

    const std::string& key_id() const override { return key_id_; }
    const std::string& did() const override { return did_; }
    KeyType key_type() const override { return type_; }
    Jwk public_key_jwk() const override;

    bool verify_signature(
        const std::vector<uint8_t>& signing_input,
        const std::vector<uint8_t>& signature,
        const JwsProtected& protected_header
    ) const override;

    // ========================================================================
    // SigningKey
    // ========================================================================

    std::vector<uint8_t> sign(const std::vector<uint8_t>& data) const override;
    JwsAlgorithm recommended_jws_alg() const override;

    // ========================================================================
    // EncryptionKey / DecryptionKey
    // ========================================================================

    /**
     * @throws EnvelopeError UNSUPPORTED_ALGORITHM for Ed25519 keys
     */
    EncryptedContent encrypt(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& aad,
        const VerificationKey& recipient
    ) const override;

    /**
     * @throws EnvelopeError UNSUPPORTED_ALGORITHM for Ed25519 keys
     */
    Jwe create_jwe(
        const std::vector<uint8_t>& plaintext,
        const std::vector<std::shared_ptr<const VerificationKey>>& recipients,
        const std::optional<JweProtected>& protected_header = std::nullopt
    ) const override;

    std::vector<uint8_t> decrypt(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& encrypted_key,
        const std::vector<uint8_t>& iv,
        const std::vector<uint8_t>& tag,
        const std::vector<uint8_t>& aad,
        const Jwk& epk,
        const std::optional<std::string>& sender_kid
    ) const override;

    /**
     * @brief Whether this key type supports ECDH encryption
     */
    bool supports_encryption() const { return type_ != KeyType::ED25519; }

    /**
     * @brief Export private key as JWK (SENSITIVE - audited)
     * @return JWK including "d"
     */
    Jwk export_private_jwk() const;

private:
    LocalAgentKey(KeyType type, std::vector<uint8_t> private_key, std::vector<uint8_t> public_key,
                  std::string key_id, std::string did);

    void require_encryption() const;

    KeyType type_;
    std::vector<uint8_t> private_key_;  ///< Ed25519 seed or EC scalar
    std::vector<uint8_t> public_key_;   ///< Ed25519 key or uncompressed SEC1 point
    std::string key_id_;
    std::string did_;
};

/**
 * @brief PublicVerificationKey - Verification key built from a public JWK
 */
class PublicVerificationKey : public VerificationKey {
public:
    /**
     * @brief Construct from a public JWK
     * @param key_id Key identifier
     * @param jwk Public JWK (private member is discarded)
     * @throws EnvelopeError INVALID_KEY or UNSUPPORTED_ALGORITHM
     */
    PublicVerificationKey(const std::string& key_id, const Jwk& jwk);

    const std::string& key_id() const override { return key_id_; }
    Jwk public_key_jwk() const override { return jwk_; }
    KeyType key_type() const { return type_; }

    bool verify_signature(
        const std::vector<uint8_t>& signing_input,
        const std::vector<uint8_t>& signature,
        const JwsProtected& protected_header
    ) const override;

    /**
     * @brief Verify the signature in a JWS made by this key
     * @param jws Signed envelope
     * @return Decoded payload
     * @throws EnvelopeError VERIFICATION_FAILED
     */
    std::vector<uint8_t> verify_jws(const Jws& jws) const;

private:
    std::string key_id_;
    Jwk jwk_;
    KeyType type_;
    std::vector<uint8_t> public_key_;
};

} // namespace didenvelope
