/**
 * @file agent_key.hpp
 * @brief Capability-typed key interfaces
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A key exposes only the capabilities its algorithm supports:
 * - SigningKey: produce JWS signatures
 * - VerificationKey: check JWS signatures (public material only)
 * - EncryptionKey: build ECDH-ES+A256KW / A256GCM envelopes
 * - DecryptionKey: open envelopes addressed to this key
 *
 * Remote or HSM-backed keys implement the same interfaces.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "didenvelope/jwk.hpp"
#include "didenvelope/message_types.hpp"

namespace didenvelope {

/**
 * @brief JWS signature algorithms
 */
enum class JwsAlgorithm {
    EDDSA,   ///< Ed25519
    ES256,   ///< ECDSA P-256 / SHA-256
    ES256K   ///< ECDSA secp256k1 / SHA-256
};

/**
 * @brief JWE key management algorithms
 */
enum class JweAlgorithm {
    ECDH_ES_A256KW   ///< ECDH-ES with AES-256 key wrap
};

/**
 * @brief JWE content encryption algorithms
 */
enum class JweEncryption {
    A256GCM          ///< AES-256-GCM
};

std::string jws_algorithm_to_string(JwsAlgorithm alg);
std::optional<JwsAlgorithm> jws_algorithm_from_string(const std::string& alg);
std::string jwe_algorithm_to_string(JweAlgorithm alg);
std::string jwe_encryption_to_string(JweEncryption enc);

/**
 * @brief Signature algorithm a key type signs with
 * @param type Key type
 * @return EdDSA, ES256 or ES256K
 */
JwsAlgorithm jws_algorithm_for(KeyType type);

/**
 * @brief Output of a single-recipient encryption
 */
struct EncryptedContent {
    std::vector<uint8_t> ciphertext;     ///< AES-256-GCM ciphertext
    std::vector<uint8_t> iv;             ///< 96-bit nonce
    std::vector<uint8_t> tag;            ///< 128-bit authentication tag
    std::vector<uint8_t> encrypted_key;  ///< CEK wrapped for the recipient
    Jwk epk;                             ///< Ephemeral public key
};

// ============================================================================
// Capability Interfaces
// ============================================================================

/**
 * @brief AgentKey - Identity of a key held by an agent
 */
class AgentKey {
public:
    virtual ~AgentKey() = default;

    /**
     * @brief Stable key identifier (usually a DID URL)
     */
    virtual const std::string& key_id() const = 0;

    /**
     * @brief DID this key authenticates as
     */
    virtual const std::string& did() const = 0;

    virtual KeyType key_type() const = 0;

    /**
     * @brief Public key as a JWK (never contains private material)
     */
    virtual Jwk public_key_jwk() const = 0;
};

/**
 * @brief VerificationKey - Public key able to check signatures
 */
class VerificationKey {
public:
    virtual ~VerificationKey() = default;

    virtual const std::string& key_id() const = 0;
    virtual Jwk public_key_jwk() const = 0;

    /**
     * @brief Verify a signature
     * @param signing_input Bytes that were signed (protected "." payload)
     * @param signature Raw signature bytes
     * @param protected_header Header naming the algorithm
     * @return true only if the algorithm matches this key and the signature is valid
     */
    virtual bool verify_signature(
        const std::vector<uint8_t>& signing_input,
        const std::vector<uint8_t>& signature,
        const JwsProtected& protected_header
    ) const = 0;
};

/**
 * @brief SigningKey - Key able to produce signatures
 */
class SigningKey : public virtual AgentKey {
public:
    /**
     * @brief Sign data with the key's native algorithm
     * @param data Bytes to sign
     * @return Raw signature (64 bytes for all supported algorithms)
     */
    virtual std::vector<uint8_t> sign(const std::vector<uint8_t>& data) const = 0;

    /**
     * @brief Algorithm this key signs with
     */
    virtual JwsAlgorithm recommended_jws_alg() const = 0;

    /**
     * @brief Create a signed envelope
     * @param payload Payload bytes
     * @param protected_header Header template (alg is always overwritten)
     * @return JWS with one signature whose header.kid is this key's id
     */
    virtual Jws create_jws(
        const std::vector<uint8_t>& payload,
        const std::optional<JwsProtected>& protected_header = std::nullopt
    ) const;
};

/**
 * @brief EncryptionKey - Key able to encrypt to other parties
 */
class EncryptionKey : public virtual AgentKey {
public:
    /**
     * @brief Encrypt for one recipient using ECDH-ES+A256KW and A256GCM
     * @param plaintext Data to encrypt
     * @param aad Additional authenticated data (may be empty)
     * @param recipient Recipient public key
     * @return Ciphertext, nonce, tag, wrapped CEK and ephemeral key
     * @throws EnvelopeError UNSUPPORTED_ALGORITHM or INVALID_KEY
     */
    virtual EncryptedContent encrypt(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& aad,
        const VerificationKey& recipient
    ) const = 0;

    std::pair<JweAlgorithm, JweEncryption> recommended_jwe_alg_enc() const {
        return {JweAlgorithm::ECDH_ES_A256KW, JweEncryption::A256GCM};
    }

    /**
     * @brief Create a multi-recipient encrypted envelope with this key as sender
     * @param plaintext Data to encrypt
     * @param recipients Recipient keys (at least one, same curve)
     * @param protected_header Header template (only typ and cty are honoured)
     * @return JWE whose recipient headers carry sender_kid = this key's id
     */
    virtual Jwe create_jwe(
        const std::vector<uint8_t>& plaintext,
        const std::vector<std::shared_ptr<const VerificationKey>>& recipients,
        const std::optional<JweProtected>& protected_header = std::nullopt
    ) const;
};

/**
 * @brief DecryptionKey - Key able to open envelopes addressed to it
 */
class DecryptionKey : public virtual AgentKey {
public:
    /**
     * @brief Decrypt content encrypted to this key
     * @param ciphertext AES-GCM ciphertext
     * @param encrypted_key CEK wrapped for this key
     * @param iv Nonce
     * @param tag Authentication tag
     * @param aad Additional authenticated data
     * @param epk Sender's ephemeral public key
     * @param sender_kid Sender hint bound into the key derivation
     * @return Plaintext
     * @throws EnvelopeError DECRYPTION_FAILED on any failure
     */
    virtual std::vector<uint8_t> decrypt(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& encrypted_key,
        const std::vector<uint8_t>& iv,
        const std::vector<uint8_t>& tag,
        const std::vector<uint8_t>& aad,
        const Jwk& epk,
        const std::optional<std::string>& sender_kid
    ) const = 0;

    /**
     * @brief Open a JWE using the recipient entry for this key's id
     * @param jwe Encrypted envelope
     * @return Plaintext
     * @throws EnvelopeError DECRYPTION_FAILED ("not an intended recipient" when absent)
     */
    virtual std::vector<uint8_t> unwrap_jwe(const Jwe& jwe) const;
};

} // namespace didenvelope
