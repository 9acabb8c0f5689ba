/**
 * @file agent_crypto.hpp
 * @brief Symmetric and Ed25519 primitives for envelope agents
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides Ed25519 signatures, AES-256-GCM, SHA-256, secure randomness and
 * the base64url/base58btc encodings used on the wire.
 */

#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include <string>
#include <optional>
#include <sodium.h>

namespace didenvelope {

/**
 * @brief Ed25519 signature key pair
 */
struct Ed25519KeyPair {
    std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> public_key;
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret_key;
};

/**
 * @brief Output of one AES-256-GCM encryption
 */
struct GcmCiphertext {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;
};

/**
 * @brief AgentCrypto - Cryptographic primitives for agents
 *
 * Thread-safe cryptographic primitives using libsodium and OpenSSL.
 * All methods are stateless.
 */
class AgentCrypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Digital Signatures (Ed25519)
    // ========================================================================

    /**
     * @brief Generate Ed25519 signature key pair
     * @return Ed25519KeyPair with public and secret keys
     */
    static Ed25519KeyPair generate_ed25519_keypair();

    /**
     * @brief Derive Ed25519 key pair from a 32-byte seed
     * @param seed Private seed (32 bytes)
     * @return Key pair, or std::nullopt if the seed has the wrong length
     */
    static std::optional<Ed25519KeyPair> ed25519_keypair_from_seed(const std::vector<uint8_t>& seed);

    /**
     * @brief Extract the 32-byte seed from an Ed25519 secret key
     * @param secret_key Secret key (64 bytes)
     * @return Seed bytes
     */
    static std::vector<uint8_t> ed25519_seed(
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    /**
     * @brief Sign a message with Ed25519
     * @param message Message to sign
     * @param secret_key Secret signing key
     * @return Signature (64 bytes)
     */
    static std::vector<uint8_t> sign_ed25519(
        const std::vector<uint8_t>& message,
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    /**
     * @brief Verify Ed25519 signature
     * @param message Original message
     * @param signature Signature to verify (64 bytes)
     * @param public_key Public key of signer (32 bytes)
     * @return true if signature is valid, false otherwise
     */
    static bool verify_ed25519(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const std::vector<uint8_t>& public_key
    );

    // ========================================================================
    // Content Encryption (AES-256-GCM)
    // ========================================================================

    /**
     * @brief Encrypt with AES-256-GCM
     * @param plaintext Data to encrypt
     * @param key Content-encryption key (32 bytes)
     * @param iv Nonce (12 bytes) - must never be reused with same key
     * @param aad Additional authenticated data (may be empty)
     * @return Ciphertext and 16-byte tag, or std::nullopt on bad parameters
     */
    static std::optional<GcmCiphertext> encrypt_aes256gcm(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& iv,
        const std::vector<uint8_t>& aad
    );

    /**
     * @brief Decrypt with AES-256-GCM
     * @param ciphertext Encrypted data
     * @param tag Authentication tag (16 bytes)
     * @param key Content-encryption key (32 bytes)
     * @param iv Nonce used for encryption (12 bytes)
     * @param aad Additional authenticated data used for encryption
     * @return Plaintext, or std::nullopt if authentication fails
     */
    static std::optional<std::vector<uint8_t>> decrypt_aes256gcm(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& tag,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& iv,
        const std::vector<uint8_t>& aad
    );

    // ========================================================================
    // Hashing
    // ========================================================================

    /**
     * @brief Compute SHA-256 digest
     * @param data Input bytes
     * @return Digest (32 bytes)
     */
    static std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

    // ========================================================================
    // Utility Functions
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     * @param size Number of random bytes to generate
     * @return Vector of random bytes
     */
    static std::vector<uint8_t> generate_random_bytes(size_t size);

    /**
     * @brief Constant-time comparison of byte arrays (prevents timing attacks)
     * @param a First byte array
     * @param b Second byte array
     * @return true if arrays are equal, false otherwise
     */
    static bool constant_time_compare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    /**
     * @brief Convert bytes to hexadecimal string
     * @param bytes Input bytes
     * @return Lowercase hexadecimal string
     */
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert hexadecimal string to bytes
     * @param hex Hexadecimal string
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

    /**
     * @brief Encode bytes as base64url without padding
     * @param bytes Input bytes
     * @return Base64url string
     */
    static std::string bytes_to_base64url(const std::vector<uint8_t>& bytes);

    /**
     * @brief Decode base64url (trailing padding tolerated)
     * @param base64url Base64url string
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64url_to_bytes(const std::string& base64url);

    /**
     * @brief Encode bytes with the bitcoin base58 alphabet
     * @param bytes Input bytes
     * @return Base58btc string
     */
    static std::string bytes_to_base58(const std::vector<uint8_t>& bytes);

    /**
     * @brief Decode a base58btc string
     * @param base58 Base58btc string
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base58_to_bytes(const std::string& base58);

    /**
     * @brief Securely zero memory (prevents compiler optimization from removing)
     * @param data Pointer to memory to zero
     * @param size Size of memory region
     */
    static void secure_zero(void* data, size_t size);

    /**
     * @brief Securely zero a byte vector in place
     * @param data Vector to wipe
     */
    static void secure_zero(std::vector<uint8_t>& data);
};

} // namespace didenvelope
