/**
 * @file key_manager.hpp
 * @brief Agent key store and capability lookup
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Maps key ids to agent keys and hands out capability-typed handles.
 * Lookups take a shared lock; adding or removing keys takes it exclusively.
 */

#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "didenvelope/agent_key.hpp"
#include "didenvelope/key_resolver.hpp"

namespace didenvelope {

class LocalAgentKey;

/**
 * @brief KeyManager - Thread-safe key store with DID fallback resolution
 */
class KeyManager {
public:
    /**
     * @brief Create key manager
     * @param resolver Resolver consulted for unknown verification keys
     *                 (nullptr for local keys only)
     */
    explicit KeyManager(std::shared_ptr<KeyResolver> resolver = std::make_shared<DidKeyResolver>());

    // Non-copyable, non-movable
    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;
    KeyManager(KeyManager&&) = delete;
    KeyManager& operator=(KeyManager&&) = delete;

    // ========================================================================
    // Key Management
    // ========================================================================

    /**
     * @brief Generate and store a new local key
     * @param type Key type
     * @param key_id Key identifier (default: did:key DID URL)
     * @return Generated key
     * @throws EnvelopeError INVALID_PARAMETER if the id is already taken
     */
    std::shared_ptr<LocalAgentKey> generate_key(KeyType type, const std::string& key_id = "");

    /**
     * @brief Store an agent key (local, remote or HSM-backed)
     * @param key Key to store
     * @throws EnvelopeError INVALID_PARAMETER for null keys or duplicate ids
     */
    void add_key(std::shared_ptr<AgentKey> key);

    /**
     * @brief Register a peer's public verification key
     * @param key Verification key (replaces an existing one with the same id)
     * @throws EnvelopeError INVALID_PARAMETER for null keys
     */
    void add_verification_key(std::shared_ptr<const VerificationKey> key);

    /**
     * @brief Remove a local key or registered verification key
     * @param key_id Key identifier
     * @return true if something was removed
     */
    bool remove_key(const std::string& key_id);

    /**
     * @brief Whether a local key with this id is stored
     */
    bool has_key(const std::string& key_id) const;

    /**
     * @brief Whether a local key with this id can decrypt envelopes
     */
    bool can_decrypt(const std::string& key_id) const;

    /**
     * @brief Ids of all local keys, sorted
     */
    std::vector<std::string> list_keys() const;

    // ========================================================================
    // Capability Lookup
    // ========================================================================

    /**
     * @brief Get a local key able to sign
     * @throws EnvelopeError KEY_NOT_FOUND or UNSUPPORTED_ALGORITHM
     */
    std::shared_ptr<const SigningKey> get_signing_key(const std::string& key_id) const;

    /**
     * @brief Get a local key able to encrypt
     * @throws EnvelopeError KEY_NOT_FOUND or UNSUPPORTED_ALGORITHM (e.g. Ed25519)
     */
    std::shared_ptr<const EncryptionKey> get_encryption_key(const std::string& key_id) const;

    /**
     * @brief Get a local key able to decrypt
     * @throws EnvelopeError KEY_NOT_FOUND or UNSUPPORTED_ALGORITHM (e.g. Ed25519)
     */
    std::shared_ptr<const DecryptionKey> get_decryption_key(const std::string& key_id) const;

    /**
     * @brief Find a verification key: local keys, then registered keys, then the resolver
     * @param key_id DID or key identifier
     * @return Verification key
     * @throws EnvelopeError KEY_NOT_FOUND, or INVALID_KEY if the resolved JWK is unusable
     */
    std::shared_ptr<const VerificationKey> resolve_verification_key(const std::string& key_id) const;

private:
    std::shared_ptr<AgentKey> find_local(const std::string& key_id) const;

    std::shared_ptr<KeyResolver> resolver_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<AgentKey>> keys_;
    std::map<std::string, std::shared_ptr<const VerificationKey>> verification_keys_;
};

} // namespace didenvelope
