/**
 * @file key_manager.cpp
 * @brief Implementation of the agent key store
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/key_manager.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/local_agent_key.hpp"
#include "didenvelope/utilities.hpp"

#include <mutex>

namespace didenvelope {

KeyManager::KeyManager(std::shared_ptr<KeyResolver> resolver)
    : resolver_(std::move(resolver)) {
}

// ============================================================================
// Key Management
// ============================================================================

std::shared_ptr<LocalAgentKey> KeyManager::generate_key(KeyType type, const std::string& key_id) {
    auto key = LocalAgentKey::generate(type, key_id);
    add_key(key);
    return key;
}

void KeyManager::add_key(std::shared_ptr<AgentKey> key) {
    if (!key) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "null key");
    }

    const std::string key_id = key->key_id();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (keys_.count(key_id) > 0) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "key already exists: " + key_id);
    }
    keys_.emplace(key_id, std::move(key));
    lock.unlock();

    utilities::log_debug("Added key " + key_id);
}

void KeyManager::add_verification_key(std::shared_ptr<const VerificationKey> key) {
    if (!key) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "null verification key");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    verification_keys_[key->key_id()] = std::move(key);
}

bool KeyManager::remove_key(const std::string& key_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = keys_.erase(key_id) + verification_keys_.erase(key_id);
    return removed > 0;
}

bool KeyManager::has_key(const std::string& key_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return keys_.count(key_id) > 0;
}

bool KeyManager::can_decrypt(const std::string& key_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = keys_.find(key_id);
    if (it == keys_.end() || it->second->key_type() == KeyType::ED25519) {
        return false;
    }
    return std::dynamic_pointer_cast<const DecryptionKey>(it->second) != nullptr;
}

std::vector<std::string> KeyManager::list_keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> ids;
    ids.reserve(keys_.size());
    for (const auto& entry : keys_) {
        ids.push_back(entry.first);
    }
    return ids;
}

// ============================================================================
// Capability Lookup
// ============================================================================

std::shared_ptr<AgentKey> KeyManager::find_local(const std::string& key_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = keys_.find(key_id);
    if (it == keys_.end()) {
        throw EnvelopeError(ErrorKind::KEY_NOT_FOUND, "key not found: " + key_id);
    }
    return it->second;
}

std::shared_ptr<const SigningKey> KeyManager::get_signing_key(const std::string& key_id) const {
    auto signing = std::dynamic_pointer_cast<const SigningKey>(find_local(key_id));
    if (!signing) {
        throw EnvelopeError(ErrorKind::UNSUPPORTED_ALGORITHM, "key cannot sign: " + key_id);
    }
    return signing;
}

std::shared_ptr<const EncryptionKey> KeyManager::get_encryption_key(const std::string& key_id) const {
    auto key = find_local(key_id);

    auto encryption = std::dynamic_pointer_cast<const EncryptionKey>(key);
    if (!encryption || key->key_type() == KeyType::ED25519) {
        throw EnvelopeError(ErrorKind::UNSUPPORTED_ALGORITHM, "key cannot encrypt: " + key_id);
    }
    return encryption;
}

std::shared_ptr<const DecryptionKey> KeyManager::get_decryption_key(const std::string& key_id) const {
    auto key = find_local(key_id);

    auto decryption = std::dynamic_pointer_cast<const DecryptionKey>(key);
    if (!decryption || key->key_type() == KeyType::ED25519) {
        throw EnvelopeError(ErrorKind::UNSUPPORTED_ALGORITHM, "key cannot decrypt: " + key_id);
    }
    return decryption;
}

std::shared_ptr<const VerificationKey> KeyManager::resolve_verification_key(const std::string& key_id) const {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto local = keys_.find(key_id);
        if (local != keys_.end()) {
            auto verification = std::dynamic_pointer_cast<const VerificationKey>(local->second);
            if (verification) {
                return verification;
            }
            return std::make_shared<PublicVerificationKey>(key_id, local->second->public_key_jwk());
        }

        auto registered = verification_keys_.find(key_id);
        if (registered != verification_keys_.end()) {
            return registered->second;
        }
    }

    if (resolver_) {
        auto jwk = resolver_->resolve(key_id);
        if (jwk) {
            return std::make_shared<PublicVerificationKey>(key_id, *jwk);
        }
    }

    throw EnvelopeError(ErrorKind::KEY_NOT_FOUND, "verification key not found: " + key_id);
}

} // namespace didenvelope
