/**
 * @file key_resolver.cpp
 * @brief Implementation of the built-in key resolvers
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/key_resolver.hpp"
#include "didenvelope/did_key.hpp"

namespace didenvelope {

// ============================================================================
// StaticKeyResolver
// ============================================================================

void StaticKeyResolver::add(const std::string& id, const Jwk& jwk) {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_[id] = jwk.public_only();
}

bool StaticKeyResolver::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.erase(id) > 0;
}

std::optional<Jwk> StaticKeyResolver::resolve(const std::string& did_or_kid) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = keys_.find(did_or_kid);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// DidKeyResolver
// ============================================================================

std::optional<Jwk> DidKeyResolver::resolve(const std::string& did_or_kid) const {
    return DidKey::resolve(did_or_kid);
}

// ============================================================================
// ChainedKeyResolver
// ============================================================================

ChainedKeyResolver::ChainedKeyResolver(std::vector<std::shared_ptr<KeyResolver>> resolvers)
    : resolvers_(std::move(resolvers)) {
}

std::optional<Jwk> ChainedKeyResolver::resolve(const std::string& did_or_kid) const {
    for (const auto& resolver : resolvers_) {
        if (!resolver) {
            continue;
        }
        auto jwk = resolver->resolve(did_or_kid);
        if (jwk) {
            return jwk;
        }
    }
    return std::nullopt;
}

} // namespace didenvelope
