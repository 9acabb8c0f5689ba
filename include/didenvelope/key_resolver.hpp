/**
 * @file key_resolver.hpp
 * @brief DID / key id resolution to public JWKs
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Full DID-document resolution lives outside this library; it plugs in
 * by implementing KeyResolver.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "didenvelope/jwk.hpp"

namespace didenvelope {

/**
 * @brief KeyResolver - Maps a DID or key id to a public JWK
 */
class KeyResolver {
public:
    virtual ~KeyResolver() = default;

    /**
     * @brief Resolve a DID or DID URL
     * @param did_or_kid DID or key identifier
     * @return Public JWK, or std::nullopt if unknown
     */
    virtual std::optional<Jwk> resolve(const std::string& did_or_kid) const = 0;
};

/**
 * @brief StaticKeyResolver - In-memory id to JWK table
 *
 * Thread-safe.
 */
class StaticKeyResolver : public KeyResolver {
public:
    /**
     * @brief Register a public key (private member is discarded)
     * @param id DID or key id
     * @param jwk Public JWK
     */
    void add(const std::string& id, const Jwk& jwk);

    /**
     * @brief Remove a registration
     * @param id DID or key id
     * @return true if an entry was removed
     */
    bool remove(const std::string& id);

    std::optional<Jwk> resolve(const std::string& did_or_kid) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Jwk> keys_;
};

/**
 * @brief DidKeyResolver - Resolves self-certifying did:key identifiers
 */
class DidKeyResolver : public KeyResolver {
public:
    std::optional<Jwk> resolve(const std::string& did_or_kid) const override;
};

/**
 * @brief ChainedKeyResolver - Tries resolvers in order, first hit wins
 */
class ChainedKeyResolver : public KeyResolver {
public:
    explicit ChainedKeyResolver(std::vector<std::shared_ptr<KeyResolver>> resolvers);

    std::optional<Jwk> resolve(const std::string& did_or_kid) const override;

private:
    std::vector<std::shared_ptr<KeyResolver>> resolvers_;
};

} // namespace didenvelope
