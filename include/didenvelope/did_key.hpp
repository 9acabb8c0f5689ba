/**
 * @file did_key.hpp
 * @brief did:key encoding and resolution
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * did:key:z<base58btc(multicodec varint || public key)>
 * - ed25519-pub   0xed   raw 32-byte key
 * - p256-pub      0x1200 compressed SEC1 point
 * - secp256k1-pub 0xe7   compressed SEC1 point
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "didenvelope/jwk.hpp"

namespace didenvelope {

/**
 * @brief DidKey - Self-certifying DIDs derived from a public key
 */
class DidKey {
public:
    /// Method prefix
    static constexpr const char* PREFIX = "did:key:";

    /**
     * @brief Multibase (base58btc, 'z') encoding of the multicodec key
     * @param type Key type
     * @param public_key Ed25519 key or SEC1 point (compressed or not)
     * @return Multibase string
     * @throws EnvelopeError INVALID_KEY for invalid key bytes
     */
    static std::string multibase(KeyType type, const std::vector<uint8_t>& public_key);

    /**
     * @brief did:key DID for a public key
     * @param type Key type
     * @param public_key Ed25519 key or SEC1 point
     * @return "did:key:z..."
     */
    static std::string encode(KeyType type, const std::vector<uint8_t>& public_key);

    /**
     * @brief Default key id: did#multibase
     * @param type Key type
     * @param public_key Ed25519 key or SEC1 point
     * @return DID URL
     */
    static std::string default_key_id(KeyType type, const std::vector<uint8_t>& public_key);

    /**
     * @brief Resolve a did:key DID or DID URL to a public JWK
     * @param did_or_kid "did:key:z..." optionally followed by "#fragment"
     * @return JWK with kid set to the DID URL, or std::nullopt if not a valid did:key
     */
    static std::optional<Jwk> resolve(const std::string& did_or_kid);
};

} // namespace didenvelope
