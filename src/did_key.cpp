/**
 * @file did_key.cpp
 * @brief Implementation of did:key encoding and resolution
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/did_key.hpp"
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/ec_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/security_config.hpp"
#include "didenvelope/utilities.hpp"

#include <cstddef>

namespace didenvelope {

namespace {
    constexpr uint64_t MULTICODEC_ED25519_PUB = 0xed;
    constexpr uint64_t MULTICODEC_P256_PUB = 0x1200;
    constexpr uint64_t MULTICODEC_SECP256K1_PUB = 0xe7;

    void append_varint(std::vector<uint8_t>& out, uint64_t value) {
        while (value >= 0x80) {
            out.push_back(static_cast<uint8_t>((value & 0x7f) | 0x80));
            value >>= 7;
        }
        out.push_back(static_cast<uint8_t>(value));
    }

    std::optional<uint64_t> read_varint(const std::vector<uint8_t>& in, size_t& offset) {
        uint64_t value = 0;
        for (int shift = 0; shift < 63 && offset < in.size(); shift += 7) {
            uint8_t byte = in[offset++];
            value |= static_cast<uint64_t>(byte & 0x7f) << shift;
            if ((byte & 0x80) == 0) {
                return value;
            }
        }
        return std::nullopt;
    }

    uint64_t multicodec_for(KeyType type) {
        switch (type) {
            case KeyType::ED25519: return MULTICODEC_ED25519_PUB;
            case KeyType::P256: return MULTICODEC_P256_PUB;
            case KeyType::SECP256K1: return MULTICODEC_SECP256K1_PUB;
        }
        return MULTICODEC_ED25519_PUB;
    }

    // Ed25519 keys are raw, EC keys are compressed SEC1
    std::vector<uint8_t> canonical_key_bytes(KeyType type, const std::vector<uint8_t>& public_key) {
        if (type == KeyType::ED25519) {
            if (public_key.size() != security::ED25519_PUBKEY_SIZE) {
                throw EnvelopeError(ErrorKind::INVALID_KEY, "Ed25519 public key must be 32 bytes");
            }
            return public_key;
        }

        EcCurve curve = type == KeyType::P256 ? EcCurve::P256 : EcCurve::SECP256K1;
        auto compressed = EcCrypto::compress_public_key(curve, public_key);
        if (!compressed) {
            throw EnvelopeError(ErrorKind::INVALID_KEY, "public key is not a valid " + key_type_to_string(type) + " point");
        }
        return *compressed;
    }
}

std::string DidKey::multibase(KeyType type, const std::vector<uint8_t>& public_key) {
    std::vector<uint8_t> encoded;
    append_varint(encoded, multicodec_for(type));

    std::vector<uint8_t> key_bytes = canonical_key_bytes(type, public_key);
    encoded.insert(encoded.end(), key_bytes.begin(), key_bytes.end());

    return "z" + AgentCrypto::bytes_to_base58(encoded);
}

std::string DidKey::encode(KeyType type, const std::vector<uint8_t>& public_key) {
    return std::string(PREFIX) + multibase(type, public_key);
}

std::string DidKey::default_key_id(KeyType type, const std::vector<uint8_t>& public_key) {
    std::string fragment = multibase(type, public_key);
    return std::string(PREFIX) + fragment + "#" + fragment;
}

std::optional<Jwk> DidKey::resolve(const std::string& did_or_kid) {
    if (!security::validate_key_id(did_or_kid) || !utilities::starts_with(did_or_kid, PREFIX)) {
        return std::nullopt;
    }

    std::string did = did_or_kid;
    std::string fragment;
    size_t hash = did_or_kid.find('#');
    if (hash != std::string::npos) {
        did = did_or_kid.substr(0, hash);
        fragment = did_or_kid.substr(hash + 1);
    }

    std::string method_specific = did.substr(std::string(PREFIX).size());
    if (method_specific.size() < 2 || method_specific[0] != 'z') {
        return std::nullopt;
    }

    auto decoded = AgentCrypto::base58_to_bytes(method_specific.substr(1));
    if (!decoded) {
        return std::nullopt;
    }

    size_t offset = 0;
    auto codec = read_varint(*decoded, offset);
    if (!codec) {
        return std::nullopt;
    }

    KeyType type;
    if (*codec == MULTICODEC_ED25519_PUB) {
        type = KeyType::ED25519;
    } else if (*codec == MULTICODEC_P256_PUB) {
        type = KeyType::P256;
    } else if (*codec == MULTICODEC_SECP256K1_PUB) {
        type = KeyType::SECP256K1;
    } else {
        return std::nullopt;
    }

    std::vector<uint8_t> key_bytes(decoded->begin() + static_cast<std::ptrdiff_t>(offset), decoded->end());
    std::string kid = did + "#" + (fragment.empty() ? method_specific : fragment);

    try {
        return Jwk::from_public_key(type, key_bytes, kid);
    } catch (const EnvelopeError& e) {
        utilities::log_debug("Rejected did:key " + did + ": " + e.reason());
        return std::nullopt;
    }
}

} // namespace didenvelope
