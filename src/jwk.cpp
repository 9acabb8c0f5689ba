/**
 * @file jwk.cpp
 * @brief Implementation of JSON Web Key helpers
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/jwk.hpp"
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/ec_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/security_config.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace didenvelope {

std::string key_type_to_string(KeyType type) {
    switch (type) {
        case KeyType::ED25519: return "Ed25519";
        case KeyType::P256: return "P-256";
        case KeyType::SECP256K1: return "secp256k1";
        default: return "unknown";
    }
}

Jwk Jwk::from_public_key(KeyType type, const std::vector<uint8_t>& public_key, const std::string& kid) {
    Jwk jwk;
    jwk.kid = kid;

    if (type == KeyType::ED25519) {
        if (public_key.size() != security::ED25519_PUBKEY_SIZE) {
            throw EnvelopeError(ErrorKind::INVALID_KEY, "Ed25519 public key must be 32 bytes");
        }
        jwk.kty = "OKP";
        jwk.crv = "Ed25519";
        jwk.x = AgentCrypto::bytes_to_base64url(public_key);
        return jwk;
    }

    EcCurve curve = type == KeyType::P256 ? EcCurve::P256 : EcCurve::SECP256K1;
    auto point = EcCrypto::decode_public_key(curve, public_key);
    if (!point) {
        throw EnvelopeError(ErrorKind::INVALID_KEY, "public key is not a valid " + key_type_to_string(type) + " point");
    }

    const size_t n = security::EC_FIELD_SIZE;
    jwk.kty = "EC";
    jwk.crv = EcCrypto::curve_name(curve);
    jwk.x = AgentCrypto::bytes_to_base64url(std::vector<uint8_t>(point->begin() + 1, point->begin() + 1 + n));
    jwk.y = AgentCrypto::bytes_to_base64url(std::vector<uint8_t>(point->begin() + 1 + n, point->end()));
    return jwk;
}

std::optional<KeyType> Jwk::key_type() const {
    if (kty == "OKP" && crv == "Ed25519") return KeyType::ED25519;
    if (kty == "EC" && crv == "P-256") return KeyType::P256;
    if (kty == "EC" && crv == "secp256k1") return KeyType::SECP256K1;
    return std::nullopt;
}

std::optional<std::vector<uint8_t>> Jwk::public_key_bytes() const {
    auto type = key_type();
    if (!type) {
        return std::nullopt;
    }

    auto x_bytes = AgentCrypto::base64url_to_bytes(x);
    if (!x_bytes) {
        return std::nullopt;
    }

    if (*type == KeyType::ED25519) {
        if (x_bytes->size() != security::ED25519_PUBKEY_SIZE) {
            return std::nullopt;
        }
        return x_bytes;
    }

    auto y_bytes = AgentCrypto::base64url_to_bytes(y);
    if (!y_bytes ||
        x_bytes->size() != security::EC_FIELD_SIZE ||
        y_bytes->size() != security::EC_FIELD_SIZE) {
        return std::nullopt;
    }

    std::vector<uint8_t> point;
    point.reserve(security::EC_UNCOMPRESSED_POINT_SIZE);
    point.push_back(0x04);
    point.insert(point.end(), x_bytes->begin(), x_bytes->end());
    point.insert(point.end(), y_bytes->begin(), y_bytes->end());

    // Rejects points that are not on the curve
    EcCurve curve = *type == KeyType::P256 ? EcCurve::P256 : EcCurve::SECP256K1;
    return EcCrypto::decode_public_key(curve, point);
}

Jwk Jwk::public_only() const {
    Jwk copy = *this;
    copy.d.clear();
    return copy;
}

std::string Jwk::to_json() const {
    json j;
    j["kty"] = kty;
    j["crv"] = crv;
    j["x"] = x;
    if (!y.empty()) {
        j["y"] = y;
    }
    if (!d.empty()) {
        j["d"] = d;
    }
    if (!kid.empty()) {
        j["kid"] = kid;
    }
    return j.dump();
}

std::optional<Jwk> Jwk::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }

        Jwk jwk;
        jwk.kty = j.at("kty").get<std::string>();
        jwk.crv = j.at("crv").get<std::string>();
        jwk.x = j.at("x").get<std::string>();
        jwk.y = j.value("y", "");
        jwk.d = j.value("d", "");
        jwk.kid = j.value("kid", "");

        if (jwk.kty == "EC" && jwk.y.empty()) {
            return std::nullopt;
        }

        return jwk;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

bool Jwk::operator==(const Jwk& other) const {
    return kty == other.kty && crv == other.crv && x == other.x &&
           y == other.y && d == other.d && kid == other.kid;
}

} // namespace didenvelope
