/**
 * @file message_types.cpp
 * @brief Implementation of envelope structures and serialization
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didenvelope/message_types.hpp"
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/security_config.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace didenvelope {

namespace {
    std::string encode_header(const std::string& header_json) {
        return AgentCrypto::bytes_to_base64url(std::vector<uint8_t>(header_json.begin(), header_json.end()));
    }

    std::optional<std::string> decode_header(const std::string& encoded) {
        auto bytes = AgentCrypto::base64url_to_bytes(encoded);
        if (!bytes) {
            return std::nullopt;
        }
        return std::string(bytes->begin(), bytes->end());
    }
}

// ============================================================================
// JWS Protected Header
// ============================================================================

std::string JwsProtected::to_json() const {
    json j;
    j["typ"] = typ;
    j["alg"] = alg;
    return j.dump();
}

std::optional<JwsProtected> JwsProtected::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        JwsProtected header;
        header.typ = j.value("typ", "");
        header.alg = j.at("alg").get<std::string>();

        return header;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string JwsProtected::encode() const {
    return encode_header(to_json());
}

std::optional<JwsProtected> JwsProtected::decode(const std::string& encoded) {
    auto header_json = decode_header(encoded);
    if (!header_json) {
        return std::nullopt;
    }
    return from_json(*header_json);
}

// ============================================================================
// JWS Serialization
// ============================================================================

std::string Jws::to_json() const {
    json j;
    j["payload"] = payload;

    json sigs = json::array();
    for (const auto& sig : signatures) {
        json s;
        s["protected"] = sig.protected_header;
        s["signature"] = sig.signature;
        s["header"] = {{"kid", sig.header.kid}};
        sigs.push_back(s);
    }
    j["signatures"] = sigs;

    return j.dump();
}

std::optional<Jws> Jws::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        Jws jws;
        jws.payload = j.at("payload").get<std::string>();

        const json& sigs = j.at("signatures");
        if (!sigs.is_array()) {
            return std::nullopt;
        }

        for (const auto& s : sigs) {
            JwsSignature sig;
            sig.protected_header = s.at("protected").get<std::string>();
            sig.signature = s.at("signature").get<std::string>();
            sig.header.kid = s.at("header").at("kid").get<std::string>();
            jws.signatures.push_back(sig);
        }

        return jws;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// JWE Protected Header
// ============================================================================

std::string JweProtected::to_json() const {
    json j;
    j["epk"] = json::parse(epk.public_only().to_json());
    j["apv"] = apv;
    j["typ"] = typ;
    j["enc"] = enc;
    j["alg"] = alg;
    if (cty) {
        j["cty"] = *cty;
    }
    return j.dump();
}

std::optional<JweProtected> JweProtected::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        auto epk = Jwk::from_json(j.at("epk").dump());
        if (!epk) {
            return std::nullopt;
        }

        JweProtected header;
        header.epk = *epk;
        header.apv = j.value("apv", "");
        header.typ = j.value("typ", "");
        header.enc = j.at("enc").get<std::string>();
        header.alg = j.at("alg").get<std::string>();
        if (j.contains("cty")) {
            header.cty = j.at("cty").get<std::string>();
        }

        return header;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string JweProtected::encode() const {
    return encode_header(to_json());
}

std::optional<JweProtected> JweProtected::decode(const std::string& encoded) {
    auto header_json = decode_header(encoded);
    if (!header_json) {
        return std::nullopt;
    }
    return from_json(*header_json);
}

// ============================================================================
// JWE Serialization
// ============================================================================

std::string Jwe::to_json() const {
    json j;
    j["ciphertext"] = ciphertext;
    j["protected"] = protected_header;
    j["tag"] = tag;
    j["iv"] = iv;

    json recips = json::array();
    for (const auto& recipient : recipients) {
        json header;
        header["kid"] = recipient.header.kid;
        if (recipient.header.sender_kid) {
            header["sender_kid"] = *recipient.header.sender_kid;
        }

        json r;
        r["encrypted_key"] = recipient.encrypted_key;
        r["header"] = header;
        recips.push_back(r);
    }
    j["recipients"] = recips;

    return j.dump();
}

std::optional<Jwe> Jwe::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        Jwe jwe;
        jwe.ciphertext = j.at("ciphertext").get<std::string>();
        jwe.protected_header = j.at("protected").get<std::string>();
        jwe.tag = j.at("tag").get<std::string>();
        jwe.iv = j.at("iv").get<std::string>();

        const json& recips = j.at("recipients");
        if (!recips.is_array()) {
            return std::nullopt;
        }

        for (const auto& r : recips) {
            JweRecipient recipient;
            recipient.encrypted_key = r.at("encrypted_key").get<std::string>();

            const json& header = r.at("header");
            recipient.header.kid = header.at("kid").get<std::string>();
            if (header.contains("sender_kid") && !header.at("sender_kid").is_null()) {
                recipient.header.sender_kid = header.at("sender_kid").get<std::string>();
            }

            if (!security::validate_key_id(recipient.header.kid) ||
                (recipient.header.sender_kid && !security::validate_key_id(*recipient.header.sender_kid))) {
                return std::nullopt;
            }

            jwe.recipients.push_back(recipient);
        }

        return jwe;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

const JweRecipient* Jwe::find_recipient(const std::string& kid) const {
    for (const auto& recipient : recipients) {
        if (recipient.header.kid == kid) {
            return &recipient;
        }
    }
    return nullptr;
}

} // namespace didenvelope
