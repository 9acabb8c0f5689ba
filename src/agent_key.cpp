/**
 * @file agent_key.cpp
 * @brief Shared behaviour of the capability interfaces
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/agent_key.hpp"
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/jwe.hpp"
#include "didenvelope/jws.hpp"
#include "didenvelope/utilities.hpp"

namespace didenvelope {

// ============================================================================
// Algorithm Names
// ============================================================================

std::string jws_algorithm_to_string(JwsAlgorithm alg) {
    switch (alg) {
        case JwsAlgorithm::EDDSA: return "EdDSA";
        case JwsAlgorithm::ES256: return "ES256";
        case JwsAlgorithm::ES256K: return "ES256K";
        default: return "unknown";
    }
}

std::optional<JwsAlgorithm> jws_algorithm_from_string(const std::string& alg) {
    if (alg == "EdDSA") return JwsAlgorithm::EDDSA;
    if (alg == "ES256") return JwsAlgorithm::ES256;
    if (alg == "ES256K") return JwsAlgorithm::ES256K;
    return std::nullopt;
}

std::string jwe_algorithm_to_string(JweAlgorithm alg) {
    switch (alg) {
        case JweAlgorithm::ECDH_ES_A256KW: return "ECDH-ES+A256KW";
        default: return "unknown";
    }
}

std::string jwe_encryption_to_string(JweEncryption enc) {
    switch (enc) {
        case JweEncryption::A256GCM: return "A256GCM";
        default: return "unknown";
    }
}

JwsAlgorithm jws_algorithm_for(KeyType type) {
    switch (type) {
        case KeyType::ED25519: return JwsAlgorithm::EDDSA;
        case KeyType::P256: return JwsAlgorithm::ES256;
        case KeyType::SECP256K1: return JwsAlgorithm::ES256K;
    }
    return JwsAlgorithm::EDDSA;
}

// ============================================================================
// SigningKey
// ============================================================================

Jws SigningKey::create_jws(
    const std::vector<uint8_t>& payload,
    const std::optional<JwsProtected>& protected_header
) const {
    return JwsCodec::sign(*this, payload, protected_header);
}

// ============================================================================
// EncryptionKey
// ============================================================================

Jwe EncryptionKey::create_jwe(
    const std::vector<uint8_t>& plaintext,
    const std::vector<std::shared_ptr<const VerificationKey>>& recipients,
    const std::optional<JweProtected>& protected_header
) const {
    std::vector<JweCodec::Recipient> resolved;
    resolved.reserve(recipients.size());
    for (const auto& recipient : recipients) {
        if (!recipient) {
            throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "null recipient key");
        }
        resolved.push_back(JweCodec::recipient_from(*recipient));
    }

    return JweCodec::encrypt(plaintext, resolved, key_id(), protected_header);
}

// ============================================================================
// DecryptionKey
// ============================================================================

std::vector<uint8_t> DecryptionKey::unwrap_jwe(const Jwe& jwe) const {
    const JweRecipient* recipient = jwe.find_recipient(key_id());
    if (recipient == nullptr) {
        throw EnvelopeError(ErrorKind::DECRYPTION_FAILED, "not an intended recipient");
    }

    // Every failure past recipient selection is reported uniformly
    auto header = JweProtected::decode(jwe.protected_header);
    if (!header) {
        utilities::log_debug("Malformed JWE protected header");
        throw EnvelopeError(ErrorKind::DECRYPTION_FAILED, "decryption failed");
    }
    if (header->alg != jwe_algorithm_to_string(JweAlgorithm::ECDH_ES_A256KW) ||
        header->enc != jwe_encryption_to_string(JweEncryption::A256GCM)) {
        utilities::log_debug("Unsupported JWE algorithm " + header->alg + "/" + header->enc);
        throw EnvelopeError(ErrorKind::DECRYPTION_FAILED, "decryption failed");
    }

    auto ciphertext = AgentCrypto::base64url_to_bytes(jwe.ciphertext);
    auto encrypted_key = AgentCrypto::base64url_to_bytes(recipient->encrypted_key);
    auto iv = AgentCrypto::base64url_to_bytes(jwe.iv);
    auto tag = AgentCrypto::base64url_to_bytes(jwe.tag);
    if (!ciphertext || !encrypted_key || !iv || !tag) {
        throw EnvelopeError(ErrorKind::DECRYPTION_FAILED, "decryption failed");
    }

    const std::vector<uint8_t> aad(jwe.protected_header.begin(), jwe.protected_header.end());

    return decrypt(*ciphertext, *encrypted_key, *iv, *tag, aad, header->epk, recipient->header.sender_kid);
}

} // namespace didenvelope
