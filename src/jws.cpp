/**
 * @file jws.cpp
 * @brief Implementation of JWS signing and verification
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/jws.hpp"
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/security_config.hpp"
#include "didenvelope/utilities.hpp"

namespace didenvelope {

std::vector<uint8_t> JwsCodec::signing_input(const std::string& protected_b64, const std::string& payload_b64) {
    std::vector<uint8_t> input;
    input.reserve(protected_b64.size() + 1 + payload_b64.size());
    input.insert(input.end(), protected_b64.begin(), protected_b64.end());
    input.push_back('.');
    input.insert(input.end(), payload_b64.begin(), payload_b64.end());
    return input;
}

// ============================================================================
// Signing
// ============================================================================

Jws JwsCodec::sign(
    const SigningKey& key,
    const std::vector<uint8_t>& payload,
    const std::optional<JwsProtected>& protected_header
) {
    JwsProtected header = protected_header.value_or(JwsProtected{});
    if (header.typ.empty()) {
        header.typ = SIGNED_MESSAGE_TYP;
    }
    header.alg = jws_algorithm_to_string(key.recommended_jws_alg());

    Jws jws;
    jws.payload = AgentCrypto::bytes_to_base64url(payload);

    JwsSignature signature;
    signature.protected_header = header.encode();
    signature.signature = AgentCrypto::bytes_to_base64url(
        key.sign(signing_input(signature.protected_header, jws.payload)));
    signature.header.kid = key.key_id();

    jws.signatures.push_back(signature);
    return jws;
}

// ============================================================================
// Verification
// ============================================================================

bool JwsCodec::verify_signature(const Jws& jws, const JwsSignature& signature, const VerificationKey& key) {
    auto header = JwsProtected::decode(signature.protected_header);
    if (!header) {
        return false;
    }

    auto signature_bytes = AgentCrypto::base64url_to_bytes(signature.signature);
    if (!signature_bytes) {
        return false;
    }

    return key.verify_signature(
        signing_input(signature.protected_header, jws.payload),
        *signature_bytes,
        *header
    );
}

JwsCodec::Verified JwsCodec::verify(const Jws& jws, const KeyLookup& lookup) {
    if (jws.signatures.empty()) {
        throw EnvelopeError(ErrorKind::VERIFICATION_FAILED, "envelope carries no signatures");
    }
    if (jws.signatures.size() > security::MAX_SIGNATURES) {
        throw EnvelopeError(ErrorKind::INVALID_FORMAT, "too many signatures");
    }

    Verified result;
    size_t verified = 0;

    for (const auto& signature : jws.signatures) {
        if (!security::validate_key_id(signature.header.kid)) {
            utilities::log_warn("Skipping signature with invalid key id");
            continue;
        }

        auto key = lookup(signature.header.kid);
        if (!key) {
            utilities::log_debug("No verification key for " + signature.header.kid);
            continue;
        }

        if (!verify_signature(jws, signature, *key)) {
            utilities::log_warn("Signature verification failed for " + signature.header.kid);
            throw EnvelopeError(ErrorKind::VERIFICATION_FAILED, "signature verification failed");
        }

        if (verified == 0) {
            result.signer_kid = signature.header.kid;
        }
        verified++;
    }

    if (verified == 0) {
        throw EnvelopeError(ErrorKind::KEY_NOT_FOUND, "no verification key for any signature");
    }

    auto payload = AgentCrypto::base64url_to_bytes(jws.payload);
    if (!payload) {
        throw EnvelopeError(ErrorKind::INVALID_FORMAT, "payload is not valid base64url");
    }

    result.payload = std::move(*payload);
    return result;
}

} // namespace didenvelope
