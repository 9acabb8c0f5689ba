/**
 * @file jwe.cpp
 * @brief Implementation of multi-recipient JWE construction
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/jwe.hpp"
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/concat_kdf.hpp"
#include "didenvelope/ec_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/key_wrap.hpp"
#include "didenvelope/security_config.hpp"
#include "didenvelope/utilities.hpp"

#include <set>
#include <utility>

namespace didenvelope {

namespace {
    EcCurve agreement_curve(const Jwk& jwk) {
        auto type = jwk.key_type();
        if (!type) {
            throw EnvelopeError(ErrorKind::UNSUPPORTED_ALGORITHM, "unsupported recipient key type");
        }
        if (*type == KeyType::ED25519) {
            throw EnvelopeError(ErrorKind::UNSUPPORTED_ALGORITHM, "Ed25519 keys cannot receive encrypted envelopes");
        }
        return *type == KeyType::P256 ? EcCurve::P256 : EcCurve::SECP256K1;
    }

    std::vector<uint8_t> recipient_public_key(const JweCodec::Recipient& recipient) {
        auto public_key = recipient.public_key.public_key_bytes();
        if (!public_key) {
            throw EnvelopeError(ErrorKind::INVALID_KEY, "invalid public key for recipient " + recipient.kid);
        }
        return *public_key;
    }

    // Ephemeral key pair whose private half is wiped on destruction
    struct EphemeralKey {
        std::vector<uint8_t> private_key;
        Jwk public_jwk;

        explicit EphemeralKey(EcCurve curve) {
            private_key = EcCrypto::generate_private_key(curve);
            auto public_key = EcCrypto::public_key_from_private(curve, private_key);
            if (!public_key) {
                AgentCrypto::secure_zero(private_key);
                throw EnvelopeError(ErrorKind::INVALID_KEY, "ephemeral key generation failed");
            }
            public_jwk = Jwk::from_public_key(
                curve == EcCurve::P256 ? KeyType::P256 : KeyType::SECP256K1, *public_key);
        }

        ~EphemeralKey() {
            AgentCrypto::secure_zero(private_key);
        }

        EphemeralKey(const EphemeralKey&) = delete;
        EphemeralKey& operator=(const EphemeralKey&) = delete;
    };

    // Key material wiped on every exit path
    struct SecretBytes {
        std::vector<uint8_t> bytes;

        explicit SecretBytes(std::vector<uint8_t> data) : bytes(std::move(data)) {}

        ~SecretBytes() {
            AgentCrypto::secure_zero(bytes);
        }

        SecretBytes(const SecretBytes&) = delete;
        SecretBytes& operator=(const SecretBytes&) = delete;
    };

    std::vector<uint8_t> wrap_cek(
        EcCurve curve,
        const EphemeralKey& ephemeral,
        const std::vector<uint8_t>& cek,
        const std::optional<std::string>& sender_kid,
        const JweCodec::Recipient& recipient
    ) {
        auto shared_secret = EcCrypto::ecdh(curve, ephemeral.private_key, recipient_public_key(recipient));
        if (!shared_secret) {
            throw EnvelopeError(ErrorKind::INVALID_KEY, "key agreement failed for recipient " + recipient.kid);
        }

        SecretBytes secret(std::move(*shared_secret));
        SecretBytes kek(JweCodec::derive_kek(secret.bytes, sender_kid, recipient.kid));

        return AesKeyWrap::wrap(kek.bytes, cek);
    }

    std::vector<uint8_t> to_bytes(const std::string& str) {
        return std::vector<uint8_t>(str.begin(), str.end());
    }
}

JweCodec::Recipient JweCodec::recipient_from(const VerificationKey& key) {
    return Recipient{key.key_id(), key.public_key_jwk().public_only()};
}

std::vector<uint8_t> JweCodec::derive_kek(
    const std::vector<uint8_t>& shared_secret,
    const std::optional<std::string>& sender_kid,
    const std::string& recipient_kid
) {
    return ConcatKdf::derive(
        shared_secret,
        sender_kid ? to_bytes(*sender_kid) : std::vector<uint8_t>(),
        to_bytes(recipient_kid),
        static_cast<uint32_t>(security::KEK_SIZE * 8)
    );
}

std::string JweCodec::recipients_apv(const std::vector<Recipient>& recipients) {
    std::string joined;
    for (size_t i = 0; i < recipients.size(); i++) {
        if (i > 0) {
            joined += '.';
        }
        joined += recipients[i].kid;
    }
    return AgentCrypto::bytes_to_base64url(AgentCrypto::sha256(to_bytes(joined)));
}

// ============================================================================
// Multi-recipient Encryption
// ============================================================================

Jwe JweCodec::encrypt(
    const std::vector<uint8_t>& plaintext,
    const std::vector<Recipient>& recipients,
    const std::optional<std::string>& sender_kid,
    const std::optional<JweProtected>& protected_header
) {
    if (recipients.empty()) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "at least one recipient is required");
    }
    if (recipients.size() > security::MAX_RECIPIENTS) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "too many recipients");
    }

    if (sender_kid && !security::validate_key_id(*sender_kid)) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "invalid sender key id");
    }

    // A single ephemeral key requires a single curve
    const EcCurve curve = agreement_curve(recipients.front().public_key);
    std::set<std::string> seen;
    for (const auto& recipient : recipients) {
        if (agreement_curve(recipient.public_key) != curve) {
            throw EnvelopeError(ErrorKind::UNSUPPORTED_ALGORITHM, "recipients must share one curve");
        }
        if (!security::validate_key_id(recipient.kid)) {
            throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "invalid recipient key id");
        }
        if (!seen.insert(recipient.kid).second) {
            throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "duplicate recipient " + recipient.kid);
        }
        recipient_public_key(recipient);
    }

    EphemeralKey ephemeral(curve);

    JweProtected header;
    if (protected_header) {
        if (!protected_header->typ.empty()) {
            header.typ = protected_header->typ;
        }
        header.cty = protected_header->cty;
    }
    header.epk = ephemeral.public_jwk;
    header.apv = recipients_apv(recipients);

    Jwe jwe;
    jwe.protected_header = header.encode();

    SecretBytes cek(AgentCrypto::generate_random_bytes(security::CEK_SIZE));
    std::vector<uint8_t> iv = AgentCrypto::generate_random_bytes(security::GCM_IV_SIZE);

    auto sealed = AgentCrypto::encrypt_aes256gcm(plaintext, cek.bytes, iv, to_bytes(jwe.protected_header));
    if (!sealed) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "content encryption failed");
    }

    for (const auto& recipient : recipients) {
        JweRecipient entry;
        entry.encrypted_key = AgentCrypto::bytes_to_base64url(
            wrap_cek(curve, ephemeral, cek.bytes, sender_kid, recipient));
        entry.header.kid = recipient.kid;
        entry.header.sender_kid = sender_kid;
        jwe.recipients.push_back(entry);
    }

    jwe.ciphertext = AgentCrypto::bytes_to_base64url(sealed->ciphertext);
    jwe.tag = AgentCrypto::bytes_to_base64url(sealed->tag);
    jwe.iv = AgentCrypto::bytes_to_base64url(iv);

    utilities::log_debug("Built JWE for " + std::to_string(recipients.size()) + " recipient(s)");
    return jwe;
}

// ============================================================================
// Single-recipient Encryption
// ============================================================================

EncryptedContent JweCodec::encrypt_for(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& aad,
    const Recipient& recipient,
    const std::optional<std::string>& sender_kid
) {
    const EcCurve curve = agreement_curve(recipient.public_key);
    recipient_public_key(recipient);

    EphemeralKey ephemeral(curve);

    SecretBytes cek(AgentCrypto::generate_random_bytes(security::CEK_SIZE));

    EncryptedContent content;
    content.iv = AgentCrypto::generate_random_bytes(security::GCM_IV_SIZE);
    content.epk = ephemeral.public_jwk;

    auto sealed = AgentCrypto::encrypt_aes256gcm(plaintext, cek.bytes, content.iv, aad);
    if (!sealed) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "content encryption failed");
    }
    content.ciphertext = std::move(sealed->ciphertext);
    content.tag = std::move(sealed->tag);
    content.encrypted_key = wrap_cek(curve, ephemeral, cek.bytes, sender_kid, recipient);

    return content;
}

} // namespace didenvelope
