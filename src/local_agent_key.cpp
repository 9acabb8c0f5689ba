/**
 * @file local_agent_key.cpp
 * @brief Implementation of in-process agent keys
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/local_agent_key.hpp"
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/did_key.hpp"
#include "didenvelope/ec_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/jwe.hpp"
#include "didenvelope/jws.hpp"
#include "didenvelope/key_wrap.hpp"
#include "didenvelope/security_config.hpp"
#include "didenvelope/utilities.hpp"

#include <algorithm>
#include <array>

namespace didenvelope {

namespace {
    EcCurve curve_for(KeyType type) {
        return type == KeyType::P256 ? EcCurve::P256 : EcCurve::SECP256K1;
    }

    bool verify_raw(
        KeyType type,
        const std::vector<uint8_t>& public_key,
        const std::vector<uint8_t>& signing_input,
        const std::vector<uint8_t>& signature,
        const JwsProtected& protected_header
    ) {
        // The header must name the algorithm this key actually uses
        auto alg = jws_algorithm_from_string(protected_header.alg);
        if (!alg || *alg != jws_algorithm_for(type)) {
            return false;
        }

        if (type == KeyType::ED25519) {
            return AgentCrypto::verify_ed25519(signing_input, signature, public_key);
        }
        return EcCrypto::verify(curve_for(type), public_key, signing_input, signature);
    }

    void decryption_failed() {
        throw EnvelopeError(ErrorKind::DECRYPTION_FAILED, "decryption failed");
    }
}

// ============================================================================
// Construction
// ============================================================================

LocalAgentKey::LocalAgentKey(KeyType type, std::vector<uint8_t> private_key, std::vector<uint8_t> public_key,
                             std::string key_id, std::string did)
    : type_(type),
      private_key_(std::move(private_key)),
      public_key_(std::move(public_key)),
      key_id_(std::move(key_id)),
      did_(std::move(did)) {
}

LocalAgentKey::~LocalAgentKey() {
    AgentCrypto::secure_zero(private_key_);
}

std::shared_ptr<LocalAgentKey> LocalAgentKey::generate(KeyType type, const std::string& key_id) {
    std::vector<uint8_t> private_key;

    if (type == KeyType::ED25519) {
        Ed25519KeyPair keypair = AgentCrypto::generate_ed25519_keypair();
        private_key = AgentCrypto::ed25519_seed(keypair.secret_key);
        AgentCrypto::secure_zero(keypair.secret_key.data(), keypair.secret_key.size());
    } else {
        private_key = EcCrypto::generate_private_key(curve_for(type));
    }

    auto key = from_private_key(type, private_key, key_id);
    AgentCrypto::secure_zero(private_key);

    utilities::log_debug("Generated " + key_type_to_string(type) + " key " + key->key_id());
    return key;
}

std::shared_ptr<LocalAgentKey> LocalAgentKey::from_private_key(
    KeyType type,
    const std::vector<uint8_t>& private_key,
    const std::string& key_id,
    const std::string& did
) {
    std::vector<uint8_t> public_key;

    if (type == KeyType::ED25519) {
        auto keypair = AgentCrypto::ed25519_keypair_from_seed(private_key);
        if (!keypair) {
            throw EnvelopeError(ErrorKind::INVALID_KEY, "Ed25519 private key must be a 32-byte seed");
        }
        public_key.assign(keypair->public_key.begin(), keypair->public_key.end());
        AgentCrypto::secure_zero(keypair->secret_key.data(), keypair->secret_key.size());
    } else {
        auto derived = EcCrypto::public_key_from_private(curve_for(type), private_key);
        if (!derived) {
            throw EnvelopeError(ErrorKind::INVALID_KEY,
                                "invalid " + key_type_to_string(type) + " private key");
        }
        public_key = std::move(*derived);
    }

    std::string resolved_did = did.empty() ? DidKey::encode(type, public_key) : did;
    std::string resolved_kid = key_id;
    if (resolved_kid.empty()) {
        resolved_kid = did.empty()
            ? DidKey::default_key_id(type, public_key)
            : did + "#" + DidKey::multibase(type, public_key);
    }

    if (!security::validate_key_id(resolved_kid)) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "invalid key id");
    }

    // Constructor is private, so make_shared is unavailable
    return std::shared_ptr<LocalAgentKey>(
        new LocalAgentKey(type, private_key, std::move(public_key), resolved_kid, resolved_did));
}

std::shared_ptr<LocalAgentKey> LocalAgentKey::from_jwk(const Jwk& jwk, const std::string& did) {
    auto type = jwk.key_type();
    if (!type) {
        throw EnvelopeError(ErrorKind::UNSUPPORTED_ALGORITHM, "unsupported JWK " + jwk.kty + "/" + jwk.crv);
    }
    if (!jwk.has_private()) {
        throw EnvelopeError(ErrorKind::INVALID_KEY, "JWK has no private key");
    }

    auto private_key = AgentCrypto::base64url_to_bytes(jwk.d);
    if (!private_key) {
        throw EnvelopeError(ErrorKind::INVALID_KEY, "JWK private key is not valid base64url");
    }

    std::shared_ptr<LocalAgentKey> key;
    try {
        key = from_private_key(*type, *private_key, jwk.kid, did);
    } catch (const EnvelopeError&) {
        AgentCrypto::secure_zero(*private_key);
        throw;
    }
    AgentCrypto::secure_zero(*private_key);

    // Public members, when present, must match the private key
    Jwk derived = key->public_key_jwk();
    if ((!jwk.x.empty() && jwk.x != derived.x) || (!jwk.y.empty() && jwk.y != derived.y)) {
        throw EnvelopeError(ErrorKind::INVALID_KEY, "JWK public key does not match private key");
    }

    return key;
}

// ============================================================================
// AgentKey / VerificationKey
// ============================================================================

Jwk LocalAgentKey::public_key_jwk() const {
    return Jwk::from_public_key(type_, public_key_, key_id_);
}

bool LocalAgentKey::verify_signature(
    const std::vector<uint8_t>& signing_input,
    const std::vector<uint8_t>& signature,
    const JwsProtected& protected_header
) const {
    return verify_raw(type_, public_key_, signing_input, signature, protected_header);
}

Jwk LocalAgentKey::export_private_jwk() const {
    utilities::log_warn("Private key exported for " + key_id_);

    Jwk jwk = public_key_jwk();
    jwk.d = AgentCrypto::bytes_to_base64url(private_key_);
    return jwk;
}

// ============================================================================
// SigningKey
// ============================================================================

std::vector<uint8_t> LocalAgentKey::sign(const std::vector<uint8_t>& data) const {
    if (type_ == KeyType::ED25519) {
        auto keypair = AgentCrypto::ed25519_keypair_from_seed(private_key_);
        if (!keypair) {
            throw EnvelopeError(ErrorKind::INVALID_KEY, "Ed25519 key material corrupted");
        }
        std::vector<uint8_t> signature = AgentCrypto::sign_ed25519(data, keypair->secret_key);
        AgentCrypto::secure_zero(keypair->secret_key.data(), keypair->secret_key.size());
        return signature;
    }

    auto signature = EcCrypto::sign(curve_for(type_), private_key_, data);
    if (!signature) {
        throw EnvelopeError(ErrorKind::INVALID_KEY, "ECDSA signing failed");
    }
    return *signature;
}

JwsAlgorithm LocalAgentKey::recommended_jws_alg() const {
    return jws_algorithm_for(type_);
}

// ============================================================================
// EncryptionKey / DecryptionKey
// ============================================================================

void LocalAgentKey::require_encryption() const {
    if (!supports_encryption()) {
        throw EnvelopeError(ErrorKind::UNSUPPORTED_ALGORITHM,
                            key_type_to_string(type_) + " keys do not support encryption");
    }
}

EncryptedContent LocalAgentKey::encrypt(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& aad,
    const VerificationKey& recipient
) const {
    require_encryption();
    return JweCodec::encrypt_for(plaintext, aad, JweCodec::recipient_from(recipient), key_id_);
}

Jwe LocalAgentKey::create_jwe(
    const std::vector<uint8_t>& plaintext,
    const std::vector<std::shared_ptr<const VerificationKey>>& recipients,
    const std::optional<JweProtected>& protected_header
) const {
    require_encryption();
    return EncryptionKey::create_jwe(plaintext, recipients, protected_header);
}

std::vector<uint8_t> LocalAgentKey::decrypt(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& encrypted_key,
    const std::vector<uint8_t>& iv,
    const std::vector<uint8_t>& tag,
    const std::vector<uint8_t>& aad,
    const Jwk& epk,
    const std::optional<std::string>& sender_kid
) const {
    require_encryption();

    // Every failure below surfaces as the same error
    if (epk.key_type() != type_) {
        decryption_failed();
    }
    auto epk_bytes = epk.public_key_bytes();
    if (!epk_bytes) {
        decryption_failed();
    }

    auto shared_secret = EcCrypto::ecdh(curve_for(type_), private_key_, *epk_bytes);
    if (!shared_secret) {
        decryption_failed();
    }

    std::vector<uint8_t> kek = JweCodec::derive_kek(*shared_secret, sender_kid, key_id_);
    AgentCrypto::secure_zero(*shared_secret);

    std::vector<uint8_t> cek;
    try {
        cek = AesKeyWrap::unwrap(kek, encrypted_key);
    } catch (const EnvelopeError&) {
        AgentCrypto::secure_zero(kek);
        utilities::log_debug("Key unwrap failed for " + key_id_);
        decryption_failed();
    }
    AgentCrypto::secure_zero(kek);

    auto plaintext = AgentCrypto::decrypt_aes256gcm(ciphertext, tag, cek, iv, aad);
    AgentCrypto::secure_zero(cek);
    if (!plaintext) {
        utilities::log_debug("Content decryption failed for " + key_id_);
        decryption_failed();
    }

    return *plaintext;
}

// ============================================================================
// PublicVerificationKey
// ============================================================================

PublicVerificationKey::PublicVerificationKey(const std::string& key_id, const Jwk& jwk)
    : key_id_(key_id),
      jwk_(jwk.public_only()),
      type_(KeyType::ED25519) {
    auto type = jwk_.key_type();
    if (!type) {
        throw EnvelopeError(ErrorKind::UNSUPPORTED_ALGORITHM, "unsupported JWK " + jwk_.kty + "/" + jwk_.crv);
    }

    auto public_key = jwk_.public_key_bytes();
    if (!public_key) {
        throw EnvelopeError(ErrorKind::INVALID_KEY, "invalid public key for " + key_id);
    }

    type_ = *type;
    public_key_ = std::move(*public_key);
    if (jwk_.kid.empty()) {
        jwk_.kid = key_id_;
    }
}

bool PublicVerificationKey::verify_signature(
    const std::vector<uint8_t>& signing_input,
    const std::vector<uint8_t>& signature,
    const JwsProtected& protected_header
) const {
    return verify_raw(type_, public_key_, signing_input, signature, protected_header);
}

std::vector<uint8_t> PublicVerificationKey::verify_jws(const Jws& jws) const {
    auto signature = std::find_if(jws.signatures.begin(), jws.signatures.end(),
        [this](const JwsSignature& sig) { return sig.header.kid == key_id_; });

    if (signature == jws.signatures.end() || !JwsCodec::verify_signature(jws, *signature, *this)) {
        throw EnvelopeError(ErrorKind::VERIFICATION_FAILED, "signature verification failed");
    }

    auto payload = AgentCrypto::base64url_to_bytes(jws.payload);
    if (!payload) {
        throw EnvelopeError(ErrorKind::VERIFICATION_FAILED, "payload is not valid base64url");
    }
    return *payload;
}

} // namespace didenvelope
