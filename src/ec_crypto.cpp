/**
 * @file ec_crypto.cpp
 * @brief Implementation of P-256 / secp256k1 operations on OpenSSL 3
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/ec_crypto.hpp"
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/security_config.hpp"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <memory>

namespace didenvelope {

namespace {
    struct OpenSslDeleter {
        void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
        void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
        void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
        void operator()(BIGNUM* p) const { BN_clear_free(p); }
        void operator()(BN_CTX* p) const { BN_CTX_free(p); }
        void operator()(EC_GROUP* p) const { EC_GROUP_free(p); }
        void operator()(EC_POINT* p) const { EC_POINT_free(p); }
        void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); }
        void operator()(OSSL_PARAM_BLD* p) const { OSSL_PARAM_BLD_free(p); }
        void operator()(OSSL_PARAM* p) const { OSSL_PARAM_free(p); }
    };

    template <typename T>
    using OsslPtr = std::unique_ptr<T, OpenSslDeleter>;

    int curve_nid(EcCurve curve) {
        return curve == EcCurve::P256 ? NID_X9_62_prime256v1 : NID_secp256k1;
    }

    const char* group_name(EcCurve curve) {
        return curve == EcCurve::P256 ? "prime256v1" : "secp256k1";
    }

    OsslPtr<EC_GROUP> new_group(EcCurve curve) {
        return OsslPtr<EC_GROUP>(EC_GROUP_new_by_curve_name(curve_nid(curve)));
    }

    // Parse and validate a SEC1 point; null on failure
    OsslPtr<EC_POINT> decode_point(const EC_GROUP* group, const std::vector<uint8_t>& encoded, BN_CTX* bn_ctx) {
        if (encoded.empty()) {
            return nullptr;
        }

        OsslPtr<EC_POINT> point(EC_POINT_new(group));
        if (!point) {
            return nullptr;
        }

        if (EC_POINT_oct2point(group, point.get(), encoded.data(), encoded.size(), bn_ctx) != 1) {
            return nullptr;
        }

        if (EC_POINT_is_at_infinity(group, point.get()) ||
            EC_POINT_is_on_curve(group, point.get(), bn_ctx) != 1) {
            return nullptr;
        }

        return point;
    }

    std::vector<uint8_t> encode_point(const EC_GROUP* group, const EC_POINT* point,
                                      point_conversion_form_t form, BN_CTX* bn_ctx) {
        size_t len = EC_POINT_point2oct(group, point, form, nullptr, 0, bn_ctx);
        std::vector<uint8_t> out(len);
        if (len == 0 || EC_POINT_point2oct(group, point, form, out.data(), out.size(), bn_ctx) != len) {
            return {};
        }
        return out;
    }

    OsslPtr<EVP_PKEY> build_pkey(EcCurve curve, const std::vector<uint8_t>* private_key,
                                 const std::vector<uint8_t>& public_key) {
        OsslPtr<OSSL_PARAM_BLD> bld(OSSL_PARAM_BLD_new());
        if (!bld) {
            return nullptr;
        }

        OsslPtr<BIGNUM> priv_bn;
        if (OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, group_name(curve), 0) != 1 ||
            OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                             public_key.data(), public_key.size()) != 1) {
            return nullptr;
        }

        if (private_key != nullptr) {
            priv_bn.reset(BN_bin2bn(private_key->data(), static_cast<int>(private_key->size()), nullptr));
            if (!priv_bn || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, priv_bn.get()) != 1) {
                return nullptr;
            }
        }

        OsslPtr<OSSL_PARAM> params(OSSL_PARAM_BLD_to_param(bld.get()));
        OsslPtr<EVP_PKEY_CTX> kctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
        if (!params || !kctx || EVP_PKEY_fromdata_init(kctx.get()) != 1) {
            return nullptr;
        }

        EVP_PKEY* raw = nullptr;
        int selection = private_key != nullptr ? EVP_PKEY_KEYPAIR : EVP_PKEY_PUBLIC_KEY;
        if (EVP_PKEY_fromdata(kctx.get(), &raw, selection, params.get()) != 1) {
            return nullptr;
        }

        return OsslPtr<EVP_PKEY>(raw);
    }

    OsslPtr<EVP_PKEY> build_private_pkey(EcCurve curve, const std::vector<uint8_t>& private_key) {
        auto public_key = EcCrypto::public_key_from_private(curve, private_key);
        if (!public_key) {
            return nullptr;
        }
        return build_pkey(curve, &private_key, *public_key);
    }
}

// ============================================================================
// Curve Parameters
// ============================================================================

std::string EcCrypto::curve_name(EcCurve curve) {
    return curve == EcCurve::P256 ? "P-256" : "secp256k1";
}

// ============================================================================
// Key Generation
// ============================================================================

std::vector<uint8_t> EcCrypto::generate_private_key(EcCurve curve) {
    OsslPtr<EVP_PKEY_CTX> pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
    if (!pctx ||
        EVP_PKEY_keygen_init(pctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx.get(), curve_nid(curve)) <= 0) {
        throw EnvelopeError(ErrorKind::INVALID_KEY, "EC key generation setup failed");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(pctx.get(), &raw) <= 0) {
        throw EnvelopeError(ErrorKind::INVALID_KEY, "EC key generation failed");
    }
    OsslPtr<EVP_PKEY> pkey(raw);

    BIGNUM* priv_raw = nullptr;
    if (EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_PRIV_KEY, &priv_raw) != 1) {
        throw EnvelopeError(ErrorKind::INVALID_KEY, "EC private key export failed");
    }
    OsslPtr<BIGNUM> priv_bn(priv_raw);

    std::vector<uint8_t> private_key(security::EC_FIELD_SIZE);
    if (BN_bn2binpad(priv_bn.get(), private_key.data(), static_cast<int>(private_key.size())) <= 0) {
        throw EnvelopeError(ErrorKind::INVALID_KEY, "EC private key export failed");
    }

    return private_key;
}

bool EcCrypto::is_valid_private_key(EcCurve curve, const std::vector<uint8_t>& private_key) {
    if (private_key.size() != security::EC_FIELD_SIZE) {
        return false;
    }

    auto group = new_group(curve);
    if (!group) {
        return false;
    }

    OsslPtr<BIGNUM> scalar(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr));
    const BIGNUM* order = EC_GROUP_get0_order(group.get());
    if (!scalar || order == nullptr) {
        return false;
    }

    return !BN_is_zero(scalar.get()) && BN_cmp(scalar.get(), order) < 0;
}

std::optional<std::vector<uint8_t>> EcCrypto::public_key_from_private(
    EcCurve curve,
    const std::vector<uint8_t>& private_key
) {
    if (!is_valid_private_key(curve, private_key)) {
        return std::nullopt;
    }

    auto group = new_group(curve);
    OsslPtr<BN_CTX> bn_ctx(BN_CTX_new());
    OsslPtr<BIGNUM> scalar(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr));
    if (!group || !bn_ctx || !scalar) {
        return std::nullopt;
    }

    OsslPtr<EC_POINT> point(EC_POINT_new(group.get()));
    if (!point || EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr, nullptr, bn_ctx.get()) != 1) {
        return std::nullopt;
    }

    auto encoded = encode_point(group.get(), point.get(), POINT_CONVERSION_UNCOMPRESSED, bn_ctx.get());
    if (encoded.empty()) {
        return std::nullopt;
    }
    return encoded;
}

// ============================================================================
// Point Encoding
// ============================================================================

std::optional<std::vector<uint8_t>> EcCrypto::decode_public_key(
    EcCurve curve,
    const std::vector<uint8_t>& public_key
) {
    auto group = new_group(curve);
    OsslPtr<BN_CTX> bn_ctx(BN_CTX_new());
    if (!group || !bn_ctx) {
        return std::nullopt;
    }

    auto point = decode_point(group.get(), public_key, bn_ctx.get());
    if (!point) {
        return std::nullopt;
    }

    auto encoded = encode_point(group.get(), point.get(), POINT_CONVERSION_UNCOMPRESSED, bn_ctx.get());
    if (encoded.empty()) {
        return std::nullopt;
    }
    return encoded;
}

std::optional<std::vector<uint8_t>> EcCrypto::compress_public_key(
    EcCurve curve,
    const std::vector<uint8_t>& public_key
) {
    auto group = new_group(curve);
    OsslPtr<BN_CTX> bn_ctx(BN_CTX_new());
    if (!group || !bn_ctx) {
        return std::nullopt;
    }

    auto point = decode_point(group.get(), public_key, bn_ctx.get());
    if (!point) {
        return std::nullopt;
    }

    auto encoded = encode_point(group.get(), point.get(), POINT_CONVERSION_COMPRESSED, bn_ctx.get());
    if (encoded.empty()) {
        return std::nullopt;
    }
    return encoded;
}

// ============================================================================
// Digital Signatures (ECDSA / SHA-256)
// ============================================================================

std::optional<std::vector<uint8_t>> EcCrypto::sign(
    EcCurve curve,
    const std::vector<uint8_t>& private_key,
    const std::vector<uint8_t>& message
) {
    auto pkey = build_private_pkey(curve, private_key);
    if (!pkey) {
        return std::nullopt;
    }

    OsslPtr<EVP_MD_CTX> mdctx(EVP_MD_CTX_new());
    if (!mdctx || EVP_DigestSignInit(mdctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1) {
        return std::nullopt;
    }

    size_t der_len = 0;
    if (EVP_DigestSign(mdctx.get(), nullptr, &der_len, message.data(), message.size()) != 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> der_sig(der_len);
    if (EVP_DigestSign(mdctx.get(), der_sig.data(), &der_len, message.data(), message.size()) != 1) {
        return std::nullopt;
    }

    // DER to raw r || s
    const unsigned char* p = der_sig.data();
    OsslPtr<ECDSA_SIG> ecdsa_sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der_len)));
    if (!ecdsa_sig) {
        return std::nullopt;
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(ecdsa_sig.get(), &r, &s);

    std::vector<uint8_t> signature(security::ECDSA_SIGNATURE_SIZE);
    const int half = static_cast<int>(security::ECDSA_SIGNATURE_SIZE / 2);
    if (BN_bn2binpad(r, signature.data(), half) != half ||
        BN_bn2binpad(s, signature.data() + half, half) != half) {
        return std::nullopt;
    }

    return signature;
}

bool EcCrypto::verify(
    EcCurve curve,
    const std::vector<uint8_t>& public_key,
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature
) {
    if (signature.size() != security::ECDSA_SIGNATURE_SIZE) {
        return false;
    }

    auto uncompressed = decode_public_key(curve, public_key);
    if (!uncompressed) {
        return false;
    }

    auto pkey = build_pkey(curve, nullptr, *uncompressed);
    if (!pkey) {
        return false;
    }

    // Raw r || s to DER
    const int half = static_cast<int>(security::ECDSA_SIGNATURE_SIZE / 2);
    BIGNUM* r = BN_bin2bn(signature.data(), half, nullptr);
    BIGNUM* s = BN_bin2bn(signature.data() + half, half, nullptr);
    OsslPtr<ECDSA_SIG> ecdsa_sig(ECDSA_SIG_new());
    if (!r || !s || !ecdsa_sig) {
        BN_free(r);
        BN_free(s);
        return false;
    }
    ECDSA_SIG_set0(ecdsa_sig.get(), r, s);  // takes ownership of r and s

    int der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
    if (der_len <= 0) {
        return false;
    }
    std::vector<uint8_t> der_sig(static_cast<size_t>(der_len));
    unsigned char* out = der_sig.data();
    if (i2d_ECDSA_SIG(ecdsa_sig.get(), &out) != der_len) {
        return false;
    }

    OsslPtr<EVP_MD_CTX> mdctx(EVP_MD_CTX_new());
    if (!mdctx || EVP_DigestVerifyInit(mdctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1) {
        return false;
    }

    return EVP_DigestVerify(mdctx.get(), der_sig.data(), der_sig.size(), message.data(), message.size()) == 1;
}

// ============================================================================
// Key Agreement (ECDH)
// ============================================================================

std::optional<std::vector<uint8_t>> EcCrypto::ecdh(
    EcCurve curve,
    const std::vector<uint8_t>& private_key,
    const std::vector<uint8_t>& peer_public_key
) {
    auto peer_uncompressed = decode_public_key(curve, peer_public_key);
    if (!peer_uncompressed) {
        return std::nullopt;
    }

    auto priv_pkey = build_private_pkey(curve, private_key);
    auto peer_pkey = build_pkey(curve, nullptr, *peer_uncompressed);
    if (!priv_pkey || !peer_pkey) {
        return std::nullopt;
    }

    OsslPtr<EVP_PKEY_CTX> dctx(EVP_PKEY_CTX_new(priv_pkey.get(), nullptr));
    if (!dctx ||
        EVP_PKEY_derive_init(dctx.get()) != 1 ||
        EVP_PKEY_derive_set_peer(dctx.get(), peer_pkey.get()) != 1) {
        return std::nullopt;
    }

    size_t secret_len = 0;
    if (EVP_PKEY_derive(dctx.get(), nullptr, &secret_len) != 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> shared_secret(secret_len);
    if (EVP_PKEY_derive(dctx.get(), shared_secret.data(), &secret_len) != 1) {
        AgentCrypto::secure_zero(shared_secret);
        return std::nullopt;
    }

    shared_secret.resize(secret_len);
    return shared_secret;
}

} // namespace didenvelope
