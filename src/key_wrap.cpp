/**
 * @file key_wrap.cpp
 * @brief Implementation of AES-256 Key Wrap via OpenSSL EVP
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Uses the RFC 3394 default initial value A6A6A6A6A6A6A6A6.
 */

#include "didenvelope/key_wrap.hpp"
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/security_config.hpp"

#include <openssl/evp.h>
#include <memory>

namespace didenvelope {

namespace {
    struct CipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

    constexpr size_t MIN_KEY_SIZE = 16;
    constexpr size_t SEMIBLOCK_SIZE = 8;

    CipherCtxPtr new_wrap_context(const std::vector<uint8_t>& kek, bool encrypt) {
        CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return nullptr;
        }

        EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);

        if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_wrap(), nullptr,
                              kek.data(), nullptr, encrypt ? 1 : 0) != 1) {
            return nullptr;
        }

        return ctx;
    }
}

std::vector<uint8_t> AesKeyWrap::wrap(
    const std::vector<uint8_t>& kek,
    const std::vector<uint8_t>& plaintext_key
) {
    if (kek.size() != security::KEK_SIZE) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "key-encryption key must be 32 bytes");
    }
    if (plaintext_key.size() < MIN_KEY_SIZE || plaintext_key.size() % SEMIBLOCK_SIZE != 0) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER,
                            "key to wrap must be at least 16 bytes and a multiple of 8");
    }

    CipherCtxPtr ctx = new_wrap_context(kek, true);
    if (!ctx) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "key wrap initialization failed");
    }

    std::vector<uint8_t> wrapped(plaintext_key.size() + security::KEY_WRAP_ICV_SIZE);
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), wrapped.data(), &out_len,
                          plaintext_key.data(), static_cast<int>(plaintext_key.size())) != 1 ||
        static_cast<size_t>(out_len) != wrapped.size()) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "key wrap failed");
    }

    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), wrapped.data() + out_len, &final_len) != 1) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "key wrap failed");
    }

    return wrapped;
}

std::vector<uint8_t> AesKeyWrap::unwrap(
    const std::vector<uint8_t>& kek,
    const std::vector<uint8_t>& wrapped
) {
    if (kek.size() != security::KEK_SIZE) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "key-encryption key must be 32 bytes");
    }
    if (wrapped.size() < MIN_KEY_SIZE + security::KEY_WRAP_ICV_SIZE || wrapped.size() % SEMIBLOCK_SIZE != 0) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER,
                            "wrapped key must be at least 24 bytes and a multiple of 8");
    }

    CipherCtxPtr ctx = new_wrap_context(kek, false);
    if (!ctx) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "key unwrap initialization failed");
    }

    std::vector<uint8_t> plaintext_key(wrapped.size());
    int out_len = 0;

    // OpenSSL checks the integrity value and fails without releasing output
    if (EVP_DecryptUpdate(ctx.get(), plaintext_key.data(), &out_len,
                          wrapped.data(), static_cast<int>(wrapped.size())) != 1 ||
        static_cast<size_t>(out_len) != wrapped.size() - security::KEY_WRAP_ICV_SIZE) {
        AgentCrypto::secure_zero(plaintext_key);
        throw EnvelopeError(ErrorKind::INTEGRITY_CHECK_FAILED, "key unwrap integrity check failed");
    }

    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext_key.data() + out_len, &final_len) != 1) {
        AgentCrypto::secure_zero(plaintext_key);
        throw EnvelopeError(ErrorKind::INTEGRITY_CHECK_FAILED, "key unwrap integrity check failed");
    }

    plaintext_key.resize(static_cast<size_t>(out_len));
    return plaintext_key;
}

} // namespace didenvelope
