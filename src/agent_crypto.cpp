/**
 * @file agent_crypto.cpp
 * @brief Implementation of cryptographic primitives for envelope agents
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Ed25519: Digital signatures (libsodium)
 * - AES-256-GCM: Content encryption (OpenSSL EVP)
 * - SHA-256, CSPRNG, base64url: libsodium
 */

#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/security_config.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>

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

    const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

// ============================================================================
// Initialization
// ============================================================================

bool AgentCrypto::initialize() {
    // Safe to call multiple times
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

// ============================================================================
// Digital Signatures (Ed25519)
// ============================================================================

Ed25519KeyPair AgentCrypto::generate_ed25519_keypair() {
    Ed25519KeyPair keypair;

    crypto_sign_keypair(
        keypair.public_key.data(),
        keypair.secret_key.data()
    );

    return keypair;
}

std::optional<Ed25519KeyPair> AgentCrypto::ed25519_keypair_from_seed(const std::vector<uint8_t>& seed) {
    if (seed.size() != crypto_sign_SEEDBYTES) {
        return std::nullopt;
    }

    Ed25519KeyPair keypair;
    if (crypto_sign_seed_keypair(keypair.public_key.data(), keypair.secret_key.data(), seed.data()) != 0) {
        return std::nullopt;
    }

    return keypair;
}

std::vector<uint8_t> AgentCrypto::ed25519_seed(
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    std::vector<uint8_t> seed(crypto_sign_SEEDBYTES);
    crypto_sign_ed25519_sk_to_seed(seed.data(), secret_key.data());
    return seed;
}

std::vector<uint8_t> AgentCrypto::sign_ed25519(
    const std::vector<uint8_t>& message,
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    std::vector<uint8_t> signature(crypto_sign_BYTES);

    unsigned long long signature_len;
    crypto_sign_detached(
        signature.data(),
        &signature_len,
        message.data(),
        message.size(),
        secret_key.data()
    );

    signature.resize(signature_len);

    return signature;
}

bool AgentCrypto::verify_ed25519(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const std::vector<uint8_t>& public_key
) {
    if (signature.size() != crypto_sign_BYTES || public_key.size() != crypto_sign_PUBLICKEYBYTES) {
        return false;
    }

    int result = crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    );

    return result == 0;
}

// ============================================================================
// Content Encryption (AES-256-GCM)
// ============================================================================

std::optional<GcmCiphertext> AgentCrypto::encrypt_aes256gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv,
    const std::vector<uint8_t>& aad
) {
    if (key.size() != security::CEK_SIZE || iv.size() != security::GCM_IV_SIZE) {
        return std::nullopt;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            return std::nullopt;
        }
    }

    GcmCiphertext result;
    result.ciphertext.resize(plaintext.size());
    int ciphertext_len = 0;

    // A null output buffer would be read as AAD, so skip the update for empty input
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), result.ciphertext.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return std::nullopt;
        }
        ciphertext_len = len;
    }

    unsigned char final_block[16];
    if (EVP_EncryptFinal_ex(ctx.get(), final_block, &len) != 1) {
        return std::nullopt;
    }

    result.ciphertext.resize(static_cast<size_t>(ciphertext_len));
    result.tag.resize(security::GCM_TAG_SIZE);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(result.tag.size()), result.tag.data()) != 1) {
        return std::nullopt;
    }

    return result;
}

std::optional<std::vector<uint8_t>> AgentCrypto::decrypt_aes256gcm(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv,
    const std::vector<uint8_t>& aad
) {
    if (key.size() != security::CEK_SIZE ||
        iv.size() != security::GCM_IV_SIZE ||
        tag.size() != security::GCM_TAG_SIZE) {
        return std::nullopt;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            return std::nullopt;
        }
    }

    std::vector<uint8_t> plaintext(ciphertext.size());
    int plaintext_len = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                              ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
            secure_zero(plaintext);
            return std::nullopt;
        }
        plaintext_len = len;
    }

    std::vector<uint8_t> tag_copy(tag);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tag_copy.size()), tag_copy.data()) != 1) {
        secure_zero(plaintext);
        return std::nullopt;
    }

    // Fails if the tag does not match (tampering detected)
    unsigned char final_block[16];
    if (EVP_DecryptFinal_ex(ctx.get(), final_block, &len) != 1) {
        secure_zero(plaintext);
        return std::nullopt;
    }

    plaintext.resize(static_cast<size_t>(plaintext_len));
    return plaintext;
}

// ============================================================================
// Hashing
// ============================================================================

std::vector<uint8_t> AgentCrypto::sha256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<uint8_t> AgentCrypto::generate_random_bytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    randombytes_buf(bytes.data(), size);
    return bytes;
}

bool AgentCrypto::constant_time_compare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    if (a.size() != b.size()) {
        return false;
    }

    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string AgentCrypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::optional<std::vector<uint8_t>> AgentCrypto::hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }

    return bytes;
}

std::string AgentCrypto::bytes_to_base64url(const std::vector<uint8_t>& bytes) {
    size_t encoded_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_URLSAFE_NO_PADDING
    );

    std::vector<char> encoded(encoded_len);

    sodium_bin2base64(
        encoded.data(),
        encoded.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_URLSAFE_NO_PADDING
    );

    return std::string(encoded.data());
}

std::optional<std::vector<uint8_t>> AgentCrypto::base64url_to_bytes(const std::string& base64url) {
    std::string input = base64url;
    while (!input.empty() && input.back() == '=') {
        input.pop_back();
    }

    std::vector<uint8_t> bytes(input.length() * 3 / 4 + 1);
    size_t decoded_len = 0;

    // No end pointer: any invalid character fails the whole decode
    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        input.c_str(),
        input.length(),
        nullptr,
        &decoded_len,
        nullptr,
        sodium_base64_VARIANT_URLSAFE_NO_PADDING
    );

    if (result != 0) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

std::string AgentCrypto::bytes_to_base58(const std::vector<uint8_t>& bytes) {
    size_t leading_zeros = 0;
    while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0) {
        leading_zeros++;
    }

    // Base-256 to base-58 conversion, little-endian digits
    std::vector<uint8_t> digits;
    digits.reserve(bytes.size() * 138 / 100 + 1);
    for (size_t i = leading_zeros; i < bytes.size(); i++) {
        int carry = bytes[i];
        for (uint8_t& digit : digits) {
            carry += digit << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(leading_zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result += BASE58_ALPHABET[*it];
    }

    return result;
}

std::optional<std::vector<uint8_t>> AgentCrypto::base58_to_bytes(const std::string& base58) {
    size_t leading_ones = 0;
    while (leading_ones < base58.size() && base58[leading_ones] == '1') {
        leading_ones++;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(base58.size() * 733 / 1000 + 1);
    for (size_t i = leading_ones; i < base58.size(); i++) {
        const char* pos = std::strchr(BASE58_ALPHABET, base58[i]);
        if (pos == nullptr || base58[i] == '\0') {
            return std::nullopt;
        }

        int carry = static_cast<int>(pos - BASE58_ALPHABET);
        for (uint8_t& byte : bytes) {
            carry += byte * 58;
            byte = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    std::vector<uint8_t> result(leading_ones, 0);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    return result;
}

void AgentCrypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

void AgentCrypto::secure_zero(std::vector<uint8_t>& data) {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
    }
}

} // namespace didenvelope
