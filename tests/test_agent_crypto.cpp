/**
 * @file test_agent_crypto.cpp
 * @brief Unit tests for AgentCrypto
 *
 * Tests the primitive layer including:
 * - Ed25519 key generation, seeds and signatures
 * - AES-256-GCM content encryption with AAD
 * - SHA-256
 * - Encoding helpers (hex, base64url, base58)
 * - Constant-time comparison and secure zeroing
 */

#include <gtest/gtest.h>
#include "didenvelope/agent_crypto.hpp"
#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using namespace didenvelope;

// Test fixture for AgentCrypto tests
class AgentCryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(AgentCrypto::initialize());
    }

    static std::vector<uint8_t> from_hex(const std::string& hex) {
        auto bytes = AgentCrypto::hex_to_bytes(hex);
        EXPECT_TRUE(bytes.has_value());
        return bytes.value_or(std::vector<uint8_t>());
    }

    static std::vector<uint8_t> to_bytes(const std::string& str) {
        return std::vector<uint8_t>(str.begin(), str.end());
    }
};

// ============================================================================
// Initialization Tests
// ============================================================================

TEST_F(AgentCryptoTest, InitializeIsIdempotent) {
    EXPECT_TRUE(AgentCrypto::initialize());
    EXPECT_TRUE(AgentCrypto::initialize());
}

// ============================================================================
// Ed25519 Tests
// ============================================================================

TEST_F(AgentCryptoTest, GenerateEd25519Keypair) {
    auto keypair = AgentCrypto::generate_ed25519_keypair();

    EXPECT_EQ(keypair.public_key.size(), crypto_sign_PUBLICKEYBYTES);
    EXPECT_TRUE(std::any_of(keypair.public_key.begin(), keypair.public_key.end(),
                            [](uint8_t b) { return b != 0; }));
}

TEST_F(AgentCryptoTest, Ed25519KeypairFromSeedMatchesRfc8032) {
    // RFC 8032 section 7.1, test 1
    auto seed = from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    auto keypair = AgentCrypto::ed25519_keypair_from_seed(seed);
    ASSERT_TRUE(keypair.has_value());

    std::vector<uint8_t> public_key(keypair->public_key.begin(), keypair->public_key.end());
    EXPECT_EQ(AgentCrypto::bytes_to_hex(public_key),
              "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");

    EXPECT_EQ(AgentCrypto::ed25519_seed(keypair->secret_key), seed);
}

TEST_F(AgentCryptoTest, Ed25519SignatureMatchesRfc8032) {
    auto seed = from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    auto keypair = AgentCrypto::ed25519_keypair_from_seed(seed);
    ASSERT_TRUE(keypair.has_value());

    auto signature = AgentCrypto::sign_ed25519({}, keypair->secret_key);
    EXPECT_EQ(AgentCrypto::bytes_to_hex(signature),
              "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
              "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
}

TEST_F(AgentCryptoTest, Ed25519KeypairFromSeedRejectsWrongLength) {
    EXPECT_FALSE(AgentCrypto::ed25519_keypair_from_seed(std::vector<uint8_t>(31, 0x01)).has_value());
    EXPECT_FALSE(AgentCrypto::ed25519_keypair_from_seed(std::vector<uint8_t>(64, 0x01)).has_value());
}

TEST_F(AgentCryptoTest, SignAndVerifyEd25519) {
    auto keypair = AgentCrypto::generate_ed25519_keypair();
    std::vector<uint8_t> public_key(keypair.public_key.begin(), keypair.public_key.end());
    auto message = to_bytes("signed content");

    auto signature = AgentCrypto::sign_ed25519(message, keypair.secret_key);
    EXPECT_EQ(signature.size(), crypto_sign_BYTES);
    EXPECT_TRUE(AgentCrypto::verify_ed25519(message, signature, public_key));
}

TEST_F(AgentCryptoTest, VerifyEd25519RejectsTamperedMessage) {
    auto keypair = AgentCrypto::generate_ed25519_keypair();
    std::vector<uint8_t> public_key(keypair.public_key.begin(), keypair.public_key.end());
    auto message = to_bytes("signed content");
    auto signature = AgentCrypto::sign_ed25519(message, keypair.secret_key);

    message[0] ^= 0x01;
    EXPECT_FALSE(AgentCrypto::verify_ed25519(message, signature, public_key));
}

TEST_F(AgentCryptoTest, VerifyEd25519RejectsMalformedInputs) {
    auto keypair = AgentCrypto::generate_ed25519_keypair();
    std::vector<uint8_t> public_key(keypair.public_key.begin(), keypair.public_key.end());
    auto message = to_bytes("signed content");
    auto signature = AgentCrypto::sign_ed25519(message, keypair.secret_key);

    std::vector<uint8_t> short_signature(signature.begin(), signature.begin() + 63);
    EXPECT_FALSE(AgentCrypto::verify_ed25519(message, short_signature, public_key));

    std::vector<uint8_t> short_key(public_key.begin(), public_key.begin() + 31);
    EXPECT_FALSE(AgentCrypto::verify_ed25519(message, signature, short_key));
}

// ============================================================================
// AES-256-GCM Tests
// ============================================================================

TEST_F(AgentCryptoTest, Aes256GcmKnownAnswerEmptyPlaintext) {
    // NIST GCM test case 13
    std::vector<uint8_t> key(32, 0x00);
    std::vector<uint8_t> iv(12, 0x00);

    auto sealed = AgentCrypto::encrypt_aes256gcm({}, key, iv, {});
    ASSERT_TRUE(sealed.has_value());
    EXPECT_TRUE(sealed->ciphertext.empty());
    EXPECT_EQ(AgentCrypto::bytes_to_hex(sealed->tag), "530f8afbc74536b9a963b4f1c4cb738b");
}

TEST_F(AgentCryptoTest, Aes256GcmKnownAnswerOneBlock) {
    // NIST GCM test case 14
    std::vector<uint8_t> key(32, 0x00);
    std::vector<uint8_t> iv(12, 0x00);
    std::vector<uint8_t> plaintext(16, 0x00);

    auto sealed = AgentCrypto::encrypt_aes256gcm(plaintext, key, iv, {});
    ASSERT_TRUE(sealed.has_value());
    EXPECT_EQ(AgentCrypto::bytes_to_hex(sealed->ciphertext), "cea7403d4d606b6e074ec5d3baf39d18");
    EXPECT_EQ(AgentCrypto::bytes_to_hex(sealed->tag), "d0d1c8a799996bf0265b98b5d48ab919");
}

TEST_F(AgentCryptoTest, Aes256GcmEncryptDecrypt) {
    auto key = AgentCrypto::generate_random_bytes(32);
    auto iv = AgentCrypto::generate_random_bytes(12);
    auto aad = to_bytes("protected-header");
    auto plaintext = to_bytes("{\"hello\":\"world\"}");

    auto sealed = AgentCrypto::encrypt_aes256gcm(plaintext, key, iv, aad);
    ASSERT_TRUE(sealed.has_value());
    EXPECT_EQ(sealed->ciphertext.size(), plaintext.size());
    EXPECT_EQ(sealed->tag.size(), 16u);

    auto opened = AgentCrypto::decrypt_aes256gcm(sealed->ciphertext, sealed->tag, key, iv, aad);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, plaintext);
}

TEST_F(AgentCryptoTest, Aes256GcmRejectsModifiedAad) {
    auto key = AgentCrypto::generate_random_bytes(32);
    auto iv = AgentCrypto::generate_random_bytes(12);
    auto plaintext = to_bytes("payload");

    auto sealed = AgentCrypto::encrypt_aes256gcm(plaintext, key, iv, to_bytes("aad-one"));
    ASSERT_TRUE(sealed.has_value());

    EXPECT_FALSE(AgentCrypto::decrypt_aes256gcm(sealed->ciphertext, sealed->tag, key, iv,
                                                to_bytes("aad-two")).has_value());
}

TEST_F(AgentCryptoTest, Aes256GcmRejectsTamperedCiphertextAndTag) {
    auto key = AgentCrypto::generate_random_bytes(32);
    auto iv = AgentCrypto::generate_random_bytes(12);
    auto plaintext = to_bytes("payload");

    auto sealed = AgentCrypto::encrypt_aes256gcm(plaintext, key, iv, {});
    ASSERT_TRUE(sealed.has_value());

    auto ciphertext = sealed->ciphertext;
    ciphertext[0] ^= 0x01;
    EXPECT_FALSE(AgentCrypto::decrypt_aes256gcm(ciphertext, sealed->tag, key, iv, {}).has_value());

    auto tag = sealed->tag;
    tag[15] ^= 0x80;
    EXPECT_FALSE(AgentCrypto::decrypt_aes256gcm(sealed->ciphertext, tag, key, iv, {}).has_value());
}

TEST_F(AgentCryptoTest, Aes256GcmRejectsBadParameterSizes) {
    std::vector<uint8_t> plaintext = to_bytes("payload");

    EXPECT_FALSE(AgentCrypto::encrypt_aes256gcm(plaintext, std::vector<uint8_t>(16, 0x01),
                                                std::vector<uint8_t>(12, 0x00), {}).has_value());
    EXPECT_FALSE(AgentCrypto::encrypt_aes256gcm(plaintext, std::vector<uint8_t>(32, 0x01),
                                                std::vector<uint8_t>(8, 0x00), {}).has_value());
    EXPECT_FALSE(AgentCrypto::decrypt_aes256gcm(plaintext, std::vector<uint8_t>(8, 0x00),
                                                std::vector<uint8_t>(32, 0x01),
                                                std::vector<uint8_t>(12, 0x00), {}).has_value());
}

// ============================================================================
// Hashing Tests
// ============================================================================

TEST_F(AgentCryptoTest, Sha256KnownAnswers) {
    EXPECT_EQ(AgentCrypto::bytes_to_hex(AgentCrypto::sha256(to_bytes("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(AgentCrypto::bytes_to_hex(AgentCrypto::sha256({})),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

// ============================================================================
// Utility Tests
// ============================================================================

TEST_F(AgentCryptoTest, GenerateRandomBytes) {
    auto first = AgentCrypto::generate_random_bytes(32);
    auto second = AgentCrypto::generate_random_bytes(32);

    EXPECT_EQ(first.size(), 32u);
    EXPECT_NE(first, second);
    EXPECT_TRUE(AgentCrypto::generate_random_bytes(0).empty());
}

TEST_F(AgentCryptoTest, ConstantTimeCompare) {
    std::vector<uint8_t> a = {1, 2, 3, 4};
    std::vector<uint8_t> b = {1, 2, 3, 4};
    std::vector<uint8_t> c = {1, 2, 3, 5};
    std::vector<uint8_t> d = {1, 2, 3};

    EXPECT_TRUE(AgentCrypto::constant_time_compare(a, b));
    EXPECT_FALSE(AgentCrypto::constant_time_compare(a, c));
    EXPECT_FALSE(AgentCrypto::constant_time_compare(a, d));
}

TEST_F(AgentCryptoTest, HexEncoding) {
    std::vector<uint8_t> bytes = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(AgentCrypto::bytes_to_hex(bytes), "000fabff");

    auto decoded = AgentCrypto::hex_to_bytes("000FABff");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);

    EXPECT_FALSE(AgentCrypto::hex_to_bytes("abc").has_value());
    EXPECT_FALSE(AgentCrypto::hex_to_bytes("zz").has_value());
}

TEST_F(AgentCryptoTest, Base64UrlEncodingHasNoPadding) {
    EXPECT_EQ(AgentCrypto::bytes_to_base64url(to_bytes("f")), "Zg");
    EXPECT_EQ(AgentCrypto::bytes_to_base64url(to_bytes("fo")), "Zm8");
    EXPECT_EQ(AgentCrypto::bytes_to_base64url(to_bytes("foo")), "Zm9v");
    EXPECT_EQ(AgentCrypto::bytes_to_base64url({0xfb, 0xff}), "-_8");
}

TEST_F(AgentCryptoTest, Base64UrlDecoding) {
    auto decoded = AgentCrypto::base64url_to_bytes("-_8");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, std::vector<uint8_t>({0xfb, 0xff}));

    auto padded = AgentCrypto::base64url_to_bytes("Zm8=");
    ASSERT_TRUE(padded.has_value());
    EXPECT_EQ(*padded, to_bytes("fo"));

    auto empty = AgentCrypto::base64url_to_bytes("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());

    EXPECT_FALSE(AgentCrypto::base64url_to_bytes("Zm8+").has_value());
    EXPECT_FALSE(AgentCrypto::base64url_to_bytes("Zm!v").has_value());
}

TEST_F(AgentCryptoTest, Base58Encoding) {
    EXPECT_EQ(AgentCrypto::bytes_to_base58(to_bytes("hello world")), "StV1DL6CwTryKyV");
    EXPECT_EQ(AgentCrypto::bytes_to_base58({0x00, 0x00, 0x01, 0x02}), "115T");

    auto decoded = AgentCrypto::base58_to_bytes("115T");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, std::vector<uint8_t>({0x00, 0x00, 0x01, 0x02}));

    // 0, O, I and l are not in the alphabet
    EXPECT_FALSE(AgentCrypto::base58_to_bytes("0OIl").has_value());
}

TEST_F(AgentCryptoTest, SecureZero) {
    std::vector<uint8_t> secret = {0xde, 0xad, 0xbe, 0xef};
    AgentCrypto::secure_zero(secret);

    EXPECT_EQ(secret.size(), 4u);
    EXPECT_TRUE(std::all_of(secret.begin(), secret.end(), [](uint8_t b) { return b == 0; }));
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(AgentCryptoTest, ConcurrentSigning) {
    auto keypair = AgentCrypto::generate_ed25519_keypair();
    std::vector<uint8_t> public_key(keypair.public_key.begin(), keypair.public_key.end());

    std::vector<std::thread> threads;
    std::vector<int> results(8, 0);

    for (size_t t = 0; t < results.size(); t++) {
        threads.emplace_back([&, t]() {
            auto message = to_bytes("message " + std::to_string(t));
            auto signature = AgentCrypto::sign_ed25519(message, keypair.secret_key);
            results[t] = AgentCrypto::verify_ed25519(message, signature, public_key) ? 1 : 0;
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_TRUE(std::all_of(results.begin(), results.end(), [](int ok) { return ok == 1; }));
}
