/**
 * @file test_key_wrap.cpp
 * @brief Unit tests for AES key wrap (RFC 3394)
 */

#include <gtest/gtest.h>
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/key_wrap.hpp"
#include <string>
#include <vector>

using namespace didenvelope;

class AesKeyWrapTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(AgentCrypto::initialize());
    }

    static std::vector<uint8_t> from_hex(const std::string& hex) {
        auto bytes = AgentCrypto::hex_to_bytes(hex);
        EXPECT_TRUE(bytes.has_value());
        return bytes.value_or(std::vector<uint8_t>());
    }

    static ErrorKind error_kind_of(const std::vector<uint8_t>& kek, const std::vector<uint8_t>& wrapped) {
        try {
            AesKeyWrap::unwrap(kek, wrapped);
        } catch (const EnvelopeError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "unwrap did not throw";
        return ErrorKind::INVALID_PARAMETER;
    }
};

// ============================================================================
// Known Answers
// ============================================================================

TEST_F(AesKeyWrapTest, Rfc3394Section4_6) {
    // 256 bits of key data with a 256-bit KEK
    auto kek = from_hex("000102030405060708090A0B0C0D0E0F101112131415161718191A1B1C1D1E1F");
    auto key = from_hex("00112233445566778899AABBCCDDEEFF000102030405060708090A0B0C0D0E0F");
    auto expected = from_hex("28C9F404C4B810F4CBCCB35CFB87F8263F5786E2D80ED326"
                             "CBC7F0E71A99F43BFB988B9B7A02DD21");

    EXPECT_EQ(AesKeyWrap::wrap(kek, key), expected);
    EXPECT_EQ(AesKeyWrap::unwrap(kek, expected), key);
}

TEST_F(AesKeyWrapTest, WrapAddsEightBytes) {
    std::vector<uint8_t> kek(32, 0x42);
    std::vector<uint8_t> cek(32, 0xAB);

    auto wrapped = AesKeyWrap::wrap(kek, cek);
    EXPECT_EQ(wrapped.size(), 40u);
    EXPECT_EQ(AesKeyWrap::unwrap(kek, wrapped), cek);
}

// ============================================================================
// Integrity
// ============================================================================

TEST_F(AesKeyWrapTest, UnwrapWithWrongKekFailsIntegrity) {
    std::vector<uint8_t> kek(32, 0x42);
    std::vector<uint8_t> other(32, 0x43);
    auto wrapped = AesKeyWrap::wrap(kek, std::vector<uint8_t>(32, 0xAB));

    EXPECT_EQ(error_kind_of(other, wrapped), ErrorKind::INTEGRITY_CHECK_FAILED);
}

TEST_F(AesKeyWrapTest, UnwrapTamperedDataFailsIntegrity) {
    std::vector<uint8_t> kek(32, 0x42);
    auto wrapped = AesKeyWrap::wrap(kek, std::vector<uint8_t>(32, 0xAB));

    for (size_t i : {size_t(0), size_t(8), wrapped.size() - 1}) {
        auto tampered = wrapped;
        tampered[i] ^= 0x01;
        EXPECT_EQ(error_kind_of(kek, tampered), ErrorKind::INTEGRITY_CHECK_FAILED) << "byte " << i;
    }
}

TEST_F(AesKeyWrapTest, EverySingleBitFlipIsDetected) {
    std::vector<uint8_t> kek(32, 0x42);
    auto wrapped = AesKeyWrap::wrap(kek, std::vector<uint8_t>(16, 0x5A));

    for (size_t bit = 0; bit < wrapped.size() * 8; bit++) {
        auto tampered = wrapped;
        tampered[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
        EXPECT_THROW(AesKeyWrap::unwrap(kek, tampered), EnvelopeError) << "bit " << bit;
    }
}

TEST_F(AesKeyWrapTest, RoundTripAcrossKeySizes) {
    auto kek = AgentCrypto::generate_random_bytes(32);

    for (size_t size = 16; size <= 256; size += 8) {
        auto key = AgentCrypto::generate_random_bytes(size);
        auto wrapped = AesKeyWrap::wrap(kek, key);
        EXPECT_EQ(wrapped.size(), size + 8);
        EXPECT_EQ(AesKeyWrap::unwrap(kek, wrapped), key);
    }
}

// ============================================================================
// Parameter Validation
// ============================================================================

TEST_F(AesKeyWrapTest, RejectsWrongKekSize) {
    std::vector<uint8_t> short_kek(16, 0x42);
    std::vector<uint8_t> cek(32, 0xAB);

    try {
        AesKeyWrap::wrap(short_kek, cek);
        FAIL() << "128-bit KEK accepted";
    } catch (const EnvelopeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_PARAMETER);
    }

    EXPECT_EQ(error_kind_of(short_kek, std::vector<uint8_t>(40, 0x00)), ErrorKind::INVALID_PARAMETER);
}

TEST_F(AesKeyWrapTest, RejectsBadKeyDataLength) {
    std::vector<uint8_t> kek(32, 0x42);

    EXPECT_THROW(AesKeyWrap::wrap(kek, std::vector<uint8_t>(8, 0xAB)), EnvelopeError);
    EXPECT_THROW(AesKeyWrap::wrap(kek, std::vector<uint8_t>(20, 0xAB)), EnvelopeError);

    EXPECT_EQ(error_kind_of(kek, std::vector<uint8_t>(16, 0x00)), ErrorKind::INVALID_PARAMETER);
    EXPECT_EQ(error_kind_of(kek, std::vector<uint8_t>(41, 0x00)), ErrorKind::INVALID_PARAMETER);
}
