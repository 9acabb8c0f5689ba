/**
 * @file test_security_config.cpp
 * @brief Unit tests for limits, runtime configuration and input validation
 *
 * Tests configuration including:
 * - Security limits and cryptographic sizes
 * - Environment-driven configuration
 * - Log level parsing
 * - Key identifier validation
 * - Error kinds and messages
 */

#include <gtest/gtest.h>
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/security_config.hpp"
#include "didenvelope/utilities.hpp"
#include <cstdlib>
#include <string>

using namespace didenvelope;
using namespace didenvelope::security;

// Test fixture that restores the environment after each test
class SecurityConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear_environment();
    }

    void TearDown() override {
        clear_environment();
    }

    static void clear_environment() {
        unsetenv("DIDENVELOPE_LOG_LEVEL");
        unsetenv("DIDENVELOPE_LOG_FILE");
        unsetenv("DIDENVELOPE_MAX_ENVELOPE_SIZE");
    }
};

// ============================================================================
// Security Constants Tests
// ============================================================================

TEST_F(SecurityConfigTest, SecurityLimitsAreReasonable) {
    EXPECT_EQ(MAX_ENVELOPE_SIZE, 10u * 1024 * 1024);  // 10MB
    EXPECT_EQ(MAX_RECIPIENTS, 256u);
    EXPECT_EQ(MAX_SIGNATURES, 32u);
    EXPECT_EQ(MAX_KEY_ID_LENGTH, 512u);
}

TEST_F(SecurityConfigTest, CryptoSizesAreCorrect) {
    EXPECT_EQ(ED25519_SIGNATURE_SIZE, 64u);
    EXPECT_EQ(ED25519_PUBKEY_SIZE, 32u);
    EXPECT_EQ(ED25519_SEED_SIZE, 32u);
    EXPECT_EQ(EC_UNCOMPRESSED_POINT_SIZE, 1 + 2 * EC_FIELD_SIZE);
    EXPECT_EQ(EC_COMPRESSED_POINT_SIZE, 1 + EC_FIELD_SIZE);
    EXPECT_EQ(ECDSA_SIGNATURE_SIZE, 2 * EC_FIELD_SIZE);
    EXPECT_EQ(CEK_SIZE, 32u);
    EXPECT_EQ(KEK_SIZE, 32u);
    EXPECT_EQ(GCM_IV_SIZE, 12u);
    EXPECT_EQ(GCM_TAG_SIZE, 16u);
    EXPECT_EQ(KEY_WRAP_ICV_SIZE, 8u);
}

// ============================================================================
// Runtime Configuration Tests
// ============================================================================

TEST_F(SecurityConfigTest, LoadConfigDefaults) {
    EnvelopeConfig config = load_config();

    EXPECT_EQ(config.log_level, utilities::LogLevel::INFO);
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_EQ(config.max_envelope_size, MAX_ENVELOPE_SIZE);
}

TEST_F(SecurityConfigTest, LoadConfigFromEnvironment) {
    setenv("DIDENVELOPE_LOG_LEVEL", "debug", 1);
    setenv("DIDENVELOPE_LOG_FILE", "/tmp/didenvelope.log", 1);
    setenv("DIDENVELOPE_MAX_ENVELOPE_SIZE", " 4096 ", 1);

    EnvelopeConfig config = load_config();

    EXPECT_EQ(config.log_level, utilities::LogLevel::DEBUG);
    EXPECT_EQ(config.log_file, "/tmp/didenvelope.log");
    EXPECT_EQ(config.max_envelope_size, 4096u);
}

TEST_F(SecurityConfigTest, InvalidMaxSizeKeepsDefault) {
    for (const char* value : {"abc", "0", "-5", "12kb", "99999999999999999999999"}) {
        setenv("DIDENVELOPE_MAX_ENVELOPE_SIZE", value, 1);
        EXPECT_EQ(load_config().max_envelope_size, MAX_ENVELOPE_SIZE) << value;
    }
}

TEST_F(SecurityConfigTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), utilities::LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), utilities::LogLevel::INFO);
    EXPECT_EQ(parse_log_level("warn"), utilities::LogLevel::WARN);
    EXPECT_EQ(parse_log_level(" Warning "), utilities::LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), utilities::LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("critical"), utilities::LogLevel::CRITICAL);
}

TEST_F(SecurityConfigTest, ParseLogLevelFallsBack) {
    EXPECT_EQ(parse_log_level("verbose"), utilities::LogLevel::INFO);
    EXPECT_EQ(parse_log_level("", utilities::LogLevel::ERROR), utilities::LogLevel::ERROR);
}

// ============================================================================
// Key Identifier Validation Tests
// ============================================================================

TEST_F(SecurityConfigTest, ValidateKeyIdValid) {
    EXPECT_TRUE(validate_key_id("did:example:alice#key-1"));
    EXPECT_TRUE(validate_key_id("did:key:z6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMMsw#z6Mk"));
    EXPECT_TRUE(validate_key_id("did:web:example.com:user%20a;service=x?q=1/path"));
    EXPECT_TRUE(validate_key_id("k"));
}

TEST_F(SecurityConfigTest, ValidateKeyIdInvalid) {
    EXPECT_FALSE(validate_key_id(""));
    EXPECT_FALSE(validate_key_id("has space"));
    EXPECT_FALSE(validate_key_id("tab\there"));
    EXPECT_FALSE(validate_key_id("newline\n"));
    EXPECT_FALSE(validate_key_id(std::string("nul\0byte", 8)));
    EXPECT_FALSE(validate_key_id("caf\xc3\xa9"));
}

TEST_F(SecurityConfigTest, ValidateKeyIdLength) {
    EXPECT_TRUE(validate_key_id(std::string(MAX_KEY_ID_LENGTH, 'a')));
    EXPECT_FALSE(validate_key_id(std::string(MAX_KEY_ID_LENGTH + 1, 'a')));
    EXPECT_FALSE(validate_key_id("abcdef", 5));
}

// ============================================================================
// Error Tests
// ============================================================================

TEST_F(SecurityConfigTest, EnvelopeErrorCarriesKindAndReason) {
    EnvelopeError error(ErrorKind::KEY_NOT_FOUND, "key not found: did:example:bob#1");

    EXPECT_EQ(error.kind(), ErrorKind::KEY_NOT_FOUND);
    EXPECT_EQ(error.reason(), "key not found: did:example:bob#1");
    EXPECT_STREQ(error.what(), "KEY_NOT_FOUND: key not found: did:example:bob#1");
}

TEST_F(SecurityConfigTest, ErrorKindNames) {
    EXPECT_EQ(error_kind_to_string(ErrorKind::INVALID_PARAMETER), "INVALID_PARAMETER");
    EXPECT_EQ(error_kind_to_string(ErrorKind::INTEGRITY_CHECK_FAILED), "INTEGRITY_CHECK_FAILED");
    EXPECT_EQ(error_kind_to_string(ErrorKind::DECRYPTION_FAILED), "DECRYPTION_FAILED");
    EXPECT_EQ(error_kind_to_string(ErrorKind::POLICY_VIOLATION), "POLICY_VIOLATION");
}

// ============================================================================
// Utility Tests
// ============================================================================

TEST_F(SecurityConfigTest, StringHelpers) {
    EXPECT_EQ(utilities::trim_string("  x y  "), "x y");
    EXPECT_EQ(utilities::trim_string("   "), "");
    EXPECT_EQ(utilities::to_lowercase("DeBuG"), "debug");
    EXPECT_TRUE(utilities::starts_with("did:key:z6Mk", "did:key:"));
    EXPECT_FALSE(utilities::starts_with("did", "did:key:"));
}

TEST_F(SecurityConfigTest, LoggingDoesNotThrow) {
    utilities::initialize_logging("", utilities::LogLevel::DEBUG);
    EXPECT_NO_THROW(utilities::log_debug("debug message"));
    EXPECT_NO_THROW(utilities::log_info("info message"));
    EXPECT_NO_THROW(utilities::log_warn("warn message"));
    EXPECT_NO_THROW(utilities::log_error("error message"));
}
