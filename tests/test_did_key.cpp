/**
 * @file test_did_key.cpp
 * @brief Unit tests for did:key encoding and key resolvers
 */

#include <gtest/gtest.h>
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/did_key.hpp"
#include "didenvelope/ec_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/key_resolver.hpp"
#include "didenvelope/local_agent_key.hpp"
#include "didenvelope/security_config.hpp"
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace didenvelope;

class DidKeyTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(AgentCrypto::initialize());
    }

    // RFC 8032 section 7.1, test 1
    static std::vector<uint8_t> rfc8032_public_key() {
        return AgentCrypto::hex_to_bytes(
            "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a").value_or(std::vector<uint8_t>());
    }
};

// ============================================================================
// Encoding
// ============================================================================

TEST_F(DidKeyTest, EncodeEd25519KnownKey) {
    EXPECT_EQ(DidKey::encode(KeyType::ED25519, rfc8032_public_key()),
              "did:key:z6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMMsw");
}

TEST_F(DidKeyTest, DefaultKeyIdRepeatsFragment) {
    EXPECT_EQ(DidKey::default_key_id(KeyType::ED25519, rfc8032_public_key()),
              "did:key:z6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMMsw"
              "#z6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMMsw");
}

TEST_F(DidKeyTest, MulticodecPrefixes) {
    auto p256 = LocalAgentKey::generate(KeyType::P256);
    auto k1 = LocalAgentKey::generate(KeyType::SECP256K1);
    auto ed = LocalAgentKey::generate(KeyType::ED25519);

    EXPECT_EQ(p256->did().rfind("did:key:zDn", 0), 0u);
    EXPECT_EQ(k1->did().rfind("did:key:zQ3s", 0), 0u);
    EXPECT_EQ(ed->did().rfind("did:key:z6Mk", 0), 0u);
}

TEST_F(DidKeyTest, EcEncodingIgnoresPointFormat) {
    auto private_key = EcCrypto::generate_private_key(EcCurve::P256);
    auto uncompressed = EcCrypto::public_key_from_private(EcCurve::P256, private_key);
    ASSERT_TRUE(uncompressed.has_value());
    auto compressed = EcCrypto::compress_public_key(EcCurve::P256, *uncompressed);
    ASSERT_TRUE(compressed.has_value());

    EXPECT_EQ(DidKey::encode(KeyType::P256, *uncompressed), DidKey::encode(KeyType::P256, *compressed));
}

TEST_F(DidKeyTest, EncodeRejectsInvalidKey) {
    EXPECT_THROW(DidKey::encode(KeyType::ED25519, std::vector<uint8_t>(16, 0x01)), EnvelopeError);
    EXPECT_THROW(DidKey::encode(KeyType::SECP256K1, std::vector<uint8_t>(33, 0x02)), EnvelopeError);
}

// ============================================================================
// Resolution
// ============================================================================

TEST_F(DidKeyTest, ResolveEd25519KnownKey) {
    auto jwk = DidKey::resolve("did:key:z6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMMsw");
    ASSERT_TRUE(jwk.has_value());

    EXPECT_EQ(jwk->kty, "OKP");
    EXPECT_EQ(jwk->crv, "Ed25519");
    EXPECT_EQ(jwk->x, "11qYAYKxCrfVS_7TyWQHOg7hcvPapiMlrwIaaPcHURo");
    EXPECT_EQ(jwk->kid, "did:key:z6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMMsw"
                        "#z6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMMsw");
}

TEST_F(DidKeyTest, ResolveKeepsExplicitFragment) {
    auto jwk = DidKey::resolve("did:key:z6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMMsw#signing");
    ASSERT_TRUE(jwk.has_value());
    EXPECT_EQ(jwk->kid, "did:key:z6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMMsw#signing");
}

TEST_F(DidKeyTest, ResolveGeneratedKeysOfEveryType) {
    for (KeyType type : {KeyType::ED25519, KeyType::P256, KeyType::SECP256K1}) {
        auto key = LocalAgentKey::generate(type);

        auto jwk = DidKey::resolve(key->key_id());
        ASSERT_TRUE(jwk.has_value()) << key_type_to_string(type);
        EXPECT_EQ(jwk->key_type(), type);
        EXPECT_EQ(*jwk, key->public_key_jwk());
    }
}

TEST_F(DidKeyTest, ResolveRejectsMalformedIdentifiers) {
    EXPECT_FALSE(DidKey::resolve("did:web:example.com").has_value());
    EXPECT_FALSE(DidKey::resolve("did:key:").has_value());
    EXPECT_FALSE(DidKey::resolve("did:key:m6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMMsw").has_value());
    EXPECT_FALSE(DidKey::resolve("did:key:z0OIl").has_value());
    // Truncated key bytes
    EXPECT_FALSE(DidKey::resolve("did:key:z6MktwupdmLXVVqTzCw4i46r4uGyosGXRnR3XjN4Zq7oMM").has_value());
}

TEST_F(DidKeyTest, ResolveRejectsOverlongIdentifiers) {
    std::string did = std::string(DidKey::PREFIX) + "z" + std::string(security::MAX_KEY_ID_LENGTH, 'z');
    EXPECT_FALSE(DidKey::resolve(did).has_value());

    DidKeyResolver resolver;
    EXPECT_FALSE(resolver.resolve(did + "#" + std::string(1 << 20, 'z')).has_value());
}

TEST_F(DidKeyTest, ResolveRejectsUnknownMulticodec) {
    // x25519-pub (0xec) is not a supported key type
    std::vector<uint8_t> encoded = {0xec, 0x01};
    encoded.resize(34, 0x09);
    std::string did = std::string(DidKey::PREFIX) + "z" + AgentCrypto::bytes_to_base58(encoded);

    EXPECT_FALSE(DidKey::resolve(did).has_value());
}

// ============================================================================
// Resolvers
// ============================================================================

TEST_F(DidKeyTest, StaticResolverStoresPublicOnly) {
    auto key = LocalAgentKey::generate(KeyType::P256, "did:example:alice#key-1");
    StaticKeyResolver resolver;
    resolver.add(key->key_id(), key->export_private_jwk());

    auto jwk = resolver.resolve("did:example:alice#key-1");
    ASSERT_TRUE(jwk.has_value());
    EXPECT_FALSE(jwk->has_private());
    EXPECT_EQ(jwk->x, key->public_key_jwk().x);

    EXPECT_FALSE(resolver.resolve("did:example:alice#key-2").has_value());
    EXPECT_TRUE(resolver.remove("did:example:alice#key-1"));
    EXPECT_FALSE(resolver.remove("did:example:alice#key-1"));
    EXPECT_FALSE(resolver.resolve("did:example:alice#key-1").has_value());
}

TEST_F(DidKeyTest, ChainedResolverTriesInOrder) {
    auto local = std::make_shared<StaticKeyResolver>();
    auto override_key = LocalAgentKey::generate(KeyType::ED25519);
    auto did_key = LocalAgentKey::generate(KeyType::ED25519);

    // The static entry shadows the did:key document for the same identifier
    local->add(did_key->key_id(), override_key->public_key_jwk());

    ChainedKeyResolver chain({local, nullptr, std::make_shared<DidKeyResolver>()});

    auto shadowed = chain.resolve(did_key->key_id());
    ASSERT_TRUE(shadowed.has_value());
    EXPECT_EQ(shadowed->x, override_key->public_key_jwk().x);

    auto fallback = chain.resolve(override_key->key_id());
    ASSERT_TRUE(fallback.has_value());
    EXPECT_EQ(fallback->x, override_key->public_key_jwk().x);

    EXPECT_FALSE(chain.resolve("did:example:nobody#1").has_value());
}

TEST_F(DidKeyTest, StaticResolverConcurrentAccess) {
    StaticKeyResolver resolver;
    auto key = LocalAgentKey::generate(KeyType::ED25519);
    Jwk jwk = key->public_key_jwk();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 100; i++) {
                std::string id = "did:example:t" + std::to_string(t) + "#" + std::to_string(i);
                resolver.add(id, jwk);
                EXPECT_TRUE(resolver.resolve(id).has_value());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_TRUE(resolver.resolve("did:example:t3#99").has_value());
}
