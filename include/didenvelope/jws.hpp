/**
 * @file jws.hpp
 * @brief JWS construction and verification
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Signing input is always recomputed from the envelope's own protected
 * header and payload, never from caller-supplied copies.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "didenvelope/agent_key.hpp"
#include "didenvelope/message_types.hpp"

namespace didenvelope {

/**
 * @brief JwsCodec - Signs and verifies general JWS JSON envelopes
 */
class JwsCodec {
public:
    /// Resolves a verification key by kid; returns nullptr when unknown
    using KeyLookup = std::function<std::shared_ptr<const VerificationKey>(const std::string&)>;

    /**
     * @brief Result of a successful verification
     */
    struct Verified {
        std::vector<uint8_t> payload;  ///< Decoded payload bytes
        std::string signer_kid;        ///< kid of the first verified signature
    };

    /**
     * @brief Build the JWS signing input
     * @param protected_b64 Base64url protected header
     * @param payload_b64 Base64url payload
     * @return ASCII bytes of protected_b64 "." payload_b64
     */
    static std::vector<uint8_t> signing_input(const std::string& protected_b64, const std::string& payload_b64);

    /**
     * @brief Sign a payload
     * @param key Signing key
     * @param payload Payload bytes
     * @param protected_header Header template; alg is set from the key
     * @return JWS with a single signature
     */
    static Jws sign(
        const SigningKey& key,
        const std::vector<uint8_t>& payload,
        const std::optional<JwsProtected>& protected_header = std::nullopt
    );

    /**
     * @brief Check one signature of an envelope
     * @param jws Envelope supplying the payload
     * @param signature Signature entry to check
     * @param key Verification key for signature.header.kid
     * @return true if valid, false for any mismatch or malformed field
     */
    static bool verify_signature(const Jws& jws, const JwsSignature& signature, const VerificationKey& key);

    /**
     * @brief Verify an envelope and return its payload
     *
     * Every signature whose key resolves must verify, and at least one must.
     *
     * @param jws Envelope
     * @param lookup Verification key resolver
     * @return Payload and signer kid
     * @throws EnvelopeError VERIFICATION_FAILED, KEY_NOT_FOUND or INVALID_FORMAT
     */
    static Verified verify(const Jws& jws, const KeyLookup& lookup);
};

} // namespace didenvelope
