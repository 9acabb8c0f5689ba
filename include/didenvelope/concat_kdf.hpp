/**
 * @file concat_kdf.hpp
 * @brief Concat KDF (NIST SP 800-56A single-step, SHA-256) for ECDH-ES
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * OtherInfo follows RFC 7518 section 4.6.2 with AlgorithmID fixed to
 * "ECDH-ES+A256KW".
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace didenvelope {

/**
 * @brief ConcatKdf - Derives key-encryption keys from ECDH shared secrets
 */
class ConcatKdf {
public:
    /// AlgorithmID bound into OtherInfo
    static constexpr const char* ALGORITHM_ID = "ECDH-ES+A256KW";

    /**
     * @brief Derive key material
     * @param shared_secret Raw ECDH output (Z)
     * @param apu Agreement PartyUInfo (may be empty)
     * @param apv Agreement PartyVInfo (may be empty)
     * @param key_data_len_bits Output length in bits (non-zero multiple of 8)
     * @return key_data_len_bits / 8 bytes
     * @throws EnvelopeError INVALID_PARAMETER on a bad output length
     */
    static std::vector<uint8_t> derive(
        const std::vector<uint8_t>& shared_secret,
        const std::vector<uint8_t>& apu,
        const std::vector<uint8_t>& apv,
        uint32_t key_data_len_bits
    );

    /**
     * @brief Build the OtherInfo block
     * @param apu Agreement PartyUInfo
     * @param apv Agreement PartyVInfo
     * @param key_data_len_bits Output length in bits
     * @return Serialized OtherInfo
     */
    static std::vector<uint8_t> other_info(
        const std::vector<uint8_t>& apu,
        const std::vector<uint8_t>& apv,
        uint32_t key_data_len_bits
    );
};

} // namespace didenvelope
