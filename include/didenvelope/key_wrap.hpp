/**
 * @file key_wrap.hpp
 * @brief AES Key Wrap (RFC 3394) with a 256-bit key-encryption key
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <cstdint>
#include <vector>

namespace didenvelope {

/**
 * @brief AesKeyWrap - Authenticated wrapping of content-encryption keys
 */
class AesKeyWrap {
public:
    /**
     * @brief Wrap a key
     * @param kek Key-encryption key (32 bytes)
     * @param plaintext_key Key to wrap (>= 16 bytes, multiple of 8)
     * @return Wrapped key, 8 bytes longer than the input
     * @throws EnvelopeError INVALID_PARAMETER on bad lengths
     */
    static std::vector<uint8_t> wrap(
        const std::vector<uint8_t>& kek,
        const std::vector<uint8_t>& plaintext_key
    );

    /**
     * @brief Unwrap a key and verify its integrity check value
     * @param kek Key-encryption key (32 bytes)
     * @param wrapped Wrapped key (>= 24 bytes, multiple of 8)
     * @return Unwrapped key
     * @throws EnvelopeError INVALID_PARAMETER on bad lengths,
     *         INTEGRITY_CHECK_FAILED on wrong KEK or tampering
     */
    static std::vector<uint8_t> unwrap(
        const std::vector<uint8_t>& kek,
        const std::vector<uint8_t>& wrapped
    );
};

} // namespace didenvelope
