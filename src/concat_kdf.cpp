/**
 * @file concat_kdf.cpp
 * @brief Implementation of the Concat KDF
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/concat_kdf.hpp"
#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/envelope_error.hpp"

#include <cstring>

namespace didenvelope {

namespace {
    void append_be32(std::vector<uint8_t>& out, uint32_t value) {
        out.push_back(static_cast<uint8_t>(value >> 24));
        out.push_back(static_cast<uint8_t>(value >> 16));
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    }

    void append_length_prefixed(std::vector<uint8_t>& out, const uint8_t* data, size_t size) {
        append_be32(out, static_cast<uint32_t>(size));
        out.insert(out.end(), data, data + size);
    }
}

std::vector<uint8_t> ConcatKdf::other_info(
    const std::vector<uint8_t>& apu,
    const std::vector<uint8_t>& apv,
    uint32_t key_data_len_bits
) {
    std::vector<uint8_t> info;
    info.reserve(4 + std::strlen(ALGORITHM_ID) + 4 + apu.size() + 4 + apv.size() + 4);

    append_length_prefixed(info, reinterpret_cast<const uint8_t*>(ALGORITHM_ID), std::strlen(ALGORITHM_ID));
    append_length_prefixed(info, apu.data(), apu.size());
    append_length_prefixed(info, apv.data(), apv.size());
    append_be32(info, key_data_len_bits);

    return info;
}

std::vector<uint8_t> ConcatKdf::derive(
    const std::vector<uint8_t>& shared_secret,
    const std::vector<uint8_t>& apu,
    const std::vector<uint8_t>& apv,
    uint32_t key_data_len_bits
) {
    if (key_data_len_bits == 0 || key_data_len_bits % 8 != 0) {
        throw EnvelopeError(ErrorKind::INVALID_PARAMETER,
                            "key data length must be a non-zero multiple of 8 bits");
    }

    const size_t output_len = key_data_len_bits / 8;
    const std::vector<uint8_t> info = other_info(apu, apv, key_data_len_bits);

    std::vector<uint8_t> output;
    output.reserve(output_len + crypto_hash_sha256_BYTES);

    // One SHA-256 round per 256 bits, counter starts at 1
    for (uint32_t counter = 1; output.size() < output_len; counter++) {
        std::vector<uint8_t> round_input;
        round_input.reserve(4 + shared_secret.size() + info.size());
        append_be32(round_input, counter);
        round_input.insert(round_input.end(), shared_secret.begin(), shared_secret.end());
        round_input.insert(round_input.end(), info.begin(), info.end());

        std::vector<uint8_t> digest = AgentCrypto::sha256(round_input);
        output.insert(output.end(), digest.begin(), digest.end());

        AgentCrypto::secure_zero(round_input);
        AgentCrypto::secure_zero(digest);
    }

    if (output.size() > output_len) {
        AgentCrypto::secure_zero(output.data() + output_len, output.size() - output_len);
        output.resize(output_len);
    }

    return output;
}

} // namespace didenvelope
