/**
 * @file message_packing.cpp
 * @brief Implementation of the pack/unpack pipeline
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didenvelope/message_packing.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/jwe.hpp"
#include "didenvelope/jws.hpp"
#include "didenvelope/message_types.hpp"
#include "didenvelope/utilities.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace didenvelope {

namespace {
    std::string canonicalize(const std::string& payload_json) {
        try {
            return json::parse(payload_json).dump();
        } catch (const json::exception&) {
            throw EnvelopeError(ErrorKind::SERIALIZATION_ERROR, "payload is not valid JSON");
        }
    }

    std::vector<uint8_t> to_bytes(const std::string& str) {
        return std::vector<uint8_t>(str.begin(), str.end());
    }

    std::vector<JweCodec::Recipient> to_recipients(
        const std::vector<std::shared_ptr<const VerificationKey>>& keys
    ) {
        std::vector<JweCodec::Recipient> recipients;
        recipients.reserve(keys.size());
        for (const auto& key : keys) {
            if (!key) {
                throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "null recipient key");
            }
            recipients.push_back(JweCodec::recipient_from(*key));
        }
        return recipients;
    }

    JwsCodec::KeyLookup lookup_from(const KeyManager& key_manager) {
        return [&key_manager](const std::string& kid) -> std::shared_ptr<const VerificationKey> {
            try {
                return key_manager.resolve_verification_key(kid);
            } catch (const EnvelopeError& e) {
                if (e.kind() != ErrorKind::KEY_NOT_FOUND) {
                    throw;
                }
                return nullptr;
            }
        };
    }

    // Picks the local key that decrypts; throws when none can
    std::string select_recipient(const Jwe& jwe, const KeyManager& key_manager, const UnpackOptions& options) {
        if (options.expected_recipient_kid) {
            if (jwe.find_recipient(*options.expected_recipient_kid) == nullptr) {
                throw EnvelopeError(ErrorKind::DECRYPTION_FAILED, "not an intended recipient");
            }
            return *options.expected_recipient_kid;
        }

        for (const auto& recipient : jwe.recipients) {
            if (key_manager.can_decrypt(recipient.header.kid)) {
                return recipient.header.kid;
            }
        }

        throw EnvelopeError(ErrorKind::DECRYPTION_FAILED, "not an intended recipient");
    }

    JwsCodec::Verified verify_jws_text(const std::string& text, const KeyManager& key_manager) {
        auto jws = Jws::from_json(text);
        if (!jws) {
            throw EnvelopeError(ErrorKind::SERIALIZATION_ERROR, "malformed signed envelope");
        }
        return JwsCodec::verify(*jws, lookup_from(key_manager));
    }
}

// ============================================================================
// Security Modes
// ============================================================================

SecurityMode SecurityMode::plain() {
    return SecurityMode{};
}

SecurityMode SecurityMode::signed_by(const std::string& signing_key_id) {
    SecurityMode mode;
    mode.kind = Kind::SIGNED;
    mode.signing_key_id = signing_key_id;
    return mode;
}

SecurityMode SecurityMode::encrypted(
    std::vector<std::shared_ptr<const VerificationKey>> recipients,
    std::optional<std::string> sender_key_id
) {
    SecurityMode mode;
    mode.kind = Kind::ENCRYPTED;
    mode.recipients = std::move(recipients);
    mode.sender_key_id = std::move(sender_key_id);
    return mode;
}

SecurityMode SecurityMode::signed_and_encrypted(
    const std::string& signing_key_id,
    std::vector<std::shared_ptr<const VerificationKey>> recipients
) {
    SecurityMode mode;
    mode.kind = Kind::SIGNED_ENCRYPTED;
    mode.signing_key_id = signing_key_id;
    mode.recipients = std::move(recipients);
    return mode;
}

std::string security_mode_to_string(SecurityMode::Kind kind) {
    switch (kind) {
        case SecurityMode::Kind::PLAIN: return "PLAIN";
        case SecurityMode::Kind::SIGNED: return "SIGNED";
        case SecurityMode::Kind::ENCRYPTED: return "ENCRYPTED";
        case SecurityMode::Kind::SIGNED_ENCRYPTED: return "SIGNED_ENCRYPTED";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Pack
// ============================================================================

std::string pack(const std::string& payload_json, const SecurityMode& mode, const KeyManager& key_manager) {
    const std::string canonical = canonicalize(payload_json);

    utilities::log_debug("Packing message as " + security_mode_to_string(mode.kind));

    switch (mode.kind) {
        case SecurityMode::Kind::PLAIN:
            return canonical;

        case SecurityMode::Kind::SIGNED: {
            auto signing_key = key_manager.get_signing_key(mode.signing_key_id);
            return signing_key->create_jws(to_bytes(canonical)).to_json();
        }

        case SecurityMode::Kind::ENCRYPTED: {
            if (mode.sender_key_id) {
                auto sender = key_manager.get_encryption_key(*mode.sender_key_id);
                return sender->create_jwe(to_bytes(canonical), mode.recipients).to_json();
            }
            return JweCodec::encrypt(to_bytes(canonical), to_recipients(mode.recipients), std::nullopt).to_json();
        }

        case SecurityMode::Kind::SIGNED_ENCRYPTED: {
            auto signing_key = key_manager.get_signing_key(mode.signing_key_id);
            std::string inner = signing_key->create_jws(to_bytes(canonical)).to_json();

            JweProtected header;
            header.cty = SIGNED_MESSAGE_TYP;
            return JweCodec::encrypt(to_bytes(inner), to_recipients(mode.recipients),
                                     mode.signing_key_id, header).to_json();
        }
    }

    throw EnvelopeError(ErrorKind::INVALID_PARAMETER, "unknown security mode");
}

// ============================================================================
// Unpack
// ============================================================================

UnpackResult unpack(const std::string& transport, const KeyManager& key_manager, const UnpackOptions& options) {
    if (transport.size() > options.max_envelope_size) {
        throw EnvelopeError(ErrorKind::INVALID_FORMAT, "envelope exceeds maximum size");
    }

    json parsed;
    try {
        parsed = json::parse(transport);
    } catch (const json::exception&) {
        throw EnvelopeError(ErrorKind::SERIALIZATION_ERROR, "envelope is not valid JSON");
    }

    UnpackResult result;
    const bool is_object = parsed.is_object();

    if (is_object && parsed.contains("signatures")) {
        auto verified = verify_jws_text(transport, key_manager);
        result.payload.assign(verified.payload.begin(), verified.payload.end());
        result.provenance.mode = SecurityMode::Kind::SIGNED;
        result.provenance.signer_kid = verified.signer_kid;

    } else if (is_object && parsed.contains("recipients")) {
        auto jwe = Jwe::from_json(transport);
        if (!jwe) {
            throw EnvelopeError(ErrorKind::SERIALIZATION_ERROR, "malformed encrypted envelope");
        }

        std::string recipient_kid = select_recipient(*jwe, key_manager, options);
        auto decryption_key = key_manager.get_decryption_key(recipient_kid);

        std::vector<uint8_t> plaintext;
        try {
            plaintext = decryption_key->unwrap_jwe(*jwe);
        } catch (const EnvelopeError& e) {
            utilities::log_warn("Decryption failed for " + recipient_kid + ": " + e.reason());
            throw;
        }

        result.provenance.recipient_kid = recipient_kid;
        result.provenance.sender_kid = jwe->find_recipient(recipient_kid)->header.sender_kid;

        auto header = JweProtected::decode(jwe->protected_header);
        if (header && header->cty && *header->cty == SIGNED_MESSAGE_TYP) {
            auto verified = verify_jws_text(std::string(plaintext.begin(), plaintext.end()), key_manager);
            result.payload.assign(verified.payload.begin(), verified.payload.end());
            result.provenance.mode = SecurityMode::Kind::SIGNED_ENCRYPTED;
            result.provenance.signer_kid = verified.signer_kid;
        } else {
            result.payload.assign(plaintext.begin(), plaintext.end());
            result.provenance.mode = SecurityMode::Kind::ENCRYPTED;
        }

    } else {
        result.payload = parsed.dump();
        result.provenance.mode = SecurityMode::Kind::PLAIN;
    }

    utilities::log_debug("Unpacked " + security_mode_to_string(result.provenance.mode) + " message");

    if (options.require_signature && !result.provenance.signer_kid) {
        utilities::log_warn("Rejected unsigned " + security_mode_to_string(result.provenance.mode) + " message");
        throw EnvelopeError(ErrorKind::POLICY_VIOLATION, "signature required");
    }

    return result;
}

} // namespace didenvelope
