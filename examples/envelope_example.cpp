/**
 * @file envelope_example.cpp
 * @brief Envelope example - Pack and unpack a message in every security mode
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates:
 * - Generating did:key identities for two agents
 * - Packing plain, signed, encrypted and signed-then-encrypted envelopes
 * - Unpacking with a signature requirement and reading provenance
 */

#include "didenvelope/agent_crypto.hpp"
#include "didenvelope/envelope_error.hpp"
#include "didenvelope/key_manager.hpp"
#include "didenvelope/local_agent_key.hpp"
#include "didenvelope/message_packing.hpp"
#include "didenvelope/security_config.hpp"
#include "didenvelope/utilities.hpp"
#include <iostream>
#include <memory>
#include <string>

using namespace didenvelope;

namespace {
    void show(const std::string& label, const std::string& packed, const UnpackResult& result) {
        std::cout << "--- " << label << " ---\n";
        std::cout << "  Wire size:  " << packed.size() << " bytes\n";
        std::cout << "  Mode:       " << security_mode_to_string(result.provenance.mode) << "\n";
        if (result.provenance.signer_kid) {
            std::cout << "  Signer:     " << *result.provenance.signer_kid << "\n";
        }
        if (result.provenance.sender_kid) {
            std::cout << "  Sender:     " << *result.provenance.sender_kid << " (unauthenticated)\n";
        }
        if (result.provenance.recipient_kid) {
            std::cout << "  Recipient:  " << *result.provenance.recipient_kid << "\n";
        }
        std::cout << "  Payload:    " << result.payload << "\n\n";
    }
}

int main(int argc, char** argv) {
    std::string content = argc >= 2 ? argv[1] : "Hello Bob";

    try {
        security::EnvelopeConfig config = security::load_config();
        utilities::initialize_logging(config.log_file, config.log_level);

        if (!AgentCrypto::initialize()) {
            std::cerr << "Error: crypto initialization failed\n";
            return 1;
        }

        std::cout << "\n=== DIDEnvelope Example ===\n\n";

        KeyManager alice;
        KeyManager bob;

        auto alice_signing = alice.generate_key(KeyType::ED25519);
        auto alice_agreement = alice.generate_key(KeyType::P256);
        auto bob_agreement = bob.generate_key(KeyType::P256);

        std::cout << "Alice signs with:  " << alice_signing->key_id() << "\n";
        std::cout << "Bob decrypts with: " << bob_agreement->key_id() << "\n\n";

        // Alice only knows Bob's public key
        std::shared_ptr<const VerificationKey> bob_public = std::make_shared<PublicVerificationKey>(
            bob_agreement->key_id(), bob_agreement->public_key_jwk());

        const std::string message =
            R"({"id":"1","type":"https://didcomm.org/basicmessage/2.0/message","body":{"content":")" +
            content + R"("}})";

        UnpackOptions options;
        options.max_envelope_size = config.max_envelope_size;

        std::string packed = pack(message, SecurityMode::plain(), alice);
        show("Plain", packed, unpack(packed, bob, options));

        packed = pack(message, SecurityMode::signed_by(alice_signing->key_id()), alice);
        show("Signed", packed, unpack(packed, bob, options));

        packed = pack(message, SecurityMode::encrypted({bob_public}, alice_agreement->key_id()), alice);
        show("Encrypted", packed, unpack(packed, bob, options));

        packed = pack(message, SecurityMode::signed_and_encrypted(alice_signing->key_id(), {bob_public}), alice);
        options.require_signature = true;
        show("Signed + Encrypted", packed, unpack(packed, bob, options));

        // Unsigned envelopes are refused once a signature is required
        packed = pack(message, SecurityMode::encrypted({bob_public}), alice);
        try {
            unpack(packed, bob, options);
            std::cout << "Unexpected: unsigned envelope accepted\n";
            return 1;
        } catch (const EnvelopeError& e) {
            std::cout << "Rejected unsigned envelope: " << e.what() << "\n";
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
