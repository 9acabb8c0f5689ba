/**
 * @file security_config.cpp
 * @brief Implementation of configuration loading and validation functions
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didenvelope/security_config.hpp"
#include <cctype>
#include <stdexcept>

namespace didenvelope {
namespace security {

// ============================================================================
// Runtime Configuration
// ============================================================================

utilities::LogLevel parse_log_level(const std::string& name, utilities::LogLevel fallback) {
    std::string level = utilities::to_lowercase(utilities::trim_string(name));

    if (level == "debug") return utilities::LogLevel::DEBUG;
    if (level == "info") return utilities::LogLevel::INFO;
    if (level == "warn" || level == "warning") return utilities::LogLevel::WARN;
    if (level == "error") return utilities::LogLevel::ERROR;
    if (level == "critical") return utilities::LogLevel::CRITICAL;
    return fallback;
}

EnvelopeConfig load_config() {
    EnvelopeConfig config;

    config.log_level = parse_log_level(utilities::get_env("DIDENVELOPE_LOG_LEVEL", "info"));
    config.log_file = utilities::get_env("DIDENVELOPE_LOG_FILE");

    std::string max_size = utilities::trim_string(utilities::get_env("DIDENVELOPE_MAX_ENVELOPE_SIZE"));
    if (!max_size.empty()) {
        try {
            // stoull accepts a sign, so digits are checked first
            unsigned long long value = 0;
            if (max_size.find_first_not_of("0123456789") == std::string::npos) {
                value = std::stoull(max_size);
            }
            if (value > 0) {
                config.max_envelope_size = static_cast<size_t>(value);
            } else {
                utilities::log_warn("Ignoring invalid DIDENVELOPE_MAX_ENVELOPE_SIZE: " + max_size);
            }
        } catch (const std::exception&) {
            utilities::log_warn("Ignoring invalid DIDENVELOPE_MAX_ENVELOPE_SIZE: " + max_size);
        }
    }

    return config;
}

// ============================================================================
// Input Validation
// ============================================================================

bool validate_key_id(const std::string& key_id, size_t max_length) {
    if (key_id.empty() || key_id.length() > max_length) {
        return false;
    }

    // Visible ASCII only: DID URLs use ':', '#', ';', '/', '?' and '%'
    for (char c : key_id) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x21 || uc > 0x7e) {
            return false;
        }
    }

    return true;
}

} // namespace security
} // namespace didenvelope
