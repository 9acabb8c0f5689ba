/**
 * @file utilities.hpp
 * @brief Common utility functions for DIDEnvelope
 *
 * DIDEnvelope - DID-addressed secure messaging envelope
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout DIDEnvelope:
 * - Logging and error reporting
 * - String manipulation
 * - Environment access
 */

#pragma once

#include <string>

namespace didenvelope {
namespace utilities {

/**
 * @brief Log levels for DIDEnvelope logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Trim whitespace from string
 * @param str String to trim
 * @return Trimmed string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 * @param str String to convert
 * @return Lowercase string
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Check if string starts with prefix
 * @param str String to check
 * @param prefix Prefix to check for
 * @return true if starts with prefix, false otherwise
 */
bool starts_with(const std::string& str, const std::string& prefix);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

} // namespace utilities
} // namespace didenvelope
