/**
 * @file utilities.hpp
 * @brief Common utility functions for MeshDir
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout MeshDir:
 * - Logging and error reporting
 * - String manipulation
 * - Byte/string conversion
 * - Environment helpers
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace meshdir {
namespace utilities {

/**
 * @brief Log levels for MeshDir logging
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
 * @brief Change the minimum level of the active logger
 * @param level Minimum log level to output
 */
void set_log_level(LogLevel level);

/**
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if the name is unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

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
 * @brief Format a byte count in human-readable format
 * @param size Size in bytes
 * @return Formatted string (e.g., "1.5 KB")
 */
std::string format_byte_size(uint64_t size);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Copy a string's characters into a byte vector
 */
std::vector<uint8_t> string_to_bytes(const std::string& str);

/**
 * @brief Copy a byte vector into a string
 */
std::string bytes_to_string(const std::vector<uint8_t>& bytes);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Parse an unsigned integer, rejecting trailing garbage
 * @param str Decimal string
 * @return Parsed value or std::nullopt
 */
std::optional<uint64_t> parse_unsigned(const std::string& str);

} // namespace utilities
} // namespace meshdir
