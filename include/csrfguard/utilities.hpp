/**
 * @file utilities.hpp
 * @brief Common utility functions for CSRFGuard
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout CSRFGuard:
 * - Logging and error reporting
 * - Time and date formatting
 * - String manipulation
 * - File and environment helpers
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace csrfguard {
namespace utilities {

/**
 * @brief Log levels for CSRFGuard logging
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
 * @brief Initialize logging from CSRFGUARD_LOG_LEVEL and CSRFGUARD_LOG_FILE
 */
void initialize_logging_from_environment();

/**
 * @brief Parse a log level name (debug, info, warn, error, critical)
 * @param name Level name, case-insensitive
 * @return Parsed level or std::nullopt if unknown
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
 * @brief Format timestamp as ISO 8601 string
 * @param epoch_seconds Unix timestamp (seconds since epoch, fraction dropped)
 * @return Formatted string (e.g., "2025-11-10T15:30:45Z"); values outside
 *         year 1970..9999 are clamped, NaN yields an empty string
 */
std::string format_timestamp(double epoch_seconds);

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Split string by delimiter
 * @param str String to split
 * @param delimiter Delimiter character
 * @return Vector of split strings
 */
std::vector<std::string> split_string(const std::string& str, char delimiter);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

std::string to_lowercase(const std::string& str);
std::string to_uppercase(const std::string& str);

/**
 * @brief Case-insensitive ASCII comparison (header names, method names)
 */
bool iequals(const std::string& a, const std::string& b);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Parse a boolean flag ("1", "true", "yes", "on" / "0", "false", "no", "off")
 * @return Parsed value or std::nullopt if unrecognized
 */
std::optional<bool> parse_bool(const std::string& value);

} // namespace utilities
} // namespace csrfguard
