/**
 * @file utilities.hpp
 * @brief Common utility functions for Ferry
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout Ferry:
 * - Logging and error reporting
 * - Size, speed and duration formatting
 * - Hex encoding
 * - Session identifier generation
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

namespace ferry {
namespace utilities {

/**
 * @brief Log levels for Ferry logging
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
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @return LogLevel if recognised, std::nullopt otherwise
 */
std::optional<LogLevel> string_to_log_level(const std::string& name);

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
 * @brief Format file size in human-readable format
 * @param size Size in bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
std::string format_file_size(uint64_t size);

/**
 * @brief Format a throughput value
 * @param bytes_per_second Speed in bytes per second
 * @return Formatted string (e.g., "3.2 MB/s")
 */
std::string format_speed(double bytes_per_second);

/**
 * @brief Format duration in human-readable format
 * @param seconds Duration in seconds
 * @return Formatted string (e.g., "1h 23m 45s")
 */
std::string format_duration(uint64_t seconds);

/**
 * @brief Convert bytes to lowercase hex string
 */
std::string bytes_to_hex(const uint8_t* data, size_t size);

/**
 * @brief Convert bytes to lowercase hex string
 */
std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

/**
 * @brief Generate a random RFC 4122 version 4 UUID
 *
 * Uses the libsodium CSPRNG; session identifiers feed the chunk nonce and
 * must not repeat.
 *
 * @return UUID string (lowercase, hyphenated)
 */
std::string generate_uuid();

/**
 * @brief Milliseconds elapsed between two steady clock points
 */
uint64_t elapsed_ms(std::chrono::steady_clock::time_point since,
                    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

} // namespace utilities
} // namespace ferry
