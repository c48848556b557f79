/**
 * @file transfer_config.hpp
 * @brief Limits, defaults, runtime configuration and path safety for Ferry
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string>
#include <optional>
#include <filesystem>

namespace ferry {
namespace config {

// ============================================================================
// Chunking
// ============================================================================

/// Default chunk size (256 KiB)
constexpr uint32_t DEFAULT_CHUNK_SIZE = 256 * 1024;

/// Smallest chunk size a peer may offer
constexpr uint32_t MIN_CHUNK_SIZE = 16;

/// Largest chunk size a peer may offer (4 MiB)
constexpr uint32_t MAX_CHUNK_SIZE = 4 * 1024 * 1024;

/// Maximum encoded wire message (10MB) to prevent memory exhaustion
constexpr size_t MAX_MESSAGE_SIZE = 10 * 1024 * 1024;

/// Maximum number of files in a single offer
constexpr size_t MAX_FILES_PER_OFFER = 10000;

/// Maximum length of a single path component
constexpr size_t MAX_FILENAME_LENGTH = 255;

/// Maximum length of an offered relative path
constexpr size_t MAX_RELATIVE_PATH_LENGTH = 4096;

/// Maximum session identifier length
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

// ============================================================================
// Scheduling
// ============================================================================

/// Outstanding chunk requests per file
constexpr size_t DEFAULT_MAX_CONCURRENT_CHUNKS = 8;

/// Attempts per chunk, first try included
constexpr uint32_t DEFAULT_MAX_CHUNK_ATTEMPTS = 3;

/// Delay before the first retry, doubled for each further retry
constexpr auto DEFAULT_RETRY_BASE_DELAY = std::chrono::milliseconds(500);

/// Upper bound on a single retry delay
constexpr auto DEFAULT_RETRY_MAX_DELAY = std::chrono::milliseconds(2000);

// ============================================================================
// Progress
// ============================================================================

/// Minimum interval between two progress snapshots
constexpr auto DEFAULT_PROGRESS_INTERVAL = std::chrono::milliseconds(200);

/// Sliding window used for throughput estimation
constexpr auto DEFAULT_SPEED_WINDOW = std::chrono::milliseconds(3000);

/// Below this throughput (bytes/s) no ETA is reported
constexpr double ETA_MIN_SPEED = 1.0;

// ============================================================================
// Network and lifecycle
// ============================================================================

/// TCP connection establishment timeout
constexpr auto CONNECTION_TIMEOUT = std::chrono::seconds(5);

/// Time a single request may wait for its response
constexpr auto DEFAULT_REQUEST_TIMEOUT = std::chrono::milliseconds(30000);

/// Time an offer waits for the user to accept or reject it
constexpr auto DEFAULT_OFFER_TIMEOUT = std::chrono::milliseconds(180000);

/// A send session with no activity for this long is dropped
constexpr auto DEFAULT_STALE_SESSION_TIMEOUT = std::chrono::milliseconds(5 * 60 * 1000);

/// Interval of the stale session sweep
constexpr auto DEFAULT_CLEANUP_INTERVAL = std::chrono::milliseconds(60 * 1000);

/// Threads serving transport completions and timers
constexpr size_t DEFAULT_IO_THREADS = 2;

/// Threads serving blocking file operations
constexpr size_t DEFAULT_DISK_THREADS = 4;

/// Threads running receive session drivers
constexpr size_t DEFAULT_DRIVER_THREADS = 4;

// ============================================================================
// Cryptographic Configuration
// ============================================================================

/// XChaCha20-Poly1305 key size
constexpr size_t SESSION_KEY_SIZE = 32;

/// XChaCha20-Poly1305 nonce size
constexpr size_t CHUNK_NONCE_SIZE = 24;

/// Poly1305 tag size
constexpr size_t CHUNK_TAG_SIZE = 16;

// ============================================================================
// Runtime configuration
// ============================================================================

/**
 * @brief Retry policy for chunk requests
 */
struct RetryPolicy {
    uint32_t max_attempts = DEFAULT_MAX_CHUNK_ATTEMPTS;                 ///< Attempts including the first
    std::chrono::milliseconds base_delay = DEFAULT_RETRY_BASE_DELAY;    ///< Delay before the first retry
    std::chrono::milliseconds max_delay = DEFAULT_RETRY_MAX_DELAY;      ///< Cap on any single delay

    /**
     * @brief Delay before a given retry
     * @param retry Retry number, 1 for the second attempt
     * @return base_delay * 2^(retry-1), capped at max_delay
     */
    std::chrono::milliseconds delay_for(uint32_t retry) const;
};

/**
 * @brief Tunables of a transfer manager
 *
 * Loaded from JSON; keys that are absent keep their defaults and unknown
 * keys are ignored.
 */
struct TransferConfig {
    uint32_t chunk_size = DEFAULT_CHUNK_SIZE;                                       ///< Chunk size used when sending
    size_t max_concurrent_chunks = DEFAULT_MAX_CONCURRENT_CHUNKS;                   ///< Per-file request window
    RetryPolicy retry;                                                              ///< Chunk retry policy
    std::chrono::milliseconds request_timeout = DEFAULT_REQUEST_TIMEOUT;            ///< Transport request timeout
    std::chrono::milliseconds offer_timeout = DEFAULT_OFFER_TIMEOUT;                ///< Pending offer lifetime
    std::chrono::milliseconds progress_interval = DEFAULT_PROGRESS_INTERVAL;        ///< Progress throttle
    std::chrono::milliseconds speed_window = DEFAULT_SPEED_WINDOW;                  ///< Throughput window
    std::chrono::milliseconds stale_session_timeout = DEFAULT_STALE_SESSION_TIMEOUT; ///< Idle session limit
    std::chrono::milliseconds cleanup_interval = DEFAULT_CLEANUP_INTERVAL;          ///< Stale sweep period
    size_t io_threads = DEFAULT_IO_THREADS;                                         ///< I/O pool size
    size_t disk_threads = DEFAULT_DISK_THREADS;                                     ///< Disk pool size
    size_t driver_threads = DEFAULT_DRIVER_THREADS;                                 ///< Receive driver pool size
    bool auto_accept = false;                                                       ///< Accept offers without asking
    std::filesystem::path save_directory;                                           ///< Empty selects get_received_directory()

    /**
     * @brief Serialize to JSON
     * @return JSON string
     */
    std::string to_json() const;

    /**
     * @brief Deserialize from JSON
     * @param json_str JSON string
     * @return TransferConfig if parsing and validation succeed, std::nullopt otherwise
     */
    static std::optional<TransferConfig> from_json(const std::string& json_str);

    /**
     * @brief Check the configuration for consistency
     * @throws TransferError (INVALID_ARGUMENT) naming the first bad field
     */
    void validate() const;
};

/**
 * @brief Load configuration from a JSON file
 * @param path Path to the configuration file
 * @return TransferConfig if the file exists and is valid, std::nullopt otherwise
 */
std::optional<TransferConfig> load_config(const std::filesystem::path& path);

// ============================================================================
// Directories
// ============================================================================

/**
 * @brief Get Ferry data directory from FERRY_DATA_DIR or use default
 * @return Filesystem path to data directory
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get default directory for received files
 * @return Filesystem path to received files directory
 */
std::filesystem::path get_received_directory();

/**
 * @brief Get log directory
 * @return Filesystem path to log directory
 */
std::filesystem::path get_log_directory();

// ============================================================================
// Path validation
// ============================================================================

/**
 * @brief Check an offered relative path
 *
 * Accepts forward-slash separated relative paths whose components are
 * non-empty, not "." or "..", free of backslashes, NUL bytes and drive
 * prefixes, and within the length limits.
 *
 * @param relative_path Path as received on the wire
 * @return true if the path can be joined under a save directory
 */
bool is_safe_relative_path(const std::string& relative_path);

/**
 * @brief Validate session identifier (alphanumeric + hyphen only)
 * @param identifier String to validate
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier);

/**
 * @brief Replace characters unusable in a file name
 * @param filename Candidate file name
 * @return Sanitized single path component, "untitled" when nothing is left
 */
std::string sanitize_filename(const std::string& filename);

/**
 * @brief Check if path is safe (no traversal, within allowed directory)
 * @param path Path to validate
 * @param base_dir Base directory that path must be within
 * @return true if safe, false if path traversal detected
 */
bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);

} // namespace config
} // namespace ferry
