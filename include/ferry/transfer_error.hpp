/**
 * @file transfer_error.hpp
 * @brief Error taxonomy for the Ferry transfer engine
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every failure that leaves a storage or session boundary is classified
 * into one ErrorKind. The kind decides whether the receive scheduler
 * retries the operation, abandons the file, or abandons the session.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <optional>

namespace ferry {

/**
 * @brief Failure classes recognised by the transfer engine
 */
enum class ErrorKind {
    TRANSPORT,          ///< Timeout or connection loss, retried per chunk
    INTEGRITY,          ///< Authentication tag or content hash mismatch, never retried
    STORAGE,            ///< Disk full, permission denied, I/O failure
    PROTOCOL,           ///< Unexpected or malformed response
    CANCELLED,          ///< Cooperative cancellation, a terminal status
    INVALID_ARGUMENT    ///< Bad input to a local API call
};

/**
 * @brief Convert ErrorKind to its wire/log name
 */
std::string error_kind_to_string(ErrorKind kind);

/**
 * @brief Parse an ErrorKind name
 * @return ErrorKind if recognised, std::nullopt otherwise
 */
std::optional<ErrorKind> string_to_error_kind(const std::string& name);

/**
 * @brief Exception carrying an ErrorKind
 *
 * Thrown by the synchronous storage and configuration layers and caught at
 * session boundaries, where it becomes a terminal transfer event.
 */
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

    /// Whether the receive scheduler may retry the failed chunk
    bool is_retryable() const noexcept;

    /// Whether the failure is confined to a single file of the session
    bool is_file_scoped() const noexcept;

private:
    ErrorKind kind_;
};

} // namespace ferry
