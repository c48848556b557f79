/**
 * @file transfer_error.cpp
 * @brief Implementation of the transfer error taxonomy
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/transfer_error.hpp"

namespace ferry {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRANSPORT:        return "TRANSPORT";
        case ErrorKind::INTEGRITY:        return "INTEGRITY";
        case ErrorKind::STORAGE:          return "STORAGE";
        case ErrorKind::PROTOCOL:         return "PROTOCOL";
        case ErrorKind::CANCELLED:        return "CANCELLED";
        case ErrorKind::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        default:                          return "UNKNOWN";
    }
}

std::optional<ErrorKind> string_to_error_kind(const std::string& name) {
    if (name == "TRANSPORT")        return ErrorKind::TRANSPORT;
    if (name == "INTEGRITY")        return ErrorKind::INTEGRITY;
    if (name == "STORAGE")          return ErrorKind::STORAGE;
    if (name == "PROTOCOL")         return ErrorKind::PROTOCOL;
    if (name == "CANCELLED")        return ErrorKind::CANCELLED;
    if (name == "INVALID_ARGUMENT") return ErrorKind::INVALID_ARGUMENT;
    return std::nullopt;
}

TransferError::TransferError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
{
}

bool TransferError::is_retryable() const noexcept {
    return kind_ == ErrorKind::TRANSPORT || kind_ == ErrorKind::PROTOCOL;
}

bool TransferError::is_file_scoped() const noexcept {
    return kind_ == ErrorKind::INTEGRITY;
}

} // namespace ferry
