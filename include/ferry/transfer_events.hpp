/**
 * @file transfer_events.hpp
 * @brief Events reported to the application layer
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every session ends with exactly one complete or failed event. Progress
 * events are throttled snapshots. All events serialise to camelCase JSON.
 */

#pragma once

#include "ferry/wire_protocol.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

/**
 * @brief Side of a transfer
 */
enum class TransferDirection {
    SEND,       ///< This node serves chunks
    RECEIVE     ///< This node pulls chunks
};

/**
 * @brief Per-file transfer state
 */
enum class FileTransferStatus {
    PENDING,        ///< Not started
    TRANSFERRING,   ///< Chunks in flight
    COMPLETED,      ///< Verified and promoted (receive) or fully served (send)
    FAILED          ///< Rejected or aborted
};

std::string direction_to_string(TransferDirection direction);
std::string file_status_to_string(FileTransferStatus status);

/**
 * @brief Progress of one file within a session
 */
struct FileProgress {
    uint32_t file_id = 0;                                   ///< File id from the offer
    std::string name;                                       ///< Display name
    uint64_t size = 0;                                      ///< Size in bytes
    uint64_t transferred = 0;                               ///< Bytes moved so far
    FileTransferStatus status = FileTransferStatus::PENDING; ///< Current state
    uint32_t chunks_done = 0;                               ///< Chunks moved so far (not serialised)
    uint32_t total_chunks = 0;                              ///< Chunks in the file (not serialised)
};

/**
 * @brief Throttled progress snapshot
 */
struct TransferProgressEvent {
    std::string session_id;
    TransferDirection direction = TransferDirection::RECEIVE;
    size_t total_files = 0;
    size_t completed_files = 0;
    size_t failed_files = 0;
    uint64_t total_bytes = 0;
    uint64_t transferred_bytes = 0;
    double speed = 0.0;                 ///< Bytes per second over the sliding window
    std::optional<double> eta;          ///< Seconds remaining, absent when speed is negligible
    std::vector<FileProgress> files;

    std::string to_json() const;
};

/**
 * @brief Terminal success event
 */
struct TransferCompleteEvent {
    std::string session_id;
    TransferDirection direction = TransferDirection::RECEIVE;
    uint64_t total_bytes = 0;
    uint64_t elapsed_ms = 0;
    std::optional<std::string> save_location;   ///< Receive side only
    std::vector<std::string> file_locations;    ///< Final locations of received files

    std::string to_json() const;
};

/**
 * @brief Terminal failure event (cancellation included)
 */
struct TransferFailedEvent {
    std::string session_id;
    TransferDirection direction = TransferDirection::RECEIVE;
    std::string error;
    bool cancelled = false;                     ///< Ended by cancellation rather than an error
    std::vector<uint32_t> failed_file_ids;      ///< Files that did not arrive intact

    std::string to_json() const;
};

/**
 * @brief Inbound offer awaiting a decision
 */
struct IncomingOfferEvent {
    std::string session_id;
    std::string peer_id;
    std::vector<wire::FileInfo> files;
    uint64_t total_size = 0;

    std::string to_json() const;
};

/**
 * @brief Application callbacks; any may be left empty
 *
 * Callbacks run on engine threads and must not block for long.
 */
struct TransferEvents {
    std::function<void(const IncomingOfferEvent&)> on_offer;
    std::function<void(const TransferProgressEvent&)> on_progress;
    std::function<void(const TransferCompleteEvent&)> on_complete;
    std::function<void(const TransferFailedEvent&)> on_failed;
};

} // namespace ferry
