/**
 * @file send_session.hpp
 * @brief Passive responder for one outbound transfer
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A send session answers chunk requests from the bound peer. Apart from
 * the cancellation flag and the progress counters it holds no mutable
 * state, so any number of requests may be served concurrently.
 */

#pragma once

#include "ferry/chunk_cipher.hpp"
#include "ferry/file_source.hpp"
#include "ferry/progress_tracker.hpp"
#include "ferry/transfer_config.hpp"
#include "ferry/transfer_events.hpp"
#include "ferry/wire_protocol.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ferry {

/**
 * @brief A file ready to be offered
 *
 * Immutable once prepared.
 */
struct PreparedFile {
    uint32_t file_id = 0;                   ///< Sequential id within one prepare call
    std::string name;                       ///< Display name
    std::string relative_path;              ///< Forward-slash relative path
    uint64_t size = 0;                      ///< Size in bytes
    std::string checksum;                   ///< Hex SHA-256 of the content
    std::shared_ptr<FileSource> source;     ///< Where the bytes come from

    /// Wire form without the storage handle
    wire::FileInfo to_file_info() const;
};

/**
 * @brief SendSession - serves one accepted offer
 */
class SendSession {
public:
    using FinishCallback = std::function<void(const std::string& session_id)>;

    /**
     * @param key_bytes Session key returned by the receiver
     * @throws TransferError (PROTOCOL) if the key has the wrong length
     */
    SendSession(
        std::string session_id,
        std::string peer_id,
        std::vector<PreparedFile> files,
        const std::vector<uint8_t>& key_bytes,
        uint32_t chunk_size,
        const config::TransferConfig& config,
        TransferEvents events,
        FinishCallback on_finished
    );

    SendSession(const SendSession&) = delete;
    SendSession& operator=(const SendSession&) = delete;

    const std::string& session_id() const { return session_id_; }
    const std::string& peer_id() const { return peer_id_; }
    uint32_t chunk_size() const { return chunk_size_; }
    const std::vector<PreparedFile>& files() const { return files_; }

    // ========================================================================
    // Request handling
    // ========================================================================

    /**
     * @brief Read, encrypt and return one chunk
     *
     * Blocking; call from the disk executor. Returns an inert Ack when the
     * session is over, the file or index is unknown, or the read fails.
     */
    wire::Response handle_chunk_request(uint32_t file_id, uint32_t chunk_index);

    /**
     * @brief The receiver verified every file
     */
    void handle_complete();

    /**
     * @brief The receiver aborted the transfer
     */
    void handle_cancel(const std::string& reason);

    // ========================================================================
    // Local control
    // ========================================================================

    /**
     * @brief Abort locally; idempotent
     * @return true if this call ended the session
     */
    bool cancel(const std::string& reason);

    /**
     * @brief End the session because the peer went quiet
     */
    void expire();

    bool is_cancelled() const { return cancelled_.load(); }
    bool is_finished() const { return finished_.load(); }

    /// Time of the last request from the peer
    std::chrono::steady_clock::time_point last_activity() const;

    /// Current progress snapshot
    TransferProgressEvent progress();

private:
    void touch();
    void publish_progress();
    bool finish();
    std::shared_ptr<SourceReader> reader_for(const PreparedFile& file);

    const std::string session_id_;
    const std::string peer_id_;
    const std::vector<PreparedFile> files_;
    std::map<uint32_t, size_t> file_index_;     ///< file id -> position in files_
    const uint32_t chunk_size_;
    ChunkCipher cipher_;
    ProgressTracker tracker_;
    TransferEvents events_;
    FinishCallback on_finished_;

    std::atomic<bool> cancelled_;
    std::atomic<bool> finished_;
    std::atomic<std::chrono::steady_clock::rep> last_activity_;

    std::mutex readers_mutex_;
    std::map<uint32_t, std::shared_ptr<SourceReader>> readers_;    ///< Opened on the first chunk request of each file
};

} // namespace ferry
