/**
 * @file receive_session.hpp
 * @brief Active puller for one inbound transfer
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Files are processed strictly in offer order. Within a file, chunk
 * requests run concurrently up to the configured window; responses are
 * decrypted and written on the disk executor and may land out of order.
 * A file is promoted only after its content hash matches the offer.
 *
 * Failure scope:
 * - Integrity failures (bad tag, bad length, hash mismatch) fail the file
 *   and the session moves on to the next file
 * - Transport failures after the last retry and storage failures end the
 *   session
 */

#pragma once

#include "ferry/cancellation.hpp"
#include "ferry/chunk_cipher.hpp"
#include "ferry/file_sink.hpp"
#include "ferry/progress_tracker.hpp"
#include "ferry/transfer_config.hpp"
#include "ferry/transfer_error.hpp"
#include "ferry/transfer_events.hpp"
#include "ferry/transport.hpp"
#include "ferry/wire_protocol.hpp"

#include <asio/thread_pool.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ferry {

/**
 * @brief ReceiveSession - pulls and verifies the files of one accepted offer
 *
 * Always owned by std::shared_ptr; in-flight requests keep it alive.
 */
class ReceiveSession : public std::enable_shared_from_this<ReceiveSession> {
public:
    using FinishCallback = std::function<void(const std::string& session_id)>;

    /**
     * @param transport Used for chunk requests and Complete/Cancel; must outlive run()
     * @param io_pool Executor for retry timers
     * @param disk_pool Executor for blocking sink calls
     */
    ReceiveSession(
        std::string session_id,
        std::string peer_id,
        std::vector<wire::FileInfo> files,
        uint32_t chunk_size,
        std::shared_ptr<FileSink> sink,
        Transport& transport,
        asio::thread_pool& io_pool,
        asio::thread_pool& disk_pool,
        const config::TransferConfig& config,
        TransferEvents events,
        FinishCallback on_finished
    );

    ReceiveSession(const ReceiveSession&) = delete;
    ReceiveSession& operator=(const ReceiveSession&) = delete;

    const std::string& session_id() const { return session_id_; }
    const std::string& peer_id() const { return peer_id_; }
    const std::vector<wire::FileInfo>& files() const { return files_; }

    /// Key returned to the sender in the offer result
    std::vector<uint8_t> key_bytes() const { return cipher_.key_bytes(); }

    /**
     * @brief Receive every file, then report the outcome
     *
     * Blocks until the session ends; run on the driver executor. Emits
     * exactly one terminal event and then calls the finish callback. A
     * second call, or a call after cancel(), returns immediately.
     */
    void run();

    /**
     * @brief Abort the session; idempotent
     *
     * In-flight work is abandoned and partial files are removed before the
     * failure event is emitted.
     *
     * @param reason Reported in the failure event and to the peer
     * @param notify_peer Send a Cancel request to the sender
     * @return true if this call cancelled the session
     */
    bool cancel(const std::string& reason, bool notify_peer = true);

    bool is_cancelled() const { return token_->is_cancelled(); }
    bool is_finished() const { return finished_.load(); }

    /// Current progress snapshot
    TransferProgressEvent progress();

private:
    struct FileFetch;

    std::string receive_file(const wire::FileInfo& file);
    void request_chunk(const std::shared_ptr<FileFetch>& fetch, uint32_t chunk_index, uint32_t attempt);
    void on_chunk_response(const std::shared_ptr<FileFetch>& fetch, uint32_t chunk_index, uint32_t attempt,
                           std::error_code ec, std::optional<wire::Response> response);
    void schedule_retry(const std::shared_ptr<FileFetch>& fetch, uint32_t chunk_index, uint32_t attempt,
                        const TransferError& reason);
    void store_chunk(const std::shared_ptr<FileFetch>& fetch, uint32_t chunk_index, const std::vector<uint8_t>& ciphertext);

    void discard_partial(PartialFile& partial);
    void notify_peer_cancel(const std::string& reason);
    bool send_complete();
    void publish_progress();
    void finish_cancelled();
    void finish_failed(const std::string& error);
    void finish_completed(const std::vector<std::string>& locations);

    template <class Work>
    auto run_on_disk(Work&& work) -> decltype(work());

    const std::string session_id_;
    const std::string peer_id_;
    const std::vector<wire::FileInfo> files_;
    const uint32_t chunk_size_;
    std::shared_ptr<FileSink> sink_;
    Transport& transport_;
    asio::thread_pool& io_pool_;
    asio::thread_pool& disk_pool_;

    ChunkCipher cipher_;
    ProgressTracker tracker_;
    const config::RetryPolicy retry_;
    const size_t max_concurrent_chunks_;
    const std::chrono::milliseconds request_timeout_;
    TransferEvents events_;
    FinishCallback on_finished_;

    std::shared_ptr<CancellationToken> token_;
    std::atomic<bool> started_;
    std::atomic<bool> finished_;
    std::set<uint32_t> completed_files_;        ///< Written only by run()

    std::mutex cancel_mutex_;
    std::optional<std::string> cancel_reason_;
};

} // namespace ferry
