/**
 * @file transfer_manager.hpp
 * @brief Registry of transfer sessions and routing point for inbound requests
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The manager owns the executors every session runs on:
 * - io pool: transport completions, retry timers, the stale sweep
 * - disk pool: blocking source and sink calls
 * - driver pool: one sequential file loop per receive session
 *
 * Sessions live in lock-striped maps keyed by session id. A session removes
 * itself through its finish callback. Session ids are claimed when first
 * offered or generated and are never released.
 */

#pragma once

#include "ferry/concurrent_map.hpp"
#include "ferry/file_sink.hpp"
#include "ferry/file_source.hpp"
#include "ferry/receive_session.hpp"
#include "ferry/send_session.hpp"
#include "ferry/transfer_config.hpp"
#include "ferry/transfer_events.hpp"
#include "ferry/transport.hpp"
#include "ferry/wire_protocol.hpp"

#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ferry {

/**
 * @brief Result of prepare(): hashed files ready to offer
 */
struct PreparedTransfer {
    std::string prepared_id;
    std::vector<PreparedFile> files;
    uint64_t total_size = 0;
};

/**
 * @brief Outcome of an offer
 */
struct StartSendResult {
    std::string session_id;
    bool accepted = false;
    std::optional<std::string> reason;      ///< Rejection or failure reason
};

/**
 * @brief Check an inbound offer before it is announced
 * @return Reason for rejection, std::nullopt if the offer is acceptable
 */
std::optional<std::string> validate_offer(const wire::OfferRequest& offer);

/**
 * @brief TransferManager - entry point of the transfer engine
 */
class TransferManager {
public:
    /**
     * @param transport Channel to peers; the manager installs its request handler
     * @param config Runtime configuration (validated)
     * @param events Application callbacks
     * @throws TransferError (INVALID_ARGUMENT) for an invalid configuration
     * @throws std::runtime_error if libsodium cannot be initialised
     */
    TransferManager(std::shared_ptr<Transport> transport,
                    config::TransferConfig config = config::TransferConfig(),
                    TransferEvents events = TransferEvents());

    ~TransferManager();

    // Disable copy and move
    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;
    TransferManager(TransferManager&&) = delete;
    TransferManager& operator=(TransferManager&&) = delete;

    // ========================================================================
    // Sending
    // ========================================================================

    /**
     * @brief Scan and hash files and directories
     *
     * Directory entries get "dir_name/sub/path" relative paths. Ids are
     * assigned sequentially from 0 in scan order.
     *
     * @throws TransferError (INVALID_ARGUMENT) if nothing was given or found,
     *         (STORAGE) if a source cannot be read
     */
    PreparedTransfer prepare(const std::vector<std::filesystem::path>& paths);
    PreparedTransfer prepare(const std::vector<std::shared_ptr<FileSource>>& sources);

    /**
     * @brief Offer a prepared transfer to a peer
     *
     * The prepared transfer is consumed. The future resolves when the peer
     * answers or the request fails.
     *
     * @param selected_file_ids Subset to send; std::nullopt sends every file
     * @throws TransferError (INVALID_ARGUMENT) for an unknown prepared id or
     *         an empty or unknown selection
     */
    std::future<StartSendResult> start_send(
        const std::string& prepared_id,
        const std::string& peer_id,
        const std::optional<std::vector<uint32_t>>& selected_file_ids = std::nullopt
    );

    // ========================================================================
    // Receiving
    // ========================================================================

    /**
     * @brief Accept a pending offer into the configured save directory
     * @return true if the offer was pending and a receive session started
     */
    bool accept(const std::string& session_id);

    /**
     * @brief Accept a pending offer into a save directory
     */
    bool accept(const std::string& session_id, const std::filesystem::path& save_directory);

    /**
     * @brief Accept a pending offer into an explicit sink
     */
    bool accept(const std::string& session_id, std::shared_ptr<FileSink> sink);

    /**
     * @brief Reject a pending offer
     * @return true if the offer was pending
     */
    bool reject(const std::string& session_id, const std::string& reason = "user rejected");

    // ========================================================================
    // Control
    // ========================================================================

    /**
     * @brief Cancel a live session or reject a pending offer
     * @return true if something was cancelled
     */
    bool cancel(const std::string& session_id, const std::string& reason = "cancelled by user");

    /**
     * @brief Route one inbound request
     *
     * Installed as the transport's request handler.
     */
    void handle_request(const std::string& peer_id, wire::Request request, Responder respond);

    /**
     * @brief Expire idle send sessions and unanswered offers
     * @return Number of sessions and offers removed
     */
    size_t sweep_stale_sessions(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /**
     * @brief Cancel everything and join the executors; idempotent
     */
    void shutdown();

    // ========================================================================
    // Introspection
    // ========================================================================

    size_t send_session_count() const { return send_sessions_.size(); }
    size_t receive_session_count() const { return receive_sessions_.size(); }
    size_t pending_offer_count() const { return pending_offers_.size(); }
    std::vector<IncomingOfferEvent> pending_offers() const;
    std::optional<TransferProgressEvent> progress(const std::string& session_id);
    const config::TransferConfig& config() const { return config_; }

private:
    struct PendingOffer {
        std::string peer_id;
        wire::OfferRequest offer;
        Responder respond;
        std::chrono::steady_clock::time_point received_at;
    };

    /// Guards callbacks that may outlive the manager
    struct Lifetime {
        std::shared_mutex mutex;
        bool alive = true;
    };

    void on_request(const std::string& peer_id, wire::OfferRequest request, Responder& respond);
    void on_request(const std::string& peer_id, wire::ChunkRequest request, Responder& respond);
    void on_request(const std::string& peer_id, wire::CompleteRequest request, Responder& respond);
    void on_request(const std::string& peer_id, wire::CancelRequest request, Responder& respond);

    void on_offer_result(const std::string& session_id, const std::string& peer_id,
                         std::shared_ptr<PreparedTransfer> prepared,
                         std::error_code ec, std::optional<wire::Response> response,
                         std::promise<StartSendResult>& result);
    void send_cancel(const std::string& peer_id, const std::string& session_id, const std::string& reason);
    bool claim_session_id(const std::string& session_id);
    void schedule_sweep();

    std::shared_ptr<Transport> transport_;
    const config::TransferConfig config_;
    TransferEvents events_;
    std::shared_ptr<Lifetime> lifetime_;

    asio::thread_pool io_pool_;
    asio::thread_pool disk_pool_;
    asio::thread_pool driver_pool_;
    asio::strand<asio::thread_pool::executor_type> sweep_strand_;
    asio::steady_timer sweep_timer_;

    ShardedMap<std::string, std::shared_ptr<SendSession>> send_sessions_;
    ShardedMap<std::string, std::shared_ptr<ReceiveSession>> receive_sessions_;
    ShardedMap<std::string, std::shared_ptr<PendingOffer>> pending_offers_;
    ShardedMap<std::string, std::shared_ptr<PreparedTransfer>> prepared_transfers_;
    ShardedMap<std::string, bool> claimed_ids_;         ///< Set of every session id offered or used; never shrinks

    std::atomic<bool> shut_down_;
};

} // namespace ferry
