/**
 * @file progress_tracker.hpp
 * @brief Sliding-window throughput, ETA and throttled progress snapshots
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "ferry/transfer_config.hpp"
#include "ferry/transfer_events.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ferry {

/**
 * @brief Description used to initialise per-file tracking
 */
struct TrackedFile {
    uint32_t file_id = 0;
    std::string name;
    uint64_t size = 0;
};

/**
 * @brief ProgressTracker - observes the byte counter of one session
 *
 * Speed is the byte delta over the samples inside the window divided by
 * their time span. Thread-safe; every method takes an explicit time point
 * so that behaviour is deterministic under test.
 */
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    ProgressTracker(
        std::string session_id,
        TransferDirection direction,
        uint64_t total_bytes,
        uint32_t chunk_size,
        const std::vector<TrackedFile>& files,
        std::chrono::milliseconds speed_window = config::DEFAULT_SPEED_WINDOW,
        std::chrono::milliseconds emit_interval = config::DEFAULT_PROGRESS_INTERVAL,
        Clock::time_point started_at = Clock::now()
    );

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    /**
     * @brief Record transferred bytes not attributed to a file
     */
    void add_bytes(uint64_t bytes, Clock::time_point now = Clock::now());

    /**
     * @brief Record one chunk of a file
     *
     * Moves the file from pending to transferring.
     *
     * @return true when every chunk of the file has now been recorded
     */
    bool record_chunk(uint32_t file_id, uint64_t bytes, Clock::time_point now = Clock::now());

    /// Mark a file as transferring
    void start_file(uint32_t file_id);

    /// Mark a file as completed
    void complete_file(uint32_t file_id);

    /// Mark a file as failed
    void fail_file(uint32_t file_id);

    /**
     * @brief Current throughput in bytes per second
     * @return 0 with fewer than two samples or less than 1 ms between them
     */
    double speed() const;

    /**
     * @brief Estimated seconds remaining
     * @return std::nullopt while speed is below ETA_MIN_SPEED
     */
    std::optional<double> eta() const;

    uint64_t transferred_bytes() const;
    uint64_t total_bytes() const { return total_bytes_; }
    uint64_t elapsed_ms(Clock::time_point now = Clock::now()) const;

    /**
     * @brief Throttled snapshot
     * @return Snapshot if at least the emit interval passed since the last one
     */
    std::optional<TransferProgressEvent> poll(Clock::time_point now = Clock::now());

    /**
     * @brief Unthrottled snapshot; resets the throttle
     */
    TransferProgressEvent snapshot(Clock::time_point now = Clock::now());

    /// Ids of files marked failed
    std::vector<uint32_t> failed_file_ids() const;

private:
    void evict_locked(Clock::time_point now);
    double speed_locked() const;
    FileProgress* find_locked(uint32_t file_id);
    TransferProgressEvent build_locked() const;

    const std::string session_id_;
    const TransferDirection direction_;
    const uint64_t total_bytes_;
    const std::chrono::milliseconds speed_window_;
    const std::chrono::milliseconds emit_interval_;
    const Clock::time_point started_at_;

    mutable std::mutex mutex_;
    uint64_t transferred_bytes_;
    std::vector<FileProgress> files_;
    std::deque<std::pair<Clock::time_point, uint64_t>> samples_;   ///< (time, cumulative bytes)
    std::optional<Clock::time_point> last_emit_;
};

} // namespace ferry
