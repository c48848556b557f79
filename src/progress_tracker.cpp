/**
 * @file progress_tracker.cpp
 * @brief Implementation of the progress tracker
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/progress_tracker.hpp"
#include "ferry/file_source.hpp"

#include <algorithm>

namespace ferry {

ProgressTracker::ProgressTracker(
    std::string session_id,
    TransferDirection direction,
    uint64_t total_bytes,
    uint32_t chunk_size,
    const std::vector<TrackedFile>& files,
    std::chrono::milliseconds speed_window,
    std::chrono::milliseconds emit_interval,
    Clock::time_point started_at
)
    : session_id_(std::move(session_id))
    , direction_(direction)
    , total_bytes_(total_bytes)
    , speed_window_(speed_window)
    , emit_interval_(emit_interval)
    , started_at_(started_at)
    , transferred_bytes_(0)
{
    files_.reserve(files.size());
    for (const auto& f : files) {
        FileProgress progress;
        progress.file_id = f.file_id;
        progress.name = f.name;
        progress.size = f.size;
        progress.total_chunks = calc_total_chunks(f.size, chunk_size);
        files_.push_back(std::move(progress));
    }
}

// ============================================================================
// Recording
// ============================================================================

void ProgressTracker::add_bytes(uint64_t bytes, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    transferred_bytes_ += bytes;
    samples_.emplace_back(now, transferred_bytes_);
    evict_locked(now);
}

bool ProgressTracker::record_chunk(uint32_t file_id, uint64_t bytes, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    transferred_bytes_ += bytes;
    samples_.emplace_back(now, transferred_bytes_);
    evict_locked(now);

    FileProgress* file = find_locked(file_id);
    if (file == nullptr) {
        return false;
    }

    if (file->status == FileTransferStatus::PENDING) {
        file->status = FileTransferStatus::TRANSFERRING;
    }
    file->transferred = std::min(file->size, file->transferred + bytes);
    file->chunks_done++;
    return file->chunks_done >= file->total_chunks;
}

void ProgressTracker::start_file(uint32_t file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileProgress* file = find_locked(file_id);
    if (file != nullptr && file->status == FileTransferStatus::PENDING) {
        file->status = FileTransferStatus::TRANSFERRING;
    }
}

void ProgressTracker::complete_file(uint32_t file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileProgress* file = find_locked(file_id);
    if (file != nullptr && file->status != FileTransferStatus::FAILED) {
        file->status = FileTransferStatus::COMPLETED;
        file->transferred = file->size;
    }
}

void ProgressTracker::fail_file(uint32_t file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileProgress* file = find_locked(file_id);
    if (file != nullptr) {
        file->status = FileTransferStatus::FAILED;
    }
}

// ============================================================================
// Estimation
// ============================================================================

double ProgressTracker::speed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return speed_locked();
}

std::optional<double> ProgressTracker::eta() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double current = speed_locked();
    if (current < config::ETA_MIN_SPEED) {
        return std::nullopt;
    }
    uint64_t remaining = total_bytes_ > transferred_bytes_ ? total_bytes_ - transferred_bytes_ : 0;
    return static_cast<double>(remaining) / current;
}

uint64_t ProgressTracker::transferred_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transferred_bytes_;
}

uint64_t ProgressTracker::elapsed_ms(Clock::time_point now) const {
    if (now <= started_at_) {
        return 0;
    }
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now - started_at_).count());
}

// ============================================================================
// Snapshots
// ============================================================================

std::optional<TransferProgressEvent> ProgressTracker::poll(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_emit_ && now - *last_emit_ < emit_interval_) {
        return std::nullopt;
    }
    last_emit_ = now;
    return build_locked();
}

TransferProgressEvent ProgressTracker::snapshot(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_emit_ = now;
    return build_locked();
}

std::vector<uint32_t> ProgressTracker::failed_file_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint32_t> ids;
    for (const auto& f : files_) {
        if (f.status == FileTransferStatus::FAILED) {
            ids.push_back(f.file_id);
        }
    }
    return ids;
}

// ============================================================================
// Internals
// ============================================================================

void ProgressTracker::evict_locked(Clock::time_point now) {
    auto cutoff = now - speed_window_;
    while (!samples_.empty() && samples_.front().first < cutoff) {
        samples_.pop_front();
    }
}

double ProgressTracker::speed_locked() const {
    if (samples_.size() < 2) {
        return 0.0;
    }

    const auto& first = samples_.front();
    const auto& last = samples_.back();
    double elapsed = std::chrono::duration<double>(last.first - first.first).count();
    if (elapsed < 0.001) {
        return 0.0;
    }
    return static_cast<double>(last.second - first.second) / elapsed;
}

FileProgress* ProgressTracker::find_locked(uint32_t file_id) {
    auto it = std::find_if(files_.begin(), files_.end(),
        [file_id](const FileProgress& f) { return f.file_id == file_id; });
    return it == files_.end() ? nullptr : &*it;
}

TransferProgressEvent ProgressTracker::build_locked() const {
    TransferProgressEvent event;
    event.session_id = session_id_;
    event.direction = direction_;
    event.total_files = files_.size();
    event.total_bytes = total_bytes_;
    event.transferred_bytes = std::min(transferred_bytes_, total_bytes_);
    event.speed = speed_locked();

    if (event.speed >= config::ETA_MIN_SPEED) {
        uint64_t remaining = total_bytes_ > transferred_bytes_ ? total_bytes_ - transferred_bytes_ : 0;
        event.eta = static_cast<double>(remaining) / event.speed;
    }

    for (const auto& f : files_) {
        if (f.status == FileTransferStatus::COMPLETED) {
            event.completed_files++;
        } else if (f.status == FileTransferStatus::FAILED) {
            event.failed_files++;
        }
    }
    event.files = files_;
    return event;
}

} // namespace ferry
