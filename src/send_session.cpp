/**
 * @file send_session.cpp
 * @brief Implementation of the sending side of a transfer
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/send_session.hpp"
#include "ferry/transfer_error.hpp"
#include "ferry/utilities.hpp"

namespace ferry {

namespace {

std::vector<TrackedFile> tracked_files(const std::vector<PreparedFile>& files) {
    std::vector<TrackedFile> tracked;
    tracked.reserve(files.size());
    for (const auto& f : files) {
        tracked.push_back(TrackedFile{f.file_id, f.name, f.size});
    }
    return tracked;
}

uint64_t total_size(const std::vector<PreparedFile>& files) {
    uint64_t total = 0;
    for (const auto& f : files) {
        total += f.size;
    }
    return total;
}

std::chrono::steady_clock::rep now_ticks() {
    return std::chrono::steady_clock::now().time_since_epoch().count();
}

} // anonymous namespace

wire::FileInfo PreparedFile::to_file_info() const {
    wire::FileInfo info;
    info.file_id = file_id;
    info.name = name;
    info.relative_path = relative_path;
    info.size = size;
    info.checksum = checksum;
    return info;
}

// ============================================================================
// Constructor
// ============================================================================

SendSession::SendSession(
    std::string session_id,
    std::string peer_id,
    std::vector<PreparedFile> files,
    const std::vector<uint8_t>& key_bytes,
    uint32_t chunk_size,
    const config::TransferConfig& config,
    TransferEvents events,
    FinishCallback on_finished
)
    : session_id_(std::move(session_id))
    , peer_id_(std::move(peer_id))
    , files_(std::move(files))
    , chunk_size_(chunk_size)
    , cipher_(key_bytes, session_id_)
    , tracker_(session_id_, TransferDirection::SEND, total_size(files_), chunk_size_,
               tracked_files(files_), config.speed_window, config.progress_interval)
    , events_(std::move(events))
    , on_finished_(std::move(on_finished))
    , cancelled_(false)
    , finished_(false)
    , last_activity_(now_ticks())
{
    for (size_t i = 0; i < files_.size(); ++i) {
        file_index_.emplace(files_[i].file_id, i);
    }

    utilities::log_info("Send session " + session_id_ + " started with " + peer_id_ + ": " +
                        std::to_string(files_.size()) + " file(s), " +
                        utilities::format_file_size(tracker_.total_bytes()));
}

// ============================================================================
// Request handling
// ============================================================================

wire::Response SendSession::handle_chunk_request(uint32_t file_id, uint32_t chunk_index) {
    touch();
    wire::AckResponse inert{session_id_};

    if (cancelled_ || finished_) {
        utilities::log_debug("Chunk request for ended session " + session_id_);
        return inert;
    }

    auto it = file_index_.find(file_id);
    if (it == file_index_.end()) {
        utilities::log_warn("Chunk request for unknown file " + std::to_string(file_id) +
                            " in session " + session_id_);
        return inert;
    }

    const PreparedFile& file = files_[it->second];
    uint32_t total_chunks = calc_total_chunks(file.size, chunk_size_);
    if (chunk_index >= total_chunks) {
        utilities::log_warn("Chunk index " + std::to_string(chunk_index) + " out of range for " +
                            file.relative_path + " (" + std::to_string(total_chunks) + " chunks)");
        return inert;
    }

    std::vector<uint8_t> plaintext;
    try {
        auto reader = reader_for(file);
        plaintext = file.source->read_chunk(*reader, chunk_index, chunk_size_);
    } catch (const TransferError& e) {
        utilities::log_error("Failed to read chunk " + std::to_string(chunk_index) + " of " +
                             file.relative_path + ": " + e.what());
        return inert;
    }

    auto ciphertext = cipher_.encrypt_chunk(file_id, chunk_index, plaintext);
    if (!ciphertext) {
        utilities::log_error("Failed to encrypt chunk " + std::to_string(chunk_index) + " of " + file.relative_path);
        return inert;
    }

    if (tracker_.record_chunk(file_id, plaintext.size())) {
        tracker_.complete_file(file_id);
    }
    publish_progress();

    wire::ChunkResponse chunk;
    chunk.session_id = session_id_;
    chunk.file_id = file_id;
    chunk.chunk_index = chunk_index;
    chunk.data = std::move(*ciphertext);
    chunk.is_last = chunk_index + 1 >= total_chunks;

    utilities::log_debug("Served chunk " + std::to_string(chunk_index) + "/" + std::to_string(total_chunks) +
                         " of " + file.relative_path);
    return chunk;
}

void SendSession::handle_complete() {
    touch();
    if (cancelled_ || !finish()) {
        return;
    }

    for (const auto& f : files_) {
        tracker_.complete_file(f.file_id);
    }

    auto now = std::chrono::steady_clock::now();
    if (events_.on_progress) {
        events_.on_progress(tracker_.snapshot(now));
    }

    TransferCompleteEvent event;
    event.session_id = session_id_;
    event.direction = TransferDirection::SEND;
    event.total_bytes = tracker_.total_bytes();
    event.elapsed_ms = tracker_.elapsed_ms(now);

    utilities::log_info("Send session " + session_id_ + " completed: " +
                        utilities::format_file_size(event.total_bytes) + " in " +
                        utilities::format_duration(event.elapsed_ms / 1000));

    if (events_.on_complete) {
        events_.on_complete(event);
    }
    if (on_finished_) {
        on_finished_(session_id_);
    }
}

void SendSession::handle_cancel(const std::string& reason) {
    touch();
    utilities::log_info("Peer cancelled send session " + session_id_ + ": " + reason);
    cancel(reason);
}

// ============================================================================
// Local control
// ============================================================================

bool SendSession::cancel(const std::string& reason) {
    if (cancelled_.exchange(true) || !finish()) {
        return false;
    }

    TransferFailedEvent event;
    event.session_id = session_id_;
    event.direction = TransferDirection::SEND;
    event.error = reason;
    event.cancelled = true;

    utilities::log_info("Send session " + session_id_ + " cancelled: " + reason);

    if (events_.on_failed) {
        events_.on_failed(event);
    }
    if (on_finished_) {
        on_finished_(session_id_);
    }
    return true;
}

void SendSession::expire() {
    cancelled_ = true;
    if (!finish()) {
        return;
    }

    TransferFailedEvent event;
    event.session_id = session_id_;
    event.direction = TransferDirection::SEND;
    event.error = "session expired after " +
                  std::to_string(utilities::elapsed_ms(last_activity()) / 1000) + "s without requests";

    utilities::log_warn("Send session " + session_id_ + " expired");

    if (events_.on_failed) {
        events_.on_failed(event);
    }
    if (on_finished_) {
        on_finished_(session_id_);
    }
}

std::chrono::steady_clock::time_point SendSession::last_activity() const {
    return std::chrono::steady_clock::time_point(std::chrono::steady_clock::duration(last_activity_.load()));
}

TransferProgressEvent SendSession::progress() {
    return tracker_.snapshot();
}

// ============================================================================
// Private Methods
// ============================================================================

void SendSession::touch() {
    last_activity_.store(now_ticks());
}

void SendSession::publish_progress() {
    if (!events_.on_progress) {
        return;
    }
    if (auto event = tracker_.poll()) {
        events_.on_progress(*event);
    }
}

bool SendSession::finish() {
    if (finished_.exchange(true)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(readers_mutex_);
    readers_.clear();
    return true;
}

std::shared_ptr<SourceReader> SendSession::reader_for(const PreparedFile& file) {
    std::lock_guard<std::mutex> lock(readers_mutex_);
    auto& reader = readers_[file.file_id];
    if (!reader) {
        reader = file.source->open_reader();
    }
    return reader;
}

} // namespace ferry
