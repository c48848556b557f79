/**
 * @file receive_session.cpp
 * @brief Implementation of the receiving side of a transfer
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/receive_session.hpp"
#include "ferry/file_source.hpp"
#include "ferry/utilities.hpp"

#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <algorithm>
#include <condition_variable>
#include <future>

namespace ferry {

namespace {

std::vector<TrackedFile> tracked_files(const std::vector<wire::FileInfo>& files) {
    std::vector<TrackedFile> tracked;
    tracked.reserve(files.size());
    for (const auto& f : files) {
        tracked.push_back(TrackedFile{f.file_id, f.name, f.size});
    }
    return tracked;
}

uint64_t total_size(const std::vector<wire::FileInfo>& files) {
    uint64_t total = 0;
    for (const auto& f : files) {
        total += f.size;
    }
    return total;
}

std::string describe_chunk(uint32_t chunk_index, const wire::FileInfo& file) {
    return "chunk " + std::to_string(chunk_index) + " of " + file.relative_path;
}

} // anonymous namespace

// ============================================================================
// Per-file fetch state
// ============================================================================

/**
 * @brief Shared state of the chunk requests for one file
 *
 * A chunk holds a limiter slot from acquisition until it has been stored
 * or has failed. It is counted in `requesting` while its request (and any
 * retry delay) is outstanding and in `storing` while the disk executor owns
 * it. Once the file token is cancelled, outstanding requests are abandoned:
 * their late completions see the token and never reach the disk.
 */
struct ReceiveSession::FileFetch {
    FileFetch(const wire::FileInfo& info, std::shared_ptr<PartialFile> partial_file,
              std::shared_ptr<CancellationToken> file_token, size_t window, uint32_t chunks)
        : file(info)
        , partial(std::move(partial_file))
        , token(std::move(file_token))
        , limiter(window)
        , total_chunks(chunks)
        , requesting(0)
        , storing(0)
    {
    }

    const wire::FileInfo file;
    std::shared_ptr<PartialFile> partial;
    std::shared_ptr<CancellationToken> token;
    ConcurrencyLimiter limiter;
    const uint32_t total_chunks;

    std::mutex mutex;
    std::condition_variable settled;
    size_t requesting;
    size_t storing;
    std::optional<TransferError> error;     ///< First unrecoverable failure

    bool begin_request() {
        std::lock_guard<std::mutex> lock(mutex);
        if (token->is_cancelled()) {
            return false;
        }
        ++requesting;
        return true;
    }

    void end_request() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --requesting;
        }
        limiter.release();
        settled.notify_all();
    }

    /// Move a chunk from the network stage to the disk stage
    bool begin_store() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --requesting;
            if (!token->is_cancelled()) {
                ++storing;
                return true;
            }
        }
        limiter.release();
        settled.notify_all();
        return false;
    }

    void end_store() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --storing;
        }
        limiter.release();
        settled.notify_all();
    }

    void fail(const TransferError& e) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!error) {
                error = e;
            }
        }
        token->cancel();
    }

    void wake() {
        {
            std::lock_guard<std::mutex> lock(mutex);
        }
        settled.notify_all();
    }

    void wait_settled() {
        std::unique_lock<std::mutex> lock(mutex);
        settled.wait(lock, [this]() {
            return storing == 0 && (requesting == 0 || token->is_cancelled());
        });
    }

    std::optional<TransferError> first_error() {
        std::lock_guard<std::mutex> lock(mutex);
        return error;
    }
};

// ============================================================================
// Constructor
// ============================================================================

ReceiveSession::ReceiveSession(
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
)
    : session_id_(std::move(session_id))
    , peer_id_(std::move(peer_id))
    , files_(std::move(files))
    , chunk_size_(chunk_size)
    , sink_(std::move(sink))
    , transport_(transport)
    , io_pool_(io_pool)
    , disk_pool_(disk_pool)
    , cipher_(ChunkCipher::generate_key(), session_id_)
    , tracker_(session_id_, TransferDirection::RECEIVE, total_size(files_), chunk_size_,
               tracked_files(files_), config.speed_window, config.progress_interval)
    , retry_(config.retry)
    , max_concurrent_chunks_(config.max_concurrent_chunks)
    , request_timeout_(config.request_timeout)
    , events_(std::move(events))
    , on_finished_(std::move(on_finished))
    , token_(CancellationToken::create())
    , started_(false)
    , finished_(false)
{
}

// ============================================================================
// Session driver
// ============================================================================

template <class Work>
auto ReceiveSession::run_on_disk(Work&& work) -> decltype(work()) {
    std::packaged_task<decltype(work())()> task(std::forward<Work>(work));
    auto result = task.get_future();
    asio::post(disk_pool_, std::move(task));
    return result.get();
}

void ReceiveSession::run() {
    if (started_.exchange(true)) {
        return;
    }

    utilities::log_info("Receive session " + session_id_ + " started from " + peer_id_ + ": " +
                        std::to_string(files_.size()) + " file(s), " +
                        utilities::format_file_size(tracker_.total_bytes()) + " to " +
                        sink_->save_location_display());

    std::vector<std::string> locations;
    std::optional<std::string> session_error;
    std::optional<std::string> first_file_error;

    for (const auto& file : files_) {
        if (token_->is_cancelled()) {
            break;
        }

        try {
            locations.push_back(receive_file(file));
            tracker_.complete_file(file.file_id);
            completed_files_.insert(file.file_id);
            utilities::log_info("Received " + file.relative_path + " (" + utilities::format_file_size(file.size) + ")");

        } catch (const TransferError& e) {
            tracker_.fail_file(file.file_id);
            if (token_->is_cancelled()) {
                break;
            }
            if (e.is_file_scoped()) {
                utilities::log_error("File " + file.relative_path + " failed: " + e.what());
                if (!first_file_error) {
                    first_file_error = e.what();
                }
                publish_progress();
                continue;
            }
            utilities::log_error("Receive session " + session_id_ + " failed: " + e.what() +
                                 " [" + error_kind_to_string(e.kind()) + "]");
            session_error = e.what();
            break;

        } catch (const std::exception& e) {
            tracker_.fail_file(file.file_id);
            utilities::log_error("Receive session " + session_id_ + " failed on " + file.relative_path + ": " + e.what());
            session_error = e.what();
            break;
        }

        publish_progress();
    }

    if (token_->is_cancelled()) {
        finish_cancelled();
        return;
    }

    if (session_error) {
        notify_peer_cancel(*session_error);
        finish_failed(*session_error);
        return;
    }

    size_t failed = files_.size() - completed_files_.size();
    if (failed > 0) {
        std::string error = std::to_string(failed) + " of " + std::to_string(files_.size()) +
                            " file(s) failed verification: " + first_file_error.value_or("unknown error");
        notify_peer_cancel(error);
        finish_failed(error);
        return;
    }

    send_complete();
    finish_completed(locations);
}

std::string ReceiveSession::receive_file(const wire::FileInfo& file) {
    tracker_.start_file(file.file_id);
    publish_progress();

    auto partial = run_on_disk([this, &file]() {
        return sink_->create_partial(file.relative_path, file.size);
    });

    auto fetch = std::make_shared<FileFetch>(file, partial, token_->create_child(), max_concurrent_chunks_,
                                             calc_total_chunks(file.size, chunk_size_));
    FileFetch* raw_fetch = fetch.get();
    auto wake = fetch->token->on_cancel([raw_fetch]() { raw_fetch->wake(); });

    utilities::log_debug("Fetching " + std::to_string(fetch->total_chunks) + " chunk(s) of " + file.relative_path);

    for (uint32_t chunk_index = 0; chunk_index < fetch->total_chunks; ++chunk_index) {
        if (!fetch->limiter.acquire(*fetch->token)) {
            break;
        }
        if (!fetch->begin_request()) {
            fetch->limiter.release();
            break;
        }
        request_chunk(fetch, chunk_index, 1);
    }

    fetch->wait_settled();
    fetch->token->remove_callback(wake);

    auto error = fetch->first_error();
    if (error || fetch->token->is_cancelled()) {
        discard_partial(*partial);
        if (error) {
            throw *error;
        }
        throw TransferError(ErrorKind::CANCELLED, "transfer of " + file.relative_path + " cancelled");
    }

    try {
        return run_on_disk([this, &partial, &file]() {
            return sink_->finalize(*partial, file.checksum);
        });
    } catch (const TransferError&) {
        discard_partial(*partial);
        throw;
    }
}

// ============================================================================
// Chunk pipeline
// ============================================================================

void ReceiveSession::request_chunk(const std::shared_ptr<FileFetch>& fetch, uint32_t chunk_index, uint32_t attempt) {
    if (fetch->token->is_cancelled()) {
        fetch->end_request();
        return;
    }

    wire::ChunkRequest request;
    request.session_id = session_id_;
    request.file_id = fetch->file.file_id;
    request.chunk_index = chunk_index;

    auto self = shared_from_this();
    transport_.async_request(peer_id_, request,
        [self, fetch, chunk_index, attempt](std::error_code ec, std::optional<wire::Response> response) {
            self->on_chunk_response(fetch, chunk_index, attempt, ec, std::move(response));
        });
}

void ReceiveSession::on_chunk_response(const std::shared_ptr<FileFetch>& fetch, uint32_t chunk_index, uint32_t attempt,
                                       std::error_code ec, std::optional<wire::Response> response) {
    if (fetch->token->is_cancelled()) {
        fetch->end_request();
        return;
    }

    const auto& file = fetch->file;
    wire::ChunkResponse* chunk = response ? std::get_if<wire::ChunkResponse>(&*response) : nullptr;

    std::optional<TransferError> failure;
    if (ec) {
        failure.emplace(ErrorKind::TRANSPORT, describe_chunk(chunk_index, file) + ": " + ec.message());
    } else if (chunk == nullptr) {
        failure.emplace(ErrorKind::PROTOCOL, describe_chunk(chunk_index, file) + ": unexpected " +
                        (response ? wire::response_type_name(*response) : std::string("empty")) + " response");
    } else if (chunk->session_id != session_id_ || chunk->file_id != file.file_id ||
               chunk->chunk_index != chunk_index) {
        failure.emplace(ErrorKind::PROTOCOL, describe_chunk(chunk_index, file) + ": response addressed to another chunk");
    } else if (chunk->is_last != (chunk_index + 1 >= fetch->total_chunks)) {
        failure.emplace(ErrorKind::PROTOCOL, describe_chunk(chunk_index, file) + ": inconsistent last chunk flag");
    }

    if (failure) {
        if (attempt < retry_.max_attempts) {
            schedule_retry(fetch, chunk_index, attempt, *failure);
            return;
        }
        TransferError exhausted(failure->kind(), std::string(failure->what()) + " (gave up after " +
                                std::to_string(attempt) + " attempts)");
        utilities::log_error(exhausted.what());
        fetch->fail(exhausted);
        fetch->end_request();
        return;
    }

    if (!fetch->begin_store()) {
        return;
    }

    auto self = shared_from_this();
    asio::post(disk_pool_, [self, fetch, chunk_index, data = std::move(chunk->data)]() {
        self->store_chunk(fetch, chunk_index, data);
    });
}

void ReceiveSession::schedule_retry(const std::shared_ptr<FileFetch>& fetch, uint32_t chunk_index, uint32_t attempt,
                                    const TransferError& reason) {
    auto delay = retry_.delay_for(attempt);
    utilities::log_warn(std::string(reason.what()) + "; retrying (attempt " + std::to_string(attempt + 1) + "/" +
                        std::to_string(retry_.max_attempts) + ") in " + std::to_string(delay.count()) + "ms");

    auto strand = asio::make_strand(io_pool_);
    auto timer = std::make_shared<asio::steady_timer>(strand, delay);
    auto self = shared_from_this();

    auto registration = std::make_shared<std::atomic<CancellationToken::CallbackId>>(0);

    timer->async_wait([self, fetch, chunk_index, attempt, timer, registration](const std::error_code&) {
        fetch->token->remove_callback(registration->load());
        // A cancelled wait lands here too; request_chunk observes the token
        self->request_chunk(fetch, chunk_index, attempt + 1);
    });

    registration->store(fetch->token->on_cancel([strand, timer]() {
        asio::post(strand, [timer]() { timer->cancel(); });
    }));
}

void ReceiveSession::store_chunk(const std::shared_ptr<FileFetch>& fetch, uint32_t chunk_index,
                                 const std::vector<uint8_t>& ciphertext) {
    const auto& file = fetch->file;

    if (!fetch->token->is_cancelled()) {
        try {
            auto plaintext = cipher_.decrypt_chunk(file.file_id, chunk_index, ciphertext);
            if (!plaintext) {
                throw TransferError(ErrorKind::INTEGRITY, describe_chunk(chunk_index, file) + " failed authentication");
            }

            uint64_t offset = static_cast<uint64_t>(chunk_index) * chunk_size_;
            uint64_t expected = std::min<uint64_t>(chunk_size_, file.size - offset);
            if (plaintext->size() != expected) {
                throw TransferError(ErrorKind::INTEGRITY, describe_chunk(chunk_index, file) + " has " +
                                    std::to_string(plaintext->size()) + " bytes, expected " +
                                    std::to_string(expected));
            }

            sink_->write_chunk(*fetch->partial, chunk_index, chunk_size_, *plaintext);
            tracker_.record_chunk(file.file_id, plaintext->size());
            publish_progress();

            utilities::log_debug("Stored " + describe_chunk(chunk_index, file));

        } catch (const TransferError& e) {
            utilities::log_error("Failed to store " + describe_chunk(chunk_index, file) + ": " + e.what());
            fetch->fail(e);
        }
    }

    fetch->end_store();
}

// ============================================================================
// Control
// ============================================================================

bool ReceiveSession::cancel(const std::string& reason, bool notify_peer) {
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        if (cancel_reason_ || finished_) {
            return false;
        }
        cancel_reason_ = reason;
    }

    utilities::log_info("Cancelling receive session " + session_id_ + ": " + reason);
    token_->cancel();

    if (notify_peer) {
        notify_peer_cancel(reason);
    }

    // Never started: nothing to clean up, so end it here
    if (!started_.exchange(true)) {
        finish_cancelled();
    }
    return true;
}

TransferProgressEvent ReceiveSession::progress() {
    return tracker_.snapshot();
}

// ============================================================================
// Private Methods
// ============================================================================

void ReceiveSession::discard_partial(PartialFile& partial) {
    try {
        run_on_disk([this, &partial]() { sink_->discard(partial); });
    } catch (const TransferError& e) {
        utilities::log_warn("Failed to remove partial file " + partial.temp_location() + ": " + e.what());
    }
}

void ReceiveSession::notify_peer_cancel(const std::string& reason) {
    wire::CancelRequest request;
    request.session_id = session_id_;
    request.reason = reason;

    std::string session_id = session_id_;
    transport_.async_request(peer_id_, request,
        [session_id](std::error_code ec, std::optional<wire::Response>) {
            if (ec) {
                utilities::log_debug("Cancel of session " + session_id + " not delivered: " + ec.message());
            }
        });
}

bool ReceiveSession::send_complete() {
    auto acknowledged = std::make_shared<std::promise<bool>>();
    auto result = acknowledged->get_future();

    wire::CompleteRequest request;
    request.session_id = session_id_;

    transport_.async_request(peer_id_, request,
        [acknowledged](std::error_code ec, std::optional<wire::Response> response) {
            acknowledged->set_value(!ec && response && std::holds_alternative<wire::AckResponse>(*response));
        });

    if (result.wait_for(request_timeout_ * 2) != std::future_status::ready || !result.get()) {
        utilities::log_warn("Peer did not acknowledge completion of session " + session_id_);
        return false;
    }
    return true;
}

void ReceiveSession::publish_progress() {
    if (!events_.on_progress) {
        return;
    }
    if (auto event = tracker_.poll()) {
        events_.on_progress(*event);
    }
}

void ReceiveSession::finish_cancelled() {
    if (finished_.exchange(true)) {
        return;
    }

    std::string reason;
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        reason = cancel_reason_.value_or("cancelled");
    }

    for (const auto& file : files_) {
        if (completed_files_.count(file.file_id) == 0) {
            tracker_.fail_file(file.file_id);
        }
    }

    TransferFailedEvent event;
    event.session_id = session_id_;
    event.direction = TransferDirection::RECEIVE;
    event.error = reason;
    event.cancelled = true;
    event.failed_file_ids = tracker_.failed_file_ids();

    utilities::log_info("Receive session " + session_id_ + " cancelled: " + reason);

    if (events_.on_failed) {
        events_.on_failed(event);
    }
    if (on_finished_) {
        on_finished_(session_id_);
    }
}

void ReceiveSession::finish_failed(const std::string& error) {
    if (finished_.exchange(true)) {
        return;
    }

    for (const auto& file : files_) {
        if (completed_files_.count(file.file_id) == 0) {
            tracker_.fail_file(file.file_id);
        }
    }

    TransferFailedEvent event;
    event.session_id = session_id_;
    event.direction = TransferDirection::RECEIVE;
    event.error = error;
    event.failed_file_ids = tracker_.failed_file_ids();

    if (events_.on_failed) {
        events_.on_failed(event);
    }
    if (on_finished_) {
        on_finished_(session_id_);
    }
}

void ReceiveSession::finish_completed(const std::vector<std::string>& locations) {
    if (finished_.exchange(true)) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    if (events_.on_progress) {
        events_.on_progress(tracker_.snapshot(now));
    }

    TransferCompleteEvent event;
    event.session_id = session_id_;
    event.direction = TransferDirection::RECEIVE;
    event.total_bytes = tracker_.transferred_bytes();
    event.elapsed_ms = tracker_.elapsed_ms(now);
    event.save_location = sink_->save_location_display();
    event.file_locations = locations;

    utilities::log_info("Receive session " + session_id_ + " completed: " +
                        std::to_string(locations.size()) + " file(s), " +
                        utilities::format_file_size(event.total_bytes) + " in " +
                        utilities::format_duration(event.elapsed_ms / 1000));

    if (events_.on_complete) {
        events_.on_complete(event);
    }
    if (on_finished_) {
        on_finished_(session_id_);
    }
}

} // namespace ferry
