/**
 * @file transfer_manager.cpp
 * @brief Implementation of the transfer session registry
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/transfer_manager.hpp"
#include "ferry/transfer_error.hpp"
#include "ferry/utilities.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <mutex>
#include <set>
#include <sstream>

namespace ferry {

namespace {

config::TransferConfig validated(config::TransferConfig config) {
    config.validate();
    return config;
}

bool is_hex_digest(const std::string& value) {
    return value.size() == 64 &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

// Sanitize every component of a sender-side relative path
std::string safe_relative_path(const std::string& relative_path) {
    if (config::is_safe_relative_path(relative_path)) {
        return relative_path;
    }

    std::string result;
    std::stringstream stream(relative_path);
    std::string component;
    while (std::getline(stream, component, '/')) {
        if (component.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += "/";
        }
        result += config::sanitize_filename(component);
    }
    return result.empty() ? config::sanitize_filename(relative_path) : result;
}

wire::OfferResultResponse rejection(const std::string& reason) {
    wire::OfferResultResponse answer;
    answer.accepted = false;
    answer.reason = reason;
    return answer;
}

} // anonymous namespace

// ============================================================================
// Offer validation
// ============================================================================

std::optional<std::string> validate_offer(const wire::OfferRequest& offer) {
    if (!config::validate_identifier(offer.session_id)) {
        return std::string("invalid session id");
    }
    if (offer.files.empty()) {
        return std::string("offer contains no files");
    }
    if (offer.files.size() > config::MAX_FILES_PER_OFFER) {
        return "offer contains more than " + std::to_string(config::MAX_FILES_PER_OFFER) + " files";
    }
    if (offer.chunk_size < config::MIN_CHUNK_SIZE || offer.chunk_size > config::MAX_CHUNK_SIZE) {
        return "chunk size " + std::to_string(offer.chunk_size) + " out of range";
    }

    std::set<uint32_t> ids;
    std::set<std::string> paths;
    uint64_t total = 0;

    for (const auto& file : offer.files) {
        if (!ids.insert(file.file_id).second) {
            return "duplicate file id " + std::to_string(file.file_id);
        }
        if (!config::is_safe_relative_path(file.relative_path)) {
            return "unsafe relative path: " + file.relative_path;
        }
        if (!paths.insert(file.relative_path).second) {
            return "duplicate relative path: " + file.relative_path;
        }
        if (file.name.empty() || file.name.size() > config::MAX_FILENAME_LENGTH) {
            return "invalid file name for " + file.relative_path;
        }
        if (!is_hex_digest(file.checksum)) {
            return "invalid checksum for " + file.relative_path;
        }
        if (file.size / offer.chunk_size >= std::numeric_limits<uint32_t>::max()) {
            return "file too large for chunk size: " + file.relative_path;
        }
        if (file.size > std::numeric_limits<uint64_t>::max() - total) {
            return std::string("total size overflows");
        }
        total += file.size;
    }

    if (total != offer.total_size) {
        return "declared total size " + std::to_string(offer.total_size) +
               " does not match the files (" + std::to_string(total) + ")";
    }
    return std::nullopt;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

TransferManager::TransferManager(std::shared_ptr<Transport> transport,
                                 config::TransferConfig config,
                                 TransferEvents events)
    : transport_(std::move(transport))
    , config_(validated(std::move(config)))
    , events_(std::move(events))
    , lifetime_(std::make_shared<Lifetime>())
    , io_pool_(config_.io_threads)
    , disk_pool_(config_.disk_threads)
    , driver_pool_(config_.driver_threads)
    , sweep_strand_(asio::make_strand(io_pool_))
    , sweep_timer_(sweep_strand_)
    , shut_down_(false)
{
    if (!transport_) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "TransferManager requires a transport");
    }
    if (!ChunkCipher::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    auto lifetime = lifetime_;
    transport_->set_request_handler(
        [this, lifetime](const std::string& peer_id, wire::Request request, Responder respond) {
            std::shared_lock<std::shared_mutex> lock(lifetime->mutex);
            if (!lifetime->alive) {
                return;
            }
            handle_request(peer_id, std::move(request), std::move(respond));
        });

    asio::post(sweep_strand_, [this]() { schedule_sweep(); });

    utilities::log_info("TransferManager started (chunk size " + utilities::format_file_size(config_.chunk_size) +
                        ", " + std::to_string(config_.max_concurrent_chunks) + " concurrent chunks)");
}

TransferManager::~TransferManager() {
    shutdown();
}

// ============================================================================
// Sending
// ============================================================================

PreparedTransfer TransferManager::prepare(const std::vector<std::filesystem::path>& paths) {
    std::vector<std::shared_ptr<FileSource>> sources;
    sources.reserve(paths.size());
    for (const auto& path : paths) {
        sources.push_back(std::make_shared<PathFileSource>(path));
    }
    return prepare(sources);
}

PreparedTransfer TransferManager::prepare(const std::vector<std::shared_ptr<FileSource>>& sources) {
    if (shut_down_) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "TransferManager is shut down");
    }
    if (sources.empty()) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "No files given");
    }

    auto prepared = std::make_shared<PreparedTransfer>();
    prepared->prepared_id = utilities::generate_uuid();

    uint32_t next_id = 0;
    auto add_file = [&](std::shared_ptr<FileSource> source, const std::string& name,
                        const std::string& relative_path, uint64_t size) {
        PreparedFile file;
        file.file_id = next_id++;
        file.name = name;
        file.relative_path = safe_relative_path(relative_path);
        file.size = size;
        file.source = std::move(source);
        prepared->files.push_back(std::move(file));
    };

    for (const auto& source : sources) {
        if (!source) {
            throw TransferError(ErrorKind::INVALID_ARGUMENT, "Null file source");
        }

        auto meta = source->metadata();
        if (meta.is_dir) {
            for (auto& entry : source->enumerate(meta.name)) {
                add_file(entry.source, entry.name, entry.relative_path, entry.size);
            }
        } else {
            add_file(source, meta.name, meta.name, meta.size);
        }
    }

    if (prepared->files.empty()) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "No files found");
    }

    // Hash on the disk executor; files are independent
    std::vector<std::future<std::string>> hashes;
    hashes.reserve(prepared->files.size());
    for (const auto& file : prepared->files) {
        std::packaged_task<std::string()> task([source = file.source]() { return source->compute_hash(); });
        hashes.push_back(task.get_future());
        asio::post(disk_pool_, std::move(task));
    }

    for (size_t i = 0; i < prepared->files.size(); ++i) {
        prepared->files[i].checksum = hashes[i].get();
        prepared->total_size += prepared->files[i].size;
    }

    prepared_transfers_.insert(prepared->prepared_id, prepared);

    utilities::log_info("Prepared " + std::to_string(prepared->files.size()) + " file(s), " +
                        utilities::format_file_size(prepared->total_size) + " (" + prepared->prepared_id + ")");
    return *prepared;
}

std::future<StartSendResult> TransferManager::start_send(
    const std::string& prepared_id,
    const std::string& peer_id,
    const std::optional<std::vector<uint32_t>>& selected_file_ids
) {
    if (shut_down_) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "TransferManager is shut down");
    }

    auto found = prepared_transfers_.find(prepared_id);
    if (!found) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "Unknown prepared transfer: " + prepared_id);
    }

    auto transfer = std::make_shared<PreparedTransfer>();
    transfer->prepared_id = prepared_id;

    if (selected_file_ids) {
        if (selected_file_ids->empty()) {
            throw TransferError(ErrorKind::INVALID_ARGUMENT, "No files selected");
        }
        std::set<uint32_t> wanted(selected_file_ids->begin(), selected_file_ids->end());
        for (const auto& file : (*found)->files) {
            if (wanted.count(file.file_id) > 0) {
                transfer->files.push_back(file);
            }
        }
        if (transfer->files.size() != wanted.size()) {
            throw TransferError(ErrorKind::INVALID_ARGUMENT, "Selection contains unknown file ids");
        }
    } else {
        transfer->files = (*found)->files;
    }

    if (!prepared_transfers_.take(prepared_id)) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "Prepared transfer already started: " + prepared_id);
    }

    wire::OfferRequest offer;
    do {
        offer.session_id = utilities::generate_uuid();
    } while (!claim_session_id(offer.session_id));
    offer.chunk_size = config_.chunk_size;
    for (const auto& file : transfer->files) {
        offer.files.push_back(file.to_file_info());
        offer.total_size += file.size;
    }
    transfer->total_size = offer.total_size;

    auto promise = std::make_shared<std::promise<StartSendResult>>();
    auto future = promise->get_future();

    utilities::log_info("Offering " + std::to_string(offer.files.size()) + " file(s), " +
                        utilities::format_file_size(offer.total_size) + " to " + peer_id +
                        " (session " + offer.session_id + ")");

    auto lifetime = lifetime_;
    std::string session_id = offer.session_id;
    transport_->async_request(peer_id, std::move(offer),
        [this, lifetime, session_id, peer_id, transfer, promise](std::error_code ec,
                                                                 std::optional<wire::Response> response) {
            std::shared_lock<std::shared_mutex> lock(lifetime->mutex);
            if (!lifetime->alive) {
                promise->set_value(StartSendResult{session_id, false, std::string("transfer manager shut down")});
                return;
            }
            on_offer_result(session_id, peer_id, transfer, ec, std::move(response), *promise);
        });

    return future;
}

void TransferManager::on_offer_result(const std::string& session_id, const std::string& peer_id,
                                      std::shared_ptr<PreparedTransfer> prepared,
                                      std::error_code ec, std::optional<wire::Response> response,
                                      std::promise<StartSendResult>& result) {
    StartSendResult outcome;
    outcome.session_id = session_id;

    const auto* answer = response ? std::get_if<wire::OfferResultResponse>(&*response) : nullptr;

    if (ec) {
        outcome.reason = "offer failed: " + ec.message();
    } else if (answer == nullptr) {
        outcome.reason = std::string("unexpected response to offer");
    } else if (!answer->accepted) {
        outcome.reason = answer->reason.value_or("rejected");
    } else if (!answer->key) {
        outcome.reason = std::string("offer accepted without a session key");
        send_cancel(peer_id, session_id, *outcome.reason);
    } else if (shut_down_) {
        outcome.reason = std::string("transfer manager shut down");
        send_cancel(peer_id, session_id, *outcome.reason);
    } else {
        try {
            auto session = std::make_shared<SendSession>(
                session_id, peer_id, prepared->files, *answer->key, config_.chunk_size, config_, events_,
                [this](const std::string& id) {
                    send_sessions_.erase(id);
                });
            send_sessions_.insert(session_id, session);
            outcome.accepted = true;
        } catch (const TransferError& e) {
            outcome.reason = std::string(e.what());
            send_cancel(peer_id, session_id, "invalid session key");
        }
    }

    if (outcome.accepted) {
        utilities::log_info("Offer " + session_id + " accepted by " + peer_id);
    } else {
        utilities::log_info("Offer " + session_id + " not accepted: " + outcome.reason.value_or(""));
    }
    result.set_value(std::move(outcome));
}

// ============================================================================
// Receiving
// ============================================================================

bool TransferManager::accept(const std::string& session_id) {
    auto directory = config_.save_directory.empty() ? config::get_received_directory() : config_.save_directory;
    return accept(session_id, directory);
}

bool TransferManager::accept(const std::string& session_id, const std::filesystem::path& save_directory) {
    std::shared_ptr<FileSink> sink;
    try {
        sink = std::make_shared<PathFileSink>(save_directory);
    } catch (const TransferError& e) {
        utilities::log_error("Cannot receive into " + save_directory.string() + ": " + e.what());
        return false;
    }
    return accept(session_id, std::move(sink));
}

bool TransferManager::accept(const std::string& session_id, std::shared_ptr<FileSink> sink) {
    if (!sink) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "accept requires a file sink");
    }

    auto pending = pending_offers_.take(session_id);
    if (!pending) {
        utilities::log_warn("No pending offer: " + session_id);
        return false;
    }

    const auto& offer = (*pending)->offer;
    auto session = std::make_shared<ReceiveSession>(
        offer.session_id, (*pending)->peer_id, offer.files, offer.chunk_size, std::move(sink),
        *transport_, io_pool_, disk_pool_, config_, events_,
        [this](const std::string& id) {
            receive_sessions_.erase(id);
        });
    if (!receive_sessions_.insert(session_id, session)) {
        utilities::log_error("Receive session " + session_id + " already exists");
        (*pending)->respond(rejection("session id already in use"));
        return false;
    }

    wire::OfferResultResponse answer;
    answer.accepted = true;
    answer.key = session->key_bytes();
    (*pending)->respond(answer);

    utilities::log_info("Accepted offer " + session_id + " from " + (*pending)->peer_id);

    asio::post(driver_pool_, [session]() { session->run(); });
    return true;
}

bool TransferManager::reject(const std::string& session_id, const std::string& reason) {
    auto pending = pending_offers_.take(session_id);
    if (!pending) {
        return false;
    }

    (*pending)->respond(rejection(reason));

    utilities::log_info("Rejected offer " + session_id + ": " + reason);
    return true;
}

// ============================================================================
// Control
// ============================================================================

bool TransferManager::cancel(const std::string& session_id, const std::string& reason) {
    if (auto session = receive_sessions_.find(session_id)) {
        return (*session)->cancel(reason, true);
    }

    if (auto session = send_sessions_.find(session_id)) {
        if ((*session)->cancel(reason)) {
            send_cancel((*session)->peer_id(), session_id, reason);
            return true;
        }
        return false;
    }

    return reject(session_id, reason);
}

void TransferManager::handle_request(const std::string& peer_id, wire::Request request, Responder respond) {
    utilities::log_debug("Request " + wire::request_type_name(request) + " from " + peer_id +
                         " for session " + wire::request_session_id(request));

    std::visit([this, &peer_id, &respond](auto&& typed) {
        on_request(peer_id, std::move(typed), respond);
    }, std::move(request));
}

void TransferManager::on_request(const std::string& peer_id, wire::OfferRequest request, Responder& respond) {
    if (shut_down_) {
        respond(rejection("receiver shutting down"));
        return;
    }

    auto problem = validate_offer(request);
    if (!problem && !claim_session_id(request.session_id)) {
        problem = std::string("session id already in use");
    }
    if (problem) {
        utilities::log_warn("Rejecting offer " + request.session_id + " from " + peer_id + ": " + *problem);
        respond(rejection(*problem));
        return;
    }

    IncomingOfferEvent event;
    event.session_id = request.session_id;
    event.peer_id = peer_id;
    event.files = request.files;
    event.total_size = request.total_size;

    auto pending = std::make_shared<PendingOffer>();
    pending->peer_id = peer_id;
    pending->offer = std::move(request);
    pending->respond = std::move(respond);
    pending->received_at = std::chrono::steady_clock::now();

    if (!pending_offers_.insert(event.session_id, pending)) {
        pending->respond(rejection("session id already in use"));
        return;
    }

    utilities::log_info("Offer " + event.session_id + " from " + peer_id + ": " +
                        std::to_string(event.files.size()) + " file(s), " +
                        utilities::format_file_size(event.total_size));

    if (events_.on_offer) {
        events_.on_offer(event);
    }
    if (config_.auto_accept) {
        accept(event.session_id);
    }
}

void TransferManager::on_request(const std::string& peer_id, wire::ChunkRequest request, Responder& respond) {
    auto session = send_sessions_.find(request.session_id);
    if (!session || (*session)->peer_id() != peer_id) {
        utilities::log_debug("Chunk request for unknown session " + request.session_id + " from " + peer_id);
        respond(wire::AckResponse{request.session_id});
        return;
    }

    auto send_session = *session;
    asio::post(disk_pool_, [send_session, request, respond = std::move(respond)]() {
        respond(send_session->handle_chunk_request(request.file_id, request.chunk_index));
    });
}

void TransferManager::on_request(const std::string& peer_id, wire::CompleteRequest request, Responder& respond) {
    auto session = send_sessions_.find(request.session_id);
    if (session && (*session)->peer_id() == peer_id) {
        (*session)->handle_complete();
    } else {
        utilities::log_debug("Complete for unknown session " + request.session_id + " from " + peer_id);
    }
    respond(wire::AckResponse{request.session_id});
}

void TransferManager::on_request(const std::string& peer_id, wire::CancelRequest request, Responder& respond) {
    const std::string& session_id = request.session_id;

    auto receive = receive_sessions_.find(session_id);
    auto send = send_sessions_.find(session_id);

    if (receive && (*receive)->peer_id() == peer_id) {
        utilities::log_info("Peer " + peer_id + " cancelled receive session " + session_id + ": " + request.reason);
        (*receive)->cancel(request.reason, false);
    } else if (send && (*send)->peer_id() == peer_id) {
        (*send)->handle_cancel(request.reason);
    } else if (auto offer = pending_offers_.take_if(session_id, [&peer_id](const std::shared_ptr<PendingOffer>& p) {
                   return p->peer_id == peer_id;
               })) {
        utilities::log_info("Offer " + session_id + " withdrawn by " + peer_id + ": " + request.reason);
        (*offer)->respond(rejection("offer withdrawn"));

        TransferFailedEvent event;
        event.session_id = session_id;
        event.direction = TransferDirection::RECEIVE;
        event.error = "offer withdrawn: " + request.reason;
        event.cancelled = true;
        if (events_.on_failed) {
            events_.on_failed(event);
        }
    } else {
        utilities::log_debug("Cancel for unknown session " + session_id + " from " + peer_id);
    }

    respond(wire::AckResponse{session_id});
}

size_t TransferManager::sweep_stale_sessions(std::chrono::steady_clock::time_point now) {
    size_t removed = 0;

    for (const auto& [session_id, session] : send_sessions_.entries()) {
        if (now - session->last_activity() > config_.stale_session_timeout) {
            session->expire();
            send_cancel(session->peer_id(), session_id, "session expired");
            removed++;
        }
    }

    // An unanswered offer is useless once the sender's request has timed out
    auto expired = pending_offers_.take_matching([this, now](const std::shared_ptr<PendingOffer>& pending) {
        return now - pending->received_at > config_.offer_timeout;
    });
    for (const auto& [session_id, pending] : expired) {
        utilities::log_warn("Offer " + session_id + " from " + pending->peer_id + " expired");
        pending->respond(rejection("offer expired"));

        TransferFailedEvent event;
        event.session_id = session_id;
        event.direction = TransferDirection::RECEIVE;
        event.error = "offer expired";
        if (events_.on_failed) {
            events_.on_failed(event);
        }
        removed++;
    }

    if (removed > 0) {
        utilities::log_info("Swept " + std::to_string(removed) + " stale session(s)");
    }
    return removed;
}

void TransferManager::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }

    utilities::log_info("Shutting down TransferManager...");

    {
        std::unique_lock<std::shared_mutex> lock(lifetime_->mutex);
        lifetime_->alive = false;
    }
    transport_->set_request_handler(nullptr);
    asio::post(sweep_strand_, [this]() { sweep_timer_.cancel(); });

    for (const auto& [session_id, pending] : pending_offers_.take_matching([](const std::shared_ptr<PendingOffer>&) { return true; })) {
        pending->respond(rejection("receiver shutting down"));
    }

    for (const auto& [session_id, session] : receive_sessions_.entries()) {
        session->cancel("transfer manager shutting down", true);
    }

    for (const auto& [session_id, session] : send_sessions_.entries()) {
        if (session->cancel("transfer manager shutting down")) {
            send_cancel(session->peer_id(), session_id, "sender shutting down");
        }
    }

    // Drivers first: they wait on disk work
    driver_pool_.join();
    disk_pool_.join();
    io_pool_.join();

    utilities::log_info("TransferManager stopped");
}

// ============================================================================
// Introspection
// ============================================================================

std::vector<IncomingOfferEvent> TransferManager::pending_offers() const {
    std::vector<IncomingOfferEvent> offers;
    for (const auto& [session_id, pending] : pending_offers_.entries()) {
        IncomingOfferEvent event;
        event.session_id = session_id;
        event.peer_id = pending->peer_id;
        event.files = pending->offer.files;
        event.total_size = pending->offer.total_size;
        offers.push_back(std::move(event));
    }
    return offers;
}

std::optional<TransferProgressEvent> TransferManager::progress(const std::string& session_id) {
    if (auto session = receive_sessions_.find(session_id)) {
        return (*session)->progress();
    }
    if (auto session = send_sessions_.find(session_id)) {
        return (*session)->progress();
    }
    return std::nullopt;
}

// ============================================================================
// Private Methods
// ============================================================================

void TransferManager::send_cancel(const std::string& peer_id, const std::string& session_id, const std::string& reason) {
    wire::CancelRequest request;
    request.session_id = session_id;
    request.reason = reason;

    transport_->async_request(peer_id, std::move(request),
        [session_id](std::error_code ec, std::optional<wire::Response>) {
            if (ec) {
                utilities::log_debug("Cancel of session " + session_id + " not delivered: " + ec.message());
            }
        });
}

// An id is claimed once, when first offered or generated, and stays claimed
// after its session ends, so no two sessions can ever share it.
bool TransferManager::claim_session_id(const std::string& session_id) {
    return claimed_ids_.insert(session_id, true);
}

void TransferManager::schedule_sweep() {
    sweep_timer_.expires_after(config_.cleanup_interval);
    sweep_timer_.async_wait([this](const std::error_code& ec) {
        if (ec || shut_down_) {
            return;
        }
        sweep_stale_sessions();
        schedule_sweep();
    });
}

} // namespace ferry
