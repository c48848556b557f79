/**
 * @file transfer_events.cpp
 * @brief JSON serialisation of transfer events
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/transfer_events.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ferry {

std::string direction_to_string(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::SEND:    return "send";
        case TransferDirection::RECEIVE: return "receive";
        default:                         return "unknown";
    }
}

std::string file_status_to_string(FileTransferStatus status) {
    switch (status) {
        case FileTransferStatus::PENDING:      return "pending";
        case FileTransferStatus::TRANSFERRING: return "transferring";
        case FileTransferStatus::COMPLETED:    return "completed";
        case FileTransferStatus::FAILED:       return "failed";
        default:                               return "unknown";
    }
}

std::string TransferProgressEvent::to_json() const {
    json j;
    j["sessionId"] = session_id;
    j["direction"] = direction_to_string(direction);
    j["totalFiles"] = total_files;
    j["completedFiles"] = completed_files;
    j["failedFiles"] = failed_files;
    j["totalBytes"] = total_bytes;
    j["transferredBytes"] = transferred_bytes;
    j["speed"] = speed;
    j["eta"] = eta ? json(*eta) : json(nullptr);

    j["files"] = json::array();
    for (const auto& f : files) {
        json fj;
        fj["fileId"] = f.file_id;
        fj["name"] = f.name;
        fj["size"] = f.size;
        fj["transferred"] = f.transferred;
        fj["status"] = file_status_to_string(f.status);
        j["files"].push_back(fj);
    }
    return j.dump();
}

std::string TransferCompleteEvent::to_json() const {
    json j;
    j["sessionId"] = session_id;
    j["direction"] = direction_to_string(direction);
    j["totalBytes"] = total_bytes;
    j["elapsedMs"] = elapsed_ms;
    j["savePath"] = save_location ? json(*save_location) : json(nullptr);
    j["fileLocations"] = file_locations;
    return j.dump();
}

std::string TransferFailedEvent::to_json() const {
    json j;
    j["sessionId"] = session_id;
    j["direction"] = direction_to_string(direction);
    j["error"] = error;
    j["cancelled"] = cancelled;
    j["failedFileIds"] = failed_file_ids;
    return j.dump();
}

std::string IncomingOfferEvent::to_json() const {
    json j;
    j["sessionId"] = session_id;
    j["peerId"] = peer_id;
    j["totalSize"] = total_size;
    j["files"] = json::array();
    for (const auto& f : files) {
        json fj;
        fj["fileId"] = f.file_id;
        fj["name"] = f.name;
        fj["relativePath"] = f.relative_path;
        fj["size"] = f.size;
        j["files"].push_back(fj);
    }
    return j.dump();
}

} // namespace ferry
