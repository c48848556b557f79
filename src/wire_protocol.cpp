/**
 * @file wire_protocol.cpp
 * @brief Implementation of the transfer protocol codec
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/wire_protocol.hpp"
#include "ferry/transfer_config.hpp"
#include "ferry/utilities.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace ferry {
namespace wire {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

json file_info_to_json(const FileInfo& info) {
    json j;
    j["fileId"] = info.file_id;
    j["name"] = info.name;
    j["relativePath"] = info.relative_path;
    j["size"] = info.size;
    j["checksum"] = info.checksum;
    return j;
}

FileInfo file_info_from_json(const json& j) {
    FileInfo info;
    info.file_id = j.at("fileId").get<uint32_t>();
    info.name = j.at("name").get<std::string>();
    info.relative_path = j.at("relativePath").get<std::string>();
    info.size = j.at("size").get<uint64_t>();
    info.checksum = j.at("checksum").get<std::string>();
    return info;
}

std::vector<uint8_t> binary_field(const json& j, const char* key) {
    const json& field = j.at(key);
    if (!field.is_binary()) {
        throw std::invalid_argument(std::string(key) + " must be a byte string");
    }
    const auto& bin = field.get_binary();
    return std::vector<uint8_t>(bin.begin(), bin.end());
}

json parse_cbor(const std::vector<uint8_t>& bytes) {
    if (bytes.empty() || bytes.size() > config::MAX_MESSAGE_SIZE) {
        throw std::length_error("message size out of range: " + std::to_string(bytes.size()));
    }
    json j = json::from_cbor(bytes);
    if (!j.is_object()) {
        throw std::invalid_argument("message root is not a map");
    }
    return j;
}

} // namespace

bool operator==(const FileInfo& a, const FileInfo& b) {
    return a.file_id == b.file_id && a.name == b.name &&
           a.relative_path == b.relative_path && a.size == b.size &&
           a.checksum == b.checksum;
}

// ============================================================================
// Requests
// ============================================================================

std::vector<uint8_t> encode_request(const Request& request) {
    json j = std::visit(overloaded{
        [](const OfferRequest& r) {
            json j;
            j["type"] = "offer";
            j["sessionId"] = r.session_id;
            j["files"] = json::array();
            for (const auto& f : r.files) {
                j["files"].push_back(file_info_to_json(f));
            }
            j["totalSize"] = r.total_size;
            j["chunkSize"] = r.chunk_size;
            return j;
        },
        [](const ChunkRequest& r) {
            json j;
            j["type"] = "chunkRequest";
            j["sessionId"] = r.session_id;
            j["fileId"] = r.file_id;
            j["chunkIndex"] = r.chunk_index;
            return j;
        },
        [](const CompleteRequest& r) {
            json j;
            j["type"] = "complete";
            j["sessionId"] = r.session_id;
            return j;
        },
        [](const CancelRequest& r) {
            json j;
            j["type"] = "cancel";
            j["sessionId"] = r.session_id;
            j["reason"] = r.reason;
            return j;
        }
    }, request);

    return json::to_cbor(j);
}

std::optional<Request> decode_request(const std::vector<uint8_t>& bytes) {
    try {
        json j = parse_cbor(bytes);
        std::string type = j.at("type").get<std::string>();

        if (type == "offer") {
            OfferRequest r;
            r.session_id = j.at("sessionId").get<std::string>();
            for (const auto& f : j.at("files")) {
                r.files.push_back(file_info_from_json(f));
            }
            r.total_size = j.at("totalSize").get<uint64_t>();
            r.chunk_size = j.at("chunkSize").get<uint32_t>();
            return Request{std::move(r)};
        }
        if (type == "chunkRequest") {
            ChunkRequest r;
            r.session_id = j.at("sessionId").get<std::string>();
            r.file_id = j.at("fileId").get<uint32_t>();
            r.chunk_index = j.at("chunkIndex").get<uint32_t>();
            return Request{std::move(r)};
        }
        if (type == "complete") {
            CompleteRequest r;
            r.session_id = j.at("sessionId").get<std::string>();
            return Request{std::move(r)};
        }
        if (type == "cancel") {
            CancelRequest r;
            r.session_id = j.at("sessionId").get<std::string>();
            r.reason = j.value("reason", std::string());
            return Request{std::move(r)};
        }

        utilities::log_warn("Unknown request type: " + type);
        return std::nullopt;

    } catch (const std::exception& e) {
        utilities::log_warn("Failed to decode request: " + std::string(e.what()));
        return std::nullopt;
    }
}

// ============================================================================
// Responses
// ============================================================================

std::vector<uint8_t> encode_response(const Response& response) {
    json j = std::visit(overloaded{
        [](const OfferResultResponse& r) {
            json j;
            j["type"] = "offerResult";
            j["accepted"] = r.accepted;
            if (r.key) {
                j["key"] = json::binary(*r.key);
            }
            if (r.reason) {
                j["reason"] = *r.reason;
            }
            return j;
        },
        [](const ChunkResponse& r) {
            json j;
            j["type"] = "chunk";
            j["sessionId"] = r.session_id;
            j["fileId"] = r.file_id;
            j["chunkIndex"] = r.chunk_index;
            j["data"] = json::binary(r.data);
            j["isLast"] = r.is_last;
            return j;
        },
        [](const AckResponse& r) {
            json j;
            j["type"] = "ack";
            j["sessionId"] = r.session_id;
            return j;
        }
    }, response);

    return json::to_cbor(j);
}

std::optional<Response> decode_response(const std::vector<uint8_t>& bytes) {
    try {
        json j = parse_cbor(bytes);
        std::string type = j.at("type").get<std::string>();

        if (type == "offerResult") {
            OfferResultResponse r;
            r.accepted = j.at("accepted").get<bool>();
            if (j.contains("key")) {
                r.key = binary_field(j, "key");
            }
            if (j.contains("reason")) {
                r.reason = j.at("reason").get<std::string>();
            }
            return Response{std::move(r)};
        }
        if (type == "chunk") {
            ChunkResponse r;
            r.session_id = j.at("sessionId").get<std::string>();
            r.file_id = j.at("fileId").get<uint32_t>();
            r.chunk_index = j.at("chunkIndex").get<uint32_t>();
            r.data = binary_field(j, "data");
            r.is_last = j.at("isLast").get<bool>();
            return Response{std::move(r)};
        }
        if (type == "ack") {
            AckResponse r;
            r.session_id = j.at("sessionId").get<std::string>();
            return Response{std::move(r)};
        }

        utilities::log_warn("Unknown response type: " + type);
        return std::nullopt;

    } catch (const std::exception& e) {
        utilities::log_warn("Failed to decode response: " + std::string(e.what()));
        return std::nullopt;
    }
}

// ============================================================================
// Helpers
// ============================================================================

std::string request_type_name(const Request& request) {
    return std::visit(overloaded{
        [](const OfferRequest&) { return std::string("offer"); },
        [](const ChunkRequest&) { return std::string("chunkRequest"); },
        [](const CompleteRequest&) { return std::string("complete"); },
        [](const CancelRequest&) { return std::string("cancel"); }
    }, request);
}

std::string response_type_name(const Response& response) {
    return std::visit(overloaded{
        [](const OfferResultResponse&) { return std::string("offerResult"); },
        [](const ChunkResponse&) { return std::string("chunk"); },
        [](const AckResponse&) { return std::string("ack"); }
    }, response);
}

const std::string& request_session_id(const Request& request) {
    return std::visit([](const auto& r) -> const std::string& { return r.session_id; }, request);
}

} // namespace wire
} // namespace ferry
