/**
 * @file wire_protocol.hpp
 * @brief Transfer protocol messages and their CBOR encoding
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The protocol is a closed set of request/response pairs:
 *
 *   Offer        -> OfferResult   (acceptance carries the session key)
 *   ChunkRequest -> Chunk         (or an inert Ack when the chunk is unavailable)
 *   Complete     -> Ack
 *   Cancel       -> Ack           (sent by either side)
 *
 * Every message is a CBOR map with a "type" tag. Keys and chunk payloads
 * travel as CBOR byte strings.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ferry {
namespace wire {

// ============================================================================
// Payload types
// ============================================================================

/**
 * @brief Description of one offered file
 */
struct FileInfo {
    uint32_t file_id = 0;           ///< Sequential id, unique within the offer
    std::string name;               ///< Display name
    std::string relative_path;      ///< Forward-slash path below the save directory
    uint64_t size = 0;              ///< Size in bytes
    std::string checksum;           ///< Hex content hash of the whole file
};

bool operator==(const FileInfo& a, const FileInfo& b);

// ============================================================================
// Requests
// ============================================================================

/// Propose a transfer; answered by OfferResult
struct OfferRequest {
    std::string session_id;
    std::vector<FileInfo> files;
    uint64_t total_size = 0;
    uint32_t chunk_size = 0;
};

/// Pull one chunk; answered by Chunk or Ack
struct ChunkRequest {
    std::string session_id;
    uint32_t file_id = 0;
    uint32_t chunk_index = 0;
};

/// Receiver has verified every file; answered by Ack
struct CompleteRequest {
    std::string session_id;
};

/// Abort the session from either side; answered by Ack
struct CancelRequest {
    std::string session_id;
    std::string reason;
};

using Request = std::variant<OfferRequest, ChunkRequest, CompleteRequest, CancelRequest>;

// ============================================================================
// Responses
// ============================================================================

/// Answer to an offer
struct OfferResultResponse {
    bool accepted = false;
    std::optional<std::vector<uint8_t>> key;    ///< Present iff accepted
    std::optional<std::string> reason;          ///< Present on rejection
};

/// Encrypted chunk payload
struct ChunkResponse {
    std::string session_id;
    uint32_t file_id = 0;
    uint32_t chunk_index = 0;
    std::vector<uint8_t> data;                  ///< Ciphertext with trailing tag
    bool is_last = false;
};

/// Generic acknowledgement
struct AckResponse {
    std::string session_id;
};

using Response = std::variant<OfferResultResponse, ChunkResponse, AckResponse>;

// ============================================================================
// Codec
// ============================================================================

/**
 * @brief Encode a request as CBOR
 * @return Encoded bytes
 */
std::vector<uint8_t> encode_request(const Request& request);

/**
 * @brief Decode a CBOR request
 * @param bytes Encoded message
 * @return Request if well formed and within size limits, std::nullopt otherwise
 */
std::optional<Request> decode_request(const std::vector<uint8_t>& bytes);

/**
 * @brief Encode a response as CBOR
 * @return Encoded bytes
 */
std::vector<uint8_t> encode_response(const Response& response);

/**
 * @brief Decode a CBOR response
 * @param bytes Encoded message
 * @return Response if well formed and within size limits, std::nullopt otherwise
 */
std::optional<Response> decode_response(const std::vector<uint8_t>& bytes);

/**
 * @brief Wire tag of a request ("offer", "chunkRequest", "complete", "cancel")
 */
std::string request_type_name(const Request& request);

/**
 * @brief Wire tag of a response ("offerResult", "chunk", "ack")
 */
std::string response_type_name(const Response& response);

/**
 * @brief Session id carried by any request
 */
const std::string& request_session_id(const Request& request);

} // namespace wire
} // namespace ferry
