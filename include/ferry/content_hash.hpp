/**
 * @file content_hash.hpp
 * @brief Streaming SHA-256 used for whole-file integrity checks
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace ferry {

/**
 * @brief Incremental SHA-256 hasher producing lowercase hex digests
 *
 * Memory use is constant regardless of how much data is fed.
 */
class ContentHasher {
public:
    /// Block size used by callers that stream from storage
    static constexpr size_t READ_BLOCK_SIZE = 64 * 1024;

    /**
     * @brief Create a hasher
     * @throws TransferError (STORAGE) if the digest context cannot be created
     */
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    /**
     * @brief Finish and return the hex digest
     *
     * The hasher must not be updated afterwards.
     */
    std::string finish_hex();

    /**
     * @brief Hash a byte buffer in one call
     */
    static std::string hash_bytes(const std::vector<uint8_t>& data);

private:
    evp_md_ctx_st* ctx_;
    bool finished_;
};

} // namespace ferry
