/**
 * @file content_hash.cpp
 * @brief Implementation of streaming SHA-256
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/content_hash.hpp"
#include "ferry/transfer_error.hpp"
#include "ferry/utilities.hpp"

#include <openssl/evp.h>

namespace ferry {

ContentHasher::ContentHasher()
    : ctx_(EVP_MD_CTX_new())
    , finished_(false)
{
    if (ctx_ == nullptr) {
        throw TransferError(ErrorKind::STORAGE, "Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw TransferError(ErrorKind::STORAGE, "Failed to initialize SHA-256");
    }
}

ContentHasher::~ContentHasher() {
    EVP_MD_CTX_free(ctx_);
}

void ContentHasher::update(const uint8_t* data, size_t size) {
    if (finished_) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "Hasher already finished");
    }
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw TransferError(ErrorKind::STORAGE, "SHA-256 update failed");
    }
}

std::string ContentHasher::finish_hex() {
    if (finished_) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "Hasher already finished");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1) {
        throw TransferError(ErrorKind::STORAGE, "SHA-256 finalization failed");
    }
    finished_ = true;

    return utilities::bytes_to_hex(digest, digest_len);
}

std::string ContentHasher::hash_bytes(const std::vector<uint8_t>& data) {
    ContentHasher hasher;
    hasher.update(data);
    return hasher.finish_hex();
}

} // namespace ferry
