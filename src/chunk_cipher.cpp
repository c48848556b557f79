/**
 * @file chunk_cipher.cpp
 * @brief Implementation of per-chunk XChaCha20-Poly1305 encryption
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/chunk_cipher.hpp"
#include "ferry/transfer_error.hpp"

#include <cstring>

namespace ferry {

namespace {

void append_be32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

} // namespace

bool ChunkCipher::initialize() {
    // Safe to call multiple times
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

SessionKey ChunkCipher::generate_key() {
    SessionKey key;
    crypto_aead_xchacha20poly1305_ietf_keygen(key.data());
    return key;
}

ChunkNonce ChunkCipher::derive_nonce(const std::string& session_id, uint32_t file_id, uint32_t chunk_index) {
    std::vector<uint8_t> input;
    input.reserve(12 + session_id.size());
    append_be32(input, static_cast<uint32_t>(session_id.size()));
    input.insert(input.end(), session_id.begin(), session_id.end());
    append_be32(input, file_id);
    append_be32(input, chunk_index);

    static_assert(sizeof(NONCE_CONTEXT) - 1 >= crypto_generichash_KEYBYTES_MIN,
                  "nonce context too short for a BLAKE2b key");

    ChunkNonce nonce;
    crypto_generichash(
        nonce.data(),
        nonce.size(),
        input.data(),
        input.size(),
        reinterpret_cast<const unsigned char*>(NONCE_CONTEXT),
        sizeof(NONCE_CONTEXT) - 1
    );

    return nonce;
}

ChunkCipher::ChunkCipher(const SessionKey& key, std::string session_id)
    : key_(key)
    , session_id_(std::move(session_id))
{
}

ChunkCipher::ChunkCipher(const std::vector<uint8_t>& key_bytes, std::string session_id)
    : key_()
    , session_id_(std::move(session_id))
{
    if (key_bytes.size() != key_.size()) {
        throw TransferError(ErrorKind::PROTOCOL,
            "Invalid session key length: " + std::to_string(key_bytes.size()));
    }
    std::memcpy(key_.data(), key_bytes.data(), key_.size());
}

ChunkCipher::~ChunkCipher() {
    sodium_memzero(key_.data(), key_.size());
}

std::optional<std::vector<uint8_t>> ChunkCipher::encrypt_chunk(
    uint32_t file_id,
    uint32_t chunk_index,
    const std::vector<uint8_t>& plaintext
) const {
    ChunkNonce nonce = derive_nonce(session_id_, file_id, chunk_index);

    // Allocate ciphertext buffer (plaintext + authentication tag)
    std::vector<uint8_t> ciphertext(plaintext.size() + crypto_aead_xchacha20poly1305_ietf_ABYTES);
    unsigned long long ciphertext_len = 0;

    int result = crypto_aead_xchacha20poly1305_ietf_encrypt(
        ciphertext.data(),
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        nullptr,  // No additional data
        0,
        nullptr,  // No secret nonce
        nonce.data(),
        key_.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    ciphertext.resize(static_cast<size_t>(ciphertext_len));
    return ciphertext;
}

std::optional<std::vector<uint8_t>> ChunkCipher::decrypt_chunk(
    uint32_t file_id,
    uint32_t chunk_index,
    const std::vector<uint8_t>& ciphertext
) const {
    if (ciphertext.size() < crypto_aead_xchacha20poly1305_ietf_ABYTES) {
        return std::nullopt;
    }

    ChunkNonce nonce = derive_nonce(session_id_, file_id, chunk_index);

    std::vector<uint8_t> plaintext(ciphertext.size() - crypto_aead_xchacha20poly1305_ietf_ABYTES);
    unsigned long long plaintext_len = 0;

    int result = crypto_aead_xchacha20poly1305_ietf_decrypt(
        plaintext.data(),
        &plaintext_len,
        nullptr,  // No secret nonce
        ciphertext.data(),
        ciphertext.size(),
        nullptr,  // No additional data
        0,
        nonce.data(),
        key_.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    plaintext.resize(static_cast<size_t>(plaintext_len));
    return plaintext;
}

std::vector<uint8_t> ChunkCipher::key_bytes() const {
    return std::vector<uint8_t>(key_.begin(), key_.end());
}

} // namespace ferry
