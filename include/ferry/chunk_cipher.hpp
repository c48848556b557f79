/**
 * @file chunk_cipher.hpp
 * @brief Per-chunk authenticated encryption for transfer sessions
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Each session uses one random XChaCha20-Poly1305 key. The nonce for a
 * chunk is derived from (session id, file id, chunk index) with keyed
 * BLAKE2b, so both sides compute it independently and a retransmitted
 * chunk is encrypted identically.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

namespace ferry {

/// Symmetric session key
using SessionKey = std::array<uint8_t, crypto_aead_xchacha20poly1305_ietf_KEYBYTES>;

/// Per-chunk nonce
using ChunkNonce = std::array<uint8_t, crypto_aead_xchacha20poly1305_ietf_NPUBBYTES>;

/// Domain separation key for nonce derivation
constexpr char NONCE_CONTEXT[] = "ferry-transfer-nonce-v1";

/**
 * @brief ChunkCipher - encrypts and decrypts the chunks of one session
 *
 * Thread-safe: all operations after construction are const. The key is
 * wiped when the cipher is destroyed.
 */
class ChunkCipher {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    /**
     * @brief Generate a fresh session key from the OS CSPRNG
     */
    static SessionKey generate_key();

    /**
     * @brief Derive the nonce of a chunk
     *
     * BLAKE2b keyed with NONCE_CONTEXT over
     * len(session_id) BE32 || session_id || file_id BE32 || chunk_index BE32,
     * truncated to the nonce size.
     */
    static ChunkNonce derive_nonce(const std::string& session_id, uint32_t file_id, uint32_t chunk_index);

    /**
     * @brief Construct from a key
     * @param key Session key
     * @param session_id Session the key belongs to
     */
    ChunkCipher(const SessionKey& key, std::string session_id);

    /**
     * @brief Construct from key bytes received on the wire
     * @throws TransferError (PROTOCOL) if the key has the wrong length
     */
    ChunkCipher(const std::vector<uint8_t>& key_bytes, std::string session_id);

    ~ChunkCipher();

    // Disable copy and move
    ChunkCipher(const ChunkCipher&) = delete;
    ChunkCipher& operator=(const ChunkCipher&) = delete;
    ChunkCipher(ChunkCipher&&) = delete;
    ChunkCipher& operator=(ChunkCipher&&) = delete;

    /**
     * @brief Encrypt a chunk
     * @param file_id File the chunk belongs to
     * @param chunk_index Index of the chunk within the file
     * @param plaintext Chunk bytes (may be empty)
     * @return Ciphertext followed by the 16-byte tag, std::nullopt on failure
     */
    std::optional<std::vector<uint8_t>> encrypt_chunk(
        uint32_t file_id,
        uint32_t chunk_index,
        const std::vector<uint8_t>& plaintext
    ) const;

    /**
     * @brief Decrypt and authenticate a chunk
     * @return Plaintext, std::nullopt if authentication fails
     */
    std::optional<std::vector<uint8_t>> decrypt_chunk(
        uint32_t file_id,
        uint32_t chunk_index,
        const std::vector<uint8_t>& ciphertext
    ) const;

    /// Key bytes for the offer result
    std::vector<uint8_t> key_bytes() const;

    const std::string& session_id() const { return session_id_; }

private:
    SessionKey key_;
    std::string session_id_;
};

} // namespace ferry
