/**
 * @file file_sink.hpp
 * @brief Write side of the storage abstraction
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Received bytes are written into a partial file that is only promoted to
 * its final location after the whole-file hash matches. A half-written file
 * is never visible at the final location.
 */

#pragma once

#include "ferry/content_store.hpp"
#include "ferry/posix_io.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ferry {

/**
 * @brief A file under construction
 *
 * Shared by all concurrent chunk writers of one file. Once finalized or
 * discarded it accepts no further writes.
 */
class PartialFile {
public:
    PartialFile(std::string relative_path, uint64_t size);
    virtual ~PartialFile() = default;

    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    const std::string& relative_path() const { return relative_path_; }
    uint64_t size() const { return size_; }

    /// Whether the file was promoted or discarded
    bool is_finished() const { return finished_.load(); }

    /// Temporary location (for logs)
    virtual std::string temp_location() const = 0;

    /// Location the file is promoted to
    virtual std::string final_location() const = 0;

protected:
    friend class FileSink;

    /// Mark finished; returns false if it already was
    bool mark_finished() { return !finished_.exchange(true); }

private:
    std::string relative_path_;
    uint64_t size_;
    std::atomic<bool> finished_;
};

/**
 * @brief Abstract destination for received files
 */
class FileSink {
public:
    virtual ~FileSink() = default;

    /**
     * @brief Create the partial file for an offered file
     * @param relative_path Forward-slash path below the save location
     * @param size Declared size in bytes
     * @throws TransferError (INVALID_ARGUMENT) for unsafe paths, (STORAGE) on I/O failure
     */
    virtual std::shared_ptr<PartialFile> create_partial(const std::string& relative_path, uint64_t size) = 0;

    /**
     * @brief Write decrypted chunk bytes at chunk_index * chunk_size
     *
     * Safe to call concurrently for distinct chunk indices of the same file.
     *
     * @throws TransferError (STORAGE) on I/O failure, out-of-bounds data or a closed partial
     */
    void write_chunk(PartialFile& partial, uint32_t chunk_index, uint32_t chunk_size,
                     const std::vector<uint8_t>& data);

    /**
     * @brief Verify the partial against the expected hash and promote it
     * @return Final location of the file
     * @throws TransferError (INTEGRITY) on mismatch, after deleting the partial;
     *         (STORAGE) if promotion fails
     */
    std::string finalize(PartialFile& partial, const std::string& expected_hash);

    /**
     * @brief Delete a partial that will not be completed; no-op once finished
     */
    void discard(PartialFile& partial);

    /**
     * @brief Human readable save location for completion events
     */
    virtual std::string save_location_display() const = 0;

protected:
    virtual void write_at(PartialFile& partial, uint64_t offset, const std::vector<uint8_t>& data) = 0;

    /// Release the write handle so that the data is complete before hashing
    virtual void close_partial(PartialFile& partial) = 0;

    virtual std::string hash_partial(PartialFile& partial) = 0;

    /// Move the partial to its final location
    virtual std::string promote(PartialFile& partial) = 0;

    /// Delete the partial's storage; must tolerate already-missing data
    virtual void remove_partial(PartialFile& partial) = 0;
};

// ============================================================================
// Filesystem backend
// ============================================================================

/**
 * @brief Partial file on disk, "<final>.part"
 *
 * The mutex guards only the descriptor slot. Writers clone the shared
 * descriptor out of the lock and perform pwrite without holding it.
 */
class PathPartialFile : public PartialFile {
public:
    PathPartialFile(std::string relative_path, uint64_t size,
                    std::filesystem::path part_path, std::filesystem::path final_path,
                    posix::FileDescriptor fd);

    std::string temp_location() const override { return part_path_.string(); }
    std::string final_location() const override { return final_path_.string(); }

    const std::filesystem::path& part_path() const { return part_path_; }
    const std::filesystem::path& final_path() const { return final_path_; }

    /**
     * @brief Shared write descriptor
     * @return Descriptor, nullptr once closed
     */
    std::shared_ptr<posix::FileDescriptor> write_handle() const;

    /// Drop the write descriptor; the file closes when the last writer releases it
    void close_write_handle();

private:
    std::filesystem::path part_path_;
    std::filesystem::path final_path_;
    mutable std::mutex mutex_;
    std::shared_ptr<posix::FileDescriptor> fd_;
};

/**
 * @brief Derive the partial path: the full file name plus ".part"
 *
 * "readme.md" -> "readme.md.part", "Makefile" -> "Makefile.part"
 */
std::filesystem::path part_path_for(const std::filesystem::path& final_path);

/**
 * @brief FileSink writing below a save directory
 */
class PathFileSink : public FileSink {
public:
    /**
     * @param save_directory Root below which files are created (created if missing)
     */
    explicit PathFileSink(std::filesystem::path save_directory);

    std::shared_ptr<PartialFile> create_partial(const std::string& relative_path, uint64_t size) override;
    std::string save_location_display() const override;

    const std::filesystem::path& save_directory() const { return save_directory_; }

protected:
    void write_at(PartialFile& partial, uint64_t offset, const std::vector<uint8_t>& data) override;
    void close_partial(PartialFile& partial) override;
    std::string hash_partial(PartialFile& partial) override;
    std::string promote(PartialFile& partial) override;
    void remove_partial(PartialFile& partial) override;

private:
    std::filesystem::path save_directory_;
};

// ============================================================================
// Managed content backend
// ============================================================================

/**
 * @brief Partial file held as a pending content entry
 */
class ContentPartialFile : public PartialFile {
public:
    ContentPartialFile(std::string relative_path, uint64_t size, std::string handle, std::string final_location);

    std::string temp_location() const override { return handle_; }
    std::string final_location() const override { return final_location_; }

    const std::string& handle() const { return handle_; }

    bool is_closed() const { return closed_.load(); }
    void close() { closed_.store(true); }

private:
    std::string handle_;
    std::string final_location_;
    std::atomic<bool> closed_;
};

/**
 * @brief FileSink writing pending entries into a ContentStore
 */
class ContentFileSink : public FileSink {
public:
    explicit ContentFileSink(std::shared_ptr<ContentStore> store);

    std::shared_ptr<PartialFile> create_partial(const std::string& relative_path, uint64_t size) override;
    std::string save_location_display() const override;

protected:
    void write_at(PartialFile& partial, uint64_t offset, const std::vector<uint8_t>& data) override;
    void close_partial(PartialFile& partial) override;
    std::string hash_partial(PartialFile& partial) override;
    std::string promote(PartialFile& partial) override;
    void remove_partial(PartialFile& partial) override;

private:
    std::shared_ptr<ContentStore> store_;
};

} // namespace ferry
