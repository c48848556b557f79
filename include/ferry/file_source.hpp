/**
 * @file file_source.hpp
 * @brief Read side of the storage abstraction
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A FileSource reads byte ranges of one file or enumerates a directory.
 * Two backends exist: plain filesystem paths and managed content handles.
 * Callers never branch on the backend.
 */

#pragma once

#include "ferry/content_store.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ferry {

/**
 * @brief Number of chunks a file of a given size is split into
 *
 * An empty file has exactly one zero-length chunk.
 */
uint32_t calc_total_chunks(uint64_t size, uint32_t chunk_size);

/**
 * @brief Basic metadata of a source
 */
struct FileMetadata {
    std::string name;       ///< Last path component / display name
    uint64_t size = 0;      ///< Size in bytes (0 for directories)
    bool is_dir = false;    ///< Whether the source is a directory
};

class FileSource;

/**
 * @brief Open handle for a series of positioned reads of one source
 */
class SourceReader {
public:
    virtual ~SourceReader() = default;

    /**
     * @brief Read up to len bytes at offset
     * @return Bytes read, less than len only at end of file
     * @throws TransferError (STORAGE) if reading fails
     */
    virtual size_t read_at(uint64_t offset, uint8_t* buffer, size_t len) = 0;
};

/**
 * @brief One file found while enumerating a directory
 */
struct EnumeratedFile {
    std::string name;                       ///< File name
    std::string relative_path;              ///< Forward-slash path including the parent prefix
    std::shared_ptr<FileSource> source;     ///< Source for reading the file
    uint64_t size = 0;                      ///< Size in bytes
};

/**
 * @brief Abstract readable file or directory
 *
 * Chunk reads and hashing are implemented once on top of a SourceReader,
 * so both backends slice and hash identically.
 */
class FileSource {
public:
    virtual ~FileSource() = default;

    /**
     * @brief Read one chunk
     * @param chunk_index Index of the chunk
     * @param chunk_size Chunk size of the transfer
     * @return Chunk bytes; the last chunk may be short, an empty file yields one empty chunk
     * @throws TransferError (INVALID_ARGUMENT) if the index is past the end,
     *         (STORAGE) if reading fails
     */
    std::vector<uint8_t> read_chunk(uint32_t chunk_index, uint32_t chunk_size) const;

    /// Same as read_chunk() but through a reader from open_reader()
    std::vector<uint8_t> read_chunk(SourceReader& reader, uint32_t chunk_index, uint32_t chunk_size) const;

    /**
     * @brief Stream the whole file through SHA-256
     * @return Lowercase hex digest
     * @throws TransferError (STORAGE) if reading fails
     */
    std::string compute_hash() const;

    /**
     * @brief Name, size and kind of the source
     * @throws TransferError (STORAGE) if the source does not exist
     */
    virtual FileMetadata metadata() const = 0;

    /**
     * @brief Recursively list the files below a directory source
     * @param parent_relative_path Prefix for the returned relative paths (usually the directory name)
     * @return Files ordered by relative path; empty for a plain file
     */
    virtual std::vector<EnumeratedFile> enumerate(const std::string& parent_relative_path) const = 0;

    /**
     * @brief Human readable location for logs
     */
    virtual std::string describe() const = 0;

    /**
     * @brief Open the source once for any number of reads
     * @throws TransferError (STORAGE) if the source cannot be opened
     */
    virtual std::unique_ptr<SourceReader> open_reader() const = 0;
};

/**
 * @brief FileSource over a filesystem path
 */
class PathFileSource : public FileSource {
public:
    explicit PathFileSource(std::filesystem::path path);

    FileMetadata metadata() const override;
    std::vector<EnumeratedFile> enumerate(const std::string& parent_relative_path) const override;
    std::string describe() const override;

    std::unique_ptr<SourceReader> open_reader() const override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief FileSource over a managed content handle
 */
class ContentFileSource : public FileSource {
public:
    ContentFileSource(std::shared_ptr<ContentStore> store, std::string handle);

    FileMetadata metadata() const override;
    std::vector<EnumeratedFile> enumerate(const std::string& parent_relative_path) const override;
    std::string describe() const override;
    std::unique_ptr<SourceReader> open_reader() const override;

private:
    std::shared_ptr<ContentStore> store_;
    std::string handle_;
};

} // namespace ferry
