/**
 * @file content_store.hpp
 * @brief Handle-based managed content storage
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Some platforms do not expose plain file paths; files are addressed by
 * opaque content handles and new entries are created "pending" (invisible
 * to other readers) until they are published. ContentStore models that
 * storage; MemoryContentStore is the in-process implementation.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

/**
 * @brief Metadata of a content entry
 */
struct ContentEntryInfo {
    std::string handle;         ///< Opaque handle
    std::string name;           ///< Display name
    uint64_t size = 0;          ///< Size in bytes (0 for directories)
    bool is_dir = false;        ///< Whether the entry is a directory
};

/**
 * @brief Abstract managed content store
 *
 * Implementations must allow concurrent write_at calls on distinct byte
 * ranges of the same pending entry.
 */
class ContentStore {
public:
    virtual ~ContentStore() = default;

    /**
     * @brief Look up a visible (published) entry
     * @return Entry info, std::nullopt if unknown or still pending
     */
    virtual std::optional<ContentEntryInfo> stat(const std::string& handle) const = 0;

    /**
     * @brief Visible children of a directory entry, ordered by name
     */
    virtual std::vector<ContentEntryInfo> list_children(const std::string& handle) const = 0;

    /**
     * @brief Read bytes from an entry
     * @return Bytes read, less than len only at end of entry
     * @throws TransferError (STORAGE) if the handle is unknown
     */
    virtual size_t read_at(const std::string& handle, uint64_t offset, uint8_t* buffer, size_t len) const = 0;

    /**
     * @brief Create a pending entry of a given size below the store root
     * @param relative_path Forward-slash path of the new entry
     * @param size Declared size; the entry is zero-filled to this size
     * @return Handle of the pending entry
     * @throws TransferError (STORAGE) if the entry cannot be created
     */
    virtual std::string create_pending(const std::string& relative_path, uint64_t size) = 0;

    /**
     * @brief Write into a pending entry
     * @throws TransferError (STORAGE) if the handle is unknown, not pending, or the range is out of bounds
     */
    virtual void write_at(const std::string& handle, uint64_t offset, const uint8_t* data, size_t len) = 0;

    /**
     * @brief Make a pending entry visible, replacing any entry at the same path
     * @throws TransferError (STORAGE) if the handle is not pending
     */
    virtual void publish(const std::string& handle) = 0;

    /**
     * @brief Delete an entry; unknown handles are ignored
     */
    virtual void remove(const std::string& handle) = 0;

    /**
     * @brief Find the visible entry at a relative path
     */
    virtual std::optional<ContentEntryInfo> find(const std::string& relative_path) const = 0;

    /**
     * @brief Human readable description of the store root
     */
    virtual std::string describe() const = 0;
};

/**
 * @brief In-memory ContentStore
 *
 * The store mutex guards the entry table only. Entry buffers are sized when
 * created and never reallocated, so reads and writes copy bytes outside the
 * lock.
 */
class MemoryContentStore : public ContentStore {
public:
    /**
     * @param root_name Label used in handles and descriptions
     */
    explicit MemoryContentStore(std::string root_name = "memory");

    MemoryContentStore(const MemoryContentStore&) = delete;
    MemoryContentStore& operator=(const MemoryContentStore&) = delete;

    std::optional<ContentEntryInfo> stat(const std::string& handle) const override;
    std::vector<ContentEntryInfo> list_children(const std::string& handle) const override;
    size_t read_at(const std::string& handle, uint64_t offset, uint8_t* buffer, size_t len) const override;
    std::string create_pending(const std::string& relative_path, uint64_t size) override;
    void write_at(const std::string& handle, uint64_t offset, const uint8_t* data, size_t len) override;
    void publish(const std::string& handle) override;
    void remove(const std::string& handle) override;
    std::optional<ContentEntryInfo> find(const std::string& relative_path) const override;
    std::string describe() const override;

    // ========================================================================
    // Population and inspection
    // ========================================================================

    /**
     * @brief Add a published file, creating parent directories
     * @return Handle of the file
     */
    std::string add_file(const std::string& relative_path, std::vector<uint8_t> content);

    /**
     * @brief Add a published directory (and its parents)
     * @return Handle of the directory
     */
    std::string add_directory(const std::string& relative_path);

    /**
     * @brief Contents of the visible file at a relative path
     */
    std::optional<std::vector<uint8_t>> contents(const std::string& relative_path) const;

    /// Number of pending entries
    size_t pending_count() const;

private:
    struct Entry {
        std::string handle;
        std::string relative_path;
        std::string name;
        bool is_dir = false;
        bool pending = false;
        std::shared_ptr<std::vector<uint8_t>> data;
    };

    std::string next_handle();
    std::string ensure_directory(const std::string& relative_path);
    std::shared_ptr<Entry> lookup(const std::string& handle) const;

    std::string root_name_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;     ///< handle -> entry
    std::map<std::string, std::string> visible_paths_;          ///< relative path -> handle
    uint64_t next_id_;
};

} // namespace ferry
