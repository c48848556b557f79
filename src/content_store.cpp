/**
 * @file content_store.cpp
 * @brief Implementation of the in-memory content store
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/content_store.hpp"
#include "ferry/transfer_error.hpp"

#include <algorithm>
#include <cstring>

namespace ferry {

namespace {

std::string parent_of(const std::string& relative_path) {
    auto pos = relative_path.rfind('/');
    return pos == std::string::npos ? std::string() : relative_path.substr(0, pos);
}

std::string name_of(const std::string& relative_path) {
    auto pos = relative_path.rfind('/');
    return pos == std::string::npos ? relative_path : relative_path.substr(pos + 1);
}

} // namespace

MemoryContentStore::MemoryContentStore(std::string root_name)
    : root_name_(std::move(root_name))
    , next_id_(0)
{
    auto root = std::make_shared<Entry>();
    root->handle = next_handle();
    root->name = root_name_;
    root->is_dir = true;
    entries_[root->handle] = root;
    visible_paths_[""] = root->handle;
}

std::string MemoryContentStore::next_handle() {
    return root_name_ + "://" + std::to_string(next_id_++);
}

std::shared_ptr<MemoryContentStore::Entry> MemoryContentStore::lookup(const std::string& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    return it == entries_.end() ? nullptr : it->second;
}

// ============================================================================
// Reading
// ============================================================================

std::optional<ContentEntryInfo> MemoryContentStore::stat(const std::string& handle) const {
    auto entry = lookup(handle);
    if (!entry || entry->pending) {
        return std::nullopt;
    }

    ContentEntryInfo info;
    info.handle = entry->handle;
    info.name = entry->name;
    info.is_dir = entry->is_dir;
    info.size = entry->data ? entry->data->size() : 0;
    return info;
}

std::vector<ContentEntryInfo> MemoryContentStore::list_children(const std::string& handle) const {
    std::vector<ContentEntryInfo> children;

    std::lock_guard<std::mutex> lock(mutex_);
    auto dir_it = entries_.find(handle);
    if (dir_it == entries_.end() || !dir_it->second->is_dir || dir_it->second->pending) {
        return children;
    }
    const std::string& dir_path = dir_it->second->relative_path;

    // visible_paths_ is ordered, so children come out sorted by path
    for (const auto& [path, child_handle] : visible_paths_) {
        if (path.empty() || parent_of(path) != dir_path) {
            continue;
        }
        const auto& child = entries_.at(child_handle);
        ContentEntryInfo info;
        info.handle = child->handle;
        info.name = child->name;
        info.is_dir = child->is_dir;
        info.size = child->data ? child->data->size() : 0;
        children.push_back(std::move(info));
    }

    return children;
}

size_t MemoryContentStore::read_at(const std::string& handle, uint64_t offset, uint8_t* buffer, size_t len) const {
    auto entry = lookup(handle);
    if (!entry || entry->is_dir || !entry->data) {
        throw TransferError(ErrorKind::STORAGE, "Unknown content handle: " + handle);
    }

    const auto& data = *entry->data;
    if (offset >= data.size()) {
        return 0;
    }
    size_t available = static_cast<size_t>(data.size() - offset);
    size_t count = std::min(len, available);
    if (count > 0) {
        std::memcpy(buffer, data.data() + offset, count);
    }
    return count;
}

std::optional<ContentEntryInfo> MemoryContentStore::find(const std::string& relative_path) const {
    std::string handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = visible_paths_.find(relative_path);
        if (it == visible_paths_.end()) {
            return std::nullopt;
        }
        handle = it->second;
    }
    return stat(handle);
}

std::string MemoryContentStore::describe() const {
    return root_name_ + "://";
}

// ============================================================================
// Writing
// ============================================================================

std::string MemoryContentStore::create_pending(const std::string& relative_path, uint64_t size) {
    if (relative_path.empty()) {
        throw TransferError(ErrorKind::STORAGE, "Empty content path");
    }

    auto entry = std::make_shared<Entry>();
    entry->relative_path = relative_path;
    entry->name = name_of(relative_path);
    entry->pending = true;
    entry->data = std::make_shared<std::vector<uint8_t>>(static_cast<size_t>(size), 0);

    std::string parent = parent_of(relative_path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!parent.empty()) {
        ensure_directory(parent);
    }
    entry->handle = next_handle();
    entries_[entry->handle] = entry;
    return entry->handle;
}

void MemoryContentStore::write_at(const std::string& handle, uint64_t offset, const uint8_t* data, size_t len) {
    auto entry = lookup(handle);
    if (!entry || !entry->pending) {
        throw TransferError(ErrorKind::STORAGE, "Content handle is not writable: " + handle);
    }

    auto& buffer = *entry->data;
    if (offset > buffer.size() || len > buffer.size() - offset) {
        throw TransferError(ErrorKind::STORAGE,
            "Write beyond declared size of " + entry->relative_path);
    }
    if (len > 0) {
        std::memcpy(buffer.data() + offset, data, len);
    }
}

void MemoryContentStore::publish(const std::string& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    if (it == entries_.end() || !it->second->pending) {
        throw TransferError(ErrorKind::STORAGE, "Content handle is not pending: " + handle);
    }

    auto& entry = it->second;
    auto existing = visible_paths_.find(entry->relative_path);
    if (existing != visible_paths_.end()) {
        entries_.erase(existing->second);
    }

    entry->pending = false;
    visible_paths_[entry->relative_path] = handle;
}

void MemoryContentStore::remove(const std::string& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    if (it == entries_.end() || it->second->relative_path.empty()) {
        return;
    }

    if (!it->second->pending) {
        visible_paths_.erase(it->second->relative_path);
    }
    entries_.erase(it);
}

// ============================================================================
// Population and inspection
// ============================================================================

std::string MemoryContentStore::ensure_directory(const std::string& relative_path) {
    auto it = visible_paths_.find(relative_path);
    if (it != visible_paths_.end()) {
        return it->second;
    }

    std::string parent = parent_of(relative_path);
    if (!parent.empty()) {
        ensure_directory(parent);
    }

    auto entry = std::make_shared<Entry>();
    entry->handle = next_handle();
    entry->relative_path = relative_path;
    entry->name = name_of(relative_path);
    entry->is_dir = true;
    entries_[entry->handle] = entry;
    visible_paths_[relative_path] = entry->handle;
    return entry->handle;
}

std::string MemoryContentStore::add_file(const std::string& relative_path, std::vector<uint8_t> content) {
    auto handle = create_pending(relative_path, 0);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.at(handle)->data = std::make_shared<std::vector<uint8_t>>(std::move(content));
    }
    publish(handle);
    return handle;
}

std::string MemoryContentStore::add_directory(const std::string& relative_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (relative_path.empty()) {
        return visible_paths_.at("");
    }
    return ensure_directory(relative_path);
}

std::optional<std::vector<uint8_t>> MemoryContentStore::contents(const std::string& relative_path) const {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = visible_paths_.find(relative_path);
        if (it == visible_paths_.end()) {
            return std::nullopt;
        }
        entry = entries_.at(it->second);
    }
    if (entry->is_dir || !entry->data) {
        return std::nullopt;
    }
    return *entry->data;
}

size_t MemoryContentStore::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const auto& kv) { return kv.second->pending; }));
}

} // namespace ferry
