/**
 * @file file_sink.cpp
 * @brief Implementation of the file sink backends
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/file_sink.hpp"
#include "ferry/file_source.hpp"
#include "ferry/transfer_config.hpp"
#include "ferry/transfer_error.hpp"
#include "ferry/utilities.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace ferry {

namespace {

std::string to_lower_hex(std::string hex) {
    std::transform(hex.begin(), hex.end(), hex.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return hex;
}

template <class T>
T& downcast(PartialFile& partial) {
    auto* typed = dynamic_cast<T*>(&partial);
    if (typed == nullptr) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT,
            "Partial file belongs to a different sink: " + partial.relative_path());
    }
    return *typed;
}

} // namespace

// ============================================================================
// PartialFile / FileSink
// ============================================================================

PartialFile::PartialFile(std::string relative_path, uint64_t size)
    : relative_path_(std::move(relative_path))
    , size_(size)
    , finished_(false)
{
}

void FileSink::write_chunk(PartialFile& partial, uint32_t chunk_index, uint32_t chunk_size,
                           const std::vector<uint8_t>& data) {
    if (partial.is_finished()) {
        throw TransferError(ErrorKind::STORAGE,
            "Write to finished partial file: " + partial.relative_path());
    }

    uint64_t offset = static_cast<uint64_t>(chunk_index) * chunk_size;
    if (data.size() > chunk_size || offset > partial.size() || data.size() > partial.size() - offset) {
        throw TransferError(ErrorKind::STORAGE,
            "Chunk " + std::to_string(chunk_index) + " exceeds declared size of " + partial.relative_path());
    }

    if (data.empty()) {
        return;
    }

    write_at(partial, offset, data);
}

std::string FileSink::finalize(PartialFile& partial, const std::string& expected_hash) {
    if (partial.is_finished()) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT,
            "Partial file already finished: " + partial.relative_path());
    }

    close_partial(partial);

    std::string actual = hash_partial(partial);
    if (actual != to_lower_hex(expected_hash)) {
        discard(partial);
        throw TransferError(ErrorKind::INTEGRITY,
            "Checksum mismatch for " + partial.relative_path() +
            ": expected " + expected_hash + ", got " + actual);
    }

    std::string location = promote(partial);
    partial.mark_finished();

    utilities::log_debug("Promoted " + partial.temp_location() + " -> " + location);
    return location;
}

void FileSink::discard(PartialFile& partial) {
    if (!partial.mark_finished()) {
        return;
    }

    close_partial(partial);
    remove_partial(partial);
    utilities::log_debug("Discarded partial file " + partial.temp_location());
}

// ============================================================================
// Filesystem backend
// ============================================================================

std::filesystem::path part_path_for(const std::filesystem::path& final_path) {
    std::filesystem::path part = final_path;
    part += ".part";
    return part;
}

PathPartialFile::PathPartialFile(std::string relative_path, uint64_t size,
                                 std::filesystem::path part_path, std::filesystem::path final_path,
                                 posix::FileDescriptor fd)
    : PartialFile(std::move(relative_path), size)
    , part_path_(std::move(part_path))
    , final_path_(std::move(final_path))
    , fd_(std::make_shared<posix::FileDescriptor>(std::move(fd)))
{
}

std::shared_ptr<posix::FileDescriptor> PathPartialFile::write_handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd_;
}

void PathPartialFile::close_write_handle() {
    std::shared_ptr<posix::FileDescriptor> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released = std::move(fd_);
        fd_.reset();
    }
}

PathFileSink::PathFileSink(std::filesystem::path save_directory)
    : save_directory_(std::move(save_directory))
{
    std::error_code ec;
    std::filesystem::create_directories(save_directory_, ec);
    if (ec) {
        throw TransferError(ErrorKind::STORAGE,
            "Failed to create save directory " + save_directory_.string() + ": " + ec.message());
    }
}

std::shared_ptr<PartialFile> PathFileSink::create_partial(const std::string& relative_path, uint64_t size) {
    if (!config::is_safe_relative_path(relative_path)) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "Unsafe relative path: " + relative_path);
    }

    std::filesystem::path final_path = save_directory_ / std::filesystem::path(relative_path).make_preferred();
    if (!config::is_safe_path(final_path, save_directory_)) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT,
            "Path escapes save directory: " + relative_path);
    }

    std::error_code ec;
    std::filesystem::create_directories(final_path.parent_path(), ec);
    if (ec) {
        throw TransferError(ErrorKind::STORAGE,
            "Failed to create directory " + final_path.parent_path().string() + ": " + ec.message());
    }

    std::filesystem::path part_path = part_path_for(final_path);
    auto fd = posix::FileDescriptor::open(part_path.string(), O_WRONLY | O_CREAT | O_TRUNC, 0644);

    // Pre-size so out-of-order chunk writes land inside the file
    if (::ftruncate(fd.get(), static_cast<off_t>(size)) != 0) {
        int err = errno;
        fd.close();
        std::filesystem::remove(part_path, ec);
        throw TransferError(ErrorKind::STORAGE,
            "Failed to allocate " + part_path.string() + ": " + posix::errno_message(err));
    }

    return std::make_shared<PathPartialFile>(relative_path, size, part_path, final_path, std::move(fd));
}

std::string PathFileSink::save_location_display() const {
    return save_directory_.string();
}

void PathFileSink::write_at(PartialFile& partial, uint64_t offset, const std::vector<uint8_t>& data) {
    auto& file = downcast<PathPartialFile>(partial);

    auto fd = file.write_handle();
    if (!fd) {
        throw TransferError(ErrorKind::STORAGE, "Partial file is closed: " + file.temp_location());
    }

    ssize_t n = posix::full_pwrite(fd->get(), data.data(), data.size(), static_cast<off_t>(offset));
    if (n < 0) {
        int err = errno;
        throw TransferError(ErrorKind::STORAGE,
            "Failed to write " + file.temp_location() + ": " + posix::errno_message(err));
    }
}

void PathFileSink::close_partial(PartialFile& partial) {
    downcast<PathPartialFile>(partial).close_write_handle();
}

std::string PathFileSink::hash_partial(PartialFile& partial) {
    auto& file = downcast<PathPartialFile>(partial);
    return PathFileSource(file.part_path()).compute_hash();
}

std::string PathFileSink::promote(PartialFile& partial) {
    auto& file = downcast<PathPartialFile>(partial);

    std::error_code ec;
    std::filesystem::rename(file.part_path(), file.final_path(), ec);
    if (ec) {
        throw TransferError(ErrorKind::STORAGE,
            "Failed to rename " + file.part_path().string() + ": " + ec.message());
    }
    return file.final_path().string();
}

void PathFileSink::remove_partial(PartialFile& partial) {
    auto& file = downcast<PathPartialFile>(partial);

    std::error_code ec;
    std::filesystem::remove(file.part_path(), ec);
    if (ec) {
        utilities::log_warn("Failed to remove " + file.part_path().string() + ": " + ec.message());
    }
}

// ============================================================================
// Managed content backend
// ============================================================================

ContentPartialFile::ContentPartialFile(std::string relative_path, uint64_t size,
                                       std::string handle, std::string final_location)
    : PartialFile(std::move(relative_path), size)
    , handle_(std::move(handle))
    , final_location_(std::move(final_location))
    , closed_(false)
{
}

ContentFileSink::ContentFileSink(std::shared_ptr<ContentStore> store)
    : store_(std::move(store))
{
}

std::shared_ptr<PartialFile> ContentFileSink::create_partial(const std::string& relative_path, uint64_t size) {
    if (!config::is_safe_relative_path(relative_path)) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "Unsafe relative path: " + relative_path);
    }

    std::string handle = store_->create_pending(relative_path, size);
    return std::make_shared<ContentPartialFile>(relative_path, size, handle,
                                                store_->describe() + relative_path);
}

std::string ContentFileSink::save_location_display() const {
    return store_->describe();
}

void ContentFileSink::write_at(PartialFile& partial, uint64_t offset, const std::vector<uint8_t>& data) {
    auto& file = downcast<ContentPartialFile>(partial);
    if (file.is_closed()) {
        throw TransferError(ErrorKind::STORAGE, "Partial file is closed: " + file.handle());
    }
    store_->write_at(file.handle(), offset, data.data(), data.size());
}

void ContentFileSink::close_partial(PartialFile& partial) {
    downcast<ContentPartialFile>(partial).close();
}

std::string ContentFileSink::hash_partial(PartialFile& partial) {
    auto& file = downcast<ContentPartialFile>(partial);
    return ContentFileSource(store_, file.handle()).compute_hash();
}

std::string ContentFileSink::promote(PartialFile& partial) {
    auto& file = downcast<ContentPartialFile>(partial);
    store_->publish(file.handle());
    return file.final_location();
}

void ContentFileSink::remove_partial(PartialFile& partial) {
    store_->remove(downcast<ContentPartialFile>(partial).handle());
}

} // namespace ferry
