/**
 * @file file_source.cpp
 * @brief Implementation of the file source backends
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/file_source.hpp"
#include "ferry/content_hash.hpp"
#include "ferry/posix_io.hpp"
#include "ferry/transfer_error.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>

namespace ferry {

namespace {

/// Reads a file through one descriptor held for the reader's lifetime
class DescriptorReader : public SourceReader {
public:
    explicit DescriptorReader(const std::filesystem::path& path)
        : path_(path.string())
        , fd_(posix::FileDescriptor::open(path_, O_RDONLY))
    {
    }

    size_t read_at(uint64_t offset, uint8_t* buffer, size_t len) override {
        ssize_t n = posix::full_pread(fd_.get(), buffer, len, static_cast<off_t>(offset));
        if (n < 0) {
            int err = errno;
            throw TransferError(ErrorKind::STORAGE, "Failed to read " + path_ + ": " + posix::errno_message(err));
        }
        return static_cast<size_t>(n);
    }

private:
    std::string path_;
    posix::FileDescriptor fd_;
};

class ContentReader : public SourceReader {
public:
    ContentReader(std::shared_ptr<ContentStore> store, std::string handle)
        : store_(std::move(store))
        , handle_(std::move(handle))
    {
    }

    size_t read_at(uint64_t offset, uint8_t* buffer, size_t len) override {
        return store_->read_at(handle_, offset, buffer, len);
    }

private:
    std::shared_ptr<ContentStore> store_;
    std::string handle_;
};

} // anonymous namespace

uint32_t calc_total_chunks(uint64_t size, uint32_t chunk_size) {
    if (size == 0 || chunk_size == 0) {
        return 1;
    }
    return static_cast<uint32_t>((size + chunk_size - 1) / chunk_size);
}

// ============================================================================
// FileSource
// ============================================================================

std::vector<uint8_t> FileSource::read_chunk(uint32_t chunk_index, uint32_t chunk_size) const {
    if (chunk_size == 0) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "Chunk size must be positive");
    }
    return read_chunk(*open_reader(), chunk_index, chunk_size);
}

std::vector<uint8_t> FileSource::read_chunk(SourceReader& reader, uint32_t chunk_index, uint32_t chunk_size) const {
    if (chunk_size == 0) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, "Chunk size must be positive");
    }

    uint64_t offset = static_cast<uint64_t>(chunk_index) * chunk_size;
    std::vector<uint8_t> buffer(chunk_size);
    size_t n = reader.read_at(offset, buffer.data(), buffer.size());

    // Only chunk 0 of an empty file may be empty
    if (n == 0 && chunk_index > 0) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT,
            "Chunk " + std::to_string(chunk_index) + " is past the end of " + describe());
    }

    buffer.resize(n);
    return buffer;
}

std::string FileSource::compute_hash() const {
    ContentHasher hasher;
    std::vector<uint8_t> block(ContentHasher::READ_BLOCK_SIZE);
    auto reader = open_reader();

    uint64_t offset = 0;
    while (true) {
        size_t n = reader->read_at(offset, block.data(), block.size());
        if (n == 0) {
            break;
        }
        hasher.update(block.data(), n);
        offset += n;
    }

    return hasher.finish_hex();
}

// ============================================================================
// PathFileSource
// ============================================================================

PathFileSource::PathFileSource(std::filesystem::path path)
    : path_(std::move(path))
{
}

FileMetadata PathFileSource::metadata() const {
    std::error_code ec;
    auto status = std::filesystem::status(path_, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw TransferError(ErrorKind::STORAGE, "Source does not exist: " + path_.string());
    }

    FileMetadata meta;
    auto name_path = path_.has_filename() ? path_.filename() : path_.parent_path().filename();
    meta.name = name_path.string();
    meta.is_dir = std::filesystem::is_directory(status);
    if (!meta.is_dir) {
        meta.size = std::filesystem::file_size(path_, ec);
        if (ec) {
            throw TransferError(ErrorKind::STORAGE,
                "Failed to stat " + path_.string() + ": " + ec.message());
        }
    }
    return meta;
}

std::vector<EnumeratedFile> PathFileSource::enumerate(const std::string& parent_relative_path) const {
    std::vector<EnumeratedFile> files;

    std::error_code ec;
    if (!std::filesystem::is_directory(path_, ec)) {
        return files;
    }

    std::filesystem::recursive_directory_iterator it(
        path_, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw TransferError(ErrorKind::STORAGE,
            "Failed to list " + path_.string() + ": " + ec.message());
    }

    try {
        for (const auto& entry : it) {
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec)) {
                continue;
            }

            auto relative = entry.path().lexically_relative(path_).generic_string();

            EnumeratedFile file;
            file.name = entry.path().filename().string();
            file.relative_path = parent_relative_path.empty()
                ? relative
                : parent_relative_path + "/" + relative;
            file.source = std::make_shared<PathFileSource>(entry.path());
            file.size = entry.file_size(entry_ec);
            if (entry_ec) {
                throw TransferError(ErrorKind::STORAGE,
                    "Failed to stat " + entry.path().string() + ": " + entry_ec.message());
            }
            files.push_back(std::move(file));
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw TransferError(ErrorKind::STORAGE,
            "Failed to list " + path_.string() + ": " + e.what());
    }

    std::sort(files.begin(), files.end(),
        [](const EnumeratedFile& a, const EnumeratedFile& b) {
            return a.relative_path < b.relative_path;
        });

    return files;
}

std::string PathFileSource::describe() const {
    return path_.string();
}

std::unique_ptr<SourceReader> PathFileSource::open_reader() const {
    return std::make_unique<DescriptorReader>(path_);
}

// ============================================================================
// ContentFileSource
// ============================================================================

ContentFileSource::ContentFileSource(std::shared_ptr<ContentStore> store, std::string handle)
    : store_(std::move(store))
    , handle_(std::move(handle))
{
}

FileMetadata ContentFileSource::metadata() const {
    auto info = store_->stat(handle_);
    if (!info) {
        throw TransferError(ErrorKind::STORAGE, "Source does not exist: " + handle_);
    }

    FileMetadata meta;
    meta.name = info->name;
    meta.size = info->size;
    meta.is_dir = info->is_dir;
    return meta;
}

std::vector<EnumeratedFile> ContentFileSource::enumerate(const std::string& parent_relative_path) const {
    std::vector<EnumeratedFile> files;

    auto info = store_->stat(handle_);
    if (!info || !info->is_dir) {
        return files;
    }

    // Depth-first walk; children arrive sorted by name
    std::vector<std::pair<std::string, std::string>> stack{{handle_, parent_relative_path}};
    while (!stack.empty()) {
        auto [dir_handle, prefix] = stack.back();
        stack.pop_back();

        for (const auto& child : store_->list_children(dir_handle)) {
            std::string child_path = prefix.empty() ? child.name : prefix + "/" + child.name;
            if (child.is_dir) {
                stack.emplace_back(child.handle, child_path);
                continue;
            }

            EnumeratedFile file;
            file.name = child.name;
            file.relative_path = child_path;
            file.source = std::make_shared<ContentFileSource>(store_, child.handle);
            file.size = child.size;
            files.push_back(std::move(file));
        }
    }

    std::sort(files.begin(), files.end(),
        [](const EnumeratedFile& a, const EnumeratedFile& b) {
            return a.relative_path < b.relative_path;
        });

    return files;
}

std::string ContentFileSource::describe() const {
    return handle_;
}

std::unique_ptr<SourceReader> ContentFileSource::open_reader() const {
    return std::make_unique<ContentReader>(store_, handle_);
}

} // namespace ferry
