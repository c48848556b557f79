/**
 * @file posix_io.hpp
 * @brief Positioned read/write helpers and an owning file descriptor
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace ferry {
namespace posix {

/**
 * @brief Read up to n bytes at offset, retrying on EINTR and short reads
 * @return Bytes read (less than n only at end of file), -1 on error
 */
ssize_t full_pread(int fd, void* buf, size_t n, off_t offset);

/**
 * @brief Write n bytes at offset, retrying on EINTR and short writes
 * @return Bytes written, -1 on error
 */
ssize_t full_pwrite(int fd, const void* buf, size_t n, off_t offset);

/**
 * @brief Owning POSIX file descriptor
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept : fd_(-1) {}
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

    /**
     * @brief Close now and report the result
     * @return 0 on success, errno value on failure
     */
    int close() noexcept;

    /**
     * @brief Open a file
     * @throws TransferError (STORAGE) with the errno text on failure
     */
    static FileDescriptor open(const std::string& path, int flags, mode_t mode = 0644);

private:
    int fd_;
};

/**
 * @brief Describe an errno value for error messages
 */
std::string errno_message(int err);

} // namespace posix
} // namespace ferry
