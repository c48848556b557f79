/**
 * @file posix_io.cpp
 * @brief Implementation of positioned I/O helpers
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/posix_io.hpp"
#include "ferry/transfer_error.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace ferry {
namespace posix {

ssize_t full_pread(int fd, void* buf, size_t n, off_t offset) {
    uint8_t* p = static_cast<uint8_t*>(buf);

    size_t done = 0;
    while (done < n) {
        ssize_t r = ::pread(fd, p + done, n - done, offset + static_cast<off_t>(done));
        if (r < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (r == 0) break; // EOF
        done += static_cast<size_t>(r);
    }
    return static_cast<ssize_t>(done);
}

ssize_t full_pwrite(int fd, const void* buf, size_t n, off_t offset) {
    const uint8_t* p = static_cast<const uint8_t*>(buf);

    size_t done = 0;
    while (done < n) {
        ssize_t w = ::pwrite(fd, p + done, n - done, offset + static_cast<off_t>(done));
        if (w < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (w == 0) {
            errno = EIO;
            return -1;
        }
        done += static_cast<size_t>(w);
    }
    return static_cast<ssize_t>(done);
}

FileDescriptor::~FileDescriptor() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_)
{
    other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

int FileDescriptor::close() noexcept {
    if (fd_ < 0) {
        return 0;
    }
    int result = ::close(fd_);
    fd_ = -1;
    return result == 0 ? 0 : errno;
}

FileDescriptor FileDescriptor::open(const std::string& path, int flags, mode_t mode) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        int err = errno;
        throw TransferError(ErrorKind::STORAGE,
            "Failed to open " + path + ": " + errno_message(err));
    }
    return FileDescriptor(fd);
}

std::string errno_message(int err) {
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

} // namespace posix
} // namespace ferry
