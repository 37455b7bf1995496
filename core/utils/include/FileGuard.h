#pragma once

/**
 * @file FileGuard.h
 * @brief RAII wrapper for file descriptors
 *
 * Destination and source files of the broker are held through a FileGuard
 * so that dropping a transfer closes every descriptor exactly once.
 */

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace TermXfer {

/**
 * @brief RAII wrapper for file descriptors
 *
 * Usage:
 * @code
 * FileGuard file(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
 * if (!file) { // handle errno }
 * file.readAt(buf, sizeof(buf), 0);
 * // Descriptor closed when file goes out of scope
 * @endcode
 */
class FileGuard {
public:
    FileGuard() noexcept : fd_(-1) {}

    explicit FileGuard(int fd) noexcept : fd_(fd) {}

    FileGuard(const FileGuard&) = delete;
    FileGuard& operator=(const FileGuard&) = delete;

    FileGuard(FileGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    FileGuard& operator=(FileGuard&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~FileGuard() {
        reset();
    }

    int get() const noexcept { return fd_; }

    explicit operator bool() const noexcept { return fd_ >= 0; }

    bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /**
     * @brief Close now, reporting the error a deferred write may surface
     * @throws std::system_error if close fails
     */
    void close(const std::string& what) {
        if (fd_ < 0) {
            return;
        }
        int fd = release();
        if (::close(fd) != 0) {
            throw std::system_error(errno, std::generic_category(), "Failed to close " + what);
        }
    }

    /// Write all of data, retrying short writes. @throws std::system_error
    void writeAll(const uint8_t* data, size_t len, const std::string& what) {
        while (len > 0) {
            ssize_t n = ::write(fd_, data, len);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "Failed to write to " + what);
            }
            data += n;
            len -= static_cast<size_t>(n);
        }
    }

    /// Read up to len bytes at offset, 0 at end of file. @throws std::system_error
    size_t readAt(uint8_t* buffer, size_t len, uint64_t offset, const std::string& what) const {
        while (true) {
            ssize_t n = ::pread(fd_, buffer, len, static_cast<off_t>(offset));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "Failed to read " + what);
            }
            return static_cast<size_t>(n);
        }
    }

    /// Sequential read of up to len bytes, 0 at end of file. @throws std::system_error
    size_t read(uint8_t* buffer, size_t len, const std::string& what) {
        while (true) {
            ssize_t n = ::read(fd_, buffer, len);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "Failed to read " + what);
            }
            return static_cast<size_t>(n);
        }
    }

    void swap(FileGuard& other) noexcept {
        std::swap(fd_, other.fd_);
    }

private:
    int fd_;
};

inline void swap(FileGuard& a, FileGuard& b) noexcept {
    a.swap(b);
}

} // namespace TermXfer
