#pragma once

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

// Owns a file descriptor, closes it upon destruction
class FileDescriptor {
    int fd_ = -1;

public:
    FileDescriptor() noexcept = default;

    explicit FileDescriptor(int fd) noexcept : fd_{fd} {}

    // Opens @p path, check is_open() for the result
    FileDescriptor(const char* path, int flags, mode_t mode = S_IRUSR | S_IWUSR) noexcept
    : fd_{::open(path, flags, mode)} {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_{std::exchange(other.fd_, -1)} {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            (void)close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    ~FileDescriptor() { (void)close(); }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    // Use is_open() instead
    explicit operator bool() const noexcept = delete;

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    // Returns close(2) result, 0 if nothing was open
    int close() noexcept {
        if (fd_ < 0) {
            return 0;
        }
        return ::close(std::exchange(fd_, -1));
    }
};
