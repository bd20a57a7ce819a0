#pragma once

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// Owns a file descriptor, closes it on destruction
class FileDescriptor {
    int fd_ = -1;

public:
    FileDescriptor() noexcept = default;

    explicit FileDescriptor(int fd) noexcept : fd_{fd} {}

    FileDescriptor(const char* path, int flags, mode_t mode = S_IRUSR | S_IWUSR) noexcept
    : fd_{::open(path, flags, mode)} {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_{other.release()} {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        reset(other.release());
        return *this;
    }

    ~FileDescriptor() { (void)close(); }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    // Gives up ownership of the file descriptor
    [[nodiscard]] int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd) noexcept {
        (void)close();
        fd_ = fd;
    }

    // Returns the result of close(2), 0 if the file descriptor was not open
    int close() noexcept {
        if (fd_ < 0) {
            return 0;
        }
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }
};
